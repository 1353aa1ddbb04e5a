/*
 Copyright (C) 2017-2025 Fredrik Öhrström (gpl-3.0-or-later)

 This program is free software: you can redistribute it and/or modify
 it under the terms of the GNU General Public License as published by
 the Free Software Foundation, either version 3 of the License, or
 (at your option) any later version.

 This program is distributed in the hope that it will be useful,
 but WITHOUT ANY WARRANTY; without even the implied warranty of
 MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 GNU General Public License for more details.

 You should have received a copy of the GNU General Public License
 along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#ifndef UTIL_H
#define UTIL_H

#include<stdint.h>
#include<string>
#include<map>
#include<set>
#include<vector>

std::string tostrprintf(const char* fmt, ...);

bool enableLogfile(const std::string& logfile);
void disableLogfile();
void error(const char* fmt, ...);
void verbose(const char* fmt, ...);
void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void warning(const char* fmt, ...);
void notice(const char* fmt, ...);

void silentLogging(bool b);
void verboseEnabled(bool b);
void debugEnabled(bool b);
void traceEnabled(bool b);

enum class AddLogTimestamps
{
    NotSet, Never, Always, Important
};

void setLogTimestamps(AddLogTimestamps ts);
void stderrEnabled(bool b);

// A date is always kept as an iso string 2025-01-20, which sorts correctly.
// Accepts 2025-01-20 and the short US form 01/20/25. Returns false if not a valid date.
bool parseDate(const std::string &s, std::string *iso);
// Add (or subtract) whole days to an iso date.
std::string addDays(const std::string &iso, int days);
// Split "2025-01-20 13:45:10" or "2025-01-20T13:45:10" into date and hour.
bool parseTimestamp(const std::string &s, std::string *iso_date, int *hour);

// Return for example: 2010-03-21 15:22:03
std::string currentSeconds();

// Round v to the given number of decimals, half away from zero.
double roundTo(double v, int decimals);
// Print a double with at most the given decimals and without trailing zeroes.
std::string formatDecimals(double v, int decimals);

bool isNumber(const std::string& s);
// Parse a leading floating point value, the rest of the string must be whitespace.
bool parseDouble(const std::string &s, double *out);
bool parseInt(const std::string &s, int *out);

// Split s into strings separated by c, keeping empty parts.
std::vector<std::string> splitStringKeepEmpty(const std::string &s, char c);
// Join the strings with the separator.
std::string joinStrings(const std::vector<std::string> &v, const std::string &sep);

bool checkFileExists(const char *file);
bool checkIfDirExists(const char *dir);
int loadFile(const std::string& file, std::vector<std::string> *lines);
bool loadFile(const std::string& file, std::vector<char> *buf);

// Eat characters from the vector v, iterating using i, until the end char c is found.
// If end char == -1, then do not expect any end char, get all until eof.
// If the end char is not found, return error.
// If the maximum length is reached without finding the end char, return error.
std::string eatTo(std::vector<char> &v, std::vector<char>::iterator &i, int c, size_t max, bool *eof, bool *err);
// Eat whitespace (space and tab, not end of lines).
void eatWhitespace(std::vector<char> &v, std::vector<char>::iterator &i, bool *eof);
// First eat whitespace, then start eating until c is found or eof. The found string is trimmed from beginning and ending whitespace.
std::string eatToSkipWhitespace(std::vector<char> &v, std::vector<char>::iterator &i, int c, size_t max, bool *eof, bool *err);
// Remove leading and trailing white space
void trimWhitespace(std::string *s);

bool startsWith(const std::string &s, const char *prefix);
bool startsWith(const std::string &s, const std::string &prefix);

// Parse text string into milliseconds, 5h = (3600*5*1000) 2m = (60*2*1000) 1s = 1000 250ms = 250
// Returns -1 if the string is not a valid time.
int parseTimeMillis(const std::string& time);

// Sleep the calling thread.
void sleepMillis(int ms);

#endif
