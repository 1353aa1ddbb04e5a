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

#include"util.h"

#include<algorithm>
#include<ctype.h>
#include<errno.h>
#include<fcntl.h>
#include<math.h>
#include<pthread.h>
#include<stdarg.h>
#include<stddef.h>
#include<stdio.h>
#include<stdlib.h>
#include<string.h>
#include<string>
#include<sys/stat.h>
#include<sys/time.h>
#include<sys/types.h>
#include<time.h>
#include<unistd.h>

using namespace std;

string tostrprintf(const char* fmt, ...)
{
    string s;
    char buf[4096];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buf, 4096, fmt, args);
    va_end(args);
    s = buf;
    return s;
}

bool logfile_enabled_ = false;
bool logging_silenced_ = false;
bool verbose_enabled_ = false;
bool debug_enabled_ = false;
bool trace_enabled_ = false;
AddLogTimestamps log_timestamps_ {};
bool stderr_enabled_ = false;

string log_file_;

// The workers log too, keep their lines from interleaving.
pthread_mutex_t log_lock_ = PTHREAD_MUTEX_INITIALIZER;

void silentLogging(bool b) {
    logging_silenced_ = b;
}

bool enableLogfile(const string& logfile)
{
    log_file_ = logfile;
    logfile_enabled_ = true;
    FILE *output = fopen(log_file_.c_str(), "a");
    if (output) {
        char buf[256];
        time_t now = time(NULL);
        strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", localtime(&now));
        fprintf(output, "(hvacmeters) logging started %s\n", buf);
        fclose(output);
        return true;
    }
    logfile_enabled_ = false;
    return false;
}

void disableLogfile()
{
    logfile_enabled_ = false;
}

void verboseEnabled(bool b) {
    verbose_enabled_ = b;
}

void debugEnabled(bool b) {
    debug_enabled_ = b;
    if (debug_enabled_) {
        verbose_enabled_ = true;
    }
}

void traceEnabled(bool b) {
    trace_enabled_ = b;
    if (trace_enabled_) {
        debug_enabled_ = b;
        verbose_enabled_ = true;
    }
}

void setLogTimestamps(AddLogTimestamps ts) {
    log_timestamps_ = ts;
}

void stderrEnabled(bool b) {
    stderr_enabled_ = b;
}

void output_stuff(bool use_timestamp, const char *fmt, va_list args)
{
    string timestamp;
    bool add_timestamp = false;

    if (log_timestamps_ == AddLogTimestamps::Always ||
        (log_timestamps_ == AddLogTimestamps::Important && use_timestamp))
    {
        timestamp = currentSeconds();
        add_timestamp = true;
    }

    pthread_mutex_lock(&log_lock_);
    if (logfile_enabled_)
    {
        // Open close at every log occasion, a run logs a few hundred lines at most.
        FILE *output = fopen(log_file_.c_str(), "a");
        if (output)
        {
            if (add_timestamp) fprintf(output, "[%s] ", timestamp.c_str());
            vfprintf(output, fmt, args);
            fclose(output);
            pthread_mutex_unlock(&log_lock_);
            return;
        }
        // Ouch, disable the log file and fall back to stdout/stderr.
        logfile_enabled_ = false;
        fprintf(stderr, "Log file could not be written!\n");
    }
    if (stderr_enabled_)
    {
        if (add_timestamp) fprintf(stderr, "[%s] ", timestamp.c_str());
        vfprintf(stderr, fmt, args);
    }
    else
    {
        if (add_timestamp) printf("[%s] ", timestamp.c_str());
        vprintf(fmt, args);
        fflush(stdout);
    }
    pthread_mutex_unlock(&log_lock_);
}

void notice(const char* fmt, ...) {
    if (!logging_silenced_) {
        va_list args;
        va_start(args, fmt);
        output_stuff(false, fmt, args);
        va_end(args);
    }
}

void warning(const char* fmt, ...) {
    if (!logging_silenced_) {
        va_list args;
        va_start(args, fmt);
        output_stuff(true, fmt, args);
        va_end(args);
    }
}

void verbose(const char* fmt, ...) {
    if (verbose_enabled_) {
        va_list args;
        va_start(args, fmt);
        output_stuff(false, fmt, args);
        va_end(args);
    }
}

void debug(const char* fmt, ...) {
    if (debug_enabled_) {
        va_list args;
        va_start(args, fmt);
        output_stuff(false, fmt, args);
        va_end(args);
    }
}

void trace(const char* fmt, ...) {
    if (trace_enabled_) {
        va_list args;
        va_start(args, fmt);
        output_stuff(false, fmt, args);
        va_end(args);
    }
}

void error(const char* fmt, ...)
{
    va_list args;
    va_start(args, fmt);
    output_stuff(true, fmt, args);
    va_end(args);
    exit(1);
}

bool is_leap_year(int year)
{
    if (year % 4 != 0) return false;
    if (year % 400 == 0) return true;
    if (year % 100 == 0) return false;
    return true;
}

int days_in_months[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};

int get_days_in_month(int year, int month)
{
    if (month < 1 || month > 12) return 0;
    int days = days_in_months[month-1];
    if (month == 2 && is_leap_year(year)) days++;
    return days;
}

// Days since 1970-01-01 for a proleptic gregorian date.
static long daysFromCivil(int y, int m, int d)
{
    y -= m <= 2;
    long era = (y >= 0 ? y : y-399) / 400;
    long yoe = y - era * 400;
    long doy = (153*(m + (m > 2 ? -3 : 9)) + 2)/5 + d-1;
    long doe = yoe * 365 + yoe/4 - yoe/100 + doy;
    return era * 146097 + doe - 719468;
}

static void civilFromDays(long z, int *y, int *m, int *d)
{
    z += 719468;
    long era = (z >= 0 ? z : z - 146096) / 146097;
    long doe = z - era * 146097;
    long yoe = (doe - doe/1460 + doe/36524 - doe/146096) / 365;
    long doy = doe - (365*yoe + yoe/4 - yoe/100);
    long mp = (5*doy + 2)/153;
    *d = doy - (153*mp+2)/5 + 1;
    *m = mp < 10 ? mp+3 : mp-9;
    *y = yoe + era * 400 + (*m <= 2);
}

static bool allDigits(const string &s)
{
    if (s.length() == 0) return false;
    for (char c : s) if (!isdigit((unsigned char)c)) return false;
    return true;
}

static string isoFrom(int y, int m, int d)
{
    return tostrprintf("%04d-%02d-%02d", y, m, d);
}

bool parseDate(const string &in, string *iso)
{
    string s = in;
    trimWhitespace(&s);
    int y, m, d;

    if (s.length() == 10 && s[4] == '-' && s[7] == '-')
    {
        string ys = s.substr(0,4), ms = s.substr(5,2), ds = s.substr(8,2);
        if (!allDigits(ys) || !allDigits(ms) || !allDigits(ds)) return false;
        y = atoi(ys.c_str());
        m = atoi(ms.c_str());
        d = atoi(ds.c_str());
    }
    else
    {
        // The roster exports automation dates as 01/20/25.
        vector<string> parts = splitStringKeepEmpty(s, '/');
        if (parts.size() != 3) return false;
        if (!allDigits(parts[0]) || !allDigits(parts[1]) || !allDigits(parts[2])) return false;
        if (parts[2].length() != 2 && parts[2].length() != 4) return false;
        m = atoi(parts[0].c_str());
        d = atoi(parts[1].c_str());
        y = atoi(parts[2].c_str());
        if (parts[2].length() == 2) y += 2000;
    }

    if (m < 1 || m > 12) return false;
    if (d < 1 || d > get_days_in_month(y, m)) return false;

    *iso = isoFrom(y, m, d);
    return true;
}

string addDays(const string &iso, int days)
{
    int y = atoi(iso.substr(0,4).c_str());
    int m = atoi(iso.substr(5,2).c_str());
    int d = atoi(iso.substr(8,2).c_str());
    long z = daysFromCivil(y, m, d) + days;
    civilFromDays(z, &y, &m, &d);
    return isoFrom(y, m, d);
}

bool parseTimestamp(const string &in, string *iso_date, int *hour)
{
    string s = in;
    trimWhitespace(&s);
    if (s.length() < 10) return false;
    string date;
    if (!parseDate(s.substr(0,10), &date)) return false;

    int h = 0;
    if (s.length() > 10)
    {
        if (s[10] != ' ' && s[10] != 'T') return false;
        if (s.length() < 13) return false;
        string hs = s.substr(11,2);
        if (!allDigits(hs)) return false;
        h = atoi(hs.c_str());
        if (h > 23) return false;
    }
    *iso_date = date;
    *hour = h;
    return true;
}

string currentSeconds()
{
    char datetime[40];
    memset(datetime, 0, sizeof(datetime));

    struct timeval tv;
    gettimeofday(&tv, NULL);

    strftime(datetime, 20, "%Y-%m-%d_%H:%M:%S", localtime(&tv.tv_sec));
    return string(datetime);
}

double roundTo(double v, int decimals)
{
    double scale = pow(10.0, decimals);
    return round(v * scale) / scale;
}

string formatDecimals(double v, int decimals)
{
    string s = tostrprintf("%.*f", decimals, roundTo(v, decimals));
    if (s.find('.') != string::npos)
    {
        while (s.back() == '0') s.pop_back();
        if (s.back() == '.') s.pop_back();
    }
    if (s == "-0") s = "0";
    return s;
}

bool isNumber(const string& fq)
{
    int len = fq.length();
    if (len == 0) return false;
    for (int i=0; i<len; ++i) {
        if (!isdigit((unsigned char)fq[i])) return false;
    }
    return true;
}

bool parseDouble(const string &in, double *out)
{
    string s = in;
    trimWhitespace(&s);
    if (s.length() == 0) return false;

    const char *start = s.c_str();
    char *end = NULL;
    errno = 0;
    double v = strtod(start, &end);
    if (end == start || errno == ERANGE) return false;
    if (*end != 0) return false;
    if (isnan(v) || isinf(v)) return false;
    *out = v;
    return true;
}

bool parseInt(const string &in, int *out)
{
    string s = in;
    trimWhitespace(&s);
    if (s.length() == 0) return false;

    const char *start = s.c_str();
    char *end = NULL;
    errno = 0;
    long v = strtol(start, &end, 10);
    if (end == start || errno == ERANGE || *end != 0) return false;
    *out = (int)v;
    return true;
}

vector<string> splitStringKeepEmpty(const string &s, char c)
{
    vector<string> v;
    size_t from = 0;
    for (;;)
    {
        size_t p = s.find(c, from);
        if (p == string::npos)
        {
            v.push_back(s.substr(from));
            break;
        }
        v.push_back(s.substr(from, p-from));
        from = p+1;
    }
    return v;
}

string joinStrings(const vector<string> &v, const string &sep)
{
    string r;
    for (size_t i = 0; i < v.size(); ++i)
    {
        if (i > 0) r += sep;
        r += v[i];
    }
    return r;
}

bool checkFileExists(const char *file)
{
    struct stat info;

    int rc = stat(file, &info);
    if (rc != 0) {
        return false;
    }
    if (!S_ISREG(info.st_mode)) {
        return false;
    }
    return true;
}

bool checkIfDirExists(const char *dir)
{
    struct stat info;

    int rc = stat(dir, &info);
    if (rc != 0) {
        return false;
    }
    if (!S_ISDIR(info.st_mode)) {
        return false;
    }
    if (info.st_mode & S_IWUSR &&
        info.st_mode & S_IRUSR &&
        info.st_mode & S_IXUSR) {
        // Check the directory is writeable.
        return true;
    }
    return false;
}

int loadFile(const string& file, vector<string> *lines)
{
    vector<char> buf;
    if (!loadFile(file, &buf)) return -1;

    bool eof, err;
    auto i = buf.begin();
    if (i == buf.end()) return 0;
    for (;;) {
        // A line can be as long as the whole file.
        string line = eatTo(buf, i, '\n', buf.size()+1, &eof, &err);
        if (line.length() > 0 && line.back() == '\r') line.pop_back();
        if (line.length() > 0) {
            lines->push_back(line);
        }
        if (eof) break;
    }

    return 0;
}

bool loadFile(const string& file, vector<char> *buf)
{
    char block[4096];

    int fd = open(file.c_str(), O_RDONLY);
    if (fd == -1) {
        warning("Could not open file %s errno=%d\n", file.c_str(), errno);
        return false;
    }
    while (true) {
        ssize_t n = read(fd, block, sizeof(block));
        if (n == -1) {
            if (errno == EINTR) {
                continue;
            }
            warning("Could not read file %s errno=%d\n", file.c_str(), errno);
            close(fd);

            return false;
        }
        if (n == 0) break;
        buf->insert(buf->end(), block, block+n);
    }
    close(fd);
    return true;
}

string eatToSkipWhitespace(vector<char> &v, vector<char>::iterator &i, int c, size_t max, bool *eof, bool *err)
{
    eatWhitespace(v, i, eof);
    if (*eof) {
        if (c != -1) {
            *err = true;
        }
        return "";
    }
    string s = eatTo(v,i,c,max,eof,err);
    trimWhitespace(&s);
    return s;
}

string eatTo(vector<char> &v, vector<char>::iterator &i, int c, size_t max, bool *eof, bool *err)
{
    string s;

    *eof = false;
    *err = false;
    while (max > 0 && i != v.end() && (c == -1 || *i != c))
    {
        s += *i;
        i++;
        max--;
    }
    if (c != -1 && (i == v.end() || *i != c))
    {
        *err = true;
    }
    if (i != v.end())
    {
        i++;
    }
    if (i == v.end()) {
        *eof = true;
    }
    return s;
}

void eatWhitespace(vector<char> &v, vector<char>::iterator &i, bool *eof)
{
    *eof = false;
    while (i != v.end() && (*i == ' ' || *i == '\t'))
    {
        i++;
    }
    if (i == v.end()) {
        *eof = true;
    }
}

void trimWhitespace(string *s)
{
    const char *ws = " \t\r";
    s->erase(0, s->find_first_not_of(ws));
    s->erase(s->find_last_not_of(ws) + 1);
}

bool startsWith(const string& s, const string &prefix)
{
    return startsWith(s, prefix.c_str());
}

bool startsWith(const string& s, const char *prefix)
{
    size_t len = strlen(prefix);
    if (s.length() < len) return false;
    if (s.length() == len) return s == prefix;
    return !strncmp(&s[0], prefix, len);
}

int parseTimeMillis(const string& s)
{
    string time = s;
    trimWhitespace(&time);
    if (time.length() == 0) return -1;
    int mul = 1000;
    if (time.length() > 2 && time.substr(time.length()-2) == "ms") {
        time.pop_back();
        time.pop_back();
        mul = 1;
    }
    else if (time.back() == 'h') {
        time.pop_back();
        mul = 3600*1000;
    }
    else if (time.back() == 'm') {
        time.pop_back();
        mul = 60*1000;
    }
    else if (time.back() == 's') {
        time.pop_back();
        mul = 1000;
    }
    if (!isNumber(time)) return -1;
    int n = atoi(time.c_str());
    return n*mul;
}

void sleepMillis(int ms)
{
    if (ms <= 0) return;
    struct timespec ts;
    ts.tv_sec = ms / 1000;
    ts.tv_nsec = (ms % 1000) * 1000000L;
    while (nanosleep(&ts, &ts) == -1 && errno == EINTR) { }
}
