/*
 Copyright (C) 2025 Fredrik Öhrström (gpl-3.0-or-later)

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

#ifndef CSVFILE_H
#define CSVFILE_H

#include<string>
#include<vector>

// Rows of text cells with named columns, as returned by a query
// or loaded from a csv file with a header line.
struct Table
{
    std::vector<std::string> columns;
    std::vector<std::vector<std::string>> rows;

    // Returns -1 if there is no such column.
    int column(const std::string &name) const;
    // Returns false and fills missing with the names not found.
    bool hasColumns(const std::vector<std::string> &required, std::vector<std::string> *missing) const;
    size_t size() const { return rows.size(); }
    void clear() { columns.clear(); rows.clear(); }
};

// Split a csv line, "a,b" quoting and "" escapes are understood.
// Returns false if a quote is left open.
bool parseCsvLine(const std::string &line, char separator, std::vector<std::string> *fields);
// The first line is the header. Returns false and sets err on failure.
bool parseCsv(const std::vector<std::string> &lines, char separator, Table *table, std::string *err);
bool loadCsv(const std::string &file, char separator, Table *table, std::string *err);

std::string csvQuote(const std::string &field, char separator);
std::string toCsvLine(const std::vector<std::string> &fields, char separator);

#endif
