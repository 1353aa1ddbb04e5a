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

#include"csvfile.h"
#include"util.h"

using namespace std;

int Table::column(const string &name) const
{
    for (size_t i = 0; i < columns.size(); ++i)
    {
        if (columns[i] == name) return (int)i;
    }
    return -1;
}

bool Table::hasColumns(const vector<string> &required, vector<string> *missing) const
{
    bool ok = true;
    for (auto &r : required)
    {
        if (column(r) == -1)
        {
            if (missing) missing->push_back(r);
            ok = false;
        }
    }
    return ok;
}

bool parseCsvLine(const string &line, char separator, vector<string> *fields)
{
    string field;
    bool quoted = false;
    bool was_quoted = false;

    fields->clear();
    for (size_t i = 0; i < line.length(); ++i)
    {
        char c = line[i];
        if (quoted)
        {
            if (c == '"')
            {
                if (i+1 < line.length() && line[i+1] == '"')
                {
                    field += '"';
                    i++;
                }
                else
                {
                    quoted = false;
                }
            }
            else
            {
                field += c;
            }
            continue;
        }
        if (c == '"')
        {
            quoted = true;
            was_quoted = true;
            continue;
        }
        if (c == separator)
        {
            if (!was_quoted) trimWhitespace(&field);
            fields->push_back(field);
            field = "";
            was_quoted = false;
            continue;
        }
        field += c;
    }
    if (quoted) return false;
    if (!was_quoted) trimWhitespace(&field);
    fields->push_back(field);
    return true;
}

bool parseCsv(const vector<string> &lines, char separator, Table *table, string *err)
{
    table->clear();
    if (lines.size() == 0)
    {
        *err = "no header line";
        return false;
    }
    if (!parseCsvLine(lines[0], separator, &table->columns))
    {
        *err = "bad header line";
        return false;
    }
    for (size_t i = 1; i < lines.size(); ++i)
    {
        vector<string> fields;
        if (!parseCsvLine(lines[i], separator, &fields))
        {
            *err = tostrprintf("unterminated quote on line %zu", i+1);
            return false;
        }
        if (fields.size() != table->columns.size())
        {
            *err = tostrprintf("line %zu has %zu fields but the header has %zu",
                               i+1, fields.size(), table->columns.size());
            return false;
        }
        table->rows.push_back(fields);
    }
    return true;
}

bool loadCsv(const string &file, char separator, Table *table, string *err)
{
    vector<string> lines;
    if (!checkFileExists(file.c_str()) || loadFile(file, &lines) != 0)
    {
        *err = "cannot read "+file;
        return false;
    }
    debug("(csv) loaded %zu lines from %s\n", lines.size(), file.c_str());
    string e;
    if (!parseCsv(lines, separator, table, &e))
    {
        *err = file+": "+e;
        return false;
    }
    return true;
}

string csvQuote(const string &field, char separator)
{
    if (field.find(separator) == string::npos &&
        field.find('"') == string::npos &&
        field.find('\n') == string::npos)
    {
        return field;
    }
    string r = "\"";
    for (char c : field)
    {
        if (c == '"') r += '"';
        r += c;
    }
    r += "\"";
    return r;
}

string toCsvLine(const vector<string> &fields, char separator)
{
    string r;
    for (size_t i = 0; i < fields.size(); ++i)
    {
        if (i > 0) r += separator;
        r += csvQuote(fields[i], separator);
    }
    return r;
}
