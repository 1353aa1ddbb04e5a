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

#ifndef PRINTER_H
#define PRINTER_H

#include"aggregation.h"
#include"config.h"
#include"consumption.h"

#include<stdio.h>
#include<string>
#include<vector>

using namespace std;

#define CONSOLIDATED_NAME "consumption_consolidated"
#define UNIT_HOURS_NAME "consumption_unit_hours"
#define ROLLUP_NAME "consumption_aggregated_by_unit"
#define SUMMARY_NAME "consumption_summary_by_unit"

// Writes the result tables as csv with a header line, or as one json object per line.
// With outputdir "-" everything is printed on stdout, otherwise each table
// goes into outputdir/<name>.csv or outputdir/<name>.json
struct Printer {
    Printer(OutputFormat format, char separator, string outputdir);

    bool printConsolidated(const vector<ConsumptionRecord> &records);
    bool printUnitHours(const vector<UnitHourAggregate> &hours);
    bool printRollup(const vector<UnitRollup> &rollup);
    bool printSummary(const vector<UnitSummary> &summary);

    // The file the table name is written to, or "-".
    string filename(const string &name);

    private:

    OutputFormat format_;
    char separator_;
    string outputdir_;

    // A column is numeric when its json value should not be quoted.
    struct Column
    {
        const char *name;
        bool numeric;
    };

    bool print(const string &name, const vector<Column> &columns, const vector<vector<string>> &rows);
    void printCsv(FILE *output, const vector<Column> &columns, const vector<vector<string>> &rows);
    void printJson(FILE *output, const vector<Column> &columns, const vector<vector<string>> &rows);
};

// Quote and escape s as a json string.
string jsonQuote(const string &s);

#endif
