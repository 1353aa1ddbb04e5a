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

#include"printer.h"
#include"util.h"

#include<string.h>

using namespace std;

Printer::Printer(OutputFormat format, char separator, string outputdir)
{
    format_ = format;
    separator_ = separator;
    outputdir_ = outputdir;
}

string Printer::filename(const string &name)
{
    if (outputdir_ == "" || outputdir_ == "-") return "-";
    return outputdir_+"/"+name+(format_ == OutputFormat::JSON ? ".json" : ".csv");
}

bool Printer::printConsolidated(const vector<ConsumptionRecord> &records)
{
    vector<vector<string>> rows;
    for (auto &r : records)
    {
        rows.push_back({ to_string(r.unit_id),
                         r.device_id,
                         r.device_version,
                         to_string(r.hour),
                         r.date,
                         formatDecimals(r.consumo_kwh, 6),
                         r.install_date,
                         r.automation_start_date,
                         toString(r.method) });
    }
    return print(CONSOLIDATED_NAME,
                 { { "unit_id", true },
                   { "device_id", false },
                   { "device_version", false },
                   { "hora", true },
                   { "data", false },
                   { "consumo_kwh", true },
                   { "data_instalacao", false },
                   { "data_inicio_automacao", false },
                   { "metodo", false } },
                 rows);
}

bool Printer::printUnitHours(const vector<UnitHourAggregate> &hours)
{
    vector<vector<string>> rows;
    for (auto &h : hours)
    {
        rows.push_back({ to_string(h.unit_id),
                         h.date,
                         to_string(h.hour),
                         to_string(h.qtd_devices_total),
                         to_string(h.qtd_dac),
                         to_string(h.qtd_dut),
                         formatDecimals(h.peso_medio_dac, 6),
                         formatDecimals(h.peso_medio_dut, 6),
                         formatDecimals(h.consumo_kwh_total, 6),
                         h.metodos });
    }
    return print(UNIT_HOURS_NAME,
                 { { "unit_id", true },
                   { "data", false },
                   { "hora", true },
                   { "qtd_devices_total", true },
                   { "qtd_dac", true },
                   { "qtd_dut", true },
                   { "peso_medio_dac", true },
                   { "peso_medio_dut", true },
                   { "consumo_kwh_total", true },
                   { "metodos", false } },
                 rows);
}

bool Printer::printRollup(const vector<UnitRollup> &rollup)
{
    vector<vector<string>> rows;
    for (auto &u : rollup)
    {
        rows.push_back({ to_string(u.unit_id),
                         u.date,
                         to_string(u.hour),
                         u.metodo,
                         formatDecimals(u.consumo_kwh_total, 4),
                         to_string(u.qtd_dispositivos) });
    }
    return print(ROLLUP_NAME,
                 { { "unit_id", true },
                   { "data", false },
                   { "hora", true },
                   { "metodo", false },
                   { "consumo_kwh_total", true },
                   { "qtd_dispositivos", true } },
                 rows);
}

bool Printer::printSummary(const vector<UnitSummary> &summary)
{
    vector<vector<string>> rows;
    for (auto &s : summary)
    {
        rows.push_back({ to_string(s.unit_id),
                         formatDecimals(s.consumo_total_kwh, 4),
                         to_string(s.dias_com_dados),
                         to_string(s.registros_direto),
                         to_string(s.registros_indireto),
                         formatDecimals(s.dispositivos_medio, 2) });
    }
    return print(SUMMARY_NAME,
                 { { "unit_id", true },
                   { "consumo_total_kwh", true },
                   { "dias_com_dados", true },
                   { "registros_direto", true },
                   { "registros_indireto", true },
                   { "dispositivos_medio", true } },
                 rows);
}

bool Printer::print(const string &name, const vector<Column> &columns, const vector<vector<string>> &rows)
{
    FILE *output = stdout;
    string file = filename(name);

    if (file != "-")
    {
        output = fopen(file.c_str(), "w");
        if (!output) {
            warning("Could not open file \"%s\" for writing!\n", file.c_str());
            return false;
        }
    }

    if (format_ == OutputFormat::JSON)
    {
        printJson(output, columns, rows);
    }
    else
    {
        printCsv(output, columns, rows);
    }

    if (output != stdout)
    {
        if (fclose(output) != 0)
        {
            warning("Could not write file \"%s\"!\n", file.c_str());
            return false;
        }
        verbose("(printer) wrote %zu rows to %s\n", rows.size(), file.c_str());
    }
    else
    {
        fflush(stdout);
    }
    return true;
}

void Printer::printCsv(FILE *output, const vector<Column> &columns, const vector<vector<string>> &rows)
{
    vector<string> header;
    for (auto &c : columns) header.push_back(c.name);
    fprintf(output, "%s\n", toCsvLine(header, separator_).c_str());
    for (auto &r : rows)
    {
        fprintf(output, "%s\n", toCsvLine(r, separator_).c_str());
    }
}

void Printer::printJson(FILE *output, const vector<Column> &columns, const vector<vector<string>> &rows)
{
    for (auto &r : rows)
    {
        string json = "{";
        for (size_t i = 0; i < columns.size(); ++i)
        {
            if (i > 0) json += ",";
            json += jsonQuote(columns[i].name)+":";
            json += columns[i].numeric ? r[i] : jsonQuote(r[i]);
        }
        json += "}";
        fprintf(output, "%s\n", json.c_str());
    }
}

string jsonQuote(const string &s)
{
    string r = "\"";
    for (char c : s)
    {
        switch (c)
        {
        case '"': r += "\\\""; break;
        case '\\': r += "\\\\"; break;
        case '\n': r += "\\n"; break;
        case '\r': r += "\\r"; break;
        case '\t': r += "\\t"; break;
        default:
            if ((unsigned char)c < 0x20) r += tostrprintf("\\u%04x", c);
            else r += c;
        }
    }
    r += "\"";
    return r;
}
