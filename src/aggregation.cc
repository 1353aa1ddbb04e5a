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

#include"aggregation.h"
#include"util.h"

#include<map>
#include<set>
#include<tuple>

using namespace std;

const char *toString(DeviceType t)
{
    switch (t)
    {
    case DeviceType::DAC: return "DAC";
    case DeviceType::DUT: return "DUT";
    case DeviceType::OTHER: return "OTHER";
    }
    return "?";
}

DeviceType deviceType(const string &device_id, int type_length)
{
    string prefix = device_id.substr(0, type_length);
    if (prefix == "DAC") return DeviceType::DAC;
    if (prefix == "DUT") return DeviceType::DUT;
    return DeviceType::OTHER;
}

typedef tuple<int,string,int> UnitHourKey;

struct UnitHour
{
    map<string,double> devices; // Consumption per device.
    set<string> methods;
};

vector<UnitHourAggregate> aggregateUnitHours(const vector<ConsumptionRecord> &records, int type_length)
{
    map<UnitHourKey,UnitHour> hours;

    for (auto &r : records)
    {
        UnitHour &uh = hours[make_tuple(r.unit_id, r.date, r.hour)];
        // A device seen with both methods counts once.
        uh.devices[r.device_id] += r.consumo_kwh;
        uh.methods.insert(toString(r.method));
    }

    vector<UnitHourAggregate> result;
    for (auto &p : hours)
    {
        UnitHour &uh = p.second;
        UnitHourAggregate a;
        a.unit_id = get<0>(p.first);
        a.date = get<1>(p.first);
        a.hour = get<2>(p.first);
        a.qtd_devices_total = uh.devices.size();

        double total = 0;
        for (auto &d : uh.devices) total += d.second;
        a.consumo_kwh_total = total;

        double n = a.qtd_devices_total;
        double sum_dac = 0, sum_dut = 0;
        for (auto &d : uh.devices)
        {
            double share = total > 0 ? d.second / total : 1.0 / n;
            double peso = 0.5 * (1.0 / n) + 0.5 * share;
            switch (deviceType(d.first, type_length))
            {
            case DeviceType::DAC: a.qtd_dac++; sum_dac += peso; break;
            case DeviceType::DUT: a.qtd_dut++; sum_dut += peso; break;
            case DeviceType::OTHER: break;
            }
        }
        a.peso_medio_dac = a.qtd_dac > 0 ? sum_dac / a.qtd_dac : 0.0;
        a.peso_medio_dut = a.qtd_dut > 0 ? sum_dut / a.qtd_dut : 0.0;

        vector<string> methods(uh.methods.begin(), uh.methods.end());
        a.metodos = joinStrings(methods, ",");
        result.push_back(a);
    }
    return result;
}

typedef tuple<int,string,int,string> RollupKey;

vector<UnitRollup> rollupUnits(const vector<ConsumptionRecord> &records)
{
    map<RollupKey,pair<double,set<string>>> groups;

    for (auto &r : records)
    {
        auto &g = groups[make_tuple(r.unit_id, r.date, r.hour, string(toString(r.method)))];
        g.first += r.consumo_kwh;
        g.second.insert(r.device_id);
    }

    vector<UnitRollup> result;
    for (auto &p : groups)
    {
        UnitRollup u;
        u.unit_id = get<0>(p.first);
        u.date = get<1>(p.first);
        u.hour = get<2>(p.first);
        u.metodo = get<3>(p.first);
        u.consumo_kwh_total = roundTo(p.second.first, 4);
        u.qtd_dispositivos = p.second.second.size();
        result.push_back(u);
    }
    return result;
}

vector<UnitSummary> summarizeUnits(const vector<UnitRollup> &rollup)
{
    map<int,UnitSummary> units;
    map<int,set<string>> dates;
    map<int,int> rows;

    for (auto &r : rollup)
    {
        UnitSummary &s = units[r.unit_id];
        s.unit_id = r.unit_id;
        s.consumo_total_kwh += r.consumo_kwh_total;
        if (r.metodo == toString(Method::Direct)) s.registros_direto++;
        if (r.metodo == toString(Method::Indirect)) s.registros_indireto++;
        s.dispositivos_medio += r.qtd_dispositivos;
        dates[r.unit_id].insert(r.date);
        rows[r.unit_id]++;
    }

    vector<UnitSummary> result;
    for (auto &p : units)
    {
        UnitSummary s = p.second;
        s.consumo_total_kwh = roundTo(s.consumo_total_kwh, 4);
        s.dias_com_dados = dates[p.first].size();
        s.dispositivos_medio = roundTo(s.dispositivos_medio / rows[p.first], 2);
        result.push_back(s);
    }
    return result;
}

bool extractConsolidated(const Table &t, vector<ConsumptionRecord> *records, string *err)
{
    vector<string> missing;
    if (!t.hasColumns({ "unit_id", "data", "hora", "metodo", "consumo_kwh", "device_id" }, &missing))
    {
        *err = "missing columns: "+joinStrings(missing, ", ");
        return false;
    }
    int uc = t.column("unit_id");
    int dc = t.column("data");
    int hc = t.column("hora");
    int mc = t.column("metodo");
    int cc = t.column("consumo_kwh");
    int ic = t.column("device_id");
    int vc = t.column("device_version");
    int sc = t.column("data_instalacao");
    int ac = t.column("data_inicio_automacao");

    int non_positive = 0;
    for (size_t i = 0; i < t.rows.size(); ++i)
    {
        auto &row = t.rows[i];
        ConsumptionRecord r;
        bool ok = parseInt(row[uc], &r.unit_id)
            && parseDate(row[dc], &r.date)
            && parseInt(row[hc], &r.hour)
            && r.hour >= 0 && r.hour < 24
            && toMethod(row[mc], &r.method)
            && parseDouble(row[cc], &r.consumo_kwh);
        if (!ok)
        {
            *err = tostrprintf("bad values on row %zu", i+2);
            return false;
        }
        if (!(r.consumo_kwh > 0))
        {
            debug("(aggregation) skipping row %zu with consumo_kwh %g\n", i+2, r.consumo_kwh);
            non_positive++;
            continue;
        }
        r.device_id = row[ic];
        if (vc != -1) r.device_version = row[vc];
        if (sc != -1) r.install_date = row[sc];
        if (ac != -1) r.automation_start_date = row[ac];
        records->push_back(r);
    }
    if (non_positive > 0)
    {
        warning("(aggregation) skipped %d consolidated rows without positive consumption\n", non_positive);
    }
    return true;
}

bool loadConsolidated(const string &file, char separator, vector<ConsumptionRecord> *records, string *err)
{
    Table t;
    if (!loadCsv(file, separator, &t, err)) return false;
    return extractConsolidated(t, records, err);
}
