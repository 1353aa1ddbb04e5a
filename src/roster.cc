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

#include"roster.h"
#include"util.h"

#include<map>
#include<set>

using namespace std;

static int findColumn(const Table &t, const char *name, const char *alias)
{
    int c = t.column(name);
    if (c == -1) c = t.column(alias);
    return c;
}

bool extractUnits(const Table &t, vector<FacilityUnit> *units, string *err)
{
    int uc = findColumn(t, "unit_id", "id_bradesco");
    int oc = findColumn(t, "install_offset_days", "dias_antes_automacao");
    int ac = findColumn(t, "automation_start_date", "data_inicio_automacao");
    int nc = t.column("unit_name");

    vector<string> missing;
    if (uc == -1) missing.push_back("unit_id");
    if (oc == -1) missing.push_back("install_offset_days");
    if (ac == -1) missing.push_back("automation_start_date");
    if (missing.size() > 0)
    {
        *err = "unit roster lacks columns: "+joinStrings(missing, ", ");
        return false;
    }

    set<int> seen;
    for (size_t i = 0; i < t.rows.size(); ++i)
    {
        auto &r = t.rows[i];
        FacilityUnit u;
        if (!parseInt(r[uc], &u.unit_id))
        {
            *err = tostrprintf("bad unit_id \"%s\" on row %zu", r[uc].c_str(), i+1);
            return false;
        }
        if (!parseInt(r[oc], &u.install_offset_days) || u.install_offset_days < 0)
        {
            *err = tostrprintf("bad install offset \"%s\" for unit %d", r[oc].c_str(), u.unit_id);
            return false;
        }
        if (!parseDate(r[ac], &u.automation_start_date))
        {
            *err = tostrprintf("bad automation start date \"%s\" for unit %d", r[ac].c_str(), u.unit_id);
            return false;
        }
        if (nc != -1) u.name = r[nc];
        u.install_date = addDays(u.automation_start_date, -(u.install_offset_days+1));

        if (seen.count(u.unit_id))
        {
            warning("(roster) unit %d listed more than once, using the first entry\n", u.unit_id);
            continue;
        }
        seen.insert(u.unit_id);
        units->push_back(u);
    }
    return true;
}

bool loadUnits(const string &file, char separator, vector<FacilityUnit> *units, string *err)
{
    Table t;
    if (!loadCsv(file, separator, &t, err)) return false;
    return extractUnits(t, units, err);
}

vector<int> unitIds(const vector<FacilityUnit> &units)
{
    vector<int> ids;
    for (auto &u : units) ids.push_back(u.unit_id);
    return ids;
}

string deviceVersion(const string &device_id, int version_length)
{
    return device_id.substr(0, version_length);
}

vector<UnitDeviceWindow> buildWindows(const vector<FacilityUnit> &units,
                                      const vector<DeviceUnit> &devices,
                                      int version_length)
{
    map<int,const FacilityUnit*> by_id;
    for (auto &u : units) by_id[u.unit_id] = &u;

    vector<UnitDeviceWindow> windows;
    set<string> seen;
    for (auto &d : devices)
    {
        auto i = by_id.find(d.unit_id);
        if (i == by_id.end())
        {
            debug("(roster) device %s belongs to unit %d which is not in the roster\n",
                  d.device_id.c_str(), d.unit_id);
            continue;
        }
        if (seen.count(d.device_id)) continue;
        seen.insert(d.device_id);

        UnitDeviceWindow w;
        w.unit_id = d.unit_id;
        w.device_id = d.device_id;
        w.device_version = deviceVersion(d.device_id, version_length);
        w.install_date = i->second->install_date;
        w.automation_start_date = i->second->automation_start_date;
        windows.push_back(w);
    }
    return windows;
}

vector<string> versionsInOrder(const vector<UnitDeviceWindow> &windows)
{
    vector<string> versions;
    set<string> seen;
    for (auto &w : windows)
    {
        if (seen.count(w.device_version)) continue;
        seen.insert(w.device_version);
        versions.push_back(w.device_version);
    }
    return versions;
}

bool dateRange(const vector<UnitDeviceWindow> &windows, string *first, string *last)
{
    if (windows.size() == 0) return false;
    *first = windows[0].install_date;
    *last = windows[0].automation_start_date;
    for (auto &w : windows)
    {
        if (w.install_date < *first) *first = w.install_date;
        if (w.automation_start_date > *last) *last = w.automation_start_date;
    }
    return true;
}

bool dateRange(const vector<FacilityUnit> &units, string *first, string *last)
{
    if (units.size() == 0) return false;
    *first = units[0].install_date;
    *last = units[0].automation_start_date;
    for (auto &u : units)
    {
        if (u.install_date < *first) *first = u.install_date;
        if (u.automation_start_date > *last) *last = u.automation_start_date;
    }
    return true;
}
