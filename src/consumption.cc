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

#include"consumption.h"

#include<algorithm>

using namespace std;

const char *toString(Method m)
{
    switch (m)
    {
    case Method::Direct: return "direto";
    case Method::Indirect: return "indireto";
    }
    return "?";
}

bool toMethod(const string &s, Method *m)
{
    if (s == "direto" || s == "direct")
    {
        *m = Method::Direct;
        return true;
    }
    if (s == "indireto" || s == "indirect")
    {
        *m = Method::Indirect;
        return true;
    }
    return false;
}

bool operator<(const ConsumptionRecord &a, const ConsumptionRecord &b)
{
    if (a.unit_id != b.unit_id) return a.unit_id < b.unit_id;
    if (a.date != b.date) return a.date < b.date;
    if (a.hour != b.hour) return a.hour < b.hour;
    if (a.method != b.method) return a.method < b.method;
    return a.device_id < b.device_id;
}

void sortRecords(vector<ConsumptionRecord> *records)
{
    stable_sort(records->begin(), records->end());
}
