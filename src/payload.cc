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

#include"payload.h"
#include"util.h"

using namespace std;

static bool parseToken(const string &token, Measurement *m)
{
    // Only the first two parts of 3*2*7 are looked at.
    size_t star = token.find('*');
    string cs = token.substr(0, star);

    double current = 0;
    if (!parseDouble(cs, &current)) return false;

    double duration = 1.0;
    if (star != string::npos)
    {
        string ds = token.substr(star+1);
        size_t next = ds.find('*');
        if (next != string::npos) ds = ds.substr(0, next);
        // An unreadable duration falls back to the default.
        double d = 0;
        if (parseDouble(ds, &d)) duration = d;
    }
    if (duration <= 0) return false;

    m->current = current;
    m->duration_seconds = duration;
    return true;
}

vector<Measurement> parsePayload(const string &payload, char ignore_marker, int *num_dropped)
{
    vector<Measurement> measurements;
    int dropped = 0;

    vector<string> tokens = splitStringKeepEmpty(payload, ',');
    for (size_t i = 0; i < tokens.size(); ++i)
    {
        string token = tokens[i];
        trimWhitespace(&token);
        if (token.length() == 0) continue;
        if (token[0] == ignore_marker)
        {
            trace("(payload) ignoring annotation \"%s\"\n", token.c_str());
            continue;
        }

        Measurement m;
        m.index = (int)i;
        if (!parseToken(token, &m))
        {
            trace("(payload) dropping token %zu \"%s\"\n", i, token.c_str());
            dropped++;
            continue;
        }
        measurements.push_back(m);
    }

    if (num_dropped) *num_dropped = dropped;
    return measurements;
}
