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

#include"spans.h"
#include"util.h"

#include<algorithm>
#include<limits.h>
#include<math.h>

using namespace std;

vector<Span> buildSpans(const string &device_id,
                        const string &date,
                        const vector<Measurement> &measurements)
{
    vector<Span> spans;
    spans.reserve(measurements.size());

    double cumulative_end = 0;
    for (auto &m : measurements)
    {
        Span s;
        s.device_id = device_id;
        s.date = date;
        s.index = m.index;
        s.current = m.current;
        s.start_sec = cumulative_end;
        cumulative_end += m.duration_seconds;
        s.end_sec = cumulative_end;
        spans.push_back(s);
    }

    if (cumulative_end > SECONDS_PER_HOUR*HOURS_PER_DAY)
    {
        debug("(spans) %s %s carries %.0f seconds of telemetry, more than a day\n",
              device_id.c_str(), date.c_str(), cumulative_end);
    }
    return spans;
}

long distributeSpan(const Span &span, vector<HourContribution> *out)
{
    if (!(span.end_sec > span.start_sec)) return 0;

    // Hours are counted in double, a single span can reach far beyond the
    // range of an int.
    double first_hour = floor(span.start_sec / SECONDS_PER_HOUR);
    // The last hour is the one holding the final second of the span.
    // Using ceil instead of floor((end-1)/3600) keeps fractional seconds
    // at an hour border inside the right bucket.
    double last_hour = ceil(span.end_sec / SECONDS_PER_HOUR) - 1;
    if (last_hour < first_hour) last_hour = first_hour;

    double last_kept = min(last_hour, (double)(HOURS_PER_DAY-1));
    for (double h = first_hour; h <= last_kept; h += 1)
    {
        double hour_start = h * SECONDS_PER_HOUR;
        double hour_end = (h+1) * SECONDS_PER_HOUR;
        double overlap = min(span.end_sec, hour_end) - max(span.start_sec, hour_start);
        if (overlap < 0) overlap = 0;

        HourContribution c;
        c.device_id = span.device_id;
        c.date = span.date;
        c.hour_index = (int)h;
        c.current = span.current;
        c.overlap_seconds = overlap;
        out->push_back(c);
    }

    if (last_hour < HOURS_PER_DAY) return 0;
    double beyond = last_hour - max(first_hour, (double)HOURS_PER_DAY) + 1;
    if (beyond >= (double)LONG_MAX) return LONG_MAX;
    return (long)beyond;
}

vector<HourContribution> distributeHours(const vector<Span> &spans, long *discarded)
{
    vector<HourContribution> contributions;
    for (auto &s : spans)
    {
        long n = distributeSpan(s, &contributions);
        if (discarded) *discarded += n;
    }
    return contributions;
}
