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

#ifndef SPANS_H
#define SPANS_H

#include"payload.h"

#include<stddef.h>
#include<string>
#include<vector>

#define SECONDS_PER_HOUR 3600
#define HOURS_PER_DAY 24

// A contiguous interval of constant current inside one day of telemetry.
// start_sec and end_sec count seconds since the start of the local day.
struct Span
{
    std::string device_id;
    std::string date;
    int index {};
    double current {};
    double start_sec {};
    double end_sec {};

    double duration() const { return end_sec - start_sec; }
};

// The part of a span that falls inside one wall clock hour.
struct HourContribution
{
    std::string device_id;
    std::string date;
    int hour_index {}; // 0-23
    double current {};
    double overlap_seconds {};
};

// Lay out the measurements back to back starting at second 0 of the day,
// in payload order, using a running sum of the durations.
std::vector<Span> buildSpans(const std::string &device_id,
                             const std::string &date,
                             const std::vector<Measurement> &measurements);

// Append one contribution for each hour 0-23 the span touches.
// Returns the number of hour buckets beyond hour 23 that were discarded.
long distributeSpan(const Span &span, std::vector<HourContribution> *out);

std::vector<HourContribution> distributeHours(const std::vector<Span> &spans, long *discarded = NULL);

#endif
