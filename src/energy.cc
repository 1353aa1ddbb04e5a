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

#include"energy.h"
#include"util.h"

using namespace std;

#define WS_PER_KWH (3600.0*1000.0)

double Calibration::constantFor(const string &device_version) const
{
    double k = default_constant;
    size_t best = 0;
    for (auto &p : families)
    {
        if (p.first.length() > best && startsWith(device_version, p.first))
        {
            best = p.first.length();
            k = p.second;
        }
    }
    return k;
}

void EnergyStats::add(const EnergyStats &o)
{
    payloads += o.payloads;
    measurements += o.measurements;
    dropped_tokens += o.dropped_tokens;
    discarded_buckets += o.discarded_buckets;
    days_beyond_24h += o.days_beyond_24h;
}

struct HourKey
{
    string device_id;
    string date;
    int hour;

    bool operator<(const HourKey &k) const
    {
        if (device_id != k.device_id) return device_id < k.device_id;
        if (date != k.date) return date < k.date;
        return hour < k.hour;
    }
};

vector<HourlyConsumption> aggregateEnergy(const vector<HourContribution> &contributions,
                                          double calibration,
                                          EnergyStats *stats)
{
    map<HourKey,double> sums;

    for (auto &c : contributions)
    {
        if (c.hour_index < 0 || c.hour_index >= HOURS_PER_DAY)
        {
            if (stats) stats->discarded_buckets++;
            continue;
        }
        double watts = calibration * c.current;
        double kwh = watts * c.overlap_seconds / WS_PER_KWH;
        sums[HourKey { c.device_id, c.date, c.hour_index }] += kwh;
    }

    vector<HourlyConsumption> result;
    result.reserve(sums.size());
    for (auto &p : sums)
    {
        HourlyConsumption hc;
        hc.device_id = p.first.device_id;
        hc.date = p.first.date;
        hc.hour = p.first.hour;
        hc.consumo_kwh = roundTo(p.second, 6);
        result.push_back(hc);
    }
    return result;
}

vector<HourlyConsumption> computeDirectConsumption(const vector<DevicePayload> &payloads,
                                                   double calibration,
                                                   char ignore_marker,
                                                   EnergyStats *stats)
{
    vector<HourContribution> contributions;
    EnergyStats local;

    for (auto &p : payloads)
    {
        int dropped = 0;
        vector<Measurement> measurements = parsePayload(p.payload, ignore_marker, &dropped);
        vector<Span> spans = buildSpans(p.device_id, p.date, measurements);
        if (spans.size() > 0 && spans.back().end_sec > SECONDS_PER_HOUR*HOURS_PER_DAY)
        {
            local.days_beyond_24h++;
        }
        for (auto &s : spans)
        {
            local.discarded_buckets += distributeSpan(s, &contributions);
        }
        local.payloads++;
        local.measurements += measurements.size();
        local.dropped_tokens += dropped;
    }

    vector<HourlyConsumption> result = aggregateEnergy(contributions, calibration, &local);

    if (local.discarded_buckets > 0)
    {
        warning("(energy) discarded %ld hour buckets beyond 23 from %d device days with more than 24h of telemetry\n",
                local.discarded_buckets, local.days_beyond_24h);
    }
    if (stats) stats->add(local);
    return result;
}
