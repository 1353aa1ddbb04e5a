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

#include"validity.h"
#include"util.h"

using namespace std;

void FilterStats::add(const FilterStats &o)
{
    accepted += o.accepted;
    unknown_device += o.unknown_device;
    wrong_version += o.wrong_version;
    outside_window += o.outside_window;
    unavailable += o.unavailable;
    non_positive += o.non_positive;
}

ValidityFilter::ValidityFilter(const vector<UnitDeviceWindow> &windows,
                               const vector<AvailabilityRecord> &availability)
{
    for (auto &w : windows)
    {
        if (windows_.count(w.device_id) == 0) windows_[w.device_id] = w;
    }
    for (auto &a : availability)
    {
        available_.insert(make_pair(a.device_id, a.date));
    }
}

const UnitDeviceWindow *ValidityFilter::window(const string &device_id) const
{
    auto i = windows_.find(device_id);
    if (i == windows_.end()) return NULL;
    return &i->second;
}

bool ValidityFilter::isAvailable(const string &device_id, const string &date) const
{
    return available_.count(make_pair(device_id, date)) > 0;
}

bool ValidityFilter::attribute(const string &device_id,
                               const string &date,
                               int hour,
                               double consumo_kwh,
                               Method method,
                               const string &version,
                               ConsumptionRecord *out,
                               FilterStats *stats) const
{
    FilterStats dummy;
    if (!stats) stats = &dummy;

    const UnitDeviceWindow *w = window(device_id);
    if (w == NULL)
    {
        stats->unknown_device++;
        return false;
    }
    if (version != "" && w->device_version != version)
    {
        stats->wrong_version++;
        return false;
    }
    if (!w->contains(date))
    {
        trace("(validity) %s %s outside window %s..%s\n", device_id.c_str(), date.c_str(),
              w->install_date.c_str(), w->automation_start_date.c_str());
        stats->outside_window++;
        return false;
    }
    if (consumo_kwh <= 0)
    {
        stats->non_positive++;
        return false;
    }
    if (!isAvailable(device_id, date))
    {
        trace("(validity) %s not available on %s\n", device_id.c_str(), date.c_str());
        stats->unavailable++;
        return false;
    }

    out->unit_id = w->unit_id;
    out->device_id = device_id;
    out->device_version = w->device_version;
    out->date = date;
    out->hour = hour;
    out->consumo_kwh = consumo_kwh;
    out->install_date = w->install_date;
    out->automation_start_date = w->automation_start_date;
    out->method = method;
    stats->accepted++;
    return true;
}

bool ValidityFilter::accept(const ConsumptionRecord &r) const
{
    const UnitDeviceWindow *w = window(r.device_id);
    if (w == NULL || w->unit_id != r.unit_id) return false;
    if (!w->contains(r.date)) return false;
    if (r.consumo_kwh <= 0) return false;
    return isAvailable(r.device_id, r.date);
}
