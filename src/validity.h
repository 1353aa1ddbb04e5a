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

#ifndef VALIDITY_H
#define VALIDITY_H

#include"consumption.h"

#include<map>
#include<set>
#include<string>
#include<utility>
#include<vector>

struct FilterStats
{
    int accepted {};
    int unknown_device {};
    int wrong_version {};
    int outside_window {};
    int unavailable {};
    int non_positive {};

    int rejected() const { return unknown_device+wrong_version+outside_window+unavailable+non_positive; }
    void add(const FilterStats &o);
};

// Decides if a computed device hour belongs in the consolidated output.
// The date must lie inside the install to automation window of the unit
// owning the device, the device must have been available on that date
// and the consumption must be positive. Direct and indirect hours are
// judged the same way.
struct ValidityFilter
{
    ValidityFilter(const std::vector<UnitDeviceWindow> &windows,
                   const std::vector<AvailabilityRecord> &availability);

    // Returns NULL if the device is not owned by any unit.
    const UnitDeviceWindow *window(const std::string &device_id) const;
    bool isAvailable(const std::string &device_id, const std::string &date) const;

    // Build the attributed record into out if the hour passes the filter.
    // A non-empty version requires the device to be of that version.
    // Safe to call from several threads, the stats are the caller's.
    bool attribute(const std::string &device_id,
                   const std::string &date,
                   int hour,
                   double consumo_kwh,
                   Method method,
                   const std::string &version,
                   ConsumptionRecord *out,
                   FilterStats *stats) const;

    // Check an already attributed record.
    bool accept(const ConsumptionRecord &r) const;

private:

    std::map<std::string,UnitDeviceWindow> windows_;
    std::set<std::pair<std::string,std::string>> available_;
};

#endif
