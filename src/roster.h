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

#ifndef ROSTER_H
#define ROSTER_H

#include"consumption.h"
#include"query.h"

#include<string>
#include<vector>

#define DEFAULT_VERSION_LENGTH 8

// A client facility unit as listed in the unit roster file.
struct FacilityUnit
{
    int unit_id {};
    std::string name;
    int install_offset_days {};
    std::string automation_start_date;
    // automation_start_date - (install_offset_days + 1) days
    std::string install_date;
};

// The unit roster has the columns unit_id, install_offset_days and automation_start_date
// (also understood: id_bradesco, dias_antes_automacao and data_inicio_automacao).
// The dates can be written 2025-01-20 or 01/20/25.
bool extractUnits(const Table &t, std::vector<FacilityUnit> *units, std::string *err);
bool loadUnits(const std::string &file, char separator, std::vector<FacilityUnit> *units, std::string *err);

std::vector<int> unitIds(const std::vector<FacilityUnit> &units);

// The device version is the first version_length characters of the device id, eg DAC40324.
std::string deviceVersion(const std::string &device_id, int version_length = DEFAULT_VERSION_LENGTH);

// Join the devices with their units. Devices whose unit is not in the roster are skipped.
// The order of the devices is kept.
std::vector<UnitDeviceWindow> buildWindows(const std::vector<FacilityUnit> &units,
                                           const std::vector<DeviceUnit> &devices,
                                           int version_length = DEFAULT_VERSION_LENGTH);

// The versions in order of their first appearance.
std::vector<std::string> versionsInOrder(const std::vector<UnitDeviceWindow> &windows);

// The earliest install date and the latest automation start of the windows.
// Returns false if there are no windows.
bool dateRange(const std::vector<UnitDeviceWindow> &windows, std::string *first, std::string *last);
bool dateRange(const std::vector<FacilityUnit> &units, std::string *first, std::string *last);

#endif
