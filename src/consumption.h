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

#ifndef CONSUMPTION_H
#define CONSUMPTION_H

#include<string>
#include<vector>

// How the consumption of a device hour was obtained.
// Direct is decoded from the current telemetry of the device,
// Indirect is read from the pre-aggregated hourly energy history.
enum class Method
{
    Direct,
    Indirect
};

// Returns the names used in the output files: direto and indireto.
const char *toString(Method m);
bool toMethod(const std::string &s, Method *m);

struct ConsumptionRecord
{
    int unit_id {};
    std::string device_id;
    std::string device_version;
    std::string date; // 2025-01-20
    int hour {}; // 0-23
    double consumo_kwh {};
    std::string install_date;
    std::string automation_start_date;
    Method method {};
};

// Sort on unit, date, hour, method and finally device.
bool operator<(const ConsumptionRecord &a, const ConsumptionRecord &b);
void sortRecords(std::vector<ConsumptionRecord> *records);

// The presence of a record means that the device availability
// was at least the configured threshold on that date.
struct AvailabilityRecord
{
    std::string device_id;
    std::string date;
};

// The time window during which the consumption of a device is attributed
// to its unit: from installation until the automation started.
struct UnitDeviceWindow
{
    int unit_id {};
    std::string device_id;
    std::string device_version;
    std::string install_date;
    std::string automation_start_date;

    bool contains(const std::string &date) const
    {
        return install_date <= date && date <= automation_start_date;
    }
};

struct UnitHourAggregate
{
    int unit_id {};
    std::string date;
    int hour {};
    int qtd_devices_total {};
    int qtd_dac {};
    int qtd_dut {};
    double peso_medio_dac {};
    double peso_medio_dut {};
    double consumo_kwh_total {};
    std::string metodos; // Sorted and comma separated, eg "direto,indireto"
};

#endif
