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

#ifndef ENERGY_H
#define ENERGY_H

#include"payload.h"
#include"spans.h"

#include<map>
#include<string>
#include<vector>

// Watts drawn per ampere of compressor current, (volts times power factor).
#define DEFAULT_CALIBRATION 310.86

// The calibration constant differs between device families.
// A family is a prefix of the device version, eg DAC4 or DAC40324.
// The longest matching prefix wins, otherwise the default is used.
struct Calibration
{
    double default_constant {DEFAULT_CALIBRATION};
    std::map<std::string,double> families;

    void set(const std::string &family, double k) { families[family] = k; }
    double constantFor(const std::string &device_version) const;
};

struct HourlyConsumption
{
    std::string device_id;
    std::string date;
    int hour {};
    double consumo_kwh {};
};

struct EnergyStats
{
    int payloads {};
    int measurements {};
    int dropped_tokens {};
    long discarded_buckets {}; // Hour buckets beyond 23.
    int days_beyond_24h {};

    void add(const EnergyStats &o);
};

// Sum K * current * overlap over each (device,date,hour) and express it in kWh
// rounded to 6 decimals. Contributions for hours outside 0-23 are discarded
// and counted in stats. The result is sorted on device, date and hour.
std::vector<HourlyConsumption> aggregateEnergy(const std::vector<HourContribution> &contributions,
                                               double calibration,
                                               EnergyStats *stats);

// Run the whole chain payload -> measurements -> spans -> hours -> kWh.
std::vector<HourlyConsumption> computeDirectConsumption(const std::vector<DevicePayload> &payloads,
                                                        double calibration,
                                                        char ignore_marker,
                                                        EnergyStats *stats);

#endif
