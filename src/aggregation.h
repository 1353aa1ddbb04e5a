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

#ifndef AGGREGATION_H
#define AGGREGATION_H

#include"consumption.h"
#include"csvfile.h"

#include<string>
#include<vector>

#define DEFAULT_TYPE_LENGTH 3

enum class DeviceType
{
    DAC,
    DUT,
    OTHER
};

const char *toString(DeviceType t);
// The type is given by the first type_length characters of the device id.
DeviceType deviceType(const std::string &device_id, int type_length = DEFAULT_TYPE_LENGTH);

// Roll the consolidated device hours up to unit hours. Each device present
// in a unit hour gets the weight 0.5/n + 0.5*share where n is the number of
// devices and share its part of the unit hour consumption. The weights are
// averaged per device type, a missing type gives 0.
std::vector<UnitHourAggregate> aggregateUnitHours(const std::vector<ConsumptionRecord> &records,
                                                  int type_length = DEFAULT_TYPE_LENGTH);

struct UnitRollup
{
    int unit_id {};
    std::string date;
    int hour {};
    std::string metodo;
    double consumo_kwh_total {}; // Rounded to 4 decimals.
    int qtd_dispositivos {};
};

// Sum per unit, date, hour and method, counting the distinct devices.
std::vector<UnitRollup> rollupUnits(const std::vector<ConsumptionRecord> &records);

struct UnitSummary
{
    int unit_id {};
    double consumo_total_kwh {};
    int dias_com_dados {};
    int registros_direto {};
    int registros_indireto {};
    double dispositivos_medio {};
};

std::vector<UnitSummary> summarizeUnits(const std::vector<UnitRollup> &rollup);

// Read back a consolidated file. Fails naming every missing required column:
// unit_id data hora metodo consumo_kwh device_id
bool extractConsolidated(const Table &t, std::vector<ConsumptionRecord> *records, std::string *err);
bool loadConsolidated(const std::string &file, char separator,
                      std::vector<ConsumptionRecord> *records, std::string *err);

#endif
