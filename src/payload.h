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

#ifndef PAYLOAD_H
#define PAYLOAD_H

#include<string>
#include<vector>

#define DEFAULT_IGNORE_MARKER '*'

// One run of constant compressor current as sent by the device.
struct Measurement
{
    int index {}; // Position of the token in the payload.
    double current {}; // Ampere
    double duration_seconds {};
};

// The raw current payload of one device and day.
struct DevicePayload
{
    std::string device_id;
    std::string date;
    std::string payload;
};

// A device-day current payload is a comma separated list of tokens: "5,3*2,*9,2*0"
// Each token is either current or current*duration, the duration defaults to one second.
// Tokens starting with the ignore marker are annotations and are dropped.
// Tokens without a numeric current or with a duration <= 0 are dropped silently.
// An empty payload gives no measurements. The order of the tokens is kept.
std::vector<Measurement> parsePayload(const std::string &payload,
                                      char ignore_marker = DEFAULT_IGNORE_MARKER,
                                      int *num_dropped = NULL);

#endif
