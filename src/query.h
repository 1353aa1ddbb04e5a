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

#ifndef QUERY_H
#define QUERY_H

#include"consumption.h"
#include"csvfile.h"
#include"payload.h"

#include<memory>
#include<string>
#include<vector>

#define LIST_OF_QUERY_KINDS \
    X(DevicesByUnits)       \
    X(Availability)         \
    X(FamiliesWithCurrent)  \
    X(Telemetry)            \
    X(Indirect)             \

enum class QueryKind
{
#define X(name) name,
LIST_OF_QUERY_KINDS
#undef X
};

const char *toString(QueryKind k);

struct Query
{
    QueryKind kind {};
    std::string table; // The device version for Telemetry queries.
    std::string device_id; // The device for Indirect queries.
    std::string date_init; // Inclusive.
    std::string date_final; // Inclusive.
    std::vector<int> units; // For DevicesByUnits and Availability.
    int threshold {}; // Availability percentage.

    std::string str() const;
};

enum class QueryStatus
{
    Ok,
    Transient, // Worth retrying, eg a timeout or a rate limit.
    Fatal
};

const char *toString(QueryStatus s);

// The data stores are reached through a query executor.
// It is called from several worker threads at the same time.
struct QueryExecutor
{
    // Execute the query and store the resulting rows in out.
    // On failure the error describes what went wrong.
    virtual QueryStatus execute(const Query &q, Table *out, std::string *error) = 0;
    virtual std::string name() = 0;
    virtual ~QueryExecutor() = 0;
};

// Serve the queries from a directory of csv files:
// devices.csv availability.csv families.csv indirect.csv telemetry/<version>.csv
std::shared_ptr<QueryExecutor> newFileQueryExecutor(std::string dir);

#define MAX_BACKOFF_MS (3600*1000)

struct RetryPolicy
{
    int retries {3};
    int backoff_ms {1000}; // Doubled for every new attempt, up to MAX_BACKOFF_MS.
};

int nextBackoff(int backoff_ms);

// Execute the query, retrying transient failures with exponential backoff.
QueryStatus executeWithRetries(QueryExecutor *qe, const Query &q, const RetryPolicy &policy,
                               Table *out, std::string *error);

struct DeviceUnit
{
    std::string device_id;
    int unit_id {};
};

struct IndirectReading
{
    std::string device_id;
    std::string record_timestamp;
    double consumption {};
};

// Convert the rows of a query result into typed rows.
// Returns false and sets err if a required column is missing or a cell cannot be read.
bool extractDevices(const Table &t, std::vector<DeviceUnit> *out, std::string *err);
bool extractAvailability(const Table &t, std::vector<AvailabilityRecord> *out, std::string *err);
bool extractFamilies(const Table &t, std::vector<std::string> *out, std::string *err);
bool extractPayloads(const Table &t, std::vector<DevicePayload> *out, std::string *err);
bool extractIndirect(const Table &t, std::vector<IndirectReading> *out, std::string *err);

#endif
