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

#ifndef ATTRIBUTION_H
#define ATTRIBUTION_H

#include"consumption.h"
#include"energy.h"
#include"query.h"
#include"roster.h"
#include"validity.h"

#include<map>
#include<string>
#include<vector>

#define DEFAULT_THRESHOLD 75
#define DEFAULT_WORKERS 4

// What to do when a device hour has both a direct and an indirect record.
enum class DuplicatePolicy
{
    PreferDirect, // Drop the indirect record.
    KeepBoth
};

const char *toString(DuplicatePolicy p);
bool toDuplicatePolicy(const std::string &s, DuplicatePolicy *p);

#define LIST_OF_VERSION_STATES \
    X(Pending)                 \
    X(DirectComputed)          \
    X(DirectOk)                \
    X(DirectEmpty)             \
    X(IndirectComputed)        \
    X(Consolidated)            \

// Progress of one device version through the pipeline:
// Pending -> DirectComputed -> DirectOk|DirectEmpty -> [IndirectComputed ->] Consolidated
enum class VersionState
{
#define X(name) name,
LIST_OF_VERSION_STATES
#undef X
};

const char *toString(VersionState s);

enum class PipelineResultType
{
    Success,
    NoDirectConsumption, // Not a single direct record survived, nothing should be written.
    QueryFailed
};

const char *toString(PipelineResultType t);

struct PipelineResult
{
    PipelineResultType type;
    std::string msg;
};

struct PipelineSettings
{
    int threshold {DEFAULT_THRESHOLD};
    Calibration calibration;
    int version_length {DEFAULT_VERSION_LENGTH};
    char ignore_marker {DEFAULT_IGNORE_MARKER};
    int workers {DEFAULT_WORKERS};
    RetryPolicy retry;
    DuplicatePolicy duplicates {DuplicatePolicy::PreferDirect};
};

struct PipelineStats
{
    int units {};
    int devices {};
    int availability_records {};
    int versions {};
    int versions_selected {};
    int versions_with_direct {};
    int direct_records {};
    int indirect_devices {};
    int indirect_records {};
    int indirect_bad_timestamps {};
    int duplicates_dropped {};
    EnergyStats energy;
    FilterStats direct_filter;
    FilterStats indirect_filter;
};

// Merge the direct and indirect records keyed by device. Indirect readings
// falling into the same device hour are summed into one record. Device hours
// present with both methods are resolved by the policy. Returns the merged
// records sorted on unit, date, hour, method and device.
std::vector<ConsumptionRecord> consolidateRecords(const std::vector<ConsumptionRecord> &direct,
                                                  const std::vector<ConsumptionRecord> &indirect,
                                                  DuplicatePolicy policy,
                                                  int *num_dropped);

// Computes the hourly consumption of every device of the units. Each device
// version present in the roster gets its consumption decoded from the current
// telemetry. Every device left without a single valid direct hour is then
// looked up in the pre-aggregated energy history instead.
struct AttributionPipeline
{
    AttributionPipeline(QueryExecutor *qe, const PipelineSettings &settings);

    PipelineResult run(const std::vector<FacilityUnit> &units, std::vector<ConsumptionRecord> *out);

    const PipelineStats &stats() { return stats_; }
    // Returns Pending for unknown versions.
    VersionState state(const std::string &version);
    const std::vector<std::string> &versions() { return versions_; }
    const std::vector<std::string> &indirectQueue() { return indirect_queue_; }

private:

    struct VersionWork
    {
        std::string version;
        bool selected {};
        std::string date_init;
        std::string date_final;
        VersionState state {VersionState::Pending};
        QueryStatus status {QueryStatus::Ok};
        std::string error;
        std::vector<ConsumptionRecord> records;
        EnergyStats energy;
        FilterStats filter;
    };

    struct IndirectWork
    {
        const UnitDeviceWindow *window {};
        QueryStatus status {QueryStatus::Ok};
        std::string error;
        std::vector<ConsumptionRecord> records;
        FilterStats filter;
        int bad_timestamps {};
    };

    bool query(const Query &q, Table *out, PipelineResult *result);
    void computeDirect(VersionWork *w, const ValidityFilter &filter);
    void computeIndirect(IndirectWork *w, const ValidityFilter &filter);
    void setState(VersionWork *w, VersionState s);

    QueryExecutor *qe_ {};
    PipelineSettings settings_;
    PipelineStats stats_;
    std::vector<std::string> versions_;
    std::vector<std::string> indirect_queue_;
    std::map<std::string,VersionState> states_;
};

#endif
