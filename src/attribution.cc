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

#include"attribution.h"
#include"threads.h"
#include"util.h"

#include<set>
#include<utility>

using namespace std;

const char *toString(DuplicatePolicy p)
{
    switch (p)
    {
    case DuplicatePolicy::PreferDirect: return "preferdirect";
    case DuplicatePolicy::KeepBoth: return "keepboth";
    }
    return "?";
}

bool toDuplicatePolicy(const string &s, DuplicatePolicy *p)
{
    if (s == "preferdirect") { *p = DuplicatePolicy::PreferDirect; return true; }
    if (s == "keepboth") { *p = DuplicatePolicy::KeepBoth; return true; }
    return false;
}

const char *toString(VersionState s)
{
    switch (s)
    {
#define X(name) case VersionState::name: return #name;
LIST_OF_VERSION_STATES
#undef X
    }
    return "?";
}

const char *toString(PipelineResultType t)
{
    switch (t)
    {
    case PipelineResultType::Success: return "Success";
    case PipelineResultType::NoDirectConsumption: return "NoDirectConsumption";
    case PipelineResultType::QueryFailed: return "QueryFailed";
    }
    return "?";
}

typedef pair<string,int> DateHour;

struct DeviceRecords
{
    map<DateHour,ConsumptionRecord> direct;
    map<DateHour,ConsumptionRecord> indirect;
};

static void addRecord(map<DateHour,ConsumptionRecord> *m, const ConsumptionRecord &r)
{
    DateHour key = make_pair(r.date, r.hour);
    auto i = m->find(key);
    if (i == m->end())
    {
        (*m)[key] = r;
        return;
    }
    i->second.consumo_kwh += r.consumo_kwh;
}

vector<ConsumptionRecord> consolidateRecords(const vector<ConsumptionRecord> &direct,
                                             const vector<ConsumptionRecord> &indirect,
                                             DuplicatePolicy policy,
                                             int *num_dropped)
{
    map<string,DeviceRecords> by_device;

    for (auto &r : direct) addRecord(&by_device[r.device_id].direct, r);
    for (auto &r : indirect) addRecord(&by_device[r.device_id].indirect, r);

    int dropped = 0;
    vector<ConsumptionRecord> out;
    for (auto &d : by_device)
    {
        for (auto &p : d.second.direct) out.push_back(p.second);
        for (auto &p : d.second.indirect)
        {
            if (policy == DuplicatePolicy::PreferDirect && d.second.direct.count(p.first) > 0)
            {
                debug("(pipeline) dropping indirect %s %s %02d, it has a direct record\n",
                      d.first.c_str(), p.first.first.c_str(), p.first.second);
                dropped++;
                continue;
            }
            out.push_back(p.second);
        }
    }
    if (dropped > 0)
    {
        warning("(pipeline) %d indirect records overlapped direct records and were dropped\n", dropped);
    }
    if (num_dropped) *num_dropped = dropped;

    sortRecords(&out);
    return out;
}

AttributionPipeline::AttributionPipeline(QueryExecutor *qe, const PipelineSettings &settings)
    : qe_(qe), settings_(settings)
{
}

VersionState AttributionPipeline::state(const string &version)
{
    auto i = states_.find(version);
    if (i == states_.end()) return VersionState::Pending;
    return i->second;
}

void AttributionPipeline::setState(VersionWork *w, VersionState s)
{
    trace("(pipeline) version %s %s -> %s\n", w->version.c_str(), toString(w->state), toString(s));
    w->state = s;
}

bool AttributionPipeline::query(const Query &q, Table *out, PipelineResult *result)
{
    string error;
    QueryStatus s = executeWithRetries(qe_, q, settings_.retry, out, &error);
    if (s != QueryStatus::Ok)
    {
        result->type = PipelineResultType::QueryFailed;
        result->msg = q.str()+": "+error;
        return false;
    }
    return true;
}

void AttributionPipeline::computeDirect(VersionWork *w, const ValidityFilter &filter)
{
    Query q;
    q.kind = QueryKind::Telemetry;
    q.table = w->version;
    q.date_init = w->date_init;
    q.date_final = w->date_final;

    Table t;
    w->status = executeWithRetries(qe_, q, settings_.retry, &t, &w->error);
    if (w->status != QueryStatus::Ok) return;

    vector<DevicePayload> payloads;
    if (!extractPayloads(t, &payloads, &w->error))
    {
        w->status = QueryStatus::Fatal;
        w->error = "telemetry "+w->version+": "+w->error;
        return;
    }

    double k = settings_.calibration.constantFor(w->version);
    vector<HourlyConsumption> hours = computeDirectConsumption(payloads, k, settings_.ignore_marker, &w->energy);
    setState(w, VersionState::DirectComputed);

    for (auto &h : hours)
    {
        ConsumptionRecord r;
        if (filter.attribute(h.device_id, h.date, h.hour, h.consumo_kwh, Method::Direct, w->version, &r, &w->filter))
        {
            w->records.push_back(r);
        }
    }
    verbose("(pipeline) version %s: %zu payloads, %zu hours, %zu valid direct records (K=%g)\n",
            w->version.c_str(), payloads.size(), hours.size(), w->records.size(), k);

    setState(w, w->records.size() > 0 ? VersionState::DirectOk : VersionState::DirectEmpty);
}

void AttributionPipeline::computeIndirect(IndirectWork *w, const ValidityFilter &filter)
{
    Query q;
    q.kind = QueryKind::Indirect;
    q.device_id = w->window->device_id;
    q.date_init = w->window->install_date;
    q.date_final = w->window->automation_start_date;

    Table t;
    w->status = executeWithRetries(qe_, q, settings_.retry, &t, &w->error);
    if (w->status != QueryStatus::Ok) return;

    vector<IndirectReading> readings;
    if (!extractIndirect(t, &readings, &w->error))
    {
        w->status = QueryStatus::Fatal;
        w->error = "indirect "+q.device_id+": "+w->error;
        return;
    }

    for (auto &ir : readings)
    {
        string date;
        int hour = 0;
        if (!parseTimestamp(ir.record_timestamp, &date, &hour))
        {
            w->bad_timestamps++;
            continue;
        }
        ConsumptionRecord r;
        if (filter.attribute(ir.device_id, date, hour, ir.consumption, Method::Indirect, "", &r, &w->filter))
        {
            w->records.push_back(r);
        }
    }
    debug("(pipeline) device %s: %zu indirect readings, %zu valid\n",
          q.device_id.c_str(), readings.size(), w->records.size());
}

PipelineResult AttributionPipeline::run(const vector<FacilityUnit> &units, vector<ConsumptionRecord> *out)
{
    PipelineResult result { PipelineResultType::Success, "" };
    stats_ = PipelineStats();
    versions_.clear();
    indirect_queue_.clear();
    states_.clear();
    stats_.units = units.size();

    string err;
    Query dq;
    dq.kind = QueryKind::DevicesByUnits;
    dq.units = unitIds(units);
    dq.threshold = settings_.threshold;
    Table devices_table;
    if (!query(dq, &devices_table, &result)) return result;
    vector<DeviceUnit> devices;
    if (!extractDevices(devices_table, &devices, &err))
    {
        return { PipelineResultType::QueryFailed, "devices: "+err };
    }
    vector<UnitDeviceWindow> windows = buildWindows(units, devices, settings_.version_length);
    stats_.devices = windows.size();
    verbose("(pipeline) %d units with %d devices\n", stats_.units, stats_.devices);

    Query aq;
    aq.kind = QueryKind::Availability;
    aq.units = dq.units;
    aq.threshold = settings_.threshold;
    dateRange(units, &aq.date_init, &aq.date_final);
    Table availability_table;
    if (!query(aq, &availability_table, &result)) return result;
    vector<AvailabilityRecord> availability;
    if (!extractAvailability(availability_table, &availability, &err))
    {
        return { PipelineResultType::QueryFailed, "availability: "+err };
    }
    stats_.availability_records = availability.size();

    Query fq;
    fq.kind = QueryKind::FamiliesWithCurrent;
    Table families_table;
    if (!query(fq, &families_table, &result)) return result;
    vector<string> family_list;
    if (!extractFamilies(families_table, &family_list, &err))
    {
        return { PipelineResultType::QueryFailed, "families: "+err };
    }
    set<string> families(family_list.begin(), family_list.end());

    ValidityFilter filter(windows, availability);

    versions_ = versionsInOrder(windows);
    vector<VersionWork> work(versions_.size());
    vector<size_t> selected;
    for (size_t i = 0; i < versions_.size(); ++i)
    {
        VersionWork &w = work[i];
        w.version = versions_[i];
        w.selected = families.count(w.version) > 0;
        vector<UnitDeviceWindow> vw;
        for (auto &dw : windows)
        {
            if (dw.device_version == w.version) vw.push_back(dw);
        }
        dateRange(vw, &w.date_init, &w.date_final);
        if (w.selected) selected.push_back(i);
    }
    stats_.versions = versions_.size();
    stats_.versions_selected = selected.size();
    verbose("(pipeline) %d versions found, %d with current telemetry\n", stats_.versions, stats_.versions_selected);

    WorkerPool direct_pool("direct", settings_.workers);
    direct_pool.run(selected.size(), [&](size_t i) { computeDirect(&work[selected[i]], filter); });

    vector<ConsumptionRecord> direct;
    for (auto &w : work)
    {
        if (w.status != QueryStatus::Ok)
        {
            return { PipelineResultType::QueryFailed, "version "+w.version+": "+w.error };
        }
        if (!w.selected)
        {
            debug("(pipeline) version %s has no current telemetry\n", w.version.c_str());
            setState(&w, VersionState::DirectEmpty);
        }
        if (w.state == VersionState::DirectOk) stats_.versions_with_direct++;
        direct.insert(direct.end(), w.records.begin(), w.records.end());
        stats_.energy.add(w.energy);
        stats_.direct_filter.add(w.filter);
    }
    stats_.direct_records = direct.size();

    if (direct.size() == 0)
    {
        for (auto &w : work) states_[w.version] = w.state;
        return { PipelineResultType::NoDirectConsumption,
                 tostrprintf("no direct consumption found for any of the %zu device versions", versions_.size()) };
    }

    set<string> with_direct;
    for (auto &r : direct) with_direct.insert(r.device_id);

    vector<IndirectWork> indirect_work;
    for (auto &dw : windows)
    {
        if (with_direct.count(dw.device_id)) continue;
        IndirectWork iw;
        iw.window = filter.window(dw.device_id);
        indirect_work.push_back(iw);
        indirect_queue_.push_back(dw.device_id);
    }
    stats_.indirect_devices = indirect_queue_.size();
    verbose("(pipeline) %zu devices with direct consumption, %zu devices for the indirect method\n",
            with_direct.size(), indirect_queue_.size());

    WorkerPool indirect_pool("indirect", settings_.workers);
    indirect_pool.run(indirect_work.size(), [&](size_t i) { computeIndirect(&indirect_work[i], filter); });

    set<string> versions_with_indirect;
    vector<ConsumptionRecord> indirect;
    for (auto &iw : indirect_work)
    {
        if (iw.status != QueryStatus::Ok)
        {
            for (auto &w : work) states_[w.version] = w.state;
            return { PipelineResultType::QueryFailed, "device "+iw.window->device_id+": "+iw.error };
        }
        versions_with_indirect.insert(iw.window->device_version);
        indirect.insert(indirect.end(), iw.records.begin(), iw.records.end());
        stats_.indirect_filter.add(iw.filter);
        stats_.indirect_bad_timestamps += iw.bad_timestamps;
    }
    if (stats_.indirect_bad_timestamps > 0)
    {
        warning("(pipeline) skipped %d indirect readings with unreadable timestamps\n", stats_.indirect_bad_timestamps);
    }

    *out = consolidateRecords(direct, indirect, settings_.duplicates, &stats_.duplicates_dropped);
    stats_.indirect_records = 0;
    for (auto &r : *out)
    {
        if (r.method == Method::Indirect) stats_.indirect_records++;
    }

    for (auto &w : work)
    {
        if (versions_with_indirect.count(w.version)) setState(&w, VersionState::IndirectComputed);
        setState(&w, VersionState::Consolidated);
        states_[w.version] = w.state;
    }
    return result;
}
