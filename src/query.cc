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

#include"query.h"
#include"threads.h"
#include"util.h"

#include<algorithm>
#include<ctype.h>
#include<map>
#include<set>

using namespace std;

const char *toString(QueryKind k)
{
    switch (k)
    {
#define X(name) case QueryKind::name: return #name;
LIST_OF_QUERY_KINDS
#undef X
    }
    return "?";
}

const char *toString(QueryStatus s)
{
    switch (s)
    {
    case QueryStatus::Ok: return "ok";
    case QueryStatus::Transient: return "transient";
    case QueryStatus::Fatal: return "fatal";
    }
    return "?";
}

string Query::str() const
{
    string s = toString(kind);
    if (table != "") s += " table="+table;
    if (device_id != "") s += " device="+device_id;
    if (date_init != "" || date_final != "") s += " dates="+date_init+".."+date_final;
    if (units.size() > 0) s += tostrprintf(" units=%zu", units.size());
    if (kind == QueryKind::DevicesByUnits || kind == QueryKind::Availability)
    {
        s += tostrprintf(" threshold=%d", threshold);
    }
    return s;
}

QueryExecutor::~QueryExecutor()
{
}

int nextBackoff(int backoff_ms)
{
    if (backoff_ms >= MAX_BACKOFF_MS/2) return MAX_BACKOFF_MS;
    return backoff_ms*2;
}

QueryStatus executeWithRetries(QueryExecutor *qe, const Query &q, const RetryPolicy &policy,
                               Table *out, string *error)
{
    int backoff = policy.backoff_ms;
    for (int attempt = 0; ; ++attempt)
    {
        out->clear();
        error->clear();
        QueryStatus s = qe->execute(q, out, error);
        if (s == QueryStatus::Ok)
        {
            debug("(query) %s returned %zu rows\n", q.str().c_str(), out->size());
            return s;
        }
        if (s == QueryStatus::Fatal || attempt >= policy.retries)
        {
            warning("(query) %s failed (%s) after %d attempts: %s\n",
                    q.str().c_str(), toString(s), attempt+1, error->c_str());
            return QueryStatus::Fatal;
        }
        verbose("(query) %s failed: %s retrying in %dms\n", q.str().c_str(), error->c_str(), backoff);
        sleepMillis(backoff);
        backoff = nextBackoff(backoff);
    }
}

static int findColumn(const Table &t, const char *name, const char *alias, string *err)
{
    int c = t.column(name);
    if (c == -1 && alias) c = t.column(alias);
    if (c == -1) *err = string("missing column ")+name;
    return c;
}

bool extractDevices(const Table &t, vector<DeviceUnit> *out, string *err)
{
    int dc = findColumn(t, "device_id", "device_code", err);
    int uc = findColumn(t, "unit_id", NULL, err);
    if (dc == -1 || uc == -1) return false;

    for (auto &r : t.rows)
    {
        DeviceUnit du;
        du.device_id = r[dc];
        if (!parseInt(r[uc], &du.unit_id))
        {
            *err = "bad unit_id \""+r[uc]+"\" for device "+r[dc];
            return false;
        }
        out->push_back(du);
    }
    return true;
}

bool extractAvailability(const Table &t, vector<AvailabilityRecord> *out, string *err)
{
    int dc = findColumn(t, "device_id", "device_code", err);
    int tc = findColumn(t, "date", "record_date", err);
    if (dc == -1 || tc == -1) return false;

    for (auto &r : t.rows)
    {
        AvailabilityRecord ar;
        ar.device_id = r[dc];
        int hour = 0;
        // The availability history is sometimes delivered with timestamps.
        if (!parseDate(r[tc], &ar.date) && !parseTimestamp(r[tc], &ar.date, &hour))
        {
            *err = "bad date \""+r[tc]+"\" for device "+r[dc];
            return false;
        }
        out->push_back(ar);
    }
    return true;
}

bool extractFamilies(const Table &t, vector<string> *out, string *err)
{
    int pc = findColumn(t, "device_prefix", NULL, err);
    if (pc == -1) return false;

    for (auto &r : t.rows)
    {
        out->push_back(r[pc]);
    }
    return true;
}

bool extractPayloads(const Table &t, vector<DevicePayload> *out, string *err)
{
    int dc = findColumn(t, "device_id", "dev_id", err);
    int tc = findColumn(t, "date", "day", err);
    int pc = findColumn(t, "payload", NULL, err);
    if (dc == -1 || tc == -1 || pc == -1) return false;

    for (auto &r : t.rows)
    {
        DevicePayload dp;
        dp.device_id = r[dc];
        if (!parseDate(r[tc], &dp.date))
        {
            *err = "bad date \""+r[tc]+"\" for device "+r[dc];
            return false;
        }
        dp.payload = r[pc];
        out->push_back(dp);
    }
    return true;
}

bool extractIndirect(const Table &t, vector<IndirectReading> *out, string *err)
{
    int dc = findColumn(t, "device_id", "device_code", err);
    int tc = findColumn(t, "record_timestamp", "record_date", err);
    int cc = findColumn(t, "consumption", "consumption_value", err);
    if (dc == -1 || tc == -1 || cc == -1) return false;

    for (auto &r : t.rows)
    {
        IndirectReading ir;
        ir.device_id = r[dc];
        ir.record_timestamp = r[tc];
        if (!parseDouble(r[cc], &ir.consumption))
        {
            *err = "bad consumption \""+r[cc]+"\" for device "+r[dc];
            return false;
        }
        out->push_back(ir);
    }
    return true;
}

// Answers the queries from csv files in a directory. It plays the
// role of the data stores when running offline and in tests.
struct FileQueryExecutor : public QueryExecutor
{
    FileQueryExecutor(string dir) : dir_(dir), cache_mutex_("cache_mutex") {}

    QueryStatus execute(const Query &q, Table *out, string *error);
    string name() { return "files:"+dir_; }

private:

    QueryStatus load(const string &file, const Table **t, string *error);
    QueryStatus devicesByUnits(const Query &q, Table *out, string *error);
    QueryStatus availability(const Query &q, Table *out, string *error);
    QueryStatus familiesWithCurrent(const Query &q, Table *out, string *error);
    QueryStatus telemetry(const Query &q, Table *out, string *error);
    QueryStatus indirect(const Query &q, Table *out, string *error);

    string dir_;
    RecursiveMutex cache_mutex_;
    // Loaded tables are never modified, pointers into the map stay valid.
    map<string,Table> cache_;
};

shared_ptr<QueryExecutor> newFileQueryExecutor(string dir)
{
    return shared_ptr<QueryExecutor>(new FileQueryExecutor(dir));
}

QueryStatus FileQueryExecutor::load(const string &file, const Table **t, string *error)
{
    WITH(cache_mutex_, load);

    auto i = cache_.find(file);
    if (i != cache_.end())
    {
        *t = &i->second;
        return QueryStatus::Ok;
    }

    string path = dir_+"/"+file;
    if (!checkFileExists(path.c_str()))
    {
        *error = "no such table "+path;
        return QueryStatus::Fatal;
    }
    Table table;
    if (!loadCsv(path, ',', &table, error))
    {
        return QueryStatus::Fatal;
    }
    cache_[file] = table;
    *t = &cache_[file];
    return QueryStatus::Ok;
}

QueryStatus FileQueryExecutor::execute(const Query &q, Table *out, string *error)
{
    trace("(query) %s %s\n", name().c_str(), q.str().c_str());

    switch (q.kind)
    {
    case QueryKind::DevicesByUnits: return devicesByUnits(q, out, error);
    case QueryKind::Availability: return availability(q, out, error);
    case QueryKind::FamiliesWithCurrent: return familiesWithCurrent(q, out, error);
    case QueryKind::Telemetry: return telemetry(q, out, error);
    case QueryKind::Indirect: return indirect(q, out, error);
    }
    *error = "unknown query kind";
    return QueryStatus::Fatal;
}

static bool insideDates(const string &date, const Query &q)
{
    if (q.date_init != "" && date < q.date_init) return false;
    if (q.date_final != "" && date > q.date_final) return false;
    return true;
}

static bool availableEnough(const vector<string> &row, int col, int threshold)
{
    if (col == -1) return true;
    double pct = 0;
    if (!parseDouble(row[col], &pct)) return false;
    return pct >= threshold;
}

QueryStatus FileQueryExecutor::devicesByUnits(const Query &q, Table *out, string *error)
{
    const Table *t = NULL;
    QueryStatus s = load("devices.csv", &t, error);
    if (s != QueryStatus::Ok) return s;

    vector<DeviceUnit> devices;
    if (!extractDevices(*t, &devices, error)) return QueryStatus::Fatal;
    int ac = t->column("availability");

    set<int> units(q.units.begin(), q.units.end());
    set<string> seen;
    vector<DeviceUnit> found;
    for (size_t i = 0; i < devices.size(); ++i)
    {
        auto &d = devices[i];
        if (units.count(d.unit_id) == 0) continue;
        if (!availableEnough(t->rows[i], ac, q.threshold)) continue;
        // A device is reported once, for the first unit found.
        if (seen.count(d.device_id)) continue;
        seen.insert(d.device_id);
        found.push_back(d);
    }
    stable_sort(found.begin(), found.end(),
                [](const DeviceUnit &a, const DeviceUnit &b) { return a.unit_id < b.unit_id; });

    out->columns = { "device_id", "unit_id" };
    for (auto &d : found)
    {
        out->rows.push_back({ d.device_id, to_string(d.unit_id) });
    }
    return QueryStatus::Ok;
}

QueryStatus FileQueryExecutor::availability(const Query &q, Table *out, string *error)
{
    const Table *t = NULL;
    QueryStatus s = load("availability.csv", &t, error);
    if (s != QueryStatus::Ok) return s;

    vector<AvailabilityRecord> records;
    if (!extractAvailability(*t, &records, error)) return QueryStatus::Fatal;
    int ac = t->column("availability");
    int uc = t->column("unit_id");

    set<int> units(q.units.begin(), q.units.end());
    out->columns = { "device_id", "date" };
    for (size_t i = 0; i < records.size(); ++i)
    {
        auto &r = records[i];
        if (uc != -1 && units.size() > 0)
        {
            int unit = 0;
            if (!parseInt(t->rows[i][uc], &unit) || units.count(unit) == 0) continue;
        }
        if (!insideDates(r.date, q)) continue;
        if (!availableEnough(t->rows[i], ac, q.threshold)) continue;
        out->rows.push_back({ r.device_id, r.date });
    }
    return QueryStatus::Ok;
}

QueryStatus FileQueryExecutor::familiesWithCurrent(const Query &q, Table *out, string *error)
{
    const Table *t = NULL;
    QueryStatus s = load("families.csv", &t, error);
    if (s != QueryStatus::Ok) return s;

    vector<string> families;
    if (!extractFamilies(*t, &families, error)) return QueryStatus::Fatal;

    set<string> seen;
    out->columns = { "device_prefix" };
    for (auto &f : families)
    {
        if (seen.count(f)) continue;
        seen.insert(f);
        out->rows.push_back({ f });
    }
    return QueryStatus::Ok;
}

static bool isValidTableName(const string &name)
{
    if (name.length() == 0) return false;
    for (char c : name)
    {
        if (!isalnum((unsigned char)c) && c != '_' && c != '-') return false;
    }
    return true;
}

QueryStatus FileQueryExecutor::telemetry(const Query &q, Table *out, string *error)
{
    if (!isValidTableName(q.table))
    {
        *error = "invalid telemetry table \""+q.table+"\"";
        return QueryStatus::Fatal;
    }
    const Table *t = NULL;
    QueryStatus s = load("telemetry/"+q.table+".csv", &t, error);
    if (s != QueryStatus::Ok) return s;

    vector<DevicePayload> payloads;
    if (!extractPayloads(*t, &payloads, error)) return QueryStatus::Fatal;

    out->columns = { "device_id", "date", "payload" };
    for (auto &p : payloads)
    {
        if (!insideDates(p.date, q)) continue;
        out->rows.push_back({ p.device_id, p.date, p.payload });
    }
    return QueryStatus::Ok;
}

QueryStatus FileQueryExecutor::indirect(const Query &q, Table *out, string *error)
{
    const Table *t = NULL;
    QueryStatus s = load("indirect.csv", &t, error);
    if (s != QueryStatus::Ok) return s;

    vector<IndirectReading> readings;
    if (!extractIndirect(*t, &readings, error)) return QueryStatus::Fatal;

    out->columns = { "device_id", "record_timestamp", "consumption" };
    for (auto &r : readings)
    {
        if (q.device_id != "" && r.device_id != q.device_id) continue;
        if (r.consumption <= 0) continue;
        string date;
        int hour = 0;
        if (!parseTimestamp(r.record_timestamp, &date, &hour)) continue;
        if (!insideDates(date, q)) continue;
        out->rows.push_back({ r.device_id, r.record_timestamp, formatDecimals(r.consumption, 9) });
    }
    return QueryStatus::Ok;
}
