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

#include"aggregation.h"
#include"attribution.h"
#include"cmdline.h"
#include"config.h"
#include"csvfile.h"
#include"energy.h"
#include"payload.h"
#include"printer.h"
#include"query.h"
#include"roster.h"
#include"spans.h"
#include"threads.h"
#include"util.h"
#include"validity.h"

#include<algorithm>
#include<math.h>
#include<stdarg.h>
#include<stdio.h>
#include<stdlib.h>
#include<string.h>
#include<set>
#include<sys/stat.h>
#include<unistd.h>

using namespace std;

void test_payload();
void test_spans();
void test_hours();
void test_energy();
void test_calibration();
void test_dates();
void test_csv();
void test_roster();
void test_validity();
void test_worker_pool();
void test_retry();
void test_pipeline();
void test_pipeline_no_direct();
void test_pipeline_failures();
void test_pipeline_workers();
void test_consolidate();
void test_aggregation();
void test_rollup();
void test_consolidated_columns();
void test_config();
void test_cmdline();
void test_file_executor();
void test_printer();

int num_errors_ = 0;

void fail(const char *fmt, ...)
{
    va_list args;
    va_start(args, fmt);
    printf("ERROR! ");
    vprintf(fmt, args);
    va_end(args);
    num_errors_++;
}

bool same(double a, double b)
{
    return fabs(a-b) < 1e-9;
}

bool test(const char *test_name, const char *pattern)
{
    if (pattern == NULL) return true;
    bool ok = strstr(test_name, pattern) != NULL;
    if (ok) printf("Test %s\n", test_name);
    return ok;
}

int main(int argc, char **argv)
{
    const char *pattern = NULL;

    int i = 1;
    while (i < argc) {
        if (!strcmp(argv[i], "--debug"))
        {
            debugEnabled(true);
        }
        else
        if (!strcmp(argv[i], "--trace"))
        {
            debugEnabled(true);
            traceEnabled(true);
        }
        else
        {
            pattern = argv[i];
        }
        i++;
    }

    if (test("payload", pattern)) test_payload();
    if (test("spans", pattern)) test_spans();
    if (test("hours", pattern)) test_hours();
    if (test("energy", pattern)) test_energy();
    if (test("calibration", pattern)) test_calibration();
    if (test("dates", pattern)) test_dates();
    if (test("csv", pattern)) test_csv();
    if (test("roster", pattern)) test_roster();
    if (test("validity", pattern)) test_validity();
    if (test("worker_pool", pattern)) test_worker_pool();
    if (test("retry", pattern)) test_retry();
    if (test("pipeline", pattern)) test_pipeline();
    if (test("pipeline_no_direct", pattern)) test_pipeline_no_direct();
    if (test("pipeline_failures", pattern)) test_pipeline_failures();
    if (test("pipeline_workers", pattern)) test_pipeline_workers();
    if (test("consolidate", pattern)) test_consolidate();
    if (test("aggregation", pattern)) test_aggregation();
    if (test("rollup", pattern)) test_rollup();
    if (test("consolidated_columns", pattern)) test_consolidated_columns();
    if (test("config", pattern)) test_config();
    if (test("cmdline", pattern)) test_cmdline();
    if (test("file_executor", pattern)) test_file_executor();
    if (test("printer", pattern)) test_printer();

    if (num_errors_ > 0)
    {
        printf("%d errors\n", num_errors_);
        return 1;
    }
    return 0;
}

void test_parse(string payload, string expected, int expected_dropped)
{
    int dropped = 0;
    vector<Measurement> ms = parsePayload(payload, '*', &dropped);
    string got;
    for (auto &m : ms)
    {
        if (got != "") got += " ";
        got += tostrprintf("%d:%g/%g", m.index, m.current, m.duration_seconds);
    }
    if (got != expected)
    {
        fail("parsing payload \"%s\" expected \"%s\" but got \"%s\"\n", payload.c_str(), expected.c_str(), got.c_str());
    }
    if (dropped != expected_dropped)
    {
        fail("parsing payload \"%s\" expected %d dropped tokens but got %d\n", payload.c_str(), expected_dropped, dropped);
    }
}

void test_payload()
{
    test_parse("5,3*2,*9,2*0", "0:5/1 1:3/2", 1);
    test_parse("", "", 0);
    test_parse(",,", "", 0);
    test_parse(" 1.5 * 10 , 2", "0:1.5/10 1:2/1", 0);
    test_parse("abc,4", "1:4/1", 1);
    test_parse("4*x", "0:4/1", 0);
    test_parse("4*-3,6*2.5", "1:6/2.5", 1);
    test_parse("0*60", "0:0/60", 0);
    test_parse("7*3*9", "0:7/3", 0);
    test_parse("*header,1*1,*trailer", "1:1/1", 0);

    vector<Measurement> ms = parsePayload("#1,2", '#');
    if (ms.size() != 1 || ms[0].current != 2)
    {
        fail("the ignore marker # should drop the first token\n");
    }
}

void test_spans()
{
    vector<Measurement> ms = parsePayload("5,3*2,1*0.5,2*100");
    vector<Span> spans = buildSpans("DAC40324A001", "2025-01-15", ms);

    if (spans.size() != 4)
    {
        fail("expected 4 spans but got %zu\n", spans.size());
        return;
    }
    double sum = 0;
    double prev_end = 0;
    for (size_t i = 0; i < spans.size(); ++i)
    {
        if (!same(spans[i].start_sec, prev_end))
        {
            fail("span %zu starts at %g but the previous ended at %g\n", i, spans[i].start_sec, prev_end);
        }
        if (!same(spans[i].duration(), ms[i].duration_seconds))
        {
            fail("span %zu has duration %g expected %g\n", i, spans[i].duration(), ms[i].duration_seconds);
        }
        sum += spans[i].duration();
        prev_end = spans[i].end_sec;
    }
    if (!same(sum, spans.back().end_sec))
    {
        fail("sum of span durations %g differs from the final end %g\n", sum, spans.back().end_sec);
    }
    if (!same(spans[1].start_sec, 1) || !same(spans[1].end_sec, 3))
    {
        fail("second span expected (1,3) got (%g,%g)\n", spans[1].start_sec, spans[1].end_sec);
    }

    // The order of the tokens decides where the spans end up.
    vector<Span> reversed = buildSpans("x", "2025-01-15", parsePayload("2*100,5"));
    if (!same(reversed[1].start_sec, 100))
    {
        fail("reordered payload should move the 5A span to second 100\n");
    }
    if (buildSpans("x", "2025-01-15", vector<Measurement>()).size() != 0)
    {
        fail("no measurements should give no spans\n");
    }
}

void test_overlap(double start, double end, string expected, long expected_discarded = 0)
{
    Span s;
    s.device_id = "d";
    s.date = "2025-01-15";
    s.current = 1;
    s.start_sec = start;
    s.end_sec = end;

    vector<HourContribution> cs;
    long discarded = distributeSpan(s, &cs);

    string got;
    double sum = 0;
    for (auto &c : cs)
    {
        if (got != "") got += " ";
        got += tostrprintf("%d:%g", c.hour_index, c.overlap_seconds);
        sum += c.overlap_seconds;
        if (c.overlap_seconds < 0) fail("negative overlap for span %g-%g\n", start, end);
    }
    if (got != expected)
    {
        fail("span %g-%g expected buckets \"%s\" but got \"%s\"\n", start, end, expected.c_str(), got.c_str());
    }
    if (discarded != expected_discarded)
    {
        fail("span %g-%g expected %ld discarded buckets but got %ld\n", start, end, expected_discarded, discarded);
    }
    // Only the part of the span inside the day is kept.
    double day = SECONDS_PER_HOUR*HOURS_PER_DAY;
    double kept = min(end, day) - min(start, day);
    if (!same(sum, kept))
    {
        fail("span %g-%g overlaps sum to %g not to the duration %g inside the day\n", start, end, sum, kept);
    }
}

void test_hours()
{
    test_overlap(0, 1, "0:1");
    test_overlap(1, 3, "0:2");
    test_overlap(3590, 3610, "0:10 1:10");
    test_overlap(3599, 3600, "0:1");
    test_overlap(3600, 3601, "1:1");
    test_overlap(3599.5, 3600.5, "0:0.5 1:0.5");
    test_overlap(0.25, 0.75, "0:0.5");
    test_overlap(1800, 9000, "0:1800 1:3600 2:1800");
    string day;
    for (int h = 0; h < 24; ++h)
    {
        if (day != "") day += " ";
        day += tostrprintf("%d:3600", h);
    }
    test_overlap(0, 86400, day);
    test_overlap(86000, 87000, "23:400", 1);
    test_overlap(90000, 97200, "", 2);
    // 1e15 seconds end in hour 277777777777, everything after hour 23 is
    // counted without being built.
    test_overlap(0, 1e15, day, 277777777777L - 23);

    vector<Span> spans = buildSpans("d", "2025-01-15", parsePayload("1*3000,1*1200"));
    long discarded = 0;
    vector<HourContribution> cs = distributeHours(spans, &discarded);
    if (cs.size() != 3 || discarded != 0)
    {
        fail("expected 3 contributions from two spans but got %zu (discarded %ld)\n", cs.size(), discarded);
    }

    spans = buildSpans("d", "2025-01-15", parsePayload("1*1e15"));
    cs = distributeHours(spans, &discarded);
    if (cs.size() != 24 || discarded != 277777777777L - 23)
    {
        fail("a 1e15 second span should give 24 contributions but got %zu (discarded %ld)\n", cs.size(), discarded);
    }
}

void test_energy()
{
    DevicePayload p { "DAC40324A001", "2025-01-15", "5,3*2,*9,2*0" };
    EnergyStats stats;
    vector<HourlyConsumption> hc = computeDirectConsumption({ p }, 300, '*', &stats);

    if (hc.size() != 1)
    {
        fail("expected one hour of consumption but got %zu\n", hc.size());
        return;
    }
    if (hc[0].hour != 0 || !same(hc[0].consumo_kwh, 0.000917))
    {
        fail("expected hour 0 with 0.000917 kWh but got hour %d with %.9f\n", hc[0].hour, hc[0].consumo_kwh);
    }
    if (stats.payloads != 1 || stats.measurements != 2 || stats.dropped_tokens != 1)
    {
        fail("unexpected stats payloads=%d measurements=%d dropped=%d\n",
             stats.payloads, stats.measurements, stats.dropped_tokens);
    }

    // Two payload rows for the same device day are summed per hour.
    vector<DevicePayload> two = { { "d", "2025-01-15", "10*3600" }, { "d", "2025-01-15", "10*1800" } };
    hc = computeDirectConsumption(two, 310.86, '*', NULL);
    if (hc.size() != 1 || !same(hc[0].consumo_kwh, roundTo(310.86*10*5400/3600.0/1000.0, 6)))
    {
        fail("payload rows of the same day should be summed into one hour\n");
    }

    // 1 A for an hour at 1000 W/A is 3600000 Ws, that is 1 kWh.
    HourContribution one;
    one.device_id = "d";
    one.date = "2025-01-15";
    one.hour_index = 7;
    one.current = 1;
    one.overlap_seconds = 3600;
    hc = aggregateEnergy({ one }, 1000, NULL);
    if (hc.size() != 1 || hc[0].hour != 7 || !same(hc[0].consumo_kwh, 1.0))
    {
        fail("one ampere hour at 1000 W/A should be 1 kWh\n");
    }

    // 25 hours of telemetry, the last hour is discarded and counted.
    EnergyStats drift;
    vector<DevicePayload> long_day = { { "d", "2025-01-16", "1*90000" } };
    hc = computeDirectConsumption(long_day, 300, '*', &drift);
    if (hc.size() != 24)
    {
        fail("a day with 25h of telemetry should give 24 hours but gave %zu\n", hc.size());
    }
    if (drift.discarded_buckets != 1 || drift.days_beyond_24h != 1)
    {
        fail("expected one discarded bucket but got %ld (days %d)\n", drift.discarded_buckets, drift.days_beyond_24h);
    }

    vector<DevicePayload> many = { { "b", "2025-01-15", "1,2*4000,0.5*9000" },
                                   { "a", "2025-01-15", "3*100,*x,8*2" } };
    vector<HourlyConsumption> first = computeDirectConsumption(many, 310.94, '*', NULL);
    vector<HourlyConsumption> second = computeDirectConsumption(many, 310.94, '*', NULL);
    if (first.size() != second.size())
    {
        fail("energy computation is not repeatable\n");
        return;
    }
    for (size_t i = 0; i < first.size(); ++i)
    {
        if (first[i].device_id != second[i].device_id ||
            first[i].hour != second[i].hour ||
            first[i].consumo_kwh != second[i].consumo_kwh)
        {
            fail("energy computation is not repeatable at row %zu\n", i);
        }
        if (first[i].consumo_kwh < 0) fail("negative energy at row %zu\n", i);
    }
    if (first.size() > 0 && first[0].device_id != "a")
    {
        fail("the hours should be sorted on device\n");
    }
}

void test_calibration()
{
    Calibration c;
    if (c.constantFor("DAC40324") != DEFAULT_CALIBRATION) fail("expected the default calibration\n");
    c.set("DAC4", 310.94);
    c.set("DAC403", 311.5);
    c.default_constant = 300;
    if (c.constantFor("DAC40324") != 311.5) fail("the longest prefix DAC403 should win\n");
    if (c.constantFor("DAC41000") != 310.94) fail("DAC41000 should use DAC4\n");
    if (c.constantFor("DUT10001") != 300) fail("DUT10001 should use the default\n");
    if (c.constantFor("DAC") != 300) fail("a version shorter than the family should use the default\n");
}

void test_date(string in, bool ok, string expected)
{
    string iso;
    bool rc = parseDate(in, &iso);
    if (rc != ok)
    {
        fail("parsing date \"%s\" expected %s\n", in.c_str(), ok ? "success" : "failure");
        return;
    }
    if (ok && iso != expected)
    {
        fail("parsing date \"%s\" expected %s but got %s\n", in.c_str(), expected.c_str(), iso.c_str());
    }
}

void test_dates()
{
    test_date("2025-01-20", true, "2025-01-20");
    test_date("01/20/25", true, "2025-01-20");
    test_date("1/5/25", true, "2025-01-05");
    test_date("12/31/2024", true, "2024-12-31");
    test_date("02/29/24", true, "2024-02-29");
    test_date("02/29/25", false, "");
    test_date("2025-13-01", false, "");
    test_date("2025-1-1", false, "");
    test_date("", false, "");
    test_date("2025-01-\xc3\xa9", false, "");
    test_date("\xe9\xe9/20/25", false, "");

    if (addDays("2025-01-20", -10) != "2025-01-10") fail("2025-01-20 minus 10 days\n");
    if (addDays("2025-03-01", -1) != "2025-02-28") fail("2025-03-01 minus 1 day\n");
    if (addDays("2024-03-01", -1) != "2024-02-29") fail("2024-03-01 minus 1 day\n");
    if (addDays("2024-12-31", 1) != "2025-01-01") fail("2024-12-31 plus 1 day\n");

    string date;
    int hour = -1;
    if (!parseTimestamp("2025-01-16 13:45:10", &date, &hour) || date != "2025-01-16" || hour != 13)
    {
        fail("timestamp with space\n");
    }
    if (!parseTimestamp("2025-01-16T07:00:00", &date, &hour) || hour != 7)
    {
        fail("timestamp with T\n");
    }
    if (!parseTimestamp("2025-01-17", &date, &hour) || date != "2025-01-17" || hour != 0)
    {
        fail("a plain date is hour 0\n");
    }
    if (parseTimestamp("2025-01-16 25:00:00", &date, &hour)) fail("hour 25 should fail\n");
    if (parseTimestamp("yesterday", &date, &hour)) fail("yesterday should fail\n");
}

void test_csv()
{
    vector<string> fields;
    if (!parseCsvLine("a,\"b,c\",\"d\"\"e\", f ,", ',', &fields))
    {
        fail("could not parse csv line\n");
    }
    else if (fields.size() != 5 || fields[0] != "a" || fields[1] != "b,c" || fields[2] != "d\"e" ||
             fields[3] != "f" || fields[4] != "")
    {
        fail("unexpected csv fields \"%s\"\n", joinStrings(fields, "|").c_str());
    }
    if (parseCsvLine("a,\"b", ',', &fields)) fail("an open quote should fail\n");

    Table t;
    string err;
    if (!parseCsv({ "device_id;unit_id", "DAC1;1", "DAC2;2" }, ';', &t, &err) || t.size() != 2)
    {
        fail("could not parse a semicolon separated table: %s\n", err.c_str());
    }
    if (t.column("unit_id") != 1 || t.column("nope") != -1) fail("column lookup\n");

    if (parseCsv({ "a,b", "1,2,3" }, ',', &t, &err)) fail("too many fields should fail\n");
    if (parseCsv({}, ',', &t, &err)) fail("no header should fail\n");

    vector<string> missing;
    Table h;
    h.columns = { "unit_id", "data" };
    if (h.hasColumns({ "unit_id", "hora", "data", "metodo" }, &missing)) fail("hasColumns should fail\n");
    if (joinStrings(missing, ",") != "hora,metodo") fail("missing should be hora,metodo\n");

    string line = toCsvLine({ "1", "a,b", "say \"hi\"" }, ',');
    if (line != "1,\"a,b\",\"say \"\"hi\"\"\"") fail("toCsvLine got %s\n", line.c_str());
}

void test_roster()
{
    Table t;
    string err;
    parseCsv({ "id_bradesco,unit_name,data_inicio_automacao,dias_antes_automacao",
               "1,Centro,01/20/25,9",
               "2,Norte,2025-01-25,4",
               "1,Again,01/30/25,1" }, ',', &t, &err);

    vector<FacilityUnit> units;
    if (!extractUnits(t, &units, &err))
    {
        fail("could not extract units: %s\n", err.c_str());
        return;
    }
    if (units.size() != 2) fail("the duplicated unit 1 should be skipped\n");
    if (units[0].install_date != "2025-01-10" || units[0].automation_start_date != "2025-01-20")
    {
        fail("unit 1 window expected 2025-01-10..2025-01-20 got %s..%s\n",
             units[0].install_date.c_str(), units[0].automation_start_date.c_str());
    }
    if (units[1].install_date != "2025-01-20") fail("unit 2 install expected 2025-01-20\n");

    Table bad;
    bad.columns = { "unit_id" };
    vector<FacilityUnit> none;
    if (extractUnits(bad, &none, &err)) fail("a roster without dates should fail\n");
    if (err.find("install_offset_days") == string::npos || err.find("automation_start_date") == string::npos)
    {
        fail("the error should name the missing columns: %s\n", err.c_str());
    }

    vector<DeviceUnit> devices;
    const char *ids[] = { "DAC40324A001", "DUT10001B001", "DAC40324A002", "DAC40324A001", "DAC99999Z001" };
    int owners[] = { 1, 2, 2, 2, 7 };
    for (int i = 0; i < 5; ++i)
    {
        DeviceUnit du;
        du.device_id = ids[i];
        du.unit_id = owners[i];
        devices.push_back(du);
    }
    vector<UnitDeviceWindow> windows = buildWindows(units, devices);
    if (windows.size() != 3)
    {
        fail("expected 3 device windows but got %zu\n", windows.size());
        return;
    }
    if (windows[0].device_version != "DAC40324" || windows[0].unit_id != 1)
    {
        fail("the first window should be DAC40324 in unit 1\n");
    }
    vector<string> versions = versionsInOrder(windows);
    if (joinStrings(versions, ",") != "DAC40324,DUT10001") fail("versions got %s\n", joinStrings(versions, ",").c_str());

    string first, last;
    if (!dateRange(windows, &first, &last) || first != "2025-01-10" || last != "2025-01-25")
    {
        fail("date range got %s..%s\n", first.c_str(), last.c_str());
    }
    if (deviceVersion("DAC4", 8) != "DAC4") fail("a short device id is its own version\n");
}

void test_validity()
{
    UnitDeviceWindow w;
    w.unit_id = 1;
    w.device_id = "DAC40324A001";
    w.device_version = "DAC40324";
    w.install_date = "2025-01-10";
    w.automation_start_date = "2025-01-20";

    vector<AvailabilityRecord> av = { { "DAC40324A001", "2025-01-10" },
                                      { "DAC40324A001", "2025-01-20" },
                                      { "DAC40324A001", "2025-01-25" } };
    ValidityFilter filter({ w }, av);
    FilterStats stats;
    ConsumptionRecord r;

    if (filter.attribute("DAC40324A001", "2025-01-25", 3, 1.0, Method::Direct, "DAC40324", &r, &stats))
    {
        fail("2025-01-25 is after the automation start and must be excluded\n");
    }
    if (!filter.attribute("DAC40324A001", "2025-01-10", 3, 1.0, Method::Direct, "DAC40324", &r, &stats))
    {
        fail("the install date is inside the window\n");
    }
    if (r.unit_id != 1 || r.install_date != "2025-01-10" || r.automation_start_date != "2025-01-20" ||
        r.hour != 3 || r.method != Method::Direct)
    {
        fail("the attributed record is not filled in\n");
    }
    if (!filter.attribute("DAC40324A001", "2025-01-20", 0, 0.1, Method::Indirect, "", &r, &stats))
    {
        fail("the automation start is inside the window\n");
    }
    if (filter.attribute("DAC40324A001", "2025-01-15", 0, 0.1, Method::Indirect, "", &r, &stats))
    {
        fail("no availability on 2025-01-15\n");
    }
    if (filter.attribute("DAC40324A001", "2025-01-10", 0, 0, Method::Direct, "", &r, &stats))
    {
        fail("zero consumption must be excluded\n");
    }
    if (filter.attribute("DAC40324A001", "2025-01-10", 0, 1, Method::Direct, "DAC40399", &r, &stats))
    {
        fail("the device is not of version DAC40399\n");
    }
    if (filter.attribute("DUT1", "2025-01-10", 0, 1, Method::Direct, "", &r, &stats))
    {
        fail("an unknown device must be excluded\n");
    }
    if (stats.accepted != 2 || stats.outside_window != 1 || stats.unavailable != 1 ||
        stats.non_positive != 1 || stats.wrong_version != 1 || stats.unknown_device != 1)
    {
        fail("unexpected filter stats accepted=%d rejected=%d\n", stats.accepted, stats.rejected());
    }

    ConsumptionRecord other = r;
    other.unit_id = 2;
    other.date = "2025-01-10";
    if (filter.accept(other)) fail("the device does not belong to unit 2\n");
    other.unit_id = 1;
    if (!filter.accept(other)) fail("the record should be accepted\n");
}

void test_worker_pool()
{
    for (int workers : { 1, 3, 16 })
    {
        WorkerPool pool("test", workers);
        vector<int> hits(500);
        pool.run(hits.size(), [&](size_t i) { hits[i]++; });
        for (size_t i = 0; i < hits.size(); ++i)
        {
            if (hits[i] != 1)
            {
                fail("item %zu was handled %d times with %d workers\n", i, hits[i], workers);
                break;
            }
        }
        pool.run(0, [&](size_t i) { fail("no items should be handed out\n"); });
    }
}

// Serves canned tables and can be told to fail.
struct TestQueryExecutor : public QueryExecutor
{
    TestQueryExecutor() : mutex_("test_executor") {}

    QueryStatus execute(const Query &q, Table *out, string *error)
    {
        WITH(mutex_, execute);
        calls[q.kind]++;
        if (transient_failures > 0)
        {
            transient_failures--;
            *error = "rate limited";
            return QueryStatus::Transient;
        }
        if (fail_kind_set && q.kind == fail_kind)
        {
            *error = "table dropped";
            return QueryStatus::Fatal;
        }
        if (q.kind == QueryKind::Telemetry)
        {
            auto i = telemetry.find(q.table);
            if (i == telemetry.end())
            {
                *error = "no such table "+q.table;
                return QueryStatus::Fatal;
            }
            *out = i->second;
            return QueryStatus::Ok;
        }
        if (q.kind == QueryKind::Indirect)
        {
            Table &t = tables[q.kind];
            out->columns = t.columns;
            for (auto &r : t.rows)
            {
                if (r[0] == q.device_id) out->rows.push_back(r);
            }
            return QueryStatus::Ok;
        }
        *out = tables[q.kind];
        return QueryStatus::Ok;
    }

    string name() { return "test"; }

    map<QueryKind,Table> tables;
    map<string,Table> telemetry;
    map<QueryKind,int> calls;
    int transient_failures {};
    bool fail_kind_set {};
    QueryKind fail_kind {};

    RecursiveMutex mutex_;
};

void test_retry()
{
    TestQueryExecutor qe;
    qe.tables[QueryKind::FamiliesWithCurrent].columns = { "device_prefix" };
    qe.tables[QueryKind::FamiliesWithCurrent].rows = { { "DAC40324" } };

    Query q;
    q.kind = QueryKind::FamiliesWithCurrent;
    RetryPolicy policy;
    policy.retries = 3;
    policy.backoff_ms = 0;

    Table out;
    string err;
    qe.transient_failures = 2;
    QueryStatus s = executeWithRetries(&qe, q, policy, &out, &err);
    if (s != QueryStatus::Ok || out.size() != 1)
    {
        fail("two transient failures should be retried, got %s %s\n", toString(s), err.c_str());
    }
    if (qe.calls[QueryKind::FamiliesWithCurrent] != 3) fail("expected 3 attempts\n");

    qe.transient_failures = 5;
    s = executeWithRetries(&qe, q, policy, &out, &err);
    if (s != QueryStatus::Fatal) fail("five transient failures should exhaust three retries\n");
    if (qe.calls[QueryKind::FamiliesWithCurrent] != 7) fail("expected 4 more attempts\n");
    if (err != "rate limited") fail("the last error should be kept, got %s\n", err.c_str());

    qe.transient_failures = 0;
    qe.fail_kind_set = true;
    qe.fail_kind = QueryKind::FamiliesWithCurrent;
    s = executeWithRetries(&qe, q, policy, &out, &err);
    if (s != QueryStatus::Fatal || qe.calls[QueryKind::FamiliesWithCurrent] != 8)
    {
        fail("a fatal failure should not be retried\n");
    }

    int backoff = 1000;
    for (int i = 0; i < 100; ++i)
    {
        int next = nextBackoff(backoff);
        if (next < backoff || next > MAX_BACKOFF_MS)
        {
            fail("backoff %d was followed by %d on retry %d\n", backoff, next, i);
            break;
        }
        backoff = next;
    }
    if (backoff != MAX_BACKOFF_MS) fail("100 retries should end at the longest backoff, got %d\n", backoff);
    if (nextBackoff(0) != 0) fail("a zero backoff stays zero\n");
    if (nextBackoff(250) != 500) fail("backoff 250 should double to 500\n");
}

vector<FacilityUnit> testUnits()
{
    Table t;
    string err;
    parseCsv({ "unit_id,install_offset_days,automation_start_date",
               "1,9,01/20/25",
               "2,4,2025-01-25" }, ',', &t, &err);
    vector<FacilityUnit> units;
    extractUnits(t, &units, &err);
    return units;
}

void setupTestTables(TestQueryExecutor *qe)
{
    Table &devices = qe->tables[QueryKind::DevicesByUnits];
    devices.columns = { "device_id", "unit_id" };
    devices.rows = { { "DAC40324A001", "1" },
                     { "DAC40324A002", "1" },
                     { "DUT10001B001", "2" },
                     { "DAC40324A003", "2" } };

    Table &av = qe->tables[QueryKind::Availability];
    av.columns = { "device_id", "date" };
    av.rows = { { "DAC40324A001", "2025-01-15" },
                { "DAC40324A001", "2025-01-25" },
                { "DAC40324A002", "2025-01-16" },
                { "DUT10001B001", "2025-01-22" },
                { "DAC40324A003", "2025-01-21" } };

    Table &families = qe->tables[QueryKind::FamiliesWithCurrent];
    families.columns = { "device_prefix" };
    families.rows = { { "DAC40324" } };

    Table &tel = qe->telemetry["DAC40324"];
    tel.columns = { "device_id", "date", "payload" };
    tel.rows = { { "DAC40324A001", "2025-01-15", "5,3*2,*9,2*0" },
                 { "DAC40324A001", "2025-01-25", "10*3600" },
                 { "DAC40324A003", "2025-01-22", "4*7200" } };

    Table &ind = qe->tables[QueryKind::Indirect];
    ind.columns = { "device_id", "record_timestamp", "consumption" };
    ind.rows = { { "DAC40324A002", "2025-01-16 13:00:00", "0.25" },
                 { "DAC40324A002", "2025-01-16 13:30:00", "0.25" },
                 { "DAC40324A002", "2025-01-17 08:00:00", "0.3" },
                 { "DUT10001B001", "2025-01-22T07:00:00", "1.5" },
                 { "DUT10001B001", "2025-01-22 08:00:00", "0" },
                 { "DUT10001B001", "garbage", "1" },
                 { "DAC40324A003", "2025-01-21 10:00:00", "0.5" },
                 { "DAC40324A001", "2025-01-15 00:00:00", "9" } };
}

PipelineSettings testSettings()
{
    PipelineSettings s;
    s.calibration.default_constant = 300;
    s.retry.backoff_ms = 0;
    return s;
}

string recordsToString(const vector<ConsumptionRecord> &records)
{
    string s;
    for (auto &r : records)
    {
        s += tostrprintf("%d %s %s %02d %s %s|", r.unit_id, r.device_id.c_str(), r.date.c_str(), r.hour,
                         formatDecimals(r.consumo_kwh, 6).c_str(), toString(r.method));
    }
    return s;
}

void test_pipeline()
{
    TestQueryExecutor qe;
    setupTestTables(&qe);

    AttributionPipeline pipeline(&qe, testSettings());
    if (pipeline.state("DAC40324") != VersionState::Pending) fail("versions start pending\n");

    vector<ConsumptionRecord> records;
    PipelineResult r = pipeline.run(testUnits(), &records);
    if (r.type != PipelineResultType::Success)
    {
        fail("pipeline failed %s %s\n", toString(r.type), r.msg.c_str());
        return;
    }

    string expected =
        "1 DAC40324A001 2025-01-15 00 0.000917 direto|"
        "1 DAC40324A002 2025-01-16 13 0.5 indireto|"
        "2 DAC40324A003 2025-01-21 10 0.5 indireto|"
        "2 DUT10001B001 2025-01-22 07 1.5 indireto|";
    string got = recordsToString(records);
    if (got != expected)
    {
        fail("pipeline output\nexpected %s\ngot      %s\n", expected.c_str(), got.c_str());
    }

    // Every device without direct hours was queued for the indirect method.
    string queue = joinStrings(pipeline.indirectQueue(), ",");
    if (queue != "DAC40324A002,DUT10001B001,DAC40324A003")
    {
        fail("indirect queue got %s\n", queue.c_str());
    }
    if (qe.calls[QueryKind::Indirect] != 3) fail("expected 3 indirect queries\n");
    if (qe.calls[QueryKind::Telemetry] != 1) fail("only DAC40324 has current telemetry\n");

    if (pipeline.state("DAC40324") != VersionState::Consolidated ||
        pipeline.state("DUT10001") != VersionState::Consolidated)
    {
        fail("all versions should end consolidated\n");
    }

    const PipelineStats &s = pipeline.stats();
    if (s.units != 2 || s.devices != 4 || s.versions != 2 || s.versions_selected != 1 ||
        s.versions_with_direct != 1 || s.direct_records != 1 || s.indirect_records != 3 ||
        s.indirect_devices != 3 || s.indirect_bad_timestamps != 1)
    {
        fail("unexpected pipeline stats\n");
    }
    // 4*7200 covers hours 0 and 1 of a day the device was not available.
    if (s.direct_filter.outside_window != 1 || s.direct_filter.unavailable != 2)
    {
        fail("expected one direct hour outside the window and two unavailable\n");
    }
    for (auto &rec : records)
    {
        if (rec.device_version != deviceVersion(rec.device_id)) fail("wrong version for %s\n", rec.device_id.c_str());
        if (rec.unit_id == 1 && rec.install_date != "2025-01-10") fail("wrong install date\n");
    }
}

void test_pipeline_no_direct()
{
    TestQueryExecutor qe;
    setupTestTables(&qe);
    qe.tables[QueryKind::FamiliesWithCurrent].rows.clear();

    AttributionPipeline pipeline(&qe, testSettings());
    vector<ConsumptionRecord> records;
    PipelineResult r = pipeline.run(testUnits(), &records);
    if (r.type != PipelineResultType::NoDirectConsumption)
    {
        fail("expected NoDirectConsumption but got %s\n", toString(r.type));
    }
    if (records.size() != 0) fail("nothing should be produced\n");
    if (qe.calls[QueryKind::Indirect] != 0) fail("the indirect method should not run\n");
    if (pipeline.state("DAC40324") != VersionState::DirectEmpty) fail("DAC40324 should be DirectEmpty\n");

    // Telemetry exists but nothing survives the filter.
    TestQueryExecutor qe2;
    setupTestTables(&qe2);
    qe2.telemetry["DAC40324"].rows = { { "DAC40324A001", "2025-01-25", "10*3600" } };
    AttributionPipeline pipeline2(&qe2, testSettings());
    r = pipeline2.run(testUnits(), &records);
    if (r.type != PipelineResultType::NoDirectConsumption)
    {
        fail("filtered away direct hours should give NoDirectConsumption\n");
    }
}

void test_pipeline_failures()
{
    TestQueryExecutor qe;
    setupTestTables(&qe);
    qe.fail_kind_set = true;
    qe.fail_kind = QueryKind::Telemetry;

    AttributionPipeline pipeline(&qe, testSettings());
    vector<ConsumptionRecord> records;
    PipelineResult r = pipeline.run(testUnits(), &records);
    if (r.type != PipelineResultType::QueryFailed)
    {
        fail("a failing telemetry query should fail the run\n");
    }
    if (r.msg.find("DAC40324") == string::npos || r.msg.find("table dropped") == string::npos)
    {
        fail("the message should name the version and the error: %s\n", r.msg.c_str());
    }
    if (records.size() != 0) fail("no records after a failure\n");

    TestQueryExecutor qe2;
    setupTestTables(&qe2);
    qe2.fail_kind_set = true;
    qe2.fail_kind = QueryKind::Indirect;
    AttributionPipeline pipeline2(&qe2, testSettings());
    r = pipeline2.run(testUnits(), &records);
    if (r.type != PipelineResultType::QueryFailed) fail("a failing indirect query should fail the run\n");
    if (records.size() != 0) fail("no partial output after an indirect failure\n");

    TestQueryExecutor qe3;
    setupTestTables(&qe3);
    qe3.transient_failures = 2;
    AttributionPipeline pipeline3(&qe3, testSettings());
    r = pipeline3.run(testUnits(), &records);
    if (r.type != PipelineResultType::Success || records.size() != 4)
    {
        fail("transient failures should be retried\n");
    }

    TestQueryExecutor qe4;
    setupTestTables(&qe4);
    qe4.tables[QueryKind::DevicesByUnits].columns = { "device", "unit" };
    AttributionPipeline pipeline4(&qe4, testSettings());
    r = pipeline4.run(testUnits(), &records);
    if (r.type != PipelineResultType::QueryFailed) fail("a device table without device_id should fail\n");
}

void test_pipeline_workers()
{
    string reference;
    for (int workers : { 1, 2, 8 })
    {
        TestQueryExecutor qe;
        setupTestTables(&qe);
        // More versions so that the workers have something to share.
        qe.tables[QueryKind::FamiliesWithCurrent].rows.push_back({ "DUT10001" });
        qe.telemetry["DUT10001"].columns = { "device_id", "date", "payload" };
        qe.telemetry["DUT10001"].rows = { { "DUT10001B001", "2025-01-22", "2*1800,4*1800,1*7200" } };

        PipelineSettings settings = testSettings();
        settings.workers = workers;
        AttributionPipeline pipeline(&qe, settings);
        vector<ConsumptionRecord> records;
        PipelineResult r = pipeline.run(testUnits(), &records);
        if (r.type != PipelineResultType::Success)
        {
            fail("pipeline with %d workers failed: %s\n", workers, r.msg.c_str());
            continue;
        }
        string got = recordsToString(records);
        if (reference == "") reference = got;
        else if (got != reference)
        {
            fail("output with %d workers differs\n%s\n%s\n", workers, reference.c_str(), got.c_str());
        }
        if (pipeline.indirectQueue().size() != 2) fail("B001 now has direct hours\n");
    }
}

ConsumptionRecord rec(int unit, string device, string date, int hour, double kwh, Method m)
{
    ConsumptionRecord r;
    r.unit_id = unit;
    r.device_id = device;
    r.device_version = deviceVersion(device);
    r.date = date;
    r.hour = hour;
    r.consumo_kwh = kwh;
    r.method = m;
    return r;
}

void test_consolidate()
{
    vector<ConsumptionRecord> direct = { rec(1, "DAC1", "2025-01-15", 3, 1.0, Method::Direct),
                                         rec(1, "DAC1", "2025-01-15", 4, 1.5, Method::Direct) };
    vector<ConsumptionRecord> indirect = { rec(1, "DAC1", "2025-01-15", 3, 0.7, Method::Indirect),
                                           rec(1, "DAC1", "2025-01-15", 5, 0.2, Method::Indirect),
                                           rec(1, "DAC1", "2025-01-15", 5, 0.3, Method::Indirect),
                                           rec(1, "DUT1", "2025-01-15", 3, 0.4, Method::Indirect) };
    int dropped = 0;
    vector<ConsumptionRecord> out = consolidateRecords(direct, indirect, DuplicatePolicy::PreferDirect, &dropped);
    string expected =
        "1 DAC1 2025-01-15 03 1 direto|"
        "1 DUT1 2025-01-15 03 0.4 indireto|"
        "1 DAC1 2025-01-15 04 1.5 direto|"
        "1 DAC1 2025-01-15 05 0.5 indireto|";
    if (recordsToString(out) != expected)
    {
        fail("preferdirect\nexpected %s\ngot      %s\n", expected.c_str(), recordsToString(out).c_str());
    }
    if (dropped != 1) fail("one indirect record should be dropped, got %d\n", dropped);

    out = consolidateRecords(direct, indirect, DuplicatePolicy::KeepBoth, &dropped);
    if (out.size() != 5 || dropped != 0) fail("keepboth should keep both records of hour 3\n");
    if (out[0].method != Method::Direct || out[1].method != Method::Indirect || out[1].device_id != "DAC1")
    {
        fail("direct sorts before indirect within an hour\n");
    }

    DuplicatePolicy p;
    if (!toDuplicatePolicy("keepboth", &p) || p != DuplicatePolicy::KeepBoth) fail("keepboth\n");
    if (toDuplicatePolicy("both", &p)) fail("both is not a policy\n");
}

void test_aggregation()
{
    vector<ConsumptionRecord> records = { rec(1, "DAC40324A001", "2025-01-15", 3, 3.0, Method::Direct),
                                          rec(1, "DAC40324A002", "2025-01-15", 3, 1.0, Method::Indirect),
                                          rec(1, "DUT10001B001", "2025-01-15", 3, 0.0, Method::Direct),
                                          rec(1, "XYZ00001C001", "2025-01-15", 3, 0.0, Method::Direct),
                                          rec(1, "DAC40324A001", "2025-01-15", 4, 2.0, Method::Direct),
                                          rec(2, "DUT10001B002", "2025-01-15", 3, 0.0, Method::Indirect),
                                          rec(2, "DUT10001B003", "2025-01-15", 3, 0.0, Method::Indirect) };

    vector<UnitHourAggregate> hours = aggregateUnitHours(records);
    if (hours.size() != 3)
    {
        fail("expected 3 unit hours but got %zu\n", hours.size());
        return;
    }
    UnitHourAggregate &a = hours[0];
    // Four devices: uniform weight 0.125 each plus half of the share of 4 kWh.
    if (a.qtd_devices_total != 4 || a.qtd_dac != 2 || a.qtd_dut != 1)
    {
        fail("unit 1 hour 3 counts total=%d dac=%d dut=%d\n", a.qtd_devices_total, a.qtd_dac, a.qtd_dut);
    }
    double dac1 = 0.125 + 0.5*0.75;
    double dac2 = 0.125 + 0.5*0.25;
    if (!same(a.peso_medio_dac, (dac1+dac2)/2)) fail("peso_medio_dac %g\n", a.peso_medio_dac);
    if (!same(a.peso_medio_dut, 0.125)) fail("peso_medio_dut %g\n", a.peso_medio_dut);
    if (!same(a.consumo_kwh_total, 4.0)) fail("consumo total %g\n", a.consumo_kwh_total);
    if (a.metodos != "direto,indireto") fail("metodos %s\n", a.metodos.c_str());

    UnitHourAggregate &b = hours[1];
    if (b.qtd_dut != 0 || b.peso_medio_dut != 0.0 || !same(b.peso_medio_dac, 1.0) || b.metodos != "direto")
    {
        fail("a single DAC gets weight 1 and the missing DUT 0\n");
    }

    // No consumption at all, the share falls back to the uniform part.
    UnitHourAggregate &c = hours[2];
    if (!same(c.peso_medio_dut, 0.5) || c.qtd_dac != 0 || c.peso_medio_dac != 0.0)
    {
        fail("zero consumption unit hour got peso_medio_dut %g\n", c.peso_medio_dut);
    }

    for (auto &h : hours)
    {
        if (h.peso_medio_dac < 0 || h.peso_medio_dac > 1 || h.peso_medio_dut < 0 || h.peso_medio_dut > 1)
        {
            fail("weights out of bounds for unit %d hour %d\n", h.unit_id, h.hour);
        }
    }

    // keepboth can give the same device twice, it is counted once.
    vector<ConsumptionRecord> both = { rec(1, "DAC1", "2025-01-15", 3, 1.0, Method::Direct),
                                       rec(1, "DAC1", "2025-01-15", 3, 0.5, Method::Indirect) };
    hours = aggregateUnitHours(both);
    if (hours.size() != 1 || hours[0].qtd_devices_total != 1 || !same(hours[0].consumo_kwh_total, 1.5))
    {
        fail("a device with both methods should count once\n");
    }

    if (deviceType("DUT10001B001") != DeviceType::DUT) fail("DUT prefix\n");
    if (deviceType("dac40324") != DeviceType::OTHER) fail("the type prefix is case sensitive\n");
    if (deviceType("DAC40324", 4) != DeviceType::OTHER) fail("typelength 4 gives DAC4\n");
}

void test_rollup()
{
    vector<ConsumptionRecord> records = { rec(1, "DAC1", "2025-01-15", 3, 0.00004, Method::Direct),
                                          rec(1, "DAC2", "2025-01-15", 3, 0.00002, Method::Direct),
                                          rec(1, "DAC3", "2025-01-15", 3, 1.0, Method::Indirect),
                                          rec(1, "DAC1", "2025-01-16", 0, 2.5, Method::Direct),
                                          rec(2, "DUT1", "2025-01-15", 3, 0.12344, Method::Indirect) };

    vector<UnitRollup> rollup = rollupUnits(records);
    if (rollup.size() != 4)
    {
        fail("expected 4 rollup rows but got %zu\n", rollup.size());
        return;
    }
    if (rollup[0].metodo != "direto" || rollup[0].qtd_dispositivos != 2 || !same(rollup[0].consumo_kwh_total, 0.0001))
    {
        fail("first rollup row %s %d %g\n", rollup[0].metodo.c_str(), rollup[0].qtd_dispositivos,
             rollup[0].consumo_kwh_total);
    }
    if (rollup[1].metodo != "indireto" || rollup[2].date != "2025-01-16") fail("rollup order\n");
    if (!same(rollup[3].consumo_kwh_total, 0.1234)) fail("rounding to 4 decimals\n");

    vector<UnitSummary> summary = summarizeUnits(rollup);
    if (summary.size() != 2)
    {
        fail("expected 2 units in the summary\n");
        return;
    }
    UnitSummary &s = summary[0];
    if (s.unit_id != 1 || !same(s.consumo_total_kwh, 3.5001) || s.dias_com_dados != 2 ||
        s.registros_direto != 2 || s.registros_indireto != 1 || !same(s.dispositivos_medio, 1.33))
    {
        fail("summary of unit 1 total=%g days=%d direct=%d indirect=%d devices=%g\n",
             s.consumo_total_kwh, s.dias_com_dados, s.registros_direto, s.registros_indireto, s.dispositivos_medio);
    }
}

void test_consolidated_columns()
{
    Table t;
    string err;
    parseCsv({ "unit_id,device_id,data,consumo_kwh", "1,DAC1,2025-01-15,0.5" }, ',', &t, &err);
    vector<ConsumptionRecord> records;
    if (extractConsolidated(t, &records, &err))
    {
        fail("a consolidated table without hora and metodo should fail\n");
    }
    if (err.find("hora") == string::npos || err.find("metodo") == string::npos || err.find("unit_id") != string::npos)
    {
        fail("the error should name exactly the missing columns: %s\n", err.c_str());
    }

    parseCsv({ "unit_id,device_id,device_version,hora,data,consumo_kwh,data_instalacao,data_inicio_automacao,metodo",
               "1,DAC40324A001,DAC40324,3,2025-01-15,0.000917,2025-01-10,2025-01-20,direto",
               "1,DAC40324A002,DAC40324,13,2025-01-16,0.5,2025-01-10,2025-01-20,indireto" }, ',', &t, &err);
    if (!extractConsolidated(t, &records, &err) || records.size() != 2)
    {
        fail("could not read a consolidated table: %s\n", err.c_str());
    }
    else if (records[1].method != Method::Indirect || records[1].hour != 13 || records[0].install_date != "2025-01-10")
    {
        fail("consolidated values not read back\n");
    }

    parseCsv({ "unit_id,device_id,hora,data,consumo_kwh,metodo", "1,DAC1,24,2025-01-15,0.5,direto" }, ',', &t, &err);
    records.clear();
    if (extractConsolidated(t, &records, &err)) fail("hour 24 should be rejected\n");

    // Rows without positive consumption are skipped, the weights stay inside 0-1.
    parseCsv({ "unit_id,device_id,hora,data,consumo_kwh,metodo",
               "1,DAC1,5,2025-01-15,-3,direto",
               "1,DAC2,5,2025-01-15,0,indireto",
               "1,DAC3,5,2025-01-15,1.5,direto" }, ',', &t, &err);
    records.clear();
    if (!extractConsolidated(t, &records, &err) || records.size() != 1 || records[0].device_id != "DAC3")
    {
        fail("only the row with positive consumption should be read, got %zu rows %s\n", records.size(), err.c_str());
        return;
    }
    vector<UnitHourAggregate> hours = aggregateUnitHours(records);
    if (hours.size() != 1 || hours[0].qtd_devices_total != 1 || !same(hours[0].peso_medio_dac, 1.0))
    {
        fail("a single device with positive consumption should get weight 1\n");
    }
}

void test_config()
{
    Configuration c;
    string conf =
        "# hvacmeters test\n"
        "\n"
        "loglevel=normal\n"
        "units=/tmp/units.csv\n"
        "datadir=/tmp/data\n"
        "outputdir=/tmp/out\n"
        "format=json\n"
        "threshold=80\n"
        "calibration=310.94\n"
        "calibration_DAC4=311.5\n"
        "workers=100\n"
        "retries=5\n"
        "backoff=250ms\n"
        "duplicates=keepboth\n"
        "versionlength=6\n"
        "ignoremarker=#\n";
    vector<char> buf(conf.begin(), conf.end());
    parseConfig(&c, buf, "test.conf");

    if (c.units_file != "/tmp/units.csv" || c.datadir != "/tmp/data" || c.outputdir != "/tmp/out")
    {
        fail("config paths not read\n");
    }
    if (c.format != OutputFormat::JSON) fail("format json\n");
    if (c.pipeline.threshold != 80) fail("threshold %d\n", c.pipeline.threshold);
    if (c.pipeline.calibration.default_constant != 310.94) fail("default calibration\n");
    if (c.pipeline.calibration.constantFor("DAC40324") != 311.5) fail("calibration_DAC4\n");
    if (c.pipeline.workers != DEFAULT_WORKERS) fail("an invalid worker count should keep the default\n");
    if (c.pipeline.retry.retries != 5 || c.pipeline.retry.backoff_ms != 250) fail("retries and backoff\n");
    if (c.pipeline.duplicates != DuplicatePolicy::KeepBoth) fail("duplicates\n");
    if (c.pipeline.version_length != 6 || c.pipeline.ignore_marker != '#') fail("versionlength and ignoremarker\n");

    Configuration d;
    handleThreshold(&d, "101");
    handleCalibration(&d, "DAC4=abc");
    handleBackoff(&d, "soon");
    handleSeparator(&d, ";;");
    if (d.pipeline.threshold != DEFAULT_THRESHOLD || d.pipeline.calibration.families.size() != 0 ||
        d.pipeline.retry.backoff_ms != 1000 || d.separator != ',')
    {
        fail("invalid values should keep the defaults\n");
    }

    // The tables on stdout must not be mixed with log lines.
    if (!useStderrForLog(&d)) fail("printing the tables on stdout should log on stderr\n");
    d.outputdir = "";
    if (!useStderrForLog(&d)) fail("an empty outputdir prints on stdout and should log on stderr\n");
    if (useStderrForLog(&c)) fail("with an outputdir the log can stay on stdout\n");
    c.use_stderr_for_log = true;
    if (!useStderrForLog(&c)) fail("--logtostderr should log on stderr\n");
}

void test_cmdline()
{
    const char *args[] = { "hvacmeters", "--threshold=80", "--calibration=DAC4=310.94", "--workers=8",
                           "--format=json", "--duplicates=keepboth", "units.csv", "data", NULL };
    shared_ptr<Configuration> c = parseCommandLine(8, (char**)args);
    if (c->units_file != "units.csv" || c->datadir != "data") fail("positional units and datadir\n");
    if (c->pipeline.threshold != 80 || c->pipeline.workers != 8) fail("threshold and workers\n");
    if (c->pipeline.calibration.constantFor("DAC40324") != 310.94) fail("family calibration\n");
    if (c->format != OutputFormat::JSON || c->pipeline.duplicates != DuplicatePolicy::KeepBoth) fail("format\n");

    const char *agg[] = { "hvacmeters", "--aggregate=consumption_consolidated.csv", "--outputdir=/tmp", NULL };
    c = parseCommandLine(3, (char**)agg);
    if (c->aggregate_file != "consumption_consolidated.csv" || c->outputdir != "/tmp") fail("--aggregate\n");

    const char *use[] = { "hvacmeters", "--useconfig=/tmp/x", "--verbose", "--workers=2", NULL };
    c = parseCommandLine(4, (char**)use);
    if (!c->useconfig || c->config_root != "/tmp/x" || c->overrides.loglevel_override != "verbose" ||
        c->overrides.workers_override != "2")
    {
        fail("--useconfig overrides\n");
    }

    const char *help[] = { "hvacmeters", NULL };
    c = parseCommandLine(1, (char**)help);
    if (!c->need_help) fail("no arguments should print the help\n");
}

bool writeFile(string file, string content)
{
    FILE *f = fopen(file.c_str(), "w");
    if (!f) return false;
    fputs(content.c_str(), f);
    return fclose(f) == 0;
}

void test_file_executor()
{
    char tmpl[] = "/tmp/hvacmeters_testXXXXXX";
    char *dir = mkdtemp(tmpl);
    if (!dir)
    {
        fail("could not create a temporary directory\n");
        return;
    }
    string d = dir;
    mkdir((d+"/telemetry").c_str(), 0755);

    writeFile(d+"/devices.csv",
              "device_id,unit_id,availability\n"
              "DAC1,1,80\n"
              "DAC2,1,50\n"
              "DAC1,2,90\n"
              "DUT1,3,99\n"
              "DUT2,2,100\n"
              "DAC3,1,90\n");
    writeFile(d+"/availability.csv",
              "device_id,date,availability\n"
              "DAC1,2025-01-10,75\n"
              "DAC1,2025-01-11,74.9\n"
              "DAC1,01/12/25,100\n"
              "DAC1,2025-02-01,100\n");
    writeFile(d+"/families.csv", "device_prefix\nDAC1\nDAC1\nDUT2\n");
    writeFile(d+"/telemetry/DAC1.csv",
              "device_id,date,payload\n"
              "DAC1,2025-01-10,\"5,3*2\"\n"
              "DAC1,2025-03-01,1\n");
    writeFile(d+"/indirect.csv",
              "device_id,record_timestamp,consumption\n"
              "DAC1,2025-01-10 05:00:00,0.5\n"
              "DAC1,2025-01-10 06:00:00,0\n"
              "DUT2,2025-01-10 05:00:00,1\n"
              "DAC1,2025-02-10 05:00:00,1\n");

    shared_ptr<QueryExecutor> qe = newFileQueryExecutor(d);
    Table t;
    string err;

    Query q;
    q.kind = QueryKind::DevicesByUnits;
    q.units = { 1, 2 };
    q.threshold = 75;
    if (qe->execute(q, &t, &err) != QueryStatus::Ok)
    {
        fail("devices query failed: %s\n", err.c_str());
    }
    vector<DeviceUnit> devices;
    extractDevices(t, &devices, &err);
    if (devices.size() != 3 || devices[0].device_id != "DAC1" || devices[0].unit_id != 1 ||
        devices[1].device_id != "DAC3" || devices[2].device_id != "DUT2")
    {
        fail("devices should be DAC1 DAC3 DUT2 sorted on unit\n");
    }

    q = Query();
    q.kind = QueryKind::Availability;
    q.units = { 1, 2 };
    q.threshold = 75;
    q.date_init = "2025-01-01";
    q.date_final = "2025-01-31";
    t.clear();
    qe->execute(q, &t, &err);
    vector<AvailabilityRecord> av;
    extractAvailability(t, &av, &err);
    if (av.size() != 2 || av[0].date != "2025-01-10" || av[1].date != "2025-01-12")
    {
        fail("availability expected 2025-01-10 and 2025-01-12\n");
    }

    q = Query();
    q.kind = QueryKind::FamiliesWithCurrent;
    t.clear();
    qe->execute(q, &t, &err);
    if (t.size() != 2) fail("families should be distinct\n");

    q = Query();
    q.kind = QueryKind::Telemetry;
    q.table = "DAC1";
    q.date_init = "2025-01-01";
    q.date_final = "2025-01-31";
    t.clear();
    if (qe->execute(q, &t, &err) != QueryStatus::Ok) fail("telemetry query failed: %s\n", err.c_str());
    vector<DevicePayload> payloads;
    extractPayloads(t, &payloads, &err);
    if (payloads.size() != 1 || payloads[0].payload != "5,3*2") fail("telemetry payload\n");

    q.table = "NOPE";
    if (qe->execute(q, &t, &err) != QueryStatus::Fatal) fail("a missing table is fatal\n");
    q.table = "../devices";
    if (qe->execute(q, &t, &err) != QueryStatus::Fatal) fail("a table name with a path is fatal\n");
    q.table = "DAC\xc3\xa9";
    if (qe->execute(q, &t, &err) != QueryStatus::Fatal) fail("a table name with non ascii bytes is fatal\n");

    // A payload longer than any read buffer stays in one piece.
    string dense;
    for (int i = 0; i < 600000; ++i)
    {
        if (i > 0) dense += ",";
        dense += "1*1";
    }
    writeFile(d+"/telemetry/DAC2.csv", "device_id,date,payload\nDAC2,2025-01-10,\""+dense+"\"\n");
    q.table = "DAC2";
    t.clear();
    payloads.clear();
    if (qe->execute(q, &t, &err) != QueryStatus::Ok || !extractPayloads(t, &payloads, &err))
    {
        fail("a dense telemetry table could not be read: %s\n", err.c_str());
    }
    else if (payloads.size() != 1 || payloads[0].payload != dense)
    {
        fail("a dense payload of %zu bytes was not read back whole\n", dense.length());
    }

    q = Query();
    q.kind = QueryKind::Indirect;
    q.device_id = "DAC1";
    q.date_init = "2025-01-01";
    q.date_final = "2025-01-31";
    t.clear();
    qe->execute(q, &t, &err);
    vector<IndirectReading> readings;
    extractIndirect(t, &readings, &err);
    if (readings.size() != 1 || readings[0].record_timestamp != "2025-01-10 05:00:00" || readings[0].consumption != 0.5)
    {
        fail("indirect expected one reading of 0.5\n");
    }

    unlink((d+"/telemetry/DAC1.csv").c_str());
    unlink((d+"/telemetry/DAC2.csv").c_str());
    rmdir((d+"/telemetry").c_str());
    unlink((d+"/devices.csv").c_str());
    unlink((d+"/availability.csv").c_str());
    unlink((d+"/families.csv").c_str());
    unlink((d+"/indirect.csv").c_str());
    rmdir(d.c_str());
}

void test_printer()
{
    char tmpl[] = "/tmp/hvacmeters_outXXXXXX";
    char *dir = mkdtemp(tmpl);
    if (!dir)
    {
        fail("could not create a temporary directory\n");
        return;
    }
    string d = dir;

    vector<ConsumptionRecord> records = { rec(1, "DAC40324A001", "2025-01-15", 0, 0.000917, Method::Direct) };
    records[0].install_date = "2025-01-10";
    records[0].automation_start_date = "2025-01-20";

    Printer csv(OutputFormat::CSV, ',', d);
    if (!csv.printConsolidated(records)) fail("could not write csv\n");

    vector<ConsumptionRecord> back;
    string err;
    if (!loadConsolidated(csv.filename(CONSOLIDATED_NAME), ',', &back, &err) || back.size() != 1)
    {
        fail("could not read back the consolidated csv: %s\n", err.c_str());
    }
    else if (back[0].consumo_kwh != 0.000917 || back[0].automation_start_date != "2025-01-20")
    {
        fail("consolidated csv values differ\n");
    }

    Printer json(OutputFormat::JSON, ',', d);
    json.printConsolidated(records);
    vector<string> lines;
    loadFile(json.filename(CONSOLIDATED_NAME), &lines);
    string expected = "{\"unit_id\":1,\"device_id\":\"DAC40324A001\",\"device_version\":\"DAC40324\",\"hora\":0,"
        "\"data\":\"2025-01-15\",\"consumo_kwh\":0.000917,\"data_instalacao\":\"2025-01-10\","
        "\"data_inicio_automacao\":\"2025-01-20\",\"metodo\":\"direto\"}";
    if (lines.size() != 1 || lines[0] != expected)
    {
        fail("json line\nexpected %s\ngot      %s\n", expected.c_str(), lines.size() ? lines[0].c_str() : "");
    }
    if (jsonQuote("a\"b\\") != "\"a\\\"b\\\\\"") fail("jsonQuote\n");

    unlink(csv.filename(CONSOLIDATED_NAME).c_str());
    unlink(json.filename(CONSOLIDATED_NAME).c_str());
    rmdir(d.c_str());
}
