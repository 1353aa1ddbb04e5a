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
#include"printer.h"
#include"query.h"
#include"roster.h"
#include"util.h"

#include <stdio.h>
#include <stdlib.h>
#include <string.h>

using namespace std;

int main(int argc, char **argv);
int start(Configuration *config);
int aggregate(Configuration *config, Printer *printer);
void log_start_information(Configuration *config);
void log_run_statistics(const PipelineStats &stats);
void setup_logging(Configuration *config);

const char *short_manual = R"MANUAL(
Usage: hvacmeters {options} <units.csv> <datadir>
       hvacmeters {options} --aggregate=<consumption_consolidated.csv>
       hvacmeters --useconfig=<dir> {overrides}

Estimate the hourly energy consumption of the hvac devices of the units
listed in units.csv (unit_id,install_offset_days,automation_start_date).
The datadir holds devices.csv availability.csv families.csv indirect.csv
and telemetry/<version>.csv

As {options} you can use:

    --aggregate=<file> only roll up an already written consolidated file
    --backoff=<time> wait this long before the first retry, doubled for each retry (default 1s)
    --calibration=<k> default calibration constant in watts per ampere (default 310.86)
    --calibration=<family>=<k> calibration constant for versions starting with family
    --datadir=<dir> directory with the source tables
    --debug for a lot of information
    --duplicates=(preferdirect|keepboth) device hours found with both methods (default preferdirect)
    --format=(csv|json) output format (default csv)
    --help list all options
    --ignoremarker=<c> drop payload tokens starting with c (default *)
    --logfile=<file> use this file for logging
    --logtimestamps=(never|always|important) add timestamps to log entries
    --logtostderr log on stderr also when the tables go into --outputdir
    --normal for normal logging
    --outputdir=<dir> write the tables into this directory (default - prints on stdout)
    --retries=<n> retry a failing query n times (default 3)
    --separator=<c> csv column separator (default ,)
    --silent do not print any logging
    --threshold=<percent> minimum daily availability of a device (default 75)
    --trace for tons of information
    --typelength=<n> characters of the device id giving its type DAC/DUT (default 3)
    --units=<file> the unit roster
    --useconfig=<dir> load <dir>/etc/hvacmeters.conf or <dir>/hvacmeters.conf
    --verbose for more information
    --version print the version
    --versionlength=<n> characters of the device id giving its version (default 8)
    --workers=<n> number of queries executed in parallel (default 4)

With --outputdir every table is written into its own file and the log is
printed on stdout. Without it only the consolidated records are printed on
stdout, or with --aggregate the unit roll up, and the log goes to stderr.

Exit codes: 0 success, 1 failure, 2 no direct consumption was found.
)MANUAL";

int main(int argc, char **argv)
{
    // Keep stdout free for the tables until we know where they go.
    stderrEnabled(true);
    enableEarlyLoggingFromCommandLine(argc, argv);

    auto config = parseCommandLine(argc, argv);

    if (config->version)
    {
        printf("hvacmeters: %s\n", VERSION);
        exit(0);
    }

    if (config->need_help)
    {
        printf("hvacmeters version: " VERSION "\n");
        puts(short_manual);
        exit(0);
    }

    if (config->useconfig)
    {
        bool use_stderr = config->use_stderr_for_log;
        string root = config->config_root;
        config = loadConfiguration(root, config->overrides);
        if (!config)
        {
            error("Could not load the configuration from %s\n", root.c_str());
        }
        config->use_stderr_for_log = config->use_stderr_for_log || use_stderr;
        if (config->units_file == "" || config->datadir == "")
        {
            error("(config) units and datadir must both be set\n");
        }
    }

    return start(config.get());
}

void setup_logging(Configuration *config)
{
    if (config->silent) silentLogging(true);
    if (config->verbose) verboseEnabled(true);
    if (config->debug) { verboseEnabled(true); debugEnabled(true); }
    if (config->trace) { verboseEnabled(true); debugEnabled(true); traceEnabled(true); }
    stderrEnabled(useStderrForLog(config));
    setLogTimestamps(config->addtimestamps);

    if (config->use_logfile)
    {
        verbose("(hvacmeters) using log file %s\n", config->logfile.c_str());
        bool ok = enableLogfile(config->logfile);
        if (!ok) {
            error("Could not open log file %s\n", config->logfile.c_str());
        }
    }
    else
    {
        disableLogfile();
    }
}

void log_start_information(Configuration *config)
{
    verbose("(hvacmeters) version: " VERSION "\n");
    if (config->aggregate_file != "")
    {
        verbose("(config) aggregating %s\n", config->aggregate_file.c_str());
        return;
    }
    verbose("(config) units: %s\n", config->units_file.c_str());
    verbose("(config) datadir: %s\n", config->datadir.c_str());
    verbose("(config) outputdir: %s\n", config->outputdir.c_str());
    verbose("(config) availability threshold: %d%%\n", config->pipeline.threshold);
    verbose("(config) default calibration: %g\n", config->pipeline.calibration.default_constant);
    for (auto &p : config->pipeline.calibration.families)
    {
        verbose("(config) calibration %s: %g\n", p.first.c_str(), p.second);
    }
    verbose("(config) workers: %d retries: %d backoff: %dms duplicates: %s\n",
            config->pipeline.workers, config->pipeline.retry.retries,
            config->pipeline.retry.backoff_ms, toString(config->pipeline.duplicates));
}

void log_run_statistics(const PipelineStats &s)
{
    notice("(pipeline) units %d devices %d versions %d selected %d with direct consumption %d\n",
           s.units, s.devices, s.versions, s.versions_selected, s.versions_with_direct);
    notice("(pipeline) direct records %d indirect records %d devices sent to the indirect method %d\n",
           s.direct_records, s.indirect_records, s.indirect_devices);
    verbose("(pipeline) payloads %d measurements %d dropped tokens %d\n",
            s.energy.payloads, s.energy.measurements, s.energy.dropped_tokens);
    verbose("(pipeline) direct hours rejected: unknown device %d outside window %d unavailable %d not positive %d\n",
            s.direct_filter.unknown_device+s.direct_filter.wrong_version, s.direct_filter.outside_window,
            s.direct_filter.unavailable, s.direct_filter.non_positive);
    verbose("(pipeline) indirect hours rejected: outside window %d unavailable %d not positive %d\n",
            s.indirect_filter.outside_window, s.indirect_filter.unavailable, s.indirect_filter.non_positive);
    if (s.energy.discarded_buckets > 0)
    {
        warning("(pipeline) discarded %ld hour buckets beyond 23 from %d device days\n",
                s.energy.discarded_buckets, s.energy.days_beyond_24h);
    }
    if (s.duplicates_dropped > 0)
    {
        notice("(pipeline) dropped %d indirect records overlapping direct records\n", s.duplicates_dropped);
    }
}

int aggregate(Configuration *config, Printer *printer)
{
    vector<ConsumptionRecord> records;
    string err;
    if (!loadConsolidated(config->aggregate_file, config->separator, &records, &err))
    {
        error("(aggregate) %s: %s\n", config->aggregate_file.c_str(), err.c_str());
    }
    verbose("(aggregate) loaded %zu records\n", records.size());

    vector<UnitRollup> rollup = rollupUnits(records);
    vector<UnitSummary> summary = summarizeUnits(rollup);

    bool ok = printer->printRollup(rollup);
    if (ok && printer->filename(SUMMARY_NAME) != "-")
    {
        ok = printer->printUnitHours(aggregateUnitHours(records, config->type_length))
            && printer->printSummary(summary);
    }
    if (!ok) error("(aggregate) could not write the output\n");

    for (auto &s : summary)
    {
        verbose("(aggregate) unit %d: %s kWh over %d days, %d direct and %d indirect rows, %s devices on average\n",
                s.unit_id, formatDecimals(s.consumo_total_kwh, 4).c_str(), s.dias_com_dados,
                s.registros_direto, s.registros_indireto, formatDecimals(s.dispositivos_medio, 2).c_str());
    }
    return 0;
}

int start(Configuration *config)
{
    setup_logging(config);
    log_start_information(config);

    Printer printer(config->format, config->separator, config->outputdir);

    if (config->outputdir != "-" && !checkIfDirExists(config->outputdir.c_str()))
    {
        error("(hvacmeters) output directory %s does not exist\n", config->outputdir.c_str());
    }

    if (config->aggregate_file != "")
    {
        return aggregate(config, &printer);
    }

    vector<FacilityUnit> units;
    string err;
    if (!loadUnits(config->units_file, config->separator, &units, &err))
    {
        error("(roster) %s: %s\n", config->units_file.c_str(), err.c_str());
    }
    if (!checkIfDirExists(config->datadir.c_str()))
    {
        error("(hvacmeters) data directory %s does not exist\n", config->datadir.c_str());
    }

    shared_ptr<QueryExecutor> qe = newFileQueryExecutor(config->datadir);
    AttributionPipeline pipeline(qe.get(), config->pipeline);

    vector<ConsumptionRecord> records;
    PipelineResult result = pipeline.run(units, &records);
    log_run_statistics(pipeline.stats());

    switch (result.type)
    {
    case PipelineResultType::Success:
        break;
    case PipelineResultType::NoDirectConsumption:
        warning("(pipeline) %s, nothing written\n", result.msg.c_str());
        return 2;
    case PipelineResultType::QueryFailed:
        error("(pipeline) query failed: %s\n", result.msg.c_str());
    }

    bool ok = printer.printConsolidated(records);
    if (ok && printer.filename(CONSOLIDATED_NAME) != "-")
    {
        vector<UnitRollup> rollup = rollupUnits(records);
        ok = printer.printUnitHours(aggregateUnitHours(records, config->type_length))
            && printer.printRollup(rollup)
            && printer.printSummary(summarizeUnits(rollup));
    }
    if (!ok) error("(hvacmeters) could not write the output\n");

    return 0;
}
