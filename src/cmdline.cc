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

#include"cmdline.h"
#include"util.h"

#include<string>
#include<string.h>

using namespace std;

static bool checkIfUseConfig(int argc, char **argv);
static shared_ptr<Configuration> parseNormalCommandLine(Configuration *c, int argc, char **argv);
static shared_ptr<Configuration> parseCommandLineWithUseConfig(Configuration *c, int argc, char **argv);

shared_ptr<Configuration> parseCommandLine(int argc, char **argv)
{
    Configuration * c = new Configuration;

    if (argc < 2)
    {
        c->need_help = true;
        return shared_ptr<Configuration>(c);
    }

    if (checkIfUseConfig(argc, argv))
    {
        return parseCommandLineWithUseConfig(c, argc, argv);
    }

    return parseNormalCommandLine(c, argc, argv);
}

void enableEarlyLoggingFromCommandLine(int argc, char **argv)
{
    int i = 1;
    // First find all logging flags, --silent --verbose --normal --debug
    while (argv[i] && argv[i][0] == '-')
    {
        if (!strcmp(argv[i], "--silent")) {
            i++;
            silentLogging(true);
            continue;
        }
        if (!strcmp(argv[i], "--verbose")) {
            verboseEnabled(true);
            i++;
            continue;
        }
        if (!strcmp(argv[i], "--debug")) {
            verboseEnabled(true);
            debugEnabled(true);
            i++;
            continue;
        }
        if (!strcmp(argv[i], "--trace")) {
            verboseEnabled(true);
            debugEnabled(true);
            traceEnabled(true);
            i++;
            continue;
        }
        i++;
    }
}

// Match --name=value and return the value, or NULL.
static const char *flagValue(const char *arg, const char *name)
{
    size_t len = strlen(name);
    if (strncmp(arg, name, len)) return NULL;
    if (strlen(arg) == len)
    {
        error("Usage error: %s needs a value\n", name);
    }
    return arg+len;
}

static shared_ptr<Configuration> parseNormalCommandLine(Configuration *c, int argc, char **argv)
{
    int i = 1;
    const char *v = NULL;
    while (argv[i] && argv[i][0] == '-')
    {
        if (!strcmp(argv[i], "--silent")) {
            c->silent = true;
            i++;
            silentLogging(true);
            continue;
        }
        if (!strcmp(argv[i], "--verbose")) {
            c->verbose = true;
            verboseEnabled(true);
            i++;
            continue;
        }
        if (!strcmp(argv[i], "--normal")) {
            c->silent = false;
            c->verbose = false;
            c->debug = false;
            c->trace = false;
            i++;
            continue;
        }
        if (!strcmp(argv[i], "--debug")) {
            c->debug = true;
            verboseEnabled(true);
            debugEnabled(true);
            i++;
            continue;
        }
        if (!strcmp(argv[i], "--trace")) {
            c->debug = true;
            c->trace = true;
            verboseEnabled(true);
            debugEnabled(true);
            traceEnabled(true);
            i++;
            continue;
        }
        if (!strcmp(argv[i], "--version")) {
            c->version = true;
            i++;
            return shared_ptr<Configuration>(c);
        }
        if (!strcmp(argv[i], "-h") || !strcmp(argv[i], "--help")) {
            c->need_help = true;
            i++;
            return shared_ptr<Configuration>(c);
        }
        if (!strcmp(argv[i], "--logtostderr")) {
            c->use_stderr_for_log = true;
            i++;
            continue;
        }
        if ((v = flagValue(argv[i], "--logfile=")) != NULL) {
            handleLogfile(c, v);
            i++;
            continue;
        }
        if ((v = flagValue(argv[i], "--logtimestamps=")) != NULL) {
            handleLogTimestamps(c, v);
            i++;
            continue;
        }
        if ((v = flagValue(argv[i], "--units=")) != NULL) {
            c->units_file = v;
            i++;
            continue;
        }
        if ((v = flagValue(argv[i], "--datadir=")) != NULL) {
            c->datadir = v;
            i++;
            continue;
        }
        if ((v = flagValue(argv[i], "--outputdir=")) != NULL) {
            c->outputdir = v;
            i++;
            continue;
        }
        if ((v = flagValue(argv[i], "--aggregate=")) != NULL) {
            c->aggregate_file = v;
            i++;
            continue;
        }
        if ((v = flagValue(argv[i], "--format=")) != NULL) {
            handleFormat(c, v);
            i++;
            continue;
        }
        if ((v = flagValue(argv[i], "--separator=")) != NULL) {
            handleSeparator(c, v);
            i++;
            continue;
        }
        if ((v = flagValue(argv[i], "--threshold=")) != NULL) {
            handleThreshold(c, v);
            i++;
            continue;
        }
        if ((v = flagValue(argv[i], "--calibration=")) != NULL) {
            handleCalibration(c, v);
            i++;
            continue;
        }
        if ((v = flagValue(argv[i], "--versionlength=")) != NULL) {
            handleVersionLength(c, v);
            i++;
            continue;
        }
        if ((v = flagValue(argv[i], "--typelength=")) != NULL) {
            handleTypeLength(c, v);
            i++;
            continue;
        }
        if ((v = flagValue(argv[i], "--ignoremarker=")) != NULL) {
            handleIgnoreMarker(c, v);
            i++;
            continue;
        }
        if ((v = flagValue(argv[i], "--workers=")) != NULL) {
            handleWorkers(c, v);
            i++;
            continue;
        }
        if ((v = flagValue(argv[i], "--retries=")) != NULL) {
            handleRetries(c, v);
            i++;
            continue;
        }
        if ((v = flagValue(argv[i], "--backoff=")) != NULL) {
            if (parseTimeMillis(v) < 0) {
                error("Not a valid backoff time \"%s\"\n", v);
            }
            handleBackoff(c, v);
            i++;
            continue;
        }
        if ((v = flagValue(argv[i], "--duplicates=")) != NULL) {
            handleDuplicates(c, v);
            i++;
            continue;
        }
        error("Unknown option \"%s\"\n", argv[i]);
    }

    // The unit roster and the data directory can also be given without flags.
    if (argv[i])
    {
        c->units_file = argv[i];
        i++;
    }
    if (argv[i])
    {
        c->datadir = argv[i];
        i++;
    }
    if (i < argc)
    {
        error("Usage error: too many arguments \"%s\"\n", argv[i]);
    }

    if (c->aggregate_file == "" && (c->units_file == "" || c->datadir == ""))
    {
        error("Usage error: supply both the unit roster and the data directory, or --aggregate=file\n");
    }
    return shared_ptr<Configuration>(c);
}

static shared_ptr<Configuration> parseCommandLineWithUseConfig(Configuration *c, int argc, char **argv)
{
    int i = 1;
    const char *v = NULL;

    while (argv[i] && argv[i][0] == '-')
    {
        if (!strncmp(argv[i], "--useconfig", 11))
        {
            if (strlen(argv[i]) == 11)
            {
                c->useconfig = true;
                c->config_root = "";
            }
            else if (strlen(argv[i]) > 12 && argv[i][11] == '=')
            {
                size_t len = strlen(argv[i]) - 12;
                c->useconfig = true;
                c->config_root = string(argv[i]+12, len);
                if (c->config_root == "/") {
                    c->config_root = "";
                }
            }
            else
            {
                error("You must supply a directory to --useconfig=dir\n");
            }
            i++;
            continue;
        }
        if (!strcmp(argv[i], "--verbose") || !strcmp(argv[i], "--normal") || !strcmp(argv[i], "--silent") ||
            !strcmp(argv[i], "--debug") || !strcmp(argv[i], "--trace"))
        {
            c->overrides.loglevel_override = string(argv[i]+2);
            debug("(useconfig) loglevel override \"%s\"\n", c->overrides.loglevel_override.c_str());
            i++;
            continue;
        }
        if (!strcmp(argv[i], "--logtostderr")) {
            c->use_stderr_for_log = true;
            i++;
            continue;
        }
        if ((v = flagValue(argv[i], "--units=")) != NULL)
        {
            c->overrides.units_override = v;
            debug("(useconfig) units override \"%s\"\n", v);
            i++;
            continue;
        }
        if ((v = flagValue(argv[i], "--datadir=")) != NULL)
        {
            c->overrides.datadir_override = v;
            debug("(useconfig) datadir override \"%s\"\n", v);
            i++;
            continue;
        }
        if ((v = flagValue(argv[i], "--outputdir=")) != NULL)
        {
            c->overrides.outputdir_override = v;
            debug("(useconfig) outputdir override \"%s\"\n", v);
            i++;
            continue;
        }
        if ((v = flagValue(argv[i], "--workers=")) != NULL)
        {
            c->overrides.workers_override = v;
            debug("(useconfig) workers override \"%s\"\n", v);
            i++;
            continue;
        }
        if ((v = flagValue(argv[i], "--logfile=")) != NULL)
        {
            c->overrides.logfile_override = v;
            i++;
            continue;
        }

        error("Usage error: --useconfig=... can only be used in combination with:\n"
              "--units= --datadir= --outputdir= --workers= --logfile= --logtostderr --silent --normal --verbose --debug --trace\n");
        break;
    }

    if (i < argc)
    {
        error("Usage error: too many arguments \"%s\" with --useconfig=...\n", argv[i]);
    }
    return shared_ptr<Configuration>(c);
}

static bool checkIfUseConfig(int argc, char **argv)
{
    while (*argv != NULL)
    {
        if (!strncmp(*argv, "--useconfig", 11)) return true;
        argv++;
    }

    return false;
}
