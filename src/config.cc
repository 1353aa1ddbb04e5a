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

#include"config.h"

#include<vector>
#include<string>
#include<string.h>

using namespace std;

pair<string,string> getNextKeyValue(vector<char> &buf, vector<char>::iterator &i)
{
    bool eof, err;
    string key, value;
    while (i != buf.end() && (*i == '\n' || *i == ' ' || *i == '\t')) i++;
    if (i == buf.end()) return { "", "" };
    if (*i == '#')
    {
        string comment = eatToSkipWhitespace(buf, i, '\n', 4096, &eof, &err);
        return { comment, "" };
    }
    key = eatToSkipWhitespace(buf, i, '=', 4096, &eof, &err);
    if (eof || err) goto nomore;
    value = eatToSkipWhitespace(buf, i, '\n', 4096, &eof, &err);
    if (err) goto nomore;

    return { key, value };

    nomore:

    return { "", "" };
}

void handleLoglevel(Configuration *c, string loglevel)
{
    if (loglevel == "verbose")
    {
        c->silent = false;
        c->verbose = true;
        c->debug = false;
        c->trace = false;
        verboseEnabled(c->verbose);
    }
    else if (loglevel == "debug")
    {
        c->silent = false;
        c->verbose = false;
        c->debug = true;
        c->trace = false;
        // Kick in debug immediately.
        debugEnabled(c->debug);
    }
    else if (loglevel == "trace")
    {
        c->silent = false;
        c->verbose = false;
        c->debug = false;
        c->trace = true;
        // Kick in trace immediately.
        traceEnabled(c->trace);
    }
    else if (loglevel == "silent")
    {
        c->silent = true;
        c->verbose = false;
        c->debug = false;
        c->trace = false;
    }
    else if (loglevel == "normal")
    {
        c->silent = false;
        c->verbose = false;
        c->debug = false;
        c->trace = false;
    }
    else
    {
        warning("(config) no such log level: \"%s\"\n", loglevel.c_str());
    }
}

void handleLogfile(Configuration *c, string logfile)
{
    if (logfile.length() > 0)
    {
        c->use_logfile = true;
        c->logfile = logfile;
    }
}

void handleLogTimestamps(Configuration *c, string ts)
{
    if (ts == "never")
    {
        c->addtimestamps = AddLogTimestamps::Never;
    }
    else if (ts == "always")
    {
        c->addtimestamps = AddLogTimestamps::Always;
    }
    else if (ts == "important")
    {
        c->addtimestamps = AddLogTimestamps::Important;
    }
    else
    {
        warning("(config) no such timestamp setting \"%s\" possible values are: never always important\n",
                ts.c_str());
    }
}

void handleFormat(Configuration *c, string format)
{
    if (format == "csv")
    {
        c->format = OutputFormat::CSV;
    }
    else if (format == "json")
    {
        c->format = OutputFormat::JSON;
    }
    else
    {
        warning("(config) unknown output format: \"%s\"\n", format.c_str());
    }
}

void handleSeparator(Configuration *c, string s)
{
    if (s.length() == 1 && s[0] != '"') {
        c->separator = s[0];
    } else {
        warning("(config) separator must be a single character.\n");
    }
}

static bool parseRange(string s, int lo, int hi, int *out)
{
    int v = 0;
    if (!parseInt(s, &v)) return false;
    if (v < lo || v > hi) return false;
    *out = v;
    return true;
}

void handleThreshold(Configuration *c, string s)
{
    if (!parseRange(s, 0, 100, &c->pipeline.threshold))
    {
        warning("(config) threshold must be a percentage 0-100, not \"%s\"\n", s.c_str());
    }
}

void handleCalibration(Configuration *c, string s)
{
    string family;
    string value = s;
    size_t p = s.find('=');
    if (p != string::npos)
    {
        family = s.substr(0, p);
        value = s.substr(p+1);
        trimWhitespace(&family);
        trimWhitespace(&value);
    }
    double k = 0;
    if (!parseDouble(value, &k) || k <= 0)
    {
        warning("(config) not a valid calibration constant \"%s\"\n", s.c_str());
        return;
    }
    if (family == "")
    {
        c->pipeline.calibration.default_constant = k;
        debug("(config) default calibration %g\n", k);
    }
    else
    {
        c->pipeline.calibration.set(family, k);
        debug("(config) calibration for %s is %g\n", family.c_str(), k);
    }
}

void handleWorkers(Configuration *c, string s)
{
    if (!parseRange(s, 1, 64, &c->pipeline.workers))
    {
        warning("(config) workers must be 1-64, not \"%s\"\n", s.c_str());
    }
}

bool useStderrForLog(Configuration *c)
{
    return c->use_stderr_for_log || c->outputdir == "" || c->outputdir == "-";
}

void handleRetries(Configuration *c, string s)
{
    if (!parseRange(s, 0, 100, &c->pipeline.retry.retries))
    {
        warning("(config) retries must be 0-100, not \"%s\"\n", s.c_str());
    }
}

void handleBackoff(Configuration *c, string s)
{
    int ms = parseTimeMillis(s);
    if (ms < 0)
    {
        warning("(config) not a valid backoff time \"%s\"\n", s.c_str());
        return;
    }
    c->pipeline.retry.backoff_ms = ms;
}

void handleDuplicates(Configuration *c, string s)
{
    if (!toDuplicatePolicy(s, &c->pipeline.duplicates))
    {
        warning("(config) duplicates must be preferdirect or keepboth, not \"%s\"\n", s.c_str());
    }
}

void handleVersionLength(Configuration *c, string s)
{
    if (!parseRange(s, 1, 64, &c->pipeline.version_length))
    {
        warning("(config) versionlength must be 1-64, not \"%s\"\n", s.c_str());
    }
}

void handleTypeLength(Configuration *c, string s)
{
    if (!parseRange(s, 1, 64, &c->type_length))
    {
        warning("(config) typelength must be 1-64, not \"%s\"\n", s.c_str());
    }
}

void handleIgnoreMarker(Configuration *c, string s)
{
    if (s.length() == 1 && s[0] != ',') {
        c->pipeline.ignore_marker = s[0];
    } else {
        warning("(config) ignoremarker must be a single character other than comma.\n");
    }
}

void parseConfig(Configuration *c, vector<char> &buf, string file)
{
    auto i = buf.begin();

    for (;;) {
        auto p = getNextKeyValue(buf, i);

        debug("(config) \"%s\" \"%s\"\n", p.first.c_str(), p.second.c_str());
        if (p.first == "") break;
        // If the key starts with # then the line is a comment. Ignore it.
        if (p.first.length() > 0 && p.first[0] == '#') continue;
        if (p.first == "loglevel") handleLoglevel(c, p.second);
        else if (p.first == "logfile") handleLogfile(c, p.second);
        else if (p.first == "logtimestamps") handleLogTimestamps(c, p.second);
        else if (p.first == "units") c->units_file = p.second;
        else if (p.first == "datadir") c->datadir = p.second;
        else if (p.first == "outputdir") c->outputdir = p.second;
        else if (p.first == "format") handleFormat(c, p.second);
        else if (p.first == "separator") handleSeparator(c, p.second);
        else if (p.first == "threshold") handleThreshold(c, p.second);
        else if (p.first == "calibration") handleCalibration(c, p.second);
        else if (p.first == "versionlength") handleVersionLength(c, p.second);
        else if (p.first == "typelength") handleTypeLength(c, p.second);
        else if (p.first == "ignoremarker") handleIgnoreMarker(c, p.second);
        else if (p.first == "workers") handleWorkers(c, p.second);
        else if (p.first == "retries") handleRetries(c, p.second);
        else if (p.first == "backoff") handleBackoff(c, p.second);
        else if (p.first == "duplicates") handleDuplicates(c, p.second);
        else if (startsWith(p.first, "calibration_"))
        {
            string keyvalue = p.first.substr(12)+"="+p.second;
            handleCalibration(c, keyvalue);
        }
        else
        {
            warning("(config) no such key in %s: %s\n", file.c_str(), p.first.c_str());
        }
    }
}

shared_ptr<Configuration> loadConfiguration(string root, ConfigOverrides overrides)
{
    shared_ptr<Configuration> c = shared_ptr<Configuration>(new Configuration);
    c->useconfig = true;
    c->config_root = root;

    vector<char> global_conf;

    // --useconfig=/ will find /etc/hvacmeters.conf
    // If there is no root/etc/hvacmeters.conf then it will look for root/hvacmeters.conf
    string conf_file = root+"/etc/hvacmeters.conf";

    if (!checkFileExists(conf_file.c_str()))
    {
        conf_file = root+"/hvacmeters.conf";
    }

    debug("(config) loading %s\n", conf_file.c_str());
    bool ok = loadFile(conf_file, &global_conf);
    if (!ok)
    {
        warning("(config) could not read %s\n", conf_file.c_str());
        return shared_ptr<Configuration>();
    }
    global_conf.push_back('\n');

    parseConfig(c.get(), global_conf, conf_file);

    if (overrides.units_override != "")
    {
        debug("(config) overriding units with \"%s\"\n", overrides.units_override.c_str());
        c->units_file = overrides.units_override;
    }
    if (overrides.datadir_override != "")
    {
        debug("(config) overriding datadir with \"%s\"\n", overrides.datadir_override.c_str());
        c->datadir = overrides.datadir_override;
    }
    if (overrides.outputdir_override != "")
    {
        debug("(config) overriding outputdir with \"%s\"\n", overrides.outputdir_override.c_str());
        c->outputdir = overrides.outputdir_override;
    }
    if (overrides.workers_override != "")
    {
        debug("(config) overriding workers with %s\n", overrides.workers_override.c_str());
        handleWorkers(c.get(), overrides.workers_override);
    }
    if (overrides.loglevel_override != "")
    {
        debug("(config) overriding loglevel with %s\n", overrides.loglevel_override.c_str());
        handleLoglevel(c.get(), overrides.loglevel_override);
    }
    if (overrides.logfile_override != "")
    {
        debug("(config) overriding logfile with %s\n", overrides.logfile_override.c_str());
        handleLogfile(c.get(), overrides.logfile_override);
    }
    c->overrides = overrides;

    return c;
}
