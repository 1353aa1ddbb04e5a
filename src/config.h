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

#ifndef CONFIG_H
#define CONFIG_H

#include"aggregation.h"
#include"attribution.h"
#include"util.h"

#include<memory>
#include<string>
#include<vector>

using namespace std;

enum class OutputFormat
{
    CSV, JSON
};

// These values can be overridden from the command line.
struct ConfigOverrides
{
    std::string loglevel_override;
    std::string logfile_override;
    std::string units_override;
    std::string datadir_override;
    std::string outputdir_override;
    std::string workers_override;
};

struct Configuration
{
    ConfigOverrides overrides;
    bool useconfig {};
    std::string config_root;
    bool need_help {};
    bool silent {};
    bool verbose {};
    bool version {};
    bool debug {};
    bool trace {};
    AddLogTimestamps addtimestamps {};
    bool use_logfile {};
    bool use_stderr_for_log {}; // Otherwise log on stdout, unless the tables are printed there.
    std::string logfile;
    std::string units_file; // The unit roster csv.
    std::string datadir; // Directory with the csv files answering the queries.
    std::string outputdir {"-"}; // - means print on stdout.
    std::string aggregate_file; // Only aggregate this consolidated csv.
    OutputFormat format {};
    char separator { ',' };
    int type_length {DEFAULT_TYPE_LENGTH};
    PipelineSettings pipeline;
    ~Configuration() = default;
};

// Load root/etc/hvacmeters.conf or root/hvacmeters.conf.
// Returns an empty pointer if no configuration file could be read.
shared_ptr<Configuration> loadConfiguration(string root, ConfigOverrides overrides);

// Log lines go to stderr when asked for, or when the tables are printed
// on stdout, so they never end up among the records.
bool useStderrForLog(Configuration *c);

// Parse key=value lines, # starts a comment. Unknown keys and bad values give warnings.
void parseConfig(Configuration *c, vector<char> &buf, string file);

void handleLoglevel(Configuration *c, string loglevel);
void handleLogfile(Configuration *c, string logfile);
void handleLogTimestamps(Configuration *c, string ts);
void handleFormat(Configuration *c, string format);
void handleSeparator(Configuration *c, string s);
void handleThreshold(Configuration *c, string s);
// Either a plain constant 310.86 or FAMILY=constant.
void handleCalibration(Configuration *c, string s);
void handleWorkers(Configuration *c, string s);
void handleRetries(Configuration *c, string s);
void handleBackoff(Configuration *c, string s);
void handleDuplicates(Configuration *c, string s);
void handleVersionLength(Configuration *c, string s);
void handleTypeLength(Configuration *c, string s);
void handleIgnoreMarker(Configuration *c, string s);

#endif
