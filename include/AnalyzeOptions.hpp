/*AnalyzeOptions.hpp*/

#pragma once

#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "Analysis.hpp"  // Default load temperatures

// Command line of the offline analysis tool
struct AnalyzeOptions
{
    std::optional<double> voltage_hot;  // --hot, takes precedence over --hot-file
    std::optional<double> voltage_cold; // --cold, takes precedence over --cold-file
    std::string hot_file;               // Record taken on the hot load
    std::string cold_file;              // Record taken on the cold load
    double t_hot = DEFAULT_HOT_LOAD_K;
    double t_cold = DEFAULT_COLD_LOAD_K;
    std::vector<std::string> files;     // Sky records to fit
    bool show_help = false;
};

// Mean load voltages used for the two-point calibration
struct LoadVoltages
{
    double hot = 0.0;
    double cold = 0.0;
};

// Parse argv. Throws ConfigError on unknown options, missing or non-numeric
// values, a load without a voltage or record, or no sky records.
AnalyzeOptions parse_analyze_command_line(int argc, char **argv);

// Explicit voltages win; otherwise the mean of the load record.
// Throws ConfigError for unreadable records, std::invalid_argument for empty ones.
LoadVoltages resolve_load_voltages(const AnalyzeOptions &options);

void print_analyze_usage(std::ostream &out);
