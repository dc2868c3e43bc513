/*RunConfig.hpp*/

#pragma once

#include <iosfwd>
#include <string>
#include <vector>

#include "Common.hpp"  // Defaults and AcquisitionSettings

// How the run obtains its calibration value
struct CalibrationMode
{
    enum class Kind
    {
        None,   // Ask the operator
        Fixed,  // Use the configured value
        Auto    // Reuse the instrument's current calibration when valid
    };

    Kind kind = Kind::None;
    double value = 0.0; // Only meaningful for Kind::Fixed

    static CalibrationMode none() { return {Kind::None, 0.0}; }
    static CalibrationMode fixed(double v) { return {Kind::Fixed, v}; }
    static CalibrationMode automatic() { return {Kind::Auto, 0.0}; }
};

// Experiment metadata for one run; built once per invocation and never mutated
struct RunConfiguration
{
    double temperature_c = 0.0;
    std::string weather = DEFAULT_WEATHER;
    double azimuth_deg = 0.0;    // From horizontal, parallel to the supporting axis
    double elevation_deg = 0.0;  // From horizontal, perpendicular to the supporting axis
    double duration_s = DEFAULT_DURATION_S;
    CalibrationMode calibration;
    std::string pointing;        // Empty: derived from calibrator_in_view
    bool calibrator_in_view = false;
    std::string calibrator_temperature = DEFAULT_CALIBRATOR_TEMPERATURE;
    std::string units = DEFAULT_UNITS;
    std::string output_prefix = DEFAULT_OUTPUT_PREFIX;
    std::string output_suffix = DEFAULT_OUTPUT_SUFFIX;
};

// Everything the cmb_daq command line can set
struct CommandLine
{
    RunConfiguration config;
    AcquisitionSettings acquisition;
    bool assume_yes = false;
    bool show_help = false;
};

// Parse a whole option value as a number. Throws ConfigError on trailing text.
double parse_double_option(const std::string &option, const std::string &text);

// Parse "none"/"prompt", "auto", "fixed:<v>" or a bare number
CalibrationMode parse_calibration_mode(const std::string &text);

// Human readable mode, e.g. "fixed (0.0125)"
std::string to_string(const CalibrationMode &mode);

// Where the horn is pointing: the configured text, else derived from the calibrator flag
std::string pointing_description(const RunConfiguration &config);

// Throw ConfigError if any invariant of the configuration is violated
void validate_config(const RunConfiguration &config);

// Throw ConfigError for front-end settings the hardware cannot honour
void validate_acquisition_settings(const AcquisitionSettings &settings);

// Build the command line state from argv; validates before returning
CommandLine parse_command_line(int argc, char **argv);

// Print the cmb_daq option summary
void print_usage(std::ostream &out);

// Header lines describing the configured experiment, without the leading "# "
std::vector<std::string> describe_configuration(const RunConfiguration &config);
