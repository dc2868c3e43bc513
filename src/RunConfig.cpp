/*RunConfig.cpp*/

#include "RunConfig.hpp"
#include "Faults.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <iterator>
#include <sstream>

namespace
{
    std::string to_lower(std::string text)
    {
        std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return text;
    }

    long parse_integer(const std::string &option, const std::string &text)
    {
        try
        {
            std::size_t used = 0;
            long value = std::stol(text, &used);
            if (used != text.size())
                throw ConfigError(option + ": not an integer: '" + text + "'");
            return value;
        }
        catch (const std::invalid_argument &)
        {
            throw ConfigError(option + ": not an integer: '" + text + "'");
        }
        catch (const std::out_of_range &)
        {
            throw ConfigError(option + ": value out of range: '" + text + "'");
        }
    }

    bool ends_with(const std::string &text, const std::string &tail)
    {
        return text.size() >= tail.size() &&
               text.compare(text.size() - tail.size(), tail.size(), tail) == 0;
    }

    template <typename T>
    std::string format_value(const T &value)
    {
        std::ostringstream out;
        out << value;
        return out.str();
    }
}

// Whole-string numeric conversion; trailing garbage is an error
double parse_double_option(const std::string &option, const std::string &text)
{
    try
    {
        std::size_t used = 0;
        double value = std::stod(text, &used);
        if (used != text.size())
            throw ConfigError(option + ": not a number: '" + text + "'");
        return value;
    }
    catch (const std::invalid_argument &)
    {
        throw ConfigError(option + ": not a number: '" + text + "'");
    }
    catch (const std::out_of_range &)
    {
        throw ConfigError(option + ": value out of range: '" + text + "'");
    }
}

// Parse a calibration mode from its command line spelling
CalibrationMode parse_calibration_mode(const std::string &text)
{
    const std::string mode = to_lower(text);

    if (mode == "none" || mode == "prompt")
        return CalibrationMode::none();
    if (mode == "auto")
        return CalibrationMode::automatic();

    const std::string fixed_prefix = "fixed:";
    if (mode.compare(0, fixed_prefix.size(), fixed_prefix) == 0)
        return CalibrationMode::fixed(parse_double_option("--calibration", text.substr(fixed_prefix.size())));

    // A bare number is shorthand for fixed:<number>
    return CalibrationMode::fixed(parse_double_option("--calibration", text));
}

std::string to_string(const CalibrationMode &mode)
{
    switch (mode.kind)
    {
    case CalibrationMode::Kind::None:
        return "prompt";
    case CalibrationMode::Kind::Fixed:
        return "fixed (" + format_value(mode.value) + ")";
    case CalibrationMode::Kind::Auto:
        return "auto";
    }
    return "unknown";
}

std::string pointing_description(const RunConfiguration &config)
{
    if (!config.pointing.empty())
        return config.pointing;
    return config.calibrator_in_view ? "Calibrator paddle" : "Sky";
}

// Check every configuration invariant before any hardware access
void validate_config(const RunConfiguration &config)
{
    if (!std::isfinite(config.duration_s) || config.duration_s <= 0.0)
        throw ConfigError("duration must be a positive number of seconds");

    if (!std::isfinite(config.azimuth_deg) || config.azimuth_deg < 0.0 || config.azimuth_deg >= 360.0)
        throw ConfigError("azimuth must be within [0, 360) degrees");

    if (!std::isfinite(config.elevation_deg) || config.elevation_deg < -90.0 || config.elevation_deg > 90.0)
        throw ConfigError("elevation must be within [-90, 90] degrees");

    if (!std::isfinite(config.temperature_c))
        throw ConfigError("temperature must be a finite number");

    if (config.calibration.kind == CalibrationMode::Kind::Fixed && !std::isfinite(config.calibration.value))
        throw ConfigError("fixed calibration value must be finite");

    if (config.weather.find('\n') != std::string::npos ||
        config.pointing.find('\n') != std::string::npos ||
        config.calibrator_temperature.find('\n') != std::string::npos ||
        config.units.find('\n') != std::string::npos)
        throw ConfigError("header fields must fit on a single line");

    if (config.output_prefix.empty())
        throw ConfigError("output prefix must not be empty");

    if (!ends_with(config.output_suffix, ".txt"))
        throw ConfigError("output suffix must end with .txt");
}

void validate_acquisition_settings(const AcquisitionSettings &settings)
{
    if (settings.input_channel != 1 && settings.input_channel != 2)
        throw ConfigError("input channel must be 1 or 2");

    static const uint32_t supported[] = {1, 8, 64, 1024, 8192, 65536};
    if (std::find(std::begin(supported), std::end(supported), settings.decimation) == std::end(supported))
        throw ConfigError("decimation must be one of 1, 8, 64, 1024, 8192, 65536");

    if (settings.trigger_timeout_ms <= 0)
        throw ConfigError("trigger timeout must be positive");

    if (settings.calibration_cache.empty())
        throw ConfigError("calibration cache path must not be empty");
}

// Parse argv into a validated CommandLine
CommandLine parse_command_line(int argc, char **argv)
{
    CommandLine cli;
    RunConfiguration &config = cli.config;
    AcquisitionSettings &acq = cli.acquisition;

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];

        auto next_value = [&]() -> std::string
        {
            if (i + 1 >= argc)
                throw ConfigError(arg + ": missing value");
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h")
        {
            cli.show_help = true;
            return cli;
        }
        else if (arg == "--yes" || arg == "-y")
            cli.assume_yes = true;
        else if (arg == "--temperature")
            config.temperature_c = parse_double_option(arg, next_value());
        else if (arg == "--weather")
            config.weather = next_value();
        else if (arg == "--azimuth")
            config.azimuth_deg = parse_double_option(arg, next_value());
        else if (arg == "--elevation")
            config.elevation_deg = parse_double_option(arg, next_value());
        else if (arg == "--duration")
            config.duration_s = parse_double_option(arg, next_value());
        else if (arg == "--calibration")
            config.calibration = parse_calibration_mode(next_value());
        else if (arg == "--calibrator")
            config.calibrator_in_view = true;
        else if (arg == "--pointing")
            config.pointing = next_value();
        else if (arg == "--calibrator-temperature")
            config.calibrator_temperature = next_value();
        else if (arg == "--units")
            config.units = next_value();
        else if (arg == "--prefix")
            config.output_prefix = next_value();
        else if (arg == "--suffix")
            config.output_suffix = next_value();
        else if (arg == "--channel")
            acq.input_channel = static_cast<int>(parse_integer(arg, next_value()));
        else if (arg == "--hv")
            acq.high_voltage_range = true;
        else if (arg == "--decimation")
        {
            long decimation = parse_integer(arg, next_value());
            if (decimation <= 0)
                throw ConfigError("decimation must be positive");
            acq.decimation = static_cast<uint32_t>(decimation);
        }
        else if (arg == "--trigger-timeout")
            acq.trigger_timeout_ms = static_cast<int>(parse_integer(arg, next_value()));
        else if (arg == "--calibration-cache")
            acq.calibration_cache = next_value();
        else
            throw ConfigError("unknown argument: " + arg);
    }

    validate_config(config);
    validate_acquisition_settings(acq);
    return cli;
}

void print_usage(std::ostream &out)
{
    out << "cmb_daq usage:\n"
        << "  cmb_daq [options]\n\n"
        << "Experiment header:\n"
        << "  --temperature C             Outside temperature in Celsius (default 0)\n"
        << "  --weather TEXT              Weather description (default \"" << DEFAULT_WEATHER << "\")\n"
        << "  --azimuth DEG               Angle parallel to the supporting axis, [0, 360)\n"
        << "  --elevation DEG             Angle perpendicular to the supporting axis, [-90, 90]\n"
        << "  --duration S                Acquisition window in seconds (default " << DEFAULT_DURATION_S << ")\n"
        << "  --calibration MODE          prompt | auto | fixed:<volts> (default prompt)\n"
        << "  --calibrator                Calibrator paddle is in front of the horn\n"
        << "  --pointing TEXT             Pointing description (default \"Sky\", or \"Calibrator paddle\" with --calibrator)\n"
        << "  --calibrator-temperature T  Calibrator temperature label (default \"" << DEFAULT_CALIBRATOR_TEMPERATURE << "\")\n"
        << "  --units TEXT                Sample units (default \"" << DEFAULT_UNITS << "\")\n"
        << "  --prefix PATH               Record path prefix (default \"" << DEFAULT_OUTPUT_PREFIX << "\")\n"
        << "  --suffix TEXT               Record file suffix, must end in .txt (default \"" << DEFAULT_OUTPUT_SUFFIX << "\")\n\n"
        << "Front end:\n"
        << "  --channel 1|2               Fast analog input (default " << DEFAULT_INPUT_CHANNEL << ")\n"
        << "  --hv                        Inputs jumpered for the +/-20 V range\n"
        << "  --decimation N              1, 8, 64, 1024, 8192 or 65536 (default " << DEFAULT_DECIMATION << ")\n"
        << "  --trigger-timeout MS        Per-reading trigger timeout (default " << DEFAULT_TRIGGER_TIMEOUT_MS << ")\n"
        << "  --calibration-cache PATH    Stored calibration offset (default \"" << CALIBRATION_CACHE_FILE << "\")\n\n"
        << "  -y, --yes                   Do not ask for header confirmation\n"
        << "  -h, --help                  Show this message\n";
}

// Header lines shared by the confirmation prompt and the record file
std::vector<std::string> describe_configuration(const RunConfiguration &config)
{
    return {
        "Duration (in s): " + format_value(config.duration_s),
        "Pointing Position of the Horn: " + pointing_description(config),
        "Angle pointing (from horizontal perpendicular to supporting axis): " + format_value(config.elevation_deg),
        "Angle pointing (from horizontal parallel to supporting axis): " + format_value(config.azimuth_deg),
        std::string("Calibrator used: ") + (config.calibrator_in_view ? "YES" : "NO"),
        "Temperature Outside (in celsius): " + format_value(config.temperature_c),
        "Temperature of the calibrator (in celsius): " + config.calibrator_temperature,
        "Weather: " + config.weather,
        "Units: " + config.units,
    };
}
