/*AnalyzeOptions.cpp*/

#include "AnalyzeOptions.hpp"
#include "Faults.hpp"
#include "RecordReader.hpp"
#include "RunConfig.hpp"  // parse_double_option

AnalyzeOptions parse_analyze_command_line(int argc, char **argv)
{
    AnalyzeOptions options;

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
            options.show_help = true;
            return options;
        }
        else if (arg == "--hot")
            options.voltage_hot = parse_double_option(arg, next_value());
        else if (arg == "--cold")
            options.voltage_cold = parse_double_option(arg, next_value());
        else if (arg == "--hot-file")
            options.hot_file = next_value();
        else if (arg == "--cold-file")
            options.cold_file = next_value();
        else if (arg == "--t-hot")
            options.t_hot = parse_double_option(arg, next_value());
        else if (arg == "--t-cold")
            options.t_cold = parse_double_option(arg, next_value());
        else if (!arg.empty() && arg[0] == '-')
            throw ConfigError("unknown argument: " + arg);
        else
            options.files.push_back(arg);
    }

    if (!options.voltage_hot && options.hot_file.empty())
        throw ConfigError("hot load needs --hot or --hot-file");
    if (!options.voltage_cold && options.cold_file.empty())
        throw ConfigError("cold load needs --cold or --cold-file");
    if (options.files.empty())
        throw ConfigError("no sky records given");

    return options;
}

LoadVoltages resolve_load_voltages(const AnalyzeOptions &options)
{
    auto load_voltage = [](const std::optional<double> &explicit_value, const std::string &file)
    {
        if (explicit_value)
            return *explicit_value;
        return mean_value(read_record_file(file).samples);
    };

    LoadVoltages loads;
    loads.hot = load_voltage(options.voltage_hot, options.hot_file);
    loads.cold = load_voltage(options.voltage_cold, options.cold_file);
    return loads;
}

void print_analyze_usage(std::ostream &out)
{
    out << "cmb_analyze usage:\n"
        << "  cmb_analyze (--hot V | --hot-file REC) (--cold V | --cold-file REC) [--t-hot K] [--t-cold K] record.txt...\n\n"
        << "  --hot V          Mean voltage read on the hot load\n"
        << "  --hot-file REC   Record taken on the hot load; its mean is used\n"
        << "  --cold V         Mean voltage read on the cold load\n"
        << "  --cold-file REC  Record taken on the cold load; its mean is used\n"
        << "  --t-hot K        Hot load temperature (default " << DEFAULT_HOT_LOAD_K << ")\n"
        << "  --t-cold K       Cold load temperature (default " << DEFAULT_COLD_LOAD_K << ")\n";
}
