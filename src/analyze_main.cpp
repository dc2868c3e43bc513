/* analyze_main.cpp */

#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include "Common.hpp"
#include "Faults.hpp"
#include "Analysis.hpp"
#include "RecordReader.hpp"
#include "AnalyzeOptions.hpp"

int main(int argc, char **argv)
{
    AnalyzeOptions options;
    try
    {
        options = parse_analyze_command_line(argc, argv);
    }
    catch (const ConfigError &e)
    {
        std::cerr << "Configuration error: " << e.what() << "\n\n";
        print_analyze_usage(std::cerr);
        return EXIT_CONFIG_ERROR;
    }

    if (options.show_help)
    {
        print_analyze_usage(std::cout);
        return EXIT_RUN_COMPLETED;
    }

    try
    {
        const LoadVoltages loads = resolve_load_voltages(options);
        std::cout << "Hot load: " << loads.hot << " V, cold load: " << loads.cold << " V\n";

        const TemperatureCalibration cal = two_point_calibration(loads.hot, loads.cold, options.t_hot, options.t_cold);
        std::cout << "Calibration: T = " << cal.a << " * V + " << cal.b << "\n\n";

        std::vector<double> angles;
        std::vector<double> temperatures;
        for (const auto &file : options.files)
        {
            RecordFile record = read_record_file(file);
            const double angle = record.azimuth_deg - 90.0;
            const double voltage = mean_value(record.samples);
            const double temperature = voltage_to_temperature(voltage, cal);

            std::cout << std::left << std::setw(50) << file
                      << " angle " << std::setw(10) << angle
                      << " mean " << std::setw(14) << voltage
                      << " T " << temperature << " K\n";

            angles.push_back(angle);
            temperatures.push_back(temperature);
        }

        const CmbFit fit = fit_cmb_temperature(angles, temperatures);
        std::cout << std::fixed << std::setprecision(2)
                  << "\nEstimated CMB Temperature: " << fit.t_cmb << " K\n"
                  << "Estimated Vertical Temperature Contribution: " << fit.t_vertical << " K\n";
    }
    catch (const ConfigError &e)
    {
        std::cerr << "Record error: " << e.what() << "\n";
        return EXIT_CONFIG_ERROR;
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << "Analysis failed: " << e.what() << "\n";
        return EXIT_RUN_ABORTED;
    }

    return EXIT_RUN_COMPLETED;
}
