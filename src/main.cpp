/* main.cpp */

#include <iostream>
#include <chrono>

#include "rp.h"
#include "Common.hpp"
#include "Faults.hpp"
#include "RunConfig.hpp"
#include "SystemUtils.hpp"
#include "OperatorConsole.hpp"
#include "DataWriter.hpp"
#include "RunPipeline.hpp"
#include "ADC.hpp"

namespace
{
    uint64_t steady_ns()
    {
        return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
                                         std::chrono::steady_clock::now().time_since_epoch())
                                         .count());
    }
}

int main(int argc, char **argv)
{
    CommandLine cli;
    try
    {
        cli = parse_command_line(argc, argv);
    }
    catch (const ConfigError &e)
    {
        std::cerr << "Configuration error: " << e.what() << "\n\n";
        print_usage(std::cerr);
        return EXIT_CONFIG_ERROR;
    }

    if (cli.show_help)
    {
        print_usage(std::cout);
        return EXIT_RUN_COMPLETED;
    }

    // Ctrl+C cancels a prompt, or ends the acquisition window early
    if (!install_signal_handler())
        return EXIT_INSTRUMENT_INIT_FAILED;

    const std::string data_dir = output_directory(cli.config.output_prefix);
    if (!folder_manager(data_dir))
    {
        std::cerr << "Cannot prepare output directory " << data_dir << std::endl;
        return EXIT_PERSISTENCE_FAULT;
    }
    if (is_disk_space_below_threshold(data_dir.c_str(), DISK_SPACE_THRESHOLD))
        std::cerr << "[Warning] Less than " << DISK_SPACE_THRESHOLD / (1024.0 * 1024.0)
                  << " MiB free in " << data_dir << std::endl;

    TerminalConsole console;
    if (!cli.assume_yes && !console.confirm_configuration(cli.config))
    {
        if (stop_acquisition.load())
        {
            std::cerr << "Interrupted at confirmation. Nothing was written." << std::endl;
            return EXIT_RUN_ABORTED;
        }
        std::cerr << "Header not confirmed. Exiting." << std::endl;
        return EXIT_CONFIG_ERROR;
    }

    std::cout << "Starting acquisition" << std::endl;

    try
    {
        RedPitayaChannel channel(cli.acquisition);
        FileRecordStore store;

        const uint64_t start_ns = steady_ns();
        RunRecord record = execute_run(cli.config, channel, console, store, stop_acquisition,
                                       std::chrono::steady_clock::now, make_progress_printer());
        print_duration("Run", start_ns, steady_ns());

        std::cout << '\a' << std::flush;
        if (!record.outcome.is_completed())
        {
            std::cerr << "Run aborted: " << record.outcome.reason << std::endl;
            return EXIT_RUN_ABORTED;
        }
        return EXIT_RUN_COMPLETED;
    }
    catch (const OperatorAbort &e)
    {
        std::cerr << "Run aborted: " << e.what() << ". Nothing was written." << std::endl;
        return EXIT_RUN_ABORTED;
    }
    catch (const CalibrationFault &e)
    {
        std::cerr << "Calibration fault: " << e.what() << ". No data was taken." << std::endl;
        return EXIT_CALIBRATION_FAULT;
    }
    catch (const DataIntegrityFault &e)
    {
        std::cerr << "Data integrity fault: " << e.what() << ". Nothing was written." << std::endl;
        return EXIT_DATA_INTEGRITY_FAULT;
    }
    catch (const PersistenceFault &e)
    {
        std::cerr << "Persistence fault: " << e.what() << ". Re-run the acquisition to recover." << std::endl;
        return EXIT_PERSISTENCE_FAULT;
    }
    catch (const InstrumentFault &e)
    {
        std::cerr << "Instrument initialisation failed: " << e.what() << std::endl;
        return EXIT_INSTRUMENT_INIT_FAILED;
    }
    catch (const ConfigError &e)
    {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return EXIT_CONFIG_ERROR;
    }
}
