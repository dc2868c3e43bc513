/*RunPipeline.cpp*/

#include "RunPipeline.hpp"
#include "Faults.hpp"

#include <iostream>

RunRecord execute_run(const RunConfiguration &config, InstrumentChannel &channel,
                      OperatorConsole &console, RecordStore &store,
                      const std::atomic<bool> &stop_flag,
                      const MonotonicClock &clock,
                      const ProgressCallback &progress)
{
    validate_config(config);

    if (stop_flag.load())
        throw OperatorAbort("interrupted before calibration");

    CalibrationState calibration;
    try
    {
        calibration = resolve_calibration(config.calibration, channel, console);
    }
    catch (const CalibrationFault &e)
    {
        // An interrupted prompt surfaces as a calibration fault
        if (stop_flag.load())
            throw OperatorAbort(std::string("interrupted during calibration: ") + e.what());
        throw;
    }

    if (stop_flag.load())
        throw OperatorAbort("interrupted during calibration");

    std::cout << "Calibration set to " << calibration.value
              << " (" << to_string(calibration.source) << ")" << std::endl;

    const auto started_at = std::chrono::system_clock::now();
    std::cout << "Reading for " << config.duration_s << " s..." << std::endl;

    AcquisitionResult acquired = acquire_data(channel, config.duration_s, stop_flag, clock, progress);
    std::cout << "\nAcquired " << acquired.samples.size() << " samples, "
              << to_string(acquired.outcome) << std::endl;

    RunRecord record = finalize_record(config, calibration, std::move(acquired.samples),
                                       std::move(acquired.outcome), started_at);

    const std::string location = store.persist(record);
    std::cout << "Data written to " << location << std::endl;

    return record;
}
