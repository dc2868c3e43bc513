/*RunRecorder.cpp*/

#include "RunRecorder.hpp"
#include "Faults.hpp"

RunRecord finalize_record(const RunConfiguration &config, const CalibrationState &calibration,
                          std::vector<Sample> samples, RunOutcome outcome,
                          std::chrono::system_clock::time_point started_at)
{
    if (outcome.is_completed() && samples.empty())
        throw DataIntegrityFault("run completed without a single sample");

    RunRecord record;
    record.config = config;
    record.calibration = calibration;
    record.samples = std::move(samples);
    record.outcome = std::move(outcome);
    record.started_at = started_at;
    return record;
}
