/*RunRecorder.hpp*/

#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "RunConfig.hpp"            // RunConfiguration
#include "CalibrationResolver.hpp"  // CalibrationState
#include "DataAcquisition.hpp"      // Sample, RunOutcome

// The persisted artifact of one run; written once, never updated
struct RunRecord
{
    RunConfiguration config;
    CalibrationState calibration;
    std::vector<Sample> samples;
    RunOutcome outcome;
    std::chrono::system_clock::time_point started_at;
};

// Compose a record from the run's parts. Throws DataIntegrityFault when a
// completed run carries no samples.
RunRecord finalize_record(const RunConfiguration &config, const CalibrationState &calibration,
                          std::vector<Sample> samples, RunOutcome outcome,
                          std::chrono::system_clock::time_point started_at);

// Durable storage for run records
class RecordStore
{
public:
    virtual ~RecordStore() = default;

    // Write the whole record or nothing. Returns where it was stored.
    // Throws PersistenceFault.
    virtual std::string persist(const RunRecord &record) = 0;
};
