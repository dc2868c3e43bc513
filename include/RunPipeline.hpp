/*RunPipeline.hpp*/

#pragma once

#include "CalibrationResolver.hpp"  // Calibration step
#include "DataAcquisition.hpp"      // Sampling step
#include "RunRecorder.hpp"          // Record composition and storage

// One complete run: calibration, bounded acquisition, then a single persist.
// Calibration and data-integrity faults propagate before anything is written, and
// a stop request seen before sampling starts raises OperatorAbort without a record;
// instrument faults during sampling end up in the persisted record as Aborted.
RunRecord execute_run(const RunConfiguration &config, InstrumentChannel &channel,
                      OperatorConsole &console, RecordStore &store,
                      const std::atomic<bool> &stop_flag = stop_acquisition,
                      const MonotonicClock &clock = std::chrono::steady_clock::now,
                      const ProgressCallback &progress = nullptr);
