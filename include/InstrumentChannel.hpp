/*InstrumentChannel.hpp*/

#pragma once

#include <optional>

// The receiver as seen by the acquisition pipeline. One instance is owned
// exclusively by a run; calibration always completes before the first read.
class InstrumentChannel
{
public:
    virtual ~InstrumentChannel() = default;

    // Arm the instrument for sampling. Throws InstrumentFault.
    virtual void begin_run() {}

    // Block until the next reading is available. Throws InstrumentFault.
    virtual double read_sample() = 0;

    // Return the instrument to its idle trigger state. Throws InstrumentFault.
    virtual void end_run() {}

    // Calibration currently held by the instrument, if any. Throws InstrumentFault.
    virtual std::optional<double> calibration_state() = 0;

    // Load a calibration value. Throws CalibrationFault if the value is rejected.
    virtual void apply_calibration(double value) = 0;
};
