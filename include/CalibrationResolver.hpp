/*CalibrationResolver.hpp*/

#pragma once

#include <string>

#include "RunConfig.hpp"          // CalibrationMode
#include "InstrumentChannel.hpp"  // Instrument calibration access
#include "OperatorConsole.hpp"    // Operator prompt

// Where the calibration applied for a run came from
enum class CalibrationSource
{
    Operator,
    Fixed,
    Instrument
};

// Calibration actually in effect for a run; fixed once acquisition starts
struct CalibrationState
{
    double value = 0.0;
    CalibrationSource source = CalibrationSource::Operator;
};

const char *to_string(CalibrationSource source);

// Resolve the calibration for one run before any sample is taken.
// None prompts the operator once and applies the answer, Fixed applies the
// configured value, Auto keeps the instrument's own value when it reports a
// finite one and otherwise behaves like None. Throws CalibrationFault.
CalibrationState resolve_calibration(const CalibrationMode &mode, InstrumentChannel &channel, OperatorConsole &console);
