/*CalibrationResolver.cpp*/

#include "CalibrationResolver.hpp"
#include "Faults.hpp"

#include <cmath>
#include <iostream>

namespace
{
    // Operator path shared by None and the Auto fallback
    CalibrationState calibrate_from_operator(InstrumentChannel &channel, OperatorConsole &console)
    {
        double value = console.prompt_for_calibration();
        channel.apply_calibration(value);
        return {value, CalibrationSource::Operator};
    }
}

const char *to_string(CalibrationSource source)
{
    switch (source)
    {
    case CalibrationSource::Operator:
        return "operator";
    case CalibrationSource::Fixed:
        return "fixed";
    case CalibrationSource::Instrument:
        return "instrument";
    }
    return "unknown";
}

CalibrationState resolve_calibration(const CalibrationMode &mode, InstrumentChannel &channel, OperatorConsole &console)
{
    switch (mode.kind)
    {
    case CalibrationMode::Kind::None:
        return calibrate_from_operator(channel, console);

    case CalibrationMode::Kind::Fixed:
        channel.apply_calibration(mode.value);
        return {mode.value, CalibrationSource::Fixed};

    case CalibrationMode::Kind::Auto:
    {
        std::optional<double> current;
        try
        {
            current = channel.calibration_state();
        }
        catch (const InstrumentFault &e)
        {
            std::cerr << "Reading instrument calibration failed: " << e.what() << std::endl;
        }

        if (current && std::isfinite(*current))
        {
            std::cout << "Using instrument calibration: " << *current << std::endl;
            return {*current, CalibrationSource::Instrument};
        }

        std::cout << "Instrument has no valid calibration, asking the operator." << std::endl;
        return calibrate_from_operator(channel, console);
    }
    }

    throw CalibrationFault("unknown calibration mode");
}
