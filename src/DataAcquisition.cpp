/*DataAcquisition.cpp*/

#include "DataAcquisition.hpp"
#include "Faults.hpp"

#include <iostream>

std::string to_string(const RunOutcome &outcome)
{
    if (outcome.is_completed())
        return "Completed";
    return "Aborted: " + outcome.reason;
}

// Bounded acquisition loop for a single run
AcquisitionResult acquire_data(InstrumentChannel &channel, double duration_s,
                               const std::atomic<bool> &stop_flag,
                               const MonotonicClock &clock,
                               const ProgressCallback &progress)
{
    AcquisitionResult result;
    result.outcome = RunOutcome::completed();

    try
    {
        channel.begin_run();
    }
    catch (const InstrumentFault &e)
    {
        result.outcome = RunOutcome::aborted(std::string("instrument fault: ") + e.what());
        return result;
    }

    const auto start = clock();

    while (true)
    {
        if (stop_flag.load())
        {
            result.outcome = RunOutcome::aborted("operator interrupt");
            break;
        }

        const double elapsed = std::chrono::duration<double>(clock() - start).count();
        if (elapsed > duration_s)
            break;

        if (progress)
            progress(elapsed, duration_s);

        try
        {
            double value = channel.read_sample();
            result.samples.push_back({elapsed, value});
        }
        catch (const InstrumentFault &e)
        {
            result.outcome = RunOutcome::aborted(std::string("instrument fault: ") + e.what());
            break;
        }
    }

    // Put the trigger back to idle on every path; the outcome stands either way
    try
    {
        channel.end_run();
    }
    catch (const InstrumentFault &e)
    {
        std::cerr << "Returning instrument to idle failed: " << e.what() << std::endl;
    }

    return result;
}
