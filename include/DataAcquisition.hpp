/*DataAcquisition.hpp*/

#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "Common.hpp"             // Sample, stop_acquisition
#include "InstrumentChannel.hpp"  // Receiver access

// How a run ended
struct RunOutcome
{
    enum class Status
    {
        Completed,
        Aborted
    };

    Status status = Status::Completed;
    std::string reason; // Empty when completed

    static RunOutcome completed() { return {Status::Completed, {}}; }
    static RunOutcome aborted(std::string why) { return {Status::Aborted, std::move(why)}; }

    bool is_completed() const { return status == Status::Completed; }
};

// "Completed" or "Aborted: <reason>"
std::string to_string(const RunOutcome &outcome);

// Samples in read order plus the way the loop ended
struct AcquisitionResult
{
    std::vector<Sample> samples;
    RunOutcome outcome;
};

using MonotonicClock = std::function<std::chrono::steady_clock::time_point()>;
using ProgressCallback = std::function<void(double elapsed_s, double duration_s)>;

// Sample the channel until duration_s has elapsed since the first iteration.
// Every sample carries the elapsed time at which it was requested, so the last
// one is never later than duration_s. An InstrumentFault or a raised stop flag
// ends the loop early as Aborted; samples already read are kept.
AcquisitionResult acquire_data(InstrumentChannel &channel, double duration_s,
                               const std::atomic<bool> &stop_flag = stop_acquisition,
                               const MonotonicClock &clock = std::chrono::steady_clock::now,
                               const ProgressCallback &progress = nullptr);
