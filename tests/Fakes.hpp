/*Fakes.hpp*/

#pragma once

#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "Faults.hpp"
#include "DataAcquisition.hpp"
#include "InstrumentChannel.hpp"
#include "OperatorConsole.hpp"
#include "RunRecorder.hpp"

// Monotonic clock that only moves when told to
struct FakeClock
{
    std::chrono::steady_clock::time_point now{};

    MonotonicClock as_function()
    {
        return [this]()
        { return now; };
    }

    void advance(std::chrono::nanoseconds step) { now += step; }
};

// Instrument that returns 0.1, 0.2, ... and advances the fake clock by one read period per reading
class FakeInstrument : public InstrumentChannel
{
public:
    FakeClock *clock = nullptr;
    std::chrono::nanoseconds read_period = std::chrono::milliseconds(125);
    std::chrono::nanoseconds real_delay{0}; // Wall-clock pause per reading when no fake clock is used
    int fail_on_read = 0; // 1-based read number that faults; 0 never faults
    std::atomic<bool> *raise_on_read_flag = nullptr;
    int raise_after_reads = 0;

    std::optional<double> stored_calibration;
    bool reject_calibration = false;
    bool fail_calibration_read = false;
    bool fail_begin = false;

    int reads = 0;
    int begin_calls = 0;
    int end_calls = 0;
    int calibration_reads = 0;
    std::vector<double> applied;

    void begin_run() override
    {
        ++begin_calls;
        if (fail_begin)
            throw InstrumentFault("front end did not respond");
    }

    double read_sample() override
    {
        ++reads;
        if (fail_on_read != 0 && reads == fail_on_read)
            throw InstrumentFault("read timeout");
        if (clock)
            clock->advance(read_period);
        else if (real_delay.count() > 0)
            std::this_thread::sleep_for(real_delay);
        if (raise_on_read_flag && reads == raise_after_reads)
            raise_on_read_flag->store(true);
        return 0.1 * reads;
    }

    void end_run() override { ++end_calls; }

    std::optional<double> calibration_state() override
    {
        ++calibration_reads;
        if (fail_calibration_read)
            throw InstrumentFault("calibration register unreadable");
        return stored_calibration;
    }

    void apply_calibration(double value) override
    {
        applied.push_back(value);
        if (reject_calibration)
            throw CalibrationFault("value rejected");
        stored_calibration = value;
    }
};

// Console with a scripted calibration answer
class FakeConsole : public OperatorConsole
{
public:
    double answer = 0.0125;
    bool confirm = true;
    std::atomic<bool> *raise_on_prompt = nullptr; // Flag set while the prompt is showing
    bool fail_prompt = false;                     // Prompt ends without an answer
    int prompts = 0;
    int confirmations = 0;

    double prompt_for_calibration() override
    {
        ++prompts;
        if (raise_on_prompt)
            raise_on_prompt->store(true);
        if (fail_prompt)
            throw CalibrationFault("no calibration value entered (end of input)");
        return answer;
    }

    bool confirm_configuration(const RunConfiguration &) override
    {
        ++confirmations;
        return confirm;
    }
};

// Store that keeps records in memory, or fails on demand
class MemoryStore : public RecordStore
{
public:
    bool fail = false;
    std::vector<RunRecord> records;

    std::string persist(const RunRecord &record) override
    {
        if (fail)
            throw PersistenceFault("disk full");
        records.push_back(record);
        return "memory:" + std::to_string(records.size());
    }
};
