/*ADC.hpp*/

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "rp.h"                   // Red Pitaya API
#include "Common.hpp"             // AcquisitionSettings and buffer size
#include "InstrumentChannel.hpp"  // Channel interface implemented here

// Owns the Red Pitaya API for the lifetime of the process
class RedPitayaSession
{
public:
    RedPitayaSession();
    ~RedPitayaSession();

    RedPitayaSession(const RedPitayaSession &) = delete;
    RedPitayaSession &operator=(const RedPitayaSession &) = delete;
};

// Receiver detector output on one fast analog input. Each reading is the mean
// of one full ADC buffer captured on an immediate trigger. The calibration is
// a DC offset subtracted from every reading and kept in a cache file so that
// later runs can reuse it.
class RedPitayaChannel : public InstrumentChannel
{
public:
    explicit RedPitayaChannel(const AcquisitionSettings &settings);
    ~RedPitayaChannel() override;

    void begin_run() override;
    double read_sample() override;
    void end_run() override;

    std::optional<double> calibration_state() override;
    void apply_calibration(double value) override;

private:
    // Initializes the acquisition system (decimation, gain, trigger delay)
    void initialize_acq();

    // Releases the acquisition unit
    void cleanup();

    void load_calibration_cache();
    void check(int status, const char *call) const;

    RedPitayaSession session_;
    AcquisitionSettings settings_;
    rp_channel_t rp_channel_;
    double full_scale_v_;
    std::vector<float> buffer_;
    std::optional<double> offset_v_;
};
