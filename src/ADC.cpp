/*ADC.cpp*/

#include "ADC.hpp"
#include "Faults.hpp"
#include "SystemUtils.hpp"

#include <chrono>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <sstream>

namespace
{
    rp_acq_decimation_t to_rp_decimation(uint32_t decimation)
    {
        switch (decimation)
        {
        case 1:
            return RP_DEC_1;
        case 8:
            return RP_DEC_8;
        case 64:
            return RP_DEC_64;
        case 1024:
            return RP_DEC_1024;
        case 8192:
            return RP_DEC_8192;
        case 65536:
            return RP_DEC_65536;
        }
        throw InstrumentFault("unsupported decimation " + std::to_string(decimation));
    }
}

RedPitayaSession::RedPitayaSession()
{
    int status = rp_Init();
    if (status != RP_OK)
        throw InstrumentFault(std::string("Rp API init failed: ") + rp_GetError(status));
}

RedPitayaSession::~RedPitayaSession()
{
    rp_Release();
}

RedPitayaChannel::RedPitayaChannel(const AcquisitionSettings &settings)
    : settings_(settings),
      rp_channel_(settings.input_channel == 2 ? RP_CH_2 : RP_CH_1),
      full_scale_v_(settings.high_voltage_range ? 20.0 : 1.0),
      buffer_(ADC_BUFFER_SIZE)
{
    initialize_acq();
    load_calibration_cache();
}

RedPitayaChannel::~RedPitayaChannel()
{
    cleanup();
}

// Convert a Red Pitaya return code into an InstrumentFault
void RedPitayaChannel::check(int status, const char *call) const
{
    if (status != RP_OK)
        throw InstrumentFault(std::string(call) + " failed: " + rp_GetError(status));
}

// Initializes acquisition settings for the configured input
void RedPitayaChannel::initialize_acq()
{
    check(rp_AcqReset(), "rp_AcqReset");
    check(rp_AcqSetDecimation(to_rp_decimation(settings_.decimation)), "rp_AcqSetDecimation");
    check(rp_AcqSetGain(rp_channel_, settings_.high_voltage_range ? RP_HIGH : RP_LOW), "rp_AcqSetGain");
    check(rp_AcqSetTriggerDelay(0), "rp_AcqSetTriggerDelay");

    // Print actual sampling rate
    float sampling_rate;
    if (rp_AcqGetSamplingRateHz(&sampling_rate) == RP_OK)
        printf("Current Sampling Rate: %.2f Hz\n", sampling_rate);
    else
        std::cerr << "Failed to get sampling rate\n";
}

// Releases Red Pitaya acquisition resources
void RedPitayaChannel::cleanup()
{
    std::cout << "\nReleasing resources\n";

    int status = rp_AcqStop();
    if (status != RP_OK)
        std::cerr << "rp_AcqStop failed: " << rp_GetError(status) << std::endl;
}

void RedPitayaChannel::begin_run()
{
    // Fresh front-end state for every run
    initialize_acq();
}

// One reading: arm, trigger immediately, wait for a full buffer and average it
double RedPitayaChannel::read_sample()
{
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + std::chrono::milliseconds(settings_.trigger_timeout_ms);

    check(rp_AcqStart(), "rp_AcqStart");
    check(rp_AcqSetTriggerSrc(RP_TRIG_SRC_NOW), "rp_AcqSetTriggerSrc");

    const auto poll = std::chrono::microseconds(ACQ_POLL_INTERVAL_US);

    auto triggered = [this]()
    {
        rp_acq_trig_state_t state = RP_TRIG_STATE_WAITING;
        check(rp_AcqGetTriggerState(&state), "rp_AcqGetTriggerState");
        return state == RP_TRIG_STATE_TRIGGERED;
    };
    if (!wait_until(triggered, deadline, poll))
        throw InstrumentFault("trigger timeout after " + std::to_string(settings_.trigger_timeout_ms) + " ms");

    auto filled = [this]()
    {
        bool fill_state = false;
        check(rp_AcqGetBufferFillState(&fill_state), "rp_AcqGetBufferFillState");
        return fill_state;
    };
    if (!wait_until(filled, deadline, poll))
        throw InstrumentFault("buffer fill timeout after " + std::to_string(settings_.trigger_timeout_ms) + " ms");

    uint32_t size = static_cast<uint32_t>(buffer_.size());
    check(rp_AcqGetOldestDataV(rp_channel_, &size, buffer_.data()), "rp_AcqGetOldestDataV");
    if (size == 0)
        throw InstrumentFault("acquisition returned an empty buffer");

    double mean = std::accumulate(buffer_.begin(), buffer_.begin() + size, 0.0) / size;
    if (!std::isfinite(mean))
        throw InstrumentFault("acquisition returned a non-finite reading");

    return mean - offset_v_.value_or(0.0);
}

// Leave the trigger disabled between runs
void RedPitayaChannel::end_run()
{
    check(rp_AcqStop(), "rp_AcqStop");
    check(rp_AcqSetTriggerSrc(RP_TRIG_SRC_DISABLED), "rp_AcqSetTriggerSrc");
}

std::optional<double> RedPitayaChannel::calibration_state()
{
    return offset_v_;
}

// Accept an offset inside the input range and remember it for later runs
void RedPitayaChannel::apply_calibration(double value)
{
    if (!std::isfinite(value) || std::abs(value) >= full_scale_v_)
    {
        std::ostringstream msg;
        msg << "calibration offset " << value << " V is outside the +/-" << full_scale_v_ << " V input range";
        throw CalibrationFault(msg.str());
    }

    namespace fs = std::filesystem;
    const fs::path cache(settings_.calibration_cache);
    std::error_code ec;
    if (cache.has_parent_path())
        fs::create_directories(cache.parent_path(), ec);

    std::ofstream out(cache, std::ios::out | std::ios::trunc);
    out << std::setprecision(17) << value << '\n';
    out.flush();
    if (!out)
        throw CalibrationFault("cannot store calibration in " + settings_.calibration_cache);

    offset_v_ = value;
}

// Pick up the offset stored by a previous run, if any
void RedPitayaChannel::load_calibration_cache()
{
    std::ifstream in(settings_.calibration_cache);
    if (!in)
        return;

    double value = 0.0;
    if (in >> value && std::isfinite(value))
    {
        offset_v_ = value;
        std::cout << "Stored calibration offset: " << value << " V" << std::endl;
    }
    else
    {
        std::cerr << "Ignoring unreadable calibration cache " << settings_.calibration_cache << std::endl;
    }
}
