/*Common.hpp*/

#pragma once

#include <atomic>
#include <cstdint>
#include <string>

// Run defaults, overridable from the command line
constexpr double DEFAULT_DURATION_S = 30.0;
constexpr const char *DEFAULT_OUTPUT_PREFIX = "./Data/BW";
constexpr const char *DEFAULT_OUTPUT_SUFFIX = "_Readout.txt";
constexpr const char *DEFAULT_UNITS = "Volts";
constexpr const char *DEFAULT_WEATHER = "clear";
constexpr const char *DEFAULT_CALIBRATOR_TEMPERATURE = "Low";

// Acquisition front-end defaults
constexpr int DEFAULT_INPUT_CHANNEL = 1;       // IN1
constexpr uint32_t DEFAULT_DECIMATION = 1024;  // ~122 kS/s, one buffer every ~134 ms
constexpr uint32_t ADC_BUFFER_SIZE = 16384;    // Samples per hardware buffer
constexpr int DEFAULT_TRIGGER_TIMEOUT_MS = 2000;
constexpr int ACQ_POLL_INTERVAL_US = 200; // Sleep between trigger/fill polls
constexpr const char *CALIBRATION_CACHE_FILE = "./Data/.calibration";

// Operator console and housekeeping
constexpr int MAX_PROMPT_ATTEMPTS = 3;
constexpr double PROGRESS_INTERVAL_S = 10.0;
constexpr double DISK_SPACE_THRESHOLD = 64.0 * 1024.0 * 1024.0; // Bytes

// Process exit status
constexpr int EXIT_RUN_COMPLETED = 0;
constexpr int EXIT_RUN_ABORTED = 1;
constexpr int EXIT_CONFIG_ERROR = 2;
constexpr int EXIT_CALIBRATION_FAULT = 3;
constexpr int EXIT_DATA_INTEGRITY_FAULT = 4;
constexpr int EXIT_PERSISTENCE_FAULT = 5;
constexpr int EXIT_INSTRUMENT_INIT_FAILED = 6;

// One receiver reading tagged with seconds since run start
struct Sample
{
    double elapsed_s = 0.0;
    double value = 0.0;
};

// Front-end settings handed to the instrument channel
struct AcquisitionSettings
{
    int input_channel = DEFAULT_INPUT_CHANNEL;   // 1 or 2
    bool high_voltage_range = false;             // LV (+/-1 V) or HV (+/-20 V) jumper setting
    uint32_t decimation = DEFAULT_DECIMATION;
    int trigger_timeout_ms = DEFAULT_TRIGGER_TIMEOUT_MS;
    std::string calibration_cache = CALIBRATION_CACHE_FILE;
};

// Set from the SIGINT handler, polled once per sampling iteration
extern std::atomic<bool> stop_acquisition;
