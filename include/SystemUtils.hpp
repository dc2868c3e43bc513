/*SystemUtils.hpp*/

#pragma once

#include <iostream>
#include <string>
#include <chrono>
#include <cstdint>
#include <functional>
#include <sys/statvfs.h>  // For disk space checks

#include "Common.hpp"           // For stop_acquisition and defaults
#include "DataAcquisition.hpp"  // For ProgressCallback

// Check if the available disk space at the given path is below the specified threshold
bool is_disk_space_below_threshold(const char *path, double threshold);

// Handle SIGINT by asking the acquisition loop to stop after the current reading
void signal_handler(int sig);

// Install signal_handler for SIGINT without SA_RESTART, so a prompt blocked in read() returns.
// Returns false if sigaction fails.
bool install_signal_handler();

// Poll ready() every poll interval, sleeping in between, until it holds or the deadline passes.
// Returns whether ready() held.
bool wait_until(const std::function<bool()> &ready, std::chrono::steady_clock::time_point deadline,
                std::chrono::microseconds poll);

// Print the duration between two timestamps in nanoseconds
void print_duration(const std::string &label, uint64_t start_ns, uint64_t end_ns, std::ostream &out = std::cout);

// Draw a text progress bar on a single, rewritten line
void print_progress(double iteration, double total, const std::string &prefix, const std::string &suffix,
                    int bar_length = 50, std::ostream &out = std::cout);

// Progress callback that redraws the bar each time another interval_s of the run has elapsed
ProgressCallback make_progress_printer(double interval_s = PROGRESS_INTERVAL_S, std::ostream &out = std::cout);

// Ensure the existence of a directory, create if missing
bool folder_manager(const std::string &folder_path);

// Directory part of a record path prefix such as "./Data/BW"
std::string output_directory(const std::string &output_prefix);
