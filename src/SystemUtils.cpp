/* SystemUtils.cpp */

#include "SystemUtils.hpp"
#include "Common.hpp"
#include <algorithm>
#include <csignal>
#include <cmath>
#include <iomanip>
#include <filesystem>
#include <memory>
#include <thread>
#include <sys/statvfs.h>
#include <unistd.h>

// Check if available disk space is below a given threshold (in bytes)
bool is_disk_space_below_threshold(const char *path, double threshold)
{
    struct statvfs stat;
    if (statvfs(path, &stat) != 0)
    {
        std::cerr << "Error getting filesystem statistics for " << path << "." << std::endl;
        return false;
    }

    double available_space = static_cast<double>(stat.f_bsize) * static_cast<double>(stat.f_bavail);
    return available_space < threshold;
}

// SIGINT handler: only async-signal-safe work here
void signal_handler(int sig)
{
    if (sig == SIGINT)
    {
        static const char message[] = "^CSIGINT received, stopping after the current reading...\n";
        ssize_t ignored = write(STDOUT_FILENO, message, sizeof(message) - 1);
        (void)ignored;
        stop_acquisition.store(true);
    }
}

bool install_signal_handler()
{
    struct sigaction action{};
    action.sa_handler = signal_handler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    if (sigaction(SIGINT, &action, nullptr) != 0)
    {
        std::cerr << "Failed to install the SIGINT handler." << std::endl;
        return false;
    }
    return true;
}

bool wait_until(const std::function<bool()> &ready, std::chrono::steady_clock::time_point deadline,
                std::chrono::microseconds poll)
{
    while (!ready())
    {
        if (std::chrono::steady_clock::now() > deadline)
            return false;
        std::this_thread::sleep_for(poll);
    }
    return true;
}

// Print acquisition duration between two timestamps
void print_duration(const std::string &label, uint64_t start_ns, uint64_t end_ns, std::ostream &out)
{
    auto duration_ns = end_ns > start_ns ? end_ns - start_ns : 0;
    auto duration_ms = duration_ns / 1'000'000;

    auto minutes = duration_ms / 60000;
    auto seconds = (duration_ms % 60000) / 1000;
    auto ms = duration_ms % 1000;

    out << std::left << std::setw(40) << label + " acquisition time:"
        << minutes << " min " << seconds << " sec " << ms << " ms\n";
}

// Render "prefix |#####-----| 40.0% suffix" and return to line start
void print_progress(double iteration, double total, const std::string &prefix, const std::string &suffix,
                    int bar_length, std::ostream &out)
{
    double fraction = total > 0.0 ? iteration / total : 1.0;
    fraction = std::min(std::max(fraction, 0.0), 1.0);

    int filled = static_cast<int>(std::lround(fraction * bar_length));
    out << '\r' << prefix << " |" << std::string(filled, '#') << std::string(bar_length - filled, '-') << "| "
        << std::fixed << std::setprecision(1) << fraction * 100.0 << "% " << suffix
        << std::defaultfloat << std::flush;
}

ProgressCallback make_progress_printer(double interval_s, std::ostream &out)
{
    auto next_report = std::make_shared<double>(0.0);
    return [next_report, interval_s, &out](double elapsed_s, double duration_s)
    {
        if (elapsed_s < *next_report)
            return;
        print_progress(elapsed_s, duration_s, "Progress reading data:", "Complete", 50, out);
        if (interval_s > 0.0)
            *next_report = (std::floor(elapsed_s / interval_s) + 1.0) * interval_s;
    };
}

// Ensure directory exists; existing records are never touched
bool folder_manager(const std::string &folder_path)
{
    namespace fs = std::filesystem;
    fs::path dir_path(folder_path);

    try
    {
        if (fs::exists(dir_path))
        {
            if (!fs::is_directory(dir_path))
            {
                std::cerr << "Not a directory: " << folder_path << std::endl;
                return false;
            }
            return true;
        }

        if (!fs::create_directories(dir_path))
        {
            std::cerr << "Failed to create directory: " << folder_path << std::endl;
            return false;
        }
        return true;
    }
    catch (const fs::filesystem_error &e)
    {
        std::cerr << "Filesystem error: " << e.what() << std::endl;
        return false;
    }
}

std::string output_directory(const std::string &output_prefix)
{
    std::filesystem::path parent = std::filesystem::path(output_prefix).parent_path();
    return parent.empty() ? std::string(".") : parent.string();
}
