/*DataWriter.cpp*/

#include "DataWriter.hpp"
#include "Faults.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <unistd.h>

namespace
{
    std::tm local_time(std::chrono::system_clock::time_point when)
    {
        std::time_t seconds = std::chrono::system_clock::to_time_t(when);
        std::tm parts{};
        localtime_r(&seconds, &parts);
        return parts;
    }
}

std::string file_timestamp(std::chrono::system_clock::time_point when)
{
    std::tm parts = local_time(when);
    std::ostringstream out;
    out << std::put_time(&parts, "%Y-%m-%d_%H:%M:%S");
    return out.str();
}

std::string record_file_name(const RunConfiguration &config, std::chrono::system_clock::time_point started_at)
{
    return config.output_prefix + file_timestamp(started_at) + config.output_suffix;
}

// Write header and samples in the layout read back by the analysis tool
void write_record(std::ostream &out, const RunRecord &record, const std::string &title)
{
    std::tm started = local_time(record.started_at);

    out << "# " << title << '\n';
    for (const auto &line : describe_configuration(record.config))
        out << "# " << line << '\n';
    out << "# Run started: " << std::put_time(&started, "%Y-%m-%dT%H:%M:%S") << '\n';
    out << "# Calibration: " << record.calibration.value
        << " (" << to_string(record.calibration.source) << ")\n";
    out << "# Outcome: " << to_string(record.outcome) << '\n';
    out << "# Samples: " << record.samples.size() << '\n';

    char row[64];
    for (const auto &sample : record.samples)
    {
        std::snprintf(row, sizeof(row), "%.18e %.18e\n", sample.elapsed_s, sample.value);
        out << row;
    }
}

// Write and fsync "<name>.partial", then hard-link it into place. link() fails with
// EEXIST instead of replacing, so a record is either complete or absent and never overwritten.
std::string FileRecordStore::persist(const RunRecord &record)
{
    namespace fs = std::filesystem;

    const std::string path = record_file_name(record.config, record.started_at);
    const fs::path final_path(path);
    const std::string temp_path = path + ".partial";

    std::error_code ec;
    if (final_path.has_parent_path())
    {
        fs::create_directories(final_path.parent_path(), ec);
        if (ec)
            throw PersistenceFault("cannot create directory " + final_path.parent_path().string() + ": " + ec.message());
    }

    std::ostringstream text;
    write_record(text, record, path);
    const std::string contents = text.str();

    int fd = ::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0)
        throw PersistenceFault("cannot open " + temp_path + " for writing: " + std::strerror(errno));

    const char *data = contents.data();
    std::size_t remaining = contents.size();
    while (remaining > 0)
    {
        ssize_t written = ::write(fd, data, remaining);
        if (written < 0)
        {
            if (errno == EINTR)
                continue;
            const std::string reason = std::strerror(errno);
            ::close(fd);
            ::unlink(temp_path.c_str());
            throw PersistenceFault("write to " + temp_path + " failed: " + reason);
        }
        data += written;
        remaining -= static_cast<std::size_t>(written);
    }

    int sync_status = ::fsync(fd);
    int sync_error = errno;
    if (::close(fd) != 0 && sync_status == 0)
    {
        sync_status = -1;
        sync_error = errno;
    }
    if (sync_status != 0)
    {
        const std::string reason = std::strerror(sync_error);
        ::unlink(temp_path.c_str());
        throw PersistenceFault("cannot flush " + temp_path + ": " + reason);
    }

    if (::link(temp_path.c_str(), path.c_str()) != 0)
    {
        const int error = errno;
        ::unlink(temp_path.c_str());
        if (error == EEXIST)
            throw PersistenceFault("record already exists: " + path);
        throw PersistenceFault("cannot move record into place at " + path + ": " + std::strerror(error));
    }

    if (::unlink(temp_path.c_str()) != 0)
        std::cerr << "[Warning] Could not remove " << temp_path << ": " << std::strerror(errno) << std::endl;

    return path;
}
