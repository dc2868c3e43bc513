/*DataWriter.hpp*/

#pragma once

#include <chrono>
#include <iosfwd>
#include <string>

#include "RunRecorder.hpp"  // RunRecord, RecordStore

// "YYYY-MM-DD_HH:MM:SS" in local time, the stamp used in record file names
std::string file_timestamp(std::chrono::system_clock::time_point when);

// Record path: output prefix + start timestamp + output suffix
std::string record_file_name(const RunConfiguration &config, std::chrono::system_clock::time_point started_at);

// Serialize a record: "# " header lines, then "elapsed value" rows in read order
void write_record(std::ostream &out, const RunRecord &record, const std::string &title);

// Text-file store; each record goes to its own file named by record_file_name
class FileRecordStore : public RecordStore
{
public:
    std::string persist(const RunRecord &record) override;
};
