/*RecordReader.hpp*/

#pragma once

#include <map>
#include <string>
#include <vector>

#include "Common.hpp"  // Sample

// A record file read back from disk
struct RecordFile
{
    std::string path;
    std::map<std::string, std::string> header; // "Key: value" lines, keyed by the text before ": "
    std::vector<Sample> samples;
    double azimuth_deg = 0.0;
};

// Parse a record written by FileRecordStore. Throws ConfigError when the file
// cannot be opened, a data row is malformed, or the azimuth line is missing.
RecordFile read_record_file(const std::string &path);
