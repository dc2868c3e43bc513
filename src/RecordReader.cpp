/*RecordReader.cpp*/

#include "RecordReader.hpp"
#include "Faults.hpp"

#include <fstream>
#include <sstream>

namespace
{
    const std::string AZIMUTH_KEY = "Angle pointing (from horizontal parallel to supporting axis)";
}

RecordFile read_record_file(const std::string &path)
{
    std::ifstream in(path);
    if (!in)
        throw ConfigError("cannot open record file " + path);

    RecordFile record;
    record.path = path;
    bool have_azimuth = false;

    std::string line;
    int line_number = 0;
    while (std::getline(in, line))
    {
        ++line_number;
        if (line.empty())
            continue;

        if (line[0] == '#')
        {
            std::string text = line.substr(line.compare(0, 2, "# ") == 0 ? 2 : 1);
            auto colon = text.find(": ");
            if (colon == std::string::npos)
                continue;

            std::string key = text.substr(0, colon);
            std::string value = text.substr(colon + 2);
            if (key == AZIMUTH_KEY)
            {
                try
                {
                    record.azimuth_deg = std::stod(value);
                    have_azimuth = true;
                }
                catch (const std::exception &)
                {
                    throw ConfigError(path + ": unreadable azimuth '" + value + "'");
                }
            }
            record.header[key] = value;
            continue;
        }

        std::istringstream row(line);
        Sample sample;
        if (!(row >> sample.elapsed_s >> sample.value))
            throw ConfigError(path + ":" + std::to_string(line_number) + ": malformed data row");
        record.samples.push_back(sample);
    }

    if (!have_azimuth)
        throw ConfigError("could not find angle in file: " + path);

    return record;
}
