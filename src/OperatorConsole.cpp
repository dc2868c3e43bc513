/*OperatorConsole.cpp*/

#include "OperatorConsole.hpp"
#include "Faults.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <string>

namespace
{
    std::string trim(const std::string &text)
    {
        auto not_space = [](unsigned char c)
        { return !std::isspace(c); };
        auto first = std::find_if(text.begin(), text.end(), not_space);
        auto last = std::find_if(text.rbegin(), text.rend(), not_space).base();
        return first < last ? std::string(first, last) : std::string();
    }

    // Whole-line finite number, false for anything else
    bool parse_number(const std::string &text, double &value)
    {
        try
        {
            std::size_t used = 0;
            value = std::stod(text, &used);
            return used == text.size() && std::isfinite(value);
        }
        catch (const std::invalid_argument &)
        {
            return false;
        }
        catch (const std::out_of_range &)
        {
            return false;
        }
    }
}

TerminalConsole::TerminalConsole(std::istream &in, std::ostream &out, int max_attempts)
    : in_(in), out_(out), max_attempts_(max_attempts)
{
}

// Ask the operator for the calibration offset, re-prompting on malformed input
double TerminalConsole::prompt_for_calibration()
{
    for (int attempt = 1; attempt <= max_attempts_; ++attempt)
    {
        out_ << "\nNo calibration configured for this run.\n"
             << "Enter the calibration offset in volts: " << std::flush;

        std::string line;
        if (!std::getline(in_, line))
            throw CalibrationFault("no calibration value entered (end of input)");

        double value = 0.0;
        if (parse_number(trim(line), value))
            return value;

        std::cerr << "Invalid input. Please enter a number such as 0.0125.\n";
    }

    throw CalibrationFault("no valid calibration value after " + std::to_string(max_attempts_) + " attempts");
}

// Print the header constants and ask for a y/n confirmation
bool TerminalConsole::confirm_configuration(const RunConfiguration &config)
{
    out_ << "Check header constants before taking data:\n";
    for (const auto &line : describe_configuration(config))
        out_ << "  " << line << '\n';
    out_ << "  Calibration mode: " << to_string(config.calibration) << '\n';

    for (int attempt = 1; attempt <= max_attempts_; ++attempt)
    {
        out_ << "Proceed with acquisition? [y/n]: " << std::flush;

        std::string line;
        if (!std::getline(in_, line))
            return false;

        std::string answer = trim(line);
        std::transform(answer.begin(), answer.end(), answer.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });

        if (answer == "y" || answer == "yes")
            return true;
        if (answer == "n" || answer == "no")
            return false;

        std::cerr << "Invalid input. Please answer y or n.\n";
    }

    return false;
}
