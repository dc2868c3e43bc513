/*OperatorConsole.hpp*/

#pragma once

#include <iostream>

#include "RunConfig.hpp"  // RunConfiguration and describe_configuration

// Blocking operator interaction used before acquisition starts
class OperatorConsole
{
public:
    virtual ~OperatorConsole() = default;

    // Ask for a calibration value; no timeout. Throws CalibrationFault when none is given.
    virtual double prompt_for_calibration() = 0;

    // Show the run header and ask the operator to accept it
    virtual bool confirm_configuration(const RunConfiguration &config) = 0;
};

// Console bound to a pair of streams, std::cin/std::cout by default
class TerminalConsole : public OperatorConsole
{
public:
    explicit TerminalConsole(std::istream &in = std::cin, std::ostream &out = std::cout,
                             int max_attempts = MAX_PROMPT_ATTEMPTS);

    double prompt_for_calibration() override;
    bool confirm_configuration(const RunConfiguration &config) override;

private:
    std::istream &in_;
    std::ostream &out_;
    int max_attempts_;
};
