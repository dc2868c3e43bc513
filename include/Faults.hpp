/*Faults.hpp*/

#pragma once

#include <stdexcept>
#include <string>

// Base of every fault raised by the acquisition pipeline
class DaqFault : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Invalid run configuration or command line, raised before the instrument is touched
class ConfigError : public DaqFault
{
public:
    using DaqFault::DaqFault;
};

// Instrument rejected a calibration value, or the operator never supplied one
class CalibrationFault : public DaqFault
{
public:
    using DaqFault::DaqFault;
};

// Instrument read or setup failure
class InstrumentFault : public DaqFault
{
public:
    using DaqFault::DaqFault;
};

// A completed run that produced no samples
class DataIntegrityFault : public DaqFault
{
public:
    using DaqFault::DaqFault;
};

// Record could not be written to storage
class PersistenceFault : public DaqFault
{
public:
    using DaqFault::DaqFault;
};

// Operator interrupted the run before sampling started; nothing is written
class OperatorAbort : public DaqFault
{
public:
    using DaqFault::DaqFault;
};
