/*Analysis.hpp*/

#pragma once

#include <vector>

#include "Common.hpp"  // Sample

// Load temperatures used by the bench calibration, in kelvin
constexpr double DEFAULT_HOT_LOAD_K = 275.15;
constexpr double DEFAULT_COLD_LOAD_K = 77.0;

// Linear radiometer calibration, T = a * V + b
struct TemperatureCalibration
{
    double a = 0.0;
    double b = 0.0;
};

// Result of fitting T = T_cmb + T_vertical / sin(theta)
struct CmbFit
{
    double t_cmb = 0.0;
    double t_vertical = 0.0;
};

// Mean of the sample values; throws std::invalid_argument when empty
double mean_value(const std::vector<Sample> &samples);

// Two-point calibration from hot and cold load readings; throws std::invalid_argument when the voltages coincide
TemperatureCalibration two_point_calibration(double voltage_hot, double voltage_cold,
                                             double t_hot = DEFAULT_HOT_LOAD_K,
                                             double t_cold = DEFAULT_COLD_LOAD_K);

double voltage_to_temperature(double voltage, const TemperatureCalibration &cal);

// Least-squares fit of the atmosphere slab model. The model is linear in
// (T_cmb, T_vertical) with abscissa 1/sin(theta), so the fit is closed form.
// Throws std::invalid_argument on size mismatch, fewer than two points,
// sin(theta) == 0, or when every point has the same abscissa.
CmbFit fit_cmb_temperature(const std::vector<double> &angles_deg, const std::vector<double> &temperatures);
