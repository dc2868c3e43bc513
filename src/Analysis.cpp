/*Analysis.cpp*/

#include "Analysis.hpp"

#include <cmath>
#include <stdexcept>

namespace
{
    constexpr double PI = 3.14159265358979323846;
}

double mean_value(const std::vector<Sample> &samples)
{
    if (samples.empty())
        throw std::invalid_argument("mean of an empty sample set");

    double sum = 0.0;
    for (const auto &sample : samples)
        sum += sample.value;
    return sum / static_cast<double>(samples.size());
}

TemperatureCalibration two_point_calibration(double voltage_hot, double voltage_cold, double t_hot, double t_cold)
{
    if (voltage_hot == voltage_cold)
        throw std::invalid_argument("hot and cold load voltages are identical");

    TemperatureCalibration cal;
    cal.a = (t_hot - t_cold) / (voltage_hot - voltage_cold);
    cal.b = t_hot - cal.a * voltage_hot;
    return cal;
}

double voltage_to_temperature(double voltage, const TemperatureCalibration &cal)
{
    return cal.a * voltage + cal.b;
}

CmbFit fit_cmb_temperature(const std::vector<double> &angles_deg, const std::vector<double> &temperatures)
{
    if (angles_deg.size() != temperatures.size())
        throw std::invalid_argument("angle and temperature counts differ");
    if (angles_deg.size() < 2)
        throw std::invalid_argument("at least two pointings are needed for the fit");

    const double n = static_cast<double>(angles_deg.size());
    std::vector<double> x(angles_deg.size());
    double mean_x = 0.0;
    double mean_y = 0.0;
    for (std::size_t i = 0; i < angles_deg.size(); ++i)
    {
        double s = std::sin(angles_deg[i] * PI / 180.0);
        if (std::abs(s) < 1e-12)
            throw std::invalid_argument("pointing along the horizon (sin(theta) == 0)");
        x[i] = 1.0 / s;
        mean_x += x[i];
        mean_y += temperatures[i];
    }
    mean_x /= n;
    mean_y /= n;

    double sxx = 0.0;
    double sxy = 0.0;
    for (std::size_t i = 0; i < x.size(); ++i)
    {
        sxx += (x[i] - mean_x) * (x[i] - mean_x);
        sxy += (x[i] - mean_x) * (temperatures[i] - mean_y);
    }
    if (sxx <= 0.0)
        throw std::invalid_argument("all pointings share the same elevation");

    CmbFit fit;
    fit.t_vertical = sxy / sxx;
    fit.t_cmb = mean_y - fit.t_vertical * mean_x;
    return fit;
}
