#include "dispersion.h"

#include <cassert>
#include <cmath>
#include <limits>

static double sech(double x) {
    // cosh overflows to inf for large x, which correctly yields 0
    return 1.0 / std::cosh(x);
}

double dispersion_peak(double gravity, double wind_speed, double fetch) {
    return 22.0 * std::cbrt(gravity * gravity / (wind_speed * fetch));
}

DispersionSample dispersion_capillary(const PhysicalParameters& parameters, double wave_number) {
    assert(wave_number >= 0.0);

    double k = wave_number;
    if (k < std::numeric_limits<double>::epsilon()) {
        return { 0.0, 0.0 };
    }

    double tension = parameters.surface_tension / parameters.water_density;
    double g = parameters.gravity;
    double h = parameters.water_depth;

    double restoring = g * k + tension * k * k * k;
    double depth_term = std::tanh(h * k);

    double omega = std::sqrt(restoring * depth_term);
    if (omega < std::numeric_limits<double>::epsilon()) {
        return { 0.0, 0.0 };
    }

    double s = sech(h * k);
    double d_omega = (h * s * s * restoring + depth_term * (g + 3.0 * tension * k * k)) / (2.0 * omega);

    return { omega, d_omega };
}
