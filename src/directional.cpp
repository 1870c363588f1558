#include "directional.h"

#include <algorithm>
#include <cmath>

#include <glm/gtc/constants.hpp>

#include "dispersion.h"
#include "integration.h"

static double sech(double x) {
    return 1.0 / std::cosh(x);
}

double directional_elongation(const PhysicalParameters& parameters, double omega, double theta) {
    const double pi = glm::pi<double>();
    double omega_peak = dispersion_peak(parameters.gravity, parameters.wind_speed, parameters.fetch);
    double shaping = 16.0 * std::tanh(omega_peak / omega) * parameters.swell * parameters.swell;

    theta = std::clamp(theta, -pi, pi);
    return std::pow(std::abs(std::cos(0.5 * theta)), 2.0 * shaping);
}

double directional_base_donelan_banner(const PhysicalParameters& parameters, double omega, double theta) {
    double omega_peak = dispersion_peak(parameters.gravity, parameters.wind_speed, parameters.fetch);
    double omega_ratio = omega / omega_peak;

    double beta;
    if (omega_ratio < 0.95) {
        beta = 2.61 * std::pow(omega_ratio, 1.3);
    } else if (omega_ratio < 1.6) {
        beta = 2.28 * std::pow(omega_ratio, -1.3);
    } else {
        double epsilon = -0.4 + 0.8393 * std::exp(-0.567 * std::log(omega_ratio * omega_ratio));
        beta = std::pow(10.0, epsilon);
    }

    double s = sech(beta * theta);
    return beta / (2.0 * std::tanh(beta * glm::pi<double>())) * s * s;
}

double directional_spreading(const PhysicalParameters& parameters, double omega, double theta, DirectionalBase base) {
    const double pi = glm::pi<double>();
    auto weight = [&](double t) {
        return base(parameters, omega, t) * directional_elongation(parameters, omega, t);
    };

    double normalization = trapezoidal_quadrature(-pi, pi, directional_quadrature_samples, weight);
    return weight(theta) / normalization;
}
