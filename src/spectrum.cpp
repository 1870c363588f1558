#include "spectrum.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

#include "dispersion.h"

double SpectrumJONSWAP::evaluate(double omega) const {
    if (omega < std::numeric_limits<double>::epsilon()) {
        return 0.0;
    }

    const double gamma = 3.3;
    double omega_peak = dispersion_peak(gravity, wind_speed, fetch);
    double alpha = 0.076 * std::pow(wind_speed * wind_speed / (fetch * gravity), 0.22);
    double sigma = omega <= omega_peak ? 0.07 : 0.09;

    double delta = omega - omega_peak;
    double spread = sigma * omega_peak;
    double r = std::exp(-delta * delta / (2.0 * spread * spread));

    double peak_ratio = omega_peak / omega;
    return alpha * gravity * gravity / std::pow(omega, 5)
        * std::exp(-1.25 * std::pow(peak_ratio, 4))
        * std::pow(gamma, r);
}

double SpectrumTMA::kitaigorodskii_depth_attenuation(double omega) const {
    double omega_h = std::clamp(omega * std::sqrt(depth / jonswap.gravity), 0.0, 2.0);
    if (omega_h <= 1.0) {
        return 0.5 * omega_h * omega_h;
    }
    return 1.0 - 0.5 * (2.0 - omega_h) * (2.0 - omega_h);
}

double SpectrumTMA::evaluate(double omega) const {
    return jonswap.evaluate(omega) * kitaigorodskii_depth_attenuation(omega);
}

std::unique_ptr<Spectrum> make_spectrum(SpectrumKind kind, const PhysicalParameters& parameters) {
    SpectrumJONSWAP jonswap(parameters.wind_speed, parameters.fetch, parameters.gravity);
    switch (kind) {
        case SpectrumKind::JONSWAP:
            return std::make_unique<SpectrumJONSWAP>(jonswap);
        case SpectrumKind::TMA:
            return std::make_unique<SpectrumTMA>(jonswap, parameters.water_depth);
    }
    throw std::invalid_argument("make_spectrum: unknown spectrum kind");
}
