#ifndef SO_SPECTRUM_H
#define SO_SPECTRUM_H

#include <memory>

#include "parameters.h"

/**
 * Non-directional spectral density as a function of angular frequency.
 */
struct Spectrum {
    virtual ~Spectrum() = default;
    virtual double evaluate(double omega) const = 0;
};

/**
 * Joint North Sea Wave Observation Project (JONSWAP) spectrum.
 *
 * Section 5.1.4 / Equation 28 in Horvath (2015).
 */
struct SpectrumJONSWAP : Spectrum {
    SpectrumJONSWAP(double wind_speed, double fetch, double gravity)
        : wind_speed(wind_speed), fetch(fetch), gravity(gravity) {}

    double evaluate(double omega) const override;

    double wind_speed; // [m/s]
    double fetch;      // [m]
    double gravity;    // [m/s^2]
};

/**
 * Texel MARSEN ARSLOE (TMA) spectrum, JONSWAP attenuated by water depth.
 *
 * Section 5.1.5 in Horvath (2015).
 */
struct SpectrumTMA : Spectrum {
    SpectrumTMA(SpectrumJONSWAP jonswap, double depth) : jonswap(jonswap), depth(depth) {}

    double evaluate(double omega) const override;

    /**
     * Kitaigorodskii depth attenuation, using the piecewise approximation of
     * Thompson and Vincent (1983). Equation 29 in Horvath (2015).
     */
    double kitaigorodskii_depth_attenuation(double omega) const;

    SpectrumJONSWAP jonswap;
    double depth; // [m]
};

/**
 * Spectrum of the given kind, parameterized by wind, fetch, gravity and depth.
 */
std::unique_ptr<Spectrum> make_spectrum(SpectrumKind kind, const PhysicalParameters& parameters);

#endif // SO_SPECTRUM_H
