#ifndef SO_DISPERSION_H
#define SO_DISPERSION_H

#include "parameters.h"

struct DispersionSample {
    double omega;   // angular frequency
    double d_omega; // d(omega)/dk
};

/**
 * Peak angular frequency of a fetch limited wind sea.
 *
 * Equation 30 in Horvath (2015), with the cube root that the paper omits.
 */
double dispersion_peak(double gravity, double wind_speed, double fetch);

/**
 * Finite depth dispersion relation with capillary term:
 *   omega = sqrt((g * k + (sigma / rho) * k^3) * tanh(h * k))
 *
 * Returns omega and its analytic derivative with respect to k, which is the
 * Jacobian between frequency space and wavenumber space.
 */
DispersionSample dispersion_capillary(const PhysicalParameters& parameters, double wave_number);

#endif // SO_DISPERSION_H
