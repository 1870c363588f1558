#ifndef SO_DIRECTIONAL_H
#define SO_DIRECTIONAL_H

#include "parameters.h"

/**
 * Directional base distribution, evaluated at angular frequency omega and
 * direction theta relative to the wind.
 */
using DirectionalBase = double (*)(const PhysicalParameters&, double omega, double theta);

// Number of quadrature samples used to normalize the spreading over [-pi, pi].
constexpr int directional_quadrature_samples = 128;

/**
 * Swell elongation of the directional distribution.
 *
 * Equation 44 in Horvath (2015).
 */
double directional_elongation(const PhysicalParameters& parameters, double omega, double theta);

/**
 * Donelan-Banner directional spreading.
 *
 * Equation 38 in Horvath (2015).
 */
double directional_base_donelan_banner(const PhysicalParameters& parameters, double omega, double theta);

/**
 * Product of the base distribution and the swell elongation, normalized so
 * that it integrates to one over [-pi, pi]. The normalization is recomputed
 * on every call.
 */
double directional_spreading(const PhysicalParameters& parameters, double omega, double theta, DirectionalBase base);

#endif // SO_DIRECTIONAL_H
