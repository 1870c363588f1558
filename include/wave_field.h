#ifndef SO_WAVE_FIELD_H
#define SO_WAVE_FIELD_H

#include <complex>
#include <vector>

#include <glm/glm.hpp>

#include "parameters.h"
#include "random_source.h"
#include "spectrum.h"

struct SpectrumSample {
    std::complex<double> amplitude;
    double omega;
};

/**
 * Base spectrum of the ocean: one complex amplitude h0(k) and one angular
 * frequency per cell, row-major with row j along y and column i along x.
 */
struct WaveField {
    int resolution = 0;
    std::vector<std::complex<double>> amplitudes;
    std::vector<double> frequencies;

    inline const std::complex<double>& amplitude(int j, int i) const { return amplitudes[j * resolution + i]; }
    inline double frequency(int j, int i) const { return frequencies[j * resolution + i]; }
};

/**
 * Wavevector of cell (i, j) on the centered grid.
 */
glm::dvec2 wave_vector(int i, int j, int resolution, double domain_size);

/**
 * Draw h0(k) for a single wavevector. Zero wavevectors yield a zero sample.
 *
 * Equation 42 in Tessendorf (2001), with the directional spectrum of
 * Horvath (2015) Equation 17 in place of the Phillips spectrum.
 */
SpectrumSample sample_spectrum(const PhysicalParameters& parameters, const Spectrum& spectrum,
    const glm::dvec2& k, RandomEngine& generator);

/**
 * Sample the whole resolution x resolution grid, one random stream per cell.
 */
WaveField build_height_spectrum(const PhysicalParameters& parameters, const Spectrum& spectrum,
    int resolution, const RandomSource& random);

#endif // SO_WAVE_FIELD_H
