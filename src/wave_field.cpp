#include "wave_field.h"

#include <cassert>
#include <cmath>
#include <limits>

#include <glm/gtc/constants.hpp>

#include "directional.h"
#include "dispersion.h"
#include "parallel.h"

glm::dvec2 wave_vector(int i, int j, int resolution, double domain_size) {
    const double pi = glm::pi<double>();
    double x = 2 * i - resolution - 1;
    double y = 2 * j - resolution - 1;
    return glm::dvec2(pi * x / domain_size, pi * y / domain_size);
}

SpectrumSample sample_spectrum(const PhysicalParameters& parameters, const Spectrum& spectrum,
    const glm::dvec2& k, RandomEngine& generator)
{
    double k_length = glm::length(k);
    if (k_length < std::numeric_limits<double>::epsilon()) {
        return { std::complex<double>(0.0, 0.0), 0.0 };
    }

    const double two_pi = glm::two_pi<double>();
    double theta = std::atan2(k.y, k.x);
    double grad_k = two_pi / parameters.domain_size;

    DispersionSample dispersion = dispersion_capillary(parameters, k_length);
    if (dispersion.omega < std::numeric_limits<double>::epsilon()) {
        // No propagating wave, e.g. zero water depth
        return { std::complex<double>(0.0, 0.0), 0.0 };
    }
    double spreading = directional_spreading(parameters, dispersion.omega, theta, directional_base_donelan_banner);
    double density = spectrum.evaluate(dispersion.omega);

    std::normal_distribution<double> normal(0.0, 1.0);
    std::uniform_real_distribution<double> uniform(0.0, two_pi);
    double z = normal(generator);
    double phase = uniform(generator);

    double amplitude = z * std::sqrt(2.0 * spreading * density * grad_k * grad_k * dispersion.d_omega / k_length);

    return { std::complex<double>(amplitude * std::cos(phase), amplitude * std::sin(phase)), dispersion.omega };
}

WaveField build_height_spectrum(const PhysicalParameters& parameters, const Spectrum& spectrum,
    int resolution, const RandomSource& random)
{
    assert(resolution > 0);

    WaveField field;
    field.resolution = resolution;
    field.amplitudes.assign(resolution * resolution, std::complex<double>(0.0, 0.0));
    field.frequencies.assign(resolution * resolution, 0.0);

    parallel_for(resolution * resolution, [&](std::ptrdiff_t index) {
        int j = index / resolution;
        int i = index % resolution;

        RandomEngine generator = random.stream(index);
        glm::dvec2 k = wave_vector(i, j, resolution, parameters.domain_size);
        SpectrumSample sample = sample_spectrum(parameters, spectrum, k, generator);

        field.amplitudes[index] = sample.amplitude;
        field.frequencies[index] = sample.omega;
    });

    return field;
}
