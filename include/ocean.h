#ifndef SO_OCEAN_H
#define SO_OCEAN_H

#include <complex>
#include <iostream>
#include <vector>

#include <cuda_runtime_api.h>
#include <cuda.h>
#include <cufft.h>

#include <glm/glm.hpp>

#include "parameters.h"

#define SO_CUDA_CHECK(call) do { cudaError_t so_err = (call); if (so_err != cudaSuccess) std::cout \
    << "Cuda Error: " << so_err << ", Line: " << __LINE__ << ", " \
    << cudaGetErrorString(so_err) << std::endl; } while (0)
#define SO_CUFFT_CHECK(call) do { cufftResult so_err = (call); if (so_err != CUFFT_SUCCESS) \
    std::cout << "Cufft Error: " << so_err << ", Line: " << __LINE__ << std::endl; } while (0)

/**
 * Per-sample displacement of the surface, row-major with row index along y.
 * x: horizontal displacement along x, y: height, z: horizontal displacement along y.
 */
using DisplacementField = std::vector<glm::dvec3>;

/**
 * Propagates a base spectrum in time and transforms it into spatial
 * displacements. Owns all scratch memory; an instance must not be used by
 * more than one thread at a time.
 */
struct Ocean {
    explicit Ocean(int resolution);
    ~Ocean();

    Ocean(const Ocean&) = delete;
    Ocean& operator=(const Ocean&) = delete;

    DisplacementField new_displacement() const;

    /**
     * Evaluate the displacement field at `time`.
     *
     * `samples` and `omega` are the base amplitudes and angular frequencies
     * from build_height_spectrum; `displacement` must come from new_displacement.
     */
    void propagate(double time, const PhysicalParameters& parameters,
        const std::vector<std::complex<double>>& samples, const std::vector<double>& omega,
        DisplacementField& displacement);

    inline int get_resolution() const { return this->resolution; }

private:
    // Inverse 2D transform of `spectrum`; result is left transposed in fft_buffer.
    void spectral_to_spatial(std::vector<std::complex<double>>& spectrum);
    void transform_rows(const std::vector<std::complex<double>>& input);

    template <typename Component>
    void correct(DisplacementField& displacement, Component component);

private:
    int resolution;

    cufftHandle plan;
    cufftDoubleComplex* allocation_device = nullptr;

    std::vector<std::complex<double>> fft_buffer;
    std::vector<std::complex<double>> displacement_x; // x-displacement of h(k, t)
    std::vector<std::complex<double>> displacement_y; // h(k, t)
    std::vector<std::complex<double>> displacement_z; // z-displacement of h(k, t)
};

#endif // SO_OCEAN_H
