#include "ocean.h"

#include <cassert>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

#include "parallel.h"
#include "wave_field.h"

Ocean::Ocean(int resolution) : resolution(resolution) {
    assert(resolution > 0);
    int N = resolution;

    fft_buffer.assign(N * N, std::complex<double>(0.0, 0.0));
    displacement_x.assign(N * N, std::complex<double>(0.0, 0.0));
    displacement_y.assign(N * N, std::complex<double>(0.0, 0.0));
    displacement_z.assign(N * N, std::complex<double>(0.0, 0.0));

    cudaError_t cuda_err = cudaMalloc((void**) &allocation_device, sizeof(cufftDoubleComplex) * N * N);
    if (cuda_err != cudaSuccess) {
        allocation_device = nullptr;
        throw std::runtime_error(std::string("ERROR (Ocean): cudaMalloc failed: ") + cudaGetErrorString(cuda_err));
    }

    // One transform per row, all rows in a single batch
    cufftResult fft_err = cufftPlan1d(&plan, N, CUFFT_Z2Z, N);
    if (fft_err != CUFFT_SUCCESS) {
        SO_CUDA_CHECK(cudaFree(allocation_device));
        allocation_device = nullptr;
        throw std::runtime_error("ERROR (Ocean): cufftPlan1d failed with code " + std::to_string(fft_err));
    }
}

Ocean::~Ocean() {
    SO_CUFFT_CHECK(cufftDestroy(plan));
    SO_CUDA_CHECK(cudaFree(allocation_device));
}

DisplacementField Ocean::new_displacement() const {
    return DisplacementField(resolution * resolution, glm::dvec3(0.0));
}

/**
 * The spectrum is sampled on a centered grid, so the plain inverse transform
 * alternates in sign from cell to cell. Negate where (row + col) is even.
 * fft_buffer holds the result transposed, hence the swapped read.
 */
template <typename Component>
void Ocean::correct(DisplacementField& displacement, Component component) {
    int N = this->resolution;
    parallel_for(N * N, [&](std::ptrdiff_t index) {
        int j = index / N;
        int i = index % N;
        double value = fft_buffer[i * N + j].real();
        component(displacement[index]) = (j + i) % 2 == 0 ? -value : value;
    });
}

void Ocean::propagate(double time, const PhysicalParameters& parameters,
    const std::vector<std::complex<double>>& samples, const std::vector<double>& omega,
    DisplacementField& displacement)
{
    int N = this->resolution;
    assert(samples.size() == static_cast<size_t>(N * N));
    assert(omega.size() == static_cast<size_t>(N * N));
    assert(displacement.size() == static_cast<size_t>(N * N));

    // Propagation step, Equation 43 in Tessendorf (2001)
    parallel_for(N * N, [&](std::ptrdiff_t index) {
        int j = index / N;
        int i = index % N;
        glm::dvec2 k = wave_vector(i, j, N, parameters.domain_size);

        double wt = omega[index] * time;
        std::complex<double> disp_pos(std::cos(wt), std::sin(wt));
        std::complex<double> disp_neg(std::cos(wt), -std::sin(wt));

        int reflected = (N - j - 1) * N + (N - i - 1);
        std::complex<double> sample = samples[index] * disp_pos + samples[reflected] * disp_neg;

        glm::dvec2 k_normalized(0.0);
        double k_length = glm::length(k);
        if (k_length >= std::numeric_limits<double>::epsilon()) {
            k_normalized = k / k_length;
        }

        displacement_x[index] = std::complex<double>(0.0, -k_normalized.x) * sample;
        displacement_y[index] = sample;
        displacement_z[index] = std::complex<double>(0.0, -k_normalized.y) * sample;
    });

    spectral_to_spatial(displacement_x);
    correct(displacement, [](glm::dvec3& d) -> double& { return d.x; });

    spectral_to_spatial(displacement_y);
    correct(displacement, [](glm::dvec3& d) -> double& { return d.y; });

    spectral_to_spatial(displacement_z);
    correct(displacement, [](glm::dvec3& d) -> double& { return d.z; });
}

/**
 * Row transforms, transpose, row transforms. The spectrum is used as scratch
 * for the transposed intermediate, so its contents are lost.
 */
void Ocean::spectral_to_spatial(std::vector<std::complex<double>>& spectrum) {
    int N = this->resolution;

    transform_rows(spectrum);

    parallel_for(N * N, [&](std::ptrdiff_t index) {
        int j = index / N;
        int i = index % N;
        spectrum[index] = fft_buffer[i * N + j];
    });

    transform_rows(spectrum);
}

void Ocean::transform_rows(const std::vector<std::complex<double>>& input) {
    size_t bytes = sizeof(cufftDoubleComplex) * input.size();
    SO_CUDA_CHECK(cudaMemcpy(allocation_device, input.data(), bytes, cudaMemcpyHostToDevice));
    // Inverse FFT: h(x) = sum(h~(k) * e^(2 pi i k x / N)), unnormalized
    SO_CUFFT_CHECK(cufftExecZ2Z(plan, allocation_device, allocation_device, CUFFT_INVERSE));
    SO_CUDA_CHECK(cudaMemcpy(fft_buffer.data(), allocation_device, bytes, cudaMemcpyDeviceToHost));
}
