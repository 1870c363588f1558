/**
 * @file test_dispersion.cpp
 * @brief Unit tests for the peak frequency and the capillary dispersion relation
 */

#include <gtest/gtest.h>

#include <cmath>

#include "dispersion.h"
#include "parameters.h"

class DispersionTest : public ::testing::Test {
protected:
    void SetUp() override {
        params.surface_tension = 0.072;
        params.water_density = 1000.0;
        params.water_depth = 1000.0;
        params.gravity = 9.81;
        params.wind_speed = 10.0;
        params.fetch = 50000.0;
    }

    PhysicalParameters params;
};

TEST_F(DispersionTest, PeakFrequency) {
    EXPECT_NEAR(dispersion_peak(9.81, 10.0, 50000.0), 1.270219232948748, 1e-12);

    // Stronger wind over longer fetch moves the peak to lower frequencies
    EXPECT_LT(dispersion_peak(9.81, 20.0, 50000.0), dispersion_peak(9.81, 10.0, 50000.0));
    EXPECT_LT(dispersion_peak(9.81, 10.0, 100000.0), dispersion_peak(9.81, 10.0, 50000.0));
}

TEST_F(DispersionTest, ZeroWaveNumberIsZero) {
    DispersionSample sample = dispersion_capillary(params, 0.0);
    EXPECT_EQ(sample.omega, 0.0);
    EXPECT_EQ(sample.d_omega, 0.0);
}

TEST_F(DispersionTest, DeepWaterLimit) {
    double k = 1.0;
    DispersionSample sample = dispersion_capillary(params, k);
    double expected = std::sqrt(params.gravity * k + params.surface_tension / params.water_density * k * k * k);
    EXPECT_NEAR(sample.omega, expected, 1e-12);
    // tanh(h k) saturates, so d_omega is the deep water derivative
    EXPECT_NEAR(sample.d_omega, (params.gravity + 3.0 * 0.072e-3 * k * k) / (2.0 * expected), 1e-12);
}

TEST_F(DispersionTest, MonotonicInWaveNumber) {
    double previous = dispersion_capillary(params, 0.001).omega;
    for (double k = 0.002; k < 200.0; k *= 1.1) {
        double omega = dispersion_capillary(params, k).omega;
        EXPECT_LT(previous, omega) << "k = " << k;
        previous = omega;
    }
}

TEST_F(DispersionTest, DerivativeMatchesFiniteDifference) {
    params.water_depth = 2.0; // shallow, so the sech^2 term matters

    for (double k : { 0.05, 0.3, 1.0, 5.0, 50.0 }) {
        double step = 1e-6 * k;
        double forward = dispersion_capillary(params, k + step).omega;
        double backward = dispersion_capillary(params, k - step).omega;
        double numeric = (forward - backward) / (2.0 * step);

        double analytic = dispersion_capillary(params, k).d_omega;
        EXPECT_NEAR(analytic, numeric, 1e-6 * std::abs(numeric)) << "k = " << k;
    }
}

TEST_F(DispersionTest, StableNearZero) {
    for (double k : { 1e-15, 1e-12, 1e-9, 1e-6 }) {
        DispersionSample sample = dispersion_capillary(params, k);
        EXPECT_TRUE(std::isfinite(sample.omega)) << "k = " << k;
        EXPECT_TRUE(std::isfinite(sample.d_omega)) << "k = " << k;
        EXPECT_GE(sample.omega, 0.0);
    }
}
