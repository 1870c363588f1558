/**
 * @file test_directional.cpp
 * @brief Unit tests for directional spreading and the quadrature it relies on
 */

#include <gtest/gtest.h>

#include <cmath>

#include <glm/gtc/constants.hpp>

#include "directional.h"
#include "dispersion.h"
#include "integration.h"
#include "parameters.h"

namespace {
const double pi = glm::pi<double>();
}

class DirectionalTest : public ::testing::Test {
protected:
    void SetUp() override {
        omega_peak = dispersion_peak(params.gravity, params.wind_speed, params.fetch);
    }

    PhysicalParameters params;
    double omega_peak = 0.0;
};

TEST(TrapezoidalQuadratureTest, ExactForLinear) {
    double integral = trapezoidal_quadrature(0.0, 1.0, 5, [](double x) { return 2.0 * x + 1.0; });
    EXPECT_NEAR(integral, 2.0, 1e-14);
}

TEST(TrapezoidalQuadratureTest, ConvergesForSmooth) {
    double integral = trapezoidal_quadrature(0.0, pi, 1001, [](double x) { return std::sin(x); });
    EXPECT_NEAR(integral, 2.0, 1e-5);
}

TEST_F(DirectionalTest, ElongationWithoutSwellIsOne) {
    params.swell = 0.0;
    for (double theta : { -pi, -1.0, 0.0, 2.0, pi }) {
        EXPECT_DOUBLE_EQ(directional_elongation(params, omega_peak, theta), 1.0);
    }
}

TEST_F(DirectionalTest, ElongationWithSwell) {
    params.swell = 1.0;
    EXPECT_DOUBLE_EQ(directional_elongation(params, omega_peak, 0.0), 1.0);
    EXPECT_NEAR(directional_elongation(params, omega_peak, pi), 0.0, 1e-12);
    // Angles outside [-pi, pi] are clamped
    EXPECT_DOUBLE_EQ(directional_elongation(params, omega_peak, 4.0),
                     directional_elongation(params, omega_peak, pi));
}

TEST_F(DirectionalTest, DonelanBannerAtPeak) {
    // omega / omega_peak = 1 lies in the middle regime, beta = 2.28
    EXPECT_NEAR(directional_base_donelan_banner(params, omega_peak, 0.0), 1.1400013689227284, 1e-9);
}

TEST_F(DirectionalTest, DonelanBannerSymmetricAndPeakedDownwind) {
    for (double ratio : { 0.5, 1.0, 1.3, 2.0, 5.0 }) {
        double omega = ratio * omega_peak;
        double downwind = directional_base_donelan_banner(params, omega, 0.0);
        for (double theta : { 0.3, 1.0, 2.5 }) {
            double left = directional_base_donelan_banner(params, omega, -theta);
            double right = directional_base_donelan_banner(params, omega, theta);
            EXPECT_DOUBLE_EQ(left, right);
            EXPECT_LT(right, downwind);
        }
    }
}

TEST_F(DirectionalTest, SpreadingIntegratesToOne) {
    for (double swell : { 0.0, 0.5, 1.0 }) {
        params.swell = swell;
        for (double ratio : { 0.4, 0.95, 1.2, 1.6, 3.0, 10.0 }) {
            double omega = ratio * omega_peak;
            auto spreading = [&](double theta) {
                return directional_spreading(params, omega, theta, directional_base_donelan_banner);
            };

            // Same rule as the normalization: exact up to rounding
            EXPECT_NEAR(trapezoidal_quadrature(-pi, pi, directional_quadrature_samples, spreading), 1.0, 1e-12);
            // Finer rule: within the quadrature error
            EXPECT_NEAR(trapezoidal_quadrature(-pi, pi, 4096, spreading), 1.0, 1e-2)
                << "swell = " << swell << ", ratio = " << ratio;
        }
    }
}

TEST_F(DirectionalTest, SpreadingIsRecomputedPerFrequency) {
    double low = directional_spreading(params, 0.5 * omega_peak, 0.0, directional_base_donelan_banner);
    double high = directional_spreading(params, 3.0 * omega_peak, 0.0, directional_base_donelan_banner);
    EXPECT_NE(low, high);

    double again = directional_spreading(params, 0.5 * omega_peak, 0.0, directional_base_donelan_banner);
    EXPECT_EQ(low, again);
}
