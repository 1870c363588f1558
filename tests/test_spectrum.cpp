/**
 * @file test_spectrum.cpp
 * @brief Unit tests for the JONSWAP and TMA spectra
 */

#include <gtest/gtest.h>

#include <cmath>
#include <memory>

#include "dispersion.h"
#include "parameters.h"
#include "spectrum.h"

class SpectrumTest : public ::testing::Test {
protected:
    SpectrumJONSWAP jonswap{ 10.0, 50000.0, 9.81 };
    double omega_peak = dispersion_peak(9.81, 10.0, 50000.0);
};

TEST_F(SpectrumTest, ZeroAtAndBelowZeroFrequency) {
    SpectrumTMA tma(jonswap, 20.0);
    for (double omega : { -10.0, -1.0, 0.0, 1e-17 }) {
        EXPECT_EQ(jonswap.evaluate(omega), 0.0) << "omega = " << omega;
        EXPECT_EQ(tma.evaluate(omega), 0.0) << "omega = " << omega;
    }
}

TEST_F(SpectrumTest, JONSWAPAtPeak) {
    // r = 1 at the peak, so the enhancement is the full gamma = 3.3
    EXPECT_NEAR(jonswap.evaluate(omega_peak), 0.32245078642698427, 1e-12);
}

TEST_F(SpectrumTest, JONSWAPIsPeaked) {
    double peak = jonswap.evaluate(omega_peak);
    EXPECT_GT(peak, jonswap.evaluate(0.7 * omega_peak));
    EXPECT_GT(peak, jonswap.evaluate(1.5 * omega_peak));
    EXPECT_GT(jonswap.evaluate(2.0 * omega_peak), jonswap.evaluate(4.0 * omega_peak));
    EXPECT_GT(jonswap.evaluate(4.0 * omega_peak), 0.0);
}

TEST_F(SpectrumTest, DepthAttenuationContinuousAtOne) {
    double depth = 20.0;
    SpectrumTMA tma(jonswap, depth);

    // omega_h = omega * sqrt(depth / g) = 1
    double omega = std::sqrt(9.81 / depth);
    EXPECT_NEAR(tma.kitaigorodskii_depth_attenuation(omega), 0.5, 1e-12);
    EXPECT_NEAR(tma.kitaigorodskii_depth_attenuation(omega * (1.0 - 1e-9)), 0.5, 1e-8);
    EXPECT_NEAR(tma.kitaigorodskii_depth_attenuation(omega * (1.0 + 1e-9)), 0.5, 1e-8);
}

TEST_F(SpectrumTest, DepthAttenuationRange) {
    double depth = 20.0;
    SpectrumTMA tma(jonswap, depth);
    double omega_unit = std::sqrt(9.81 / depth);

    EXPECT_EQ(tma.kitaigorodskii_depth_attenuation(0.0), 0.0);
    EXPECT_NEAR(tma.kitaigorodskii_depth_attenuation(0.5 * omega_unit), 0.125, 1e-12);
    EXPECT_NEAR(tma.kitaigorodskii_depth_attenuation(1.5 * omega_unit), 0.875, 1e-12);
    EXPECT_EQ(tma.kitaigorodskii_depth_attenuation(2.0 * omega_unit), 1.0);
    EXPECT_EQ(tma.kitaigorodskii_depth_attenuation(10.0 * omega_unit), 1.0);
}

TEST_F(SpectrumTest, TMAMatchesJONSWAPInDeepWater) {
    SpectrumTMA tma(jonswap, 1000.0);
    for (double ratio : { 0.5, 1.0, 2.0, 6.0 }) {
        double omega = ratio * omega_peak;
        EXPECT_DOUBLE_EQ(tma.evaluate(omega), jonswap.evaluate(omega));
    }
}

TEST_F(SpectrumTest, TMAAttenuatesInShallowWater) {
    SpectrumTMA tma(jonswap, 1.0);
    // omega_h = 1.27 * sqrt(1 / 9.81) ~ 0.41
    EXPECT_LT(tma.evaluate(omega_peak), 0.1 * jonswap.evaluate(omega_peak));
}

TEST(MakeSpectrumTest, SelectsKind) {
    PhysicalParameters params;
    params.water_depth = 5.0;

    std::unique_ptr<Spectrum> jonswap = make_spectrum(SpectrumKind::JONSWAP, params);
    std::unique_ptr<Spectrum> tma = make_spectrum(SpectrumKind::TMA, params);

    ASSERT_NE(dynamic_cast<SpectrumJONSWAP*>(jonswap.get()), nullptr);
    SpectrumTMA* as_tma = dynamic_cast<SpectrumTMA*>(tma.get());
    ASSERT_NE(as_tma, nullptr);
    EXPECT_EQ(as_tma->depth, 5.0);
    EXPECT_EQ(as_tma->jonswap.wind_speed, params.wind_speed);
    EXPECT_EQ(as_tma->jonswap.fetch, params.fetch);
    EXPECT_EQ(as_tma->jonswap.gravity, params.gravity);
}
