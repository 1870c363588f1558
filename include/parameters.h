#ifndef SO_PARAMETERS_H
#define SO_PARAMETERS_H

#include <cmath>
#include <cstdint>

/**
 * Physical quantities shared by the spectrum, dispersion and spreading models.
 * Units are SI unless noted.
 */
struct PhysicalParameters {
    double surface_tension = 0.072; // [N/m]
    double water_density = 1000.0;  // [kg/m^3]
    double water_depth = 1000.0;    // [m]
    double gravity = 9.81;          // [m/s^2]
    double wind_speed = 10.0;       // [m/s]
    double fetch = 50000.0;         // [m]
    double swell = 0.0;
    double domain_size = 64.0;      // [m] side of the simulated patch

    bool is_valid() const {
        return std::isfinite(surface_tension) && std::isfinite(water_density)
            && std::isfinite(water_depth) && std::isfinite(gravity)
            && std::isfinite(wind_speed) && std::isfinite(fetch)
            && std::isfinite(swell) && std::isfinite(domain_size)
            && gravity > 0.0 && domain_size > 0.0 && water_density > 0.0;
    }
};

enum class SpectrumKind {
    JONSWAP = 0,
    TMA = 1,
};

struct OceanSettings {
    int N = 256;
    uint64_t seed = 1337;
    SpectrumKind spectrum = SpectrumKind::TMA;
    PhysicalParameters parameters;
};

#endif // SO_PARAMETERS_H
