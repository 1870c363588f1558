#include "kernel.h"

#include <cassert>
#include <cmath>
#include <stdexcept>

#include <glm/gtc/constants.hpp>

// Radii below this are treated as coincident particles
static const double radius_epsilon = 0.00001;

Poly6::Poly6(double smoothing_radius) : h(smoothing_radius) {
    const double pi = glm::pi<double>();
    double h9 = std::pow(smoothing_radius, 9);
    w_const = 315.0 / 64.0 / (pi * h9);
    grad_w_const = -945.0 / 32.0 / (pi * h9);
}

double Poly6::w(double radius) const {
    assert(radius >= 0.0);
    if (h <= radius) {
        return 0.0;
    }
    double diff = h * h - radius * radius;
    return w_const * diff * diff * diff;
}

double Poly6::grad_w(double radius) const {
    assert(radius >= 0.0);
    if (h <= radius) {
        return 0.0;
    }
    double diff = h * h - radius * radius;
    return grad_w_const * diff * diff;
}

double Poly6::laplace_w(double) const {
    throw std::logic_error("Poly6::laplace_w is not implemented");
}

Spiky::Spiky(double smoothing_radius) : h(smoothing_radius) {
    const double pi = glm::pi<double>();
    double h6 = std::pow(smoothing_radius, 6);
    w_const = 15.0 / (pi * h6);
    grad_w_const = -45.0 / (pi * h6);
}

double Spiky::w(double radius) const {
    assert(radius >= 0.0);
    if (h <= radius) {
        return 0.0;
    }
    double diff = h - radius;
    return w_const * diff * diff * diff;
}

double Spiky::grad_w(double radius) const {
    assert(radius >= 0.0);
    if (h <= radius || radius < radius_epsilon) {
        return 0.0;
    }
    double diff = h - radius;
    return grad_w_const * diff * diff / radius;
}

double Spiky::laplace_w(double) const {
    throw std::logic_error("Spiky::laplace_w is not implemented");
}

Viscosity::Viscosity(double smoothing_radius) : h(smoothing_radius) {
    const double pi = glm::pi<double>();
    w_const = 7.5 / (pi * std::pow(smoothing_radius, 3));
    laplace_w_const = 45.0 / (pi * std::pow(smoothing_radius, 6));
}

double Viscosity::w(double radius) const {
    assert(radius >= 0.0);
    if (h <= radius || radius < radius_epsilon) {
        return 0.0;
    }
    double q = radius / h;
    double fac = -q * q * q / 2.0 + q * q + h / (2.0 * radius) - 1.0;
    return w_const * fac;
}

double Viscosity::grad_w(double) const {
    throw std::logic_error("Viscosity::grad_w is not implemented");
}

double Viscosity::laplace_w(double radius) const {
    assert(radius >= 0.0);
    if (h <= radius) {
        return 0.0;
    }
    return laplace_w_const * (h - radius);
}
