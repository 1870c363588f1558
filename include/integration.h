#ifndef SO_INTEGRATION_H
#define SO_INTEGRATION_H

#include <cassert>

/**
 * Composite trapezoidal rule over [a, b] using `samples` equally spaced
 * evaluations of f (both end points included).
 */
template <typename F>
double trapezoidal_quadrature(double a, double b, int samples, F&& f) {
    assert(samples >= 2);
    double dx = (b - a) / (samples - 1);
    double sum = 0.5 * (f(a) + f(b));
    for (int i = 1; i < samples - 1; i++) {
        sum += f(a + i * dx);
    }
    return sum * dx;
}

#endif // SO_INTEGRATION_H
