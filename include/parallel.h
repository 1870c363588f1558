#ifndef SO_PARALLEL_H
#define SO_PARALLEL_H

#include <cstddef>

#include <omp.h>

/**
 * Data-parallel map over [0, count). Iterations must only write disjoint data.
 */
template <typename F>
void parallel_for(std::ptrdiff_t count, F&& body) {
    #pragma omp parallel for schedule(static)
    for (std::ptrdiff_t i = 0; i < count; i++) {
        body(i);
    }
}

#endif // SO_PARALLEL_H
