#ifndef SO_SURFACE_H
#define SO_SURFACE_H

#include <cstdint>
#include <memory>
#include <vector>

#include "camera.h"
#include "model.h"
#include "ocean.h"
#include "parameters.h"
#include "wave_field.h"

/**
 * Renderable ocean patch: builds the base spectrum, propagates it every frame
 * and turns the displacement field into a tiled triangle mesh.
 */
struct Surface {
    explicit Surface(OceanSettings settings);

    void update(double dt);
    void draw(uint32_t shader, const Camera& camera);
    void reload_settings(OceanSettings new_settings);

    inline double get_simulation_time() const { return this->simulation_time; }

public:
    // Real-time parameters
    int num_tiles = 4;
    float vertex_distance = 16.0;
    float simulation_speed = 1.0;
    float choppiness = 1.0;

private:
    void update_vertices();

private:
    double simulation_time = 0.0;
    OceanSettings settings;

    WaveField field;
    std::unique_ptr<Ocean> ocean;
    DisplacementField displacement;

    std::vector<Vertex> vertices;
    std::unique_ptr<RawModel> surface_model;
};

#endif // SO_SURFACE_H
