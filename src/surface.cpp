#include "surface.h"

#include <iostream>
#include <stdexcept>

#include <glm/gtc/matrix_transform.hpp>

#include "spectrum.h"

Surface::Surface(OceanSettings settings) {
    reload_settings(settings);
    if (!ocean) {
        throw std::invalid_argument("ERROR (Surface): Invalid initial ocean settings");
    }
}

void Surface::update(double dt) {
    simulation_time += simulation_speed * dt;
    ocean->propagate(simulation_time, settings.parameters, field.amplitudes, field.frequencies, displacement);
    update_vertices();
    surface_model->update_vertex_data(vertices);
}

void Surface::draw(uint32_t shader, const Camera& camera) {
    GLint view_proj_loc = glGetUniformLocation(shader, "u_ViewProjection");
    GLint model_loc = glGetUniformLocation(shader, "u_Model");
    GLint camera_pos_loc = glGetUniformLocation(shader, "u_CameraPos");
    GLint height_scale_loc = glGetUniformLocation(shader, "u_HeightScale");

    glm::vec3 camera_position = camera.get_position();
    glm::mat4 view_projection = camera.get_view_projection();

    glUseProgram(shader);
    glUniformMatrix4fv(view_proj_loc, 1, false, &view_projection[0][0]);
    glUniform3f(camera_pos_loc, camera_position.x, camera_position.y, camera_position.z);
    glUniform1f(height_scale_loc, vertex_distance / float(settings.parameters.domain_size));

    surface_model->bind();
    for (int z = 0; z < num_tiles; z++) {
        for (int x = 0; x < num_tiles; x++) {
            glm::mat4 tile_matrix = glm::translate(glm::mat4(1.0),
                glm::vec3(vertex_distance * (x - num_tiles / 2.0f), 0.0, vertex_distance * (z - num_tiles / 2.0f))
            );
            glUniformMatrix4fv(model_loc, 1, false, &tile_matrix[0][0]);
            surface_model->draw();
        }
    }
    surface_model->unbind();
}

void Surface::reload_settings(OceanSettings new_settings) {
    if (!new_settings.parameters.is_valid() || new_settings.N <= 0) {
        std::cout << "ERROR (reload_settings): Invalid ocean settings, keeping the current surface" << std::endl;
        return;
    }

    settings = new_settings;
    int N = settings.N;

    std::unique_ptr<Spectrum> spectrum = make_spectrum(settings.spectrum, settings.parameters);
    field = build_height_spectrum(settings.parameters, *spectrum, N, RandomSource(settings.seed));

    if (!ocean || ocean->get_resolution() != N) {
        ocean = std::make_unique<Ocean>(N);
        displacement = ocean->new_displacement();
    }

    // One extra row and column so that tiles share their borders
    int Nplus1 = N + 1;
    vertices.assign(Nplus1 * Nplus1, Vertex{ glm::vec3(0.0f), glm::vec3(0.0f, 1.0f, 0.0f) });

    std::vector<uint32_t> indices;
    indices.reserve(N * N * 6);
    for (int z = 0; z < N; z++) {
        for (int x = 0; x < N; x++) {
            uint32_t i0 = z * Nplus1 + x;
            uint32_t i1 = (z + 1) * Nplus1 + x;
            uint32_t i2 = (z + 1) * Nplus1 + (x + 1);
            uint32_t i3 = z * Nplus1 + (x + 1);
            indices.insert(indices.end(), { i3, i0, i1, i1, i2, i3 });
        }
    }

    surface_model.reset();
    surface_model = std::make_unique<RawModel>(vertices, indices);
    simulation_time = 0.0;
}

void Surface::update_vertices() {
    int N = settings.N;
    int Nplus1 = N + 1;
    float scale = vertex_distance / float(settings.parameters.domain_size);
    float spacing = float(settings.parameters.domain_size) / N;

    for (int z = 0; z < Nplus1; z++) {
        for (int x = 0; x < Nplus1; x++) {
            int i_v = z * Nplus1 + x;
            const glm::dvec3& d = displacement[(z % N) * N + x % N];

            glm::vec3 origin_position(x * spacing, 0.0f, z * spacing);
            glm::vec3 offset(choppiness * d.x, d.y, choppiness * d.z);
            vertices[i_v].position = scale * (origin_position + offset);
        }
    }

    // Central differences of the displaced grid, wrapping around the periodic patch
    for (int z = 0; z < Nplus1; z++) {
        for (int x = 0; x < Nplus1; x++) {
            int left = z * Nplus1 + (x == 0 ? N - 1 : x - 1);
            int right = z * Nplus1 + (x == N ? 1 : x + 1);
            int back = (z == 0 ? N - 1 : z - 1) * Nplus1 + x;
            int front = (z == N ? 1 : z + 1) * Nplus1 + x;

            glm::vec3 tangent_x = vertices[right].position - vertices[left].position;
            glm::vec3 tangent_z = vertices[front].position - vertices[back].position;
            if (x == 0 || x == N) tangent_x.x = 2.0f * spacing * scale;
            if (z == 0 || z == N) tangent_z.z = 2.0f * spacing * scale;

            vertices[z * Nplus1 + x].normal = glm::normalize(glm::cross(tangent_z, tangent_x));
        }
    }
}
