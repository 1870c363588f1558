#ifndef SO_MODEL_H
#define SO_MODEL_H

#include <cstdint>
#include <vector>

#include <glad/glad.h>
#include <glm/glm.hpp>

struct Vertex {
    glm::vec3 position;
    glm::vec3 normal;
};

/**
 * Indexed triangle mesh living in GL buffers. Owns its vertex array and
 * buffers and releases them on destruction.
 */
struct RawModel {
    RawModel(const std::vector<Vertex>& vertices, const std::vector<uint32_t>& indices);
    ~RawModel();

    RawModel(const RawModel&) = delete;
    RawModel& operator=(const RawModel&) = delete;

    void update_vertex_data(const std::vector<Vertex>& vertices);

    inline void bind() { glBindVertexArray(this->renderer_id); }
    inline void unbind() { glBindVertexArray(0); }
    inline void draw() { glDrawElements(GL_TRIANGLES, this->index_count, GL_UNSIGNED_INT, 0); }

private:
    GLuint renderer_id, vbo, ebo;
    size_t vertex_count;
    GLsizei index_count;
};

#endif // SO_MODEL_H
