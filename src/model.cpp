#include "model.h"

#include <cassert>
#include <cstddef>
#include <iostream>

RawModel::RawModel(const std::vector<Vertex>& vertices, const std::vector<uint32_t>& indices)
    : vertex_count(vertices.size()), index_count(static_cast<GLsizei>(indices.size()))
{
    assert((indices.size() % 3) == 0);

    glGenVertexArrays(1, &this->renderer_id);
    glBindVertexArray(this->renderer_id);

    glGenBuffers(1, &this->vbo);
    glBindBuffer(GL_ARRAY_BUFFER, this->vbo);
    glBufferData(GL_ARRAY_BUFFER, vertices.size() * sizeof(Vertex), vertices.data(), GL_DYNAMIC_DRAW);

    glGenBuffers(1, &this->ebo);
    glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, this->ebo);
    glBufferData(GL_ELEMENT_ARRAY_BUFFER, indices.size() * sizeof(uint32_t), indices.data(), GL_STATIC_DRAW);

    glEnableVertexAttribArray(0); // Position
    glVertexAttribPointer(0, 3, GL_FLOAT, GL_FALSE, sizeof(Vertex), (const void*) offsetof(Vertex, position));
    glEnableVertexAttribArray(1); // Normal
    glVertexAttribPointer(1, 3, GL_FLOAT, GL_FALSE, sizeof(Vertex), (const void*) offsetof(Vertex, normal));

    unbind();
}

RawModel::~RawModel() {
    glDeleteBuffers(1, &this->ebo);
    glDeleteBuffers(1, &this->vbo);
    glDeleteVertexArrays(1, &this->renderer_id);
}

void RawModel::update_vertex_data(const std::vector<Vertex>& vertices) {
    if (vertices.size() != vertex_count) {
        std::cout << "ERROR (update_vertex_data): Expected " << vertex_count
            << " vertices, got " << vertices.size() << std::endl;
        return;
    }
    glBindBuffer(GL_ARRAY_BUFFER, this->vbo);
    glBufferSubData(GL_ARRAY_BUFFER, 0, vertices.size() * sizeof(Vertex), vertices.data());
    glBindBuffer(GL_ARRAY_BUFFER, 0);
}
