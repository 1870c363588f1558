#include "camera.h"

#include <algorithm>
#include <cmath>

#include <glm/gtc/matrix_transform.hpp>

glm::vec3 Camera::get_position() const {
    float r_yaw = glm::radians(this->yaw);
    float r_pitch = glm::radians(this->pitch);
    glm::vec3 offset(
        std::cos(r_pitch) * std::sin(r_yaw),
        std::sin(r_pitch),
        std::cos(r_pitch) * std::cos(r_yaw)
    );
    return target + distance * offset;
}

glm::mat4 Camera::get_view_projection() const {
    glm::mat4 view = glm::lookAt(get_position(), target, glm::vec3(0.0, 1.0, 0.0));
    glm::mat4 projection = glm::perspective(glm::radians(this->fovy), this->aspect, this->near, this->far);
    return projection * view;
}

void Camera::rotate_yaw(float dt) {
    this->yaw += dt * rotation_speed;
}

void Camera::rotate_pitch(float dt) {
    // Stay above the surface and short of the pole where lookAt degenerates
    this->pitch = std::clamp(this->pitch + dt * rotation_speed, 1.0f, 89.0f);
}

void Camera::zoom(float dt) {
    this->distance = std::clamp(this->distance - dt * zoom_speed, this->near * 10.0f, this->far * 0.5f);
}
