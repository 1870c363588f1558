#ifndef SO_CAMERA_H
#define SO_CAMERA_H

#include <glm/glm.hpp>

/**
 * Orbit camera looking at a fixed target. Yaw and pitch are in degrees.
 */
struct Camera {
    Camera(glm::vec3 target, float distance,
        float d_yaw, float d_pitch,
        float d_fovy, float aspect_ratio, float near_clip, float far_clip,
        float rot_speed, float zoom_speed
    ) : target(target), distance(distance),
        yaw(d_yaw), pitch(d_pitch),
        fovy(d_fovy), aspect(aspect_ratio), near(near_clip), far(far_clip),
        rotation_speed(rot_speed), zoom_speed(zoom_speed) {};

    glm::mat4 get_view_projection() const;
    glm::vec3 get_position() const;

    void rotate_yaw(float dt);
    void rotate_pitch(float dt);
    void zoom(float dt);

    inline void set_aspect(float aspect) { this->aspect = aspect; }
    inline void set_rotation_speed(float rotation_speed) { this->rotation_speed = rotation_speed; }
    inline void set_zoom_speed(float zoom_speed) { this->zoom_speed = zoom_speed; }

private:
    glm::vec3 target;
    float distance;
    float yaw, pitch;
    float fovy, aspect, near, far;

    float rotation_speed;
    float zoom_speed;
};

#endif // SO_CAMERA_H
