#pragma once

#include "pch.hpp"

// Euler angles are applied X, then Y, then Z.
struct Transform {
    vec3 position = vec3(0.0f);
    vec3 rotation = vec3(0.0f);
    vec3 scale = vec3(1.0f);
};

struct Motion {
    vec3 velocity = vec3(0.0f);
};

struct Time : Resource {
    real now = 0.0f;
    real delta = 0.0f;
    size_t frames = 0;
};

inline mat4 modelMatrix(const Transform &transform) {
    mat4 model = glm::translate(mat4(1.0f), transform.position);
    model = glm::rotate(model, transform.rotation.x, vec3(1.0f, 0.0f, 0.0f));
    model = glm::rotate(model, transform.rotation.y, vec3(0.0f, 1.0f, 0.0f));
    model = glm::rotate(model, transform.rotation.z, vec3(0.0f, 0.0f, 1.0f));
    return glm::scale(model, transform.scale);
}
