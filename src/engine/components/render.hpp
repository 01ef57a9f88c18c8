#pragma once

#include "pch.hpp"

struct Mesh {
    GeometryID geometry = NULL_GEOMETRY;
    bool render = true;
};

// matcap: shade with the matcap texture tinted by color, otherwise flat color
struct Material {
    vec3 color = vec3(1.0f);
    bool matcap = false;
};

inline vec3 hexToColor(uint32_t hex) {
    return vec3((hex >> 16) & 0xff, (hex >> 8) & 0xff, hex & 0xff) / 255.0f;
}

inline uint32_t colorToHex(const vec3 &color) {
    auto channel = [](real value) {
        return static_cast<uint32_t>(std::lround(glm::clamp(value, 0.0f, 1.0f) * 255.0f));
    };
    return (channel(color.r) << 16) | (channel(color.g) << 8) | channel(color.b);
}
