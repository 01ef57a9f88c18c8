#pragma once

#include "pch.hpp"
#include "engine/world/geometry.hpp"
#include "engine/functions/typeface.hpp"

struct ExtrudeOptions {
    real depth = 1.0f;
    int steps = 1;
    bool bevelEnabled = true;
    real bevelThickness = 0.2f;
    real bevelSize = 0.1f;
    real bevelOffset = 0.0f;
    int bevelSegments = 3;
};

namespace Extrude {
    // Extrudes along +z from 0 to `depth`; bevel layers extend
    // `bevelThickness` beyond both faces.
    Geometry shapes(const std::vector<Shape> &shapes, const ExtrudeOptions &options);

    // Unit-distance miter offset of `point`, pointing away from the filled
    // side of a counter-clockwise outline (or clockwise hole).
    vec2 bevelVector(const vec2 &prev, const vec2 &point, const vec2 &next);
} // namespace Extrude
