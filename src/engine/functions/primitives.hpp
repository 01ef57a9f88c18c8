#pragma once

#include "pch.hpp"
#include "engine/world/geometry.hpp"

namespace Primitives {
    // Ring around the z axis with smooth normals.
    Geometry torus(real radius = 1.0f, real tube = 0.4f, int radialSegments = 12,
                   int tubularSegments = 48, real arc = glm::two_pi<real>());
} // namespace Primitives
