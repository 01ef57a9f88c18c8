#include "engine/functions/primitives.hpp"

namespace Primitives {

    Geometry torus(real radius, real tube, int radialSegments, int tubularSegments, real arc) {
        radialSegments = std::max(radialSegments, 3);
        tubularSegments = std::max(tubularSegments, 3);

        std::vector<vec3> positions;
        std::vector<vec3> normals;
        for (int j = 0; j <= radialSegments; ++j) {
            for (int i = 0; i <= tubularSegments; ++i) {
                real u = static_cast<real>(i) / tubularSegments * arc;
                real v = static_cast<real>(j) / radialSegments * glm::two_pi<real>();
                vec3 position((radius + tube * std::cos(v)) * std::cos(u),
                              (radius + tube * std::cos(v)) * std::sin(u),
                              tube * std::sin(v));
                vec3 center(radius * std::cos(u), radius * std::sin(u), 0.0f);
                positions.push_back(position);
                normals.push_back(glm::normalize(position - center));
            }
        }

        Geometry geometry;
        geometry.vertices.reserve(static_cast<size_t>(radialSegments) * tubularSegments * 6 * Geometry::STRIDE);
        auto emit = [&](size_t index) { geometry.push(positions[index], normals[index]); };
        size_t row = static_cast<size_t>(tubularSegments) + 1;
        for (size_t j = 1; j <= static_cast<size_t>(radialSegments); ++j) {
            for (size_t i = 1; i <= static_cast<size_t>(tubularSegments); ++i) {
                size_t a = row * j + i - 1;
                size_t b = row * (j - 1) + i - 1;
                size_t c = row * (j - 1) + i;
                size_t d = row * j + i;
                emit(a);
                emit(b);
                emit(d);
                emit(b);
                emit(c);
                emit(d);
            }
        }
        return geometry;
    }

} // namespace Primitives
