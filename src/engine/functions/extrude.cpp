#include <mapbox/earcut.hpp>
#include "engine/functions/extrude.hpp"

namespace {

    struct Layer {
        real z;
        real offset;
    };

    using Point = std::array<real, 2>;

    std::vector<Layer> buildLayers(const ExtrudeOptions &options) {
        int steps = std::max(options.steps, 1);
        int segments = options.bevelEnabled ? std::max(options.bevelSegments, 0) : 0;
        real thickness = options.bevelEnabled ? options.bevelThickness : 0.0f;
        real size = options.bevelEnabled ? options.bevelSize : 0.0f;
        real offset = options.bevelEnabled ? options.bevelOffset : 0.0f;
        real halfPi = glm::half_pi<real>();

        std::vector<Layer> layers;
        for (int b = 0; b < segments; ++b) {
            real t = static_cast<real>(b) / segments;
            layers.push_back({-thickness * std::cos(t * halfPi), size * std::sin(t * halfPi) + offset});
        }
        for (int s = 0; s <= steps; ++s)
            layers.push_back({options.depth / steps * s, size + offset});
        for (int b = segments - 1; b >= 0; --b) {
            real t = static_cast<real>(b) / segments;
            layers.push_back({options.depth + thickness * std::cos(t * halfPi),
                              size * std::sin(t * halfPi) + offset});
        }
        return layers;
    }

    std::vector<vec2> bevelVectors(const Contour &ring) {
        std::vector<vec2> moves(ring.size());
        size_t n = ring.size();
        for (size_t i = 0; i < n; ++i)
            moves[i] = Extrude::bevelVector(ring[(i + n - 1) % n], ring[i], ring[(i + 1) % n]);
        return moves;
    }

    vec3 layerPoint(const Contour &ring, const std::vector<vec2> &moves, size_t i, const Layer &layer) {
        vec2 p = ring[i] + moves[i] * layer.offset;
        return vec3(p, layer.z);
    }

    void addWalls(Geometry &geometry, const Contour &ring, const std::vector<vec2> &moves,
                  const std::vector<Layer> &layers) {
        size_t n = ring.size();
        for (size_t l = 0; l + 1 < layers.size(); ++l) {
            for (size_t i = 0; i < n; ++i) {
                size_t j = (i + 1) % n;
                vec3 a = layerPoint(ring, moves, i, layers[l]);
                vec3 b = layerPoint(ring, moves, j, layers[l]);
                vec3 c = layerPoint(ring, moves, j, layers[l + 1]);
                vec3 d = layerPoint(ring, moves, i, layers[l + 1]);
                geometry.pushTriangle(a, b, c);
                geometry.pushTriangle(a, c, d);
            }
        }
    }

    void addCap(Geometry &geometry, const std::vector<Contour> &rings,
                const std::vector<std::vector<vec2>> &moves, const std::vector<uint32_t> &indices,
                const Layer &layer, bool front) {
        std::vector<vec3> points;
        for (size_t r = 0; r < rings.size(); ++r)
            for (size_t i = 0; i < rings[r].size(); ++i)
                points.push_back(layerPoint(rings[r], moves[r], i, layer));

        vec3 normal(0.0f, 0.0f, front ? -1.0f : 1.0f);
        for (size_t t = 0; t + 2 < indices.size(); t += 3) {
            const vec3 &a = points[indices[t]];
            vec3 b = points[indices[t + 1]];
            vec3 c = points[indices[t + 2]];
            real winding = (b.x - a.x) * (c.y - a.y) - (c.x - a.x) * (b.y - a.y);
            if ((front && winding > 0.0f) || (!front && winding < 0.0f))
                std::swap(b, c);
            geometry.push(a, normal);
            geometry.push(b, normal);
            geometry.push(c, normal);
        }
    }

} // namespace

namespace Extrude {

    vec2 bevelVector(const vec2 &prev, const vec2 &point, const vec2 &next) {
        vec2 in = point - prev;
        vec2 out = next - point;
        real inLength = glm::length(in);
        real outLength = glm::length(out);
        if (inLength <= 0.0f && outLength <= 0.0f)
            return vec2(0.0f);
        in = inLength > 0.0f ? in / inLength : out / outLength;
        out = outLength > 0.0f ? out / outLength : in;

        vec2 inNormal(in.y, -in.x);
        vec2 outNormal(out.y, -out.x);
        vec2 sum = inNormal + outNormal;
        real sumLength = glm::length(sum);
        if (sumLength < 1e-6f)
            return inNormal; // contour folds back on itself

        vec2 direction = sum / sumLength;
        real cosHalf = glm::dot(direction, inNormal);
        vec2 shift = direction / std::max(cosHalf, 1e-6f);
        // sharp corners are capped at a sqrt(2) offset
        if (glm::dot(shift, shift) > 2.0f)
            shift = direction * std::sqrt(2.0f);
        return shift;
    }

    Geometry shapes(const std::vector<Shape> &shapes, const ExtrudeOptions &options) {
        Geometry geometry;
        std::vector<Layer> layers = buildLayers(options);

        for (const Shape &shape : shapes) {
            if (shape.outline.size() < 3)
                continue;
            std::vector<Contour> rings;
            rings.push_back(shape.outline);
            if (ShapeUtils::isClockWise(rings.front()))
                std::reverse(rings.front().begin(), rings.front().end());
            for (const Contour &hole : shape.holes) {
                if (hole.size() < 3)
                    continue;
                rings.push_back(hole);
                if (!ShapeUtils::isClockWise(rings.back()))
                    std::reverse(rings.back().begin(), rings.back().end());
            }

            std::vector<std::vector<vec2>> moves;
            std::vector<std::vector<Point>> polygon;
            for (const Contour &ring : rings) {
                moves.push_back(bevelVectors(ring));
                std::vector<Point> points;
                points.reserve(ring.size());
                for (const vec2 &p : ring)
                    points.push_back({p.x, p.y});
                polygon.push_back(std::move(points));
            }
            std::vector<uint32_t> indices = mapbox::earcut<uint32_t>(polygon);

            addCap(geometry, rings, moves, indices, layers.front(), true);
            addCap(geometry, rings, moves, indices, layers.back(), false);
            for (size_t r = 0; r < rings.size(); ++r)
                addWalls(geometry, rings[r], moves[r], layers);
        }
        return geometry;
    }

} // namespace Extrude
