#pragma once

#include "pch.hpp"

struct Bounds {
    vec3 min = vec3(std::numeric_limits<real>::max());
    vec3 max = vec3(std::numeric_limits<real>::lowest());

    bool empty() const { return min.x > max.x; }
    vec3 center() const { return (min + max) * 0.5f; }
    vec3 size() const { return max - min; }
};

// Non-indexed triangle list, interleaved as position.xyz normal.xyz.
struct Geometry {
    static constexpr size_t STRIDE = 6;

    std::vector<real> vertices;

    void push(const vec3 &position, const vec3 &normal) {
        vertices.insert(vertices.end(), {position.x, position.y, position.z,
                                         normal.x, normal.y, normal.z});
    }

    // Flat-shaded triangle; the normal follows the a, b, c winding.
    void pushTriangle(const vec3 &a, const vec3 &b, const vec3 &c) {
        vec3 normal = glm::cross(b - a, c - a);
        real length = glm::length(normal);
        normal = length > 0.0f ? normal / length : vec3(0.0f, 0.0f, 1.0f);
        push(a, normal);
        push(b, normal);
        push(c, normal);
    }

    size_t vertexCount() const { return vertices.size() / STRIDE; }
    size_t triangleCount() const { return vertexCount() / 3; }
    size_t byteSize() const { return vertices.size() * sizeof(real); }

    vec3 position(size_t index) const {
        const real *v = &vertices[index * STRIDE];
        return vec3(v[0], v[1], v[2]);
    }
    vec3 normal(size_t index) const {
        const real *v = &vertices[index * STRIDE + 3];
        return vec3(v[0], v[1], v[2]);
    }

    Bounds bounds() const {
        Bounds box;
        for (size_t i = 0; i < vertexCount(); ++i) {
            vec3 p = position(i);
            box.min = glm::min(box.min, p);
            box.max = glm::max(box.max, p);
        }
        return box;
    }

    void translate(const vec3 &offset) {
        for (size_t i = 0; i < vertices.size(); i += STRIDE) {
            vertices[i] += offset.x;
            vertices[i + 1] += offset.y;
            vertices[i + 2] += offset.z;
        }
    }

    // Moves the bounding-box center to the origin.
    void center() {
        Bounds box = bounds();
        if (!box.empty())
            translate(-box.center());
    }
};

// Owns every CPU-side geometry. GPU buffers are created and destroyed by the
// renderer, which drains `uploads` and `releases` on each sync.
class Geometries {
  private:
    std::unordered_map<GeometryID, Geometry> geometries;
    std::vector<GeometryID> uploads;
    std::vector<GeometryID> releases;
    GeometryID nextID = 1;

  public:
    Geometries() = default;

    GeometryID add(Geometry geometry) {
        GeometryID id = nextID++;
        geometries.emplace(id, std::move(geometry));
        uploads.push_back(id);
        return id;
    }

    void release(GeometryID &id) {
        if (geometries.erase(id) > 0) {
            auto pending = std::find(uploads.begin(), uploads.end(), id);
            if (pending != uploads.end())
                uploads.erase(pending);
            else
                releases.push_back(id);
        }
        id = NULL_GEOMETRY;
    }

    bool contains(GeometryID id) const { return geometries.count(id) > 0; }

    const Geometry &get(GeometryID id) const {
        auto it = geometries.find(id);
        if (it == geometries.end())
            throw std::out_of_range("Unknown geometry " + std::to_string(id));
        return it->second;
    }

    size_t size() const { return geometries.size(); }

    std::vector<GeometryID> takeUploads() { return std::exchange(uploads, {}); }
    std::vector<GeometryID> takeReleases() { return std::exchange(releases, {}); }
    size_t pendingReleases() const { return releases.size(); }
};
