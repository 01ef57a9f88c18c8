#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "helpers.hpp"
#include "engine/functions/extrude.hpp"
#include "engine/functions/primitives.hpp"

using Catch::Matchers::WithinAbs;

namespace {

    Contour square(real min, real max) {
        return {vec2(min, min), vec2(max, min), vec2(max, max), vec2(min, max)};
    }

    ExtrudeOptions flat(real depth) {
        ExtrudeOptions options;
        options.depth = depth;
        options.bevelEnabled = false;
        return options;
    }

} // namespace

TEST_CASE("Geometry triangles and bounds", "[geometry]") {
    Geometry geometry;
    geometry.pushTriangle(vec3(0, 0, 0), vec3(2, 0, 0), vec3(0, 4, 0));

    REQUIRE(geometry.vertexCount() == 3);
    REQUIRE(geometry.triangleCount() == 1);
    REQUIRE(geometry.byteSize() == 18 * sizeof(real));
    REQUIRE_THAT(geometry.normal(0).z, WithinAbs(1.0f, 1e-6f));

    Bounds box = geometry.bounds();
    REQUIRE_THAT(box.max.x, WithinAbs(2.0f, 1e-6f));
    REQUIRE_THAT(box.max.y, WithinAbs(4.0f, 1e-6f));

    geometry.center();
    box = geometry.bounds();
    REQUIRE_THAT(box.center().x, WithinAbs(0.0f, 1e-6f));
    REQUIRE_THAT(box.center().y, WithinAbs(0.0f, 1e-6f));
    REQUIRE_THAT(geometry.position(0).x, WithinAbs(-1.0f, 1e-6f));

    REQUIRE(Geometry{}.bounds().empty());
}

TEST_CASE("Torus matches the donut layout", "[geometry]") {
    Geometry torus = Primitives::torus(0.3f, 0.2f, 16, 32);

    REQUIRE(torus.triangleCount() == 16 * 32 * 2);
    Bounds box = torus.bounds();
    REQUIRE_THAT(box.max.x, WithinAbs(0.5f, 1e-4f));
    REQUIRE_THAT(box.min.y, WithinAbs(-0.5f, 1e-4f));
    REQUIRE_THAT(box.max.z, WithinAbs(0.2f, 1e-4f));
    REQUIRE_THAT(box.min.z, WithinAbs(-0.2f, 1e-4f));

    for (size_t i = 0; i < torus.vertexCount(); i += 97)
        REQUIRE_THAT(glm::length(torus.normal(i)), WithinAbs(1.0f, 1e-4f));

    REQUIRE(Primitives::torus(1.0f, 0.4f, 1, 1).triangleCount() == 3 * 3 * 2);
}

TEST_CASE("Extrusion without bevel", "[geometry][extrude]") {
    SECTION("square prism") {
        Geometry prism = Extrude::shapes({Shape{square(0.0f, 1.0f), {}}}, flat(1.0f));
        // two caps of two triangles, four walls of two
        REQUIRE(prism.triangleCount() == 12);
        Bounds box = prism.bounds();
        REQUIRE_THAT(box.min.z, WithinAbs(0.0f, 1e-6f));
        REQUIRE_THAT(box.max.z, WithinAbs(1.0f, 1e-6f));
        REQUIRE_THAT(box.max.x, WithinAbs(1.0f, 1e-6f));
    }

    SECTION("winding of the input does not matter") {
        Contour reversed = square(0.0f, 1.0f);
        std::reverse(reversed.begin(), reversed.end());
        Geometry prism = Extrude::shapes({Shape{reversed, {}}}, flat(1.0f));
        REQUIRE(prism.triangleCount() == 12);
        REQUIRE_THAT(prism.normal(0).z, WithinAbs(-1.0f, 1e-6f));
    }

    SECTION("hole is cut through both caps") {
        Geometry frame = Extrude::shapes({Shape{square(0.0f, 3.0f), {square(1.0f, 2.0f)}}}, flat(0.5f));
        // caps: 8 triangles each; walls: 8 edges of two triangles
        REQUIRE(frame.triangleCount() == 32);
    }

    SECTION("degenerate outlines are skipped") {
        Geometry nothing = Extrude::shapes({Shape{{vec2(0, 0), vec2(1, 0)}, {}}}, flat(1.0f));
        REQUIRE(nothing.vertexCount() == 0);
        REQUIRE(Extrude::shapes({}, flat(1.0f)).vertexCount() == 0);
    }
}

TEST_CASE("Extrusion with bevel", "[geometry][extrude]") {
    ExtrudeOptions options;
    options.depth = 1.0f;
    options.bevelThickness = 0.2f;
    options.bevelSize = 0.1f;
    options.bevelSegments = 3;
    Geometry solid = Extrude::shapes({Shape{square(0.0f, 1.0f), {}}}, options);

    // 3 + 2 + 3 layers give 7 wall bands
    REQUIRE(solid.triangleCount() == 4 + 4 * 7 * 2);

    Bounds box = solid.bounds();
    REQUIRE_THAT(box.min.z, WithinAbs(-0.2f, 1e-5f));
    REQUIRE_THAT(box.max.z, WithinAbs(1.2f, 1e-5f));
    REQUIRE_THAT(box.min.x, WithinAbs(-0.1f, 1e-5f));
    REQUIRE_THAT(box.max.y, WithinAbs(1.1f, 1e-5f));

    SECTION("caps face away from the body") {
        for (size_t t = 0; t < 2; ++t) {
            vec3 a = solid.position(t * 3), b = solid.position(t * 3 + 1), c = solid.position(t * 3 + 2);
            REQUIRE(glm::cross(b - a, c - a).z < 0.0f);
            REQUIRE_THAT(a.z, WithinAbs(-0.2f, 1e-5f));
        }
        for (size_t t = 2; t < 4; ++t) {
            vec3 a = solid.position(t * 3), b = solid.position(t * 3 + 1), c = solid.position(t * 3 + 2);
            REQUIRE(glm::cross(b - a, c - a).z > 0.0f);
            REQUIRE_THAT(a.z, WithinAbs(1.2f, 1e-5f));
        }
    }

    SECTION("walls face outward") {
        for (size_t t = 4; t < solid.triangleCount(); ++t) {
            vec3 centroid = (solid.position(t * 3) + solid.position(t * 3 + 1) + solid.position(t * 3 + 2)) / 3.0f;
            vec2 outward = vec2(centroid) - vec2(0.5f);
            REQUIRE(glm::dot(vec2(solid.normal(t * 3)), outward) > 0.0f);
        }
    }
}

TEST_CASE("Bevel vectors", "[geometry][extrude]") {
    SECTION("straight edge moves along its right normal") {
        vec2 shift = Extrude::bevelVector(vec2(0, 0), vec2(1, 0), vec2(2, 0));
        REQUIRE_THAT(shift.x, WithinAbs(0.0f, 1e-6f));
        REQUIRE_THAT(shift.y, WithinAbs(-1.0f, 1e-6f));
    }

    SECTION("right angle corner keeps unit distance to both edges") {
        vec2 shift = Extrude::bevelVector(vec2(0, 1), vec2(0, 0), vec2(1, 0));
        REQUIRE_THAT(shift.x, WithinAbs(-1.0f, 1e-5f));
        REQUIRE_THAT(shift.y, WithinAbs(-1.0f, 1e-5f));
    }

    SECTION("sharp spikes are capped") {
        vec2 shift = Extrude::bevelVector(vec2(-1, 0.05f), vec2(0, 0), vec2(-1, -0.05f));
        REQUIRE(glm::length(shift) <= std::sqrt(2.0f) + 1e-5f);
    }
}

TEST_CASE("Geometries store", "[geometry]") {
    Geometries geometries;
    GeometryID first = geometries.add(Primitives::torus());
    GeometryID second = geometries.add(Primitives::torus());

    REQUIRE(first != NULL_GEOMETRY);
    REQUIRE(first != second);
    REQUIRE(geometries.size() == 2);
    REQUIRE(geometries.contains(first));

    SECTION("releasing before upload cancels the upload") {
        geometries.release(first);
        REQUIRE(first == NULL_GEOMETRY);
        REQUIRE(geometries.pendingReleases() == 0);
        REQUIRE(geometries.takeUploads() == std::vector<GeometryID>{second});
    }

    SECTION("releasing after upload queues the buffers for deletion") {
        REQUIRE(geometries.takeUploads().size() == 2);
        GeometryID released = first;
        geometries.release(first);
        REQUIRE(geometries.size() == 1);
        REQUIRE_FALSE(geometries.contains(released));
        REQUIRE(geometries.takeReleases() == std::vector<GeometryID>{released});
        REQUIRE(geometries.pendingReleases() == 0);
        REQUIRE_THROWS_AS(geometries.get(released), std::out_of_range);
    }

    SECTION("releasing the null id is harmless") {
        GeometryID none = NULL_GEOMETRY;
        geometries.release(none);
        REQUIRE(geometries.size() == 2);
    }
}
