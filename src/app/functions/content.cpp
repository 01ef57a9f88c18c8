#include "app/functions/content.hpp"
#include "engine/functions/extrude.hpp"
#include "engine/functions/primitives.hpp"

namespace ContentFunctions {

    std::string displayText(const std::string &text) {
        if (text.find_first_not_of(" \t\r\n\f\v") == std::string::npos)
            return "...";
        return text;
    }

    Geometry createTextGeometry(const std::string &text, const Typeface &typeface) {
        constexpr real size = 0.5f;
        constexpr int curveSegments = 5;

        ExtrudeOptions options;
        options.depth = 0.2f;
        options.bevelEnabled = true;
        options.bevelThickness = 0.03f;
        options.bevelSize = 0.02f;
        options.bevelOffset = 0.0f;
        options.bevelSegments = 3;

        Geometry geometry = Extrude::shapes(typeface.generateShapes(displayText(text), size, curveSegments), options);
        geometry.center();
        return geometry;
    }

    Geometry createDonutGeometry() { return Primitives::torus(0.3f, 0.2f, 16, 32); }

    void seed(Scene &scene, uint32_t value) {
        if (value == 0)
            value = std::random_device{}();
        scene.random.seed(value);
    }

    void clearContent(ECS &ecs, World &world) {
        auto &scene = world.source.get<Scene>();
        for (EntityID id : scene.donuts)
            ecs.removeEntity(id);
        scene.donuts.clear();
        world.geometries.release(scene.torus);

        if (scene.text != NULL_ENTITY)
            ecs.removeEntity(scene.text);
        world.geometries.release(scene.textGeometry);
        scene.built = false;
    }

    void buildContent(ECS &ecs, World &world) {
        auto &settings = world.source.get<Settings>();
        auto &scene = world.source.get<Scene>();
        const Typeface &typeface = world.assets.getTypeface(FONT);
        bool matcap = world.assets.hasImage(MATCAP);

        clearContent(ecs, world);

        scene.textGeometry = world.geometries.add(createTextGeometry(settings.text, typeface));
        scene.text = ecs.createEntity();
        ecs.add(scene.text, Transform{});
        ecs.add(scene.text, Mesh{.geometry = scene.textGeometry});
        ecs.add(scene.text, Material{.color = hexToColor(settings.textColor), .matcap = matcap});
        ecs.add(scene.text, Label{});

        scene.torus = world.geometries.add(createDonutGeometry());
        std::uniform_real_distribution<real> random(0.0f, 1.0f);
        auto next = [&]() { return random(scene.random); };
        scene.donuts.reserve(DONUT_COUNT);
        for (size_t i = 0; i < DONUT_COUNT; ++i) {
            Transform transform;
            real x = next(), y = next(), z = next();
            transform.position = (vec3(x, y, z) - 0.5f) * SPREAD;
            real pitch = next(), yaw = next();
            transform.rotation = vec3(pitch * glm::pi<real>(), yaw * glm::pi<real>(), 0.0f);
            transform.scale = vec3(next() * 0.7f + 0.3f);

            Motion motion;
            x = next(), y = next(), z = next();
            motion.velocity = (vec3(x, y, z) - 0.5f) * 0.02f;

            EntityID id = ecs.createEntity();
            ecs.add(id, transform);
            ecs.add(id, motion);
            ecs.add(id, Mesh{.geometry = scene.torus});
            ecs.add(id, Material{.color = hexToColor(PALETTE[i % PALETTE.size()]), .matcap = matcap});
            ecs.add(id, Donut{});
            scene.donuts.push_back(id);
        }
        scene.built = true;
        std::cout << "[LOG] " << "Built text \"" << displayText(settings.text) << "\" and "
                  << scene.donuts.size() << " donuts" << (matcap ? "" : " (flat colors)") << "\n";
    }

    void regenerateText(ECS &ecs, World &world) {
        auto &scene = world.source.get<Scene>();
        if (!scene.built || !world.assets.hasTypeface(FONT))
            return;
        auto &settings = world.source.get<Settings>();
        world.geometries.release(scene.textGeometry);
        scene.textGeometry =
            world.geometries.add(createTextGeometry(settings.text, world.assets.getTypeface(FONT)));
        ecs.get<Mesh>(scene.text).geometry = scene.textGeometry;
    }

    void setTextColor(ECS &ecs, World &world, uint32_t color) {
        world.source.get<Settings>().textColor = color;
        auto &scene = world.source.get<Scene>();
        if (scene.text != NULL_ENTITY && ecs.has<Material>(scene.text))
            ecs.get<Material>(scene.text).color = hexToColor(color);
    }

    void setDonutColor(ECS &ecs, World &world, uint32_t color) {
        world.source.get<Settings>().donutColor = color;
        auto view = ecs.view<Material, Donut>();
        view.iterate([&](EntityID id, Material &material, Donut &donut) {
            material.color = hexToColor(color);
        });
    }

    // Flips the velocity on every axis beyond the wall. The position is left
    // where it is, so a donut can sit just outside for a tick.
    glm::bvec3 bounce(const Transform &transform, Motion &motion) {
        glm::bvec3 flipped(false);
        for (int axis = 0; axis < 3; ++axis) {
            if (std::abs(transform.position[axis]) > BOUNDARY) {
                motion.velocity[axis] = -motion.velocity[axis];
                flipped[axis] = true;
            }
        }
        return flipped;
    }

    void stepDonut(Transform &transform, Motion &motion, real dt) {
        transform.rotation.x += dt * SPIN_SPEED;
        transform.rotation.y += dt * SPIN_SPEED;
        transform.position += motion.velocity * (dt * FRAME_RATE);
        bounce(transform, motion);
    }
} // namespace ContentFunctions
