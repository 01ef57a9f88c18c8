#include "pch.hpp"
#include "engine/engine.hpp"
#include "engine/defaults.hpp"

namespace CameraSystem {

    // Keeps the polar angle off the poles so lookAt never degenerates.
    constexpr real POLE_EPSILON = 1e-6f;

    void init(ECS &ecs, World &world, real dt) {
        world.source.add<Camera>();
        world.source.add<CamData>();
        update(ecs, world, dt);
    }

    void update(ECS &ecs, World &world, real dt) {
        auto &camera = world.source.get<Camera>();
        auto &data = world.source.get<CamData>();

        vec3 offset = camera.pos - camera.target;
        real radius = glm::length(offset);
        real theta = std::atan2(offset.x, offset.z);
        real phi = radius > 0.0f ? std::acos(glm::clamp(offset.y / radius, -1.0f, 1.0f)) : 0.0f;

        if (camera.damping) {
            theta += camera.thetaDelta * camera.dampingFactor;
            phi += camera.phiDelta * camera.dampingFactor;
        } else {
            theta += camera.thetaDelta;
            phi += camera.phiDelta;
        }
        phi = glm::clamp(phi, POLE_EPSILON, glm::pi<real>() - POLE_EPSILON);
        radius = glm::clamp(radius * camera.scale, camera.minDistance, camera.maxDistance);

        offset = radius * vec3(std::sin(phi) * std::sin(theta), std::cos(phi),
                               std::sin(phi) * std::cos(theta));
        camera.pos = camera.target + offset;

        if (camera.damping) {
            camera.thetaDelta *= 1.0f - camera.dampingFactor;
            camera.phiDelta *= 1.0f - camera.dampingFactor;
        } else {
            camera.thetaDelta = 0.0f;
            camera.phiDelta = 0.0f;
        }
        camera.scale = 1.0f;

        ivec2 resolution = world.getResolution();
        data.aspect = static_cast<real>(resolution.x) / static_cast<real>(std::max(resolution.y, 1));
        data.position = camera.pos;
        data.view = glm::lookAt(camera.pos, camera.target, vec3(0.0f, 1.0f, 0.0f));
        data.projection = glm::perspective(glm::radians(camera.fov), data.aspect,
                                           camera.planeN, camera.planeF);
    }

    // Drag of `delta` pixels; a drag across the full height is one turn.
    void rotate(Camera &camera, const vec2 &delta, real height) {
        real h = std::max(height, 1.0f);
        camera.thetaDelta -= glm::two_pi<real>() * delta.x / h * camera.rotateSpeed;
        camera.phiDelta -= glm::two_pi<real>() * delta.y / h * camera.rotateSpeed;
    }

    // Positive steps move toward the target.
    void dolly(Camera &camera, real steps) {
        real zoomScale = std::pow(0.95f, camera.zoomSpeed);
        camera.scale *= std::pow(zoomScale, steps);
    }
} // namespace CameraSystem

class Engine;
void CameraPlugin(Engine &engine) {
    engine.addLogicSystem(SystemType::INIT, CameraSystem::init);
    engine.addLogicSystem(SystemType::UPDATE, CameraSystem::update);
};
