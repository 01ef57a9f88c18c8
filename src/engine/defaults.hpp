#pragma once

#include "pch.hpp"
#include "engine/engine.hpp"
#include "engine/components/events.hpp"

#include "engine/components/camera.hpp"
#include "engine/components/mouse.hpp"
#include "engine/components/physics.hpp"
#include "engine/components/render.hpp"

class Engine;

void PhysicsPlugin(Engine &engine);
void MousePlugin(Engine &engine);
void CameraPlugin(Engine &engine);
void RenderPlugin(Engine &engine);

namespace CameraSystem {
    void init(ECS &ecs, World &world, real dt);
    void update(ECS &ecs, World &world, real dt);
    void rotate(Camera &camera, const vec2 &delta, real height);
    void dolly(Camera &camera, real steps);
} // namespace CameraSystem

namespace MouseSystem {
    void init(ECS &ecs, World &world, real dt);
    void mouseMotionEvent(ECS &ecs, World &world, Event &baseEvent);
    void mouseButtonEvent(ECS &ecs, World &world, Event &baseEvent);
    void mouseWheelEvent(ECS &ecs, World &world, Event &baseEvent);
    void keyDownEvent(ECS &ecs, World &world, Event &baseEvent);
} // namespace MouseSystem

namespace PhysicsSystem {
    void updateTime(ECS &ecs, World &world, real dt);
} // namespace PhysicsSystem
