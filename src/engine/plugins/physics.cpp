#include "pch.hpp"
#include "engine/engine.hpp"
#include "engine/defaults.hpp"

namespace PhysicsSystem {

    void updateTime(ECS &ecs, World &world, real dt) {
        auto &time = world.source.get<Time>();
        time.delta = dt;
        time.now += dt;
        ++time.frames;
    };

} // namespace PhysicsSystem

void PhysicsPlugin(Engine &engine) {
    engine.addLogicSystem(SystemType::UPDATE, PhysicsSystem::updateTime);
};
