#include "pch.hpp"
#include "engine/engine.hpp"
#include "app/plugins.hpp"
#include "app/functions/content.hpp"

namespace DonutSystem {

    void update(ECS &ecs, World &world, real dt) {
        auto view = ecs.view<Transform, Motion, Donut>();
        view.iterate([&](EntityID id, Transform &transform, Motion &motion, Donut &donut) {
            ContentFunctions::stepDonut(transform, motion, dt);
        });
    }

} // namespace DonutSystem

void DonutPlugin(Engine &engine) {
    engine.addLogicSystem(SystemType::UPDATE, DonutSystem::update);
};
