#include "pch.hpp"
#include "engine/engine.hpp"
#include "app/plugins.hpp"
#include "app/functions/content.hpp"

namespace ContentSystem {

    void init(ECS &ecs, World &world, real dt) {
        auto &settings = world.source.add<Settings>();
        settings.text = world.config.text;
        settings.textColor = world.config.textColor;
        settings.donutColor = world.config.donutColor;

        auto &scene = world.source.add<Scene>();
        ContentFunctions::seed(scene, world.config.seed);
        ContentFunctions::buildContent(ecs, world);
    }

    void textChangedEvent(ECS &ecs, World &world, Event &baseEvent) {
        TextChangedEvent &event = static_cast<TextChangedEvent &>(baseEvent);
        world.source.get<Settings>().text = event.text;
        ContentFunctions::regenerateText(ecs, world);
    }

    void textColorChangedEvent(ECS &ecs, World &world, Event &baseEvent) {
        TextColorChangedEvent &event = static_cast<TextColorChangedEvent &>(baseEvent);
        ContentFunctions::setTextColor(ecs, world, event.color);
    }

    void donutColorChangedEvent(ECS &ecs, World &world, Event &baseEvent) {
        DonutColorChangedEvent &event = static_cast<DonutColorChangedEvent &>(baseEvent);
        ContentFunctions::setDonutColor(ecs, world, event.color);
    }

    void rebuildContentEvent(ECS &ecs, World &world, Event &baseEvent) {
        ContentFunctions::buildContent(ecs, world);
    }

} // namespace ContentSystem

void ContentPlugin(Engine &engine) {
    engine.addLogicSystem(SystemType::INIT, ContentSystem::init);

    engine.addEventHandler<TextChangedEvent>(ContentSystem::textChangedEvent);
    engine.addEventHandler<TextColorChangedEvent>(ContentSystem::textColorChangedEvent);
    engine.addEventHandler<DonutColorChangedEvent>(ContentSystem::donutColorChangedEvent);
    engine.addEventHandler<RebuildContentEvent>(ContentSystem::rebuildContentEvent);
};
