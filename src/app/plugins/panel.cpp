#include <imgui.h>
#include "pch.hpp"
#include "engine/engine.hpp"
#include "app/plugins.hpp"

// Widget state mirrored from Settings; ImGui edits it in place.
struct PanelState : Resource {
    float textColor[3] = {1.0f, 1.0f, 1.0f};
    float donutColor[3] = {1.0f, 0.0f, 0.0f};
    char text[256] = {};
};

namespace PanelSystem {

    void copyColor(uint32_t hex, float (&target)[3]) {
        vec3 color = hexToColor(hex);
        target[0] = color.r;
        target[1] = color.g;
        target[2] = color.b;
    }

    void init(ECS &ecs, World &world, real dt) {
        auto &state = world.source.add<PanelState>();
        auto &settings = world.source.get<Settings>();
        copyColor(settings.textColor, state.textColor);
        copyColor(settings.donutColor, state.donutColor);
        std::snprintf(state.text, sizeof(state.text), "%s", settings.text.c_str());
    }

    void update(ECS &ecs, World &world, real dt) {
        auto &state = world.source.get<PanelState>();
        world.panel.beginFrame();

        ImGui::SetNextWindowPos(ImVec2(static_cast<float>(world.getResolution().x) - 10.0f, 10.0f),
                                ImGuiCond_FirstUseEver, ImVec2(1.0f, 0.0f));
        ImGui::Begin("Debug");
        if (ImGui::CollapsingHeader("Text", ImGuiTreeNodeFlags_DefaultOpen)) {
            ImGui::PushID("text");
            if (ImGui::ColorEdit3("Color", state.textColor)) {
                TextColorChangedEvent event;
                event.color = colorToHex(vec3(state.textColor[0], state.textColor[1], state.textColor[2]));
                world.events.write(ecs, world, std::move(event));
            }
            if (ImGui::InputText("Content", state.text, sizeof(state.text))) {
                TextChangedEvent event;
                event.text = state.text;
                world.events.write(ecs, world, std::move(event));
            }
            ImGui::PopID();
        }
        if (ImGui::CollapsingHeader("Donuts", ImGuiTreeNodeFlags_DefaultOpen)) {
            ImGui::PushID("donuts");
            if (ImGui::ColorEdit3("Global Color", state.donutColor)) {
                DonutColorChangedEvent event;
                event.color = colorToHex(vec3(state.donutColor[0], state.donutColor[1], state.donutColor[2]));
                world.events.write(ecs, world, std::move(event));
            }
            if (ImGui::Button("Rebuild"))
                world.events.write(ecs, world, RebuildContentEvent{});
            ImGui::PopID();
        }
        ImGui::End();

        world.panel.endFrame();
    }

} // namespace PanelSystem

void PanelPlugin(Engine &engine) {
    engine.addRenderSystem(SystemType::INIT, PanelSystem::init);
    engine.addRenderSystem(SystemType::UPDATE, PanelSystem::update);
};
