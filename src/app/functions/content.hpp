#pragma once

#include "pch.hpp"
#include "engine/engine.hpp"
#include "engine/functions/typeface.hpp"
#include "app/plugins.hpp"

namespace ContentFunctions {
    constexpr size_t DONUT_COUNT = 100;
    constexpr real BOUNDARY = 10.0f;
    constexpr real SPREAD = 15.0f;
    constexpr real SPIN_SPEED = 0.5f;
    constexpr real FRAME_RATE = 60.0f;
    constexpr std::array<uint32_t, 7> PALETTE = {0xff0000, 0xffa500, 0xffff00, 0x00ff00,
                                                 0x00ffff, 0x0000ff, 0x8a2be2};

    const std::string FONT = "font";
    const std::string MATCAP = "matcap";

    // "..." when `text` is empty or whitespace only.
    std::string displayText(const std::string &text);
    Geometry createTextGeometry(const std::string &text, const Typeface &typeface);
    Geometry createDonutGeometry();

    void seed(Scene &scene, uint32_t value);
    void buildContent(ECS &ecs, World &world);
    void clearContent(ECS &ecs, World &world);
    void regenerateText(ECS &ecs, World &world);
    void setTextColor(ECS &ecs, World &world, uint32_t color);
    void setDonutColor(ECS &ecs, World &world, uint32_t color);

    void stepDonut(Transform &transform, Motion &motion, real dt);
    glm::bvec3 bounce(const Transform &transform, Motion &motion);
} // namespace ContentFunctions
