#pragma once

#include "pch.hpp"

struct Settings : Resource {
    uint32_t donutColor = 0xff0000;
    uint32_t textColor = 0xffffff;
    std::string text = "Hello :)";
};

struct Donut {};
struct Label {};

// Handles to everything the content builder created, so a rebuild can
// release exactly what it replaces.
struct Scene : Resource {
    EntityID text = NULL_ENTITY;
    GeometryID textGeometry = NULL_GEOMETRY;
    GeometryID torus = NULL_GEOMETRY;
    std::vector<EntityID> donuts;
    bool built = false;

    std::mt19937 random;
};

struct TextChangedEvent : Event {
    std::string text;
};

struct TextColorChangedEvent : Event {
    uint32_t color = 0xffffff;
};

struct DonutColorChangedEvent : Event {
    uint32_t color = 0xff0000;
};

struct RebuildContentEvent : Event {};
