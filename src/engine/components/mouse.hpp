#pragma once

#include "pch.hpp"

enum class MouseState {
    IDLE,
    DRAGGING,
};

struct Mouse : Resource {
    vec2 current = vec2(0.0f);
    vec2 last = vec2(0.0f);
    MouseState left = MouseState::IDLE;
};
