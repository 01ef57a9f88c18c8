#pragma once

#include "pch.hpp"

// Orbit camera around `target`. Pointer input accumulates into the pending
// deltas, which are bled off by `dampingFactor` on every update.
struct Camera : Resource {
    vec3 target = vec3(0.0f);
    vec3 pos = vec3(1.0f, 1.0f, 5.0f);
    real fov = 75.0f;
    real planeN = 0.1f;
    real planeF = 100.0f;

    bool damping = true;
    real dampingFactor = 0.05f;
    real rotateSpeed = 1.0f;
    real zoomSpeed = 1.0f;
    real minDistance = 0.5f;
    real maxDistance = 50.0f;

    real thetaDelta = 0.0f;
    real phiDelta = 0.0f;
    real scale = 1.0f;
};

struct CamData : Resource {
    mat4 view = mat4(1.0f);
    mat4 projection = mat4(1.0f);
    vec3 position = vec3(0.0f);
    real aspect = 1.0f;
};
