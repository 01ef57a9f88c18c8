#include "pch.hpp"
#include "engine/engine.hpp"
#include "engine/defaults.hpp"

namespace MouseSystem {

    void init(ECS &ecs, World &world, real dt) { world.source.add<Mouse>(); };

    void mouseMotionEvent(ECS &ecs, World &world, Event &baseEvent) {
        MouseMotionEvent &event = static_cast<MouseMotionEvent &>(baseEvent);
        if (event.type == SDL_EVENT_MOUSE_MOTION) {
            auto &mouse = world.source.get<Mouse>();
            mouse.last = mouse.current;
            mouse.current = vec2(event.x, event.y);
            if (mouse.left == MouseState::DRAGGING) {
                auto &camera = world.source.get<Camera>();
                CameraSystem::rotate(camera, mouse.current - mouse.last,
                                     static_cast<real>(world.getResolution().y));
            }
        }
    }

    void mouseButtonEvent(ECS &ecs, World &world, Event &baseEvent) {
        MouseButtonEvent &event = static_cast<MouseButtonEvent &>(baseEvent);
        if (event.button != SDL_BUTTON_LEFT)
            return;
        auto &mouse = world.source.get<Mouse>();
        if (event.type == SDL_EVENT_MOUSE_BUTTON_DOWN) {
            mouse.left = MouseState::DRAGGING;
            mouse.current = vec2(event.x, event.y);
            mouse.last = mouse.current;
        }
        if (event.type == SDL_EVENT_MOUSE_BUTTON_UP)
            mouse.left = MouseState::IDLE;
    };

    void mouseWheelEvent(ECS &ecs, World &world, Event &baseEvent) {
        MouseWheelEvent &event = static_cast<MouseWheelEvent &>(baseEvent);
        if (event.type == SDL_EVENT_MOUSE_WHEEL && event.y != 0.0f)
            CameraSystem::dolly(world.source.get<Camera>(), event.y);
    }

    void keyDownEvent(ECS &ecs, World &world, Event &baseEvent) {
        KeyDownEvent &event = static_cast<KeyDownEvent &>(baseEvent);
        if (event.key == SDLK_ESCAPE) {
            SDL_Event quit{};
            quit.type = SDL_EVENT_QUIT;
            if (!SDL_PushEvent(&quit))
                std::cerr << "[WARN] " << "Could not queue quit: " << SDL_GetError() << "\n";
        }
    }
}; // namespace MouseSystem

void MousePlugin(Engine &engine) {
    engine.addLogicSystem(SystemType::INIT, MouseSystem::init);
    engine.addEventHandler<MouseMotionEvent>(MouseSystem::mouseMotionEvent);
    engine.addEventHandler<MouseButtonEvent>(MouseSystem::mouseButtonEvent);
    engine.addEventHandler<MouseWheelEvent>(MouseSystem::mouseWheelEvent);
    engine.addEventHandler<KeyDownEvent>(MouseSystem::keyDownEvent);
};
