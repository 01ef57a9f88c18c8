#pragma once

#include "pch.hpp"
#include "engine/components/events.hpp"

class ECS;
class World;

class Events {
public:
    using Handler = std::function<void(ECS &, World &, Event &)>;

private:
    std::unordered_map<size_t, std::vector<Handler>> handlers;
    std::queue<SDL_Event> queue;

public:
    Events() = default;

    template <typename T>
    void addEventHandler(Handler &&handler) {
        handlers[getStructHash<T>()].emplace_back(std::move(handler));
    }

    // Dispatches synchronously to every handler registered for T.
    template <typename T>
    void write(ECS &ecs, World &world, T &&event) {
        auto it = handlers.find(getStructHash<std::decay_t<T>>());
        if (it == handlers.end())
            return;
        for (auto &handler : it->second)
            handler(ecs, world, event);
    }

    void pushSDLEvent(const SDL_Event &event) { queue.push(event); }

    void flushSDLEvents(ECS &ecs, World &world) {
        while (!queue.empty()) {
            SDL_Event &sdlEvent = queue.front();
            switch (sdlEvent.type) {
            case SDL_EVENT_MOUSE_BUTTON_DOWN:
            case SDL_EVENT_MOUSE_BUTTON_UP:
                write(ecs, world, MouseButtonEvent(sdlEvent));
                break;
            case SDL_EVENT_MOUSE_WHEEL:
                write(ecs, world, MouseWheelEvent(sdlEvent));
                break;
            case SDL_EVENT_MOUSE_MOTION:
                write(ecs, world, MouseMotionEvent(sdlEvent));
                break;
            case SDL_EVENT_KEY_DOWN:
                write(ecs, world, KeyDownEvent(sdlEvent));
                break;
            case SDL_EVENT_WINDOW_RESIZED:
                write(ecs, world, WindowResizeEvent(sdlEvent));
                break;
            default:
                break;
            }
            queue.pop();
        }
    }

    size_t pending() const { return queue.size(); }
};
