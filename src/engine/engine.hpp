#pragma once

#include "pch.hpp"
#include "ecs.hpp"
#include "world.hpp"

enum class SystemType {
    INIT,
    UPDATE,
};

// Owns the ECS and the World and drives every registered system from one
// thread: poll input, dispatch events, logic systems, render systems, swap.
class Engine {
protected:
    ECS ecs;
    World world;

private:
    using System = std::function<void(ECS &, World &, real)>;
    std::vector<System> logicInits;
    std::vector<System> logicUpdates;
    std::vector<System> renderInits;
    std::vector<System> renderUpdates;

    using Plugin = std::function<void(Engine &)>;
    std::vector<Plugin> plugins;

    std::chrono::steady_clock::time_point lastFrame;
    std::string configFile = "config.ini";
    bool isRunning = false;
    size_t frameCount = 0;

public:
    Engine() { ecs.init(); }
    virtual ~Engine() = default;

    void run() {
        if (!start()) {
            shutdown();
            return;
        }
        isRunning = true;
        lastFrame = std::chrono::steady_clock::now();
        while (isRunning)
            tick();
        shutdown();
        std::cout << "[LOG] " << "Stopped after " << frameCount << " frames\n";
    }

    // Loads config, opens the window and runs every INIT system. A missing
    // required asset is reported once and leaves the engine stopped.
    bool start() {
        initPlugins();
        world.init(configFile);
        openWindow();
        try {
            for (auto &system : logicInits)
                system(ecs, world, 0.0f);
            for (auto &system : renderInits)
                system(ecs, world, 0.0f);
        } catch (const FatalAssetError &e) {
            reportFatal(e.what());
            return false;
        }
        return true;
    }

    void tick() {
        auto currentTime = std::chrono::steady_clock::now();
        std::chrono::duration<real> deltaTime = currentTime - lastFrame;
        lastFrame = currentTime;

        pollEvents();
        step(deltaTime.count());
        world.window.swapBuffer();
    }

    // One frame without touching the window: queued events, then logic and
    // render systems.
    void step(real dt) {
        world.events.flushSDLEvents(ecs, world);
        for (auto &system : logicUpdates)
            system(ecs, world, dt);
        for (auto &system : renderUpdates)
            system(ecs, world, dt);
        ++frameCount;
    }

    void stop() { isRunning = false; }
    bool running() const { return isRunning; }
    size_t getFrameCount() const { return frameCount; }

    void setRoot(const std::string &root) { world.root = root; }
    void setConfigFile(const std::string &file) { configFile = file; }

    void addPlugin(Plugin plugin) { plugins.emplace_back(std::move(plugin)); }
    void addLogicSystem(SystemType type, System system) {
        if (type == SystemType::INIT)
            logicInits.emplace_back(std::move(system));
        if (type == SystemType::UPDATE)
            logicUpdates.emplace_back(std::move(system));
    }
    void addRenderSystem(SystemType type, System system) {
        if (type == SystemType::INIT)
            renderInits.emplace_back(std::move(system));
        if (type == SystemType::UPDATE)
            renderUpdates.emplace_back(std::move(system));
    }
    template <typename EventType>
    void addEventHandler(Events::Handler &&handler) {
        world.events.addEventHandler<EventType>(std::move(handler));
    }

protected:
    virtual void openWindow() { world.openWindow(); }
    virtual void shutdown() { world.shutdown(); }

    virtual void reportFatal(const std::string &message) {
        std::cerr << "[ERROR] " << message << "\n";
        world.window.alert(world.config.title, message);
    }

private:
    void initPlugins() {
        for (auto &init : plugins)
            init(*this);
        plugins.clear();
    }

    void pollEvents() {
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            world.panel.processEvent(event);
            if (event.type == SDL_EVENT_QUIT ||
                event.type == SDL_EVENT_WINDOW_CLOSE_REQUESTED) {
                stop();
                continue;
            }
            if (world.panel.captures(event))
                continue;
            world.events.pushSDLEvent(event);
        }
    }
};

Engine *createApp();
