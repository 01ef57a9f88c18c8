#pragma once

#include "engine/engine.hpp"

#ifndef TEST_DATA_DIR
#define TEST_DATA_DIR "tests/fixtures/"
#endif

// Engine without a window or GL context. Only plugins whose systems stay off
// the GPU may be added.
class HeadlessEngine : public Engine {
public:
    std::vector<std::string> alerts;

    explicit HeadlessEngine(const std::string &configFile = "config.ini") {
        setRoot(TEST_DATA_DIR);
        setConfigFile(configFile);
    }

    ECS &getECS() { return ecs; }
    World &getWorld() { return world; }

protected:
    void openWindow() override {}
    void shutdown() override {}
    void reportFatal(const std::string &message) override { alerts.push_back(message); }
};

inline void loadWorld(World &world, const std::string &configFile = "config.ini") {
    world.root = TEST_DATA_DIR;
    world.init(configFile);
}
