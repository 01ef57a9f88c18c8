#pragma once

#include <SimpleIni.h>
#include "pch.hpp"
#include "world/assets.hpp"
#include "world/render.hpp"
#include "world/events.hpp"
#include "world/source.hpp"
#include "world/window.hpp"
#include "world/panel.hpp"
#include "world/geometry.hpp"

struct Config {
    std::string title = "Donut Field";
    ivec2 resolution = ivec2(800, 600);

    std::string font = "helvetiker_regular.typeface.json";
    std::string matcap = "matcaps/1.png";

    std::string text = "Hello :)";
    uint32_t textColor = 0xffffff;
    uint32_t donutColor = 0xff0000;
    uint32_t seed = 0;
};

class World {
public:
    Config config;
    Assets assets;
    Render render;
    Source source;
    Events events;
    Window window;
    Panel panel;
    Geometries geometries;

    std::string root;
    ivec2 resolution = ivec2(800, 600);

public:
    World() : root(RESOURCE_ROOT) {}

    void init(const std::string &configFile) {
        parseConfigFile(path(PATH_CONFIG + configFile));
    }

    void openWindow() {
        window.init(config.title, config.resolution);
        window.setContext();
        resolution = window.getSize();
        render.init(path(PATH_SHADER), resolution, window.getPixelSize(), window.getPixelRatio());
        panel.init(window.get(), window.getContext());
    }

    void shutdown() {
        panel.shutdown();
        render.shutdown();
        window.shutdown();
    }

    void setResolution(ivec2 newResolution) {
        resolution = glm::max(newResolution, ivec2(1));
        if (window.get())
            render.setResolution(resolution, window.getPixelSize(), window.getPixelRatio());
    }
    ivec2 getResolution() const { return resolution; }

    std::string path(const std::string &relative) const { return root + relative; }

    // Accepts "#rrggbb", "0xrrggbb" or "rrggbb".
    static uint32_t parseColor(const std::string &value, uint32_t fallback) {
        std::string digits = value;
        if (!digits.empty() && digits[0] == '#')
            digits.erase(0, 1);
        else if (digits.size() > 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X'))
            digits.erase(0, 2);
        if (digits.size() != 6 ||
            digits.find_first_not_of("0123456789abcdefABCDEF") != std::string::npos) {
            std::cerr << "[WARN] " << "Invalid color '" << value << "' in config\n";
            return fallback;
        }
        return static_cast<uint32_t>(std::stoul(digits, nullptr, 16));
    }

private:
    static int parseInt(const char *value, int fallback) {
        try {
            return std::stoi(value);
        } catch (const std::exception &) {
            std::cerr << "[WARN] " << "Invalid number '" << value << "' in config\n";
            return fallback;
        }
    }

    void parseConfigFile(const std::string &configPath) {
        CSimpleIniA ini;
        ini.SetUnicode();
        SI_Error rc = ini.LoadFile(configPath.c_str());
        if (rc < 0) {
            throw std::runtime_error("Failed to load config file " + configPath);
        }
        Config defaults;
        config.title = ini.GetValue("project", "name", defaults.title.c_str());
        config.resolution.x = std::max(1, parseInt(ini.GetValue("window", "width", "800"), 800));
        config.resolution.y = std::max(1, parseInt(ini.GetValue("window", "height", "600"), 600));

        config.font = ini.GetValue("assets", "font", defaults.font.c_str());
        config.matcap = ini.GetValue("assets", "matcap", defaults.matcap.c_str());

        config.text = ini.GetValue("content", "text", defaults.text.c_str());
        config.textColor = parseColor(ini.GetValue("content", "textColor", "ffffff"), defaults.textColor);
        config.donutColor = parseColor(ini.GetValue("content", "donutColor", "ff0000"), defaults.donutColor);
        config.seed = static_cast<uint32_t>(std::max(0, parseInt(ini.GetValue("content", "seed", "0"), 0)));
        resolution = config.resolution;
        std::cout << "[LOG] " << "Loaded config " << configPath << "\n";
    }
};
