#pragma once

#include <stb_image.h>
#include "pch.hpp"
#include "engine/functions/typeface.hpp"

// Raised when an asset the scene cannot do without is missing or unreadable.
class FatalAssetError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct Image {
    int width = 0;
    int height = 0;
    std::vector<unsigned char> pixels; // RGBA8, bottom row first
};

class Assets {
private:
    std::unordered_map<std::string, Image> images;
    std::unordered_map<std::string, Typeface> typefaces;

public:
    Assets() = default;

    bool loadImage(const std::string &name, const std::string &path) {
        int width, height, nrChannels;
        stbi_set_flip_vertically_on_load(true);
        unsigned char *data = stbi_load(path.c_str(), &width, &height, &nrChannels, STBI_rgb_alpha);
        if (!data) {
            std::cerr << "[WARN] " << "Could not load image " << path << " ("
                      << stbi_failure_reason() << ")\n";
            return false;
        }
        Image image;
        image.width = width;
        image.height = height;
        image.pixels.assign(data, data + static_cast<size_t>(width) * height * 4);
        stbi_image_free(data);
        images[name] = std::move(image);
        std::cout << "[LOG] " << "Loaded image " << path << " " << width << "x" << height << "\n";
        return true;
    }
    bool hasImage(const std::string &name) const { return images.count(name) > 0; }
    const Image &getImage(const std::string &name) const {
        auto it = images.find(name);
        if (it == images.end())
            throw std::out_of_range("Unknown image " + name);
        return it->second;
    }

    void loadTypeface(const std::string &name, const std::string &path) {
        try {
            typefaces[name] = Typeface::load(path);
        } catch (const std::runtime_error &e) {
            throw FatalAssetError(e.what());
        }
        std::cout << "[LOG] " << "Loaded typeface " << typefaces[name].getFamily() << " ("
                  << typefaces[name].glyphCount() << " glyphs)\n";
    }
    bool hasTypeface(const std::string &name) const { return typefaces.count(name) > 0; }
    const Typeface &getTypeface(const std::string &name) const {
        auto it = typefaces.find(name);
        if (it == typefaces.end())
            throw std::out_of_range("Unknown typeface " + name);
        return it->second;
    }
};
