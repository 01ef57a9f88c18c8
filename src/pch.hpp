#pragma once
#ifdef _WIN32
#define NOMINMAX
#endif
#include <glad.h>

#include <string>
#include <fstream>
#include <sstream>
#include <iostream>
#include <stdexcept>
#include <utility>

#include <map>
#include <queue>
#include <memory>
#include <array>
#include <tuple>
#include <bitset>
#include <vector>
#include <unordered_map>
#include <unordered_set>

#include <cmath>
#include <cstdio>
#include <limits>
#include <chrono>
#include <random>
#include <cstdint>
#include <typeindex>
#include <algorithm>
#include <functional>

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/constants.hpp>

#include <SDL3/SDL.h>

using real = float;
using vec2 = glm::vec2;
using vec3 = glm::vec3;
using vec4 = glm::vec4;
using mat3 = glm::mat3;
using mat4 = glm::mat4;
using ivec2 = glm::ivec2;

using EntityID = uint64_t;
static constexpr EntityID NULL_ENTITY = std::numeric_limits<EntityID>::max();
constexpr size_t MAX_COMPONENTS = 64;

using GeometryID = uint32_t;
static constexpr GeometryID NULL_GEOMETRY = 0;

template <typename T>
constexpr size_t getStructHash() {
#if defined(_MSC_VER)
    constexpr const char *name = __FUNCSIG__;
#elif defined(__clang__) || defined(__GNUC__)
    constexpr const char *name = __PRETTY_FUNCTION__;
#else
#error "Unsupported compiler"
#endif

    // FNV-1a 64-bit hash
    size_t hash = 14695981039346656037ULL;
    for (const char *p = name; *p; ++p) {
        hash ^= static_cast<size_t>(*p);
        hash *= 1099511628211ULL;
    }
    return hash;
}

#ifndef RESOURCE_ROOT
#define RESOURCE_ROOT "resource/"
#endif

constexpr const char *PATH_CONFIG = "";
constexpr const char *PATH_FONT = "fonts/";
constexpr const char *PATH_SHADER = "shaders/";
constexpr const char *PATH_TEXTURE = "textures/";

using EventType = Uint32;
struct Event {
    virtual ~Event() = default;
};

struct Resource {
    virtual ~Resource() = default;
};
