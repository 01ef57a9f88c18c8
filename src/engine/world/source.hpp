#pragma once

#include "pch.hpp"

// Type-keyed singletons shared between systems (camera, mouse, settings...).
class Source {
  private:
    std::unordered_map<size_t, std::unique_ptr<Resource>> resources;

  public:
    Source() = default;

    template <typename T> T &add() {
        static_assert(std::is_base_of_v<Resource, T>,
                      "T must inherit from Resource");
        size_t type = getStructHash<T>();
        resources[type] = std::make_unique<T>();
        return static_cast<T &>(*resources[type]);
    }

    template <typename T> T &get() {
        static_assert(std::is_base_of_v<Resource, T>,
                      "T must inherit from Resource");
        auto it = resources.find(getStructHash<T>());
        if (it == resources.end())
            return add<T>();
        return static_cast<T &>(*it->second);
    }

    template <typename T> bool has() const {
        return resources.find(getStructHash<T>()) != resources.end();
    }

    void clear() { resources.clear(); }
};
