#pragma once

#include "pch.hpp"

class ISparseSet {
public:
    virtual ~ISparseSet() = default;
    virtual void clear() = 0;
    virtual void remove(EntityID id) = 0;
    virtual size_t size() const = 0;
    virtual bool contains(EntityID id) const = 0;
    virtual const std::vector<EntityID> &getEntityList() const = 0;
};

template <typename T>
class SparseSet : public ISparseSet {
private:
    using Sparse = std::vector<size_t>;
    std::vector<Sparse> pages;
    std::vector<T> dense;
    std::vector<EntityID> denseToEntity;
    static constexpr size_t PAGE_SIZE = 1000;
    static constexpr size_t empty = std::numeric_limits<size_t>::max();

    void setDenseIndex(EntityID id, size_t index) {
        size_t page = id / PAGE_SIZE;
        size_t sparseIndex = id % PAGE_SIZE;
        if (page >= pages.size())
            pages.resize(page + 1);
        Sparse &sparse = pages[page];
        if (sparseIndex >= sparse.size())
            sparse.resize(sparseIndex + 1, empty);
        sparse[sparseIndex] = index;
    }

    size_t getDenseIndex(EntityID id) const {
        size_t page = id / PAGE_SIZE;
        size_t sparseIndex = id % PAGE_SIZE;
        if (page < pages.size()) {
            const Sparse &sparse = pages[page];
            if (sparseIndex < sparse.size())
                return sparse[sparseIndex];
        }
        return empty;
    }

public:
    SparseSet() = default;

    void set(EntityID id, T obj) {
        size_t index = getDenseIndex(id);
        if (index == empty) {
            setDenseIndex(id, dense.size());
            dense.push_back(std::move(obj));
            denseToEntity.push_back(id);
            return;
        }
        dense[index] = std::move(obj);
    }

    T &get(EntityID id) {
        size_t index = getDenseIndex(id);
        if (index == empty)
            throw std::out_of_range("Entity has no such component");
        return dense[index];
    }

    void remove(EntityID id) override {
        size_t deletedIndex = getDenseIndex(id);
        if (dense.empty() || deletedIndex == empty)
            return;
        setDenseIndex(denseToEntity.back(), deletedIndex);
        setDenseIndex(id, empty);
        std::swap(dense.back(), dense[deletedIndex]);
        std::swap(denseToEntity.back(), denseToEntity[deletedIndex]);
        dense.pop_back();
        denseToEntity.pop_back();
    }

    size_t size() const override { return dense.size(); }

    const std::vector<EntityID> &getEntityList() const override { return denseToEntity; }

    bool contains(EntityID id) const override { return getDenseIndex(id) != empty; }

    void clear() override {
        dense.clear();
        pages.clear();
        denseToEntity.clear();
    }
};

template <class... Types>
struct type_list {
    using type_tuple = std::tuple<Types...>;
    template <size_t Index>
    using get = std::tuple_element_t<Index, type_tuple>;
    static constexpr size_t size = sizeof...(Types);
};

template <typename... Components>
class View {
private:
    using componentTypes = type_list<Components...>;
    std::array<ISparseSet *, sizeof...(Components)> viewPools;
    ISparseSet *smallest = nullptr;

    bool allContain(EntityID id) const {
        return std::all_of(
            viewPools.begin(), viewPools.end(),
            [id](ISparseSet *pool) { return pool->contains(id); });
    }

    template <size_t Index>
    auto getPool() {
        using componentType = typename componentTypes::template get<Index>;
        return static_cast<SparseSet<componentType> *>(viewPools[Index]);
    }

    template <size_t... Indices>
    auto makeTuple(EntityID id, std::index_sequence<Indices...>) {
        return std::make_tuple((std::ref(getPool<Indices>()->get(id)))...);
    }

public:
    View(std::array<ISparseSet *, sizeof...(Components)> pools)
        : viewPools{pools} {
        smallest = *std::min_element(viewPools.begin(), viewPools.end(),
                                     [](ISparseSet *poolA, ISparseSet *poolB) {
                                         return poolA->size() < poolB->size();
                                     });
    }

    // Components must not be added to or removed from the viewed pools
    // while iterating.
    template <typename Func>
    void iterate(Func &&func) {
        auto inds = std::make_index_sequence<sizeof...(Components)>{};
        for (EntityID id : smallest->getEntityList()) {
            if (allContain(id)) {
                std::apply(func, std::tuple_cat(std::make_tuple(id),
                                                makeTuple(id, inds)));
            }
        }
    }

    std::vector<EntityID> getEntities() const {
        std::vector<EntityID> result;
        for (EntityID id : smallest->getEntityList()) {
            if (allContain(id))
                result.push_back(id);
        }
        return result;
    }

    size_t count() const { return getEntities().size(); }
};

class ECS {
private:
    using ComponentMask = std::bitset<MAX_COMPONENTS>;
    std::vector<std::unique_ptr<ISparseSet>> componentPools;
    std::unordered_map<std::type_index, size_t> componentBit;
    std::vector<EntityID> availableEntities;
    SparseSet<ComponentMask> entityMasks;
    EntityID maxEntityID = 0;
    static constexpr size_t empty = std::numeric_limits<size_t>::max();

    template <typename T>
    size_t getComponentBit() const {
        auto it = componentBit.find(std::type_index(typeid(T)));
        if (it == componentBit.end())
            return empty;
        return it->second;
    }

    template <typename T>
    size_t registerComponent() {
        size_t bitPos = getComponentBit<T>();
        if (bitPos != empty)
            return bitPos;
        if (componentPools.size() >= MAX_COMPONENTS)
            throw std::length_error("Too many component types");
        bitPos = componentPools.size();
        componentBit[std::type_index(typeid(T))] = bitPos;
        componentPools.push_back(std::make_unique<SparseSet<T>>());
        return bitPos;
    }

    template <typename T>
    SparseSet<T> &getPool() {
        size_t bitPos = registerComponent<T>();
        return static_cast<SparseSet<T> &>(*componentPools[bitPos]);
    }

public:
    ECS() = default;

    void init() { reset(); }

    void reset() {
        entityMasks.clear();
        componentBit.clear();
        componentPools.clear();
        availableEntities.clear();
        maxEntityID = 0;
    }

    EntityID createEntity() {
        EntityID id;
        if (availableEntities.empty()) {
            id = maxEntityID++;
        } else {
            id = availableEntities.back();
            availableEntities.pop_back();
        }
        entityMasks.set(id, {});
        return id;
    }

    void removeEntity(EntityID &id) {
        if (!entityMasks.contains(id))
            return;
        ComponentMask &mask = entityMasks.get(id);
        for (size_t bit = 0; bit < componentPools.size(); bit++)
            if (mask[bit])
                componentPools[bit]->remove(id);
        entityMasks.remove(id);
        availableEntities.push_back(id);
        id = NULL_ENTITY;
    }

    bool alive(EntityID id) const { return entityMasks.contains(id); }

    template <typename T>
    void add(EntityID id, T component = {}) {
        size_t bitPos = registerComponent<T>();
        entityMasks.get(id)[bitPos] = true;
        getPool<T>().set(id, std::move(component));
    }

    template <typename T>
    T &get(EntityID id) {
        return getPool<T>().get(id);
    }

    template <typename T>
    bool has(EntityID id) {
        return getPool<T>().contains(id);
    }

    template <typename T>
    void remove(EntityID id) {
        size_t bitPos = getComponentBit<T>();
        if (bitPos == empty || !entityMasks.contains(id))
            return;
        entityMasks.get(id)[bitPos] = false;
        getPool<T>().remove(id);
    }

    template <typename... Components>
    View<Components...> view() {
        return View<Components...>({&getPool<Components>()...});
    }

    size_t getEntityCount() const { return entityMasks.size(); }

    size_t getPoolCount() const { return componentPools.size(); }
};
