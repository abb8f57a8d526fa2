#pragma once
#include "config.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <new>
#include <type_traits>
#include <utility>

namespace sprout {

using ComponentTypeID = uint32_t;

inline ComponentTypeID next_component_id() {
    static ComponentTypeID counter = 0;
    return counter++;
}

template <typename T>
ComponentTypeID component_id() {
    static ComponentTypeID id = next_component_id();
    return id;
}

/**
 * @brief Type-erased lifetime operations for one component type.
 * @details Everything that stores components without knowing their type (columns, bundles,
 * the command buffer) goes through one of these.
 */
struct ComponentVTable {
    using RelocateFunc = void (*)(void* dst, void* src);
    using DestroyFunc = void (*)(void* ptr);
    using CopyFunc = void (*)(void* dst, const void* src);

    ComponentTypeID id = 0;
    size_t size = 0;
    size_t alignment = 1;

    /** @brief Move-constructs into `dst` and destroys the source object. */
    RelocateFunc relocate = nullptr;
    DestroyFunc destroy = nullptr;
    /** @brief Copy-constructs into `dst`; null for move-only components. */
    CopyFunc copy = nullptr;
};

template <typename T>
const ComponentVTable* component_vtable() {
    static_assert(std::is_move_constructible_v<T>, "components must be move-constructible");
    static const ComponentVTable vt = [] {
        ComponentVTable v;
        v.id = component_id<T>();
        v.size = sizeof(T);
        v.alignment = alignof(T);
        v.relocate = [](void* dst, void* src) {
            new (dst) T(std::move(*static_cast<T*>(src)));
            static_cast<T*>(src)->~T();
        };
        v.destroy = [](void* ptr) { static_cast<T*>(ptr)->~T(); };
        if constexpr (std::is_copy_constructible_v<T>) {
            v.copy = [](void* dst, const void* src) { new (dst) T(*static_cast<const T*>(src)); };
        }
        return v;
    }();
    return &vt;
}

// Process-wide id -> vtable lookup, so archetypes can be built for type sets that were
// assembled at runtime (bundle insertion, migrations).
inline std::map<ComponentTypeID, const ComponentVTable*>& vtable_registry() {
    static std::map<ComponentTypeID, const ComponentVTable*> reg;
    return reg;
}

template <typename T>
const ComponentVTable* ensure_registered() {
    const ComponentVTable* vt = component_vtable<T>();
    vtable_registry().emplace(vt->id, vt);
    return vt;
}

inline void ensure_registered(const ComponentVTable* vt) {
    vtable_registry().emplace(vt->id, vt);
}

inline const ComponentVTable* vtable_for(ComponentTypeID id) {
    auto& reg = vtable_registry();
    auto it = reg.find(id);
    SPROUT_ASSERT(it != reg.end(), "vtable_for: component type never registered");
    return it->second;
}

// -- Raw storage helpers --

inline void* allocate_component(const ComponentVTable* vt, size_t count = 1) {
    return ::operator new(vt->size * count, std::align_val_t{vt->alignment});
}

inline void free_component(const ComponentVTable* vt, void* ptr) {
    ::operator delete(ptr, std::align_val_t{vt->alignment});
}

/**
 * @brief Densely packed storage for one component type inside an archetype.
 * @details Rows line up with the archetype's entity list. Growth relocates every element
 * through the vtable, so non-trivially-movable types are safe.
 */
struct ComponentColumn {
    const ComponentVTable* vtable = nullptr;
    uint8_t* data = nullptr;
    size_t count = 0;
    size_t capacity = 0;

    ComponentColumn() = default;
    explicit ComponentColumn(const ComponentVTable* vt) : vtable(vt) {}

    ComponentColumn(ComponentColumn&& o) noexcept
        : vtable(o.vtable), data(o.data), count(o.count), capacity(o.capacity) {
        o.data = nullptr;
        o.count = 0;
        o.capacity = 0;
    }

    ComponentColumn& operator=(ComponentColumn&& o) noexcept {
        if (this != &o) {
            release();
            vtable = o.vtable;
            data = o.data;
            count = o.count;
            capacity = o.capacity;
            o.data = nullptr;
            o.count = 0;
            o.capacity = 0;
        }
        return *this;
    }

    ~ComponentColumn() { release(); }

    ComponentColumn(const ComponentColumn&) = delete;
    ComponentColumn& operator=(const ComponentColumn&) = delete;

    void* get(size_t row) { return data + row * vtable->size; }
    const void* get(size_t row) const { return data + row * vtable->size; }

    void reserve(size_t needed) {
        if (capacity >= needed)
            return;
        size_t new_cap = capacity == 0 ? 16 : capacity * 2;
        if (new_cap < needed)
            new_cap = needed;
        auto* fresh = static_cast<uint8_t*>(allocate_component(vtable, new_cap));
        for (size_t i = 0; i < count; ++i)
            vtable->relocate(fresh + i * vtable->size, data + i * vtable->size);
        if (data)
            free_component(vtable, data);
        data = fresh;
        capacity = new_cap;
    }

    /** @brief Appends a row by relocating `src` into it. `src` is left destroyed. */
    void push_relocate(void* src) {
        reserve(count + 1);
        vtable->relocate(get(count), src);
        ++count;
    }

    /** @brief Replaces an existing row by relocating `src` into it. */
    void replace_relocate(size_t row, void* src) {
        vtable->destroy(get(row));
        vtable->relocate(get(row), src);
    }

    /** @brief Removes a row, filling the hole with the last row. */
    void swap_remove(size_t row) {
        SPROUT_ASSERT(row < count, "swap_remove: row out of range");
        vtable->destroy(get(row));
        if (row != count - 1)
            vtable->relocate(get(row), get(count - 1));
        --count;
    }

    /** @brief Moves row `row` to the end of `dst`, then closes the hole here. */
    void move_row_to(size_t row, ComponentColumn& dst) {
        dst.push_relocate(get(row));
        if (row != count - 1)
            vtable->relocate(get(row), get(count - 1));
        --count;
    }

private:
    void release() {
        if (!data)
            return;
        for (size_t i = 0; i < count; ++i)
            vtable->destroy(get(i));
        free_component(vtable, data);
        data = nullptr;
        count = 0;
        capacity = 0;
    }
};

} // namespace sprout
