#pragma once

#include "component.hpp"

#include <algorithm>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace sprout {

/**
 * @brief An owned, unordered set of component values waiting to be merged into an entity.
 *
 * @details Holds at most one value per component type; adding a type that is already present
 * replaces the earlier value. Each value lives in its own allocation so the bundle can grow
 * without relocating components.
 *
 * Bundles are what every spawnable ultimately produces. World::insert() drains one into an
 * entity in a single archetype migration.
 */
class Bundle {
public:
    struct Entry {
        ComponentTypeID cid;
        const ComponentVTable* vtable;
        void* data;
    };

    Bundle() = default;

    ~Bundle() { clear(); }

    /**
     * @brief Deep copy.
     * @warning Panics if any component in `o` is move-only.
     */
    Bundle(const Bundle& o) { copy_from(o); }

    Bundle& operator=(const Bundle& o) {
        if (this != &o) {
            clear();
            copy_from(o);
        }
        return *this;
    }

    Bundle(Bundle&& o) noexcept : entries_(std::move(o.entries_)) { o.entries_.clear(); }

    Bundle& operator=(Bundle&& o) noexcept {
        if (this != &o) {
            clear();
            entries_ = std::move(o.entries_);
            o.entries_.clear();
        }
        return *this;
    }

    /**
     * @brief Builds a bundle from component values.
     * @details A Bundle argument is merged instead of being stored as a component.
     */
    template <typename... Ts>
    static Bundle of(Ts&&... components) {
        Bundle b;
        (b.add(std::forward<Ts>(components)), ...);
        return b;
    }

    /**
     * @brief Adds (or replaces) a component value.
     * @details Passing a Bundle merges it, with its values taking precedence.
     */
    template <typename T>
    Bundle& add(T&& comp) {
        using U = std::decay_t<T>;
        if constexpr (std::is_same_v<U, Bundle>) {
            return merge(Bundle(std::forward<T>(comp)));
        } else {
            const ComponentVTable* vt = ensure_registered<U>();
            void* mem = allocate_component(vt);
            new (mem) U(std::forward<T>(comp));
            put(vt, mem);
            return *this;
        }
    }

    /** @brief Moves every component of `other` into this bundle, replacing duplicates. */
    Bundle& merge(Bundle&& other) {
        for (auto& entry : other.entries_)
            put(entry.vtable, entry.data);
        other.entries_.clear();
        return *this;
    }

    template <typename T>
    bool has() const {
        return find(component_id<std::decay_t<T>>()) != nullptr;
    }

    template <typename T>
    T& get() {
        const Entry* entry = find(component_id<T>());
        SPROUT_ASSERT(entry != nullptr, "Bundle::get<T> on missing component");
        return *static_cast<T*>(entry->data);
    }

    template <typename T>
    const T& get() const {
        const Entry* entry = find(component_id<T>());
        SPROUT_ASSERT(entry != nullptr, "Bundle::get<T> on missing component");
        return *static_cast<const T*>(entry->data);
    }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    const std::vector<Entry>& entries() const { return entries_; }

    /** @brief True if every component can be copied, i.e. the bundle can be cloned. */
    bool copyable() const {
        return std::all_of(entries_.begin(), entries_.end(),
                           [](const Entry& e) { return e.vtable->copy != nullptr; });
    }

    /**
     * @brief Hands every component to `fn(const Entry&)` and forgets it.
     * @details `fn` must relocate the data out (ComponentVTable::relocate). The storage is
     * freed afterwards without running destructors.
     */
    template <typename Func>
    void drain(Func&& fn) {
        std::vector<Entry> taken = std::move(entries_);
        entries_.clear();
        for (auto& entry : taken) {
            fn(static_cast<const Entry&>(entry));
            free_component(entry.vtable, entry.data);
        }
    }

    void clear() {
        for (auto& entry : entries_) {
            entry.vtable->destroy(entry.data);
            free_component(entry.vtable, entry.data);
        }
        entries_.clear();
    }

private:
    std::vector<Entry> entries_;

    const Entry* find(ComponentTypeID cid) const {
        for (auto& entry : entries_) {
            if (entry.cid == cid)
                return &entry;
        }
        return nullptr;
    }

    // Takes ownership of an allocated, constructed value.
    void put(const ComponentVTable* vt, void* data) {
        for (auto& entry : entries_) {
            if (entry.cid == vt->id) {
                entry.vtable->destroy(entry.data);
                free_component(entry.vtable, entry.data);
                entry.data = data;
                return;
            }
        }
        entries_.push_back(Entry{vt->id, vt, data});
    }

    void copy_from(const Bundle& o) {
        entries_.reserve(o.entries_.size());
        for (auto& entry : o.entries_) {
            if (!entry.vtable->copy)
                SPROUT_PANIC("cannot copy a bundle holding a move-only component");
            void* mem = allocate_component(entry.vtable);
            entry.vtable->copy(mem, entry.data);
            entries_.push_back(Entry{entry.cid, entry.vtable, mem});
        }
    }
};

template <typename T>
struct is_tuple : std::false_type {};

template <typename... Ts>
struct is_tuple<std::tuple<Ts...>> : std::true_type {};

template <typename T>
inline constexpr bool is_tuple_v = is_tuple<std::decay_t<T>>::value;

/**
 * @brief Converts a component, a std::tuple of components, or a Bundle into a Bundle.
 */
template <typename T>
Bundle into_bundle(T&& value) {
    using U = std::decay_t<T>;
    if constexpr (std::is_same_v<U, Bundle>) {
        return Bundle(std::forward<T>(value));
    } else if constexpr (is_tuple_v<U>) {
        return std::apply(
            [](auto&&... comps) { return Bundle::of(std::forward<decltype(comps)>(comps)...); },
            std::forward<T>(value));
    } else {
        Bundle b;
        b.add(std::forward<T>(value));
        return b;
    }
}

} // namespace sprout
