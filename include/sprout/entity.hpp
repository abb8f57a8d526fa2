#pragma once
#include <cstdint>
#include <functional>
#include <ostream>

namespace sprout {

/**
 * @brief Handle to an object living in a World.
 *
 * @details An index into the world's entity table plus a generation count. Indices are
 * recycled after destruction; the generation is bumped each time so stale handles held by
 * systems (or by queued spawn instructions) are detected instead of aliasing a newer entity.
 */
struct Entity {
    /** @brief Slot in the world's entity table. */
    uint32_t index = 0;

    /** @brief Incremented every time the slot is recycled. */
    uint32_t generation = 0;

    bool operator==(const Entity& o) const {
        return index == o.index && generation == o.generation;
    }

    bool operator!=(const Entity& o) const { return !(*this == o); }
};

/**
 * @brief The null entity.
 * @details Slot 0 is reserved by every World, so this handle is never alive.
 */
inline constexpr Entity INVALID_ENTITY{0, 0};

/** @brief Hasher for unordered containers keyed by Entity. */
struct EntityHash {
    size_t operator()(const Entity& e) const {
        return std::hash<uint64_t>{}(static_cast<uint64_t>(e.generation) << 32 | e.index);
    }
};

inline std::ostream& operator<<(std::ostream& out, const Entity& e) {
    return out << e.index << "v" << e.generation;
}

} // namespace sprout
