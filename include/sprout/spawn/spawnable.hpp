#pragma once
#include "../bundle.hpp"
#include "../entity.hpp"
#include "../world.hpp"

#include <memory>
#include <type_traits>
#include <utility>

namespace sprout {

/**
 * @file spawnable.hpp
 * @brief What a "spawnable" is, and how one is invoked.
 *
 * A spawnable produces the components of one entity. It is matched structurally; any of
 * these qualifies:
 *
 * - A type with `Out spawn_once(const World&, Entity) &&`: single-use, consumes itself.
 * - A type with `Out spawn(const World&, Entity) const`: reusable.
 * - Anything bundle-like (a component, a std::tuple of components, a Bundle), which spawns
 *   as itself.
 *
 * `Out` is anything into_bundle() accepts. A copyable single-use spawnable is also reusable:
 * each spawn consumes a fresh copy.
 *
 * Spawn functions only read the world. The caller inserts the returned bundle afterwards.
 */

namespace detail {

template <typename T, typename = void>
struct has_spawn_once_member : std::false_type {};

template <typename T>
struct has_spawn_once_member<
    T, std::void_t<decltype(std::declval<T&&>().spawn_once(std::declval<const World&>(),
                                                           std::declval<Entity>()))>>
    : std::true_type {};

template <typename T, typename = void>
struct has_spawn_member : std::false_type {};

template <typename T>
struct has_spawn_member<T, std::void_t<decltype(std::declval<const T&>().spawn(
                               std::declval<const World&>(), std::declval<Entity>()))>>
    : std::true_type {};

} // namespace detail

template <typename T>
inline constexpr bool is_spawn_once_v = std::is_move_constructible_v<std::decay_t<T>>;

template <typename T>
inline constexpr bool is_spawn_v =
    detail::has_spawn_member<std::decay_t<T>>::value ||
    (is_spawn_once_v<T> && std::is_copy_constructible_v<std::decay_t<T>>);

/**
 * @brief Consumes a single-use spawnable and returns its output.
 */
template <typename S>
Bundle invoke_spawn_once(S spawnable, const World& world, Entity entity) {
    if constexpr (detail::has_spawn_once_member<S>::value) {
        return into_bundle(std::move(spawnable).spawn_once(world, entity));
    } else if constexpr (detail::has_spawn_member<S>::value) {
        return into_bundle(static_cast<const S&>(spawnable).spawn(world, entity));
    } else {
        return into_bundle(std::move(spawnable));
    }
}

/**
 * @brief Invokes a reusable spawnable, leaving it untouched.
 */
template <typename S>
Bundle invoke_spawn(const S& spawnable, const World& world, Entity entity) {
    static_assert(is_spawn_v<S>, "spawnable is single-use; use spawn_once");
    if constexpr (detail::has_spawn_member<S>::value) {
        return into_bundle(spawnable.spawn(world, entity));
    } else {
        return invoke_spawn_once(S(spawnable), world, entity);
    }
}

// -- Type erasure --

/**
 * @brief Boxed single-use spawnable.
 */
class ErasedSpawnOnce {
public:
    virtual ~ErasedSpawnOnce() = default;
    virtual Bundle spawn_once(const World& world, Entity entity) = 0;
};

/**
 * @brief Boxed reusable spawnable, as stored by Spawnables.
 */
class ErasedSpawn {
public:
    virtual ~ErasedSpawn() = default;
    virtual Bundle spawn(const World& world, Entity entity) const = 0;
};

namespace detail {

template <typename S>
class SpawnOnceHolder final : public ErasedSpawnOnce {
public:
    explicit SpawnOnceHolder(S spawnable) : spawnable_(std::move(spawnable)) {}

    Bundle spawn_once(const World& world, Entity entity) override {
        SPROUT_ASSERT(!spent_, "single-use spawnable invoked twice");
        spent_ = true;
        return invoke_spawn_once(std::move(spawnable_), world, entity);
    }

private:
    S spawnable_;
    bool spent_ = false;
};

template <typename S>
class SpawnHolder final : public ErasedSpawn {
public:
    explicit SpawnHolder(S spawnable) : spawnable_(std::move(spawnable)) {}

    Bundle spawn(const World& world, Entity entity) const override {
        return invoke_spawn(spawnable_, world, entity);
    }

private:
    S spawnable_;
};

} // namespace detail

template <typename S>
std::unique_ptr<ErasedSpawnOnce> box_spawn_once(S spawnable) {
    return std::make_unique<detail::SpawnOnceHolder<S>>(std::move(spawnable));
}

template <typename S>
std::shared_ptr<const ErasedSpawn> share_spawn(S spawnable) {
    static_assert(is_spawn_v<S>, "spawnable is single-use and cannot be shared");
    return std::make_shared<const detail::SpawnHolder<S>>(std::move(spawnable));
}

} // namespace sprout
