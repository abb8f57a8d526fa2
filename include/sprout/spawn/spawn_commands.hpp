#pragma once
#include "../command_buffer.hpp"
#include "../world.hpp"
#include "spawn_children.hpp"
#include "spawn_system.hpp"
#include "spawnable.hpp"

#include <utility>

namespace sprout {

/**
 * @file spawn_commands.hpp
 * @brief Spawning through a World (immediate) or a CommandBuffer (deferred).
 *
 * World overloads create the entity, insert its components and materialize every pending
 * child before returning. CommandBuffer overloads reserve the entity id right away and do the
 * rest when the buffer is flushed; children then wait for the next invoke_spawn_children().
 */

// -- Immediate --

/** @brief Spawns a reusable spawnable; `spawnable` is left untouched. */
template <typename S>
Entity spawn(World& world, const S& spawnable) {
    static_assert(is_spawn_v<S>, "spawnable is single-use; use spawn_once");
    Entity e = world.create();
    world.insert(e, invoke_spawn(spawnable, world, e));
    invoke_spawn_children(world);
    return e;
}

/** @brief Spawns a single-use spawnable, consuming it. */
template <typename S>
Entity spawn_once(World& world, S spawnable) {
    Entity e = world.create();
    world.insert(e, invoke_spawn_once(std::move(spawnable), world, e));
    invoke_spawn_children(world);
    return e;
}

/**
 * @brief Spawns the spawnable registered under `key`.
 * @warning Panics if `key` is not registered.
 */
inline Entity spawn_with_key(World& world, const SpawnKey& key) {
    Entity e = world.create();
    world.insert(e, SpawnInstruction::from_key(key).produce(world, e));
    invoke_spawn_children(world);
    return e;
}

/**
 * @brief Spawns by key, then applies `extra` (component, tuple or Bundle) on top.
 * @warning Panics if `key` is not registered.
 */
template <typename B>
Entity spawn_with_key(World& world, const SpawnKey& key, B&& extra) {
    Entity e = world.create();
    world.insert(e, SpawnInstruction::from_key(key, into_bundle(std::forward<B>(extra)))
                        .produce(world, e));
    invoke_spawn_children(world);
    return e;
}

// -- Deferred --

/**
 * @brief Queues a spawn of a reusable spawnable. The returned id is live after the flush.
 */
template <typename S>
Entity spawn(CommandBuffer& cmds, S spawnable) {
    static_assert(is_spawn_v<S>, "spawnable is single-use; use spawn_once");
    Entity e = cmds.spawn_empty();
    cmds.queue([e, s = std::move(spawnable)](World& w) {
        if (w.alive(e))
            w.insert(e, invoke_spawn(s, w, e));
    });
    return e;
}

template <typename S>
Entity spawn_once(CommandBuffer& cmds, S spawnable) {
    Entity e = cmds.spawn_empty();
    cmds.queue([e, s = std::move(spawnable)](World& w) mutable {
        if (w.alive(e))
            w.insert(e, invoke_spawn_once(std::move(s), w, e));
    });
    return e;
}

/**
 * @brief Queues a keyed spawn. The key is resolved at flush time.
 * @warning The flush panics if `key` is not registered by then.
 */
inline Entity spawn_with_key(CommandBuffer& cmds, SpawnKey key) {
    Entity e = cmds.spawn_empty();
    cmds.queue([e, key = std::move(key)](World& w) {
        if (w.alive(e))
            w.insert(e, SpawnInstruction::from_key(key).produce(w, e));
    });
    return e;
}

template <typename B>
Entity spawn_with_key(CommandBuffer& cmds, SpawnKey key, B&& extra) {
    Entity e = cmds.spawn_empty();
    cmds.queue([e, instruction = SpawnInstruction::from_key(
                       std::move(key), into_bundle(std::forward<B>(extra)))](World& w) mutable {
        if (w.alive(e))
            w.insert(e, std::move(instruction).produce(w, e));
    });
    return e;
}

} // namespace sprout
