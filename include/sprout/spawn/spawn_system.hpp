#pragma once
#include "../builtin/hierarchy_ops.hpp"
#include "../schedule.hpp"
#include "../world.hpp"
#include "spawn_children.hpp"
#include "spawnables.hpp"

#include <utility>
#include <vector>

namespace sprout {

namespace detail {

/**
 * @brief Materializes the pending children of one entity.
 * @details Takes SpawnChildren off `owner`, then for each instruction in order: creates a
 * child, produces and inserts its components, parents it under `owner`. `spawned(child)` is
 * called for every child created.
 */
template <typename Func>
void spawn_children_of(World& world, Entity owner, Func&& spawned) {
    if (!world.has<SpawnChildren>(owner))
        return;
    std::vector<SpawnInstruction> pending = world.take<SpawnChildren>(owner).release();
    for (auto& instruction : pending) {
        Entity child = world.create();
        Bundle components = std::move(instruction).produce(world, child);
        world.insert(child, std::move(components));
        set_parent(world, child, owner);
        spawned(child);
    }
}

} // namespace detail

/**
 * @brief Materializes every pending SpawnChildren in the world.
 *
 * @details Works breadth-first in batches: first every entity currently holding
 * SpawnChildren, then every child that came out of that batch still holding SpawnChildren,
 * and so on until a batch produces nothing. On return no entity holds SpawnChildren (unless
 * an on_add observer re-adds it), and each child is parented in instruction order.
 *
 * Running it again with nothing pending is a no-op.
 *
 * @warning Must not run during query iteration. Registering spawnables, or replacing or
 * removing the Spawnables resource, from inside a spawn panics.
 */
inline void invoke_spawn_children(World& world) {
    Spawnables::MaterializeScope scope(world);

    std::vector<Entity> batch;
    world.each<SpawnChildren>([&](Entity e, SpawnChildren&) { batch.push_back(e); });

    std::vector<Entity> next;
    while (!batch.empty()) {
        for (Entity owner : batch) {
            detail::spawn_children_of(world, owner, [&](Entity child) {
                if (world.has<SpawnChildren>(child))
                    next.push_back(child);
            });
        }
        batch.swap(next);
        next.clear();
    }
}

/** @brief True while any entity holds SpawnChildren. */
inline bool should_spawn_children(const World& world) {
    return world.count<SpawnChildren>() != 0;
}

/**
 * @brief The materialization system, gated on should_spawn_children().
 * @details Add it to any stage to have children spawned there in addition to the plugin's
 * own stage.
 */
inline SystemConfig force_spawn_children() {
    return make_system("invoke_spawn_children", invoke_spawn_children)
        .run_if(should_spawn_children);
}

} // namespace sprout
