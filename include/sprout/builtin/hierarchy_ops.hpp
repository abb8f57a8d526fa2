#pragma once
#include "../world.hpp"
#include "hierarchy.hpp"

#include <algorithm>
#include <vector>

namespace sprout {

namespace detail {

inline void unlink_from_parent(World& world, Entity child, Entity parent) {
    if (!world.alive(parent))
        return;
    if (auto* kids = world.try_get<Children>(parent)) {
        auto& list = kids->entities;
        list.erase(std::remove(list.begin(), list.end(), child), list.end());
    }
}

} // namespace detail

/**
 * @brief Makes `child` the last child of `parent`.
 *
 * @details Writes Parent on the child and appends it to the parent's Children (adding the
 * component if needed). A child that already had a parent is detached from it first.
 * Does nothing if either entity is dead.
 *
 * @warning Asserts if child == parent.
 */
inline void set_parent(World& world, Entity child, Entity parent) {
    SPROUT_ASSERT(child != parent, "cannot parent entity to itself");
    if (!world.alive(child) || !world.alive(parent))
        return;

    if (auto* old = world.try_get<Parent>(child))
        detail::unlink_from_parent(world, child, old->entity);

    world.add(child, Parent{parent});
    if (!world.has<Children>(parent))
        world.add(parent, Children{});
    world.get<Children>(parent).entities.push_back(child);
}

/**
 * @brief Detaches `child` from its parent, if it has one.
 */
inline void remove_parent(World& world, Entity child) {
    if (!world.alive(child) || !world.has<Parent>(child))
        return;
    detail::unlink_from_parent(world, child, world.get<Parent>(child).entity);
    world.remove<Parent>(child);
}

/**
 * @brief Destroys `root` and every descendant.
 * @details Collects the subtree breadth-first, then destroys leaves first. `root` is also
 * removed from its own parent's Children.
 */
inline void destroy_recursive(World& world, Entity root) {
    if (!world.alive(root))
        return;

    if (auto* parent = world.try_get<Parent>(root))
        detail::unlink_from_parent(world, root, parent->entity);

    std::vector<Entity> to_destroy;
    to_destroy.push_back(root);
    size_t cursor = 0;
    while (cursor < to_destroy.size()) {
        Entity e = to_destroy[cursor++];
        if (auto* kids = world.try_get<Children>(e)) {
            for (auto child : kids->entities) {
                if (world.alive(child))
                    to_destroy.push_back(child);
            }
        }
    }

    for (auto it = to_destroy.rbegin(); it != to_destroy.rend(); ++it)
        world.destroy(*it);
}

} // namespace sprout
