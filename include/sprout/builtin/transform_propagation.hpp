#pragma once
#include "../app.hpp"
#include "../world.hpp"
#include "hierarchy.hpp"
#include "transform.hpp"

#include <queue>

namespace sprout {

/**
 * @brief Recomputes every WorldTransform from the LocalTransforms along the hierarchy.
 *
 * @details Breadth-first from the roots (entities with transforms but no Parent):
 *
 * Roots: World = Local
 * Children: World = Parent.World * Local
 *
 * Children missing either transform component cut the walk below them.
 */
inline void propagate_transforms(World& world) {
    std::queue<Entity> queue;

    world.each<LocalTransform, WorldTransform>(
        World::Exclude<Parent>{}, [&](Entity e, LocalTransform& local, WorldTransform& wt) {
            wt.matrix = local.matrix();
            if (auto* children = world.try_get<Children>(e)) {
                for (auto child : children->entities)
                    queue.push(child);
            }
        });

    while (!queue.empty()) {
        Entity e = queue.front();
        queue.pop();

        auto* parent = world.try_get<Parent>(e);
        if (!parent)
            continue;
        auto* parent_wt = world.try_get<WorldTransform>(parent->entity);
        auto* local = world.try_get<LocalTransform>(e);
        auto* wt = world.try_get<WorldTransform>(e);
        if (!parent_wt || !local || !wt)
            continue;

        wt->matrix = parent_wt->matrix * local->matrix();

        if (auto* children = world.try_get<Children>(e)) {
            for (auto child : children->entities)
                queue.push(child);
        }
    }
}

/**
 * @brief Runs propagate_transforms() every frame in Stage::PostUpdate.
 */
class TransformPlugin : public Plugin {
public:
    void build(App& app) override {
        app.add_system(Stage::PostUpdate, "propagate_transforms", propagate_transforms);
    }

    const char* name() const override { return "TransformPlugin"; }
};

} // namespace sprout
