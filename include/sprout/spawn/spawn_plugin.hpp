#pragma once
#include "../app.hpp"
#include "../config.hpp"
#include "../schedule.hpp"
#include "spawn_key.hpp"
#include "spawn_system.hpp"
#include "spawnables.hpp"

#include <utility>

namespace sprout {

/**
 * @brief Installs the Spawnables registry and the child materialization system.
 *
 * @details invoke_spawn_children() runs in `stage` (Stage::First by default) whenever some
 * entity holds SpawnChildren. Use force_spawn_children() to run it at other points as well.
 * An existing Spawnables resource is kept.
 */
class SpawnPlugin : public Plugin {
public:
    explicit SpawnPlugin(Stage stage = Stage::First) : stage_(stage) {}

    void build(App& app) override {
        if (!app.world().has_resource<Spawnables>())
            app.insert_resource(Spawnables{});
        app.add_system(stage_, force_spawn_children());
    }

    const char* name() const override { return "SpawnPlugin"; }

    Stage stage() const { return stage_; }

private:
    Stage stage_;
};

/**
 * @brief Registers a reusable spawnable with the app's Spawnables and returns its key.
 * @warning Panics without SpawnPlugin, or if `key` is already registered.
 */
template <typename S>
SpawnKey add_spawnable(App& app, SpawnKey key, S spawnable) {
    Spawnables* registry = app.world().try_resource<Spawnables>();
    if (!registry)
        SPROUT_PANIC("add_spawnable requires SpawnPlugin");
    return registry->register_spawnable(std::move(key), std::move(spawnable));
}

} // namespace sprout
