#pragma once
#include "schedule.hpp"
#include "world.hpp"

#include <algorithm>
#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace sprout {

class App;

/**
 * @brief A unit of app configuration: resources, systems, other plugins.
 * @details build() runs once, when the plugin is added.
 */
class Plugin {
public:
    virtual ~Plugin() = default;
    virtual void build(App& app) = 0;
    virtual const char* name() const = 0;
};

/**
 * @brief A World plus the Schedule that drives it.
 */
class App {
public:
    App() = default;
    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /**
     * @brief Builds and keeps a plugin.
     * @warning Panics if a plugin of the same type was already added.
     */
    template <typename P>
    App& add_plugin(P plugin) {
        static_assert(std::is_base_of_v<Plugin, P>, "add_plugin requires a Plugin subclass");
        ComponentTypeID id = component_id<P>();
        if (std::find(plugin_ids_.begin(), plugin_ids_.end(), id) != plugin_ids_.end()) {
            std::string msg = std::string("plugin added twice: ") + plugin.name();
            SPROUT_PANIC(msg.c_str());
        }
        plugin_ids_.push_back(id);
        auto owned = std::make_unique<P>(std::move(plugin));
        owned->build(*this);
        plugins_.push_back(std::move(owned));
        return *this;
    }

    template <typename P>
    App& add_plugin() {
        return add_plugin(P{});
    }

    template <typename P>
    bool has_plugin() const {
        return std::find(plugin_ids_.begin(), plugin_ids_.end(), component_id<P>()) !=
               plugin_ids_.end();
    }

    App& add_system(Stage stage, SystemConfig config) {
        schedule_.add(stage, std::move(config));
        return *this;
    }

    App& add_system(Stage stage, std::string name, SystemFunc fn) {
        return add_system(stage, make_system(std::move(name), std::move(fn)));
    }

    /** @brief Adds several systems to one stage; they run in the given order. */
    App& add_systems(Stage stage, std::vector<SystemConfig> configs) {
        for (auto& config : configs)
            schedule_.add(stage, std::move(config));
        return *this;
    }

    template <typename T>
    App& insert_resource(T&& value) {
        world_.set_resource(std::forward<T>(value));
        return *this;
    }

    World& world() { return world_; }
    const World& world() const { return world_; }
    Schedule& schedule() { return schedule_; }

    /** @brief Number of completed update() calls. */
    uint64_t frame() const { return frame_; }

    /**
     * @brief Runs one frame.
     * @details Applies commands queued outside any system, runs Startup on the first call, then
     * every other stage in order.
     */
    void update() {
        world_.flush_deferred();
        if (frame_ == 0)
            schedule_.run(Stage::Startup, world_);
        for (Stage stage : {Stage::First, Stage::PreUpdate, Stage::Update, Stage::PostUpdate,
                            Stage::Last})
            schedule_.run(stage, world_);
        ++frame_;
    }

private:
    World world_;
    Schedule schedule_;
    std::vector<std::unique_ptr<Plugin>> plugins_;
    std::vector<ComponentTypeID> plugin_ids_;
    uint64_t frame_ = 0;
};

} // namespace sprout
