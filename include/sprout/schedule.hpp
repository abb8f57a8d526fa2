#pragma once
#include "world.hpp"

#include <array>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace sprout {

/**
 * @brief Fixed points of a frame, run in declaration order by App::update().
 * @details Startup runs once, on the first update only, before First.
 */
enum class Stage : uint8_t { Startup, First, PreUpdate, Update, PostUpdate, Last };

inline constexpr size_t STAGE_COUNT = 6;

inline const char* stage_name(Stage stage) {
    switch (stage) {
    case Stage::Startup:
        return "Startup";
    case Stage::First:
        return "First";
    case Stage::PreUpdate:
        return "PreUpdate";
    case Stage::Update:
        return "Update";
    case Stage::PostUpdate:
        return "PostUpdate";
    case Stage::Last:
        return "Last";
    }
    return "?";
}

using SystemFunc = std::function<void(World&)>;
using RunCondition = std::function<bool(const World&)>;

/**
 * @brief A named system plus an optional run condition.
 */
struct SystemConfig {
    std::string name;
    SystemFunc fn;
    RunCondition condition;

    /**
     * @brief Returns this system gated on `cond`.
     * @details Conditions stack: every one of them must hold for the system to run.
     */
    SystemConfig run_if(RunCondition cond) const {
        SystemConfig out = *this;
        if (out.condition) {
            out.condition = [prev = std::move(out.condition), cond = std::move(cond)](
                                const World& w) { return prev(w) && cond(w); };
        } else {
            out.condition = std::move(cond);
        }
        return out;
    }

    bool should_run(const World& w) const { return !condition || condition(w); }
};

inline SystemConfig make_system(std::string name, SystemFunc fn) {
    return SystemConfig{std::move(name), std::move(fn), nullptr};
}

/**
 * @brief Systems grouped by Stage, executed sequentially.
 * @details Within a stage, systems run in the order they were added. The world's deferred
 * commands are flushed after every system, whether or not its condition held, so later
 * systems observe earlier systems' structural changes.
 */
class Schedule {
public:
    void add(Stage stage, SystemConfig config) {
        stages_[index(stage)].push_back(std::move(config));
    }

    void run(Stage stage, World& world) {
        for (auto& sys : stages_[index(stage)]) {
            if (sys.should_run(world))
                sys.fn(world);
            world.flush_deferred();
        }
    }

    size_t system_count(Stage stage) const { return stages_[index(stage)].size(); }

    bool contains(Stage stage, const std::string& name) const {
        for (auto& sys : stages_[index(stage)]) {
            if (sys.name == name)
                return true;
        }
        return false;
    }

private:
    std::array<std::vector<SystemConfig>, STAGE_COUNT> stages_;

    static size_t index(Stage stage) { return static_cast<size_t>(stage); }
};

} // namespace sprout
