#pragma once
#include "../bundle.hpp"
#include "../config.hpp"
#include "../world.hpp"
#include "spawn_key.hpp"
#include "spawnable.hpp"
#include "spawnables.hpp"

#include <cstdint>
#include <memory>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace sprout {

/**
 * @brief One pending child: either a boxed single-use spawnable, or a spawn key plus an
 * optional bundle applied on top of the keyed spawnable's output.
 */
class SpawnInstruction {
public:
    enum class Kind : uint8_t { Spawnable, Key };

    template <typename S>
    static SpawnInstruction from_spawnable(S spawnable) {
        SpawnInstruction out(Kind::Spawnable);
        out.spawnable_ = box_spawn_once(std::move(spawnable));
        return out;
    }

    static SpawnInstruction from_key(SpawnKey key, Bundle extra = {}) {
        SpawnInstruction out(Kind::Key);
        out.key_ = std::move(key);
        out.extra_ = std::move(extra);
        return out;
    }

    SpawnInstruction(SpawnInstruction&&) = default;
    SpawnInstruction& operator=(SpawnInstruction&&) = default;
    SpawnInstruction(const SpawnInstruction&) = delete;
    SpawnInstruction& operator=(const SpawnInstruction&) = delete;

    Kind kind() const { return kind_; }

    /** @brief The spawn key; empty for Kind::Spawnable. */
    const SpawnKey& key() const { return key_; }

    /** @brief Components layered over the keyed output; empty unless built by spawn_key_with. */
    const Bundle& extra() const { return extra_; }

    /**
     * @brief Produces the child's components. Consumes the instruction.
     * @details Keyed instructions look the key up in the world's Spawnables; components in
     * extra() replace same-typed components from the keyed spawnable.
     * @warning Panics if the key is not registered.
     */
    Bundle produce(const World& world, Entity child) && {
        if (kind_ == Kind::Spawnable)
            return spawnable_->spawn_once(world, child);

        const Spawnables* registry = world.try_resource<Spawnables>();
        auto entry = registry ? registry->fetch(key_) : nullptr;
        if (!entry) {
            std::ostringstream msg;
            msg << "invalid spawn key: " << key_;
            std::string text = msg.str();
            SPROUT_PANIC(text.c_str());
        }
        Bundle out = entry->spawn(world, child);
        out.merge(std::move(extra_));
        return out;
    }

private:
    explicit SpawnInstruction(Kind kind) : kind_(kind) {}

    Kind kind_;
    std::unique_ptr<ErasedSpawnOnce> spawnable_;
    SpawnKey key_;
    Bundle extra_;
};

/**
 * @brief Component holding the children an entity still has to spawn.
 *
 * @details Inserted like any other component (usually through spawn_children() or
 * with_children()). invoke_spawn_children() removes it and turns each instruction, in order,
 * into a child entity parented under the holder.
 */
class SpawnChildren {
public:
    SpawnChildren() = default;
    SpawnChildren(SpawnChildren&&) = default;
    SpawnChildren& operator=(SpawnChildren&&) = default;
    SpawnChildren(const SpawnChildren&) = delete;
    SpawnChildren& operator=(const SpawnChildren&) = delete;

    const std::vector<SpawnInstruction>& instructions() const { return instructions_; }
    size_t size() const { return instructions_.size(); }
    bool empty() const { return instructions_.empty(); }

    void push(SpawnInstruction instruction) { instructions_.push_back(std::move(instruction)); }

    /**
     * @brief Appends another set of pending children after this one's.
     */
    void append(SpawnChildren&& other) {
        for (auto& instruction : other.instructions_)
            instructions_.push_back(std::move(instruction));
        other.instructions_.clear();
    }

    /** @brief Moves the instructions out, leaving this empty. */
    std::vector<SpawnInstruction> release() {
        std::vector<SpawnInstruction> out = std::move(instructions_);
        instructions_.clear();
        return out;
    }

private:
    std::vector<SpawnInstruction> instructions_;
};

/**
 * @brief Records child spawn instructions, in call order.
 *
 * @code
 * spawn_children([](SpawnChildBuilder& c) {
 *     c.spawn(Wheel{}).spawn(Wheel{});
 *     c.spawn_key("Driver");
 *     c.spawn_key_with("Passenger", Seat{2});
 * });
 * @endcode
 */
class SpawnChildBuilder {
public:
    explicit SpawnChildBuilder(SpawnChildren& target) : target_(target) {}

    /** @brief Adds a child produced by `spawnable` (consumed once, at materialization). */
    template <typename S>
    SpawnChildBuilder& spawn(S&& spawnable) {
        static_assert(is_spawn_once_v<S>, "spawn() requires a spawnable");
        target_.push(SpawnInstruction::from_spawnable(std::decay_t<S>(std::forward<S>(spawnable))));
        return *this;
    }

    /** @brief Adds a child produced by the spawnable registered under `key`. */
    SpawnChildBuilder& spawn_key(SpawnKey key) {
        target_.push(SpawnInstruction::from_key(std::move(key)));
        return *this;
    }

    /**
     * @brief Adds a keyed child, then applies `extra` on top of its components.
     * @details `extra` may be a component, a std::tuple of components or a Bundle.
     */
    template <typename B>
    SpawnChildBuilder& spawn_key_with(SpawnKey key, B&& extra) {
        target_.push(SpawnInstruction::from_key(std::move(key), into_bundle(std::forward<B>(extra))));
        return *this;
    }

private:
    SpawnChildren& target_;
};

/**
 * @brief Runs `fn(SpawnChildBuilder&)` and returns the recorded children as a component.
 */
template <typename F>
SpawnChildren spawn_children(F&& fn) {
    SpawnChildren out;
    SpawnChildBuilder builder(out);
    fn(builder);
    return out;
}

/**
 * @brief A spawnable plus children to spawn under whatever it spawns.
 * @details Reusable when both the inner spawnable and the builder function are.
 */
template <typename T, typename F>
class WithChildren {
public:
    WithChildren(T inner, F fn) : inner_(std::move(inner)), fn_(std::move(fn)) {}

    Bundle spawn_once(const World& world, Entity entity) && {
        Bundle out = invoke_spawn_once(std::move(inner_), world, entity);
        attach(out, fn_);
        return out;
    }

    template <typename U = T,
              std::enable_if_t<is_spawn_v<U> && std::is_invocable_v<const F&, SpawnChildBuilder&>,
                               int> = 0>
    Bundle spawn(const World& world, Entity entity) const {
        Bundle out = invoke_spawn(inner_, world, entity);
        attach(out, fn_);
        return out;
    }

private:
    T inner_;
    F fn_;

    // Appends to a SpawnChildren the inner spawnable already produced, if any.
    template <typename G>
    static void attach(Bundle& out, G& fn) {
        SpawnChildren children = spawn_children(fn);
        if (out.has<SpawnChildren>())
            out.get<SpawnChildren>().append(std::move(children));
        else
            out.add(std::move(children));
    }
};

/**
 * @brief Wraps `spawnable` so that its entity also gets the children `fn` records.
 */
template <typename S, typename F>
WithChildren<std::decay_t<S>, std::decay_t<F>> with_children(S&& spawnable, F&& fn) {
    return {std::forward<S>(spawnable), std::forward<F>(fn)};
}

} // namespace sprout
