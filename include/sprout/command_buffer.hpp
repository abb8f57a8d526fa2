#pragma once

#include "bundle.hpp"
#include "component.hpp"
#include "entity.hpp"

#include <memory>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace sprout {

class World; // forward declaration; members touching World are defined in world.hpp

/**
 * @brief Records structural changes to be applied to a World later.
 *
 * @details Systems queue work here while iterating, since changing an entity's archetype in
 * the middle of a query would invalidate the query. Commands run in FIFO order on flush().
 *
 * A buffer bound to a World (every World owns one, see World::deferred()) can also hand out
 * entity ids up front with spawn_empty(); the entity becomes alive when the buffer is flushed.
 */
class CommandBuffer {
public:
    CommandBuffer() = default;
    explicit CommandBuffer(World& world) : world_(&world) {}

    CommandBuffer(const CommandBuffer&) = delete;
    CommandBuffer& operator=(const CommandBuffer&) = delete;
    CommandBuffer(CommandBuffer&& o) noexcept
        : commands_(std::move(o.commands_)), reserved_(std::move(o.reserved_)), world_(o.world_) {
        o.commands_.clear();
        o.reserved_.clear();
    }
    CommandBuffer& operator=(CommandBuffer&& o) noexcept; // defined after World in world.hpp

    /** @brief Drops unflushed commands and hands unplaced spawn_empty() ids back to the world. */
    ~CommandBuffer(); // defined after World in world.hpp

    /**
     * @brief Reserves an entity id and queues its creation.
     * @return The entity handle, valid to store now and alive after the next flush.
     * @warning Panics if the buffer is not bound to a World.
     */
    Entity spawn_empty(); // defined after World in world.hpp

    /** @brief Queues the creation of an entity with the given components. */
    template <typename... Ts>
    void create_with(Ts&&... comps) {
        static_assert(sizeof...(Ts) > 0, "create_with requires at least one component");
        queue([bundle = Bundle::of(std::forward<Ts>(comps)...)](auto& w) mutable {
            Entity e = w.create();
            w.insert(e, std::move(bundle));
        });
    }

    /** @brief Queues an entity for destruction. */
    void destroy(Entity e); // defined after World in world.hpp

    /**
     * @brief Queues a component addition or overwrite.
     * @details A no-op if the entity is dead by the time the command runs.
     */
    template <typename T>
    void add(Entity e, T&& comp) {
        queue([e, c = std::decay_t<T>(std::forward<T>(comp))](auto& w) mutable {
            w.add(e, std::move(c));
        });
    }

    /** @brief Queues merging a whole bundle into an entity. */
    void insert(Entity e, Bundle bundle); // defined after World in world.hpp

    template <typename T>
    void remove(Entity e) {
        queue([e](auto& w) { w.template remove<std::decay_t<T>>(e); });
    }

    /**
     * @brief Queues an arbitrary closure `void(World&)`.
     * @details Move-only closures are accepted.
     */
    template <typename Func>
    void queue(Func&& fn) {
        commands_.push_back(std::make_unique<Closure<std::decay_t<Func>>>(std::forward<Func>(fn)));
    }

    /**
     * @brief Applies every queued command to `w` in FIFO order.
     * @details Commands queued by running commands are applied in the same call.
     */
    void flush(World& w); // defined after World in world.hpp

    /**
     * @brief Discards every queued command.
     * @details Ids handed out by spawn_empty() that were never placed return to the world's
     * free list.
     */
    void clear(); // defined after World in world.hpp

    bool empty() const { return commands_.empty(); }
    size_t size() const { return commands_.size(); }

private:
    struct Command {
        virtual ~Command() = default;
        virtual void apply(World& w) = 0;
    };

    template <typename Func>
    struct Closure final : Command {
        Func fn;
        explicit Closure(Func f) : fn(std::move(f)) {}
        void apply(World& w) override { fn(w); }
    };

    std::vector<std::unique_ptr<Command>> commands_;
    std::vector<Entity> reserved_;
    World* world_ = nullptr;
};

} // namespace sprout
