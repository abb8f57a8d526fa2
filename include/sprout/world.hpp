#pragma once
#include "archetype.hpp"
#include "bundle.hpp"
#include "command_buffer.hpp"
#include "component.hpp"
#include "entity.hpp"

#include <algorithm>
#include <functional>
#include <memory>
#include <new>
#include <tuple>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sprout {

/**
 * @brief Where an entity's data lives.
 * @details A null archetype marks a free slot, or a slot reserved by a command buffer that
 * has not been flushed yet.
 */
struct EntityRecord {
    Archetype* archetype = nullptr;
    size_t row = 0;
};

/**
 * @brief Owns every entity, component and resource of one simulation.
 *
 * @details The World is responsible for:
 * - Creating, reserving and destroying entities.
 * - Storing components in archetypes and migrating entities when their component set changes.
 * - Queries over component signatures, with optional exclusion filters.
 * - Per-world singleton resources (a Spawnables registry, for example).
 * - Observers fired when components are added or removed.
 *
 * Structural changes are not allowed while a query is running; queue them on deferred()
 * instead. Not thread-safe.
 */
class World {
public:
    /**
     * @brief Constructs an empty World.
     * @details Slot 0 is reserved so INVALID_ENTITY is never alive.
     */
    World() : deferred_commands_(*this) {
        generations_.push_back(1);
        records_.push_back({});
    }

    ~World() {
        deferred_commands_.clear();
        // Resources may own components or other heavy state; release them first so their
        // destructors run while the rest of the world is still intact.
        resources_.clear();
    }

    World(const World&) = delete;
    World& operator=(const World&) = delete;
    World(World&&) = delete;
    World& operator=(World&&) = delete;

    // -- Entity creation --

    /**
     * @brief Creates a new entity with no components.
     * @warning Asserts if called during query iteration.
     */
    Entity create() {
        SPROUT_ASSERT(iterating_ == 0, "structural change during iteration");
        Entity e = allocate_slot();
        place(e);
        return e;
    }

    /**
     * @brief Creates a new entity holding the given components.
     * @warning Asserts if called during query iteration.
     */
    template <typename... Ts>
    Entity create_with(Ts&&... components) {
        Entity e = create();
        insert(e, Bundle::of(std::forward<Ts>(components)...));
        return e;
    }

    /**
     * @brief Hands out an entity id without creating the entity.
     * @details Safe during iteration. The id stays dead until place() is called on it, which
     * is what CommandBuffer::spawn_empty() queues.
     */
    Entity reserve() { return allocate_slot(); }

    /**
     * @brief Gives back a reserved id that will never be placed.
     * @details A no-op unless `e` is still a pending reservation.
     */
    void release_reservation(Entity e) {
        if (e.index == 0 || e.index >= generations_.size() || e.generation != generations_[e.index])
            return;
        if (records_[e.index].archetype != nullptr)
            return;
        generations_[e.index]++;
        free_list_.push_back(e.index);
    }

    /**
     * @brief Brings a reserved entity to life with no components.
     * @details A no-op if `e` is not a pending reservation.
     */
    void place(Entity e) {
        SPROUT_ASSERT(iterating_ == 0, "structural change during iteration");
        if (e.index >= generations_.size() || e.generation != generations_[e.index])
            return;
        auto& rec = records_[e.index];
        if (rec.archetype != nullptr)
            return;
        Archetype* arch = get_or_create_archetype({});
        arch->entities.push_back(e);
        rec = {arch, arch->count() - 1};
    }

    // -- Entity destruction --

    /**
     * @brief Destroys an entity and its components.
     * @details Does nothing if the entity is already dead.
     * @warning Asserts if called during query iteration.
     */
    void destroy(Entity e) {
        SPROUT_ASSERT(iterating_ == 0, "structural change during iteration");
        if (!alive(e))
            return;
        Archetype* arch = records_[e.index].archetype;
        for (auto& [cid, col] : arch->columns)
            fire_hooks(on_remove_hooks_, cid, e, col.get(records_[e.index].row));

        // A hook may have moved the entity; re-read the record.
        Archetype* current = records_[e.index].archetype;
        size_t row = records_[e.index].row;
        Entity swapped = current->swap_remove(row);
        if (swapped != INVALID_ENTITY)
            records_[swapped.index].row = row;
        records_[e.index] = {};
        generations_[e.index]++;
        free_list_.push_back(e.index);
    }

    bool alive(Entity e) const {
        return e.index < generations_.size() && e.generation == generations_[e.index] &&
               records_[e.index].archetype != nullptr;
    }

    // -- Utility queries --

    /** @brief Number of living entities. */
    size_t count() const {
        size_t total = 0;
        for (auto& [ts, arch] : archetypes_)
            total += arch->count();
        return total;
    }

    /** @brief Number of living entities holding every one of Ts... */
    template <typename... Ts>
    size_t count() const {
        ComponentTypeID ids[] = {component_id<Ts>()...};
        size_t total = 0;
        for (auto& [ts, arch] : archetypes_) {
            if (arch->matches(ids, sizeof...(Ts), nullptr, 0))
                total += arch->count();
        }
        return total;
    }

    /**
     * @brief Runs `fn(Entity, Ts&...)` on the one entity matching Ts...
     * @warning Asserts unless exactly one entity matches.
     */
    template <typename... Ts, typename Func>
    void single(Func&& fn) {
        size_t found = 0;
        each<Ts...>([&](Entity e, Ts&... comps) {
            ++found;
            SPROUT_ASSERT(found <= 1, "single<Ts...>() matched more than one entity");
            fn(e, comps...);
        });
        SPROUT_ASSERT(found == 1, "single<Ts...>() matched zero entities");
    }

    // -- Deferred commands --

    /** @brief The world's own command buffer, flushed by the schedule after every system. */
    CommandBuffer& deferred() { return deferred_commands_; }

    /** @warning Asserts if called during query iteration. */
    void flush_deferred() {
        SPROUT_ASSERT(iterating_ == 0, "flush during iteration");
        deferred_commands_.flush(*this);
    }

    // -- Resources --

    /**
     * @brief Creates or replaces the resource of type T.
     * @warning Panics while T is locked (see lock_resource()).
     */
    template <typename T>
    void set_resource(T&& value) {
        using U = std::decay_t<T>;
        auto id = component_id<U>();
        if (resource_locked_id(id))
            SPROUT_PANIC("resource replaced while locked");
        ErasedResource r;
        r.data = new U(std::forward<T>(value));
        r.deleter = [](void* p) { delete static_cast<U*>(p); };
        resources_[id] = std::move(r);
    }

    /** @warning Asserts if the resource does not exist. */
    template <typename T>
    T& resource() {
        T* r = try_resource<T>();
        SPROUT_ASSERT(r != nullptr, "resource<T>() not found");
        return *r;
    }

    template <typename T>
    const T& resource() const {
        const T* r = try_resource<T>();
        SPROUT_ASSERT(r != nullptr, "resource<T>() not found");
        return *r;
    }

    template <typename T>
    T* try_resource() {
        auto it = resources_.find(component_id<T>());
        if (it == resources_.end() || !it->second.data)
            return nullptr;
        return static_cast<T*>(it->second.data);
    }

    template <typename T>
    const T* try_resource() const {
        auto it = resources_.find(component_id<T>());
        if (it == resources_.end() || !it->second.data)
            return nullptr;
        return static_cast<const T*>(it->second.data);
    }

    template <typename T>
    bool has_resource() const {
        return try_resource<T>() != nullptr;
    }

    /** @warning Panics while T is locked. */
    template <typename T>
    void remove_resource() {
        if (resource_locked_id(component_id<T>()))
            SPROUT_PANIC("resource removed while locked");
        resources_.erase(component_id<T>());
    }

    /**
     * @brief Pins the resource slot of type T: until the matching unlock_resource(),
     * set_resource<T>() and remove_resource<T>() panic, so pointers to the resource stay valid.
     * @details Nests. Works whether or not the resource exists yet.
     */
    template <typename T>
    void lock_resource() {
        ++resource_locks_[component_id<T>()];
    }

    template <typename T>
    void unlock_resource() {
        auto it = resource_locks_.find(component_id<T>());
        SPROUT_ASSERT(it != resource_locks_.end() && it->second > 0, "unbalanced unlock_resource");
        if (--it->second == 0)
            resource_locks_.erase(it);
    }

    template <typename T>
    bool resource_locked() const {
        return resource_locked_id(component_id<T>());
    }

    // -- Observers --

    /**
     * @brief Registers `fn(World&, Entity, T&)`, called whenever T is added to an entity.
     * @details Not called when an existing T is overwritten.
     */
    template <typename T>
    void on_add(std::function<void(World&, Entity, T&)> fn) {
        auto cid = component_id<std::decay_t<T>>();
        on_add_hooks_[cid].push_back([fn = std::move(fn)](World& w, Entity e, void* ptr) {
            fn(w, e, *static_cast<T*>(ptr));
        });
    }

    /**
     * @brief Registers `fn(World&, Entity, T&)`, called before T leaves an entity.
     * @details The component is still valid during the call. Also fires on destroy().
     */
    template <typename T>
    void on_remove(std::function<void(World&, Entity, T&)> fn) {
        auto cid = component_id<std::decay_t<T>>();
        on_remove_hooks_[cid].push_back([fn = std::move(fn)](World& w, Entity e, void* ptr) {
            fn(w, e, *static_cast<T*>(ptr));
        });
    }

    // -- Component access --

    template <typename T>
    bool has(Entity e) const {
        if (!alive(e))
            return false;
        return records_[e.index].archetype->has_component(component_id<T>());
    }

    /** @warning Asserts if the entity is dead or lacks T. */
    template <typename T>
    T& get(Entity e) {
        return const_cast<T&>(static_cast<const World&>(*this).get<T>(e));
    }

    template <typename T>
    const T& get(Entity e) const {
        SPROUT_ASSERT(alive(e), "get<T> on dead entity");
        SPROUT_ASSERT(has<T>(e), "get<T> on entity missing component");
        auto& rec = records_[e.index];
        return *static_cast<const T*>(rec.archetype->find_column(component_id<T>())->get(rec.row));
    }

    template <typename T>
    T* try_get(Entity e) {
        if (!has<T>(e))
            return nullptr;
        return &get<T>(e);
    }

    template <typename T>
    const T* try_get(Entity e) const {
        if (!has<T>(e))
            return nullptr;
        return &get<T>(e);
    }

    /**
     * @brief Moves T out of an entity and removes the component.
     * @details on_remove observers see the moved-from value.
     * @warning Asserts if the entity lacks T.
     */
    template <typename T>
    T take(Entity e) {
        SPROUT_ASSERT(has<T>(e), "take<T> on entity missing component");
        T out = std::move(get<T>(e));
        remove<T>(e);
        return out;
    }

    // -- Structural changes --

    /**
     * @brief Adds or overwrites a component.
     * @details Overwriting keeps the entity in place; adding migrates it to the archetype with
     * T. A no-op on dead entities.
     * @warning Asserts if called during query iteration.
     */
    template <typename T>
    void add(Entity e, T&& component) {
        using U = std::decay_t<T>;
        SPROUT_ASSERT(iterating_ == 0, "structural change during iteration");
        if (!alive(e))
            return;
        const ComponentVTable* vt = ensure_registered<U>();

        auto& rec = records_[e.index];
        Archetype* old_arch = rec.archetype;
        if (auto* col = old_arch->find_column(vt->id)) {
            U tmp(std::forward<T>(component));
            void* slot = col->get(rec.row);
            vt->destroy(slot);
            new (slot) U(std::move(tmp));
            return;
        }

        Archetype* new_arch = find_add_target(old_arch, vt->id);
        migrate(e, old_arch, new_arch);

        auto* col = new_arch->find_column(vt->id);
        col->reserve(col->count + 1);
        new (col->get(col->count)) U(std::forward<T>(component));
        ++col->count;
        new_arch->assert_parity();

        fire_add(vt->id, e);
    }

    /**
     * @brief Merges every component of `bundle` into an entity in one migration.
     * @details Components the entity already has are overwritten. on_add observers fire for
     * the newly added types only. A no-op on dead entities (the bundle is discarded).
     * @warning Asserts if called during query iteration.
     */
    void insert(Entity e, Bundle&& bundle) {
        SPROUT_ASSERT(iterating_ == 0, "structural change during iteration");
        if (!alive(e) || bundle.empty()) {
            bundle.clear();
            return;
        }

        TypeSet incoming;
        incoming.reserve(bundle.size());
        for (auto& entry : bundle.entries()) {
            ensure_registered(entry.vtable);
            incoming.push_back(entry.cid);
        }
        std::sort(incoming.begin(), incoming.end());

        Archetype* old_arch = records_[e.index].archetype;
        TypeSet target_ts = typeset_union(old_arch->type_set, incoming);
        Archetype* target = old_arch;
        if (target_ts != old_arch->type_set) {
            target = get_or_create_archetype(target_ts);
            migrate(e, old_arch, target);
        }

        size_t row = records_[e.index].row;
        std::vector<ComponentTypeID> added;
        bundle.drain([&](const Bundle::Entry& entry) {
            auto* col = target->find_column(entry.cid);
            if (typeset_contains(old_arch->type_set, entry.cid)) {
                col->replace_relocate(row, entry.data);
            } else {
                col->push_relocate(entry.data);
                added.push_back(entry.cid);
            }
        });
        target->assert_parity();

        for (auto cid : added)
            fire_add(cid, e);
    }

    /**
     * @brief Removes T from an entity, migrating it to the archetype without T.
     * @details A no-op if the entity is dead or lacks T.
     * @warning Asserts if called during query iteration.
     */
    template <typename T>
    void remove(Entity e) {
        SPROUT_ASSERT(iterating_ == 0, "structural change during iteration");
        if (!alive(e))
            return;
        ComponentTypeID cid = component_id<T>();
        if (!records_[e.index].archetype->has_component(cid))
            return;

        {
            auto& rec = records_[e.index];
            fire_hooks(on_remove_hooks_, cid, e, rec.archetype->find_column(cid)->get(rec.row));
        }

        // Observers may have changed the entity; start from its current archetype.
        if (!alive(e))
            return;
        Archetype* old_arch = records_[e.index].archetype;
        if (!old_arch->has_component(cid))
            return;
        migrate(e, old_arch, find_remove_target(old_arch, cid));
    }

    // -- Query iteration --

    // Exclude filter tag: each<A, B>(Exclude<C, D>{}, fn) matches entities with A,B but not C,D.
    template <typename... Ts>
    struct Exclude {};

    /**
     * @brief Calls `fn(Entity, Ts&...)` for every entity holding all of Ts...
     */
    template <typename... Ts, typename Func>
    void each(Func&& fn) {
        ComponentTypeID ids[] = {component_id<Ts>()...};
        for_matching(ids, sizeof...(Ts), nullptr, 0, [&](Archetype* arch) {
            auto cols = std::make_tuple(column_data<Ts>(arch)...);
            for (size_t i = 0; i < arch->count(); ++i)
                fn(arch->entities[i], std::get<Ts*>(cols)[i]...);
        });
    }

    /** @brief Calls `fn(Ts&...)` for every entity holding all of Ts... */
    template <typename... Ts, typename Func>
    void each_no_entity(Func&& fn) {
        ComponentTypeID ids[] = {component_id<Ts>()...};
        for_matching(ids, sizeof...(Ts), nullptr, 0, [&](Archetype* arch) {
            auto cols = std::make_tuple(column_data<Ts>(arch)...);
            for (size_t i = 0; i < arch->count(); ++i)
                fn(std::get<Ts*>(cols)[i]...);
        });
    }

    /** @brief Like each<Ts...>() but skips entities holding any of Ex... */
    template <typename... Ts, typename... Ex, typename Func>
    void each(Exclude<Ex...>, Func&& fn) {
        ComponentTypeID include_ids[] = {component_id<Ts>()...};
        ComponentTypeID exclude_ids[] = {component_id<Ex>()...};
        for_matching(include_ids, sizeof...(Ts), exclude_ids, sizeof...(Ex), [&](Archetype* arch) {
            auto cols = std::make_tuple(column_data<Ts>(arch)...);
            for (size_t i = 0; i < arch->count(); ++i)
                fn(arch->entities[i], std::get<Ts*>(cols)[i]...);
        });
    }

    template <typename... Ts, typename... Ex, typename Func>
    void each_no_entity(Exclude<Ex...>, Func&& fn) {
        ComponentTypeID include_ids[] = {component_id<Ts>()...};
        ComponentTypeID exclude_ids[] = {component_id<Ex>()...};
        for_matching(include_ids, sizeof...(Ts), exclude_ids, sizeof...(Ex), [&](Archetype* arch) {
            auto cols = std::make_tuple(column_data<Ts>(arch)...);
            for (size_t i = 0; i < arch->count(); ++i)
                fn(std::get<Ts*>(cols)[i]...);
        });
    }

private:
    struct ErasedResource {
        void* data = nullptr;
        void (*deleter)(void*) = nullptr;

        ErasedResource() = default;
        ~ErasedResource() { reset(); }
        ErasedResource(ErasedResource&& o) noexcept : data(o.data), deleter(o.deleter) {
            o.data = nullptr;
        }
        ErasedResource& operator=(ErasedResource&& o) noexcept {
            if (this != &o) {
                reset();
                data = o.data;
                deleter = o.deleter;
                o.data = nullptr;
            }
            return *this;
        }
        ErasedResource(const ErasedResource&) = delete;
        ErasedResource& operator=(const ErasedResource&) = delete;

        void reset() {
            if (data && deleter)
                deleter(data);
            data = nullptr;
        }
    };

    using Hook = std::function<void(World&, Entity, void*)>;
    using HookMap = std::unordered_map<ComponentTypeID, std::vector<Hook>>;

    std::vector<uint32_t> generations_;
    std::vector<EntityRecord> records_;
    std::vector<uint32_t> free_list_;
    std::unordered_map<TypeSet, std::unique_ptr<Archetype>, TypeSetHash> archetypes_;
    std::unordered_map<ComponentTypeID, ErasedResource> resources_;
    std::unordered_map<ComponentTypeID, int> resource_locks_;
    int iterating_ = 0;
    CommandBuffer deferred_commands_;
    HookMap on_add_hooks_;
    HookMap on_remove_hooks_;

    bool resource_locked_id(ComponentTypeID id) const {
        return resource_locks_.find(id) != resource_locks_.end();
    }

    Entity allocate_slot() {
        uint32_t idx;
        if (!free_list_.empty()) {
            idx = free_list_.back();
            free_list_.pop_back();
        } else {
            idx = static_cast<uint32_t>(generations_.size());
            generations_.push_back(0);
            records_.push_back({});
        }
        return Entity{idx, generations_[idx]};
    }

    void fire_hooks(const HookMap& hooks, ComponentTypeID cid, Entity e, void* data) {
        auto it = hooks.find(cid);
        if (it == hooks.end())
            return;
        for (auto& fn : it->second)
            fn(*this, e, data);
    }

    // Looks the component up again so observers see the entity where it lives right now.
    void fire_add(ComponentTypeID cid, Entity e) {
        if (on_add_hooks_.find(cid) == on_add_hooks_.end() || !alive(e))
            return;
        auto& rec = records_[e.index];
        if (auto* col = rec.archetype->find_column(cid))
            fire_hooks(on_add_hooks_, cid, e, col->get(rec.row));
    }

    template <typename T>
    static T* column_data(Archetype* arch) {
        return static_cast<T*>(static_cast<void*>(arch->find_column(component_id<T>())->data));
    }

    template <typename Visit>
    void for_matching(const ComponentTypeID* include, size_t n_include,
                      const ComponentTypeID* exclude, size_t n_exclude, Visit&& visit) {
        ++iterating_;
        struct Guard {
            int& count;
            ~Guard() { --count; }
        } guard{iterating_};

        for (auto& [ts, arch] : archetypes_) {
            if (arch->count() == 0 || !arch->matches(include, n_include, exclude, n_exclude))
                continue;
            visit(arch.get());
        }
    }

    Archetype* get_or_create_archetype(const TypeSet& ts) {
        auto it = archetypes_.find(ts);
        if (it != archetypes_.end())
            return it->second.get();
        auto arch = std::make_unique<Archetype>(ts);
        Archetype* ptr = arch.get();
        archetypes_.emplace(ts, std::move(arch));
        return ptr;
    }

    Archetype* find_add_target(Archetype* src, ComponentTypeID cid) {
        if (auto* edge = src->find_edge(cid); edge && edge->add_target)
            return edge->add_target;
        TypeSet ts = typeset_union(src->type_set, TypeSet{cid});
        Archetype* target = get_or_create_archetype(ts);
        src->edge_for(cid).add_target = target;
        return target;
    }

    Archetype* find_remove_target(Archetype* src, ComponentTypeID cid) {
        if (auto* edge = src->find_edge(cid); edge && edge->remove_target)
            return edge->remove_target;
        Archetype* target = get_or_create_archetype(typeset_without(src->type_set, cid));
        src->edge_for(cid).remove_target = target;
        return target;
    }

    // Moves `e` from `from` to `to`. Columns only `to` has are left for the caller to fill.
    void migrate(Entity e, Archetype* from, Archetype* to) {
        size_t row = records_[e.index].row;
        Entity swapped = from->move_row_to(row, *to);
        if (swapped != INVALID_ENTITY)
            records_[swapped.index].row = row;
        records_[e.index] = {to, to->count() - 1};
    }
};

// -- CommandBuffer members that need the complete World --

inline Entity CommandBuffer::spawn_empty() {
    if (world_ == nullptr)
        SPROUT_PANIC("spawn_empty on a command buffer not bound to a world");
    Entity e = world_->reserve();
    reserved_.push_back(e);
    queue([e](World& w) { w.place(e); });
    return e;
}

inline void CommandBuffer::destroy(Entity e) {
    queue([e](World& w) { w.destroy(e); });
}

inline void CommandBuffer::insert(Entity e, Bundle bundle) {
    queue([e, b = std::move(bundle)](World& w) mutable { w.insert(e, std::move(b)); });
}

inline void CommandBuffer::flush(World& w) {
    SPROUT_ASSERT(world_ == nullptr || world_ == &w,
                  "command buffer flushed into a world it is not bound to");
    // Commands may queue more commands; keep draining until the buffer stays empty.
    while (!commands_.empty()) {
        std::vector<std::unique_ptr<Command>> local = std::move(commands_);
        commands_.clear();
        for (auto& cmd : local)
            cmd->apply(w);
    }
    reserved_.clear();
}

inline void CommandBuffer::clear() {
    commands_.clear();
    if (world_) {
        for (Entity e : reserved_)
            world_->release_reservation(e);
    }
    reserved_.clear();
}

inline CommandBuffer::~CommandBuffer() {
    clear();
}

inline CommandBuffer& CommandBuffer::operator=(CommandBuffer&& o) noexcept {
    if (this != &o) {
        clear();
        commands_ = std::move(o.commands_);
        reserved_ = std::move(o.reserved_);
        world_ = o.world_;
        o.commands_.clear();
        o.reserved_.clear();
    }
    return *this;
}

} // namespace sprout
