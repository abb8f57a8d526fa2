#pragma once
#include "../config.hpp"
#include "spawn_key.hpp"
#include "spawnable.hpp"

#include <memory>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sprout {

/**
 * @brief Resource mapping SpawnKeys to reusable spawnables.
 *
 * @details Installed by SpawnPlugin. Entries are shared, so a spawnable fetched for one spawn
 * stays valid even if the registry is later replaced.
 *
 * Registration is a setup-time operation: registering while children are being materialized
 * panics, as does reusing a key or registering an empty one. Move-assignment is deleted so a
 * live registry cannot be swapped out from under a materialization pass.
 */
class Spawnables {
public:
    Spawnables() = default;
    Spawnables(Spawnables&&) = default;
    Spawnables& operator=(Spawnables&&) = delete;
    Spawnables(const Spawnables&) = delete;
    Spawnables& operator=(const Spawnables&) = delete;

    /**
     * @brief Registers a reusable spawnable under `key` and returns the key.
     * @warning Panics if `key` is empty or already registered, or if children are being
     * materialized.
     */
    template <typename S>
    SpawnKey register_spawnable(SpawnKey key, S spawnable) {
        static_assert(is_spawn_v<S>, "only reusable spawnables can be registered");
        if (key.name().empty())
            fail("spawn key must not be empty: ", key);
        if (materializing_ > 0)
            fail("spawn key registered while materializing children: ", key);
        if (entries_.count(key) != 0)
            fail("spawn key must be unique: ", key);
        entries_.emplace(key, share_spawn(std::move(spawnable)));
        return key;
    }

    bool contains(const SpawnKey& key) const { return entries_.count(key) != 0; }

    size_t size() const { return entries_.size(); }

    bool empty() const { return entries_.empty(); }

    /** @brief Registered keys, in no particular order. */
    std::vector<SpawnKey> keys() const {
        std::vector<SpawnKey> out;
        out.reserve(entries_.size());
        for (auto& [key, entry] : entries_)
            out.push_back(key);
        return out;
    }

    /** @brief The spawnable registered under `key`, or null. */
    std::shared_ptr<const ErasedSpawn> fetch(const SpawnKey& key) const {
        auto it = entries_.find(key);
        return it != entries_.end() ? it->second : nullptr;
    }

    bool materializing() const { return materializing_ > 0; }

    /**
     * @brief Marks a world's registry as in use by a materialization pass for its lifetime.
     * @details Nests. Locks the Spawnables resource slot, so the registry can be neither
     * replaced nor removed (nor installed, if the world had none) until the scope ends.
     */
    class MaterializeScope {
    public:
        explicit MaterializeScope(World& world) : world_(world) {
            world_.lock_resource<Spawnables>();
            if (Spawnables* registry = world_.try_resource<Spawnables>())
                ++registry->materializing_;
        }
        ~MaterializeScope() {
            if (Spawnables* registry = world_.try_resource<Spawnables>())
                --registry->materializing_;
            world_.unlock_resource<Spawnables>();
        }
        MaterializeScope(const MaterializeScope&) = delete;
        MaterializeScope& operator=(const MaterializeScope&) = delete;

    private:
        World& world_;
    };

private:
    std::unordered_map<SpawnKey, std::shared_ptr<const ErasedSpawn>, SpawnKeyHash> entries_;
    int materializing_ = 0;

    [[noreturn]] static void fail(const char* what, const SpawnKey& key) {
        std::ostringstream msg;
        msg << what << key;
        std::string text = msg.str();
        SPROUT_PANIC(text.c_str());
    }
};

} // namespace sprout
