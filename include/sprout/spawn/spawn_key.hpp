#pragma once

#include <functional>
#include <ostream>
#include <string>
#include <utility>

namespace sprout {

/**
 * @brief String identifier of a spawnable registered in a Spawnables registry.
 * @details Implicitly constructible from strings so call sites can write
 * `spawn_with_key(world, "Enemy")`. A default-constructed key is empty; empty keys are never
 * registered, so looking one up always fails.
 */
class SpawnKey {
public:
    SpawnKey() = default;
    SpawnKey(std::string name) : name_(std::move(name)) {}
    SpawnKey(const char* name) : name_(name) {}

    const std::string& name() const { return name_; }

    bool operator==(const SpawnKey& o) const { return name_ == o.name_; }
    bool operator!=(const SpawnKey& o) const { return name_ != o.name_; }

private:
    std::string name_;
};

struct SpawnKeyHash {
    size_t operator()(const SpawnKey& key) const { return std::hash<std::string>{}(key.name()); }
};

inline std::ostream& operator<<(std::ostream& out, const SpawnKey& key) {
    return out << "SpawnKey(\"" << key.name() << "\")";
}

} // namespace sprout
