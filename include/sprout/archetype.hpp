#pragma once
#include "component.hpp"
#include "entity.hpp"

#include <algorithm>
#include <initializer_list>
#include <iterator>
#include <map>
#include <vector>

namespace sprout {

/**
 * @brief Sorted list of component ids identifying an archetype.
 */
using TypeSet = std::vector<ComponentTypeID>;

struct TypeSetHash {
    size_t operator()(const TypeSet& ts) const {
        size_t h = ts.size();
        for (auto id : ts)
            h ^= std::hash<ComponentTypeID>{}(id) + 0x9e3779b9 + (h << 6) + (h >> 2);
        return h;
    }
};

inline TypeSet make_typeset(std::initializer_list<ComponentTypeID> ids) {
    TypeSet ts(ids);
    std::sort(ts.begin(), ts.end());
    return ts;
}

inline bool typeset_contains(const TypeSet& ts, ComponentTypeID id) {
    return std::binary_search(ts.begin(), ts.end(), id);
}

/** @brief Returns `ts` with `extra` merged in, still sorted and without duplicates. */
inline TypeSet typeset_union(const TypeSet& ts, const TypeSet& extra) {
    TypeSet out;
    out.reserve(ts.size() + extra.size());
    std::set_union(ts.begin(), ts.end(), extra.begin(), extra.end(), std::back_inserter(out));
    return out;
}

inline TypeSet typeset_without(const TypeSet& ts, ComponentTypeID id) {
    TypeSet out;
    out.reserve(ts.size());
    for (auto cid : ts) {
        if (cid != id)
            out.push_back(cid);
    }
    return out;
}

struct Archetype;

/**
 * @brief Cached transition to the archetype reached by adding or removing one component.
 */
struct ArchetypeEdge {
    Archetype* add_target = nullptr;
    Archetype* remove_target = nullptr;
};

/**
 * @brief All entities sharing exactly one set of component types.
 *
 * @details Components are stored column-wise (one ComponentColumn per type); row `i` of every
 * column belongs to `entities[i]`. Removing a row swaps the last row into the hole so columns
 * stay dense, which means the entity that used to be last changes row. Callers fix up their
 * records using the handle returned by swap_remove().
 */
struct Archetype {
    TypeSet type_set;
    std::map<ComponentTypeID, ComponentColumn> columns;
    std::vector<Entity> entities;
    std::map<ComponentTypeID, ArchetypeEdge> edges;

    explicit Archetype(TypeSet ts) : type_set(std::move(ts)) {
        for (auto cid : type_set)
            columns.emplace(cid, ComponentColumn(vtable_for(cid)));
    }

    Archetype(const Archetype&) = delete;
    Archetype& operator=(const Archetype&) = delete;

    size_t count() const { return entities.size(); }

    bool has_component(ComponentTypeID id) const { return columns.find(id) != columns.end(); }

    ComponentColumn* find_column(ComponentTypeID id) {
        auto it = columns.find(id);
        return it == columns.end() ? nullptr : &it->second;
    }

    const ComponentColumn* find_column(ComponentTypeID id) const {
        auto it = columns.find(id);
        return it == columns.end() ? nullptr : &it->second;
    }

    bool matches(const ComponentTypeID* include, size_t n_include, const ComponentTypeID* exclude,
                 size_t n_exclude) const {
        for (size_t i = 0; i < n_include; ++i) {
            if (!typeset_contains(type_set, include[i]))
                return false;
        }
        for (size_t i = 0; i < n_exclude; ++i) {
            if (typeset_contains(type_set, exclude[i]))
                return false;
        }
        return true;
    }

    void assert_parity() const {
        for (auto& [id, col] : columns)
            SPROUT_ASSERT(col.count == entities.size(), "entity-column parity violated");
    }

    /**
     * @brief Drops the row of an entity that is leaving the world.
     * @return The entity moved into `row`, or INVALID_ENTITY if `row` was the last one.
     */
    Entity swap_remove(size_t row) {
        Entity swapped = INVALID_ENTITY;
        if (row < entities.size() - 1) {
            swapped = entities.back();
            entities[row] = swapped;
        }
        entities.pop_back();
        for (auto& [id, col] : columns)
            col.swap_remove(row);
        assert_parity();
        return swapped;
    }

    /**
     * @brief Moves the row of an entity changing archetype into `dst`.
     * @details Shared columns are relocated; columns `dst` lacks are destroyed. Columns that only
     * `dst` has are left one row short and must be filled by the caller.
     * @return The entity moved into `row` here, or INVALID_ENTITY.
     */
    Entity move_row_to(size_t row, Archetype& dst) {
        for (auto& [cid, col] : columns) {
            if (auto* dst_col = dst.find_column(cid))
                col.move_row_to(row, *dst_col);
            else
                col.swap_remove(row);
        }
        dst.entities.push_back(entities[row]);

        Entity swapped = INVALID_ENTITY;
        if (row < entities.size() - 1) {
            swapped = entities.back();
            entities[row] = swapped;
        }
        entities.pop_back();
        assert_parity();
        return swapped;
    }

    ArchetypeEdge* find_edge(ComponentTypeID id) {
        auto it = edges.find(id);
        return it == edges.end() ? nullptr : &it->second;
    }

    ArchetypeEdge& edge_for(ComponentTypeID id) { return edges[id]; }
};

} // namespace sprout
