#pragma once
#include "../entity.hpp"
#include <vector>

namespace sprout {

/**
 * @brief Points a child at its parent.
 * @details Kept in sync with the parent's Children by set_parent() / remove_parent().
 */
struct Parent {
    Entity entity = INVALID_ENTITY;
};

/**
 * @brief A parent's children, in the order they were attached.
 */
struct Children {
    std::vector<Entity> entities;
};

} // namespace sprout
