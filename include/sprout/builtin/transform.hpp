#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/quaternion.hpp>

namespace sprout {

/**
 * @brief Transform relative to the parent entity (or to the world, for roots).
 * @details Kept as position / rotation / scale for gameplay code; turned into a matrix only
 * during propagation.
 */
struct LocalTransform {
    glm::vec3 position{0.0f, 0.0f, 0.0f};
    /** @brief Defaults to identity (glm stores w first in its constructor). */
    glm::quat rotation{1.0f, 0.0f, 0.0f, 0.0f};
    glm::vec3 scale{1.0f, 1.0f, 1.0f};

    static LocalTransform from_translation(float x, float y, float z) {
        LocalTransform t;
        t.position = {x, y, z};
        return t;
    }

    /** @brief Composes Translation * Rotation * Scale. */
    glm::mat4 matrix() const {
        glm::mat4 m = glm::mat4_cast(rotation);
        m[0] *= scale.x;
        m[1] *= scale.y;
        m[2] *= scale.z;
        m[3] = glm::vec4(position, 1.0f);
        return m;
    }
};

/**
 * @brief Absolute transform, written by propagate_transforms().
 */
struct WorldTransform {
    glm::mat4 matrix{1.0f};

    glm::vec3 translation() const { return glm::vec3(matrix[3]); }
};

} // namespace sprout
