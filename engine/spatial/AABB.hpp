#pragma once

#include <glm/glm.hpp>
#include <limits>
#include <cmath>

namespace Lodestone {

/**
 * @brief Axis-Aligned Bounding Box
 *
 * Default-constructed boxes are invalid (min > max) so that Expand() on an
 * empty box yields the first point or box.
 */
struct AABB {
    glm::vec3 min{std::numeric_limits<float>::max()};
    glm::vec3 max{std::numeric_limits<float>::lowest()};

    // =========================================================================
    // Constructors
    // =========================================================================

    constexpr AABB() noexcept = default;

    constexpr AABB(const glm::vec3& minPoint, const glm::vec3& maxPoint) noexcept
        : min(minPoint), max(maxPoint) {}

    [[nodiscard]] static constexpr AABB Invalid() noexcept {
        return AABB();
    }

    // =========================================================================
    // Properties
    // =========================================================================

    [[nodiscard]] constexpr glm::vec3 GetCenter() const noexcept {
        return (min + max) * 0.5f;
    }

    /**
     * @brief Get half-extents
     */
    [[nodiscard]] constexpr glm::vec3 GetExtents() const noexcept {
        return (max - min) * 0.5f;
    }

    [[nodiscard]] constexpr glm::vec3 GetSize() const noexcept {
        return max - min;
    }

    [[nodiscard]] constexpr bool IsValid() const noexcept {
        return min.x <= max.x && min.y <= max.y && min.z <= max.z;
    }

    // =========================================================================
    // Modification
    // =========================================================================

    void Expand(const glm::vec3& point) noexcept {
        min = glm::min(min, point);
        max = glm::max(max, point);
    }

    /**
     * @brief Expand to include another AABB; invalid boxes are ignored
     */
    void Expand(const AABB& other) noexcept {
        if (!other.IsValid()) {
            return;
        }
        min = glm::min(min, other.min);
        max = glm::max(max, other.max);
    }

    // =========================================================================
    // Tests
    // =========================================================================

    [[nodiscard]] constexpr bool Contains(const glm::vec3& point) const noexcept {
        return point.x >= min.x && point.x <= max.x &&
               point.y >= min.y && point.y <= max.y &&
               point.z >= min.z && point.z <= max.z;
    }

    [[nodiscard]] constexpr bool Intersects(const AABB& other) const noexcept {
        return min.x <= other.max.x && max.x >= other.min.x &&
               min.y <= other.max.y && max.y >= other.min.y &&
               min.z <= other.max.z && max.z >= other.min.z;
    }

    [[nodiscard]] bool operator==(const AABB& other) const noexcept {
        return min == other.min && max == other.max;
    }
};

/**
 * @brief Ray structure for intersection tests
 */
struct Ray {
    glm::vec3 origin{0.0f};
    glm::vec3 direction{0.0f, 0.0f, 1.0f};

    Ray() noexcept = default;
    Ray(const glm::vec3& o, const glm::vec3& d) noexcept
        : origin(o), direction(glm::normalize(d)) {}

    /**
     * @brief Get point along ray at distance t
     */
    [[nodiscard]] glm::vec3 GetPoint(float t) const noexcept {
        return origin + direction * t;
    }

    /**
     * @brief Perpendicular distance from a point to the infinite line through the ray
     */
    [[nodiscard]] float DistanceToLine(const glm::vec3& point) const noexcept {
        return glm::length(glm::cross(direction, point - origin));
    }

    /**
     * @brief Project a point onto the infinite line through the ray
     */
    [[nodiscard]] glm::vec3 ClosestPointOnLine(const glm::vec3& point) const noexcept {
        return origin + direction * glm::dot(point - origin, direction);
    }
};

} // namespace Lodestone
