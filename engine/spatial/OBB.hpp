#pragma once

#include "spatial/AABB.hpp"
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <array>

namespace Lodestone {

/**
 * @brief Oriented Bounding Box
 *
 * Center, half-extents and orientation. Used for blocking volumes, static
 * ground and grid-magnet bounds. Local axes follow the +X right, +Y up,
 * +Z forward convention used throughout the engine.
 */
struct OBB {
    glm::vec3 center{0.0f};
    glm::vec3 halfExtents{0.5f};
    glm::quat orientation{1.0f, 0.0f, 0.0f, 0.0f};

    OBB() noexcept = default;

    OBB(const glm::vec3& c, const glm::vec3& extents, const glm::quat& orient = glm::quat(1, 0, 0, 0)) noexcept
        : center(c), halfExtents(extents), orientation(orient) {}

    [[nodiscard]] static OBB FromAABB(const AABB& aabb) noexcept {
        return OBB(aabb.GetCenter(), aabb.GetExtents());
    }

    // =========================================================================
    // Axis Access
    // =========================================================================

    /**
     * @brief Local X, Y and Z axes in world space
     */
    [[nodiscard]] std::array<glm::vec3, 3> GetAxes() const noexcept;

    // =========================================================================
    // Properties
    // =========================================================================

    [[nodiscard]] std::array<glm::vec3, 8> GetCorners() const noexcept;

    /**
     * @brief Get bounding AABB that contains this OBB
     */
    [[nodiscard]] AABB GetBoundingAABB() const noexcept;

    // =========================================================================
    // Point Queries
    // =========================================================================

    [[nodiscard]] bool Contains(const glm::vec3& point, float tolerance = 0.0f) const noexcept;

    /**
     * @brief Get closest point inside or on the OBB to the given point
     */
    [[nodiscard]] glm::vec3 ClosestPoint(const glm::vec3& point) const noexcept;

    [[nodiscard]] float DistanceSquared(const glm::vec3& point) const noexcept;

    [[nodiscard]] glm::vec3 WorldToLocal(const glm::vec3& worldPoint) const noexcept;
    [[nodiscard]] glm::vec3 LocalToWorld(const glm::vec3& localPoint) const noexcept;

    // =========================================================================
    // Intersection Tests
    // =========================================================================

    /**
     * @brief Test intersection with another OBB using SAT
     */
    [[nodiscard]] bool Intersects(const OBB& other) const noexcept;

    [[nodiscard]] bool IntersectsSphere(const glm::vec3& sphereCenter, float radius) const noexcept;

    /**
     * @brief Ray intersection with entry distance and surface normal
     *
     * Rays starting inside the box report the exit point.
     */
    [[nodiscard]] bool RayIntersect(const Ray& ray, float& outT, glm::vec3& outNormal) const noexcept;

    // =========================================================================
    // Transform
    // =========================================================================

    /**
     * @brief Place a box authored in some local frame into world space
     */
    [[nodiscard]] OBB Transform(const glm::vec3& translation, const glm::quat& rotation) const noexcept;
};

} // namespace Lodestone
