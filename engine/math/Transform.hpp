#pragma once

/**
 * @file Transform.hpp
 * @brief Rigid poses and rotation helpers
 *
 * Convention: +X right, +Y up, +Z forward. Angles passed in and out of the
 * helpers in this file are in degrees.
 */

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

namespace Lodestone {

namespace Transform {

inline constexpr glm::vec3 WorldRight{1.0f, 0.0f, 0.0f};
inline constexpr glm::vec3 WorldUp{0.0f, 1.0f, 0.0f};
inline constexpr glm::vec3 WorldForward{0.0f, 0.0f, 1.0f};

/**
 * @brief Shortest-arc rotation taking direction @p from onto direction @p to
 *
 * Antiparallel inputs rotate 180 degrees about an arbitrary perpendicular axis.
 * Zero-length inputs yield identity.
 */
glm::quat FromToRotation(const glm::vec3& from, const glm::vec3& to);

/**
 * @brief Rotation whose forward is @p forward and whose up is as close to @p up as possible
 */
glm::quat LookRotation(const glm::vec3& forward, const glm::vec3& up = WorldUp);

glm::quat AngleAxis(float degrees, const glm::vec3& axis);

/**
 * @brief Angle in degrees between two rotations
 */
float Angle(const glm::quat& a, const glm::quat& b);

/**
 * @brief Minimally rotate @p rotation so that its local up maps to @p up
 */
glm::quat WithUp(const glm::quat& rotation, const glm::vec3& up);

/**
 * @brief Minimally rotate @p rotation so that its local right maps to @p right
 */
glm::quat WithRight(const glm::quat& rotation, const glm::vec3& right);

} // namespace Transform

/**
 * @brief Position and rotation of a rigid frame
 */
struct Pose {
    glm::vec3 position{0.0f};
    glm::quat rotation{1.0f, 0.0f, 0.0f, 0.0f};

    Pose() = default;
    Pose(const glm::vec3& p, const glm::quat& r) : position(p), rotation(r) {}

    [[nodiscard]] glm::vec3 Forward() const { return rotation * Transform::WorldForward; }
    [[nodiscard]] glm::vec3 Up() const { return rotation * Transform::WorldUp; }
    [[nodiscard]] glm::vec3 Right() const { return rotation * Transform::WorldRight; }

    [[nodiscard]] glm::vec3 TransformPoint(const glm::vec3& local) const {
        return position + rotation * local;
    }

    [[nodiscard]] glm::vec3 InverseTransformPoint(const glm::vec3& world) const {
        return glm::inverse(rotation) * (world - position);
    }

    [[nodiscard]] glm::vec3 TransformDirection(const glm::vec3& local) const {
        return rotation * local;
    }

    [[nodiscard]] glm::vec3 InverseTransformDirection(const glm::vec3& world) const {
        return glm::inverse(rotation) * world;
    }

    /**
     * @brief Compose: the world pose of a frame given relative to this one
     */
    [[nodiscard]] Pose operator*(const Pose& local) const {
        return Pose(TransformPoint(local.position), glm::normalize(rotation * local.rotation));
    }

    [[nodiscard]] Pose Inverse() const {
        glm::quat inv = glm::inverse(rotation);
        return Pose(inv * -position, inv);
    }

    bool operator==(const Pose& other) const {
        return position == other.position && rotation == other.rotation;
    }
};

} // namespace Lodestone
