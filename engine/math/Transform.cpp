#include "math/Transform.hpp"

#include <glm/gtc/constants.hpp>

#include <algorithm>
#include <cmath>

namespace Lodestone {

namespace Transform {

namespace {
constexpr float kEpsilon = 1e-6f;
}

glm::quat FromToRotation(const glm::vec3& from, const glm::vec3& to) {
    float lenFrom = glm::length(from);
    float lenTo = glm::length(to);
    if (lenFrom < kEpsilon || lenTo < kEpsilon) {
        return glm::quat(1.0f, 0.0f, 0.0f, 0.0f);
    }

    glm::vec3 a = from / lenFrom;
    glm::vec3 b = to / lenTo;
    float cosTheta = glm::dot(a, b);

    if (cosTheta >= 1.0f - kEpsilon) {
        return glm::quat(1.0f, 0.0f, 0.0f, 0.0f);
    }

    if (cosTheta <= -1.0f + kEpsilon) {
        // Any perpendicular axis will do; prefer one built from world up
        glm::vec3 axis = glm::cross(WorldUp, a);
        if (glm::dot(axis, axis) < kEpsilon) {
            axis = glm::cross(WorldRight, a);
        }
        return glm::angleAxis(glm::pi<float>(), glm::normalize(axis));
    }

    glm::vec3 axis = glm::cross(a, b);
    float s = std::sqrt((1.0f + cosTheta) * 2.0f);
    float invs = 1.0f / s;
    return glm::normalize(glm::quat(s * 0.5f, axis.x * invs, axis.y * invs, axis.z * invs));
}

glm::quat LookRotation(const glm::vec3& forward, const glm::vec3& up) {
    if (glm::dot(forward, forward) < kEpsilon) {
        return glm::quat(1.0f, 0.0f, 0.0f, 0.0f);
    }

    glm::vec3 z = glm::normalize(forward);
    glm::vec3 x = glm::cross(up, z);
    if (glm::dot(x, x) < kEpsilon) {
        // Forward parallel to up; no roll reference left
        return FromToRotation(WorldForward, z);
    }
    x = glm::normalize(x);
    glm::vec3 y = glm::cross(z, x);

    return glm::normalize(glm::quat_cast(glm::mat3(x, y, z)));
}

glm::quat AngleAxis(float degrees, const glm::vec3& axis) {
    if (glm::dot(axis, axis) < kEpsilon) {
        return glm::quat(1.0f, 0.0f, 0.0f, 0.0f);
    }
    return glm::angleAxis(glm::radians(degrees), glm::normalize(axis));
}

float Angle(const glm::quat& a, const glm::quat& b) {
    float d = std::min(std::abs(glm::dot(glm::normalize(a), glm::normalize(b))), 1.0f);
    if (d > 1.0f - kEpsilon) {
        return 0.0f;
    }
    return glm::degrees(2.0f * std::acos(d));
}

glm::quat WithUp(const glm::quat& rotation, const glm::vec3& up) {
    return glm::normalize(FromToRotation(rotation * WorldUp, up) * rotation);
}

glm::quat WithRight(const glm::quat& rotation, const glm::vec3& right) {
    return glm::normalize(FromToRotation(rotation * WorldRight, right) * rotation);
}

} // namespace Transform

} // namespace Lodestone
