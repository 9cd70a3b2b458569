#include "spatial/OBB.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace Lodestone {

std::array<glm::vec3, 3> OBB::GetAxes() const noexcept {
    glm::mat3 rot = glm::mat3_cast(orientation);
    return {{rot[0], rot[1], rot[2]}};
}

std::array<glm::vec3, 8> OBB::GetCorners() const noexcept {
    const auto axes = GetAxes();

    glm::vec3 x = axes[0] * halfExtents.x;
    glm::vec3 y = axes[1] * halfExtents.y;
    glm::vec3 z = axes[2] * halfExtents.z;

    return {{
        center - x - y - z,
        center + x - y - z,
        center - x + y - z,
        center + x + y - z,
        center - x - y + z,
        center + x - y + z,
        center - x + y + z,
        center + x + y + z
    }};
}

AABB OBB::GetBoundingAABB() const noexcept {
    const auto axes = GetAxes();

    // Project each axis extent onto world axes
    glm::vec3 worldExtent(0.0f);
    for (int i = 0; i < 3; ++i) {
        worldExtent += glm::abs(axes[i]) * halfExtents[i];
    }

    return AABB(center - worldExtent, center + worldExtent);
}

bool OBB::Contains(const glm::vec3& point, float tolerance) const noexcept {
    glm::vec3 local = WorldToLocal(point);

    return std::abs(local.x) <= halfExtents.x + tolerance &&
           std::abs(local.y) <= halfExtents.y + tolerance &&
           std::abs(local.z) <= halfExtents.z + tolerance;
}

glm::vec3 OBB::ClosestPoint(const glm::vec3& point) const noexcept {
    glm::vec3 local = glm::clamp(WorldToLocal(point), -halfExtents, halfExtents);
    return LocalToWorld(local);
}

float OBB::DistanceSquared(const glm::vec3& point) const noexcept {
    glm::vec3 diff = point - ClosestPoint(point);
    return glm::dot(diff, diff);
}

glm::vec3 OBB::WorldToLocal(const glm::vec3& worldPoint) const noexcept {
    return glm::inverse(orientation) * (worldPoint - center);
}

glm::vec3 OBB::LocalToWorld(const glm::vec3& localPoint) const noexcept {
    return center + orientation * localPoint;
}

bool OBB::Intersects(const OBB& other) const noexcept {
    const auto a = GetAxes();
    const auto b = other.GetAxes();
    const glm::vec3& ea = halfExtents;
    const glm::vec3& eb = other.halfExtents;

    constexpr float epsilon = 1e-6f;

    // Rotation expressing other in this box's frame
    float R[3][3];
    float AbsR[3][3];
    for (int i = 0; i < 3; ++i) {
        for (int j = 0; j < 3; ++j) {
            R[i][j] = glm::dot(a[i], b[j]);
            AbsR[i][j] = std::abs(R[i][j]) + epsilon;
        }
    }

    glm::vec3 d = other.center - center;
    glm::vec3 t(glm::dot(d, a[0]), glm::dot(d, a[1]), glm::dot(d, a[2]));

    // Face axes of this box
    for (int i = 0; i < 3; ++i) {
        float rb = eb[0] * AbsR[i][0] + eb[1] * AbsR[i][1] + eb[2] * AbsR[i][2];
        if (std::abs(t[i]) > ea[i] + rb) return false;
    }

    // Face axes of the other box
    for (int j = 0; j < 3; ++j) {
        float ra = ea[0] * AbsR[0][j] + ea[1] * AbsR[1][j] + ea[2] * AbsR[2][j];
        float sep = std::abs(t[0] * R[0][j] + t[1] * R[1][j] + t[2] * R[2][j]);
        if (sep > ra + eb[j]) return false;
    }

    // Edge cross products A_i x B_j
    for (int i = 0; i < 3; ++i) {
        const int i1 = (i + 1) % 3;
        const int i2 = (i + 2) % 3;
        for (int j = 0; j < 3; ++j) {
            const int j1 = (j + 1) % 3;
            const int j2 = (j + 2) % 3;
            float ra = ea[i1] * AbsR[i2][j] + ea[i2] * AbsR[i1][j];
            float rb = eb[j1] * AbsR[i][j2] + eb[j2] * AbsR[i][j1];
            float sep = std::abs(t[i2] * R[i1][j] - t[i1] * R[i2][j]);
            if (sep > ra + rb) return false;
        }
    }

    return true;
}

bool OBB::IntersectsSphere(const glm::vec3& sphereCenter, float radius) const noexcept {
    return DistanceSquared(sphereCenter) <= radius * radius;
}

bool OBB::RayIntersect(const Ray& ray, float& outT, glm::vec3& outNormal) const noexcept {
    const auto axes = GetAxes();

    // Slab test in local space
    glm::vec3 localOrigin = WorldToLocal(ray.origin);
    glm::vec3 localDir = glm::inverse(orientation) * ray.direction;

    float tMin = -std::numeric_limits<float>::max();
    float tMax = std::numeric_limits<float>::max();
    int normalAxis = -1;
    float normalSign = 1.0f;

    for (int i = 0; i < 3; ++i) {
        if (std::abs(localDir[i]) < 1e-6f) {
            if (localOrigin[i] < -halfExtents[i] || localOrigin[i] > halfExtents[i]) {
                return false;
            }
            continue;
        }

        float invD = 1.0f / localDir[i];
        float t1 = (-halfExtents[i] - localOrigin[i]) * invD;
        float t2 = (halfExtents[i] - localOrigin[i]) * invD;
        float sign = -1.0f;
        if (t1 > t2) {
            std::swap(t1, t2);
            sign = 1.0f;
        }

        if (t1 > tMin) {
            tMin = t1;
            normalAxis = i;
            normalSign = sign;
        }
        tMax = std::min(tMax, t2);
        if (tMin > tMax) return false;
    }

    if (tMax < 0.0f) return false;

    outT = tMin >= 0.0f ? tMin : tMax;
    outNormal = normalAxis >= 0 ? axes[normalAxis] * normalSign : glm::vec3(0.0f, 1.0f, 0.0f);
    return true;
}

OBB OBB::Transform(const glm::vec3& translation, const glm::quat& rotation) const noexcept {
    return OBB(rotation * center + translation, halfExtents, rotation * orientation);
}

} // namespace Lodestone
