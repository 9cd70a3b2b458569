#include "building/Magnet.hpp"

#include <cmath>
#include <stdexcept>

namespace Lodestone {
namespace Building {

AlignmentMode AlignmentModeFromString(const std::string& name) {
    if (name == "world_up")       return AlignmentMode::WorldUp;
    if (name == "magnet_forward") return AlignmentMode::MagnetForward;
    if (name == "magnet_right")   return AlignmentMode::MagnetRight;
    if (name == "magnet_up")      return AlignmentMode::MagnetUp;
    if (name == "magnet_face")    return AlignmentMode::MagnetFace;
    throw std::invalid_argument("Unknown alignment mode: " + name);
}

RotateAxis RotateAxisFromString(const std::string& name) {
    if (name == "world_up") return RotateAxis::WorldUp;
    if (name == "aligned")  return RotateAxis::Aligned;
    if (name == "none")     return RotateAxis::None;
    throw std::invalid_argument("Unknown rotate axis: " + name);
}

Magnet::Magnet(MagnetId id, PlaceableId owner, MagnetSpec spec)
    : m_id(id)
    , m_owner(owner)
    , m_spec(std::move(spec))
    , m_worldPose(m_spec.localPose) {
}

void Magnet::RequireGrid(const char* what) const {
    if (!m_spec.isGrid) {
        throw std::logic_error(std::string("Can only get ") + what + " on a grid magnet");
    }
}

glm::vec2 Magnet::GetGridDivisions() const {
    RequireGrid("grid divisions");
    return m_spec.gridDivisions;
}

glm::vec2 Magnet::GetGridSpacing() const {
    RequireGrid("grid spacing");
    return glm::vec2(1.0f) / m_spec.gridDivisions;
}

OBB Magnet::GetGridBounds() const {
    RequireGrid("grid bounds");
    return OBB(m_worldPose.position, m_spec.gridHalfExtents, m_worldPose.rotation);
}

bool Magnet::IsTouching(const Magnet& other) const {
    if (m_spec.isGrid && other.m_spec.isGrid) {
        return GetGridBounds().Intersects(other.GetGridBounds());
    }
    if (m_spec.isGrid) {
        return GetGridBounds().IntersectsSphere(other.GetPosition(), other.GetTriggerRadius());
    }
    return other.IntersectsSphere(GetPosition(), GetTriggerRadius());
}

bool Magnet::IntersectsSphere(const glm::vec3& center, float radius) const {
    if (m_spec.isGrid) {
        return GetGridBounds().IntersectsSphere(center, radius);
    }
    float reach = radius + m_spec.triggerRadius;
    glm::vec3 delta = center - m_worldPose.position;
    return glm::dot(delta, delta) <= reach * reach;
}

glm::vec3 Magnet::GetNearestSnapPosition(const glm::vec3& point) const {
    glm::vec3 unused;
    return GetNearestSnapPosition(point, unused);
}

glm::vec3 Magnet::GetNearestSnapPosition(const glm::vec3& point, glm::vec3& outLocalOffset) const {
    if (!m_spec.isGrid) {
        outLocalOffset = glm::vec3(0.0f);
        return m_worldPose.position;
    }

    // Clamp into the box, then drop onto the grid plane
    glm::vec3 inBounds = GetGridBounds().ClosestPoint(point);
    glm::vec3 normal = m_worldPose.Forward();
    glm::vec3 onPlane = inBounds - normal * glm::dot(inBounds - m_worldPose.position, normal);

    glm::vec3 local = m_worldPose.InverseTransformPoint(onPlane);
    const glm::vec2& div = m_spec.gridDivisions;
    glm::vec3 snapLocal(
        std::round(local.x * div.x) / div.x,
        std::round(local.y * div.y) / div.y,
        0.0f);

    outLocalOffset = snapLocal;
    return m_worldPose.TransformPoint(snapLocal);
}

// ============================================================================
// Matching
// ============================================================================

bool Magnet::TargetAcceptsSeeker(const Magnet* seeker, const Magnet* target) {
    if (!seeker || !target) {
        return false;
    }

    const bool hasWhitelist = !target->GetAcceptFrom().Empty();
    const bool hasBlacklist = !target->GetRejectFrom().Empty();
    const IdentitySet& identity = seeker->GetIdentity();

    if (hasWhitelist && hasBlacklist) {
        return target->GetAcceptFrom().Overlaps(identity) &&
               !target->GetRejectFrom().Overlaps(identity);
    }
    if (hasBlacklist) {
        return !target->GetRejectFrom().Overlaps(identity);
    }
    if (hasWhitelist) {
        return target->GetAcceptFrom().Overlaps(identity);
    }
    return false;
}

bool Magnet::SeekerWantsTarget(const Magnet* seeker, const Magnet* target) {
    if (!seeker || !target) {
        return false;
    }
    if (seeker->IsGrid() || seeker->GetSnapTo().Empty()) {
        return false;
    }
    return seeker->GetSnapTo().Overlaps(target->GetIdentity());
}

bool Magnet::CanSnapTo(const Magnet* from, const Magnet* to) {
    if (!from || !to || from->GetSnapTo().Empty()) {
        return false;
    }
    return SeekerWantsTarget(from, to) && TargetAcceptsSeeker(from, to);
}

bool Magnet::IsMagnetMatch(const Magnet* seeker, const Magnet* target) {
    return TargetAcceptsSeeker(seeker, target) && SeekerWantsTarget(seeker, target);
}

} // namespace Building
} // namespace Lodestone
