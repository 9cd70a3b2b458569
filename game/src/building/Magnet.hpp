#pragma once

/**
 * @file Magnet.hpp
 * @brief Snap points and snap grids attached to placeables
 *
 * A magnet declares what it is (identity), which seekers it lets in
 * (acceptFrom / rejectFrom) and what it actively looks for (snapTo).
 * Grid magnets expose a quantized snap surface instead of a single point
 * and never seek on their own.
 */

#include "building/BuildIds.hpp"
#include "building/MagnetIdentity.hpp"
#include "math/Transform.hpp"
#include "spatial/OBB.hpp"

#include <glm/glm.hpp>
#include <string>

namespace Lodestone {
namespace Building {

// ============================================================================
// Orientation Contracts
// ============================================================================

/**
 * @brief How a placeable is oriented when one of its magnets snaps
 */
enum class AlignmentMode : uint8_t {
    WorldUp,        ///< Keep upright, use the builder heading
    MagnetForward,  ///< Face the target magnet's forward
    MagnetRight,    ///< Match the target magnet's right axis
    MagnetUp,       ///< Match the target magnet's up axis
    MagnetFace      ///< Mirror the seeker face onto the target face
};

inline const char* AlignmentModeToString(AlignmentMode mode) {
    switch (mode) {
        case AlignmentMode::WorldUp:       return "world_up";
        case AlignmentMode::MagnetForward: return "magnet_forward";
        case AlignmentMode::MagnetRight:   return "magnet_right";
        case AlignmentMode::MagnetUp:      return "magnet_up";
        case AlignmentMode::MagnetFace:    return "magnet_face";
        default:                           return "unknown";
    }
}

/**
 * @throws std::invalid_argument for an unknown name
 */
AlignmentMode AlignmentModeFromString(const std::string& name);

/**
 * @brief Axis around which a snapped object may be rotated
 */
enum class RotateAxis : uint8_t {
    WorldUp,
    Aligned,
    None
};

inline const char* RotateAxisToString(RotateAxis axis) {
    switch (axis) {
        case RotateAxis::WorldUp: return "world_up";
        case RotateAxis::Aligned: return "aligned";
        case RotateAxis::None:    return "none";
        default:                  return "unknown";
    }
}

/**
 * @throws std::invalid_argument for an unknown name
 */
RotateAxis RotateAxisFromString(const std::string& name);

// ============================================================================
// Magnet Spec
// ============================================================================

/**
 * @brief Authored description of a magnet, relative to its placeable
 */
struct MagnetSpec {
    std::string name;
    Pose localPose;

    IdentitySet identity;
    IdentitySet acceptFrom;
    IdentitySet rejectFrom;
    IdentitySet snapTo;

    AlignmentMode alignWith = AlignmentMode::WorldUp;
    RotateAxis rotateAxis = RotateAxis::WorldUp;

    float triggerRadius = 0.25f;        ///< Touch radius of a point magnet

    bool isGrid = false;
    glm::vec2 gridDivisions{2.0f, 2.0f};    ///< Snap points per unit along local x and y
    glm::vec3 gridHalfExtents{0.5f, 0.5f, 0.05f};
};

// ============================================================================
// Magnet
// ============================================================================

class Magnet {
public:
    Magnet(MagnetId id, PlaceableId owner, MagnetSpec spec);

    [[nodiscard]] MagnetId GetId() const { return m_id; }
    [[nodiscard]] PlaceableId GetOwner() const { return m_owner; }
    [[nodiscard]] const std::string& GetName() const { return m_spec.name; }
    [[nodiscard]] const MagnetSpec& GetSpec() const { return m_spec; }

    [[nodiscard]] const IdentitySet& GetIdentity() const { return m_spec.identity; }
    [[nodiscard]] const IdentitySet& GetAcceptFrom() const { return m_spec.acceptFrom; }
    [[nodiscard]] const IdentitySet& GetRejectFrom() const { return m_spec.rejectFrom; }
    [[nodiscard]] const IdentitySet& GetSnapTo() const { return m_spec.snapTo; }

    [[nodiscard]] AlignmentMode GetAlignWith() const { return m_spec.alignWith; }
    [[nodiscard]] RotateAxis GetRotateAxis() const { return m_spec.rotateAxis; }
    [[nodiscard]] float GetTriggerRadius() const { return m_spec.triggerRadius; }

    [[nodiscard]] bool IsGrid() const { return m_spec.isGrid; }

    /**
     * @throws std::logic_error if this is not a grid magnet
     */
    [[nodiscard]] glm::vec2 GetGridDivisions() const;

    /**
     * @brief Distance between adjacent grid points
     * @throws std::logic_error if this is not a grid magnet
     */
    [[nodiscard]] glm::vec2 GetGridSpacing() const;

    /**
     * @brief Grid volume in world space
     * @throws std::logic_error if this is not a grid magnet
     */
    [[nodiscard]] OBB GetGridBounds() const;

    // =========================================================================
    // Pose
    // =========================================================================

    [[nodiscard]] const Pose& GetLocalPose() const { return m_spec.localPose; }
    [[nodiscard]] const Pose& GetWorldPose() const { return m_worldPose; }
    [[nodiscard]] glm::vec3 GetPosition() const { return m_worldPose.position; }
    [[nodiscard]] glm::quat GetRotation() const { return m_worldPose.rotation; }
    [[nodiscard]] glm::vec3 GetForward() const { return m_worldPose.Forward(); }
    [[nodiscard]] glm::vec3 GetUp() const { return m_worldPose.Up(); }
    [[nodiscard]] glm::vec3 GetRight() const { return m_worldPose.Right(); }

    [[nodiscard]] glm::vec3 TransformPoint(const glm::vec3& local) const {
        return m_worldPose.TransformPoint(local);
    }

    [[nodiscard]] glm::vec3 InverseTransformPoint(const glm::vec3& world) const {
        return m_worldPose.InverseTransformPoint(world);
    }

    void SetLocalPose(const Pose& local) { m_spec.localPose = local; }

    /**
     * @brief Recompute the world pose from the owner's pose
     */
    void UpdateWorldPose(const Pose& ownerPose) { m_worldPose = ownerPose * m_spec.localPose; }

    [[nodiscard]] bool IsCollisionEnabled() const { return m_collisionEnabled; }
    void SetCollisionEnabled(bool enabled) { m_collisionEnabled = enabled; }

    /**
     * @brief True if this magnet's trigger volume overlaps the other's
     *
     * Point magnets are spheres. Grid magnets are their grid box.
     */
    [[nodiscard]] bool IsTouching(const Magnet& other) const;

    /**
     * @brief True if a sphere query reaches this magnet's trigger volume
     */
    [[nodiscard]] bool IntersectsSphere(const glm::vec3& center, float radius) const;

    // =========================================================================
    // Snap Queries
    // =========================================================================

    /**
     * @brief Closest snap location to @p point in world space
     *
     * Point magnets return their position. Grid magnets clamp the point into
     * the grid box, flatten it onto the plane through the magnet with the
     * magnet forward as normal, and round each local axis to the grid.
     */
    [[nodiscard]] glm::vec3 GetNearestSnapPosition(const glm::vec3& point) const;

    /**
     * @brief As above, also reporting the snap location in magnet-local space
     */
    glm::vec3 GetNearestSnapPosition(const glm::vec3& point, glm::vec3& outLocalOffset) const;

    // =========================================================================
    // Matching
    // =========================================================================

    /**
     * @brief Whether @p target lets @p seeker in
     *
     * Both lists empty accepts nobody. An accept list requires overlap with
     * the seeker identity; a reject list requires none.
     */
    static bool TargetAcceptsSeeker(const Magnet* seeker, const Magnet* target);

    /**
     * @brief Whether @p seeker is looking for something @p target is
     *
     * Grids and magnets with an empty snapTo never seek.
     */
    static bool SeekerWantsTarget(const Magnet* seeker, const Magnet* target);

    /**
     * @brief Gate used for physical contact between two magnets
     */
    static bool CanSnapTo(const Magnet* from, const Magnet* to);

    /**
     * @brief Gate used while searching for snap candidates
     */
    static bool IsMagnetMatch(const Magnet* seeker, const Magnet* target);

    [[nodiscard]] bool CanSnapTo(const Magnet& other) const { return CanSnapTo(this, &other); }

private:
    void RequireGrid(const char* what) const;

    MagnetId m_id;
    PlaceableId m_owner;
    MagnetSpec m_spec;

    Pose m_worldPose;
    bool m_collisionEnabled = false;
};

} // namespace Building
} // namespace Lodestone
