#pragma once

/**
 * @file Placeable.hpp
 * @brief Placed or in-progress object instance with magnets and contacts
 *
 * Lifecycle: a placeable is instantiated as a ghost with its colliders
 * disabled, receives OnStarted, is moved around by the builder, and is
 * finalized exactly once with OnPlaced. A placed object may later receive
 * OnDelete before it is destroyed.
 *
 * Contacts are tracked as other-magnet -> own-magnet handles and resolved
 * through the owning PlacementWorld.
 */

#include "building/BuildIds.hpp"
#include "building/Magnet.hpp"
#include "building/PlaceableDefinition.hpp"
#include "building/SpatialQuery.hpp"
#include "core/json_config.hpp"
#include "math/Transform.hpp"
#include "spatial/AABB.hpp"
#include "spatial/OBB.hpp"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace Lodestone {
namespace Building {

class PlacementWorld;

// ============================================================================
// Memento
// ============================================================================

/**
 * @brief Persistent state of a placed object
 */
struct PlaceableMemento {
    std::string assetId;
    Pose rootPose;
    std::optional<Pose> endPose;    ///< Connectors only
    bool canFloat = true;
    bool isPlayerDeletable = true;
    bool isPlayerPlaceable = true;

    [[nodiscard]] json Pack() const;

    /**
     * @return false if required fields are missing or malformed
     */
    static bool Unpack(const json& j, PlaceableMemento& out);
};

// ============================================================================
// Placeable
// ============================================================================

class Placeable {
public:
    /// Growth of GetBounds() over the collider union, in world units
    static constexpr float BoundsExpansion = 0.125f;

    using Listener = std::function<void(Placeable&)>;
    using ConnectedListener = std::function<void(Placeable&, bool connected)>;

    /**
     * @param firstMagnetId Id of the first magnet; the rest are numbered consecutively
     */
    Placeable(PlaceableId id, const PlaceableDefinition& definition, MagnetId firstMagnetId,
              const Pose& pose = Pose());

    // Non-copyable: magnets are referenced by pointer from spatial queries
    Placeable(const Placeable&) = delete;
    Placeable& operator=(const Placeable&) = delete;

    [[nodiscard]] PlaceableId GetId() const { return m_id; }
    [[nodiscard]] const PlaceableDefinition& GetDefinition() const { return *m_definition; }
    [[nodiscard]] const std::string& GetAssetId() const { return m_definition->assetId; }
    [[nodiscard]] const std::string& GetDisplayName() const { return m_definition->displayName; }

    // =========================================================================
    // Pose
    // =========================================================================

    [[nodiscard]] const Pose& GetPose() const { return m_pose; }
    [[nodiscard]] glm::vec3 GetPosition() const { return m_pose.position; }
    [[nodiscard]] glm::quat GetRotation() const { return m_pose.rotation; }

    /**
     * @brief Move the root; magnets, the end handle included, follow
     */
    void SetPose(const Pose& pose);
    void SetPosition(const glm::vec3& position);
    void SetRotation(const glm::quat& rotation);

    /**
     * @brief Move the end handle independently of the root
     *
     * No-op for placeables without an end handle.
     */
    void SetEndHandlePose(const Pose& worldPose);
    void SetEndHandlePosition(const glm::vec3& position);
    void SetEndHandleRotation(const glm::quat& rotation);

    /**
     * @brief Distance between the root and the end handle, 0 without an end handle
     */
    [[nodiscard]] float GetConnectorLength() const;

    // =========================================================================
    // Magnets
    // =========================================================================

    /**
     * @brief All magnets including the connector end handle
     */
    [[nodiscard]] const std::vector<Magnet>& GetMagnets() const { return m_magnets; }

    /**
     * @brief Magnets that take part in snapping; excludes the end handle
     */
    [[nodiscard]] std::vector<const Magnet*> GetSnapMagnets() const;

    [[nodiscard]] const Magnet* FindMagnet(MagnetId id) const;
    [[nodiscard]] bool OwnsMagnet(MagnetId id) const;

    [[nodiscard]] const Magnet* GetStartHandle() const;
    [[nodiscard]] const Magnet* GetEndHandle() const;

    // =========================================================================
    // Flags
    // =========================================================================

    [[nodiscard]] bool IsConnector() const { return m_definition->isConnector; }
    [[nodiscard]] bool CanFloat() const { return m_canFloat; }
    [[nodiscard]] bool MustSnap() const { return m_definition->mustSnap; }
    [[nodiscard]] bool IsPlayerPlaceable() const { return m_isPlayerPlaceable; }
    [[nodiscard]] bool IsPlayerDeletable() const { return m_isPlayerDeletable; }
    [[nodiscard]] float GetDeletionRefund() const { return m_definition->deletionRefund; }
    [[nodiscard]] float GetOverlapScale() const { return m_definition->GetOverlapScale(); }
    [[nodiscard]] const CostList& GetPlacementCost() const { return m_definition->placementCost; }
    [[nodiscard]] const CostList& GetDeletionCost() const { return m_definition->deletionCost; }

    [[nodiscard]] bool IsStarted() const { return m_started; }
    [[nodiscard]] bool IsPlaced() const { return m_placed; }
    [[nodiscard]] bool IsDeleted() const { return m_deleted; }

    /**
     * @brief Cached at placement: can float, or rests on the ground mask
     */
    [[nodiscard]] bool IsStableGround() const { return m_stableGround; }

    // =========================================================================
    // Colliders
    // =========================================================================

    [[nodiscard]] bool AreCollidersEnabled() const { return m_collidersEnabled; }

    /**
     * @brief Toggle body and magnet colliders together
     */
    void SetCollidersEnabled(bool enabled);

    /**
     * @brief Collision layer of the body; changes while focused
     */
    [[nodiscard]] int GetLayer() const { return m_layer; }
    void SetLayer(int layer) { m_layer = layer; }

    /**
     * @brief Authored blocking boxes in world space
     */
    [[nodiscard]] std::vector<OBB> GetBlockingBoxes() const;

    /**
     * @brief World AABB of the body, grown by BoundsExpansion
     */
    [[nodiscard]] AABB GetBounds() const;

    /**
     * @brief True if any blocking box overlaps the blocking mask
     */
    [[nodiscard]] bool CheckBlocked(const ISpatialQuery& query) const;

    /**
     * @brief True if the bounds overlap the ground mask
     */
    [[nodiscard]] bool CheckGrounded(const ISpatialQuery& query) const;

    // =========================================================================
    // Contacts
    // =========================================================================

    /**
     * @brief Record a contact if @p own may snap to @p other
     */
    void OnStartTouching(const Magnet& own, const Magnet& other);
    void OnEndTouching(const Magnet& own, const Magnet& other);

    /**
     * @brief other magnet -> own magnet
     */
    [[nodiscard]] const std::map<MagnetId, MagnetId>& GetContacts() const { return m_contacts; }

    [[nodiscard]] bool IsTouching(MagnetId otherMagnet) const;

    /**
     * @brief Touching anything; connectors must also be connected
     */
    [[nodiscard]] bool IsTouchingAny() const;

    /**
     * @brief Connector whose required handles are both in contact
     *
     * Always false for non-connectors.
     */
    [[nodiscard]] bool IsConnected() const;

    /**
     * @brief Breadth-first search over contacts for a stable placeable
     */
    [[nodiscard]] bool CheckConnectedToStableGround(const PlacementWorld& world) const;

    [[nodiscard]] bool IsContactsDirty() const { return m_contactsDirty; }
    void ClearContactsDirty() { m_contactsDirty = false; }

    // =========================================================================
    // Floating Countdown
    // =========================================================================

    /**
     * @brief Start or restart the destroy-floating countdown
     */
    void StartFloatingCountdown();
    void CancelFloatingCountdown();
    [[nodiscard]] bool IsFloatingCountdownActive() const { return m_floatingRemaining.has_value(); }

    /**
     * @brief Advance the countdown
     * @return true exactly once, when the countdown expires
     */
    bool AdvanceFloatingCountdown(float deltaTime);

    // =========================================================================
    // Lifecycle
    // =========================================================================

    void OnStarted();
    void OnUpdate();

    /**
     * @brief Finalize placement; repeated calls are ignored
     */
    void OnPlaced(const ISpatialQuery& query);

    void OnAborted();
    void OnDelete();
    void NotifyConnected(bool connected);

    void AddOnStarted(Listener listener) { m_onStarted.push_back(std::move(listener)); }
    void AddOnUpdated(Listener listener) { m_onUpdated.push_back(std::move(listener)); }
    void AddOnPlaced(Listener listener) { m_onPlaced.push_back(std::move(listener)); }
    void AddOnDeleted(Listener listener) { m_onDeleted.push_back(std::move(listener)); }
    void AddOnAborted(Listener listener) { m_onAborted.push_back(std::move(listener)); }
    void AddOnConnectedChanged(ConnectedListener listener) { m_onConnectedChanged.push_back(std::move(listener)); }

    // =========================================================================
    // Memento
    // =========================================================================

    [[nodiscard]] PlaceableMemento Pack() const;

    /**
     * @brief Restore pose and flags without running OnPlaced
     */
    void Unpack(const PlaceableMemento& memento);

private:
    void RefreshMagnetPoses();
    Magnet* GetEndHandleMutable();
    void MarkContactsDirty() { m_contactsDirty = true; }

    PlaceableId m_id;
    const PlaceableDefinition* m_definition;

    Pose m_pose;
    std::vector<Magnet> m_magnets;

    bool m_canFloat;
    bool m_isPlayerPlaceable;
    bool m_isPlayerDeletable;

    bool m_started = false;
    bool m_placed = false;
    bool m_deleted = false;
    bool m_stableGround = false;

    bool m_collidersEnabled = true;
    int m_layer;

    std::map<MagnetId, MagnetId> m_contacts;
    bool m_contactsDirty = false;
    std::optional<float> m_floatingRemaining;

    std::vector<Listener> m_onStarted;
    std::vector<Listener> m_onUpdated;
    std::vector<Listener> m_onPlaced;
    std::vector<Listener> m_onDeleted;
    std::vector<Listener> m_onAborted;
    std::vector<ConnectedListener> m_onConnectedChanged;
};

} // namespace Building
} // namespace Lodestone
