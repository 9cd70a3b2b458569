#pragma once

/**
 * @file Builder.hpp
 * @brief Interactive placement and deletion controller
 *
 * The Builder consumes one InputState per frame, casts the pointer ray into
 * the PlacementWorld and drives a hierarchical state machine:
 *
 * - Ready: nothing selected, aimed placeables are highlighted
 * - Placing: a ghost of the selected definition follows the pointer and
 *   snaps to compatible magnets; confirm commits it
 * - Deleting: the aimed placeable is highlighted; confirm deletes it
 *
 * Ready, Placing and Deleting each split into IsHit and NoHit substates.
 * Costs are claimed from an IResourceLedger transactionally.
 */

#include "building/BuilderConfig.hpp"
#include "building/BuilderView.hpp"
#include "building/InputState.hpp"
#include "building/PlacementEvents.hpp"
#include "building/PlaceableDefinition.hpp"
#include "building/SpatialQuery.hpp"
#include "core/StateMachine.hpp"
#include "spatial/AABB.hpp"
#include "math/Transform.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace Lodestone {
namespace Building {

class Magnet;
class Placeable;
class PlacementWorld;
class PlaceableCatalog;
class IResourceLedger;

// ============================================================================
// States and Triggers
// ============================================================================

enum class BuilderState : uint8_t {
    Initial,        ///< Constructed, waiting for Start()
    Disabled,
    Ready,
    ReadyNoHit,
    ReadyIsHit,
    Placing,
    PlacingNoHit,
    PlacingIsHit,
    Deleting,
    DeletingNoHit,
    DeletingIsHit,
    Final           ///< Torn down, accepts nothing
};

enum class BuilderTrigger : uint8_t {
    Start,
    Enable,
    Disable,
    ToolSelected,
    ToolDeselected,
    StartPlacing,
    StartDeleting,
    Cancel,
    IsHit,
    NoHit,
    Update,
    Confirmed,
    InstanceLost,
    Final
};

const char* BuilderStateToString(BuilderState state);
const char* BuilderTriggerToString(BuilderTrigger trigger);

// ============================================================================
// Placement State
// ============================================================================

/**
 * @brief Transient state of one in-progress placement
 *
 * Reset whenever a new ghost is created; only the heading carries over.
 */
struct PlaceState {
    MagnetId selectedWorldMagnet = InvalidMagnetId;
    MagnetId selectedPlaceableMagnet = InvalidMagnetId;
    glm::vec3 selectedWorldMagnetOffset{0.0f};     ///< Grid cell in world magnet space

    float heading = 0.0f;                           ///< Accumulated scroll rotation, degrees
    glm::vec3 headingVector = Transform::WorldForward;

    std::optional<Ray> alignmentRay;                ///< Set while the align input is held
    int confirmCount = 0;                           ///< Connectors: 1 once the start is confirmed
};

// ============================================================================
// Builder
// ============================================================================

class Builder {
public:
    using PlacementCallback = std::function<void(const PlacementEvent&)>;
    using BoundsCallback = std::function<void(const AABB& bounds)>;
    using ToolChangedCallback = std::function<void(const std::string& assetId)>;

    /**
     * @param catalog Definitions the copy tool may select, optional
     * @param view Camera services, optional
     */
    Builder(PlacementWorld& world, IResourceLedger& ledger, BuilderConfig config = {},
            const PlaceableCatalog* catalog = nullptr, IBuilderView* view = nullptr);
    ~Builder();

    // Non-copyable: state machine actions capture this
    Builder(const Builder&) = delete;
    Builder& operator=(const Builder&) = delete;

    // =========================================================================
    // Control
    // =========================================================================

    void Start();
    void Enable();
    void Disable();

    /**
     * @brief Tear down; the builder ignores everything afterwards
     */
    void Shutdown();

    /**
     * @brief Abort the current placement or deletion
     */
    void Cancel();

    /**
     * @brief Select the definition to place, nullptr to deselect
     */
    void SetTool(const PlaceableDefinition* tool);
    [[nodiscard]] const PlaceableDefinition* GetTool() const { return m_tool; }

    void SetCatalog(const PlaceableCatalog* catalog) { m_catalog = catalog; }
    void SetView(IBuilderView* view) { m_view = view; }

    /**
     * @brief Provide the input for the next Update()
     */
    void SetInput(const InputState& input) { m_input = input; }

    /**
     * @brief Run one frame
     * @param deltaTime Seconds since the previous frame
     */
    void Update(float deltaTime);

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] BuilderState GetState() const { return m_fsm.GetState(); }
    [[nodiscard]] bool IsInState(BuilderState state) const { return m_fsm.IsInState(state); }
    [[nodiscard]] bool IsPlacing() const { return m_fsm.IsInState(BuilderState::Placing); }
    [[nodiscard]] bool IsDeleting() const { return m_fsm.IsInState(BuilderState::Deleting); }

    /**
     * @brief The in-progress instance, nullptr when not placing
     */
    [[nodiscard]] Placeable* GetGhost();
    [[nodiscard]] const Placeable* GetGhost() const;
    [[nodiscard]] PlaceableId GetGhostId() const { return m_ghost; }

    /**
     * @brief Placed instance under the pointer, nullptr when none or pending deletion
     */
    [[nodiscard]] Placeable* GetAim();
    [[nodiscard]] const Placeable* GetAim() const;

    [[nodiscard]] const PlaceState& GetPlaceState() const { return m_placeState; }
    [[nodiscard]] int GetConfirmCount() const { return m_placeState.confirmCount; }
    [[nodiscard]] const std::optional<SurfaceHit>& GetLastHit() const { return m_hit; }
    [[nodiscard]] const BuilderConfig& GetConfig() const { return m_config; }
    [[nodiscard]] LayerMask GetSurfaceMask() const { return m_surfaceMask; }

    [[nodiscard]] const Magnet* GetSelectedWorldMagnet() const;
    [[nodiscard]] const Magnet* GetSelectedPlaceableMagnet() const;

    // =========================================================================
    // Costs
    // =========================================================================

    /**
     * @brief Line item quantity scaled by the connector length, rounded up
     */
    static int64_t GetModifiedCost(const Placeable& placeable, const ResourceCost& lineItem);

    [[nodiscard]] bool CheckAffordable(const Placeable* placeable) const;

    /**
     * @brief Deletion cost is available and the refund fits into the ledger
     */
    [[nodiscard]] bool CheckDeleteAffordable(const Placeable* placeable) const;

    // =========================================================================
    // Callbacks
    // =========================================================================

    void SetOnPlacementPerformed(PlacementCallback callback) { m_onPlacementPerformed = std::move(callback); }
    void SetOnPlaced(BoundsCallback callback) { m_onPlaced = std::move(callback); }
    void SetOnDeleted(BoundsCallback callback) { m_onDeleted = std::move(callback); }

    /**
     * @brief Aggregated and debounced by BuilderConfig::onPlacedDelay
     */
    void SetOnWorldChanged(BoundsCallback callback) { m_onWorldChanged = std::move(callback); }
    void SetOnToolChanged(ToolChangedCallback callback) { m_onToolChanged = std::move(callback); }

private:
    void DefineStateMachine();

    // Frame driver
    bool TryUpdateRaycast(LayerMask mask);
    void HandleCopy();
    void FlushWorldChanged();

    // Aim and focus
    void UpdateAim(bool addFocus);
    void ClearAim();
    void RemoveFocusAll();
    void ResetHitDerivedState();

    // Ghost lifecycle
    void EnsureToolSelectionWasRecognized();
    void RefreshPlacement();
    void InstantiateGhost();
    void DestroyGhost();
    void DropGhost(Placeable& ghost);
    void RebuildLostGhost();
    void NotifyToolChanged();

    // Confirmation
    void ConfirmPlacement();
    void ConfirmConstrainedEnd();
    void ConfirmDeletion();
    void DeleteAim(Placeable& aim);
    void UpdateConstrainedEnd();
    [[nodiscard]] bool IsPlacingConstrainedEnd() const;
    [[nodiscard]] bool CheckSnapIfRequired(const Placeable& ghost) const;

    // Placement
    void UpdatePlacement(Placeable& ghost, glm::vec3 surfacePoint);
    std::pair<const Magnet*, glm::vec3> GetBestWorldMagnet(const glm::vec3& point, const Placeable& ghost) const;
    const Magnet* SelectBestPlaceableMagnet(Placeable& ghost, const glm::vec3& snapPoint, const Magnet& target,
                                            const glm::vec3& surfacePoint);
    [[nodiscard]] Pose SnapRootPose(const Placeable& ghost, const Magnet& from, const Magnet& to) const;
    [[nodiscard]] Pose SnapEndPose(const Placeable& ghost, const Magnet& to) const;
    void SetPositionToPoint(Placeable& ghost, const glm::vec3& point);
    void SetEndPositionToPoint(Placeable& ghost, const glm::vec3& point);
    [[nodiscard]] glm::vec3 ApplyWorldGrid(const glm::vec3& point) const;
    [[nodiscard]] glm::vec3 GetCameraPosition() const;

    // Resources
    /**
     * @brief Claim every line item, then commit them all
     * @return false if a claim failed; earlier claims are cancelled and nothing is charged
     */
    [[nodiscard]] bool ApplyCost(const Placeable& placeable, const CostList& lineItems);
    void ApplyRefund(const Placeable& placeable, const CostList& lineItems);

    [[nodiscard]] static PlacementFailure ClassifyPlacementFailure(bool notBlocked, bool hasSnapIfRequired,
                                                                   bool affordable);

    void MarkWorldDirty(const AABB& bounds);
    void Notify(PlacementPhase phase, PlacementFailure failure = PlacementFailure::None,
                PlaceableId placeable = InvalidPlaceableId);

    PlacementWorld& m_world;
    IResourceLedger& m_ledger;
    BuilderConfig m_config;
    const PlaceableCatalog* m_catalog = nullptr;
    IBuilderView* m_view = nullptr;

    StateMachine<BuilderState, BuilderTrigger> m_fsm;

    const PlaceableDefinition* m_tool = nullptr;
    const PlaceableDefinition* m_previousTool = nullptr;
    PlaceableId m_ghost = InvalidPlaceableId;
    PlaceableId m_aim = InvalidPlaceableId;
    PlaceState m_placeState;

    InputState m_input;
    std::optional<SurfaceHit> m_hit;
    LayerMask m_surfaceMask = 0;

    float m_time = 0.0f;
    bool m_isWorldDirty = false;
    float m_lastDirtyTime = 0.0f;
    AABB m_dirtyBounds;

    // Expires with the builder so deferred deletions stop reporting back
    std::shared_ptr<bool> m_alive;

    PlacementCallback m_onPlacementPerformed;
    BoundsCallback m_onPlaced;
    BoundsCallback m_onDeleted;
    BoundsCallback m_onWorldChanged;
    ToolChangedCallback m_onToolChanged;
};

} // namespace Building
} // namespace Lodestone
