#include "building/Builder.hpp"
#include "building/Magnet.hpp"
#include "building/Placeable.hpp"
#include "building/PlaceableCatalog.hpp"
#include "building/PlacementWorld.hpp"
#include "building/ResourceLedger.hpp"
#include "building/SnapAlignment.hpp"
#include "core/Logger.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

namespace Lodestone {
namespace Building {

const char* BuilderStateToString(BuilderState state) {
    switch (state) {
        case BuilderState::Initial:       return "Initial";
        case BuilderState::Disabled:      return "Disabled";
        case BuilderState::Ready:         return "Ready";
        case BuilderState::ReadyNoHit:    return "ReadyNoHit";
        case BuilderState::ReadyIsHit:    return "ReadyIsHit";
        case BuilderState::Placing:       return "Placing";
        case BuilderState::PlacingNoHit:  return "PlacingNoHit";
        case BuilderState::PlacingIsHit:  return "PlacingIsHit";
        case BuilderState::Deleting:      return "Deleting";
        case BuilderState::DeletingNoHit: return "DeletingNoHit";
        case BuilderState::DeletingIsHit: return "DeletingIsHit";
        case BuilderState::Final:         return "Final";
        default:                          return "Unknown";
    }
}

const char* BuilderTriggerToString(BuilderTrigger trigger) {
    switch (trigger) {
        case BuilderTrigger::Start:          return "Start";
        case BuilderTrigger::Enable:         return "Enable";
        case BuilderTrigger::Disable:        return "Disable";
        case BuilderTrigger::ToolSelected:   return "ToolSelected";
        case BuilderTrigger::ToolDeselected: return "ToolDeselected";
        case BuilderTrigger::StartPlacing:   return "StartPlacing";
        case BuilderTrigger::StartDeleting:  return "StartDeleting";
        case BuilderTrigger::Cancel:         return "Cancel";
        case BuilderTrigger::IsHit:          return "IsHit";
        case BuilderTrigger::NoHit:          return "NoHit";
        case BuilderTrigger::Update:         return "Update";
        case BuilderTrigger::Confirmed:      return "Confirmed";
        case BuilderTrigger::InstanceLost:   return "InstanceLost";
        case BuilderTrigger::Final:          return "Final";
        default:                             return "Unknown";
    }
}

namespace {

bool IsChargeable(const ResourceCost& lineItem) {
    return !lineItem.kind.empty() && lineItem.quantity > 0;
}

glm::vec3 MatchingMagnetCenter(const std::vector<const Magnet*>& seekers, const Magnet& target,
                               const glm::vec3& fallback) {
    glm::dvec3 sum(0.0);
    int count = 0;
    for (const Magnet* seeker : seekers) {
        if (Magnet::IsMagnetMatch(seeker, &target)) {
            sum += glm::dvec3(seeker->GetPosition());
            ++count;
        }
    }
    return count > 0 ? glm::vec3(sum / static_cast<double>(count)) : fallback;
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

Builder::Builder(PlacementWorld& world, IResourceLedger& ledger, BuilderConfig config,
                 const PlaceableCatalog* catalog, IBuilderView* view)
    : m_world(world)
    , m_ledger(ledger)
    , m_config(config)
    , m_catalog(catalog)
    , m_view(view)
    , m_fsm(BuilderState::Initial)
    , m_surfaceMask(config.surfaceMask)
    , m_alive(std::make_shared<bool>(true)) {
    m_world.SetFocusLayer(m_config.focusLayer);
    DefineStateMachine();
}

Builder::~Builder() {
    m_alive.reset();
    // Leave nothing half-built in the world
    if (m_ghost != InvalidPlaceableId) {
        m_world.Destroy(m_ghost);
    }
}

void Builder::DefineStateMachine() {
    using S = BuilderState;
    using T = BuilderTrigger;

    m_fsm.SetOnTransitioned([](S from, S to, T trigger) {
        LODESTONE_LOG_DEBUG("Builder transitioned from {} to {} on {}",
                            BuilderStateToString(from), BuilderStateToString(to),
                            BuilderTriggerToString(trigger));
    });

    m_fsm.Configure(S::Initial)
        .Ignore(T::Enable)
        .Ignore(T::Disable)
        .Ignore(T::Cancel)
        .Ignore(T::InstanceLost)
        .Permit(T::Start, S::Ready);

    m_fsm.Configure(S::Disabled)
        .Ignore(T::Confirmed)
        .Ignore(T::StartDeleting)
        .Ignore(T::StartPlacing)
        .Ignore(T::Cancel)
        .Ignore(T::Start)
        .Ignore(T::ToolSelected)
        .Ignore(T::ToolDeselected)
        .Ignore(T::Update)
        .Ignore(T::IsHit)
        .Ignore(T::NoHit)
        .Ignore(T::Disable)
        .Permit(T::Final, S::Final)
        .Permit(T::Enable, S::Ready)
        .OnEntry([this] {
            ClearAim();
            RemoveFocusAll();
        });

    m_fsm.Configure(S::Ready)
        .Ignore(T::Update)
        .Ignore(T::Cancel)
        .Ignore(T::ToolDeselected)
        .Ignore(T::InstanceLost)
        .Ignore(T::Enable)
        .Permit(T::Disable, S::Disabled)
        .Permit(T::StartDeleting, S::Deleting)
        .Permit(T::Final, S::Final)
        .PermitIf(T::ToolSelected, S::Placing, [this] { return m_tool != nullptr; })
        .PermitIf(T::StartPlacing, S::Placing, [this] { return m_tool != nullptr; })
        .Permit(T::IsHit, S::ReadyIsHit)
        .Permit(T::NoHit, S::ReadyNoHit)
        .OnEntry([this] {
            // Highlighted placeables live on the focus layer and must stay aimable
            m_surfaceMask |= LayerBit(m_config.focusLayer);
            NotifyToolChanged();
        })
        .OnExit([this] {
            m_surfaceMask &= ~LayerBit(m_config.focusLayer);
        });

    m_fsm.Configure(S::ReadyNoHit)
        .SubstateOf(S::Ready)
        .Ignore(T::Cancel)
        .Ignore(T::NoHit)
        .Ignore(T::Confirmed)
        .Ignore(T::Update)
        .OnEntry([this] {
            ClearAim();
            ResetHitDerivedState();
        });

    m_fsm.Configure(S::ReadyIsHit)
        .SubstateOf(S::Ready)
        .Ignore(T::Cancel)
        .Ignore(T::Confirmed)
        .Ignore(T::IsHit)
        .InternalTransition(T::Update, [this] { UpdateAim(true); })
        .OnEntry([this] {
            if (m_aim != InvalidPlaceableId) {
                m_world.AddFocus(m_aim);
            }
        });

    m_fsm.Configure(S::Deleting)
        .Ignore(T::Update)
        .Ignore(T::ToolDeselected)
        .Permit(T::Cancel, S::Ready)
        .Permit(T::IsHit, S::DeletingIsHit)
        .Permit(T::NoHit, S::DeletingNoHit)
        .Permit(T::Final, S::Final)
        .OnEntry([this] {
            DestroyGhost();
            if (m_aim != InvalidPlaceableId) {
                m_world.AddFocus(m_aim);
            }
        })
        .OnExit([this] { RemoveFocusAll(); });

    m_fsm.Configure(S::DeletingNoHit)
        .SubstateOf(S::Deleting)
        .Ignore(T::NoHit)
        .Ignore(T::Update)
        .Ignore(T::Confirmed)
        .OnEntry([this] {
            ClearAim();
            ResetHitDerivedState();
        });

    m_fsm.Configure(S::DeletingIsHit)
        .SubstateOf(S::Deleting)
        .Ignore(T::ToolSelected)
        .Ignore(T::ToolDeselected)
        .Ignore(T::IsHit)
        .InternalTransition(T::Confirmed, [this] { ConfirmDeletion(); })
        .InternalTransition(T::Update, [this] { UpdateAim(true); });

    m_fsm.Configure(S::Placing)
        .Ignore(T::Update)
        .Permit(T::Cancel, S::Ready)
        .Permit(T::IsHit, S::PlacingIsHit)
        .Permit(T::NoHit, S::PlacingNoHit)
        .Permit(T::ToolDeselected, S::Ready)
        .Permit(T::StartDeleting, S::DeletingIsHit)
        .Permit(T::Final, S::Final)
        .InternalTransition(T::ToolSelected, [this] {
            EnsureToolSelectionWasRecognized();
            RefreshPlacement();
            NotifyToolChanged();
        })
        .InternalTransition(T::InstanceLost, [this] { RebuildLostGhost(); })
        .OnEntry([this] {
            EnsureToolSelectionWasRecognized();
            RefreshPlacement();
            NotifyToolChanged();
        })
        .OnExit([this] {
            DestroyGhost();
            SetTool(nullptr);
        });

    m_fsm.Configure(S::PlacingIsHit)
        .SubstateOf(S::Placing)
        .Ignore(T::IsHit)
        .InternalTransition(T::ToolSelected, [this] {
            EnsureToolSelectionWasRecognized();
            RefreshPlacement();
        })
        .InternalTransition(T::Update, [this] { RefreshPlacement(); })
        .InternalTransition(T::Confirmed, [this] { ConfirmPlacement(); });

    m_fsm.Configure(S::PlacingNoHit)
        .SubstateOf(S::Placing)
        .Ignore(T::NoHit)
        .InternalTransition(T::Update, [this] { UpdateConstrainedEnd(); })
        .InternalTransition(T::Confirmed, [this] { ConfirmConstrainedEnd(); })
        .InternalTransition(T::ToolSelected, [this] { EnsureToolSelectionWasRecognized(); })
        .OnEntry([this] {
            ClearAim();
            ResetHitDerivedState();
        });

    auto finalState = m_fsm.Configure(S::Final);
    for (T trigger : {T::Start, T::Enable, T::Disable, T::ToolSelected, T::ToolDeselected, T::StartPlacing,
                      T::StartDeleting, T::Cancel, T::IsHit, T::NoHit, T::Update, T::Confirmed,
                      T::InstanceLost, T::Final}) {
        finalState.Ignore(trigger);
    }
    finalState
        .OnEntry([this] {
            ClearAim();
            RemoveFocusAll();
        });
}

// ============================================================================
// Control
// ============================================================================

void Builder::Start() { m_fsm.Fire(BuilderTrigger::Start); }
void Builder::Enable() { m_fsm.Fire(BuilderTrigger::Enable); }
void Builder::Disable() { m_fsm.Fire(BuilderTrigger::Disable); }
void Builder::Shutdown() { m_fsm.Fire(BuilderTrigger::Final); }
void Builder::Cancel() { m_fsm.Fire(BuilderTrigger::Cancel); }

void Builder::SetTool(const PlaceableDefinition* tool) {
    m_previousTool = m_tool;
    m_tool = tool;
    m_fsm.Fire(tool ? BuilderTrigger::ToolSelected : BuilderTrigger::ToolDeselected);
}

void Builder::Update(float deltaTime) {
    m_time += deltaTime;

    // Nothing to act on before the first input snapshot
    if (m_input.version == 0) {
        return;
    }

    // While deleting, highlighted placeables sit on the focus layer and must stay aimable
    const LayerMask mask = m_surfaceMask | (m_input.isDelete ? LayerBit(m_config.focusLayer) : 0u);
    const bool isHit = !m_input.pointerIsOverUi && TryUpdateRaycast(mask);
    if (!isHit) {
        m_hit.reset();
    }

    if (m_fsm.IsInState(BuilderState::Placing) && !GetGhost()) {
        LODESTONE_LOG_WARN("Builder lost its placement instance {}", m_ghost);
        m_fsm.Fire(BuilderTrigger::InstanceLost);
    }

    if (m_input.isEscThisFrame) {
        m_fsm.Fire(BuilderTrigger::Cancel);
    }

    if (m_config.lockCameraInMenu && m_view) {
        m_view->SetMovementLocked(m_input.toolMenuIsOpen);
    }

    if (m_input.isCopyThisFrame && isHit) {
        HandleCopy();
    }

    if (m_input.hasDeleteStartedThisFrame) {
        m_fsm.Fire(BuilderTrigger::StartDeleting);
    }
    if (m_input.hasDeleteEndedThisFrame) {
        m_fsm.Fire(BuilderTrigger::Cancel);
    }

    m_fsm.Fire(isHit ? BuilderTrigger::IsHit : BuilderTrigger::NoHit);
    m_fsm.Fire(BuilderTrigger::Update);

    if (m_input.isConfirmThisFrame) {
        m_fsm.Fire(BuilderTrigger::Confirmed);
    }

    FlushWorldChanged();
}

bool Builder::TryUpdateRaycast(LayerMask mask) {
    const float radius = m_config.pointerRayRadius > BuilderConfig::RaySphereThreshold
                             ? m_config.pointerRayRadius
                             : 0.0f;
    m_hit = m_world.GetSpatialQuery().Raycast(m_input.pointerRay, m_config.maxBuildRange, radius, mask);
    return m_hit.has_value();
}

void Builder::HandleCopy() {
    const Placeable* source = m_hit ? m_world.Find(m_hit->placeable) : nullptr;
    if (!source) {
        LODESTONE_LOG_DEBUG("Copying rejected (no placeable)");
        Notify(PlacementPhase::PlacementFailed, PlacementFailure::NoPlaceable);
        return;
    }
    if (!source->IsPlayerPlaceable()) {
        LODESTONE_LOG_DEBUG("Copying rejected ({} is not placeable by the player)", source->GetAssetId());
        Notify(PlacementPhase::PlacementFailed, PlacementFailure::NotPlaceableByPlayer, source->GetId());
        return;
    }

    // The source would otherwise stay highlighted next to the new ghost
    if (source->GetId() == m_aim) {
        ClearAim();
    } else {
        m_world.RemoveFocus(source->GetId());
    }

    const PlaceableDefinition* tool = m_catalog ? m_catalog->Find(source->GetAssetId()) : nullptr;
    if (!tool) {
        LODESTONE_LOG_DEBUG("No catalog entry to copy {} from", source->GetAssetId());
    }
    SetTool(tool);
}

void Builder::FlushWorldChanged() {
    if (m_isWorldDirty && m_lastDirtyTime + m_config.onPlacedDelay < m_time) {
        if (m_onWorldChanged) {
            m_onWorldChanged(m_dirtyBounds);
        }
        m_isWorldDirty = false;
        m_dirtyBounds = AABB();
    }
}

// ============================================================================
// Queries
// ============================================================================

Placeable* Builder::GetGhost() {
    return m_ghost != InvalidPlaceableId ? m_world.Find(m_ghost) : nullptr;
}

const Placeable* Builder::GetGhost() const {
    return m_ghost != InvalidPlaceableId ? m_world.Find(m_ghost) : nullptr;
}

Placeable* Builder::GetAim() {
    if (m_aim == InvalidPlaceableId || m_world.IsDestroyScheduled(m_aim)) {
        return nullptr;
    }
    return m_world.Find(m_aim);
}

const Placeable* Builder::GetAim() const {
    if (m_aim == InvalidPlaceableId || m_world.IsDestroyScheduled(m_aim)) {
        return nullptr;
    }
    return m_world.Find(m_aim);
}

const Magnet* Builder::GetSelectedWorldMagnet() const {
    return m_world.FindMagnet(m_placeState.selectedWorldMagnet);
}

const Magnet* Builder::GetSelectedPlaceableMagnet() const {
    return m_world.FindMagnet(m_placeState.selectedPlaceableMagnet);
}

glm::vec3 Builder::GetCameraPosition() const {
    return m_view ? m_view->GetCameraPosition() : m_input.pointerRay.origin;
}

// ============================================================================
// Aim and Focus
// ============================================================================

void Builder::UpdateAim(bool addFocus) {
    if (!m_hit) {
        return;
    }

    const PlaceableId previous = m_aim;
    const PlaceableId target = m_hit->placeable;
    if (target == previous) {
        return;
    }

    m_aim = target;
    if (previous != InvalidPlaceableId) {
        m_world.RemoveFocus(previous);
    }
    if (target != InvalidPlaceableId && addFocus) {
        m_world.AddFocus(target);
    }
}

void Builder::ClearAim() {
    if (m_aim != InvalidPlaceableId) {
        m_world.RemoveFocus(m_aim);
        m_aim = InvalidPlaceableId;
    }
}

void Builder::RemoveFocusAll() {
    m_world.ClearFocus();
}

void Builder::ResetHitDerivedState() {
    m_placeState.alignmentRay.reset();
}

// ============================================================================
// Ghost Lifecycle
// ============================================================================

void Builder::EnsureToolSelectionWasRecognized() {
    if (m_previousTool == m_tool && GetGhost()) {
        return;
    }

    DestroyGhost();
    if (m_tool) {
        InstantiateGhost();
    }
    NotifyToolChanged();
    m_previousTool = m_tool;
}

void Builder::RefreshPlacement() {
    Placeable* ghost = GetGhost();
    if (!ghost || !m_hit) {
        return;
    }

    UpdateAim(false);
    UpdatePlacement(*ghost, m_hit->point);
    ghost->OnUpdate();
}

void Builder::InstantiateGhost() {
    if (!m_tool) {
        LODESTONE_LOG_ERROR("Builder cannot instantiate without a tool");
        return;
    }

    PlaceState fresh;
    fresh.heading = m_placeState.heading;
    fresh.headingVector = m_placeState.headingVector;
    m_placeState = fresh;

    Placeable& ghost = m_world.Instantiate(*m_tool, Pose());
    m_ghost = ghost.GetId();
    m_world.AddFocus(m_ghost);
    ghost.OnStarted();

    Notify(PlacementPhase::Started, PlacementFailure::None, m_ghost);
}

void Builder::DestroyGhost() {
    Placeable* ghost = GetGhost();
    m_ghost = InvalidPlaceableId;
    if (!ghost) {
        return;
    }

    const PlaceableId id = ghost->GetId();
    ghost->OnAborted();
    m_world.Destroy(id);
    Notify(PlacementPhase::Cancelled, PlacementFailure::None, id);
}

void Builder::RebuildLostGhost() {
    m_ghost = InvalidPlaceableId;
    if (m_tool) {
        InstantiateGhost();
    }
}

void Builder::DropGhost(Placeable& ghost) {
    const PlaceableId id = ghost.GetId();

    // Bake the final configuration the same way a loaded placeable gets it
    ghost.Unpack(ghost.Pack());
    ghost.OnPlaced(m_world.GetSpatialQuery());

    ghost.SetCollidersEnabled(true);
    m_world.RemoveFocus(id);

    const AABB bounds = ghost.GetBounds();
    MarkWorldDirty(bounds);
    m_ghost = InvalidPlaceableId;

    if (m_onPlaced) {
        m_onPlaced(bounds);
    }
    Notify(PlacementPhase::Placed, PlacementFailure::None, id);
}

void Builder::NotifyToolChanged() {
    if (m_onToolChanged) {
        m_onToolChanged(m_tool ? m_tool->assetId : std::string());
    }
}

// ============================================================================
// Confirmation
// ============================================================================

void Builder::ConfirmPlacement() {
    if (m_config.lockPlacementInMenu && m_input.toolMenuIsOpen) {
        return;
    }

    Placeable* ghost = GetGhost();
    if (!ghost) {
        return;
    }

    const bool notBlocked = !ghost->CheckBlocked(m_world.GetSpatialQuery());
    const bool hasSnapIfRequired = CheckSnapIfRequired(*ghost);
    const bool playerPlaceable = ghost->IsPlayerPlaceable();
    const bool affordable = CheckAffordable(ghost);

    if (notBlocked && hasSnapIfRequired && playerPlaceable && affordable) {
        if (ghost->IsConnector() && m_placeState.confirmCount == 0) {
            ++m_placeState.confirmCount;
            LODESTONE_LOG_DEBUG("Start of {} confirmed", ghost->GetAssetId());
            return;
        }

        const std::string assetId = ghost->GetAssetId();
        if (!ApplyCost(*ghost, ghost->GetPlacementCost())) {
            Notify(PlacementPhase::PlacementFailed, PlacementFailure::NotAffordable, ghost->GetId());
            return;
        }
        DropGhost(*ghost);
        InstantiateGhost();
        RefreshPlacement();
        LODESTONE_LOG_DEBUG("Placement of {} confirmed", assetId);
        return;
    }

    LODESTONE_LOG_DEBUG("Placement of {} rejected (blocked={} snap={} affordable={} playerPlaceable={})",
                        ghost->GetAssetId(), !notBlocked, hasSnapIfRequired, affordable, playerPlaceable);

    Notify(PlacementPhase::PlacementFailed, ClassifyPlacementFailure(notBlocked, hasSnapIfRequired, affordable),
           ghost->GetId());
}

PlacementFailure Builder::ClassifyPlacementFailure(bool notBlocked, bool hasSnapIfRequired, bool affordable) {
    if (!notBlocked) {
        return PlacementFailure::Blocked;
    }
    if (!hasSnapIfRequired) {
        return PlacementFailure::NoSnap;
    }
    if (!affordable) {
        return PlacementFailure::NotAffordable;
    }
    return PlacementFailure::NotPlaceableByPlayer;
}

bool Builder::IsPlacingConstrainedEnd() const {
    const Placeable* ghost = GetGhost();
    return ghost && ghost->GetDefinition().IsConstrainedEndHandle() && ghost->GetEndHandle() &&
           m_placeState.confirmCount > 0;
}

void Builder::UpdateConstrainedEnd() {
    // Without a surface hit the end handle follows a virtual point in front of the camera
    if (!IsPlacingConstrainedEnd()) {
        return;
    }

    Placeable* ghost = GetGhost();
    const Ray& ray = m_input.pointerRay;
    const glm::vec3 virtualPoint = ray.origin + ray.direction * (m_config.overlapRadius * 2.0f);
    UpdatePlacement(*ghost, virtualPoint);
    ghost->OnUpdate();
}

void Builder::ConfirmConstrainedEnd() {
    if (!IsPlacingConstrainedEnd()) {
        return;
    }

    Placeable* ghost = GetGhost();
    const bool notBlocked = !ghost->CheckBlocked(m_world.GetSpatialQuery());
    const bool hasSnapIfRequired = !ghost->MustSnap() ||
                                   (GetSelectedWorldMagnet() && GetSelectedPlaceableMagnet());
    // The cost grew with the handle since the start was confirmed
    const bool affordable = CheckAffordable(ghost);
    const bool playerPlaceable = ghost->IsPlayerPlaceable();

    if (notBlocked && hasSnapIfRequired && affordable && playerPlaceable) {
        if (!ApplyCost(*ghost, ghost->GetPlacementCost())) {
            Notify(PlacementPhase::PlacementFailed, PlacementFailure::NotAffordable, ghost->GetId());
            return;
        }
        DropGhost(*ghost);
        InstantiateGhost();
        return;
    }

    LODESTONE_LOG_DEBUG("End of {} rejected (blocked={} snap={} affordable={} playerPlaceable={})",
                        ghost->GetAssetId(), !notBlocked, hasSnapIfRequired, affordable, playerPlaceable);
    Notify(PlacementPhase::PlacementFailed, ClassifyPlacementFailure(notBlocked, hasSnapIfRequired, affordable),
           ghost->GetId());
}

void Builder::ConfirmDeletion() {
    Placeable* aim = GetAim();
    if (aim && aim->IsPlayerDeletable() && CheckDeleteAffordable(aim)) {
        if (ApplyCost(*aim, aim->GetDeletionCost())) {
            ApplyRefund(*aim, aim->GetPlacementCost());
            DeleteAim(*aim);
            return;
        }
        Notify(PlacementPhase::DeletionFailed, PlacementFailure::NotAffordable, aim->GetId());
        return;
    }

    PlacementFailure failure = PlacementFailure::NotAffordable;
    if (!aim) {
        failure = PlacementFailure::NoAim;
    } else if (!aim->IsPlayerDeletable()) {
        failure = PlacementFailure::NotDeletableByPlayer;
    }
    LODESTONE_LOG_DEBUG("Deletion rejected ({})", PlacementFailureToString(failure));
    Notify(PlacementPhase::DeletionFailed, failure, aim ? aim->GetId() : InvalidPlaceableId);
}

void Builder::DeleteAim(Placeable& aim) {
    const PlaceableId id = aim.GetId();
    LODESTONE_LOG_DEBUG("Deletion of {} ({}) confirmed", aim.GetAssetId(), id);

    MarkWorldDirty(aim.GetBounds());
    m_world.RemoveFocus(id);
    m_aim = InvalidPlaceableId;

    // Destruction waits one collision cycle so neighbours see their contacts end
    std::weak_ptr<bool> alive = m_alive;
    m_world.ScheduleDestroy(id, [this, alive, id](Placeable& target) {
        target.OnDelete();
        if (alive.expired()) {
            return;
        }
        const AABB bounds = target.GetBounds();
        if (m_onDeleted) {
            m_onDeleted(bounds);
        }
        Notify(PlacementPhase::Deleted, PlacementFailure::None, id);
    });
}

bool Builder::CheckSnapIfRequired(const Placeable& ghost) const {
    if (!ghost.MustSnap()) {
        return true;
    }

    const Magnet* worldMagnet = GetSelectedWorldMagnet();
    const Magnet* placeableMagnet = GetSelectedPlaceableMagnet();
    if (!worldMagnet || !placeableMagnet) {
        return false;
    }

    const glm::vec3 seekerPosition = placeableMagnet->GetPosition();
    if (glm::distance(worldMagnet->GetPosition(), seekerPosition) < BuilderConfig::SnapEpsilon) {
        return true;
    }
    return worldMagnet->IsGrid() &&
           glm::distance(worldMagnet->GetNearestSnapPosition(seekerPosition), seekerPosition) <
               BuilderConfig::SnapEpsilon;
}

// ============================================================================
// Placement
// ============================================================================

void Builder::UpdatePlacement(Placeable& ghost, glm::vec3 surfacePoint) {
    const bool placingEnd = ghost.IsConnector() && ghost.GetEndHandle() && m_placeState.confirmCount > 0;
    PlaceState& state = m_placeState;

    // Heading, quantized to the angle increment
    const float scroll = m_input.scrollDelta;
    const float scrollDirection = scroll == 0.0f ? 0.0f : (scroll > 0.0f ? 1.0f : -1.0f);
    state.heading = std::fmod(state.heading - scrollDirection * m_config.rotateSpeed, 360.0f);
    const float increment = m_config.angleIncrement > 0.0f ? m_config.angleIncrement : 1.0f;
    const float snapHeading = std::round(state.heading / increment) * increment;
    state.headingVector = Transform::AngleAxis(snapHeading, Transform::WorldUp) * Transform::WorldForward;

    const glm::quat beforeRotation = placingEnd ? ghost.GetEndHandle()->GetRotation() : ghost.GetRotation();
    if (placingEnd) {
        if (!ghost.GetDefinition().IsConstrainedEndHandle()) {
            ghost.SetEndHandleRotation(SnapAlignment::AlignForwardWith(state.headingVector));
        }
    } else {
        ghost.SetRotation(SnapAlignment::AlignForwardWith(state.headingVector));
    }

    // World magnet selection stays sticky while aligning
    bool canSnap = false;
    {
        std::pair<const Magnet*, glm::vec3> best = GetBestWorldMagnet(surfacePoint, ghost);

        if (best.first && ghost.OwnsMagnet(best.first->GetId())) {
            best = {nullptr, glm::vec3(0.0f)};
        }
        if (placingEnd && best.first) {
            const Magnet* start = ghost.GetStartHandle();
            const glm::vec3 startPosition = start ? start->GetPosition() : ghost.GetPosition();
            if (glm::distance(startPosition, best.first->GetPosition()) < BuilderConfig::MinConnectorLength) {
                best = {nullptr, glm::vec3(0.0f)};
            }
        }

        const MagnetId bestId = best.first ? best.first->GetId() : InvalidMagnetId;
        const bool isWorldMagnetChanged = bestId != state.selectedWorldMagnet;
        if (!m_input.isAlign || !state.alignmentRay || !GetSelectedWorldMagnet()) {
            canSnap = isWorldMagnetChanged;
            state.selectedWorldMagnet = bestId;
            state.selectedWorldMagnetOffset = best.second;
        }
    }

    if (!m_input.isAlign) {
        state.alignmentRay.reset();
    }

    const Magnet* worldMagnet = GetSelectedWorldMagnet();
    if (worldMagnet) {
        if (m_input.isAlign && !state.alignmentRay) {
            state.alignmentRay = Ray(worldMagnet->GetPosition(), worldMagnet->GetForward());
        }

        const glm::vec3 snapPoint = worldMagnet->TransformPoint(state.selectedWorldMagnetOffset);

        const Magnet* placeableMagnet = nullptr;
        if (placingEnd) {
            const Magnet* endHandle = ghost.GetEndHandle();
            placeableMagnet = Magnet::IsMagnetMatch(endHandle, worldMagnet) ? endHandle : nullptr;
        } else {
            placeableMagnet = SelectBestPlaceableMagnet(ghost, snapPoint, *worldMagnet, surfacePoint);
        }
        state.selectedPlaceableMagnet = placeableMagnet ? placeableMagnet->GetId() : InvalidMagnetId;

        bool didSnap = false;
        if (placeableMagnet) {
            if (placingEnd) {
                const glm::vec3 before = ghost.GetEndHandle()->GetPosition();
                ghost.SetEndHandlePose(SnapEndPose(ghost, *worldMagnet));
                didSnap = before != ghost.GetEndHandle()->GetPosition();
            } else {
                const glm::vec3 before = ghost.GetPosition();
                ghost.SetPose(SnapRootPose(ghost, *placeableMagnet, *worldMagnet));
                didSnap = before != ghost.GetPosition();
            }
        }

        if (ghost.CheckBlocked(m_world.GetSpatialQuery()) || !placeableMagnet) {
            if (!m_config.staySnappedWhenBlocked) {
                if (placingEnd) {
                    SetEndPositionToPoint(ghost, surfacePoint);
                } else {
                    SetPositionToPoint(ghost, surfacePoint);
                }
            }
        } else if (didSnap) {
            Notify(PlacementPhase::Snap, PlacementFailure::None, ghost.GetId());
        }

        // A new target appeared but the ghost did not move onto it
        if (!didSnap && canSnap) {
            Notify(PlacementPhase::CanSnap, PlacementFailure::None, ghost.GetId());
        }
    } else {
        state.selectedPlaceableMagnet = InvalidMagnetId;

        if (m_input.isAlign && state.alignmentRay &&
            state.alignmentRay->DistanceToLine(surfacePoint) < 1.0f) {
            surfacePoint = state.alignmentRay->ClosestPointOnLine(surfacePoint);
        }

        if (placingEnd) {
            SetEndPositionToPoint(ghost, surfacePoint);
        } else {
            SetPositionToPoint(ghost, surfacePoint);
        }
    }

    const glm::quat afterRotation = placingEnd ? ghost.GetEndHandle()->GetRotation() : ghost.GetRotation();
    if (scroll != 0.0f && beforeRotation != afterRotation) {
        Notify(PlacementPhase::Rotate, PlacementFailure::None, ghost.GetId());
    }
}

std::pair<const Magnet*, glm::vec3> Builder::GetBestWorldMagnet(const glm::vec3& point,
                                                                const Placeable& ghost) const {
    const float radius = m_config.overlapRadius * ghost.GetOverlapScale();
    const std::vector<const Magnet*> candidates =
        m_world.GetSpatialQuery().OverlapMagnets(point, radius, m_config.magnetMask);
    if (candidates.empty()) {
        return {nullptr, glm::vec3(0.0f)};
    }

    IdentitySet identityUnion;
    IdentitySet snapToUnion;
    for (const Magnet& magnet : ghost.GetMagnets()) {
        identityUnion.Union(magnet.GetIdentity());
        if (!magnet.IsGrid()) {
            snapToUnion.Union(magnet.GetSnapTo());
        }
    }

    const Magnet* best = nullptr;
    float bestDistance = std::numeric_limits<float>::infinity();
    glm::vec3 bestOffset(0.0f);

    // Candidates arrive ordered by MagnetId; strict comparison keeps the lowest id on ties
    for (const Magnet* candidate : candidates) {
        if (ghost.OwnsMagnet(candidate->GetId()) ||
            !candidate->GetAcceptFrom().Overlaps(identityUnion) ||
            candidate->GetRejectFrom().Overlaps(identityUnion) ||
            !snapToUnion.Overlaps(candidate->GetIdentity())) {
            continue;
        }

        if (candidate->IsGrid()) {
            glm::vec3 localOffset(0.0f);
            const glm::vec3 closest = candidate->GetNearestSnapPosition(point, localOffset);
            const float distance = glm::distance(closest, point);
            if (distance < bestDistance) {
                best = candidate;
                bestDistance = distance;
                bestOffset = localOffset;
            }
        } else {
            const float distance = glm::distance(candidate->GetPosition(), point);
            if (distance < bestDistance) {
                best = candidate;
                bestDistance = distance;
                bestOffset = glm::vec3(0.0f);
            }
        }
    }

    return {best, bestOffset};
}

const Magnet* Builder::SelectBestPlaceableMagnet(Placeable& ghost, const glm::vec3& snapPoint,
                                                 const Magnet& target, const glm::vec3& surfacePoint) {
    const std::vector<const Magnet*> seekers = ghost.GetSnapMagnets();
    const Pose original = ghost.GetPose();
    const ISpatialQuery& query = m_world.GetSpatialQuery();

    const glm::vec3 localMatchCenter =
        original.InverseTransformPoint(MatchingMagnetCenter(seekers, target, original.position));
    const float searchRadius = m_config.overlapRadius * ghost.GetOverlapScale();
    const glm::vec3 cameraPosition = GetCameraPosition();
    const glm::vec3 normal = m_hit ? m_hit->normal : Transform::WorldUp;
    const float angleWeight = (m_config.snapBias + 1.0f) * 0.5f;

    const Magnet* best = nullptr;
    float bestRating = std::numeric_limits<float>::infinity();
    float bestDot = 0.0f;
    float bestDistance = std::numeric_limits<float>::infinity();
    std::vector<const Magnet*> unblocked;

    for (const Magnet* seeker : seekers) {
        if (!Magnet::IsMagnetMatch(seeker, &target)) {
            continue;
        }

        // Trial snap, measured and then undone
        const Pose snapped = SnapRootPose(ghost, *seeker, target);
        ghost.SetPose(snapped);
        const bool blocked = ghost.CheckBlocked(query);
        ghost.SetPose(original);
        if (blocked) {
            continue;
        }
        unblocked.push_back(seeker);

        const float angleRating = glm::clamp(Transform::Angle(original.rotation, snapped.rotation) / 180.0f,
                                             0.0f, 1.0f);

        const glm::vec3 worldMatchCenter = snapped.TransformPoint(localMatchCenter);
        const glm::vec3 positionDelta = worldMatchCenter - surfacePoint;
        const glm::vec3 cameraDelta = worldMatchCenter - cameraPosition;

        const float centerDot = glm::dot(positionDelta, normal);
        const float centerDistance = glm::length(positionDelta) / searchRadius;
        const float cameraDistance = glm::length(cameraDelta) / searchRadius;

        float positionRating = centerDistance;
        if (std::abs(centerDistance - bestDistance) < BuilderConfig::SnapEpsilon) {
            if (std::abs(centerDot - bestDot) < BuilderConfig::SnapEpsilon) {
                positionRating = cameraDistance;
            } else if (centerDot > 0.0f) {
                positionRating = -centerDistance;
            } else {
                positionRating = m_config.maxBuildRange - centerDistance;
            }
        }

        const float rating = glm::mix(positionRating, angleRating, angleWeight);
        if (rating < bestRating) {
            bestRating = rating;
            bestDot = centerDot;
            bestDistance = centerDistance;
            best = seeker;
        }
    }

    if (best || unblocked.empty()) {
        return best;
    }

    // Ratings are NaN when the search radius is zero or a pose degenerates. Fall back to the
    // seeker closest to the line from the world magnet through the snap point
    const Ray towardMagnet(snapPoint, snapPoint - target.GetPosition());
    float bestRayDistance = std::numeric_limits<float>::infinity();
    for (const Magnet* seeker : unblocked) {
        const float distance = towardMagnet.DistanceToLine(seeker->GetPosition());
        if (distance < bestRayDistance) {
            bestRayDistance = distance;
            best = seeker;
        }
    }
    return best;
}

Pose Builder::SnapRootPose(const Placeable& ghost, const Magnet& from, const Magnet& to) const {
    return SnapAlignment::SnapRoot(ghost.GetPose(), from.GetLocalPose(), from.GetAlignWith(), to.GetWorldPose(),
                                   m_placeState.headingVector, m_placeState.selectedWorldMagnetOffset,
                                   m_config.flipFaceAlignment);
}

Pose Builder::SnapEndPose(const Placeable& ghost, const Magnet& to) const {
    const Magnet* endHandle = ghost.GetEndHandle();
    return SnapAlignment::SnapPivot(endHandle->GetWorldPose(), endHandle->GetAlignWith(), to.GetWorldPose(),
                                    m_placeState.headingVector, m_placeState.selectedWorldMagnetOffset);
}

void Builder::SetPositionToPoint(Placeable& ghost, const glm::vec3& point) {
    ghost.SetPosition(ApplyWorldGrid(point));
}

void Builder::SetEndPositionToPoint(Placeable& ghost, const glm::vec3& point) {
    const glm::vec3 modifiedPoint = ApplyWorldGrid(point);
    const PlaceableDefinition& definition = ghost.GetDefinition();
    const Magnet* endHandle = ghost.GetEndHandle();
    if (!endHandle) {
        return;
    }

    if (!definition.IsConstrainedEndHandle()) {
        ghost.SetEndHandlePosition(modifiedPoint);
        return;
    }

    const glm::vec2 range = definition.constrainToDistance;
    const float rangeScale = std::max(range.x, range.y) * 2.0f;

    // Viewport distance spans [0, 1]; scale it to the allowed length range
    float distance = glm::distance(ghost.GetPosition(), modifiedPoint);
    if (m_view) {
        const glm::vec3 from = m_view->WorldToViewport(ghost.GetPosition());
        const glm::vec3 to = m_view->WorldToViewport(modifiedPoint);
        distance = glm::distance(glm::vec2(from), glm::vec2(to)) * rangeScale;
    }

    const float grid = definition.constrainToGrid;
    if (grid != 0.0f) {
        distance = std::round(distance / grid) * grid;
    }
    distance = glm::clamp(distance, range.x, range.y);

    ghost.SetEndHandlePosition(ghost.GetPosition() + distance * endHandle->GetForward());
}

glm::vec3 Builder::ApplyWorldGrid(const glm::vec3& point) const {
    if (!m_config.useWorldGrid) {
        return point;
    }
    const glm::vec3& divisions = m_config.worldGridDivisions;
    return glm::vec3(std::round(point.x * divisions.x) / divisions.x,
                     std::round(point.y * divisions.y) / divisions.y,
                     std::round(point.z * divisions.z) / divisions.z);
}

// ============================================================================
// Resources
// ============================================================================

int64_t Builder::GetModifiedCost(const Placeable& placeable, const ResourceCost& lineItem) {
    const int64_t lengthFactor =
        placeable.IsConnector() ? static_cast<int64_t>(std::ceil(placeable.GetConnectorLength())) : 1;
    return lineItem.quantity * std::max<int64_t>(1, lengthFactor);
}

bool Builder::CheckAffordable(const Placeable* placeable) const {
    if (!placeable) {
        return false;
    }
    return std::all_of(placeable->GetPlacementCost().begin(), placeable->GetPlacementCost().end(),
                       [this, placeable](const ResourceCost& lineItem) {
                           return !IsChargeable(lineItem) ||
                                  m_ledger.GetAvailableCount(lineItem.kind) >=
                                      GetModifiedCost(*placeable, lineItem);
                       });
}

bool Builder::CheckDeleteAffordable(const Placeable* placeable) const {
    if (!placeable) {
        return false;
    }
    return std::all_of(placeable->GetDeletionCost().begin(), placeable->GetDeletionCost().end(),
                       [this, placeable](const ResourceCost& lineItem) {
                           if (!IsChargeable(lineItem)) {
                               return true;
                           }
                           const int64_t cost = GetModifiedCost(*placeable, lineItem);
                           return m_ledger.GetAvailableCount(lineItem.kind) >= cost &&
                                  m_ledger.CanPut(lineItem.kind, cost);
                       });
}

bool Builder::ApplyCost(const Placeable& placeable, const CostList& lineItems) {
    std::vector<std::unique_ptr<IResourceClaim>> claims;
    for (const ResourceCost& lineItem : lineItems) {
        if (!IsChargeable(lineItem)) {
            continue;
        }

        const int64_t quantity = GetModifiedCost(placeable, lineItem);
        std::unique_ptr<IResourceClaim> claim = m_ledger.TryClaim(lineItem.kind, quantity);
        if (!claim) {
            for (auto& existing : claims) {
                existing->Cancel();
            }
            LODESTONE_LOG_INFO("Could not claim {}x {} for {}", quantity, lineItem.kind, placeable.GetAssetId());
            return false;
        }
        claims.push_back(std::move(claim));
    }

    for (auto& claim : claims) {
        if (claim->TryCommit()) {
            LODESTONE_LOG_INFO("Committed {}x {} for {}", claim->GetQuantity(), claim->GetKind(),
                               placeable.GetAssetId());
        } else {
            LODESTONE_LOG_ERROR("Failed to commit {}x {} for {}", claim->GetQuantity(), claim->GetKind(),
                                placeable.GetAssetId());
        }
    }
    return true;
}

void Builder::ApplyRefund(const Placeable& placeable, const CostList& lineItems) {
    for (const ResourceCost& lineItem : lineItems) {
        if (!IsChargeable(lineItem)) {
            continue;
        }

        const int64_t quantity = GetModifiedCost(placeable, lineItem);
        const auto refund = static_cast<int64_t>(
            std::llround(static_cast<double>(quantity) * placeable.GetDeletionRefund()));
        if (refund <= 0) {
            continue;
        }
        if (!m_ledger.TryPut(lineItem.kind, refund)) {
            LODESTONE_LOG_ERROR("Failed to refund {}x {} for {}", refund, lineItem.kind, placeable.GetAssetId());
            return;
        }
        LODESTONE_LOG_INFO("Refunded {}x {} for {}", refund, lineItem.kind, placeable.GetAssetId());
    }
}

// ============================================================================
// Notifications
// ============================================================================

void Builder::MarkWorldDirty(const AABB& bounds) {
    m_isWorldDirty = true;
    m_lastDirtyTime = m_time;
    m_dirtyBounds.Expand(bounds);
}

void Builder::Notify(PlacementPhase phase, PlacementFailure failure, PlaceableId placeable) {
    if (!m_onPlacementPerformed) {
        return;
    }
    PlacementEvent event;
    event.phase = phase;
    event.failure = failure;
    event.placeable = placeable;
    m_onPlacementPerformed(event);
}

} // namespace Building
} // namespace Lodestone
