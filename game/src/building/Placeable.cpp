#include "building/Placeable.hpp"
#include "building/PlacementWorld.hpp"
#include "core/Logger.hpp"

#include <deque>
#include <exception>
#include <set>

namespace Lodestone {
namespace Building {

namespace {

json PoseToJson(const Pose& pose) {
    return json{
        {"position", Vec3ToJson(pose.position)},
        {"rotation", json::array({pose.rotation.w, pose.rotation.x, pose.rotation.y, pose.rotation.z})}
    };
}

bool JsonToPose(const json& j, Pose& out) {
    if (!j.is_object() || !j.contains("position") || !j.contains("rotation")) {
        return false;
    }
    const json& rot = j["rotation"];
    if (!rot.is_array() || rot.size() != 4 || !j["position"].is_array() || j["position"].size() != 3) {
        return false;
    }
    out.position = JsonToVec3(j["position"]);
    out.rotation = glm::normalize(glm::quat(rot[0].get<float>(), rot[1].get<float>(),
                                            rot[2].get<float>(), rot[3].get<float>()));
    return true;
}

/**
 * @brief Invoke listeners in registration order; a throwing listener is logged and skipped
 */
template<typename ListenerT, typename... Args>
void InvokeListeners(const std::vector<ListenerT>& listeners, const char* event,
                     const std::string& assetId, Args&&... args) {
    for (const auto& listener : listeners) {
        if (!listener) {
            continue;
        }
        try {
            listener(args...);
        } catch (const std::exception& e) {
            LODESTONE_LOG_ERROR("Listener for {} on {} threw: {}", event, assetId, e.what());
        }
    }
}

} // anonymous namespace

// ============================================================================
// PlaceableMemento
// ============================================================================

json PlaceableMemento::Pack() const {
    json j;
    j["assetId"] = assetId;
    j["root"] = PoseToJson(rootPose);
    if (endPose) {
        j["end"] = PoseToJson(*endPose);
    }
    j["canFloat"] = canFloat;
    j["playerDeletable"] = isPlayerDeletable;
    j["playerPlaceable"] = isPlayerPlaceable;
    return j;
}

bool PlaceableMemento::Unpack(const json& j, PlaceableMemento& out) {
    try {
        if (!j.is_object() || !j.contains("assetId") || !j.contains("root")) {
            return false;
        }

        PlaceableMemento result;
        result.assetId = j["assetId"].get<std::string>();
        if (!JsonToPose(j["root"], result.rootPose)) {
            return false;
        }
        if (j.contains("end")) {
            Pose end;
            if (!JsonToPose(j["end"], end)) {
                return false;
            }
            result.endPose = end;
        }
        result.canFloat = j.value("canFloat", true);
        result.isPlayerDeletable = j.value("playerDeletable", true);
        result.isPlayerPlaceable = j.value("playerPlaceable", true);

        out = std::move(result);
        return true;
    } catch (const json::exception& e) {
        LODESTONE_LOG_ERROR("Malformed placeable memento: {}", e.what());
        return false;
    }
}

// ============================================================================
// Placeable
// ============================================================================

Placeable::Placeable(PlaceableId id, const PlaceableDefinition& definition, MagnetId firstMagnetId,
                     const Pose& pose)
    : m_id(id)
    , m_definition(&definition)
    , m_pose(pose)
    , m_canFloat(definition.canFloat)
    , m_isPlayerPlaceable(definition.isPlayerPlaceable)
    , m_isPlayerDeletable(definition.isPlayerDeletable)
    , m_layer(definition.layer) {
    m_magnets.reserve(definition.magnets.size());
    MagnetId next = firstMagnetId;
    for (const auto& spec : definition.magnets) {
        m_magnets.emplace_back(next++, id, spec);
    }
    RefreshMagnetPoses();
    SetCollidersEnabled(true);
}

void Placeable::RefreshMagnetPoses() {
    for (auto& magnet : m_magnets) {
        magnet.UpdateWorldPose(m_pose);
    }
}

void Placeable::SetPose(const Pose& pose) {
    m_pose = Pose(pose.position, glm::normalize(pose.rotation));
    RefreshMagnetPoses();
}

void Placeable::SetPosition(const glm::vec3& position) {
    m_pose.position = position;
    RefreshMagnetPoses();
}

void Placeable::SetRotation(const glm::quat& rotation) {
    m_pose.rotation = glm::normalize(rotation);
    RefreshMagnetPoses();
}

Magnet* Placeable::GetEndHandleMutable() {
    if (!m_definition->HasEndHandle()) {
        return nullptr;
    }
    return &m_magnets[static_cast<size_t>(m_definition->endHandle)];
}

void Placeable::SetEndHandlePose(const Pose& worldPose) {
    Magnet* handle = GetEndHandleMutable();
    if (!handle) {
        return;
    }
    handle->SetLocalPose(m_pose.Inverse() * worldPose);
    handle->UpdateWorldPose(m_pose);
}

void Placeable::SetEndHandlePosition(const glm::vec3& position) {
    if (const Magnet* handle = GetEndHandle()) {
        SetEndHandlePose(Pose(position, handle->GetRotation()));
    }
}

void Placeable::SetEndHandleRotation(const glm::quat& rotation) {
    if (const Magnet* handle = GetEndHandle()) {
        SetEndHandlePose(Pose(handle->GetPosition(), rotation));
    }
}

float Placeable::GetConnectorLength() const {
    const Magnet* handle = GetEndHandle();
    return handle ? glm::distance(handle->GetPosition(), m_pose.position) : 0.0f;
}

// ============================================================================
// Magnets
// ============================================================================

std::vector<const Magnet*> Placeable::GetSnapMagnets() const {
    std::vector<const Magnet*> result;
    result.reserve(m_magnets.size());
    const Magnet* endHandle = GetEndHandle();
    for (const auto& magnet : m_magnets) {
        if (&magnet != endHandle) {
            result.push_back(&magnet);
        }
    }
    return result;
}

const Magnet* Placeable::FindMagnet(MagnetId id) const {
    for (const auto& magnet : m_magnets) {
        if (magnet.GetId() == id) {
            return &magnet;
        }
    }
    return nullptr;
}

bool Placeable::OwnsMagnet(MagnetId id) const {
    return FindMagnet(id) != nullptr;
}

const Magnet* Placeable::GetStartHandle() const {
    if (!m_definition->HasStartHandle()) {
        return nullptr;
    }
    return &m_magnets[static_cast<size_t>(m_definition->startHandle)];
}

const Magnet* Placeable::GetEndHandle() const {
    if (!m_definition->HasEndHandle()) {
        return nullptr;
    }
    return &m_magnets[static_cast<size_t>(m_definition->endHandle)];
}

// ============================================================================
// Colliders
// ============================================================================

void Placeable::SetCollidersEnabled(bool enabled) {
    m_collidersEnabled = enabled;
    for (auto& magnet : m_magnets) {
        magnet.SetCollisionEnabled(enabled);
    }
}

std::vector<OBB> Placeable::GetBlockingBoxes() const {
    std::vector<OBB> boxes;
    boxes.reserve(m_definition->blockingBoxes.size());
    for (const auto& box : m_definition->blockingBoxes) {
        Pose world = m_pose * box.localPose;
        boxes.emplace_back(world.position, box.halfExtents, world.rotation);
    }
    return boxes;
}

AABB Placeable::GetBounds() const {
    AABB bounds(m_pose.position, m_pose.position);
    for (const auto& box : GetBlockingBoxes()) {
        bounds.Expand(box.GetBoundingAABB());
    }
    if (const Magnet* handle = GetEndHandle()) {
        bounds.Expand(handle->GetPosition());
    }
    glm::vec3 grow(BoundsExpansion * 0.5f);
    return AABB(bounds.min - grow, bounds.max + grow);
}

bool Placeable::CheckBlocked(const ISpatialQuery& query) const {
    if (!m_definition->respectBlockers) {
        return false;
    }
    for (const auto& box : GetBlockingBoxes()) {
        if (query.CheckBox(box, m_definition->blockingMask, m_id)) {
            return true;
        }
    }
    return false;
}

bool Placeable::CheckGrounded(const ISpatialQuery& query) const {
    return query.CheckBox(OBB::FromAABB(GetBounds()), m_definition->groundMask, m_id);
}

// ============================================================================
// Contacts
// ============================================================================

void Placeable::OnStartTouching(const Magnet& own, const Magnet& other) {
    if (m_contacts.count(other.GetId()) != 0) {
        return;
    }
    if (own.CanSnapTo(other)) {
        m_contacts[other.GetId()] = own.GetId();
        MarkContactsDirty();
    }
}

void Placeable::OnEndTouching(const Magnet& /*own*/, const Magnet& other) {
    if (m_contacts.erase(other.GetId()) != 0) {
        MarkContactsDirty();
    }
}

bool Placeable::IsTouching(MagnetId otherMagnet) const {
    return m_contacts.count(otherMagnet) != 0;
}

bool Placeable::IsTouchingAny() const {
    return !m_contacts.empty() && (!IsConnector() || IsConnected());
}

bool Placeable::IsConnected() const {
    if (!IsConnector()) {
        return false;
    }
    const Magnet* start = GetStartHandle();
    const Magnet* end = GetEndHandle();
    if (!m_definition->requireConnection || !start || !end) {
        return true;
    }

    bool startTouching = false;
    bool endTouching = false;
    for (const auto& [other, own] : m_contacts) {
        startTouching = startTouching || own == start->GetId();
        endTouching = endTouching || own == end->GetId();
    }
    return startTouching && endTouching;
}

bool Placeable::CheckConnectedToStableGround(const PlacementWorld& world) const {
    if (m_stableGround) {
        return true;
    }
    if (!IsTouchingAny()) {
        return false;
    }

    std::set<PlaceableId> visited{m_id};
    std::deque<const Placeable*> open{this};
    while (!open.empty()) {
        const Placeable* next = open.front();
        open.pop_front();
        if (next->IsStableGround()) {
            return true;
        }
        for (const auto& contact : next->m_contacts) {
            const Placeable* neighbour = world.FindMagnetOwner(contact.first);
            if (neighbour && visited.insert(neighbour->GetId()).second) {
                open.push_back(neighbour);
            }
        }
    }
    return false;
}

// ============================================================================
// Floating Countdown
// ============================================================================

void Placeable::StartFloatingCountdown() {
    m_floatingRemaining = m_definition->destroyFloatingDelay;
}

void Placeable::CancelFloatingCountdown() {
    m_floatingRemaining.reset();
}

bool Placeable::AdvanceFloatingCountdown(float deltaTime) {
    if (!m_floatingRemaining) {
        return false;
    }
    *m_floatingRemaining -= deltaTime;
    if (*m_floatingRemaining > 0.0f) {
        return false;
    }
    m_floatingRemaining.reset();
    return true;
}

// ============================================================================
// Lifecycle
// ============================================================================

void Placeable::OnStarted() {
    if (m_started) {
        LODESTONE_LOG_ERROR("Repeated OnStarted on placeable {} ({})", m_id, GetAssetId());
        return;
    }
    m_started = true;
    InvokeListeners(m_onStarted, "started", GetAssetId(), *this);
}

void Placeable::OnUpdate() {
    InvokeListeners(m_onUpdated, "updated", GetAssetId(), *this);
}

void Placeable::OnPlaced(const ISpatialQuery& query) {
    if (m_placed) {
        return;
    }
    m_placed = true;
    m_stableGround = m_canFloat || CheckGrounded(query);
    InvokeListeners(m_onPlaced, "placed", GetAssetId(), *this);
}

void Placeable::OnAborted() {
    InvokeListeners(m_onAborted, "aborted", GetAssetId(), *this);
}

void Placeable::OnDelete() {
    if (m_deleted) {
        LODESTONE_LOG_ERROR("Repeated OnDelete on placeable {} ({})", m_id, GetAssetId());
        return;
    }
    m_deleted = true;
    InvokeListeners(m_onDeleted, "deleted", GetAssetId(), *this);
}

void Placeable::NotifyConnected(bool connected) {
    InvokeListeners(m_onConnectedChanged, "connected", GetAssetId(), *this, connected);
}

// ============================================================================
// Memento
// ============================================================================

PlaceableMemento Placeable::Pack() const {
    PlaceableMemento memento;
    memento.assetId = GetAssetId();
    memento.rootPose = m_pose;
    if (const Magnet* handle = GetEndHandle()) {
        memento.endPose = handle->GetWorldPose();
    }
    memento.canFloat = m_canFloat;
    memento.isPlayerDeletable = m_isPlayerDeletable;
    memento.isPlayerPlaceable = m_isPlayerPlaceable;
    return memento;
}

void Placeable::Unpack(const PlaceableMemento& memento) {
    SetPose(memento.rootPose);
    if (memento.endPose) {
        SetEndHandlePose(*memento.endPose);
    }
    m_canFloat = memento.canFloat;
    m_isPlayerDeletable = memento.isPlayerDeletable;
    m_isPlayerPlaceable = memento.isPlayerPlaceable;
}

} // namespace Building
} // namespace Lodestone
