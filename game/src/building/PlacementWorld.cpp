#include "building/PlacementWorld.hpp"
#include "core/Logger.hpp"

#include <algorithm>
#include <exception>
#include <iterator>

namespace Lodestone {
namespace Building {

PlacementWorld::PlacementWorld()
    : m_query(*this) {
}

PlacementWorld::~PlacementWorld() = default;

// ============================================================================
// Placeables
// ============================================================================

Placeable& PlacementWorld::Create(const PlaceableDefinition& definition, const Pose& pose) {
    const PlaceableId id = m_nextPlaceableId++;
    const MagnetId firstMagnet = m_nextMagnetId;
    m_nextMagnetId += static_cast<MagnetId>(definition.magnets.size());

    auto placeable = std::make_unique<Placeable>(id, definition, firstMagnet, pose);
    for (const auto& magnet : placeable->GetMagnets()) {
        m_magnetOwners[magnet.GetId()] = id;
    }

    Placeable& result = *placeable;
    m_placeables.emplace(id, std::move(placeable));
    return result;
}

Placeable& PlacementWorld::Instantiate(const PlaceableDefinition& definition, const Pose& pose) {
    Placeable& placeable = Create(definition, pose);
    placeable.SetCollidersEnabled(false);
    LODESTONE_LOG_DEBUG("Instantiated {} as placeable {}", definition.assetId, placeable.GetId());
    return placeable;
}

Placeable& PlacementWorld::InstantiatePlaced(const PlaceableDefinition& definition, const Pose& pose) {
    Placeable& placeable = Create(definition, pose);
    placeable.OnPlaced(m_query);
    return placeable;
}

bool PlacementWorld::Destroy(PlaceableId id) {
    Placeable* placeable = Find(id);
    if (!placeable) {
        LODESTONE_LOG_WARN("Destroy called for unknown placeable {}", id);
        return false;
    }
    EndContactsOf(*placeable);
    Remove(id);
    return true;
}

bool PlacementWorld::ScheduleDestroy(PlaceableId id, BeforeDestroyCallback beforeDestroy) {
    Placeable* placeable = Find(id);
    if (!placeable) {
        LODESTONE_LOG_WARN("ScheduleDestroy called for unknown placeable {}", id);
        return false;
    }
    if (IsDestroyScheduled(id)) {
        LODESTONE_LOG_WARN("Placeable {} is already scheduled for destruction", id);
        return false;
    }

    // Contacts end on the next refresh, before the instance goes away
    placeable->SetCollidersEnabled(false);
    placeable->CancelFloatingCountdown();
    m_pendingDestroys.push_back(PendingDestroy{id, std::move(beforeDestroy)});
    return true;
}

bool PlacementWorld::IsDestroyScheduled(PlaceableId id) const {
    return std::any_of(m_pendingDestroys.begin(), m_pendingDestroys.end(),
                       [id](const PendingDestroy& pending) { return pending.id == id; });
}

void PlacementWorld::Remove(PlaceableId id) {
    auto it = m_placeables.find(id);
    if (it == m_placeables.end()) {
        return;
    }

    for (const auto& magnet : it->second->GetMagnets()) {
        m_magnetOwners.erase(magnet.GetId());
    }
    m_focused.erase(id);
    m_pendingDestroys.erase(
        std::remove_if(m_pendingDestroys.begin(), m_pendingDestroys.end(),
                       [id](const PendingDestroy& pending) { return pending.id == id; }),
        m_pendingDestroys.end());
    m_placeables.erase(it);

    LODESTONE_LOG_DEBUG("Destroyed placeable {}", id);
    if (m_onDestroyed) {
        m_onDestroyed(id);
    }
}

void PlacementWorld::EndContactsOf(const Placeable& placeable) {
    for (auto it = m_touching.begin(); it != m_touching.end();) {
        const bool ownsFirst = placeable.OwnsMagnet(it->first);
        const bool ownsSecond = placeable.OwnsMagnet(it->second);
        if (!ownsFirst && !ownsSecond) {
            ++it;
            continue;
        }

        const MagnetId otherId = ownsFirst ? it->second : it->first;
        const MagnetId ownId = ownsFirst ? it->first : it->second;
        const Magnet* own = placeable.FindMagnet(ownId);
        const Magnet* other = FindMagnet(otherId);
        auto ownerIt = m_magnetOwners.find(otherId);
        if (own && other && ownerIt != m_magnetOwners.end()) {
            if (Placeable* neighbour = Find(ownerIt->second)) {
                neighbour->OnEndTouching(*other, *own);
            }
        }
        it = m_touching.erase(it);
    }
}

Placeable* PlacementWorld::Find(PlaceableId id) {
    auto it = m_placeables.find(id);
    return it != m_placeables.end() ? it->second.get() : nullptr;
}

const Placeable* PlacementWorld::Find(PlaceableId id) const {
    auto it = m_placeables.find(id);
    return it != m_placeables.end() ? it->second.get() : nullptr;
}

const Placeable* PlacementWorld::FindMagnetOwner(MagnetId id) const {
    auto it = m_magnetOwners.find(id);
    return it != m_magnetOwners.end() ? Find(it->second) : nullptr;
}

const Magnet* PlacementWorld::FindMagnet(MagnetId id) const {
    const Placeable* owner = FindMagnetOwner(id);
    return owner ? owner->FindMagnet(id) : nullptr;
}

std::vector<PlaceableId> PlacementWorld::GetPlaceableIds() const {
    std::vector<PlaceableId> ids;
    ids.reserve(m_placeables.size());
    for (const auto& entry : m_placeables) {
        ids.push_back(entry.first);
    }
    return ids;
}

// ============================================================================
// Surfaces and Focus
// ============================================================================

void PlacementWorld::AddSurface(const OBB& box, int layer) {
    m_surfaces.push_back(Surface{box, layer});
}

void PlacementWorld::AddFocus(PlaceableId id) {
    if (Placeable* placeable = Find(id)) {
        placeable->SetLayer(m_focusLayer);
        m_focused.insert(id);
    }
}

void PlacementWorld::RemoveFocus(PlaceableId id) {
    if (Placeable* placeable = Find(id)) {
        placeable->SetLayer(placeable->GetDefinition().layer);
    }
    m_focused.erase(id);
}

void PlacementWorld::ClearFocus() {
    for (PlaceableId id : m_focused) {
        if (Placeable* placeable = Find(id)) {
            placeable->SetLayer(placeable->GetDefinition().layer);
        }
    }
    m_focused.clear();
}

// ============================================================================
// Simulation
// ============================================================================

void PlacementWorld::Tick(float deltaTime) {
    EvaluateDirtyContacts();
    RefreshContacts();
    CompleteDeferredDestroys();
    AdvanceFloatingCountdowns(deltaTime);
}

void PlacementWorld::EvaluateDirtyContacts() {
    for (PlaceableId id : GetPlaceableIds()) {
        Placeable* placeable = Find(id);
        if (!placeable || !placeable->IsContactsDirty()) {
            continue;
        }
        placeable->ClearContactsDirty();
        if (!placeable->IsPlaced() || IsDestroyScheduled(id)) {
            continue;
        }

        if (!placeable->CheckConnectedToStableGround(*this)) {
            placeable->NotifyConnected(false);
            if (!placeable->CanFloat()) {
                LODESTONE_LOG_DEBUG("Placeable {} lost support, destroying in {}s", id,
                                    placeable->GetDefinition().destroyFloatingDelay);
                placeable->StartFloatingCountdown();
            }
        } else {
            placeable->NotifyConnected(true);
            placeable->CancelFloatingCountdown();
        }
    }
}

void PlacementWorld::RefreshContacts() {
    std::vector<const Magnet*> active;
    for (const auto& [id, placeable] : m_placeables) {
        if (!placeable->AreCollidersEnabled()) {
            continue;
        }
        for (const auto& magnet : placeable->GetMagnets()) {
            if (magnet.IsCollisionEnabled()) {
                active.push_back(&magnet);
            }
        }
    }

    std::set<std::pair<MagnetId, MagnetId>> touching;
    for (size_t i = 0; i < active.size(); ++i) {
        for (size_t j = i + 1; j < active.size(); ++j) {
            const Magnet* a = active[i];
            const Magnet* b = active[j];
            if (a->GetOwner() == b->GetOwner() || !a->IsTouching(*b)) {
                continue;
            }
            const MagnetId idA = a->GetId();
            const MagnetId idB = b->GetId();
            touching.emplace(std::min(idA, idB), std::max(idA, idB));
        }
    }

    std::vector<std::pair<MagnetId, MagnetId>> ended;
    std::vector<std::pair<MagnetId, MagnetId>> started;
    std::set_difference(m_touching.begin(), m_touching.end(), touching.begin(), touching.end(),
                        std::back_inserter(ended));
    std::set_difference(touching.begin(), touching.end(), m_touching.begin(), m_touching.end(),
                        std::back_inserter(started));
    m_touching = std::move(touching);

    auto dispatch = [this](const std::pair<MagnetId, MagnetId>& pair, bool start) {
        const Magnet* a = FindMagnet(pair.first);
        const Magnet* b = FindMagnet(pair.second);
        if (!a || !b) {
            return;
        }
        Placeable* ownerA = Find(a->GetOwner());
        Placeable* ownerB = Find(b->GetOwner());
        if (start) {
            ownerA->OnStartTouching(*a, *b);
            ownerB->OnStartTouching(*b, *a);
        } else {
            ownerA->OnEndTouching(*a, *b);
            ownerB->OnEndTouching(*b, *a);
        }
    };

    for (const auto& pair : ended) {
        dispatch(pair, false);
    }
    for (const auto& pair : started) {
        dispatch(pair, true);
    }
}

void PlacementWorld::CompleteDeferredDestroys() {
    std::vector<PendingDestroy> pending;
    pending.swap(m_pendingDestroys);

    for (auto& entry : pending) {
        Placeable* placeable = Find(entry.id);
        if (!placeable) {
            continue;
        }
        if (entry.beforeDestroy) {
            try {
                entry.beforeDestroy(*placeable);
            } catch (const std::exception& e) {
                LODESTONE_LOG_ERROR("Before-destroy callback for placeable {} threw: {}", entry.id, e.what());
            }
        }
        EndContactsOf(*placeable);
        Remove(entry.id);
    }
}

void PlacementWorld::AdvanceFloatingCountdowns(float deltaTime) {
    for (PlaceableId id : GetPlaceableIds()) {
        Placeable* placeable = Find(id);
        if (placeable && placeable->AdvanceFloatingCountdown(deltaTime)) {
            LODESTONE_LOG_INFO("Destroying floating placeable {} ({})", id, placeable->GetAssetId());
            ScheduleDestroy(id);
        }
    }
}

} // namespace Building
} // namespace Lodestone
