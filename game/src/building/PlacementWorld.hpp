#pragma once

/**
 * @file PlacementWorld.hpp
 * @brief Arena owning placeables, static surfaces and magnet contacts
 *
 * Tick() is the fixed simulation step. In order it:
 *  1. evaluates connectivity of placeables whose contacts changed before this tick
 *  2. recomputes magnet contacts and fires touching events in id order
 *  3. completes destroys deferred from an earlier tick
 *  4. advances destroy-floating countdowns
 */

#include "building/BuildIds.hpp"
#include "building/Placeable.hpp"
#include "building/WorldSpatialQuery.hpp"
#include "spatial/OBB.hpp"

#include <functional>
#include <map>
#include <memory>
#include <set>
#include <utility>
#include <vector>

namespace Lodestone {
namespace Building {

/**
 * @brief Static collision volume, e.g. terrain
 */
struct Surface {
    OBB box;
    int layer = Layers::Ground;
};

class PlacementWorld {
public:
    using BeforeDestroyCallback = std::function<void(Placeable&)>;
    using DestroyedCallback = std::function<void(PlaceableId)>;

    PlacementWorld();
    ~PlacementWorld();

    // Non-copyable: placeables and the query hold back-references
    PlacementWorld(const PlacementWorld&) = delete;
    PlacementWorld& operator=(const PlacementWorld&) = delete;

    // =========================================================================
    // Placeables
    // =========================================================================

    /**
     * @brief Create a ghost instance with colliders disabled
     */
    Placeable& Instantiate(const PlaceableDefinition& definition, const Pose& pose);

    /**
     * @brief Create an already placed instance, e.g. when loading a level
     */
    Placeable& InstantiatePlaced(const PlaceableDefinition& definition, const Pose& pose);

    /**
     * @brief Destroy immediately; contacts are ended first
     * @return false for an unknown id
     */
    bool Destroy(PlaceableId id);

    /**
     * @brief Disable colliders now and destroy after the next contact refresh
     * @param beforeDestroy Invoked right before the instance is removed
     * @return false for an unknown id
     */
    bool ScheduleDestroy(PlaceableId id, BeforeDestroyCallback beforeDestroy = nullptr);

    [[nodiscard]] bool IsDestroyScheduled(PlaceableId id) const;

    [[nodiscard]] Placeable* Find(PlaceableId id);
    [[nodiscard]] const Placeable* Find(PlaceableId id) const;

    [[nodiscard]] const Magnet* FindMagnet(MagnetId id) const;
    [[nodiscard]] const Placeable* FindMagnetOwner(MagnetId id) const;

    [[nodiscard]] size_t GetCount() const { return m_placeables.size(); }

    /**
     * @brief Ids in ascending order
     */
    [[nodiscard]] std::vector<PlaceableId> GetPlaceableIds() const;

    template<typename Func>
    void ForEachPlaceable(Func&& func) const {
        for (const auto& [id, placeable] : m_placeables) {
            func(*placeable);
        }
    }

    void SetOnDestroyed(DestroyedCallback callback) { m_onDestroyed = std::move(callback); }

    // =========================================================================
    // Surfaces
    // =========================================================================

    void AddSurface(const OBB& box, int layer = Layers::Ground);
    [[nodiscard]] const std::vector<Surface>& GetSurfaces() const { return m_surfaces; }

    // =========================================================================
    // Focus
    // =========================================================================

    /**
     * @brief Layer a focused placeable's body moves to
     */
    void SetFocusLayer(int layer) { m_focusLayer = layer; }
    [[nodiscard]] int GetFocusLayer() const { return m_focusLayer; }

    void AddFocus(PlaceableId id);
    void RemoveFocus(PlaceableId id);
    void ClearFocus();
    [[nodiscard]] bool IsFocused(PlaceableId id) const { return m_focused.count(id) != 0; }

    // =========================================================================
    // Simulation
    // =========================================================================

    void Tick(float deltaTime);

    [[nodiscard]] const ISpatialQuery& GetSpatialQuery() const { return m_query; }

private:
    Placeable& Create(const PlaceableDefinition& definition, const Pose& pose);
    void Remove(PlaceableId id);
    void EndContactsOf(const Placeable& placeable);

    void EvaluateDirtyContacts();
    void RefreshContacts();
    void CompleteDeferredDestroys();
    void AdvanceFloatingCountdowns(float deltaTime);

    std::map<PlaceableId, std::unique_ptr<Placeable>> m_placeables;
    std::map<MagnetId, PlaceableId> m_magnetOwners;
    std::vector<Surface> m_surfaces;

    /// Touching magnet pairs, lower id first
    std::set<std::pair<MagnetId, MagnetId>> m_touching;

    struct PendingDestroy {
        PlaceableId id;
        BeforeDestroyCallback beforeDestroy;
    };
    std::vector<PendingDestroy> m_pendingDestroys;

    std::set<PlaceableId> m_focused;
    int m_focusLayer = Layers::Focus;

    PlaceableId m_nextPlaceableId = 1;
    MagnetId m_nextMagnetId = 1;

    WorldSpatialQuery m_query;
    DestroyedCallback m_onDestroyed;
};

} // namespace Building
} // namespace Lodestone
