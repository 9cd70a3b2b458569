#pragma once

/**
 * @file WorldSpatialQuery.hpp
 * @brief ISpatialQuery over the surfaces and placeables of a PlacementWorld
 */

#include "building/SpatialQuery.hpp"

namespace Lodestone {
namespace Building {

class PlacementWorld;

/**
 * @brief Brute-force queries against oriented boxes
 *
 * Bodies are the blocking boxes of placeables with enabled colliders plus
 * the static surfaces. Sphere casts are approximated by growing each box
 * by the cast radius.
 */
class WorldSpatialQuery : public ISpatialQuery {
public:
    explicit WorldSpatialQuery(const PlacementWorld& world) : m_world(world) {}

    [[nodiscard]] std::optional<SurfaceHit> Raycast(const Ray& ray, float maxDistance,
                                                    float radius, LayerMask mask) const override;

    [[nodiscard]] std::vector<const Magnet*> OverlapMagnets(const glm::vec3& center, float radius,
                                                            LayerMask mask) const override;

    [[nodiscard]] bool CheckBox(const OBB& box, LayerMask mask,
                                PlaceableId ignore = InvalidPlaceableId) const override;

private:
    const PlacementWorld& m_world;
};

} // namespace Building
} // namespace Lodestone
