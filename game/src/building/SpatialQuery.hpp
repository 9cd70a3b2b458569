#pragma once

/**
 * @file SpatialQuery.hpp
 * @brief Collision queries the builder and placeables depend on
 *
 * Implementations must return overlap results in a stable order so that
 * candidate selection is reproducible from identical inputs.
 */

#include "building/BuildIds.hpp"
#include "spatial/AABB.hpp"
#include "spatial/OBB.hpp"

#include <glm/glm.hpp>
#include <optional>
#include <vector>

namespace Lodestone {
namespace Building {

class Magnet;

/**
 * @brief Result of a ray or sphere cast against surfaces
 */
struct SurfaceHit {
    glm::vec3 point{0.0f};
    glm::vec3 normal{0.0f, 1.0f, 0.0f};
    float distance = 0.0f;
    int layer = Layers::Ground;
    PlaceableId placeable = InvalidPlaceableId;     ///< Placeable owning the hit collider, if any
};

class ISpatialQuery {
public:
    virtual ~ISpatialQuery() = default;

    /**
     * @brief Closest surface along a ray
     * @param radius Sphere-cast radius, 0 for a thin ray
     */
    [[nodiscard]] virtual std::optional<SurfaceHit> Raycast(const Ray& ray, float maxDistance,
                                                            float radius, LayerMask mask) const = 0;

    /**
     * @brief Enabled magnets whose trigger volume reaches the sphere, ordered by MagnetId
     */
    [[nodiscard]] virtual std::vector<const Magnet*> OverlapMagnets(const glm::vec3& center, float radius,
                                                                    LayerMask mask) const = 0;

    /**
     * @brief True if any enabled collider on @p mask overlaps the box
     * @param ignore Placeable whose own colliders are skipped
     */
    [[nodiscard]] virtual bool CheckBox(const OBB& box, LayerMask mask,
                                        PlaceableId ignore = InvalidPlaceableId) const = 0;
};

} // namespace Building
} // namespace Lodestone
