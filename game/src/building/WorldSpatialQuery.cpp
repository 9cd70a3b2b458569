#include "building/WorldSpatialQuery.hpp"
#include "building/PlacementWorld.hpp"

#include <algorithm>

namespace Lodestone {
namespace Building {

namespace {

bool InMask(LayerMask mask, int layer) {
    return (mask & LayerBit(layer)) != 0;
}

} // anonymous namespace

std::optional<SurfaceHit> WorldSpatialQuery::Raycast(const Ray& ray, float maxDistance,
                                                     float radius, LayerMask mask) const {
    std::optional<SurfaceHit> best;

    auto consider = [&](const OBB& box, int layer, PlaceableId owner) {
        if (!InMask(mask, layer)) {
            return;
        }
        OBB probe(box.center, box.halfExtents + glm::vec3(radius), box.orientation);
        // Casts starting inside a body ignore it
        if (probe.Contains(ray.origin)) {
            return;
        }

        float t = 0.0f;
        glm::vec3 normal(0.0f);
        if (!probe.RayIntersect(ray, t, normal) || t > maxDistance) {
            return;
        }
        if (best && t >= best->distance) {
            return;
        }

        SurfaceHit hit;
        hit.distance = t;
        hit.normal = normal;
        hit.point = ray.GetPoint(t) - normal * radius;
        hit.layer = layer;
        hit.placeable = owner;
        best = hit;
    };

    for (const auto& surface : m_world.GetSurfaces()) {
        consider(surface.box, surface.layer, InvalidPlaceableId);
    }
    m_world.ForEachPlaceable([&](const Placeable& placeable) {
        if (!placeable.AreCollidersEnabled()) {
            return;
        }
        for (const auto& box : placeable.GetBlockingBoxes()) {
            consider(box, placeable.GetLayer(), placeable.GetId());
        }
    });

    return best;
}

std::vector<const Magnet*> WorldSpatialQuery::OverlapMagnets(const glm::vec3& center, float radius,
                                                             LayerMask mask) const {
    std::vector<const Magnet*> result;
    if (!InMask(mask, Layers::Magnets)) {
        return result;
    }

    m_world.ForEachPlaceable([&](const Placeable& placeable) {
        if (!placeable.AreCollidersEnabled()) {
            return;
        }
        for (const auto& magnet : placeable.GetMagnets()) {
            if (magnet.IsCollisionEnabled() && magnet.IntersectsSphere(center, radius)) {
                result.push_back(&magnet);
            }
        }
    });

    std::sort(result.begin(), result.end(),
              [](const Magnet* a, const Magnet* b) { return a->GetId() < b->GetId(); });
    return result;
}

bool WorldSpatialQuery::CheckBox(const OBB& box, LayerMask mask, PlaceableId ignore) const {
    for (const auto& surface : m_world.GetSurfaces()) {
        if (InMask(mask, surface.layer) && box.Intersects(surface.box)) {
            return true;
        }
    }

    bool blocked = false;
    m_world.ForEachPlaceable([&](const Placeable& placeable) {
        if (blocked || placeable.GetId() == ignore || !placeable.AreCollidersEnabled() ||
            !InMask(mask, placeable.GetLayer())) {
            return;
        }
        for (const auto& other : placeable.GetBlockingBoxes()) {
            if (box.Intersects(other)) {
                blocked = true;
                return;
            }
        }
    });
    return blocked;
}

} // namespace Building
} // namespace Lodestone
