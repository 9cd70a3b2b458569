#pragma once

/**
 * @file BuilderConfig.hpp
 * @brief Tuning values of the Builder, read from the "builder" config section
 */

#include "building/BuildIds.hpp"

#include <glm/glm.hpp>

namespace Lodestone {

class Config;

namespace Building {

struct BuilderConfig {
    /// Two positions closer than this count as snapped
    static constexpr float SnapEpsilon = 0.01f;
    /// Shortest connector the end handle may produce
    static constexpr float MinConnectorLength = 0.25f;
    /// Pointer radius above which a sphere cast replaces the ray cast
    static constexpr float RaySphereThreshold = 0.01f;

    // Distances
    float maxBuildRange = 40.0f;
    float pointerRayRadius = 0.2f;
    float overlapRadius = 4.0f;             ///< Magnet search radius before the per-type modifier

    // Rotation, in degrees
    float rotateSpeed = 15.0f;
    float angleIncrement = 15.0f;

    // Snapping
    bool staySnappedWhenBlocked = true;
    bool flipFaceAlignment = false;
    float snapBias = 0.0f;                  ///< -1 favours position, +1 favours rotation

    // World grid
    bool useWorldGrid = false;
    glm::vec3 worldGridDivisions{2.0f, 2.0f, 2.0f};

    // Timing
    float onPlacedDelay = 0.5f;             ///< Quiet period before OnWorldChanged fires

    // Menu behaviour
    bool lockCameraInMenu = true;
    bool lockPlacementInMenu = true;

    // Layers
    LayerMask surfaceMask = LayerBit(Layers::Ground) | LayerBit(Layers::Placeables);
    LayerMask magnetMask = LayerBit(Layers::Magnets);
    int focusLayer = Layers::Focus;

    /**
     * @brief Read builder.* keys, keeping defaults for missing ones
     */
    static BuilderConfig FromConfig(const Config& config);
};

} // namespace Building
} // namespace Lodestone
