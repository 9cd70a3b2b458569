#pragma once

/**
 * @file BuildIds.hpp
 * @brief Handles and layer masks shared by the building toolkit
 */

#include <cstdint>
#include <vector>

namespace Lodestone {
namespace Building {

/// Handle of a placeable owned by a PlacementWorld. 0 is never issued.
using PlaceableId = uint32_t;

/// Handle of a magnet owned by a placeable. 0 is never issued.
using MagnetId = uint32_t;

inline constexpr PlaceableId InvalidPlaceableId = 0;
inline constexpr MagnetId InvalidMagnetId = 0;

using LayerMask = uint32_t;

/**
 * @brief Default collision layers
 */
namespace Layers {
inline constexpr int Ground = 0;
inline constexpr int Placeables = 1;
inline constexpr int Magnets = 2;
inline constexpr int Focus = 3;
} // namespace Layers

inline constexpr LayerMask LayerBit(int layer) {
    return (layer >= 0 && layer < 32) ? (1u << layer) : 0u;
}

inline constexpr LayerMask AllLayers = 0xFFFFFFFFu;

inline LayerMask MaskFromLayers(const std::vector<int>& layers) {
    LayerMask mask = 0;
    for (int layer : layers) {
        mask |= LayerBit(layer);
    }
    return mask;
}

} // namespace Building
} // namespace Lodestone
