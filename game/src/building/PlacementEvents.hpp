#pragma once

/**
 * @file PlacementEvents.hpp
 * @brief Notifications published by the Builder
 */

#include "building/BuildIds.hpp"

#include <cstdint>

namespace Lodestone {
namespace Building {

enum class PlacementPhase : uint8_t {
    Started,            ///< A ghost was created for the current tool
    Cancelled,          ///< The ghost was discarded
    PlacementFailed,
    CanSnap,            ///< A new snap target came into range
    Snap,               ///< The ghost snapped to a target
    Rotate,             ///< The heading changed
    DeletionFailed,
    Deleted,
    Placed
};

inline const char* PlacementPhaseToString(PlacementPhase phase) {
    switch (phase) {
        case PlacementPhase::Started:         return "Started";
        case PlacementPhase::Cancelled:       return "Cancelled";
        case PlacementPhase::PlacementFailed: return "PlacementFailed";
        case PlacementPhase::CanSnap:         return "CanSnap";
        case PlacementPhase::Snap:            return "Snap";
        case PlacementPhase::Rotate:          return "Rotate";
        case PlacementPhase::DeletionFailed:  return "DeletionFailed";
        case PlacementPhase::Deleted:         return "Deleted";
        case PlacementPhase::Placed:          return "Placed";
        default:                              return "Unknown";
    }
}

/**
 * @brief Why a placement, copy or deletion was rejected
 */
enum class PlacementFailure : uint8_t {
    None,
    NoAim,
    NotAffordable,
    NoPlaceable,
    NotPlaceableByPlayer,
    Blocked,
    NoSnap,
    NotDeletableByPlayer
};

inline const char* PlacementFailureToString(PlacementFailure failure) {
    switch (failure) {
        case PlacementFailure::None:                 return "None";
        case PlacementFailure::NoAim:                return "NoAim";
        case PlacementFailure::NotAffordable:        return "NotAffordable";
        case PlacementFailure::NoPlaceable:          return "NoPlaceable";
        case PlacementFailure::NotPlaceableByPlayer: return "NotPlaceableByPlayer";
        case PlacementFailure::Blocked:              return "Blocked";
        case PlacementFailure::NoSnap:               return "NoSnap";
        case PlacementFailure::NotDeletableByPlayer: return "NotDeletableByPlayer";
        default:                                     return "Unknown";
    }
}

struct PlacementEvent {
    PlacementPhase phase = PlacementPhase::Started;
    PlacementFailure failure = PlacementFailure::None;
    PlaceableId placeable = InvalidPlaceableId;     ///< Ghost, placed or deleted instance when known
};

} // namespace Building
} // namespace Lodestone
