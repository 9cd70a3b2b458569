#pragma once

/**
 * @file InputState.hpp
 * @brief Per-frame input snapshot consumed by the Builder
 */

#include "spatial/AABB.hpp"

#include <cstdint>

namespace Lodestone {
namespace Building {

/**
 * @brief Immutable input for one frame
 *
 * Producers increment @c version for every new snapshot. A builder that has
 * only seen version 0 has not received input yet and does nothing.
 */
struct InputState {
    uint64_t version = 0;

    Ray pointerRay;                         ///< World-space ray under the pointer

    bool pointerIsOverUi = false;
    bool toolMenuIsOpen = false;

    bool isConfirmThisFrame = false;
    bool isEscThisFrame = false;

    bool isDelete = false;                  ///< Delete modifier held
    bool hasDeleteStartedThisFrame = false;
    bool hasDeleteEndedThisFrame = false;

    bool isAlign = false;                   ///< Align modifier held
    bool isCopyThisFrame = false;

    float scrollDelta = 0.0f;
    int hotkeyThisFrame = -1;               ///< Toolbar slot pressed this frame, -1 for none
};

} // namespace Building
} // namespace Lodestone
