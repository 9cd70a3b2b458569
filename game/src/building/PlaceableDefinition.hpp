#pragma once

/**
 * @file PlaceableDefinition.hpp
 * @brief Authored description of a placeable type
 *
 * Definitions are immutable once loaded into a PlaceableCatalog. Every
 * Placeable instance keeps a pointer to the definition it was created from.
 */

#include "building/BuildIds.hpp"
#include "building/Magnet.hpp"
#include "math/Transform.hpp"

#include <glm/glm.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace Lodestone {
namespace Building {

// ============================================================================
// Overlap Modifier
// ============================================================================

/// Denominator of the overlap modifier scale
inline constexpr int MaxOverlapModifier = 16;

/**
 * @brief Scale applied to the builder's magnet search radius
 *
 * Values are expressed in sixteenths above Sixteenth and as divisors below.
 */
enum class OverlapModifier : uint8_t {
    Undefined     = 0,      ///< Treated as None
    None          = 1,
    Half          = 2,
    Quarter       = 4,
    Eighth        = 8,
    Sixteenth     = 16,
    PlusSixteenth = 17,
    PlusEighth    = 18,
    PlusQuarter   = 20,
    PlusHalf      = 24,
    Double        = 32,
    Triple        = 48,
    Quadruple     = 64
};

/**
 * @brief Multiplier for the search radius
 */
float GetOverlapScale(OverlapModifier modifier);

const char* OverlapModifierToString(OverlapModifier modifier);

/**
 * @throws std::invalid_argument for an unknown name
 */
OverlapModifier OverlapModifierFromString(const std::string& name);

// ============================================================================
// Costs
// ============================================================================

/**
 * @brief One line item of a placement or deletion cost
 */
struct ResourceCost {
    std::string kind;
    int64_t quantity = 0;
};

using CostList = std::vector<ResourceCost>;

// ============================================================================
// Blocking Shape
// ============================================================================

/**
 * @brief Box, relative to the placeable root, that must not overlap blocking layers
 */
struct BlockingBox {
    Pose localPose;
    glm::vec3 halfExtents{0.5f};
};

// ============================================================================
// Placeable Definition
// ============================================================================

struct PlaceableDefinition {
    std::string assetId;
    std::string displayName;
    std::string tooltip;
    int layer = Layers::Placeables;

    std::vector<MagnetSpec> magnets;

    // Connector
    bool isConnector = false;
    int startHandle = -1;               ///< Index into magnets, -1 if none
    int endHandle = -1;                 ///< Index into magnets, -1 if none
    bool requireConnection = false;     ///< Both handles must touch to count as connected
    bool constrainToAxis = false;       ///< End handle slides along its own forward
    float constrainToGrid = 0.0f;       ///< Quantization of the constrained length, 0 for none
    glm::vec2 constrainToDistance{0.0f, 50.0f};

    // Costs
    CostList placementCost;
    CostList deletionCost;
    float deletionRefund = 1.0f;        ///< Fraction of the placement cost returned on deletion

    OverlapModifier overlapModifier = OverlapModifier::None;

    // Blocking and grounding
    bool respectBlockers = true;
    std::vector<BlockingBox> blockingBoxes;
    LayerMask blockingMask = LayerBit(Layers::Placeables);
    LayerMask groundMask = LayerBit(Layers::Ground);

    // Behaviour
    bool canFloat = true;
    bool mustSnap = false;
    bool isPlayerPlaceable = true;
    bool isPlayerDeletable = true;
    float destroyFloatingDelay = 4.0f;

    [[nodiscard]] bool HasStartHandle() const { return isConnector && startHandle >= 0; }
    [[nodiscard]] bool HasEndHandle() const { return isConnector && endHandle >= 0; }
    [[nodiscard]] bool IsConstrainedEndHandle() const { return isConnector && constrainToAxis; }
    [[nodiscard]] float GetOverlapScale() const { return Building::GetOverlapScale(overlapModifier); }
};

} // namespace Building
} // namespace Lodestone
