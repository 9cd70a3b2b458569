#pragma once

/**
 * @file SnapAlignment.hpp
 * @brief Pose math that brings a placeable magnet onto a world magnet
 *
 * All functions are pure: they take the current root pose and return the
 * snapped one. A magnet that belongs to the moved frame is passed by its
 * pose relative to that frame so it follows every intermediate rotation.
 */

#include "building/Magnet.hpp"
#include "math/Transform.hpp"

#include <glm/glm.hpp>

namespace Lodestone {
namespace Building {
namespace SnapAlignment {

/**
 * @brief Upright rotation facing @p direction
 */
glm::quat AlignForwardWith(const glm::vec3& direction);

/**
 * @brief Turn @p root so the seeker faces against the target forward
 */
glm::quat ForwardOffset(const Pose& from, const Pose& to, const Pose& root, bool flip);

/**
 * @brief Turn @p root so the seeker right matches the target right, keeping root up
 */
glm::quat RightOffset(const Pose& from, const Pose& to, const Pose& root, bool flip);

/**
 * @brief Turn @p root so the seeker up matches the target up
 */
glm::quat UpOffset(const Pose& from, const Pose& to, const Pose& root, bool flip);

/**
 * @brief Re-express @p root relative to @p to as it was relative to @p from
 * @param flip Mirror the root forward through the face
 */
Pose FaceOffset(const Pose& from, const Pose& to, const Pose& root, bool flip);

/**
 * @brief Root position that puts @p from onto @p to plus an offset in target space
 */
glm::vec3 PositionOffset(const Pose& from, const Pose& to, const Pose& root, const glm::vec3& offset);

/**
 * @brief Snap a placeable root so its magnet meets a world magnet
 *
 * The seeker's alignment mode picks the orientation rule.
 * @param fromLocal Seeker magnet pose relative to @p root
 * @param heading Builder heading used by AlignmentMode::WorldUp
 * @param offset Snap location in target magnet space, e.g. a grid cell
 * @throws std::invalid_argument for an unsupported alignment mode
 */
Pose SnapRoot(const Pose& root, const Pose& fromLocal, AlignmentMode mode, const Pose& to,
              const glm::vec3& heading, const glm::vec3& offset, bool flipFaceAlignment);

/**
 * @brief Snap a connector end handle, which is its own pivot
 */
Pose SnapPivot(const Pose& pivot, AlignmentMode mode, const Pose& to,
               const glm::vec3& heading, const glm::vec3& offset);

} // namespace SnapAlignment
} // namespace Building
} // namespace Lodestone
