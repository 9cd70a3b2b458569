#include "building/SnapAlignment.hpp"

#include <stdexcept>
#include <string>

namespace Lodestone {
namespace Building {
namespace SnapAlignment {

glm::quat AlignForwardWith(const glm::vec3& direction) {
    return Transform::LookRotation(direction, Transform::WorldUp);
}

glm::quat ForwardOffset(const Pose& from, const Pose& to, const Pose& root, bool flip) {
    glm::quat localOffset = Transform::FromToRotation(root.Forward(), -from.Forward());
    glm::quat flipOffset = flip ? Transform::AngleAxis(180.0f, to.Up()) : glm::quat(1.0f, 0.0f, 0.0f, 0.0f);
    glm::quat rotation = glm::normalize(flipOffset * localOffset * to.rotation);
    // Keep the root upright relative to the target
    return Transform::WithUp(rotation, to.Up());
}

glm::quat RightOffset(const Pose& from, const Pose& to, const Pose& root, bool flip) {
    glm::vec3 up = root.Up();
    glm::quat localOffset = Transform::FromToRotation(root.Right(), from.Right());
    bool dotFlip = glm::dot(to.Right(), from.Right()) < 0.0f;
    glm::quat flipOffset = (flip && !dotFlip) ? Transform::AngleAxis(180.0f, to.Up())
                                              : glm::quat(1.0f, 0.0f, 0.0f, 0.0f);
    glm::quat corrected = flipOffset * localOffset * to.rotation;
    return Transform::LookRotation(corrected * Transform::WorldForward, up);
}

glm::quat UpOffset(const Pose& from, const Pose& to, const Pose& root, bool flip) {
    glm::quat localOffset = Transform::FromToRotation(root.Up(), from.Up());
    glm::quat flipOffset = flip ? Transform::AngleAxis(180.0f, to.Right()) : glm::quat(1.0f, 0.0f, 0.0f, 0.0f);
    glm::quat rotation = glm::normalize(flipOffset * localOffset * to.rotation);
    return Transform::WithRight(rotation, to.Right());
}

Pose FaceOffset(const Pose& from, const Pose& to, const Pose& root, bool flip) {
    glm::vec3 localForward = from.InverseTransformDirection(flip ? -root.Forward() : root.Forward());
    glm::vec3 localUp = from.InverseTransformDirection(root.Up());
    glm::vec3 localPosition = from.InverseTransformPoint(root.position);

    return Pose(to.TransformPoint(localPosition),
                Transform::LookRotation(to.TransformDirection(localForward), to.TransformDirection(localUp)));
}

glm::vec3 PositionOffset(const Pose& from, const Pose& to, const Pose& root, const glm::vec3& offset) {
    glm::vec3 pivotToMagnet = from.position - root.position;
    return to.position - pivotToMagnet + to.TransformDirection(offset);
}

Pose SnapRoot(const Pose& root, const Pose& fromLocal, AlignmentMode mode, const Pose& to,
              const glm::vec3& heading, const glm::vec3& offset, bool flipFaceAlignment) {
    Pose result = root;
    const Pose from = root * fromLocal;

    switch (mode) {
        case AlignmentMode::WorldUp:
            result.rotation = AlignForwardWith(heading);
            break;
        case AlignmentMode::MagnetForward:
            result.rotation = ForwardOffset(from, to, result, true);
            break;
        case AlignmentMode::MagnetRight:
            result.rotation = RightOffset(from, to, result, false);
            break;
        case AlignmentMode::MagnetUp:
            result.rotation = UpOffset(from, to, result, true);
            break;
        case AlignmentMode::MagnetFace:
            result = FaceOffset(from, to, result, flipFaceAlignment);
            break;
        default:
            throw std::invalid_argument("Unsupported alignment mode: " +
                                        std::to_string(static_cast<int>(mode)));
    }

    // The seeker moved with the root
    const Pose movedFrom = result * fromLocal;
    result.position = PositionOffset(movedFrom, to, result, offset);
    return result;
}

Pose SnapPivot(const Pose& pivot, AlignmentMode mode, const Pose& to,
               const glm::vec3& heading, const glm::vec3& offset) {
    Pose result = pivot;

    switch (mode) {
        case AlignmentMode::MagnetForward:
            result.rotation = ForwardOffset(pivot, to, pivot, false);
            break;
        case AlignmentMode::MagnetRight:
            result.rotation = RightOffset(pivot, to, pivot, false);
            break;
        case AlignmentMode::MagnetUp:
            result.rotation = UpOffset(pivot, to, pivot, true);
            break;
        case AlignmentMode::MagnetFace:
            result = FaceOffset(pivot, to, pivot, true);
            break;
        default:
            result.rotation = AlignForwardWith(heading);
            break;
    }

    result.position = PositionOffset(result, to, result, offset);
    return result;
}

} // namespace SnapAlignment
} // namespace Building
} // namespace Lodestone
