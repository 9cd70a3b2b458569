/**
 * @file test_snap_alignment.cpp
 * @brief Unit tests for the pose math that snaps magnets together
 */

#include <gtest/gtest.h>

#include "building/SnapAlignment.hpp"

#include "utils/TestHelpers.hpp"

#include <stdexcept>

using namespace Lodestone;
using namespace Lodestone::Building;
using namespace Lodestone::Test;

namespace {

const glm::quat kIdentity(1.0f, 0.0f, 0.0f, 0.0f);

Pose Yawed(const glm::vec3& position, float degrees) {
    return Pose(position, Transform::AngleAxis(degrees, Transform::WorldUp));
}

} // anonymous namespace

// =============================================================================
// Orientation Helpers
// =============================================================================

TEST(SnapAlignmentTest, AlignForwardWithStaysUpright) {
    glm::quat q = SnapAlignment::AlignForwardWith(Transform::WorldRight);
    EXPECT_VEC3_NEAR(Transform::WorldRight, q * Transform::WorldForward, 1e-5f);
    EXPECT_VEC3_NEAR(Transform::WorldUp, q * Transform::WorldUp, 1e-5f);
}

TEST(SnapAlignmentTest, PositionOffsetKeepsPivotToMagnetVector) {
    Pose root(glm::vec3(1.0f, 0.0f, 0.0f), kIdentity);
    Pose from(glm::vec3(1.5f, 0.0f, 0.0f), kIdentity);
    Pose to = Yawed(glm::vec3(4.0f, 1.0f, 0.0f), 90.0f);

    glm::vec3 position = SnapAlignment::PositionOffset(from, to, root, glm::vec3(0.0f, 0.0f, 1.0f));
    // Offset is expressed in target space: its forward is world +X
    EXPECT_VEC3_NEAR(glm::vec3(4.5f, 1.0f, 0.0f), position, 1e-5f);
}

// =============================================================================
// Root Snapping
// =============================================================================

class SnapRootTest : public ::testing::Test {
protected:
    Pose root{glm::vec3(0.0f), kIdentity};
    glm::vec3 heading{Transform::WorldForward};
    glm::vec3 noOffset{0.0f};
};

TEST_F(SnapRootTest, WorldUpFollowsHeading) {
    Pose fromLocal(glm::vec3(0.0f, -0.5f, 0.0f), kIdentity);
    Pose to(glm::vec3(2.0f, 1.0f, 2.0f), kIdentity);

    Pose result = SnapAlignment::SnapRoot(root, fromLocal, AlignmentMode::WorldUp, to,
                                          Transform::WorldRight, noOffset, false);

    EXPECT_VEC3_NEAR(Transform::WorldRight, result.Forward(), 1e-5f);
    EXPECT_VEC3_NEAR(glm::vec3(2.0f, 1.5f, 2.0f), result.position, 1e-5f);
}

TEST_F(SnapRootTest, MagnetForwardFacesAgainstTarget) {
    Pose fromLocal = Yawed(glm::vec3(0.5f, 0.0f, 0.0f), 90.0f);
    Pose to(glm::vec3(3.0f, 0.0f, 0.0f), kIdentity);

    Pose result = SnapAlignment::SnapRoot(root, fromLocal, AlignmentMode::MagnetForward, to,
                                          heading, noOffset, false);
    Pose seeker = result * fromLocal;

    EXPECT_VEC3_NEAR(-to.Forward(), seeker.Forward(), 1e-4f);
    EXPECT_VEC3_NEAR(Transform::WorldUp, result.Up(), 1e-4f);
    EXPECT_VEC3_NEAR(to.position, seeker.position, 1e-4f);
}

TEST_F(SnapRootTest, MagnetRightMatchesTargetRight) {
    Pose fromLocal(glm::vec3(0.0f, 0.0f, 1.0f), kIdentity);
    Pose to = Yawed(glm::vec3(-2.0f, 0.0f, 1.0f), 90.0f);

    Pose result = SnapAlignment::SnapRoot(root, fromLocal, AlignmentMode::MagnetRight, to,
                                          heading, noOffset, false);
    Pose seeker = result * fromLocal;

    EXPECT_VEC3_NEAR(to.Right(), seeker.Right(), 1e-4f);
    EXPECT_VEC3_NEAR(to.position, seeker.position, 1e-4f);
}

TEST_F(SnapRootTest, MagnetUpOpposesTargetUp) {
    Pose fromLocal(glm::vec3(0.0f, 1.0f, 0.0f), kIdentity);
    Pose to(glm::vec3(0.0f, 3.0f, 0.0f), kIdentity);

    Pose result = SnapAlignment::SnapRoot(root, fromLocal, AlignmentMode::MagnetUp, to,
                                          heading, noOffset, false);
    Pose seeker = result * fromLocal;

    EXPECT_VEC3_NEAR(-to.Up(), seeker.Up(), 1e-4f);
    EXPECT_VEC3_NEAR(to.Right(), seeker.Right(), 1e-4f);
    EXPECT_VEC3_NEAR(glm::vec3(0.0f, 4.0f, 0.0f), result.position, 1e-4f);
}

TEST_F(SnapRootTest, MagnetFaceCopiesTargetFrame) {
    Pose fromLocal(glm::vec3(0.0f, 0.0f, 0.5f), kIdentity);
    Pose to = Yawed(glm::vec3(3.0f, 0.0f, 0.0f), 90.0f);

    Pose result = SnapAlignment::SnapRoot(root, fromLocal, AlignmentMode::MagnetFace, to,
                                          heading, noOffset, false);
    Pose seeker = result * fromLocal;

    EXPECT_QUAT_EQ(to.rotation, seeker.rotation);
    EXPECT_VEC3_NEAR(glm::vec3(2.5f, 0.0f, 0.0f), result.position, 1e-4f);
    EXPECT_VEC3_NEAR(to.position, seeker.position, 1e-4f);
}

TEST_F(SnapRootTest, MagnetFaceFlipMirrorsForward) {
    Pose fromLocal(glm::vec3(0.0f), kIdentity);
    Pose to = Yawed(glm::vec3(3.0f, 0.0f, 0.0f), 90.0f);

    Pose result = SnapAlignment::SnapRoot(root, fromLocal, AlignmentMode::MagnetFace, to,
                                          heading, noOffset, true);

    EXPECT_VEC3_NEAR(-to.Forward(), result.Forward(), 1e-4f);
    EXPECT_VEC3_NEAR(Transform::WorldUp, result.Up(), 1e-4f);
    EXPECT_VEC3_NEAR(to.position, result.position, 1e-4f);
}

TEST_F(SnapRootTest, OffsetIsAppliedInTargetSpace) {
    Pose fromLocal(glm::vec3(0.0f, -0.25f, 0.0f), kIdentity);
    // Floor grid facing up: local X/Y span the ground plane
    Pose to(glm::vec3(1.0f, 1.0f, 1.0f), Transform::AngleAxis(-90.0f, Transform::WorldRight));
    glm::vec3 cell(0.5f, 0.5f, 0.0f);

    Pose result = SnapAlignment::SnapRoot(root, fromLocal, AlignmentMode::WorldUp, to,
                                          heading, cell, false);
    Pose seeker = result * fromLocal;

    EXPECT_VEC3_NEAR(to.TransformPoint(cell), seeker.position, 1e-4f);
    EXPECT_NEAR(1.0f, seeker.position.y, 1e-4f);
}

TEST_F(SnapRootTest, SeekerLandsOnTargetForEveryMode) {
    Pose fromLocal = Yawed(glm::vec3(0.3f, 0.2f, -0.4f), 45.0f);
    Pose to = Yawed(glm::vec3(-1.0f, 2.0f, 5.0f), 30.0f);
    Pose start = Yawed(glm::vec3(7.0f, 0.0f, -3.0f), 10.0f);

    for (AlignmentMode mode : {AlignmentMode::WorldUp, AlignmentMode::MagnetForward,
                               AlignmentMode::MagnetRight, AlignmentMode::MagnetUp,
                               AlignmentMode::MagnetFace}) {
        Pose result = SnapAlignment::SnapRoot(start, fromLocal, mode, to, heading, noOffset, false);
        Pose seeker = result * fromLocal;
        EXPECT_VEC3_NEAR(to.position, seeker.position, 1e-4f) << AlignmentModeToString(mode);
    }
}

TEST_F(SnapRootTest, UnsupportedModeThrows) {
    Pose to(glm::vec3(0.0f), kIdentity);
    EXPECT_THROW(SnapAlignment::SnapRoot(root, root, static_cast<AlignmentMode>(42), to,
                                         heading, noOffset, false),
                 std::invalid_argument);
}

// =============================================================================
// Pivot Snapping
// =============================================================================

TEST(SnapPivotTest, PivotLandsOnTargetPlusOffset) {
    Pose pivot = Yawed(glm::vec3(5.0f, 5.0f, 5.0f), 20.0f);
    Pose to = Yawed(glm::vec3(1.0f, 0.0f, 0.0f), 90.0f);
    glm::vec3 offset(0.0f, 1.0f, 0.0f);

    for (AlignmentMode mode : {AlignmentMode::WorldUp, AlignmentMode::MagnetForward,
                               AlignmentMode::MagnetRight, AlignmentMode::MagnetUp,
                               AlignmentMode::MagnetFace}) {
        Pose result = SnapAlignment::SnapPivot(pivot, mode, to, Transform::WorldForward, offset);
        EXPECT_VEC3_NEAR(glm::vec3(1.0f, 1.0f, 0.0f), result.position, 1e-4f) << AlignmentModeToString(mode);
    }
}

TEST(SnapPivotTest, WorldUpUsesHeading) {
    Pose pivot(glm::vec3(0.0f), kIdentity);
    Pose to(glm::vec3(2.0f, 0.0f, 0.0f), kIdentity);

    Pose result = SnapAlignment::SnapPivot(pivot, AlignmentMode::WorldUp, to,
                                           -Transform::WorldRight, glm::vec3(0.0f));

    EXPECT_VEC3_NEAR(-Transform::WorldRight, result.Forward(), 1e-5f);
    EXPECT_VEC3_NEAR(to.position, result.position, 1e-5f);
}
