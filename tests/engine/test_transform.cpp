/**
 * @file test_transform.cpp
 * @brief Unit tests for poses and rotation helpers
 */

#include <gtest/gtest.h>

#include "math/Transform.hpp"

#include "utils/TestHelpers.hpp"

using namespace Lodestone;
using namespace Lodestone::Test;

// =============================================================================
// Rotation Helpers
// =============================================================================

TEST(TransformTest, FromToRotationMapsDirections) {
    glm::quat q = Transform::FromToRotation(Transform::WorldForward, Transform::WorldRight);
    EXPECT_VEC3_NEAR(Transform::WorldRight, q * Transform::WorldForward, 1e-5f);
}

TEST(TransformTest, FromToRotationHandlesAntiparallel) {
    glm::quat q = Transform::FromToRotation(Transform::WorldForward, -Transform::WorldForward);
    EXPECT_VEC3_NEAR(-Transform::WorldForward, q * Transform::WorldForward, 1e-5f);
}

TEST(TransformTest, FromToRotationOfZeroIsIdentity) {
    glm::quat q = Transform::FromToRotation(glm::vec3(0.0f), Transform::WorldUp);
    EXPECT_QUAT_EQ(glm::quat(1.0f, 0.0f, 0.0f, 0.0f), q);
}

TEST(TransformTest, LookRotationKeepsUp) {
    glm::quat q = Transform::LookRotation(Transform::WorldRight);
    EXPECT_VEC3_NEAR(Transform::WorldRight, q * Transform::WorldForward, 1e-5f);
    EXPECT_VEC3_NEAR(Transform::WorldUp, q * Transform::WorldUp, 1e-5f);
}

TEST(TransformTest, LookRotationAlongUpStillFacesForward) {
    glm::quat q = Transform::LookRotation(Transform::WorldUp);
    EXPECT_VEC3_NEAR(Transform::WorldUp, q * Transform::WorldForward, 1e-5f);
}

TEST(TransformTest, AngleAxisUsesDegrees) {
    glm::quat q = Transform::AngleAxis(90.0f, Transform::WorldUp);
    EXPECT_VEC3_NEAR(Transform::WorldRight, q * Transform::WorldForward, 1e-5f);
    EXPECT_NEAR(90.0f, Transform::Angle(glm::quat(1.0f, 0.0f, 0.0f, 0.0f), q), 1e-3f);
}

TEST(TransformTest, AngleIgnoresQuaternionSign) {
    glm::quat q = Transform::AngleAxis(30.0f, Transform::WorldRight);
    EXPECT_FLOAT_EQ(0.0f, Transform::Angle(q, -q));
}

TEST(TransformTest, WithUpPreservesHeadingWhenTilting) {
    glm::quat heading = Transform::AngleAxis(90.0f, Transform::WorldUp);
    glm::quat q = Transform::WithUp(heading, Transform::WorldUp);
    EXPECT_QUAT_EQ(heading, q);

    glm::quat flipped = Transform::WithUp(heading, -Transform::WorldUp);
    EXPECT_VEC3_NEAR(-Transform::WorldUp, flipped * Transform::WorldUp, 1e-5f);
}

TEST(TransformTest, WithRightAlignsRight) {
    glm::vec3 right = glm::normalize(glm::vec3(1.0f, 0.0f, 1.0f));
    glm::quat q = Transform::WithRight(glm::quat(1.0f, 0.0f, 0.0f, 0.0f), right);
    EXPECT_VEC3_NEAR(right, q * Transform::WorldRight, 1e-5f);
}

// =============================================================================
// Pose
// =============================================================================

class PoseTest : public ::testing::Test {
protected:
    Pose pose{glm::vec3(1.0f, 2.0f, 3.0f), Transform::AngleAxis(90.0f, Transform::WorldUp)};
};

TEST_F(PoseTest, Axes) {
    EXPECT_VEC3_NEAR(Transform::WorldRight, pose.Forward(), 1e-5f);
    EXPECT_VEC3_NEAR(Transform::WorldUp, pose.Up(), 1e-5f);
    EXPECT_VEC3_NEAR(-Transform::WorldForward, pose.Right(), 1e-5f);
}

TEST_F(PoseTest, TransformPointRoundTrip) {
    glm::vec3 local(0.5f, -1.0f, 2.0f);
    glm::vec3 world = pose.TransformPoint(local);

    EXPECT_VEC3_NEAR(glm::vec3(3.0f, 1.0f, 2.5f), world, 1e-5f);
    EXPECT_VEC3_NEAR(local, pose.InverseTransformPoint(world), 1e-5f);
}

TEST_F(PoseTest, DirectionsIgnoreTranslation) {
    EXPECT_VEC3_NEAR(Transform::WorldRight, pose.TransformDirection(Transform::WorldForward), 1e-5f);
    EXPECT_VEC3_NEAR(Transform::WorldForward, pose.InverseTransformDirection(Transform::WorldRight), 1e-5f);
}

TEST_F(PoseTest, ComposeWithInverseIsIdentity) {
    Pose identity = pose * pose.Inverse();
    EXPECT_VEC3_NEAR(glm::vec3(0.0f), identity.position, 1e-5f);
    EXPECT_QUAT_EQ(glm::quat(1.0f, 0.0f, 0.0f, 0.0f), identity.rotation);
}

TEST_F(PoseTest, ComposePlacesChildInParentFrame) {
    Pose child(glm::vec3(0.0f, 0.0f, 1.0f), glm::quat(1.0f, 0.0f, 0.0f, 0.0f));
    Pose world = pose * child;

    EXPECT_VEC3_NEAR(glm::vec3(2.0f, 2.0f, 3.0f), world.position, 1e-5f);
    EXPECT_QUAT_EQ(pose.rotation, world.rotation);
}
