/**
 * @file test_spatial.cpp
 * @brief Unit tests for spatial primitives (AABB, Ray, OBB)
 */

#include <gtest/gtest.h>

#include "spatial/AABB.hpp"
#include "spatial/OBB.hpp"
#include "math/Transform.hpp"

#include "utils/TestHelpers.hpp"

using namespace Lodestone;
using namespace Lodestone::Test;

// =============================================================================
// AABB Tests
// =============================================================================

class AABBTest : public ::testing::Test {
protected:
    AABB unitBox{glm::vec3(0.0f), glm::vec3(1.0f)};
    AABB centeredBox{glm::vec3(-1.0f), glm::vec3(1.0f)};
};

TEST_F(AABBTest, DefaultIsInvalid) {
    AABB box;
    EXPECT_FALSE(box.IsValid());
}

TEST_F(AABBTest, ExpandFromInvalidCoversPoint) {
    AABB box;
    box.Expand(glm::vec3(2.0f, 3.0f, 4.0f));

    EXPECT_TRUE(box.IsValid());
    EXPECT_VEC3_EQ(glm::vec3(2.0f, 3.0f, 4.0f), box.min);
    EXPECT_VEC3_EQ(glm::vec3(2.0f, 3.0f, 4.0f), box.max);
}

TEST_F(AABBTest, ExpandIgnoresInvalidBox) {
    AABB box = unitBox;
    box.Expand(AABB::Invalid());
    EXPECT_EQ(unitBox, box);

    box.Expand(centeredBox);
    EXPECT_VEC3_EQ(glm::vec3(-1.0f), box.min);
    EXPECT_VEC3_EQ(glm::vec3(1.0f), box.max);
}

TEST_F(AABBTest, CenterAndExtents) {
    EXPECT_VEC3_EQ(glm::vec3(0.5f), unitBox.GetCenter());
    EXPECT_VEC3_EQ(glm::vec3(0.5f), unitBox.GetExtents());
    EXPECT_VEC3_EQ(glm::vec3(2.0f), centeredBox.GetSize());
}

TEST_F(AABBTest, TouchingBoxesIntersect) {
    AABB neighbour(glm::vec3(1.0f, 0.0f, 0.0f), glm::vec3(2.0f, 1.0f, 1.0f));
    EXPECT_TRUE(unitBox.Intersects(neighbour));

    AABB apart(glm::vec3(1.1f, 0.0f, 0.0f), glm::vec3(2.0f, 1.0f, 1.0f));
    EXPECT_FALSE(unitBox.Intersects(apart));
}

// =============================================================================
// Ray Tests
// =============================================================================

TEST(RayTest, DirectionIsNormalized) {
    Ray ray(glm::vec3(0.0f), glm::vec3(0.0f, 0.0f, 5.0f));
    EXPECT_VEC3_EQ(glm::vec3(0.0f, 0.0f, 1.0f), ray.direction);
    EXPECT_VEC3_EQ(glm::vec3(0.0f, 0.0f, 3.0f), ray.GetPoint(3.0f));
}

TEST(RayTest, DistanceToLine) {
    Ray ray(glm::vec3(0.0f), glm::vec3(1.0f, 0.0f, 0.0f));
    EXPECT_FLOAT_EQ(2.0f, ray.DistanceToLine(glm::vec3(5.0f, 2.0f, 0.0f)));
    // The line extends behind the origin
    EXPECT_FLOAT_EQ(1.0f, ray.DistanceToLine(glm::vec3(-3.0f, 0.0f, 1.0f)));
    EXPECT_VEC3_EQ(glm::vec3(-3.0f, 0.0f, 0.0f), ray.ClosestPointOnLine(glm::vec3(-3.0f, 0.0f, 1.0f)));
}

// =============================================================================
// OBB Tests
// =============================================================================

class OBBTest : public ::testing::Test {
protected:
    OBB box{glm::vec3(0.0f), glm::vec3(1.0f, 0.5f, 2.0f)};
    OBB rotated{glm::vec3(0.0f), glm::vec3(1.0f, 0.5f, 2.0f), Transform::AngleAxis(90.0f, Transform::WorldUp)};
};

TEST_F(OBBTest, ContainsRespectsOrientation) {
    EXPECT_TRUE(box.Contains(glm::vec3(0.0f, 0.0f, 1.9f)));
    EXPECT_FALSE(box.Contains(glm::vec3(1.9f, 0.0f, 0.0f)));

    EXPECT_TRUE(rotated.Contains(glm::vec3(1.9f, 0.0f, 0.0f)));
    EXPECT_FALSE(rotated.Contains(glm::vec3(0.0f, 0.0f, 1.9f)));
}

TEST_F(OBBTest, ContainsWithTolerance) {
    glm::vec3 justOutside(1.05f, 0.0f, 0.0f);
    EXPECT_FALSE(box.Contains(justOutside));
    EXPECT_TRUE(box.Contains(justOutside, 0.1f));
}

TEST_F(OBBTest, BoundingAABBOfRotatedBox) {
    AABB bounds = rotated.GetBoundingAABB();
    EXPECT_VEC3_NEAR(glm::vec3(-2.0f, -0.5f, -1.0f), bounds.min, 1e-5f);
    EXPECT_VEC3_NEAR(glm::vec3(2.0f, 0.5f, 1.0f), bounds.max, 1e-5f);
}

TEST_F(OBBTest, ClosestPointAndDistance) {
    glm::vec3 p(3.0f, 0.0f, 0.0f);
    EXPECT_VEC3_NEAR(glm::vec3(1.0f, 0.0f, 0.0f), box.ClosestPoint(p), 1e-5f);
    EXPECT_NEAR(4.0f, box.DistanceSquared(p), 1e-4f);
    EXPECT_FLOAT_EQ(0.0f, box.DistanceSquared(glm::vec3(0.0f)));
}

TEST_F(OBBTest, SeparatedBoxesDoNotIntersect) {
    OBB other(glm::vec3(3.0f, 0.0f, 0.0f), glm::vec3(1.0f));
    EXPECT_FALSE(box.Intersects(other));
}

TEST_F(OBBTest, OverlappingBoxesIntersect) {
    OBB other(glm::vec3(1.5f, 0.0f, 0.0f), glm::vec3(1.0f), Transform::AngleAxis(45.0f, Transform::WorldUp));
    EXPECT_TRUE(box.Intersects(other));
    EXPECT_TRUE(other.Intersects(box));
}

TEST_F(OBBTest, TouchingFacesIntersect) {
    OBB other(glm::vec3(2.0f, 0.0f, 0.0f), glm::vec3(1.0f, 0.5f, 2.0f));
    EXPECT_TRUE(box.Intersects(other));
}

TEST_F(OBBTest, RotationCanSeparate) {
    // Long axis along z would overlap; rotated onto x it no longer reaches
    OBB slab(glm::vec3(0.0f, 0.0f, 3.5f), glm::vec3(0.25f, 0.25f, 2.0f));
    EXPECT_TRUE(box.Intersects(slab));

    OBB turned(glm::vec3(0.0f, 0.0f, 3.5f), glm::vec3(0.25f, 0.25f, 2.0f),
               Transform::AngleAxis(90.0f, Transform::WorldUp));
    EXPECT_FALSE(box.Intersects(turned));
}

TEST_F(OBBTest, IntersectsSphere) {
    EXPECT_TRUE(box.IntersectsSphere(glm::vec3(1.5f, 0.0f, 0.0f), 0.6f));
    EXPECT_FALSE(box.IntersectsSphere(glm::vec3(1.5f, 0.0f, 0.0f), 0.4f));
}

TEST_F(OBBTest, RayHitsNearFace) {
    Ray ray(glm::vec3(0.0f, 5.0f, 0.0f), glm::vec3(0.0f, -1.0f, 0.0f));
    float t = 0.0f;
    glm::vec3 normal(0.0f);

    ASSERT_TRUE(box.RayIntersect(ray, t, normal));
    EXPECT_NEAR(4.5f, t, 1e-5f);
    EXPECT_VEC3_NEAR(glm::vec3(0.0f, 1.0f, 0.0f), normal, 1e-5f);
}

TEST_F(OBBTest, RayMissesAndPointsAway) {
    float t = 0.0f;
    glm::vec3 normal(0.0f);

    Ray miss(glm::vec3(5.0f, 5.0f, 0.0f), glm::vec3(0.0f, -1.0f, 0.0f));
    EXPECT_FALSE(box.RayIntersect(miss, t, normal));

    Ray away(glm::vec3(0.0f, 5.0f, 0.0f), glm::vec3(0.0f, 1.0f, 0.0f));
    EXPECT_FALSE(box.RayIntersect(away, t, normal));
}

TEST_F(OBBTest, RayFromInsideReportsExit) {
    Ray ray(glm::vec3(0.0f), glm::vec3(1.0f, 0.0f, 0.0f));
    float t = 0.0f;
    glm::vec3 normal(0.0f);

    ASSERT_TRUE(box.RayIntersect(ray, t, normal));
    EXPECT_NEAR(1.0f, t, 1e-5f);
}

TEST_F(OBBTest, TransformPlacesLocalBox) {
    OBB local(glm::vec3(0.0f, 0.0f, 1.0f), glm::vec3(0.5f));
    OBB world = local.Transform(glm::vec3(10.0f, 0.0f, 0.0f), Transform::AngleAxis(90.0f, Transform::WorldUp));

    EXPECT_VEC3_NEAR(glm::vec3(11.0f, 0.0f, 0.0f), world.center, 1e-5f);
    EXPECT_TRUE(world.Contains(glm::vec3(11.4f, 0.0f, 0.0f)));
}
