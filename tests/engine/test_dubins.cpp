/**
 * @file test_dubins.cpp
 * @brief Unit tests for the Dubins shortest path solver
 */

#include <gtest/gtest.h>

#include "pathfinding/Dubins.hpp"

#include <cfloat>
#include <cmath>
#include <vector>

using namespace Lodestone;

namespace {
constexpr double kPi = 3.14159265358979323846;
}

// =============================================================================
// Solving
// =============================================================================

class DubinsTest : public ::testing::Test {
protected:
    DubinsConfig origin{0.0, 0.0, 0.0};
    DubinsConfig ahead{4.0, 0.0, 0.0};
};

TEST_F(DubinsTest, StraightAheadIsPureLine) {
    DubinsPath path;
    ASSERT_EQ(DubinsError::None, DubinsPath::ShortestPath(origin, ahead, 1.0, path));

    EXPECT_NEAR(4.0, path.Length(), 1e-9);
    EXPECT_NEAR(0.0, path.SegmentLength(0), 1e-9);
    EXPECT_NEAR(4.0, path.SegmentLength(1), 1e-9);
    EXPECT_NEAR(0.0, path.SegmentLength(2), 1e-9);
}

TEST_F(DubinsTest, EqualCostWordsKeepEvaluationOrder) {
    // LSL and RSR both degenerate to the straight line; LSL is tried first
    DubinsPath path;
    ASSERT_EQ(DubinsError::None, DubinsPath::ShortestPath(origin, ahead, 1.0, path));
    EXPECT_EQ(DubinsPathType::LSL, path.GetType());
}

TEST_F(DubinsTest, NonPositiveRhoIsRejected) {
    DubinsPath path;
    EXPECT_EQ(DubinsError::BadRho, DubinsPath::ShortestPath(origin, ahead, 0.0, path));
    EXPECT_EQ(DubinsError::BadRho, DubinsPath::ShortestPath(origin, ahead, -1.0, path));
    EXPECT_EQ(DubinsError::BadRho, DubinsPath::PathOfType(origin, ahead, 0.0, DubinsPathType::LSL, path));
}

TEST_F(DubinsTest, ColocatedConfigurationsHaveZeroLength) {
    DubinsPath path;
    ASSERT_EQ(DubinsError::None, DubinsPath::ShortestPath(origin, origin, 1.0, path));
    EXPECT_NEAR(0.0, path.Length(), 1e-9);
}

TEST_F(DubinsTest, EndpointReachesGoal) {
    DubinsConfig goal{4.0, 4.0, kPi / 2.0};

    DubinsPath path;
    ASSERT_EQ(DubinsError::None, DubinsPath::ShortestPath(origin, goal, 1.0, path));

    DubinsConfig end;
    ASSERT_EQ(DubinsError::None, path.Endpoint(end));
    EXPECT_NEAR(goal.x, end.x, 1e-4);
    EXPECT_NEAR(goal.y, end.y, 1e-4);
    EXPECT_NEAR(goal.heading, end.heading, 1e-4);
}

TEST_F(DubinsTest, ShortestIsNoLongerThanAnyWord) {
    DubinsConfig goal{-2.0, 3.0, kPi};

    DubinsPath best;
    ASSERT_EQ(DubinsError::None, DubinsPath::ShortestPath(origin, goal, 1.5, best));

    for (DubinsPathType type : kAllDubinsPathTypes) {
        DubinsPath candidate;
        if (DubinsPath::PathOfType(origin, goal, 1.5, type, candidate) == DubinsError::None) {
            EXPECT_LE(best.Length(), candidate.Length() + 1e-9) << DubinsPathTypeToString(type);
        }
    }
}

TEST_F(DubinsTest, LengthScalesWithRho) {
    DubinsConfig goal{0.0, 0.0, kPi};

    DubinsPath small;
    DubinsPath large;
    ASSERT_EQ(DubinsError::None, DubinsPath::PathOfType(origin, goal, 1.0, DubinsPathType::LSL, small));
    ASSERT_EQ(DubinsError::None, DubinsPath::PathOfType(origin, goal, 2.0, DubinsPathType::LSL, large));

    EXPECT_NEAR(small.Length() * 2.0, large.Length(), 1e-9);
    EXPECT_NEAR(small.SegmentLengthNormalized(0), large.SegmentLengthNormalized(0), 1e-9);
}

TEST_F(DubinsTest, ThreeArcWordsFailForDistantGoals) {
    DubinsConfig far{10.0, 0.0, 0.0};

    DubinsPath path;
    EXPECT_EQ(DubinsError::NoPath, DubinsPath::PathOfType(origin, far, 1.0, DubinsPathType::RLR, path));
    EXPECT_EQ(DubinsError::NoPath, DubinsPath::PathOfType(origin, far, 1.0, DubinsPathType::LRL, path));
}

TEST_F(DubinsTest, EveryWordRunsFromStartToGoal) {
    struct WordCase {
        DubinsPathType type;
        DubinsConfig goal;
    };
    // Straight words need distant goals, three-arc words need goals within 4 rho
    const std::vector<WordCase> cases = {
        {DubinsPathType::LSL, {4.0, 4.0, kPi / 2.0}},
        {DubinsPathType::LSR, {6.0, 2.0, 0.0}},
        {DubinsPathType::RSL, {6.0, -2.0, 0.0}},
        {DubinsPathType::RSR, {4.0, -4.0, 3.0 * kPi / 2.0}},
        {DubinsPathType::RLR, {1.0, 0.0, kPi}},
        {DubinsPathType::LRL, {1.0, 0.0, kPi}},
    };
    const DubinsConfig start{0.5, -1.0, 0.0};

    for (const WordCase& word : cases) {
        const DubinsConfig goal{start.x + word.goal.x, start.y + word.goal.y, word.goal.heading};
        const char* name = DubinsPathTypeToString(word.type);

        DubinsPath path;
        ASSERT_EQ(DubinsError::None, DubinsPath::PathOfType(start, goal, 1.0, word.type, path)) << name;
        EXPECT_EQ(word.type, path.GetType()) << name;

        DubinsConfig first;
        ASSERT_EQ(DubinsError::None, path.Sample(0.0, first)) << name;
        EXPECT_NEAR(start.x, first.x, 1e-4) << name;
        EXPECT_NEAR(start.y, first.y, 1e-4) << name;
        EXPECT_NEAR(std::cos(start.heading), std::cos(first.heading), 1e-4) << name;
        EXPECT_NEAR(std::sin(start.heading), std::sin(first.heading), 1e-4) << name;

        DubinsConfig end;
        ASSERT_EQ(DubinsError::None, path.Endpoint(end)) << name;
        EXPECT_NEAR(goal.x, end.x, 1e-4) << name;
        EXPECT_NEAR(goal.y, end.y, 1e-4) << name;
        EXPECT_NEAR(std::cos(goal.heading), std::cos(end.heading), 1e-4) << name;
        EXPECT_NEAR(std::sin(goal.heading), std::sin(end.heading), 1e-4) << name;
    }
}

TEST(DubinsSegmentsTest, WordsMapToSegments) {
    const auto& lsr = GetDubinsSegments(DubinsPathType::LSR);
    EXPECT_EQ(DubinsSegmentType::Left, lsr[0]);
    EXPECT_EQ(DubinsSegmentType::Straight, lsr[1]);
    EXPECT_EQ(DubinsSegmentType::Right, lsr[2]);

    const auto& lrl = GetDubinsSegments(DubinsPathType::LRL);
    EXPECT_EQ(DubinsSegmentType::Left, lrl[0]);
    EXPECT_EQ(DubinsSegmentType::Right, lrl[1]);
    EXPECT_EQ(DubinsSegmentType::Left, lrl[2]);
}

// =============================================================================
// Sampling
// =============================================================================

TEST_F(DubinsTest, SampleOutsidePathIsParametrizationError) {
    DubinsPath path;
    ASSERT_EQ(DubinsError::None, DubinsPath::ShortestPath(origin, ahead, 1.0, path));

    DubinsConfig q;
    EXPECT_EQ(DubinsError::Parametrization, path.Sample(-0.1, q));
    EXPECT_EQ(DubinsError::Parametrization, path.Sample(4.1, q));
}

TEST_F(DubinsTest, SampleAlongStraightPath) {
    DubinsPath path;
    ASSERT_EQ(DubinsError::None, DubinsPath::ShortestPath(origin, ahead, 1.0, path));

    DubinsConfig q;
    ASSERT_EQ(DubinsError::None, path.Sample(2.5, q));
    EXPECT_NEAR(2.5, q.x, 1e-9);
    EXPECT_NEAR(0.0, q.y, 1e-9);
    EXPECT_NEAR(0.0, q.heading, 1e-9);
}

TEST_F(DubinsTest, SampleManyVisitsEveryStep) {
    DubinsPath path;
    ASSERT_EQ(DubinsError::None, DubinsPath::ShortestPath(origin, ahead, 1.0, path));

    std::vector<double> distances;
    int code = path.SampleMany(1.0, [&](const DubinsConfig&, double t) {
        distances.push_back(t);
        return 0;
    });

    EXPECT_EQ(0, code);
    ASSERT_EQ(4u, distances.size());
    EXPECT_DOUBLE_EQ(0.0, distances.front());
    EXPECT_DOUBLE_EQ(3.0, distances.back());
}

TEST_F(DubinsTest, SampleManyStopsOnCallbackCode) {
    DubinsPath path;
    ASSERT_EQ(DubinsError::None, DubinsPath::ShortestPath(origin, ahead, 1.0, path));

    int calls = 0;
    int code = path.SampleMany(0.5, [&](const DubinsConfig&, double) {
        return ++calls == 3 ? 7 : 0;
    });

    EXPECT_EQ(7, code);
    EXPECT_EQ(3, calls);
}

TEST_F(DubinsTest, SegmentIndexOutOfRange) {
    DubinsPath path;
    ASSERT_EQ(DubinsError::None, DubinsPath::ShortestPath(origin, ahead, 1.0, path));

    EXPECT_EQ(DBL_MAX, path.SegmentLength(-1));
    EXPECT_EQ(DBL_MAX, path.SegmentLength(3));
    EXPECT_EQ(DBL_MAX, path.SegmentLengthNormalized(3));
}

TEST_F(DubinsTest, ExtractSubpathTruncates) {
    DubinsConfig goal{3.0, 5.0, kPi / 3.0};

    DubinsPath path;
    ASSERT_EQ(DubinsError::None, DubinsPath::ShortestPath(origin, goal, 1.0, path));

    const double half = path.Length() * 0.5;
    DubinsPath sub;
    ASSERT_EQ(DubinsError::None, path.ExtractSubpath(half, sub));
    EXPECT_NEAR(half, sub.Length(), 1e-9);

    DubinsConfig subEnd;
    DubinsConfig mid;
    ASSERT_EQ(DubinsError::None, sub.Endpoint(subEnd));
    ASSERT_EQ(DubinsError::None, path.Sample(half, mid));
    EXPECT_NEAR(mid.x, subEnd.x, 1e-4);
    EXPECT_NEAR(mid.y, subEnd.y, 1e-4);

    EXPECT_EQ(DubinsError::Parametrization, path.ExtractSubpath(path.Length() + 1.0, sub));
}
