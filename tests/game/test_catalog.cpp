/**
 * @file test_catalog.cpp
 * @brief Unit tests for loading placeable definitions from JSON
 */

#include <gtest/gtest.h>

#include "building/PlaceableCatalog.hpp"

#include "utils/TestHelpers.hpp"

#include <stdexcept>
#include <string>

using namespace Lodestone;
using namespace Lodestone::Building;
using namespace Lodestone::Test;

namespace {

const char* kSmallCatalog = R"({
    "identities": [
        { "name": "edge", "description": "Slab edge", "shape": "line" },
        "rail"
    ],
    "placeables": [
        {
            "assetId": "slab",
            "magnets": [
                { "name": "east", "position": [0.5, 0.0, 0.0], "rotation": [0, 90, 0],
                  "identity": ["edge"], "acceptFrom": ["edge"], "snapTo": ["edge"],
                  "alignWith": "magnet_forward", "rotateAxis": "aligned", "triggerRadius": 0.25 },
                { "name": "top", "identity": ["edge"], "snapTo": ["edge"],
                  "grid": { "divisions": [4, 2], "halfExtents": [1.0, 0.5, 0.1] } }
            ],
            "blockers": [ { "position": [0.0, 0.5, 0.0], "halfExtents": [0.4, 0.4, 0.4] } ],
            "blockingLayers": [3, 5],
            "placementCost": { "stone": 3 },
            "deletionRefund": 0.25,
            "overlapModifier": "quarter",
            "mustSnap": true,
            "playerDeletable": false
        },
        {
            "assetId": "rail",
            "displayName": "Rail",
            "magnets": [
                { "name": "a", "identity": ["rail"] },
                { "name": "b", "position": [0.0, 0.0, 1.0], "identity": ["rail"] }
            ],
            "connector": { "startHandle": "a", "endHandle": "b", "requireConnection": true,
                           "constrainToAxis": true, "constrainToGrid": 0.5,
                           "constrainToDistance": [1.0, 6.0] }
        }
    ],
    "collections": [
        { "name": "basics", "placeables": ["slab", "rail", "slab"] }
    ]
})";

} // anonymous namespace

// =============================================================================
// Loading From Text
// =============================================================================

class PlaceableCatalogTest : public ::testing::Test {
protected:
    PlaceableCatalog catalog;
};

TEST_F(PlaceableCatalogTest, LoadsIdentities) {
    ASSERT_TRUE(catalog.LoadFromString(kSmallCatalog));

    const auto& identities = catalog.GetIdentities();
    EXPECT_EQ(2u, identities.GetCount());

    auto edge = identities.Find("edge");
    ASSERT_TRUE(edge.has_value());
    const MagnetIdentityInfo* info = identities.GetInfo(*edge);
    ASSERT_NE(nullptr, info);
    EXPECT_EQ("Slab edge", info->description);
    EXPECT_EQ(MagnetShape::Line, info->shape);

    auto rail = identities.Find("rail");
    ASSERT_TRUE(rail.has_value());
    EXPECT_EQ(MagnetShape::Point, identities.GetInfo(*rail)->shape);
}

TEST_F(PlaceableCatalogTest, LoadsPlaceablesInOrder) {
    ASSERT_TRUE(catalog.LoadFromString(kSmallCatalog));

    ASSERT_EQ(2u, catalog.GetCount());
    EXPECT_EQ("slab", catalog.GetAssetIds()[0]);
    EXPECT_EQ("rail", catalog.GetAssetIds()[1]);
    EXPECT_EQ(nullptr, catalog.Find("door"));
}

TEST_F(PlaceableCatalogTest, ParsesMagnets) {
    ASSERT_TRUE(catalog.LoadFromString(kSmallCatalog));
    const PlaceableDefinition* slab = catalog.Find("slab");
    ASSERT_NE(nullptr, slab);
    ASSERT_EQ(2u, slab->magnets.size());

    const MagnetSpec& east = slab->magnets[0];
    MagnetIdentity edge = *catalog.GetIdentities().Find("edge");
    EXPECT_EQ("east", east.name);
    EXPECT_VEC3_NEAR(glm::vec3(0.5f, 0.0f, 0.0f), east.localPose.position, 1e-5f);
    EXPECT_VEC3_NEAR(glm::vec3(1.0f, 0.0f, 0.0f), east.localPose.Forward(), 1e-5f);
    EXPECT_TRUE(east.identity.Contains(edge));
    EXPECT_TRUE(east.acceptFrom.Contains(edge));
    EXPECT_TRUE(east.rejectFrom.Empty());
    EXPECT_EQ(AlignmentMode::MagnetForward, east.alignWith);
    EXPECT_EQ(RotateAxis::Aligned, east.rotateAxis);
    EXPECT_FLOAT_EQ(0.25f, east.triggerRadius);
    EXPECT_FALSE(east.isGrid);
}

TEST_F(PlaceableCatalogTest, GridMagnetsDropSnapTo) {
    ASSERT_TRUE(catalog.LoadFromString(kSmallCatalog));
    const MagnetSpec& top = catalog.Find("slab")->magnets[1];

    EXPECT_TRUE(top.isGrid);
    EXPECT_TRUE(top.snapTo.Empty());
    EXPECT_FLOAT_EQ(4.0f, top.gridDivisions.x);
    EXPECT_FLOAT_EQ(2.0f, top.gridDivisions.y);
    EXPECT_VEC3_NEAR(glm::vec3(1.0f, 0.5f, 0.1f), top.gridHalfExtents, 1e-5f);
}

TEST_F(PlaceableCatalogTest, ParsesPlacementRules) {
    ASSERT_TRUE(catalog.LoadFromString(kSmallCatalog));
    const PlaceableDefinition* slab = catalog.Find("slab");
    ASSERT_NE(nullptr, slab);

    EXPECT_EQ("slab", slab->displayName);
    EXPECT_FALSE(slab->isConnector);
    ASSERT_EQ(1u, slab->placementCost.size());
    EXPECT_EQ("stone", slab->placementCost[0].kind);
    EXPECT_EQ(3, slab->placementCost[0].quantity);
    EXPECT_FLOAT_EQ(0.25f, slab->deletionRefund);
    EXPECT_EQ(OverlapModifier::Quarter, slab->overlapModifier);
    EXPECT_TRUE(slab->mustSnap);
    EXPECT_TRUE(slab->isPlayerPlaceable);
    EXPECT_FALSE(slab->isPlayerDeletable);
    EXPECT_EQ(LayerBit(3) | LayerBit(5), slab->blockingMask);
    EXPECT_EQ(LayerBit(Layers::Ground), slab->groundMask);

    ASSERT_EQ(1u, slab->blockingBoxes.size());
    EXPECT_VEC3_NEAR(glm::vec3(0.0f, 0.5f, 0.0f), slab->blockingBoxes[0].localPose.position, 1e-5f);
    EXPECT_VEC3_NEAR(glm::vec3(0.4f), slab->blockingBoxes[0].halfExtents, 1e-5f);
}

TEST_F(PlaceableCatalogTest, ParsesConnector) {
    ASSERT_TRUE(catalog.LoadFromString(kSmallCatalog));
    const PlaceableDefinition* rail = catalog.Find("rail");
    ASSERT_NE(nullptr, rail);

    EXPECT_EQ("Rail", rail->displayName);
    EXPECT_TRUE(rail->isConnector);
    EXPECT_EQ(0, rail->startHandle);
    EXPECT_EQ(1, rail->endHandle);
    EXPECT_TRUE(rail->requireConnection);
    EXPECT_TRUE(rail->constrainToAxis);
    EXPECT_FLOAT_EQ(0.5f, rail->constrainToGrid);
    EXPECT_FLOAT_EQ(1.0f, rail->constrainToDistance.x);
    EXPECT_FLOAT_EQ(6.0f, rail->constrainToDistance.y);
}

TEST_F(PlaceableCatalogTest, CollectionsSkipDuplicates) {
    ASSERT_TRUE(catalog.LoadFromString(kSmallCatalog));

    const PlaceableCollection* basics = catalog.FindCollection("basics");
    ASSERT_NE(nullptr, basics);
    EXPECT_EQ("basics", basics->displayName);
    ASSERT_EQ(2u, basics->assetIds.size());
    EXPECT_TRUE(basics->Contains("rail"));
    EXPECT_EQ(nullptr, catalog.FindCollection("roofs"));
}

// =============================================================================
// Rejection
// =============================================================================

TEST_F(PlaceableCatalogTest, RejectsMalformedJson) {
    EXPECT_FALSE(catalog.LoadFromString("{ \"placeables\": [ "));
    EXPECT_FALSE(catalog.LoadFromString("[1, 2, 3]"));
    EXPECT_EQ(0u, catalog.GetCount());
}

TEST_F(PlaceableCatalogTest, UnknownIdentityThrows) {
    const char* text = R"({
        "placeables": [ { "assetId": "x", "magnets": [ { "identity": ["ghost"] } ] } ]
    })";
    EXPECT_THROW(catalog.LoadFromString(text), std::runtime_error);
    EXPECT_EQ(nullptr, catalog.Find("x"));
}

TEST_F(PlaceableCatalogTest, UnknownHandleThrows) {
    const char* text = R"({
        "identities": ["rail"],
        "placeables": [ { "assetId": "x", "magnets": [ { "name": "a", "identity": ["rail"] } ],
                          "connector": { "startHandle": "a", "endHandle": "missing" } } ]
    })";
    EXPECT_THROW(catalog.LoadFromString(text), std::runtime_error);
}

TEST_F(PlaceableCatalogTest, MissingAssetIdThrows) {
    EXPECT_THROW(catalog.LoadFromString(R"({ "placeables": [ { "layer": 3 } ] })"), std::runtime_error);
}

TEST_F(PlaceableCatalogTest, UnknownAlignmentModeThrows) {
    const char* text = R"({
        "identities": ["rail"],
        "placeables": [ { "assetId": "x", "magnets": [ { "identity": ["rail"], "alignWith": "sideways" } ] } ]
    })";
    EXPECT_THROW(catalog.LoadFromString(text), std::invalid_argument);
}

TEST_F(PlaceableCatalogTest, CollectionWithUnknownPlaceableThrows) {
    const char* text = R"({ "collections": [ { "name": "c", "placeables": ["nothing"] } ] })";
    EXPECT_THROW(catalog.LoadFromString(text), std::runtime_error);
}

// =============================================================================
// Registration
// =============================================================================

TEST_F(PlaceableCatalogTest, AddReplacesInPlace) {
    PlaceableDefinition first;
    first.assetId = "crate";
    first.displayName = "Crate";
    const PlaceableDefinition* stored = catalog.Add(first);

    PlaceableDefinition second;
    second.assetId = "crate";
    second.displayName = "Big Crate";
    const PlaceableDefinition* replaced = catalog.Add(second);

    EXPECT_EQ(stored, replaced);
    EXPECT_EQ("Big Crate", catalog.Find("crate")->displayName);
    EXPECT_EQ(1u, catalog.GetCount());
}

TEST_F(PlaceableCatalogTest, ClearForgetsEverything) {
    ASSERT_TRUE(catalog.LoadFromString(kSmallCatalog));
    catalog.Clear();

    EXPECT_EQ(0u, catalog.GetCount());
    EXPECT_TRUE(catalog.GetCollections().empty());
    EXPECT_EQ(0u, catalog.GetIdentities().GetCount());
}

// =============================================================================
// Shipped Data
// =============================================================================

TEST_F(PlaceableCatalogTest, LoadsShippedCatalog) {
    ASSERT_TRUE(catalog.LoadFromFile(std::string(LODESTONE_TEST_DATA_DIR) + "/catalog.json"));

    ASSERT_NE(nullptr, catalog.Find("foundation"));
    ASSERT_NE(nullptr, catalog.Find("post"));
    const PlaceableDefinition* beam = catalog.Find("beam");
    ASSERT_NE(nullptr, beam);

    EXPECT_TRUE(beam->isConnector);
    EXPECT_GE(beam->startHandle, 0);
    EXPECT_GE(beam->endHandle, 0);
    EXPECT_NE(beam->startHandle, beam->endHandle);

    const PlaceableCollection* framing = catalog.FindCollection("framing");
    ASSERT_NE(nullptr, framing);
    EXPECT_EQ(3u, framing->assetIds.size());
}

TEST_F(PlaceableCatalogTest, MissingFileFails) {
    EXPECT_FALSE(catalog.LoadFromFile("/nonexistent/catalog.json"));
}
