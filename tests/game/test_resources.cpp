/**
 * @file test_resources.cpp
 * @brief Unit tests for the resource inventory and its claims
 */

#include <gtest/gtest.h>

#include "building/ResourceInventory.hpp"

#include <memory>
#include <stdexcept>
#include <vector>

using namespace Lodestone;
using namespace Lodestone::Building;

class ResourceInventoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        inventory.ForceSet("wood", 10);
        inventory.SetOnModified([this](ResourcePhase phase, const std::string& kind, int64_t quantity) {
            events.push_back(std::string(ResourcePhaseToString(phase)) + " " + kind + " " + std::to_string(quantity));
        });
    }

    ResourceInventory inventory;
    std::vector<std::string> events;
};

// =============================================================================
// Claims
// =============================================================================

TEST_F(ResourceInventoryTest, ClaimReservesUntilCommit) {
    auto claim = inventory.TryClaim("wood", 4);
    ASSERT_NE(nullptr, claim);
    EXPECT_EQ("wood", claim->GetKind());
    EXPECT_EQ(4, claim->GetQuantity());

    EXPECT_EQ(10, inventory.GetCount("wood"));
    EXPECT_EQ(4, inventory.GetReserved("wood"));
    EXPECT_EQ(6, inventory.GetAvailableCount("wood"));

    EXPECT_TRUE(claim->TryCommit());
    EXPECT_EQ(6, inventory.GetCount("wood"));
    EXPECT_EQ(0, inventory.GetReserved("wood"));

    // A resolved claim stays resolved
    EXPECT_FALSE(claim->TryCommit());
    claim->Cancel();
    EXPECT_EQ(6, inventory.GetCount("wood"));

    std::vector<std::string> expected{"Claimed wood 4", "Committed wood 4"};
    EXPECT_EQ(expected, events);
}

TEST_F(ResourceInventoryTest, CancelReleasesReservation) {
    auto claim = inventory.TryClaim("wood", 10);
    ASSERT_NE(nullptr, claim);
    EXPECT_EQ(nullptr, inventory.TryClaim("wood", 1));

    claim->Cancel();
    EXPECT_EQ(10, inventory.GetAvailableCount("wood"));
    EXPECT_FALSE(claim->TryCommit());
}

TEST_F(ResourceInventoryTest, DroppedClaimIsCancelled) {
    {
        auto claim = inventory.TryClaim("wood", 3);
        ASSERT_NE(nullptr, claim);
        EXPECT_EQ(7, inventory.GetAvailableCount("wood"));
    }
    EXPECT_EQ(10, inventory.GetAvailableCount("wood"));
    EXPECT_EQ("Cancelled wood 3", events.back());
}

TEST_F(ResourceInventoryTest, ClaimBeyondAvailableFails) {
    EXPECT_EQ(nullptr, inventory.TryClaim("wood", 11));
    EXPECT_EQ(nullptr, inventory.TryClaim("stone", 1));
    EXPECT_TRUE(events.empty());
}

TEST_F(ResourceInventoryTest, NonPositiveClaimThrows) {
    EXPECT_THROW(inventory.TryClaim("wood", 0), std::invalid_argument);
    EXPECT_THROW(inventory.TryClaim("wood", -2), std::invalid_argument);
}

TEST_F(ResourceInventoryTest, ClaimOutlivingInventory) {
    std::unique_ptr<IResourceClaim> claim;
    {
        ResourceInventory shortLived;
        shortLived.ForceSet("wood", 5);
        claim = shortLived.TryClaim("wood", 2);
        ASSERT_NE(nullptr, claim);
    }
    EXPECT_FALSE(claim->TryCommit());
    EXPECT_NO_THROW(claim->Cancel());
}

// =============================================================================
// Capacity
// =============================================================================

TEST_F(ResourceInventoryTest, PutRespectsCapacity) {
    inventory.SetCapacity("wood", 12);

    EXPECT_TRUE(inventory.CanPut("wood", 2));
    EXPECT_FALSE(inventory.CanPut("wood", 3));
    EXPECT_FALSE(inventory.TryPut("wood", 3));
    EXPECT_TRUE(inventory.TryPut("wood", 2));
    EXPECT_EQ(12, inventory.GetCount("wood"));

    EXPECT_FALSE(inventory.CanPut("wood", -1));
    EXPECT_TRUE(inventory.TryPut("wood", 0));
}

TEST_F(ResourceInventoryTest, UnknownKindsAreUnlimited) {
    EXPECT_EQ(-1, inventory.GetCapacity("stone"));
    EXPECT_TRUE(inventory.TryPut("stone", 1000));
    EXPECT_EQ(1000, inventory.GetAvailableCount("stone"));

    inventory.SetCapacity("stone", -5);
    EXPECT_EQ(-1, inventory.GetCapacity("stone"));
}

// =============================================================================
// Memento
// =============================================================================

TEST_F(ResourceInventoryTest, PackAndRestore) {
    inventory.SetCapacity("wood", 50);
    inventory.ForceSet("stone", 3);
    json memento = inventory.Pack();

    EXPECT_EQ(50, memento["wood"]["capacity"].get<int64_t>());
    EXPECT_FALSE(memento["stone"].contains("capacity"));

    ResourceInventory restored;
    ASSERT_TRUE(restored.Unpack(memento));
    EXPECT_EQ(10, restored.GetCount("wood"));
    EXPECT_EQ(50, restored.GetCapacity("wood"));
    EXPECT_EQ(3, restored.GetCount("stone"));
}

TEST_F(ResourceInventoryTest, RestoreKeepsReservations) {
    auto claim = inventory.TryClaim("wood", 4);
    ASSERT_NE(nullptr, claim);

    ASSERT_TRUE(inventory.Unpack(json{{"wood", {{"count", 20}}}}));
    EXPECT_EQ(20, inventory.GetCount("wood"));
    EXPECT_EQ(16, inventory.GetAvailableCount("wood"));

    EXPECT_TRUE(claim->TryCommit());
    EXPECT_EQ(16, inventory.GetCount("wood"));
}

TEST_F(ResourceInventoryTest, MalformedMementoLeavesStockUntouched) {
    EXPECT_FALSE(inventory.Unpack(json::array()));
    EXPECT_FALSE(inventory.Unpack(json{{"wood", {{"amount", 1}}}}));
    EXPECT_EQ(10, inventory.GetCount("wood"));
}
