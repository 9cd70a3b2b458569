/**
 * @file MockBuildServices.hpp
 * @brief Mock implementations of the services the Builder depends on
 */

#pragma once

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "building/BuilderView.hpp"
#include "building/ResourceLedger.hpp"

#include <memory>
#include <string>

namespace Lodestone {
namespace Test {

// =============================================================================
// MockResourceClaim
// =============================================================================

class MockResourceClaim : public Building::IResourceClaim {
public:
    MOCK_METHOD(bool, TryCommit, (), (override));
    MOCK_METHOD(void, Cancel, (), (override));
    MOCK_METHOD(const std::string&, GetKind, (), (const, override));
    MOCK_METHOD(int64_t, GetQuantity, (), (const, override));
};

// =============================================================================
// MockResourceLedger
// =============================================================================

/**
 * @brief Ledger double for verifying the claim and refund protocol
 *
 * TryClaim is forwarded to ClaimRaw so expectations can hand out
 * MockResourceClaim instances the test keeps observing.
 */
class MockResourceLedger : public Building::IResourceLedger {
public:
    MOCK_METHOD(int64_t, GetAvailableCount, (const std::string& kind), (const, override));
    MOCK_METHOD(bool, TryPut, (const std::string& kind, int64_t quantity), (override));
    MOCK_METHOD(bool, CanPut, (const std::string& kind, int64_t quantity), (const, override));
    MOCK_METHOD(Building::IResourceClaim*, ClaimRaw, (const std::string& kind, int64_t quantity));

    std::unique_ptr<Building::IResourceClaim> TryClaim(const std::string& kind, int64_t quantity) override {
        return std::unique_ptr<Building::IResourceClaim>(ClaimRaw(kind, quantity));
    }
};

// =============================================================================
// MockBuilderView
// =============================================================================

class MockBuilderView : public Building::IBuilderView {
public:
    MOCK_METHOD(glm::vec3, GetCameraPosition, (), (const, override));
    MOCK_METHOD(glm::vec3, WorldToViewport, (const glm::vec3& worldPoint), (const, override));
    MOCK_METHOD(void, SetMovementLocked, (bool locked), (override));
};

} // namespace Test
} // namespace Lodestone
