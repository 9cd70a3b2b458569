#pragma once

/**
 * @file ResourceLedger.hpp
 * @brief Interfaces through which the builder pays for and refunds placements
 *
 * Costs are applied transactionally: every line item is claimed first and
 * only committed once all claims succeeded.
 */

#include <cstdint>
#include <memory>
#include <string>

namespace Lodestone {
namespace Building {

/**
 * @brief A reservation of resources that is either committed or cancelled
 */
class IResourceClaim {
public:
    virtual ~IResourceClaim() = default;

    /**
     * @brief Make the reservation permanent
     * @return false if the claim was already resolved
     */
    virtual bool TryCommit() = 0;

    /**
     * @brief Release the reservation
     */
    virtual void Cancel() = 0;

    [[nodiscard]] virtual const std::string& GetKind() const = 0;
    [[nodiscard]] virtual int64_t GetQuantity() const = 0;
};

class IResourceLedger {
public:
    virtual ~IResourceLedger() = default;

    /**
     * @brief Quantity of @p kind that can currently be claimed
     */
    [[nodiscard]] virtual int64_t GetAvailableCount(const std::string& kind) const = 0;

    /**
     * @brief Reserve @p quantity of @p kind
     * @return The claim, or nullptr if not enough is available
     */
    virtual std::unique_ptr<IResourceClaim> TryClaim(const std::string& kind, int64_t quantity) = 0;

    /**
     * @brief Add resources, e.g. a refund
     */
    virtual bool TryPut(const std::string& kind, int64_t quantity) = 0;

    [[nodiscard]] virtual bool CanPut(const std::string& kind, int64_t quantity) const = 0;
};

} // namespace Building
} // namespace Lodestone
