#pragma once

/**
 * @file ResourceInventory.hpp
 * @brief In-memory resource ledger with claims and optional capacities
 */

#include "building/ResourceLedger.hpp"
#include "core/json_config.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>

namespace Lodestone {
namespace Building {

/**
 * @brief Ledger events
 */
enum class ResourcePhase : uint8_t {
    Claimed,
    Committed,
    Cancelled,
    Put
};

inline const char* ResourcePhaseToString(ResourcePhase phase) {
    switch (phase) {
        case ResourcePhase::Claimed:   return "Claimed";
        case ResourcePhase::Committed: return "Committed";
        case ResourcePhase::Cancelled: return "Cancelled";
        case ResourcePhase::Put:       return "Put";
        default:                       return "Unknown";
    }
}

class ResourceInventory : public IResourceLedger {
public:
    using ModifiedCallback = std::function<void(ResourcePhase phase, const std::string& kind, int64_t quantity)>;

    ResourceInventory();
    ~ResourceInventory() override;

    // Non-copyable: outstanding claims point back at the inventory
    ResourceInventory(const ResourceInventory&) = delete;
    ResourceInventory& operator=(const ResourceInventory&) = delete;

    // =========================================================================
    // IResourceLedger
    // =========================================================================

    [[nodiscard]] int64_t GetAvailableCount(const std::string& kind) const override;

    /**
     * @throws std::invalid_argument if @p quantity is below 1
     */
    std::unique_ptr<IResourceClaim> TryClaim(const std::string& kind, int64_t quantity) override;

    bool TryPut(const std::string& kind, int64_t quantity) override;
    [[nodiscard]] bool CanPut(const std::string& kind, int64_t quantity) const override;

    // =========================================================================
    // Stock
    // =========================================================================

    /**
     * @brief Overwrite the stored count, ignoring capacity and reservations
     */
    void ForceSet(const std::string& kind, int64_t count);

    /**
     * @brief Stored count including reserved quantities
     */
    [[nodiscard]] int64_t GetCount(const std::string& kind) const;
    [[nodiscard]] int64_t GetReserved(const std::string& kind) const;

    /**
     * @brief Maximum stored count, or -1 for unlimited
     */
    void SetCapacity(const std::string& kind, int64_t capacity);
    [[nodiscard]] int64_t GetCapacity(const std::string& kind) const;

    void SetOnModified(ModifiedCallback callback) { m_onModified = std::move(callback); }

    // =========================================================================
    // Memento
    // =========================================================================

    /**
     * @brief Counts and capacities as JSON; reservations are not stored
     */
    [[nodiscard]] json Pack() const;

    /**
     * @brief Replace counts and capacities from JSON produced by Pack()
     * @return false if the document is malformed
     */
    bool Unpack(const json& memento);

private:
    class Claim;

    struct Entry {
        int64_t count = 0;
        int64_t reserved = 0;
        int64_t capacity = -1;
    };

    void Notify(ResourcePhase phase, const std::string& kind, int64_t quantity);

    // Claims hold this so they can tell whether the inventory is still alive
    std::shared_ptr<std::map<std::string, Entry>> m_entries;
    ModifiedCallback m_onModified;
};

} // namespace Building
} // namespace Lodestone
