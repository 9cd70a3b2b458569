#include "building/ResourceInventory.hpp"
#include "core/Logger.hpp"

#include <stdexcept>

namespace Lodestone {
namespace Building {

// ============================================================================
// Claim
// ============================================================================

class ResourceInventory::Claim : public IResourceClaim {
public:
    Claim(ResourceInventory* owner, std::string kind, int64_t quantity)
        : m_owner(owner)
        , m_entries(owner->m_entries)
        , m_kind(std::move(kind))
        , m_quantity(quantity) {}

    ~Claim() override {
        if (m_pending) {
            Cancel();
        }
    }

    bool TryCommit() override {
        if (!m_pending) {
            return false;
        }
        auto entries = m_entries.lock();
        if (!entries) {
            m_pending = false;
            return false;
        }

        Entry& entry = (*entries)[m_kind];
        entry.reserved -= m_quantity;
        entry.count -= m_quantity;
        m_pending = false;
        m_owner->Notify(ResourcePhase::Committed, m_kind, m_quantity);
        return true;
    }

    void Cancel() override {
        if (!m_pending) {
            return;
        }
        m_pending = false;
        auto entries = m_entries.lock();
        if (!entries) {
            return;
        }

        (*entries)[m_kind].reserved -= m_quantity;
        m_owner->Notify(ResourcePhase::Cancelled, m_kind, m_quantity);
    }

    [[nodiscard]] const std::string& GetKind() const override { return m_kind; }
    [[nodiscard]] int64_t GetQuantity() const override { return m_quantity; }

private:
    ResourceInventory* m_owner;
    std::weak_ptr<std::map<std::string, Entry>> m_entries;
    std::string m_kind;
    int64_t m_quantity;
    bool m_pending = true;
};

// ============================================================================
// ResourceInventory
// ============================================================================

ResourceInventory::ResourceInventory()
    : m_entries(std::make_shared<std::map<std::string, Entry>>()) {
}

ResourceInventory::~ResourceInventory() = default;

int64_t ResourceInventory::GetAvailableCount(const std::string& kind) const {
    auto it = m_entries->find(kind);
    if (it == m_entries->end()) {
        return 0;
    }
    return it->second.count - it->second.reserved;
}

std::unique_ptr<IResourceClaim> ResourceInventory::TryClaim(const std::string& kind, int64_t quantity) {
    if (quantity < 1) {
        throw std::invalid_argument("Claim quantity must be at least 1, got " + std::to_string(quantity));
    }

    if (GetAvailableCount(kind) < quantity) {
        return nullptr;
    }

    (*m_entries)[kind].reserved += quantity;
    Notify(ResourcePhase::Claimed, kind, quantity);
    return std::make_unique<Claim>(this, kind, quantity);
}

bool ResourceInventory::TryPut(const std::string& kind, int64_t quantity) {
    if (!CanPut(kind, quantity)) {
        return false;
    }
    if (quantity == 0) {
        return true;
    }

    (*m_entries)[kind].count += quantity;
    Notify(ResourcePhase::Put, kind, quantity);
    return true;
}

bool ResourceInventory::CanPut(const std::string& kind, int64_t quantity) const {
    if (quantity < 0) {
        return false;
    }
    auto it = m_entries->find(kind);
    if (it == m_entries->end() || it->second.capacity < 0) {
        return true;
    }
    return it->second.count + quantity <= it->second.capacity;
}

void ResourceInventory::ForceSet(const std::string& kind, int64_t count) {
    (*m_entries)[kind].count = count;
}

int64_t ResourceInventory::GetCount(const std::string& kind) const {
    auto it = m_entries->find(kind);
    return it != m_entries->end() ? it->second.count : 0;
}

int64_t ResourceInventory::GetReserved(const std::string& kind) const {
    auto it = m_entries->find(kind);
    return it != m_entries->end() ? it->second.reserved : 0;
}

void ResourceInventory::SetCapacity(const std::string& kind, int64_t capacity) {
    (*m_entries)[kind].capacity = capacity < 0 ? -1 : capacity;
}

int64_t ResourceInventory::GetCapacity(const std::string& kind) const {
    auto it = m_entries->find(kind);
    return it != m_entries->end() ? it->second.capacity : -1;
}

void ResourceInventory::Notify(ResourcePhase phase, const std::string& kind, int64_t quantity) {
    LODESTONE_LOG_TRACE("Inventory {} {} x{}", ResourcePhaseToString(phase), kind, quantity);
    if (m_onModified) {
        m_onModified(phase, kind, quantity);
    }
}

// ============================================================================
// Memento
// ============================================================================

json ResourceInventory::Pack() const {
    json memento = json::object();
    for (const auto& [kind, entry] : *m_entries) {
        json item;
        item["count"] = entry.count;
        if (entry.capacity >= 0) {
            item["capacity"] = entry.capacity;
        }
        memento[kind] = item;
    }
    return memento;
}

bool ResourceInventory::Unpack(const json& memento) {
    if (!memento.is_object()) {
        LODESTONE_LOG_ERROR("Inventory memento is not a JSON object");
        return false;
    }

    std::map<std::string, Entry> restored;
    try {
        for (auto& [kind, item] : memento.items()) {
            Entry entry;
            entry.count = item.at("count").get<int64_t>();
            entry.capacity = item.value("capacity", int64_t{-1});
            restored[kind] = entry;
        }
    } catch (const json::exception& e) {
        LODESTONE_LOG_ERROR("Failed to unpack inventory: {}", e.what());
        return false;
    }

    // Outstanding reservations survive a restore
    for (const auto& [kind, entry] : *m_entries) {
        if (entry.reserved > 0) {
            restored[kind].reserved = entry.reserved;
        }
    }
    *m_entries = std::move(restored);
    return true;
}

} // namespace Building
} // namespace Lodestone
