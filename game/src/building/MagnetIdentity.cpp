#include "building/MagnetIdentity.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace Lodestone {
namespace Building {

MagnetShape MagnetShapeFromString(const std::string& name) {
    if (name == "point")   return MagnetShape::Point;
    if (name == "line")    return MagnetShape::Line;
    if (name == "surface") return MagnetShape::Surface;
    if (name == "volume")  return MagnetShape::Volume;
    return MagnetShape::Nothing;
}

const char* MagnetShapeToString(MagnetShape shape) {
    switch (shape) {
        case MagnetShape::Nothing: return "nothing";
        case MagnetShape::Point:   return "point";
        case MagnetShape::Line:    return "line";
        case MagnetShape::Surface: return "surface";
        case MagnetShape::Volume:  return "volume";
        default:                   return "mixed";
    }
}

// ============================================================================
// IdentitySet
// ============================================================================

IdentitySet::IdentitySet(std::initializer_list<MagnetIdentity> identities) {
    for (MagnetIdentity identity : identities) {
        Insert(identity);
    }
}

void IdentitySet::Insert(MagnetIdentity identity) {
    auto it = std::lower_bound(m_items.begin(), m_items.end(), identity);
    if (it == m_items.end() || *it != identity) {
        m_items.insert(it, identity);
    }
}

void IdentitySet::Union(const IdentitySet& other) {
    std::vector<MagnetIdentity> merged;
    merged.reserve(m_items.size() + other.m_items.size());
    std::set_union(m_items.begin(), m_items.end(),
                   other.m_items.begin(), other.m_items.end(),
                   std::back_inserter(merged));
    m_items = std::move(merged);
}

bool IdentitySet::Contains(MagnetIdentity identity) const {
    return std::binary_search(m_items.begin(), m_items.end(), identity);
}

bool IdentitySet::Overlaps(const IdentitySet& other) const {
    auto a = m_items.begin();
    auto b = other.m_items.begin();
    while (a != m_items.end() && b != other.m_items.end()) {
        if (*a < *b) {
            ++a;
        } else if (*b < *a) {
            ++b;
        } else {
            return true;
        }
    }
    return false;
}

// ============================================================================
// MagnetIdentityRegistry
// ============================================================================

MagnetIdentity MagnetIdentityRegistry::Intern(const std::string& name,
                                              const std::string& description,
                                              MagnetShape shape) {
    auto it = m_byName.find(name);
    if (it != m_byName.end()) {
        return it->second;
    }

    MagnetIdentityInfo info;
    info.name = name;
    info.description = description;
    info.shape = shape;
    m_infos.push_back(std::move(info));

    MagnetIdentity identity(static_cast<uint32_t>(m_infos.size()));
    m_byName.emplace(name, identity);
    return identity;
}

std::optional<MagnetIdentity> MagnetIdentityRegistry::Find(const std::string& name) const {
    auto it = m_byName.find(name);
    if (it == m_byName.end()) {
        return std::nullopt;
    }
    return it->second;
}

IdentitySet MagnetIdentityRegistry::Resolve(const std::vector<std::string>& names) const {
    IdentitySet set;
    for (const auto& name : names) {
        auto identity = Find(name);
        if (!identity) {
            throw std::runtime_error("Unknown magnet identity: " + name);
        }
        set.Insert(*identity);
    }
    return set;
}

const MagnetIdentityInfo* MagnetIdentityRegistry::GetInfo(MagnetIdentity identity) const {
    if (!identity.IsValid() || identity.GetValue() > m_infos.size()) {
        return nullptr;
    }
    return &m_infos[identity.GetValue() - 1];
}

std::string MagnetIdentityRegistry::GetName(MagnetIdentity identity) const {
    const MagnetIdentityInfo* info = GetInfo(identity);
    return info ? info->name : std::string();
}

void MagnetIdentityRegistry::Clear() {
    m_infos.clear();
    m_byName.clear();
}

} // namespace Building
} // namespace Lodestone
