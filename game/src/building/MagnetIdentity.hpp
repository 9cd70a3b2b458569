#pragma once

/**
 * @file MagnetIdentity.hpp
 * @brief Interned identity tokens used to pair magnets
 *
 * Magnets never compare names. They carry sets of tokens and two magnets
 * pair up when the right sets overlap. Tokens are issued by a registry so
 * that equal names always map to the same token.
 */

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Lodestone {
namespace Building {

// ============================================================================
// Identity Token
// ============================================================================

class MagnetIdentity {
public:
    constexpr MagnetIdentity() = default;
    constexpr explicit MagnetIdentity(uint32_t value) : m_value(value) {}

    [[nodiscard]] constexpr uint32_t GetValue() const { return m_value; }
    [[nodiscard]] constexpr bool IsValid() const { return m_value != 0; }

    constexpr bool operator==(const MagnetIdentity& other) const { return m_value == other.m_value; }
    constexpr bool operator!=(const MagnetIdentity& other) const { return m_value != other.m_value; }
    constexpr bool operator<(const MagnetIdentity& other) const { return m_value < other.m_value; }

private:
    uint32_t m_value = 0;
};

// ============================================================================
// Shape Hint
// ============================================================================

/**
 * @brief Authoring hint describing what a magnet represents
 *
 * Shapes never take part in matching.
 */
enum class MagnetShape : uint8_t {
    Nothing = 0,
    Point   = 1 << 0,   ///< A single location
    Line    = 1 << 1,   ///< An edge
    Surface = 1 << 2,   ///< A face
    Volume  = 1 << 3    ///< A solid region
};

inline MagnetShape operator|(MagnetShape a, MagnetShape b) {
    return static_cast<MagnetShape>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

inline MagnetShape operator&(MagnetShape a, MagnetShape b) {
    return static_cast<MagnetShape>(static_cast<uint8_t>(a) & static_cast<uint8_t>(b));
}

inline bool HasShape(MagnetShape flags, MagnetShape shape) {
    return (flags & shape) != MagnetShape::Nothing;
}

/**
 * @brief Parse a shape name ("point", "line", "surface", "volume")
 */
MagnetShape MagnetShapeFromString(const std::string& name);

const char* MagnetShapeToString(MagnetShape shape);

// ============================================================================
// Identity Set
// ============================================================================

/**
 * @brief Sorted, duplicate-free set of identity tokens
 *
 * Iteration is in ascending token order.
 */
class IdentitySet {
public:
    using const_iterator = std::vector<MagnetIdentity>::const_iterator;

    IdentitySet() = default;
    IdentitySet(std::initializer_list<MagnetIdentity> identities);

    void Insert(MagnetIdentity identity);

    /**
     * @brief Add every token of @p other to this set
     */
    void Union(const IdentitySet& other);

    [[nodiscard]] bool Contains(MagnetIdentity identity) const;

    /**
     * @brief True if the two sets share at least one token
     */
    [[nodiscard]] bool Overlaps(const IdentitySet& other) const;

    [[nodiscard]] bool Empty() const { return m_items.empty(); }
    [[nodiscard]] size_t Size() const { return m_items.size(); }
    void Clear() { m_items.clear(); }

    [[nodiscard]] const_iterator begin() const { return m_items.begin(); }
    [[nodiscard]] const_iterator end() const { return m_items.end(); }

    bool operator==(const IdentitySet& other) const { return m_items == other.m_items; }

private:
    std::vector<MagnetIdentity> m_items;
};

// ============================================================================
// Identity Registry
// ============================================================================

struct MagnetIdentityInfo {
    std::string name;
    std::string description;
    MagnetShape shape = MagnetShape::Point;
};

/**
 * @brief Issues identity tokens for names
 *
 * Tokens are numbered from 1 in the order names are first interned.
 */
class MagnetIdentityRegistry {
public:
    /**
     * @brief Token for @p name, creating it on first use
     *
     * Description and shape are recorded only when the token is created.
     */
    MagnetIdentity Intern(const std::string& name,
                          const std::string& description = "",
                          MagnetShape shape = MagnetShape::Point);

    [[nodiscard]] std::optional<MagnetIdentity> Find(const std::string& name) const;

    /**
     * @brief Build a set from names that must all be registered
     * @throws std::runtime_error naming the first unknown identity
     */
    [[nodiscard]] IdentitySet Resolve(const std::vector<std::string>& names) const;

    [[nodiscard]] const MagnetIdentityInfo* GetInfo(MagnetIdentity identity) const;
    [[nodiscard]] std::string GetName(MagnetIdentity identity) const;

    [[nodiscard]] size_t GetCount() const { return m_infos.size(); }
    void Clear();

private:
    std::vector<MagnetIdentityInfo> m_infos;
    std::unordered_map<std::string, MagnetIdentity> m_byName;
};

} // namespace Building
} // namespace Lodestone
