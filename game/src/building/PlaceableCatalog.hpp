#pragma once

/**
 * @file PlaceableCatalog.hpp
 * @brief Loads magnet identities, placeable definitions and tool collections from JSON
 *
 * Document layout:
 * @code
 * {
 *   "identities":  [ { "name": "wall_edge", "description": "...", "shape": "line" } ],
 *   "placeables":  [ { "assetId": "wall", "magnets": [ ... ], ... } ],
 *   "collections": [ { "name": "walls", "displayName": "Walls", "placeables": ["wall"] } ]
 * }
 * @endcode
 */

#include "building/MagnetIdentity.hpp"
#include "building/PlaceableDefinition.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace Lodestone {
namespace Building {

/**
 * @brief Ordered group of placeables presented together as a toolbar tab
 */
struct PlaceableCollection {
    std::string name;
    std::string displayName;
    std::string tooltip;
    std::vector<std::string> assetIds;  ///< Presentation order, no duplicates

    [[nodiscard]] bool Contains(const std::string& assetId) const;
};

class PlaceableCatalog {
public:
    PlaceableCatalog() = default;

    // Non-copyable: definitions are handed out by pointer
    PlaceableCatalog(const PlaceableCatalog&) = delete;
    PlaceableCatalog& operator=(const PlaceableCatalog&) = delete;

    /**
     * @brief Load a catalog file, adding to what is already loaded
     * @return false if the file is missing or not valid JSON
     * @throws std::runtime_error if an entry references an unknown identity or placeable
     */
    bool LoadFromFile(const std::filesystem::path& filepath);

    /**
     * @brief Load catalog JSON text
     * @return false if the text is not valid JSON
     * @throws std::runtime_error if an entry references an unknown identity or placeable
     */
    bool LoadFromString(const std::string& text);

    /**
     * @brief Register a definition, replacing one with the same asset id
     * @return Stable pointer to the stored definition
     */
    const PlaceableDefinition* Add(PlaceableDefinition definition);

    void AddCollection(PlaceableCollection collection);

    [[nodiscard]] const PlaceableDefinition* Find(const std::string& assetId) const;
    [[nodiscard]] const PlaceableCollection* FindCollection(const std::string& name) const;

    /**
     * @brief Asset ids in load order
     */
    [[nodiscard]] const std::vector<std::string>& GetAssetIds() const { return m_order; }
    [[nodiscard]] const std::vector<PlaceableCollection>& GetCollections() const { return m_collections; }

    [[nodiscard]] MagnetIdentityRegistry& GetIdentities() { return m_identities; }
    [[nodiscard]] const MagnetIdentityRegistry& GetIdentities() const { return m_identities; }

    [[nodiscard]] size_t GetCount() const { return m_order.size(); }

    void Clear();

private:
    std::unordered_map<std::string, std::unique_ptr<PlaceableDefinition>> m_definitions;
    std::vector<std::string> m_order;
    std::vector<PlaceableCollection> m_collections;
    MagnetIdentityRegistry m_identities;
};

} // namespace Building
} // namespace Lodestone
