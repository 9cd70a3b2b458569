#include "building/PlaceableCatalog.hpp"
#include "core/Logger.hpp"
#include "core/json_config.hpp"

#include <glm/gtc/quaternion.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace Lodestone {
namespace Building {

// ============================================================================
// Helper Functions
// ============================================================================

namespace {

std::vector<std::string> ParseStringList(const json& j, const char* key) {
    std::vector<std::string> names;
    if (j.contains(key) && j[key].is_array()) {
        for (const auto& item : j[key]) {
            names.push_back(item.get<std::string>());
        }
    }
    return names;
}

LayerMask ParseLayerMask(const json& j, const char* key, LayerMask fallback) {
    if (!j.contains(key) || !j[key].is_array()) {
        return fallback;
    }
    return MaskFromLayers(j[key].get<std::vector<int>>());
}

/**
 * @brief Pose from "position" and "rotation" (Euler angles in degrees)
 */
Pose ParsePose(const json& j) {
    Pose pose;
    if (j.contains("position")) {
        pose.position = JsonToVec3(j["position"]);
    }
    if (j.contains("rotation")) {
        pose.rotation = glm::quat(glm::radians(JsonToVec3(j["rotation"])));
    }
    return pose;
}

CostList ParseCost(const json& j) {
    CostList cost;
    if (!j.is_object()) {
        return cost;
    }
    for (auto& [key, value] : j.items()) {
        cost.push_back(ResourceCost{key, value.get<int64_t>()});
    }
    return cost;
}

MagnetSpec ParseMagnet(const json& j, const MagnetIdentityRegistry& identities) {
    MagnetSpec spec;

    if (j.contains("name")) spec.name = j["name"].get<std::string>();
    spec.localPose = ParsePose(j);

    spec.identity = identities.Resolve(ParseStringList(j, "identity"));
    spec.acceptFrom = identities.Resolve(ParseStringList(j, "acceptFrom"));
    spec.rejectFrom = identities.Resolve(ParseStringList(j, "rejectFrom"));
    spec.snapTo = identities.Resolve(ParseStringList(j, "snapTo"));

    if (j.contains("alignWith")) {
        spec.alignWith = AlignmentModeFromString(j["alignWith"].get<std::string>());
    }
    if (j.contains("rotateAxis")) {
        spec.rotateAxis = RotateAxisFromString(j["rotateAxis"].get<std::string>());
    }
    if (j.contains("triggerRadius")) spec.triggerRadius = j["triggerRadius"].get<float>();

    if (j.contains("grid") && j["grid"].is_object()) {
        const auto& grid = j["grid"];
        spec.isGrid = true;
        if (grid.contains("divisions")) {
            spec.gridDivisions = JsonToVec2(grid["divisions"], spec.gridDivisions);
        }
        if (grid.contains("halfExtents")) {
            spec.gridHalfExtents = JsonToVec3(grid["halfExtents"], spec.gridHalfExtents);
        }
        // Grids never seek
        spec.snapTo.Clear();
    }

    return spec;
}

int FindMagnetIndex(const PlaceableDefinition& def, const std::string& name) {
    for (size_t i = 0; i < def.magnets.size(); ++i) {
        if (def.magnets[i].name == name) {
            return static_cast<int>(i);
        }
    }
    throw std::runtime_error("Placeable " + def.assetId + " has no magnet named " + name);
}

PlaceableDefinition ParsePlaceable(const json& j, const MagnetIdentityRegistry& identities) {
    PlaceableDefinition def;

    if (!j.contains("assetId")) {
        throw std::runtime_error("Placeable entry without assetId");
    }
    def.assetId = j["assetId"].get<std::string>();
    def.displayName = j.value("displayName", def.assetId);
    if (j.contains("tooltip")) def.tooltip = j["tooltip"].get<std::string>();
    if (j.contains("layer")) def.layer = j["layer"].get<int>();

    if (j.contains("magnets") && j["magnets"].is_array()) {
        for (const auto& magnet : j["magnets"]) {
            def.magnets.push_back(ParseMagnet(magnet, identities));
        }
    }

    if (j.contains("connector") && j["connector"].is_object()) {
        const auto& connector = j["connector"];
        def.isConnector = true;
        if (connector.contains("startHandle")) {
            def.startHandle = FindMagnetIndex(def, connector["startHandle"].get<std::string>());
        }
        if (connector.contains("endHandle")) {
            def.endHandle = FindMagnetIndex(def, connector["endHandle"].get<std::string>());
        }
        if (connector.contains("requireConnection")) {
            def.requireConnection = connector["requireConnection"].get<bool>();
        }
        if (connector.contains("constrainToAxis")) {
            def.constrainToAxis = connector["constrainToAxis"].get<bool>();
        }
        if (connector.contains("constrainToGrid")) {
            def.constrainToGrid = connector["constrainToGrid"].get<float>();
        }
        if (connector.contains("constrainToDistance")) {
            def.constrainToDistance = JsonToVec2(connector["constrainToDistance"], def.constrainToDistance);
        }
    }

    if (j.contains("placementCost")) def.placementCost = ParseCost(j["placementCost"]);
    if (j.contains("deletionCost")) def.deletionCost = ParseCost(j["deletionCost"]);
    if (j.contains("deletionRefund")) def.deletionRefund = j["deletionRefund"].get<float>();

    if (j.contains("overlapModifier")) {
        def.overlapModifier = OverlapModifierFromString(j["overlapModifier"].get<std::string>());
    }

    if (j.contains("respectBlockers")) def.respectBlockers = j["respectBlockers"].get<bool>();
    if (j.contains("blockers") && j["blockers"].is_array()) {
        for (const auto& blocker : j["blockers"]) {
            BlockingBox box;
            box.localPose = ParsePose(blocker);
            if (blocker.contains("halfExtents")) {
                box.halfExtents = JsonToVec3(blocker["halfExtents"], box.halfExtents);
            }
            def.blockingBoxes.push_back(box);
        }
    }
    def.blockingMask = ParseLayerMask(j, "blockingLayers", def.blockingMask);
    def.groundMask = ParseLayerMask(j, "groundLayers", def.groundMask);

    if (j.contains("canFloat")) def.canFloat = j["canFloat"].get<bool>();
    if (j.contains("mustSnap")) def.mustSnap = j["mustSnap"].get<bool>();
    if (j.contains("playerPlaceable")) def.isPlayerPlaceable = j["playerPlaceable"].get<bool>();
    if (j.contains("playerDeletable")) def.isPlayerDeletable = j["playerDeletable"].get<bool>();
    if (j.contains("destroyFloatingDelay")) {
        def.destroyFloatingDelay = j["destroyFloatingDelay"].get<float>();
    }

    return def;
}

PlaceableCollection ParseCollection(const json& j) {
    PlaceableCollection collection;
    if (j.contains("name")) collection.name = j["name"].get<std::string>();
    collection.displayName = j.value("displayName", collection.name);
    if (j.contains("tooltip")) collection.tooltip = j["tooltip"].get<std::string>();

    for (const auto& assetId : ParseStringList(j, "placeables")) {
        if (collection.Contains(assetId)) {
            LODESTONE_LOG_WARN("Collection {} lists {} twice; keeping the first", collection.name, assetId);
            continue;
        }
        collection.assetIds.push_back(assetId);
    }
    return collection;
}

} // anonymous namespace

// ============================================================================
// PlaceableCollection
// ============================================================================

bool PlaceableCollection::Contains(const std::string& assetId) const {
    return std::find(assetIds.begin(), assetIds.end(), assetId) != assetIds.end();
}

// ============================================================================
// PlaceableCatalog
// ============================================================================

bool PlaceableCatalog::LoadFromFile(const std::filesystem::path& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        LODESTONE_LOG_ERROR("Failed to open catalog file: {}", filepath.string());
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    bool loaded = LoadFromString(buffer.str());
    if (loaded) {
        LODESTONE_LOG_INFO("Loaded catalog from: {}", filepath.string());
    }
    return loaded;
}

bool PlaceableCatalog::LoadFromString(const std::string& text) {
    std::vector<PlaceableDefinition> definitions;
    std::vector<PlaceableCollection> collections;

    try {
        json root = json::parse(text);
        if (!root.is_object()) {
            LODESTONE_LOG_ERROR("Catalog does not contain a JSON object");
            return false;
        }

        if (root.contains("identities") && root["identities"].is_array()) {
            for (const auto& entry : root["identities"]) {
                std::string name = entry.is_string() ? entry.get<std::string>()
                                                     : entry.at("name").get<std::string>();
                std::string description = entry.is_object() ? entry.value("description", "") : "";
                MagnetShape shape = MagnetShape::Point;
                if (entry.is_object() && entry.contains("shape")) {
                    shape = MagnetShapeFromString(entry["shape"].get<std::string>());
                }
                m_identities.Intern(name, description, shape);
            }
        }

        if (root.contains("placeables") && root["placeables"].is_array()) {
            for (const auto& entry : root["placeables"]) {
                definitions.push_back(ParsePlaceable(entry, m_identities));
            }
        }

        if (root.contains("collections") && root["collections"].is_array()) {
            for (const auto& entry : root["collections"]) {
                collections.push_back(ParseCollection(entry));
            }
        }
    } catch (const json::exception& e) {
        LODESTONE_LOG_ERROR("Failed to parse catalog: {}", e.what());
        return false;
    }

    for (auto& definition : definitions) {
        Add(std::move(definition));
    }

    for (auto& collection : collections) {
        for (const auto& assetId : collection.assetIds) {
            if (!Find(assetId)) {
                throw std::runtime_error("Collection " + collection.name +
                                         " references unknown placeable " + assetId);
            }
        }
        AddCollection(std::move(collection));
    }

    LODESTONE_LOG_DEBUG("Catalog holds {} placeables in {} collections",
                        m_order.size(), m_collections.size());
    return true;
}

const PlaceableDefinition* PlaceableCatalog::Add(PlaceableDefinition definition) {
    const std::string assetId = definition.assetId;
    auto it = m_definitions.find(assetId);
    if (it != m_definitions.end()) {
        LODESTONE_LOG_WARN("Replacing placeable definition {}", assetId);
        *it->second = std::move(definition);
        return it->second.get();
    }

    auto stored = std::make_unique<PlaceableDefinition>(std::move(definition));
    const PlaceableDefinition* result = stored.get();
    m_definitions.emplace(assetId, std::move(stored));
    m_order.push_back(assetId);
    return result;
}

void PlaceableCatalog::AddCollection(PlaceableCollection collection) {
    for (auto& existing : m_collections) {
        if (existing.name == collection.name) {
            existing = std::move(collection);
            return;
        }
    }
    m_collections.push_back(std::move(collection));
}

const PlaceableDefinition* PlaceableCatalog::Find(const std::string& assetId) const {
    auto it = m_definitions.find(assetId);
    return it != m_definitions.end() ? it->second.get() : nullptr;
}

const PlaceableCollection* PlaceableCatalog::FindCollection(const std::string& name) const {
    for (const auto& collection : m_collections) {
        if (collection.name == name) {
            return &collection;
        }
    }
    return nullptr;
}

void PlaceableCatalog::Clear() {
    m_definitions.clear();
    m_order.clear();
    m_collections.clear();
    m_identities.Clear();
}

} // namespace Building
} // namespace Lodestone
