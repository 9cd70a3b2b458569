#pragma once

#include "core/json_config.hpp"

#include <string>
#include <filesystem>
#include <type_traits>
#include <glm/glm.hpp>

namespace Lodestone {

/**
 * @brief JSON-based configuration store
 *
 * Values are addressed by dot-separated key paths ("builder.max_build_range").
 * glm vectors are stored as JSON arrays.
 */
class Config {
public:
    static Config& Instance();

    // Delete copy/move for singleton
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    /**
     * @brief Load configuration from JSON file
     *
     * A missing file is created with defaults first.
     * @return true if loaded successfully
     */
    bool Load(const std::filesystem::path& filepath);

    /**
     * @brief Replace the configuration with the given JSON text
     * @return true if the text parsed as a JSON object
     */
    bool LoadFromString(const std::string& text);

    /**
     * @brief Save current configuration to JSON file
     * @param filepath Path to save to (uses loaded path if empty)
     */
    bool Save(const std::filesystem::path& filepath = "");

    /**
     * @brief Reload configuration from disk
     */
    bool Reload();

    /**
     * @brief Get a configuration value with type safety
     * @param key Dot-separated key path
     * @param defaultValue Value to return if key not found or of the wrong type
     */
    template<typename T>
    T Get(const std::string& key, const T& defaultValue = T{}) const;

    /**
     * @brief Set a configuration value, creating intermediate objects
     */
    template<typename T>
    void Set(const std::string& key, const T& value);

    [[nodiscard]] bool Has(const std::string& key) const;

    /**
     * @brief Drop all values
     */
    void Clear();

    /**
     * @brief Get the underlying JSON object for direct access
     */
    [[nodiscard]] const json& GetJson() const { return m_data; }

    /**
     * @brief Build the default configuration document
     */
    static json CreateDefaultJson();

    /**
     * @brief Create default configuration file
     */
    static bool CreateDefault(const std::filesystem::path& filepath);

private:
    Config() = default;
    ~Config() = default;

    json m_data = json::object();
    std::filesystem::path m_filepath;

    json* NavigateToKey(const std::string& key, bool create);
    const json* NavigateToKey(const std::string& key) const;
};

// Template implementations
template<typename T>
T Config::Get(const std::string& key, const T& defaultValue) const {
    const auto* node = NavigateToKey(key);
    if (!node || node->is_null()) {
        return defaultValue;
    }

    try {
        if constexpr (std::is_same_v<T, glm::vec2>) {
            return JsonToVec2(*node, defaultValue);
        } else if constexpr (std::is_same_v<T, glm::vec3>) {
            return JsonToVec3(*node, defaultValue);
        } else if constexpr (std::is_same_v<T, glm::vec4>) {
            return JsonToVec4(*node, defaultValue);
        } else {
            return node->get<T>();
        }
    } catch (const json::exception&) {
        return defaultValue;
    }
}

template<typename T>
void Config::Set(const std::string& key, const T& value) {
    auto* node = NavigateToKey(key, true);
    if (node) {
        if constexpr (std::is_same_v<T, glm::vec2>) {
            *node = json::array({value.x, value.y});
        } else if constexpr (std::is_same_v<T, glm::vec3>) {
            *node = json::array({value.x, value.y, value.z});
        } else if constexpr (std::is_same_v<T, glm::vec4>) {
            *node = json::array({value.x, value.y, value.z, value.w});
        } else {
            *node = value;
        }
    }
}

} // namespace Lodestone
