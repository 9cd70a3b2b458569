/**
 * @file json_config.hpp
 * @brief JSON library configuration - include this BEFORE nlohmann/json.hpp
 *
 * Keeps nlohmann::json away from the C++20 ranges machinery. Always include
 * this header instead of nlohmann/json.hpp directly.
 */

#pragma once

// These must be defined before ANY JSON headers
#define JSON_HAS_RANGES 0
#define JSON_HAS_CPP_20 0

#include <nlohmann/json.hpp>

#include <glm/glm.hpp>

namespace Lodestone {

using json = nlohmann::json;

// =============================================================================
// glm <-> JSON array helpers
// =============================================================================

/**
 * @brief Read a vec2 stored as [x, y]; returns fallback on shape mismatch
 */
inline glm::vec2 JsonToVec2(const json& j, const glm::vec2& fallback = glm::vec2(0.0f)) {
    if (j.is_array() && j.size() >= 2) {
        return glm::vec2(j[0].get<float>(), j[1].get<float>());
    }
    return fallback;
}

inline glm::vec3 JsonToVec3(const json& j, const glm::vec3& fallback = glm::vec3(0.0f)) {
    if (j.is_array() && j.size() >= 3) {
        return glm::vec3(j[0].get<float>(), j[1].get<float>(), j[2].get<float>());
    }
    return fallback;
}

inline glm::vec4 JsonToVec4(const json& j, const glm::vec4& fallback = glm::vec4(0.0f)) {
    if (j.is_array() && j.size() >= 4) {
        return glm::vec4(j[0].get<float>(), j[1].get<float>(), j[2].get<float>(), j[3].get<float>());
    }
    return fallback;
}

inline json Vec3ToJson(const glm::vec3& v) {
    return json::array({v.x, v.y, v.z});
}

} // namespace Lodestone
