#include "config/Config.hpp"
#include "core/Logger.hpp"

#include <fstream>
#include <iomanip>
#include <vector>

namespace Lodestone {

namespace {

std::vector<std::string> SplitKey(const std::string& key) {
    std::vector<std::string> parts;
    size_t start = 0;
    size_t end = 0;
    while ((end = key.find('.', start)) != std::string::npos) {
        parts.emplace_back(key.substr(start, end - start));
        start = end + 1;
    }
    parts.emplace_back(key.substr(start));
    return parts;
}

} // anonymous namespace

Config& Config::Instance() {
    static Config instance;
    return instance;
}

bool Config::Load(const std::filesystem::path& filepath) {
    m_filepath = filepath;

    if (!std::filesystem::exists(filepath)) {
        LODESTONE_LOG_WARN("Config file not found: {}. Creating default.", filepath.string());
        if (!CreateDefault(filepath)) {
            return false;
        }
    }

    try {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            LODESTONE_LOG_ERROR("Failed to open config file: {}", filepath.string());
            return false;
        }

        json parsed = json::parse(file);
        if (!parsed.is_object()) {
            LODESTONE_LOG_ERROR("Config file {} does not contain a JSON object", filepath.string());
            return false;
        }
        m_data = std::move(parsed);
        LODESTONE_LOG_INFO("Loaded configuration from: {}", filepath.string());
        return true;
    } catch (const json::exception& e) {
        LODESTONE_LOG_ERROR("Failed to parse config file: {}", e.what());
        return false;
    }
}

bool Config::LoadFromString(const std::string& text) {
    try {
        json parsed = json::parse(text);
        if (!parsed.is_object()) {
            LODESTONE_LOG_ERROR("Config text does not contain a JSON object");
            return false;
        }
        m_data = std::move(parsed);
        return true;
    } catch (const json::exception& e) {
        LODESTONE_LOG_ERROR("Failed to parse config text: {}", e.what());
        return false;
    }
}

bool Config::Save(const std::filesystem::path& filepath) {
    const auto& path = filepath.empty() ? m_filepath : filepath;
    if (path.empty()) {
        LODESTONE_LOG_WARN("No config file path set, cannot save");
        return false;
    }

    try {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }

        std::ofstream file(path);
        if (!file.is_open()) {
            LODESTONE_LOG_ERROR("Failed to open config file for writing: {}", path.string());
            return false;
        }

        file << std::setw(4) << m_data << std::endl;
        LODESTONE_LOG_INFO("Saved configuration to: {}", path.string());
        return true;
    } catch (const std::filesystem::filesystem_error& e) {
        LODESTONE_LOG_ERROR("Failed to save config file: {}", e.what());
        return false;
    }
}

bool Config::Reload() {
    if (m_filepath.empty()) {
        LODESTONE_LOG_WARN("No config file path set, cannot reload");
        return false;
    }
    return Load(m_filepath);
}

bool Config::Has(const std::string& key) const {
    return NavigateToKey(key) != nullptr;
}

void Config::Clear() {
    m_data = json::object();
    m_filepath.clear();
}

json* Config::NavigateToKey(const std::string& key, bool create) {
    json* current = &m_data;
    for (const auto& part : SplitKey(key)) {
        if (!current->is_object()) {
            if (!create) {
                return nullptr;
            }
            *current = json::object();
        }
        if (!current->contains(part)) {
            if (!create) {
                return nullptr;
            }
            (*current)[part] = json::object();
        }
        current = &(*current)[part];
    }
    return current;
}

const json* Config::NavigateToKey(const std::string& key) const {
    const json* current = &m_data;
    for (const auto& part : SplitKey(key)) {
        if (!current->is_object()) {
            return nullptr;
        }
        auto it = current->find(part);
        if (it == current->end()) {
            return nullptr;
        }
        current = &(*it);
    }
    return current;
}

json Config::CreateDefaultJson() {
    json config;

    // Logging
    config["logging"]["level"] = "info";
    config["logging"]["file"] = "";

    // Builder ranges
    config["builder"]["max_build_range"] = 40.0;
    config["builder"]["pointer_ray_radius"] = 0.2;
    config["builder"]["overlap_radius"] = 4.0;

    // Rotation
    config["builder"]["rotate_speed"] = 15.0;
    config["builder"]["angle_increment"] = 15.0;

    // Snapping
    config["builder"]["stay_snapped_when_blocked"] = true;
    config["builder"]["flip_face_alignment"] = false;
    config["builder"]["snap_bias"] = 0.0;

    // World grid
    config["builder"]["use_world_grid"] = false;
    config["builder"]["world_grid_divisions"] = {2.0, 2.0, 2.0};

    // Menu and notifications
    config["builder"]["on_placed_delay"] = 0.5;
    config["builder"]["lock_camera_in_menu"] = true;
    config["builder"]["lock_placement_in_menu"] = true;

    // Layers (bit indices)
    config["builder"]["surface_layers"] = {0, 1};
    config["builder"]["magnet_layers"] = {2};
    config["builder"]["focus_layer"] = 3;

    return config;
}

bool Config::CreateDefault(const std::filesystem::path& filepath) {
    try {
        if (filepath.has_parent_path()) {
            std::filesystem::create_directories(filepath.parent_path());
        }

        std::ofstream file(filepath);
        if (!file.is_open()) {
            LODESTONE_LOG_ERROR("Failed to create default config: {}", filepath.string());
            return false;
        }
        file << std::setw(4) << CreateDefaultJson() << std::endl;
        LODESTONE_LOG_INFO("Created default configuration: {}", filepath.string());
        return true;
    } catch (const std::filesystem::filesystem_error& e) {
        LODESTONE_LOG_ERROR("Failed to create default config: {}", e.what());
        return false;
    }
}

} // namespace Lodestone
