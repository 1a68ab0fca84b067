/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PersistenceService.hpp"
#include <cmath>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>

namespace typolab::infrastructure {

TaxonomySettings ConfigLoader::Load(const std::string& configPath) {
    TaxonomySettings settings;
    if (!std::filesystem::exists(configPath)) {
        return settings;
    }

    nlohmann::json j;
    try {
        std::ifstream f(configPath);
        f >> j;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << configPath << ": " << e.what() << std::endl;
        return settings;
    }
    if (!j.is_object()) {
        std::cerr << "[ConfigLoader] " << configPath << " is not a JSON object; using defaults" << std::endl;
        return settings;
    }

    if (j.contains("tolerance_factor") && j["tolerance_factor"].is_number()) {
        double v = j["tolerance_factor"].get<double>();
        if (std::isfinite(v) && v > 0.0) settings.toleranceFactor = v;
        else std::cerr << "[ConfigLoader] Ignoring tolerance_factor " << v << std::endl;
    }
    if (j.contains("confidence_threshold") && j["confidence_threshold"].is_number()) {
        double v = j["confidence_threshold"].get<double>();
        if (v > 0.0 && v <= 1.0) settings.confidenceThreshold = v;
        else std::cerr << "[ConfigLoader] Ignoring confidence_threshold " << v << std::endl;
    }
    if (j.contains("min_cluster_size") && j["min_cluster_size"].is_number_unsigned()) {
        settings.minClusterSize = j["min_cluster_size"].get<std::size_t>();
    }
    if (j.contains("operator") && j["operator"].is_string()) {
        settings.operatorName = j["operator"].get<std::string>();
    }
    if (j.contains("technological_keys") && j["technological_keys"].is_array()) {
        std::set<std::string> keys;
        for (const auto& key : j["technological_keys"]) {
            if (key.is_string()) keys.insert(key.get<std::string>());
        }
        settings.technologicalKeys = std::move(keys);
    }

    return settings;
}

bool ConfigLoader::Save(const std::string& configPath, const TaxonomySettings& settings) {
    nlohmann::json j = nlohmann::json::object();

    // Try to load existing to preserve other settings
    if (std::filesystem::exists(configPath)) {
        try {
            std::ifstream f(configPath);
            f >> j;
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[ConfigLoader] Overwriting unreadable " << configPath << ": " << e.what() << std::endl;
            j = nlohmann::json::object();
        }
        if (!j.is_object()) j = nlohmann::json::object();
    }

    j["tolerance_factor"] = settings.toleranceFactor;
    j["confidence_threshold"] = settings.confidenceThreshold;
    j["min_cluster_size"] = settings.minClusterSize;
    j["operator"] = settings.operatorName;
    j["technological_keys"] = settings.technologicalKeys;

    try {
        PersistenceService persistence;
        persistence.saveText(configPath, j.dump(4));
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error writing " << configPath << ": " << e.what() << std::endl;
        return false;
    }
    return true;
}

} // namespace typolab::infrastructure
