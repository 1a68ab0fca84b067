/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving taxonomy settings (settings.json).
 *
 * Provides a unified way to access engine defaults like the tolerance factor
 * without scattering JSON parsing logic throughout the codebase.
 */

#pragma once

#include <cstddef>
#include <set>
#include <string>

namespace typolab::infrastructure {

/**
 * @struct TaxonomySettings
 * @brief Engine defaults; every field can be overridden in settings.json.
 */
struct TaxonomySettings {
    double toleranceFactor = 0.15;
    double confidenceThreshold = 0.75;
    std::size_t minClusterSize = 5;
    std::string operatorName;
    std::set<std::string> technologicalKeys = {"socket_depth", "socket_diameter", "edge_angle", "hammering_index"};
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings from a JSON file.
     * @param configPath Path to settings.json.
     * @return Defaults for a missing file, unreadable file, or any invalid key.
     */
    static TaxonomySettings Load(const std::string& configPath);

    /**
     * @brief Saves settings, preserving unrelated keys already in the file.
     * @return false when the file could not be written.
     */
    static bool Save(const std::string& configPath, const TaxonomySettings& settings);
};

} // namespace typolab::infrastructure
