// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace typolab::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();

    /** @brief <config home>/typolab/settings.json */
    static std::filesystem::path GetDefaultSettingsPath();

    /** @brief <data home>/typolab/taxonomy.json, used when no taxonomy file is given. */
    static std::filesystem::path GetDefaultTaxonomyPath();
};

} // namespace typolab::infrastructure
