/**
 * @file FeatureMap.hpp
 * @brief Typed measurement maps consumed by the classification engine.
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <variant>

namespace typolab::domain::taxonomy {

/**
 * @brief A single measurement: either a number or a boolean presence flag.
 */
using FeatureValue = std::variant<double, bool>;

/**
 * @brief Named measurements of one artifact. An absent key is a missing measurement.
 */
using FeatureMap = std::map<std::string, FeatureValue>;

/**
 * @struct Artifact
 * @brief A measured object: identifier plus its feature map.
 */
struct Artifact {
    std::string id;
    FeatureMap features;
};

/**
 * @brief Numeric lookup. Missing keys and boolean values yield nullopt.
 */
inline std::optional<double> GetNumber(const FeatureMap& features, const std::string& key) {
    auto it = features.find(key);
    if (it == features.end()) return std::nullopt;
    if (const double* value = std::get_if<double>(&it->second)) {
        return *value;
    }
    return std::nullopt;
}

/**
 * @brief Boolean lookup. Missing keys and numeric values yield nullopt.
 */
inline std::optional<bool> GetFlag(const FeatureMap& features, const std::string& key) {
    auto it = features.find(key);
    if (it == features.end()) return std::nullopt;
    if (const bool* value = std::get_if<bool>(&it->second)) {
        return *value;
    }
    return std::nullopt;
}

} // namespace typolab::domain::taxonomy
