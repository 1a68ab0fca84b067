/**
 * @file TaxonomyEvents.hpp
 * @brief Audit records kept by the taxonomy registry.
 */

#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace typolab::domain::taxonomy {

/**
 * @struct ParameterChange
 * @brief Field edits for one existing parameter. Unset fields keep their value.
 */
struct ParameterChange {
    std::optional<double> targetValue;
    std::optional<double> minThreshold;
    std::optional<double> maxThreshold;
    std::optional<double> tolerance;
    std::optional<double> weight;

    bool empty() const {
        return !targetValue && !minThreshold && !maxThreshold && !tolerance && !weight;
    }
};

/**
 * @struct ParameterChangeSet
 * @brief Everything a Modify request may edit.
 *
 * `gates` maps a feature to its new required value, or to nullopt to drop the gate.
 */
struct ParameterChangeSet {
    std::map<std::string, ParameterChange> parameters;
    std::map<std::string, std::optional<bool>> gates;

    bool empty() const { return parameters.empty() && gates.empty(); }
};

/**
 * @struct ClassModified
 * @brief Change record linking a class to the version that supersedes it.
 */
struct ClassModified {
    static constexpr const char* Type = "ClassModified";
    std::string fromClassId;
    std::string toClassId;
    std::string fromHash;
    std::string toHash;
    ParameterChangeSet changes;
    std::string justification;
    std::string operatorName;
    std::chrono::system_clock::time_point timestamp;
};

/**
 * @struct ClassificationLogged
 * @brief One registry classification, recorded for audit.
 */
struct ClassificationLogged {
    static constexpr const char* Type = "ClassificationLogged";
    std::chrono::system_clock::time_point timestamp;
    std::string artifactId;
    std::optional<std::string> bestClassId;
    double confidence = 0.0;
};

} // namespace typolab::domain::taxonomy
