/**
 * @file ClassBuilder.hpp
 * @brief Derives class definitions statistically from reference groups.
 */

#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "domain/taxonomy/ClassDefinition.hpp"
#include "domain/taxonomy/FeatureMap.hpp"

namespace typolab::application::taxonomy {

using namespace typolab::domain::taxonomy;

/**
 * @struct BuilderOptions
 * @brief Metadata and overrides for a derived class.
 */
struct BuilderOptions {
    std::optional<std::string> classId;        ///< Defaults to TYPE_<NAME>.
    std::optional<std::string> description;    ///< Defaults to "Class defined from N reference objects".
    std::string createdBy = "system";
    double confidenceThreshold = ClassDefinition::DefaultConfidenceThreshold;
    std::string unit = "mm";
    std::set<std::string> technologicalKeys = DefaultTechnologicalKeys();

    /** @brief Manufacture-related feature names scored in the technological namespace. */
    static std::set<std::string> DefaultTechnologicalKeys() {
        return {"socket_depth", "socket_diameter", "edge_angle", "hammering_index"};
    }
};

/**
 * @class ClassBuilder
 * @brief Turns a group of measured reference artifacts into a ClassDefinition.
 */
class ClassBuilder {
public:
    static constexpr double DefaultToleranceFactor = 0.15;

    /**
     * @brief Builds a class whose range is exactly as permissive as its evidence.
     *
     * Numeric features present in every reference become parameters
     * (mean / min / max, tolerance = factor x |mean|). Booleans uniform across
     * the group become gates.
     * @throws InsufficientSamples when fewer than 2 references are given.
     */
    static ClassDefinition DefineFromReferenceGroup(const std::string& name,
                                                    const std::vector<Artifact>& referenceObjects,
                                                    const std::map<std::string, double>& weights = {},
                                                    double toleranceFactor = DefaultToleranceFactor,
                                                    const BuilderOptions& options = BuilderOptions());

    /** @brief TYPE_ + upper-cased name, non-alphanumerics replaced by '_'. */
    static std::string DefaultClassId(const std::string& name);
};

} // namespace typolab::application::taxonomy
