/**
 * @file ClassDefinition.hpp
 * @brief Immutable, content-hashed taxonomic class.
 */

#pragma once

#include <chrono>
#include <map>
#include <string>
#include <vector>

#include "Parameter.hpp"

namespace typolab::domain::taxonomy {

using ParameterMap = std::map<std::string, Parameter>;
using GateMap = std::map<std::string, bool>;

/**
 * @class ClassDefinition
 * @brief A named rule set: continuous parameters, boolean gates and provenance.
 *
 * Never mutated after construction. Edits go through TaxonomyRegistry::Modify,
 * which builds a new definition. The content hash depends only on the
 * parameter maps and the gates.
 */
class ClassDefinition {
public:
    static constexpr double DefaultConfidenceThreshold = 0.75;

    ClassDefinition(std::string classId,
                    std::string name,
                    std::string description,
                    ParameterMap morphometricParams,
                    ParameterMap technologicalParams,
                    GateMap optionalFeatures,
                    double confidenceThreshold = DefaultConfidenceThreshold,
                    std::string createdBy = "",
                    std::vector<std::string> validatedSamples = {},
                    std::chrono::system_clock::time_point createdAt = std::chrono::system_clock::now());

    const std::string& classId() const { return m_classId; }
    const std::string& name() const { return m_name; }
    const std::string& description() const { return m_description; }
    const ParameterMap& morphometricParams() const { return m_morphometricParams; }
    const ParameterMap& technologicalParams() const { return m_technologicalParams; }
    const GateMap& optionalFeatures() const { return m_optionalFeatures; }
    double confidenceThreshold() const { return m_confidenceThreshold; }
    std::chrono::system_clock::time_point createdAt() const { return m_createdAt; }
    const std::string& createdBy() const { return m_createdBy; }
    const std::vector<std::string>& validatedSamples() const { return m_validatedSamples; }
    const std::string& contentHash() const { return m_contentHash; }

    /** @brief Total number of continuous parameters in both namespaces. */
    std::size_t parameterCount() const { return m_morphometricParams.size() + m_technologicalParams.size(); }

    /** @brief Looks a parameter up in either namespace; nullptr when absent. */
    const Parameter* findParameter(const std::string& name) const;

    /**
     * @brief Digest over sorted parameter content and gates.
     *
     * Identical content always yields the same digest, whatever the order in
     * which the maps were filled.
     */
    static std::string ComputeContentHash(const ParameterMap& morphometric,
                                          const ParameterMap& technological,
                                          const GateMap& gates);

private:
    std::string m_classId;
    std::string m_name;
    std::string m_description;
    ParameterMap m_morphometricParams;
    ParameterMap m_technologicalParams;
    GateMap m_optionalFeatures;
    double m_confidenceThreshold;
    std::chrono::system_clock::time_point m_createdAt;
    std::string m_createdBy;
    std::vector<std::string> m_validatedSamples;
    std::string m_contentHash;
};

} // namespace typolab::domain::taxonomy
