/**
 * @file ClassDefinition.cpp
 * @brief Implementation of ClassDefinition and its canonical encoding.
 */

#include "domain/taxonomy/ClassDefinition.hpp"
#include "domain/taxonomy/ContentHash.hpp"

#include <sstream>

namespace typolab::domain::taxonomy {

namespace {

constexpr const char* CanonicalHeader = "typolab-class/2";

// Names may contain any character, so they are written as <length>:<bytes>.
void AppendName(std::ostringstream& out, const std::string& name) {
    out << name.size() << ':' << name;
}

// One line per parameter: <section>|<len>:<name>|target|min|max|tolerance|weight
void AppendSection(std::ostringstream& out, char section, const ParameterMap& params) {
    for (const auto& [name, p] : params) { // std::map iterates in key order
        out << section << '|';
        AppendName(out, name);
        out << '|' << ContentHash::FormatNumber(p.targetValue())
            << '|' << ContentHash::FormatNumber(p.minThreshold())
            << '|' << ContentHash::FormatNumber(p.maxThreshold())
            << '|' << ContentHash::FormatNumber(p.tolerance())
            << '|' << ContentHash::FormatNumber(p.weight()) << '\n';
    }
}

void CheckKeys(const ParameterMap& params, const std::string& classId) {
    for (const auto& [key, p] : params) {
        if (key != p.name()) {
            throw InvalidParameter("map key '" + key + "' does not match parameter name", p.name(), classId);
        }
    }
}

} // namespace

ClassDefinition::ClassDefinition(std::string classId,
                                 std::string name,
                                 std::string description,
                                 ParameterMap morphometricParams,
                                 ParameterMap technologicalParams,
                                 GateMap optionalFeatures,
                                 double confidenceThreshold,
                                 std::string createdBy,
                                 std::vector<std::string> validatedSamples,
                                 std::chrono::system_clock::time_point createdAt)
    : m_classId(std::move(classId)),
      m_name(std::move(name)),
      m_description(std::move(description)),
      m_morphometricParams(std::move(morphometricParams)),
      m_technologicalParams(std::move(technologicalParams)),
      m_optionalFeatures(std::move(optionalFeatures)),
      m_confidenceThreshold(confidenceThreshold),
      m_createdAt(createdAt),
      m_createdBy(std::move(createdBy)),
      m_validatedSamples(std::move(validatedSamples)) {
    if (m_classId.empty()) {
        throw TaxonomyError("ClassDefinition: class_id cannot be empty");
    }
    if (!(m_confidenceThreshold > 0.0 && m_confidenceThreshold <= 1.0)) {
        throw InvalidParameter("confidence_threshold must lie in (0, 1]", "confidence_threshold", m_classId);
    }
    CheckKeys(m_morphometricParams, m_classId);
    CheckKeys(m_technologicalParams, m_classId);
    for (const auto& [key, p] : m_technologicalParams) {
        if (m_morphometricParams.count(key)) {
            throw InvalidParameter("declared as both morphometric and technological", key, m_classId);
        }
    }

    m_contentHash = ComputeContentHash(m_morphometricParams, m_technologicalParams, m_optionalFeatures);
}

const Parameter* ClassDefinition::findParameter(const std::string& name) const {
    auto it = m_morphometricParams.find(name);
    if (it != m_morphometricParams.end()) return &it->second;
    it = m_technologicalParams.find(name);
    if (it != m_technologicalParams.end()) return &it->second;
    return nullptr;
}

std::string ClassDefinition::ComputeContentHash(const ParameterMap& morphometric,
                                                const ParameterMap& technological,
                                                const GateMap& gates) {
    std::ostringstream canonical;
    canonical << CanonicalHeader << '\n';
    AppendSection(canonical, 'm', morphometric);
    AppendSection(canonical, 't', technological);
    for (const auto& [feature, required] : gates) {
        canonical << 'g' << '|';
        AppendName(canonical, feature);
        canonical << '|' << (required ? '1' : '0') << '\n';
    }
    return ContentHash::Digest(canonical.str());
}

} // namespace typolab::domain::taxonomy
