/**
 * @file ClassificationResult.hpp
 * @brief Transient outcome of scoring one artifact against one class.
 */

#pragma once

#include <map>
#include <optional>
#include <string>

namespace typolab::domain::taxonomy {

enum class ParameterStatus {
    Match,       ///< Observed inside the hard bounds.
    OutOfRange,  ///< Observed outside [min, max]; scored 0.
    Missing      ///< No numeric observation; scored 0.
};

inline std::string ParameterStatusToString(ParameterStatus status) {
    switch (status) {
        case ParameterStatus::Match: return "match";
        case ParameterStatus::OutOfRange: return "out_of_range";
        case ParameterStatus::Missing: return "missing";
        default: return "unknown";
    }
}

enum class ParameterSection {
    Morphometric,
    Technological
};

inline std::string SectionToString(ParameterSection section) {
    return section == ParameterSection::Technological ? "technological" : "morphometric";
}

struct ParameterDiagnostic {
    std::optional<double> observed;
    double expectedMin = 0.0;
    double expectedMax = 0.0;
    double target = 0.0;
    double weight = 0.0;
    double score = 0.0;
    ParameterSection section = ParameterSection::Morphometric;
    ParameterStatus status = ParameterStatus::Missing;
};

struct GateDiagnostic {
    bool required = false;
    std::optional<bool> observed;
    bool satisfied = false;
};

/**
 * @struct ClassificationResult
 * @brief Membership decision, confidence and explanation for one class.
 */
struct ClassificationResult {
    std::string classId;
    std::string className;
    bool isMember = false;
    double confidence = 0.0;
    std::map<std::string, ParameterDiagnostic> diagnostic;
    std::map<std::string, GateDiagnostic> gates;
    std::optional<std::string> failedGate; ///< Set when a gate rejected the artifact.
};

} // namespace typolab::domain::taxonomy
