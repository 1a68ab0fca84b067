/**
 * @file Scorer.cpp
 * @brief Implementation of Scorer.
 */

#include "domain/taxonomy/Scorer.hpp"

#include <algorithm>

namespace typolab::domain::taxonomy {

namespace {

struct WeightedSum {
    double numerator = 0.0;
    double denominator = 0.0;
};

void ScoreSection(const ParameterMap& params,
                  ParameterSection section,
                  const FeatureMap& features,
                  WeightedSum& sum,
                  ClassificationResult& result) {
    for (const auto& [name, param] : params) {
        ParameterDiagnostic diag;
        diag.observed = GetNumber(features, name);
        diag.expectedMin = param.minThreshold();
        diag.expectedMax = param.maxThreshold();
        diag.target = param.targetValue();
        diag.weight = param.weight();
        diag.section = section;

        if (!diag.observed) {
            diag.status = ParameterStatus::Missing;
        } else if (!param.withinBounds(*diag.observed)) {
            diag.status = ParameterStatus::OutOfRange;
        } else {
            diag.status = ParameterStatus::Match;
        }
        diag.score = param.score(diag.observed);

        sum.numerator += param.weight() * diag.score;
        sum.denominator += param.weight();
        result.diagnostic.emplace(name, diag);
    }
}

} // namespace

ClassificationResult Scorer::Classify(const ClassDefinition& classDef, const FeatureMap& features) {
    ClassificationResult result;
    result.classId = classDef.classId();
    result.className = classDef.name();

    // 1. Gates short-circuit everything else.
    for (const auto& [feature, required] : classDef.optionalFeatures()) {
        GateDiagnostic gate;
        gate.required = required;
        gate.observed = GetFlag(features, feature);
        gate.satisfied = gate.observed.has_value() && *gate.observed == required;
        result.gates.emplace(feature, gate);

        if (!gate.satisfied) {
            result.failedGate = feature;
            result.isMember = false;
            result.confidence = 0.0;
            return result;
        }
    }

    // 2. Weighted average over both parameter namespaces.
    WeightedSum sum;
    ScoreSection(classDef.morphometricParams(), ParameterSection::Morphometric, features, sum, result);
    ScoreSection(classDef.technologicalParams(), ParameterSection::Technological, features, sum, result);

    result.confidence = sum.denominator > 0.0 ? std::clamp(sum.numerator / sum.denominator, 0.0, 1.0) : 0.0;

    // 3. Membership.
    result.isMember = result.confidence >= classDef.confidenceThreshold();
    return result;
}

bool Scorer::Ranks(const ClassificationResult& a, const ClassificationResult& b) {
    if (a.confidence != b.confidence) return a.confidence > b.confidence;
    return a.classId < b.classId;
}

std::vector<ClassificationResult> Scorer::ClassifyAll(
    const std::vector<std::shared_ptr<const ClassDefinition>>& classes,
    const FeatureMap& features) {
    std::vector<ClassificationResult> results;
    results.reserve(classes.size());
    for (const auto& classDef : classes) {
        if (classDef) {
            results.push_back(Classify(*classDef, features));
        }
    }
    std::sort(results.begin(), results.end(), &Scorer::Ranks);
    return results;
}

} // namespace typolab::domain::taxonomy
