/**
 * @file ClassBuilder.cpp
 * @brief Implementation of ClassBuilder.
 */

#include "application/taxonomy/ClassBuilder.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace typolab::application::taxonomy {

namespace {

struct NumericStats {
    double mean = 0.0;
    double min = 0.0;
    double max = 0.0;
};

// Keys holding the same alternative of FeatureValue in every reference.
template <typename T>
std::vector<std::string> KeysPresentEverywhere(const std::vector<Artifact>& refs) {
    std::vector<std::string> keys;
    for (const auto& [key, value] : refs.front().features) {
        if (!std::holds_alternative<T>(value)) continue;
        bool everywhere = std::all_of(refs.begin() + 1, refs.end(), [&key](const Artifact& a) {
            auto it = a.features.find(key);
            return it != a.features.end() && std::holds_alternative<T>(it->second);
        });
        if (everywhere) keys.push_back(key);
    }
    return keys;
}

NumericStats ComputeStats(const std::vector<Artifact>& refs, const std::string& key) {
    NumericStats stats;
    double sum = 0.0;
    bool first = true;
    for (const auto& ref : refs) {
        double v = std::get<double>(ref.features.at(key));
        sum += v;
        if (first) {
            stats.min = stats.max = v;
            first = false;
        } else {
            stats.min = std::min(stats.min, v);
            stats.max = std::max(stats.max, v);
        }
    }
    // Rounding can push the mean a ulp outside the observed extremes.
    stats.mean = std::clamp(sum / static_cast<double>(refs.size()), stats.min, stats.max);
    return stats;
}

double DeriveTolerance(const NumericStats& stats, double factor) {
    if (stats.mean != 0.0) return factor * std::abs(stats.mean);
    double range = stats.max - stats.min;
    if (range > 0.0) return factor * range;
    return factor;
}

} // namespace

std::string ClassBuilder::DefaultClassId(const std::string& name) {
    std::string id = "TYPE_";
    for (unsigned char c : name) {
        id.push_back(std::isalnum(c) ? static_cast<char>(std::toupper(c)) : '_');
    }
    return id;
}

ClassDefinition ClassBuilder::DefineFromReferenceGroup(const std::string& name,
                                                       const std::vector<Artifact>& referenceObjects,
                                                       const std::map<std::string, double>& weights,
                                                       double toleranceFactor,
                                                       const BuilderOptions& options) {
    if (referenceObjects.size() < 2) {
        throw InsufficientSamples(name, referenceObjects.size());
    }
    if (!std::isfinite(toleranceFactor) || toleranceFactor <= 0.0) {
        throw InvalidParameter("tolerance_factor must be a positive number", "tolerance_factor");
    }

    const std::string classId = options.classId.value_or(DefaultClassId(name));

    ParameterMap morphometric;
    ParameterMap technological;
    for (const auto& key : KeysPresentEverywhere<double>(referenceObjects)) {
        NumericStats stats = ComputeStats(referenceObjects, key);
        auto w = weights.find(key);
        double weight = (w != weights.end()) ? w->second : 1.0;

        if (!std::isfinite(weight) || weight < 0.0) {
            throw InvalidParameter("weight must be a finite, non-negative number", key, classId);
        }

        Parameter param(key, stats.mean, stats.min, stats.max,
                        DeriveTolerance(stats, toleranceFactor), weight, options.unit);
        ParameterMap& target = options.technologicalKeys.count(key) ? technological : morphometric;
        target.emplace(key, std::move(param));
    }

    GateMap gates;
    for (const auto& key : KeysPresentEverywhere<bool>(referenceObjects)) {
        bool first = std::get<bool>(referenceObjects.front().features.at(key));
        bool uniform = std::all_of(referenceObjects.begin(), referenceObjects.end(), [&](const Artifact& a) {
            return std::get<bool>(a.features.at(key)) == first;
        });
        if (uniform) gates.emplace(key, first);
    }

    std::vector<std::string> samples;
    samples.reserve(referenceObjects.size());
    for (std::size_t i = 0; i < referenceObjects.size(); ++i) {
        const auto& id = referenceObjects[i].id;
        samples.push_back(id.empty() ? "ref_" + std::to_string(i) : id);
    }

    std::string description = options.description.value_or(
        "Class defined from " + std::to_string(referenceObjects.size()) + " reference objects");

    return ClassDefinition(classId,
                           name,
                           std::move(description),
                           std::move(morphometric),
                           std::move(technological),
                           std::move(gates),
                           options.confidenceThreshold,
                           options.createdBy,
                           std::move(samples));
}

} // namespace typolab::application::taxonomy
