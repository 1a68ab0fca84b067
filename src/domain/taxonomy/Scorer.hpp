/**
 * @file Scorer.hpp
 * @brief Weighted-tolerance membership scoring.
 */

#pragma once

#include <memory>
#include <vector>

#include "ClassDefinition.hpp"
#include "ClassificationResult.hpp"
#include "FeatureMap.hpp"

namespace typolab::domain::taxonomy {

/**
 * @class Scorer
 * @brief Stateless domain service matching feature maps against class definitions.
 */
class Scorer {
public:
    /**
     * @brief Scores one artifact against one class.
     *
     * Gates are checked first; any unmet gate rejects with confidence 0 and no
     * parameter scoring. Otherwise confidence is the weighted mean of the
     * per-parameter scores (0 when the weights sum to 0).
     */
    static ClassificationResult Classify(const ClassDefinition& classDef, const FeatureMap& features);

    /**
     * @brief Scores against every class; sorted by confidence desc, then class_id asc.
     */
    static std::vector<ClassificationResult> ClassifyAll(
        const std::vector<std::shared_ptr<const ClassDefinition>>& classes,
        const FeatureMap& features);

    /** @brief Ordering used by ClassifyAll. */
    static bool Ranks(const ClassificationResult& a, const ClassificationResult& b);
};

} // namespace typolab::domain::taxonomy
