/**
 * @file SavignanoTaxonomy.hpp
 * @brief Preset classes and rule-based classifier for Savignano-type Bronze Age axes.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "domain/taxonomy/ClassDefinition.hpp"
#include "domain/taxonomy/ClassificationResult.hpp"
#include "domain/taxonomy/FeatureMap.hpp"

namespace typolab::application::taxonomy {

using namespace typolab::domain::taxonomy;

/**
 * @class SavignanoTaxonomy
 * @brief Formal definitions of the Savignano type and its known production matrices.
 */
class SavignanoTaxonomy {
public:
    static constexpr const char* BaseClassId = "SAVIGNANO_TYPE";
    static constexpr const char* MatrixAClassId = "SAVIGNANO_MATRIX_A";

    /** @brief Socket and raised flanges gated; blade, butt and overall size scored. */
    static ClassDefinition CreateBaseClass();

    /** @brief Tight dimensional ranges of axes cast in the Matrix A mould. */
    static ClassDefinition CreateMatrixAClass();

    static std::vector<ClassDefinition> CreateAllClasses();
};

/**
 * @struct SavignanoResult
 * @brief Outcome of SavignanoClassifier::Classify.
 */
struct SavignanoResult {
    std::string artifactId;
    bool classified = false;
    std::optional<std::string> type;    ///< Class name, or "Possible Savignano Type".
    std::optional<std::string> classId;
    double confidence = 0.0;
    std::string reason;
    std::vector<std::string> missingFeatures;
    std::vector<ClassificationResult> allResults;
};

/**
 * @class SavignanoClassifier
 * @brief Applies the basic criteria, then scores against every Savignano class.
 *
 * The lunate blade is reported in missingFeatures when absent but never
 * rejects an artifact on its own.
 */
class SavignanoClassifier {
public:
    static constexpr double PossibleTypeConfidence = 0.5;

    SavignanoClassifier();

    SavignanoResult Classify(const Artifact& artifact) const;

    /** @brief Socket and raised flanges both present. */
    static bool PassesBasicCriteria(const FeatureMap& features);

    static std::vector<std::string> MissingFeatures(const FeatureMap& features);

private:
    std::vector<std::shared_ptr<const ClassDefinition>> m_classes;
};

} // namespace typolab::application::taxonomy
