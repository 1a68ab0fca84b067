/**
 * @file SavignanoTaxonomy.cpp
 * @brief Implementation of the Savignano presets.
 */

#include "application/taxonomy/SavignanoTaxonomy.hpp"

#include <algorithm>

#include "domain/taxonomy/Scorer.hpp"

namespace typolab::application::taxonomy {

namespace {

constexpr const char* Author = "TypoLab Savignano presets";

void Add(ParameterMap& params, const std::string& name, double target, double min, double max, double weight,
         double tolerance) {
    params.emplace(name, Parameter(name, target, min, max, tolerance, weight, "mm"));
}

GateMap SavignanoGates() {
    // Expanded blade is typical but not mandatory, so it is not gated.
    return {
        {"incavo_presente", true},
        {"margini_rialzati_presenti", true},
    };
}

} // namespace

ClassDefinition SavignanoTaxonomy::CreateBaseClass() {
    ParameterMap morphometric;
    // Butt (tallone)
    Add(morphometric, "tallone_larghezza", 42.0, 35.0, 55.0, 1.0, 8.0);
    Add(morphometric, "tallone_spessore", 15.0, 10.0, 22.0, 1.0, 5.0);
    // Socket (incavo), critical
    Add(morphometric, "incavo_larghezza", 45.0, 30.0, 60.0, 1.5, 10.0);
    Add(morphometric, "incavo_profondita", 12.0, 5.0, 25.0, 1.5, 7.0);
    // Raised flanges (margini rialzati)
    Add(morphometric, "margini_rialzati_lunghezza", 85.0, 60.0, 120.0, 1.2, 20.0);
    Add(morphometric, "margini_rialzati_spessore_max", 8.0, 4.0, 15.0, 0.8, 4.0);
    // Blade (tagliente)
    Add(morphometric, "tagliente_larghezza", 95.0, 75.0, 130.0, 1.0, 15.0);
    Add(morphometric, "length", 165.0, 140.0, 200.0, 0.8, 20.0);

    return ClassDefinition(BaseClassId,
                           "Savignano Type Bronze Axe",
                           "Bronze Age socketed axe characterized by socket (incavo), raised flanges "
                           "(margini rialzati), and typically lunate blade. Associated with Italian Bronze "
                           "Age cultures.",
                           std::move(morphometric),
                           {},
                           SavignanoGates(),
                           0.65,
                           Author,
                           {"axe936", "axe940", "axe942", "axe957", "axe965",
                            "axe971", "axe974", "axe978", "axe979", "axe992"});
}

ClassDefinition SavignanoTaxonomy::CreateMatrixAClass() {
    ParameterMap morphometric;
    Add(morphometric, "tallone_larghezza", 42.1, 40.0, 44.0, 1.5, 1.5);
    Add(morphometric, "incavo_larghezza", 45.2, 43.0, 47.5, 2.0, 2.0);
    Add(morphometric, "tagliente_larghezza", 98.6, 95.0, 102.0, 1.5, 3.0);
    Add(morphometric, "length", 165.3, 160.0, 170.0, 1.2, 4.0);

    return ClassDefinition(MatrixAClassId,
                           "Savignano Type - Matrix A",
                           "Savignano axes from Matrix A production mold. Characterized by specific "
                           "dimensional consistency.",
                           std::move(morphometric),
                           {},
                           SavignanoGates(),
                           0.80,
                           Author,
                           {"axe974", "axe942"});
}

std::vector<ClassDefinition> SavignanoTaxonomy::CreateAllClasses() {
    std::vector<ClassDefinition> classes;
    classes.push_back(CreateBaseClass());
    classes.push_back(CreateMatrixAClass());
    return classes;
}

SavignanoClassifier::SavignanoClassifier() {
    for (auto& def : SavignanoTaxonomy::CreateAllClasses()) {
        m_classes.push_back(std::make_shared<const ClassDefinition>(std::move(def)));
    }
}

bool SavignanoClassifier::PassesBasicCriteria(const FeatureMap& features) {
    return GetFlag(features, "incavo_presente").value_or(false) &&
           GetFlag(features, "margini_rialzati_presenti").value_or(false);
}

std::vector<std::string> SavignanoClassifier::MissingFeatures(const FeatureMap& features) {
    std::vector<std::string> missing;
    if (!GetFlag(features, "incavo_presente").value_or(false)) {
        missing.push_back("socket (incavo)");
    }
    if (!GetFlag(features, "margini_rialzati_presenti").value_or(false)) {
        missing.push_back("raised flanges (margini rialzati)");
    }
    if (!GetFlag(features, "tagliente_lunato").value_or(false)) {
        missing.push_back("lunate blade (tagliente lunato)");
    }
    return missing;
}

SavignanoResult SavignanoClassifier::Classify(const Artifact& artifact) const {
    SavignanoResult result;
    result.artifactId = artifact.id;

    if (artifact.features.empty()) {
        result.reason = "No Savignano features available";
        return result;
    }

    result.missingFeatures = MissingFeatures(artifact.features);
    if (!PassesBasicCriteria(artifact.features)) {
        result.reason = "Does not meet basic Savignano criteria";
        return result;
    }

    result.allResults = Scorer::ClassifyAll(m_classes, artifact.features);
    const ClassificationResult& best = result.allResults.front();

    if (best.isMember) {
        result.classified = true;
        result.type = best.className;
        result.classId = best.classId;
        result.confidence = best.confidence;
        result.reason = "Matches " + best.className;
        return result;
    }

    auto base = std::find_if(result.allResults.begin(), result.allResults.end(),
                             [](const ClassificationResult& r) { return r.classId == SavignanoTaxonomy::BaseClassId; });
    if (base != result.allResults.end() && base->confidence >= PossibleTypeConfidence) {
        result.type = "Possible Savignano Type";
        result.classId = base->classId;
        result.confidence = base->confidence;
        result.reason = "Below confidence threshold but shows Savignano characteristics";
        return result;
    }

    result.confidence = best.confidence;
    result.reason = "Does not match Savignano type parameters";
    return result;
}

} // namespace typolab::application::taxonomy
