/**
 * @file TaxonomyJsonCodec.hpp
 * @brief JSON mapping of the taxonomy export document and of collaborator inputs.
 */

#pragma once

#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "application/taxonomy/SavignanoTaxonomy.hpp"
#include "application/taxonomy/TaxonomyRegistry.hpp"

namespace typolab::infrastructure {

using namespace typolab::domain::taxonomy;
using namespace typolab::application::taxonomy;

/**
 * @class TaxonomyJsonCodec
 * @brief Stateless encoder/decoder. Decoding errors raise MalformedImport.
 */
class TaxonomyJsonCodec {
public:
    static constexpr const char* FormatName = "typolab-taxonomy";
    static constexpr int FormatVersion = 1;

    // --- Export document ---
    static nlohmann::json EncodeSnapshot(const TaxonomySnapshot& snapshot);

    /**
     * @brief Rebuilds a snapshot and re-verifies every stored content hash.
     * @throws MalformedImport on missing fields, bad values or hash mismatch.
     */
    static TaxonomySnapshot DecodeSnapshot(const nlohmann::json& document);

    static nlohmann::json EncodeParameter(const Parameter& parameter);
    static Parameter DecodeParameter(const std::string& key, const nlohmann::json& j, const std::string& classId);

    static nlohmann::json EncodeClass(const RegistryEntry& entry);
    static RegistryEntry DecodeClass(const std::string& key, const nlohmann::json& j);

    static nlohmann::json EncodeChangeSet(const ParameterChangeSet& changes);

    /**
     * @brief Accepts {"parameters": {...}, "gates": {...}}; "morphometric" and
     *        "technological" groups are merged into "parameters".
     */
    static ParameterChangeSet DecodeChangeSet(const nlohmann::json& j);

    // --- Collaborator inputs ---

    /** @brief Numbers and booleans become features; "id" and other types are skipped. */
    static FeatureMap DecodeFeatureMap(const nlohmann::json& j);
    static Artifact DecodeArtifact(const nlohmann::json& j, const std::string& fallbackId = "unknown");

    /** @brief Array of artifact objects; missing ids become ref_<index>. */
    static std::vector<Artifact> DecodeArtifacts(const nlohmann::json& j);

    /** @brief artifact id -> label; integer labels are stringified. */
    static std::map<std::string, std::string> DecodeClusterAssignments(const nlohmann::json& j);
    static std::map<std::string, double> DecodeWeights(const nlohmann::json& j);

    // --- Reports ---
    static nlohmann::json EncodeResult(const ClassificationResult& result);
    static nlohmann::json EncodeResults(const std::vector<ClassificationResult>& results);
    static nlohmann::json EncodeSavignanoResult(const SavignanoResult& result);
    static nlohmann::json EncodeStatistics(const TaxonomyStatistics& stats);
    static nlohmann::json EncodeDiscoveryReport(const DiscoveryReport& report);

    static long long ToMillis(std::chrono::system_clock::time_point tp);
    /** @throws MalformedImport when the value does not fit the system clock. */
    static std::chrono::system_clock::time_point FromMillis(long long ms);
};

} // namespace typolab::infrastructure
