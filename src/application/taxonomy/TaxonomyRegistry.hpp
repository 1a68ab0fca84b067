/**
 * @file TaxonomyRegistry.hpp
 * @brief Append-only, versioned store of class definitions.
 */

#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "application/taxonomy/ClassBuilder.hpp"
#include "domain/taxonomy/ClassDefinition.hpp"
#include "domain/taxonomy/ClassificationResult.hpp"
#include "domain/taxonomy/FeatureMap.hpp"
#include "domain/taxonomy/events/TaxonomyEvents.hpp"

namespace typolab::application::taxonomy {

using namespace typolab::domain::taxonomy;

/**
 * @struct RegistryEntry
 * @brief A registered definition and its supersession links.
 */
struct RegistryEntry {
    std::shared_ptr<const ClassDefinition> definition;
    std::optional<std::string> supersedes;
    std::vector<std::string> supersededBy;
};

/**
 * @struct TaxonomySnapshot
 * @brief Complete registry state, in registration order. Export/import unit.
 */
struct TaxonomySnapshot {
    std::vector<RegistryEntry> entries;
    std::vector<ClassModified> changeRecords;
    std::vector<ClassificationLogged> classificationLog;
};

/** @brief Result of a Modify call. */
struct ModifyOutcome {
    std::string classId; ///< New version id, or the unchanged id for a no-op.
    bool created = false;
};

struct DiscoveryOptions {
    std::size_t minClusterSize = 5;
    double toleranceFactor = ClassBuilder::DefaultToleranceFactor;
    std::map<std::string, double> weights;
    BuilderOptions builder; ///< classId is ignored; each cluster gets its own.
};

struct ClusterSummary {
    std::string label;
    std::size_t size = 0;
    bool promoted = false;
    std::optional<std::string> classId;
};

struct DiscoveryReport {
    std::vector<std::shared_ptr<const ClassDefinition>> promoted;
    std::vector<ClusterSummary> clusters;
    std::size_t noiseCount = 0;      ///< Artifacts labelled "-1".
    std::size_t unassignedCount = 0; ///< Artifacts with no cluster label.
};

struct TaxonomyStatistics {
    struct ClassSummary {
        std::string classId;
        std::string name;
        std::size_t validatedSampleCount = 0;
        std::size_t parameterCount = 0;
        double confidenceThreshold = 0.0;
    };

    std::size_t classCount = 0;
    std::size_t classificationCount = 0;
    std::size_t modificationCount = 0;
    std::vector<ClassSummary> classes;
};

/**
 * @class TaxonomyRegistry
 * @brief Owns the class definitions of one taxonomy.
 *
 * Mutations (Register, Modify, Discover, Import) are serialized by an
 * exclusive lock; classification and export share it. Entries are never
 * removed: Modify adds a superseding version and a change record.
 */
class TaxonomyRegistry {
public:
    static constexpr const char* NoiseLabel = "-1";

    TaxonomyRegistry() = default;
    TaxonomyRegistry(const TaxonomyRegistry&) = delete;
    TaxonomyRegistry& operator=(const TaxonomyRegistry&) = delete;

    /** @throws DuplicateClassId if the id is taken. */
    std::shared_ptr<const ClassDefinition> Register(ClassDefinition classDef);

    /** @brief Best match, or nullopt for an empty registry. Logged. */
    std::optional<ClassificationResult> Classify(const FeatureMap& features,
                                                 const std::string& artifactId = "unknown");

    /** @brief Every class, ranked by confidence desc then class_id asc. Logged. */
    std::vector<ClassificationResult> ClassifyAll(const FeatureMap& features,
                                                  const std::string& artifactId = "unknown");

    /**
     * @brief Ranks many artifacts in parallel; one list per artifact, in input order.
     * @param workers Number of tasks; 0 picks the hardware concurrency.
     */
    std::vector<std::vector<ClassificationResult>> ClassifyBatch(const std::vector<Artifact>& artifacts,
                                                                 std::size_t workers = 0);

    /**
     * @brief Applies edits as a new version of the class.
     *
     * A change set that leaves the content hash unchanged is a no-op.
     * @throws UnknownClassId, InvalidChange (also when the version counter is exhausted), InvalidParameter
     */
    ModifyOutcome Modify(const std::string& classId,
                         const ParameterChangeSet& changes,
                         const std::string& justification,
                         const std::string& operatorName);

    /**
     * @brief Promotes externally computed clusters to classes.
     *
     * All promoted candidates are registered together or not at all.
     */
    DiscoveryReport Discover(const std::vector<Artifact>& artifacts,
                             const std::map<std::string, std::string>& clusterAssignments,
                             const DiscoveryOptions& options = DiscoveryOptions());

    TaxonomySnapshot Export() const;

    /**
     * @brief Replaces the whole registry state with the snapshot.
     * @throws MalformedImport, leaving the current state untouched.
     */
    void Import(const TaxonomySnapshot& snapshot);

    std::shared_ptr<const ClassDefinition> Find(const std::string& classId) const;

    /** @throws UnknownClassId */
    RegistryEntry Entry(const std::string& classId) const;

    bool Contains(const std::string& classId) const;
    std::vector<std::string> ClassIds() const;
    std::size_t Size() const;
    std::vector<ClassModified> ChangeRecords() const;
    std::vector<ClassificationLogged> ClassificationLog() const;
    TaxonomyStatistics Statistics() const;

    /** @brief Id with any trailing _v<digits> removed. */
    static std::string BaseId(const std::string& classId);

    /** @brief Version ordinal encoded in the id; 1 for a bare base id, INT_MAX when it does not fit. */
    static int VersionOf(const std::string& classId);

private:
    std::vector<std::shared_ptr<const ClassDefinition>> CurrentClasses() const;
    void AppendLog(const std::string& artifactId, const std::vector<ClassificationResult>& ranked);
    std::string NextVersionId(const std::string& classId) const;

    mutable std::shared_mutex m_mutex;
    std::map<std::string, RegistryEntry> m_entries;
    std::vector<std::string> m_order;
    std::vector<ClassModified> m_changeRecords;

    mutable std::mutex m_logMutex;
    std::vector<ClassificationLogged> m_classificationLog;
};

} // namespace typolab::application::taxonomy
