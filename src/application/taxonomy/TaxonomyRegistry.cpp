/**
 * @file TaxonomyRegistry.cpp
 * @brief Implementation of TaxonomyRegistry.
 */

#include "application/taxonomy/TaxonomyRegistry.hpp"

#include <algorithm>
#include <cctype>
#include <future>
#include <iostream>
#include <limits>
#include <set>
#include <thread>

#include "domain/taxonomy/Scorer.hpp"

namespace typolab::application::taxonomy {

namespace {

Parameter ApplyChange(const Parameter& p, const ParameterChange& c) {
    return Parameter(p.name(),
                     c.targetValue.value_or(p.targetValue()),
                     c.minThreshold.value_or(p.minThreshold()),
                     c.maxThreshold.value_or(p.maxThreshold()),
                     c.tolerance.value_or(p.tolerance()),
                     c.weight.value_or(p.weight()),
                     p.unit());
}

} // namespace

std::string TaxonomyRegistry::BaseId(const std::string& classId) {
    auto pos = classId.rfind("_v");
    if (pos == std::string::npos || pos + 2 >= classId.size()) return classId;
    bool digits = std::all_of(classId.begin() + static_cast<std::ptrdiff_t>(pos) + 2, classId.end(),
                              [](unsigned char c) { return std::isdigit(c); });
    return digits ? classId.substr(0, pos) : classId;
}

int TaxonomyRegistry::VersionOf(const std::string& classId) {
    std::string base = BaseId(classId);
    if (base.size() == classId.size()) return 1;
    try {
        return std::stoi(classId.substr(base.size() + 2));
    } catch (const std::out_of_range&) {
        return std::numeric_limits<int>::max();
    }
}

std::shared_ptr<const ClassDefinition> TaxonomyRegistry::Register(ClassDefinition classDef) {
    auto def = std::make_shared<const ClassDefinition>(std::move(classDef));
    {
        std::unique_lock lock(m_mutex);
        if (m_entries.count(def->classId())) {
            throw DuplicateClassId(def->classId());
        }
        m_entries.emplace(def->classId(), RegistryEntry{def, std::nullopt, {}});
        m_order.push_back(def->classId());
    }
    std::clog << "[TaxonomyRegistry] Registered " << def->classId() << " (hash " << def->contentHash() << ", "
              << def->parameterCount() << " parameters)" << std::endl;
    return def;
}

std::vector<std::shared_ptr<const ClassDefinition>> TaxonomyRegistry::CurrentClasses() const {
    std::shared_lock lock(m_mutex);
    std::vector<std::shared_ptr<const ClassDefinition>> classes;
    classes.reserve(m_order.size());
    for (const auto& id : m_order) {
        classes.push_back(m_entries.at(id).definition);
    }
    return classes;
}

void TaxonomyRegistry::AppendLog(const std::string& artifactId, const std::vector<ClassificationResult>& ranked) {
    ClassificationLogged entry;
    entry.timestamp = std::chrono::system_clock::now();
    entry.artifactId = artifactId;
    if (!ranked.empty()) {
        entry.bestClassId = ranked.front().classId;
        entry.confidence = ranked.front().confidence;
    }
    std::lock_guard<std::mutex> lock(m_logMutex);
    m_classificationLog.push_back(std::move(entry));
}

std::vector<ClassificationResult> TaxonomyRegistry::ClassifyAll(const FeatureMap& features,
                                                                const std::string& artifactId) {
    auto ranked = Scorer::ClassifyAll(CurrentClasses(), features);
    AppendLog(artifactId, ranked);
    return ranked;
}

std::optional<ClassificationResult> TaxonomyRegistry::Classify(const FeatureMap& features,
                                                               const std::string& artifactId) {
    auto ranked = ClassifyAll(features, artifactId);
    if (ranked.empty()) return std::nullopt;
    return ranked.front();
}

std::vector<std::vector<ClassificationResult>> TaxonomyRegistry::ClassifyBatch(const std::vector<Artifact>& artifacts,
                                                                               std::size_t workers) {
    std::vector<std::vector<ClassificationResult>> results(artifacts.size());
    if (artifacts.empty()) return results;

    const auto classes = CurrentClasses();
    if (workers == 0) {
        workers = std::max<std::size_t>(1, std::thread::hardware_concurrency());
    }
    workers = std::min(workers, artifacts.size());
    const std::size_t chunk = (artifacts.size() + workers - 1) / workers;

    // Each task writes a disjoint slice of `results`.
    std::vector<std::future<void>> tasks;
    for (std::size_t begin = 0; begin < artifacts.size(); begin += chunk) {
        const std::size_t end = std::min(begin + chunk, artifacts.size());
        tasks.push_back(std::async(std::launch::async, [&classes, &artifacts, &results, begin, end]() {
            for (std::size_t i = begin; i < end; ++i) {
                results[i] = Scorer::ClassifyAll(classes, artifacts[i].features);
            }
        }));
    }
    for (auto& task : tasks) {
        task.get();
    }

    for (std::size_t i = 0; i < artifacts.size(); ++i) {
        AppendLog(artifacts[i].id, results[i]);
    }
    return results;
}

std::string TaxonomyRegistry::NextVersionId(const std::string& classId) const {
    const std::string base = BaseId(classId);
    int highest = 1;
    for (const auto& id : m_order) {
        if (BaseId(id) == base) {
            highest = std::max(highest, VersionOf(id));
        }
    }
    if (highest == std::numeric_limits<int>::max()) {
        throw InvalidChange("no version number left after " + base + "_v" + std::to_string(highest), classId);
    }
    return base + "_v" + std::to_string(highest + 1);
}

ModifyOutcome TaxonomyRegistry::Modify(const std::string& classId,
                                       const ParameterChangeSet& changes,
                                       const std::string& justification,
                                       const std::string& operatorName) {
    std::unique_lock lock(m_mutex);

    auto it = m_entries.find(classId);
    if (it == m_entries.end()) {
        throw UnknownClassId(classId);
    }
    if (justification.empty() || operatorName.empty()) {
        throw InvalidChange("justification and operator are mandatory", classId);
    }

    const ClassDefinition& old = *it->second.definition;
    ParameterMap morphometric = old.morphometricParams();
    ParameterMap technological = old.technologicalParams();
    GateMap gates = old.optionalFeatures();

    for (const auto& [name, change] : changes.parameters) {
        ParameterMap* section = morphometric.count(name) ? &morphometric
                              : technological.count(name) ? &technological
                              : nullptr;
        if (!section) {
            throw InvalidChange("no parameter named '" + name + "'", classId);
        }
        try {
            section->insert_or_assign(name, ApplyChange(section->at(name), change));
        } catch (const InvalidParameter& e) {
            throw InvalidParameter(e.detail(), e.parameter(), classId);
        }
    }
    for (const auto& [feature, required] : changes.gates) {
        if (required) {
            gates[feature] = *required;
        } else {
            gates.erase(feature);
        }
    }

    if (ClassDefinition::ComputeContentHash(morphometric, technological, gates) == old.contentHash()) {
        lock.unlock();
        std::clog << "[TaxonomyRegistry] Modify " << classId << ": content unchanged, no new version" << std::endl;
        return {classId, false};
    }

    const std::string newId = NextVersionId(classId);
    auto def = std::make_shared<const ClassDefinition>(newId,
                                                       old.name(),
                                                       old.description(),
                                                       std::move(morphometric),
                                                       std::move(technological),
                                                       std::move(gates),
                                                       old.confidenceThreshold(),
                                                       operatorName,
                                                       old.validatedSamples());

    ClassModified record;
    record.fromClassId = classId;
    record.toClassId = newId;
    record.fromHash = old.contentHash();
    record.toHash = def->contentHash();
    record.changes = changes;
    record.justification = justification;
    record.operatorName = operatorName;
    record.timestamp = def->createdAt();

    it->second.supersededBy.push_back(newId);
    m_entries.emplace(newId, RegistryEntry{def, classId, {}});
    m_order.push_back(newId);
    m_changeRecords.push_back(std::move(record));
    lock.unlock();

    std::clog << "[TaxonomyRegistry] " << classId << " superseded by " << newId << " (operator: " << operatorName
              << ", hash " << def->contentHash() << ")" << std::endl;
    return {newId, true};
}

DiscoveryReport TaxonomyRegistry::Discover(const std::vector<Artifact>& artifacts,
                                           const std::map<std::string, std::string>& clusterAssignments,
                                           const DiscoveryOptions& options) {
    DiscoveryReport report;
    std::map<std::string, std::vector<Artifact>> clusters;
    for (const auto& artifact : artifacts) {
        auto label = clusterAssignments.find(artifact.id);
        if (label == clusterAssignments.end()) {
            ++report.unassignedCount;
        } else if (label->second == NoiseLabel) {
            ++report.noiseCount;
        } else {
            clusters[label->second].push_back(artifact);
        }
    }

    // A single artifact cannot establish a range.
    const std::size_t minSize = std::max<std::size_t>(2, options.minClusterSize);

    std::vector<ClassDefinition> candidates;
    for (const auto& [label, members] : clusters) {
        ClusterSummary summary;
        summary.label = label;
        summary.size = members.size();
        if (members.size() < minSize) {
            std::clog << "[TaxonomyRegistry] Cluster '" << label << "' has " << members.size()
                      << " artifacts (minimum " << minSize << "); not promoted" << std::endl;
            report.clusters.push_back(summary);
            continue;
        }

        BuilderOptions builderOptions = options.builder;
        builderOptions.classId.reset();
        candidates.push_back(ClassBuilder::DefineFromReferenceGroup(
            "DiscoveredType_" + label, members, options.weights, options.toleranceFactor, builderOptions));
        summary.promoted = true;
        summary.classId = candidates.back().classId();
        report.clusters.push_back(summary);
    }

    {
        std::unique_lock lock(m_mutex);
        std::set<std::string> seen;
        for (const auto& candidate : candidates) {
            if (m_entries.count(candidate.classId()) || !seen.insert(candidate.classId()).second) {
                throw DuplicateClassId(candidate.classId());
            }
        }
        for (auto& candidate : candidates) {
            auto def = std::make_shared<const ClassDefinition>(std::move(candidate));
            m_entries.emplace(def->classId(), RegistryEntry{def, std::nullopt, {}});
            m_order.push_back(def->classId());
            report.promoted.push_back(def);
        }
    }

    std::clog << "[TaxonomyRegistry] Discovery promoted " << report.promoted.size() << " of " << clusters.size()
              << " clusters (" << report.noiseCount << " noise, " << report.unassignedCount << " unassigned)"
              << std::endl;
    return report;
}

TaxonomySnapshot TaxonomyRegistry::Export() const {
    TaxonomySnapshot snapshot;
    {
        std::shared_lock lock(m_mutex);
        snapshot.entries.reserve(m_order.size());
        for (const auto& id : m_order) {
            snapshot.entries.push_back(m_entries.at(id));
        }
        snapshot.changeRecords = m_changeRecords;
    }
    snapshot.classificationLog = ClassificationLog();
    return snapshot;
}

void TaxonomyRegistry::Import(const TaxonomySnapshot& snapshot) {
    // Validate and build the new state completely before touching the current one.
    std::map<std::string, RegistryEntry> entries;
    std::vector<std::string> order;
    for (const auto& entry : snapshot.entries) {
        if (!entry.definition) {
            throw MalformedImport("entry without a class definition");
        }
        const std::string& id = entry.definition->classId();
        if (!entries.emplace(id, entry).second) {
            throw MalformedImport("duplicate class id", id);
        }
        order.push_back(id);
    }
    for (const auto& [id, entry] : entries) {
        if (entry.supersedes && !entries.count(*entry.supersedes)) {
            throw MalformedImport("supersedes unknown class '" + *entry.supersedes + "'", id);
        }
        for (const auto& child : entry.supersededBy) {
            if (!entries.count(child)) {
                throw MalformedImport("superseded by unknown class '" + child + "'", id);
            }
        }
    }
    for (const auto& record : snapshot.changeRecords) {
        if (!entries.count(record.fromClassId) || !entries.count(record.toClassId)) {
            throw MalformedImport("change record " + record.fromClassId + " -> " + record.toClassId +
                                  " names an unknown class");
        }
    }

    {
        std::unique_lock lock(m_mutex);
        m_entries = std::move(entries);
        m_order = std::move(order);
        m_changeRecords = snapshot.changeRecords;
    }
    {
        std::lock_guard<std::mutex> lock(m_logMutex);
        m_classificationLog = snapshot.classificationLog;
    }
    std::clog << "[TaxonomyRegistry] Imported " << snapshot.entries.size() << " classes and "
              << snapshot.changeRecords.size() << " change records" << std::endl;
}

std::shared_ptr<const ClassDefinition> TaxonomyRegistry::Find(const std::string& classId) const {
    std::shared_lock lock(m_mutex);
    auto it = m_entries.find(classId);
    return it == m_entries.end() ? nullptr : it->second.definition;
}

RegistryEntry TaxonomyRegistry::Entry(const std::string& classId) const {
    std::shared_lock lock(m_mutex);
    auto it = m_entries.find(classId);
    if (it == m_entries.end()) {
        throw UnknownClassId(classId);
    }
    return it->second;
}

bool TaxonomyRegistry::Contains(const std::string& classId) const {
    std::shared_lock lock(m_mutex);
    return m_entries.count(classId) > 0;
}

std::vector<std::string> TaxonomyRegistry::ClassIds() const {
    std::shared_lock lock(m_mutex);
    return m_order;
}

std::size_t TaxonomyRegistry::Size() const {
    std::shared_lock lock(m_mutex);
    return m_order.size();
}

std::vector<ClassModified> TaxonomyRegistry::ChangeRecords() const {
    std::shared_lock lock(m_mutex);
    return m_changeRecords;
}

std::vector<ClassificationLogged> TaxonomyRegistry::ClassificationLog() const {
    std::lock_guard<std::mutex> lock(m_logMutex);
    return m_classificationLog;
}

TaxonomyStatistics TaxonomyRegistry::Statistics() const {
    TaxonomyStatistics stats;
    {
        std::shared_lock lock(m_mutex);
        stats.classCount = m_order.size();
        stats.modificationCount = m_changeRecords.size();
        for (const auto& id : m_order) {
            const auto& def = *m_entries.at(id).definition;
            stats.classes.push_back({id, def.name(), def.validatedSamples().size(), def.parameterCount(),
                                     def.confidenceThreshold()});
        }
    }
    std::lock_guard<std::mutex> lock(m_logMutex);
    stats.classificationCount = m_classificationLog.size();
    return stats;
}

} // namespace typolab::application::taxonomy
