/**
 * @file TaxonomyJsonCodec.cpp
 * @brief Implementation of TaxonomyJsonCodec.
 */

#include "infrastructure/TaxonomyJsonCodec.hpp"

#include <climits>
#include <set>

namespace typolab::infrastructure {

using json = nlohmann::json;

namespace {

double RequireNumber(const json& j, const char* key, const std::string& classId, const std::string& param) {
    if (!j.contains(key) || !j[key].is_number()) {
        throw MalformedImport(std::string("missing or non-numeric field '") + key + "'", classId, param);
    }
    return j[key].get<double>();
}

std::string RequireString(const json& j, const char* key, const std::string& classId) {
    if (!j.contains(key) || !j[key].is_string()) {
        throw MalformedImport(std::string("missing or non-string field '") + key + "'", classId);
    }
    return j[key].get<std::string>();
}

std::string OptionalString(const json& j, const char* key, const std::string& fallback = "") {
    if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    return fallback;
}

std::vector<std::string> StringArray(const json& j, const char* key, const std::string& classId) {
    std::vector<std::string> out;
    if (!j.contains(key) || j[key].is_null()) return out;
    if (!j[key].is_array()) {
        throw MalformedImport(std::string("field '") + key + "' must be an array", classId);
    }
    for (const auto& item : j[key]) {
        if (!item.is_string()) {
            throw MalformedImport(std::string("field '") + key + "' must contain strings", classId);
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

std::chrono::system_clock::time_point RequireTimestamp(const json& j, const char* key, const std::string& context) {
    if (!j.contains(key) || !j[key].is_number_integer() ||
        (j[key].is_number_unsigned() && j[key].get<unsigned long long>() > static_cast<unsigned long long>(LLONG_MAX))) {
        throw MalformedImport(std::string("missing or non-integer timestamp '") + key + "'", context);
    }
    try {
        return TaxonomyJsonCodec::FromMillis(j[key].get<long long>());
    } catch (const MalformedImport&) {
        throw MalformedImport(std::string("field '") + key + "': timestamp outside the representable range", context);
    }
}

ParameterMap DecodeParameterMap(const json& j, const char* key, const std::string& classId) {
    ParameterMap params;
    if (!j.contains(key) || j[key].is_null()) return params;
    if (!j[key].is_object()) {
        throw MalformedImport(std::string("field '") + key + "' must be an object", classId);
    }
    for (auto it = j[key].begin(); it != j[key].end(); ++it) {
        params.emplace(it.key(), TaxonomyJsonCodec::DecodeParameter(it.key(), it.value(), classId));
    }
    return params;
}

json EncodeParameterMap(const ParameterMap& params) {
    json out = json::object();
    for (const auto& [name, p] : params) {
        out[name] = TaxonomyJsonCodec::EncodeParameter(p);
    }
    return out;
}

json OptionalNumber(const std::optional<double>& value) {
    return value ? json(*value) : json(nullptr);
}

ParameterChange DecodeParameterChange(const json& j, const std::string& name) {
    if (!j.is_object()) {
        throw MalformedImport("change for parameter must be an object", "", name);
    }
    auto field = [&](const char* key) -> std::optional<double> {
        if (!j.contains(key) || j[key].is_null()) return std::nullopt;
        if (!j[key].is_number()) {
            throw MalformedImport(std::string("non-numeric change field '") + key + "'", "", name);
        }
        return j[key].get<double>();
    };
    ParameterChange change;
    change.targetValue = field("target_value");
    change.minThreshold = field("min_threshold");
    change.maxThreshold = field("max_threshold");
    change.tolerance = field("tolerance");
    change.weight = field("weight");
    return change;
}

} // namespace

long long TaxonomyJsonCodec::ToMillis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point TaxonomyJsonCodec::FromMillis(long long ms) {
    using Clock = std::chrono::system_clock;
    // Milliseconds are scaled up to the clock's tick; keep the product in range.
    constexpr long long MaxMillis = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::duration::max()).count();
    constexpr long long MinMillis = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::duration::min()).count();
    if (ms > MaxMillis || ms < MinMillis) {
        throw MalformedImport("timestamp " + std::to_string(ms) + " ms is outside the representable range");
    }
    return Clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::milliseconds(ms)));
}

// --- Parameters & classes ---

json TaxonomyJsonCodec::EncodeParameter(const Parameter& p) {
    return {
        {"name", p.name()},
        {"target_value", p.targetValue()},
        {"min_threshold", p.minThreshold()},
        {"max_threshold", p.maxThreshold()},
        {"tolerance", p.tolerance()},
        {"weight", p.weight()},
        {"unit", p.unit()}
    };
}

Parameter TaxonomyJsonCodec::DecodeParameter(const std::string& key, const json& j, const std::string& classId) {
    if (!j.is_object()) {
        throw MalformedImport("parameter must be an object", classId, key);
    }
    if (j.contains("name") && (!j["name"].is_string() || j["name"].get<std::string>() != key)) {
        throw MalformedImport("parameter name does not match its key", classId, key);
    }
    try {
        return Parameter(key,
                         RequireNumber(j, "target_value", classId, key),
                         RequireNumber(j, "min_threshold", classId, key),
                         RequireNumber(j, "max_threshold", classId, key),
                         RequireNumber(j, "tolerance", classId, key),
                         RequireNumber(j, "weight", classId, key),
                         OptionalString(j, "unit", "mm"));
    } catch (const InvalidParameter& e) {
        throw MalformedImport(e.detail(), classId, key);
    }
}

json TaxonomyJsonCodec::EncodeClass(const RegistryEntry& entry) {
    const ClassDefinition& def = *entry.definition;
    return {
        {"class_id", def.classId()},
        {"name", def.name()},
        {"description", def.description()},
        {"content_hash", def.contentHash()},
        {"morphometric_params", EncodeParameterMap(def.morphometricParams())},
        {"technological_params", EncodeParameterMap(def.technologicalParams())},
        {"optional_features", def.optionalFeatures()},
        {"confidence_threshold", def.confidenceThreshold()},
        {"created_at", ToMillis(def.createdAt())},
        {"created_by", def.createdBy()},
        {"validated_samples", def.validatedSamples()},
        {"supersedes", entry.supersedes ? json(*entry.supersedes) : json(nullptr)},
        {"superseded_by", entry.supersededBy}
    };
}

RegistryEntry TaxonomyJsonCodec::DecodeClass(const std::string& key, const json& j) {
    if (!j.is_object()) {
        throw MalformedImport("class entry must be an object", key);
    }
    const std::string classId = RequireString(j, "class_id", key);
    if (classId.empty()) {
        throw MalformedImport("empty class_id");
    }
    if (classId != key) {
        throw MalformedImport("class_id does not match its key '" + key + "'", classId);
    }
    const std::string storedHash = RequireString(j, "content_hash", classId);

    GateMap gates;
    if (j.contains("optional_features") && !j["optional_features"].is_null()) {
        if (!j["optional_features"].is_object()) {
            throw MalformedImport("optional_features must be an object", classId);
        }
        for (auto it = j["optional_features"].begin(); it != j["optional_features"].end(); ++it) {
            if (!it.value().is_boolean()) {
                throw MalformedImport("optional feature '" + it.key() + "' must be boolean", classId);
            }
            gates.emplace(it.key(), it.value().get<bool>());
        }
    }

    double threshold = ClassDefinition::DefaultConfidenceThreshold;
    if (j.contains("confidence_threshold")) {
        threshold = RequireNumber(j, "confidence_threshold", classId, "");
    }
    auto createdAt = j.contains("created_at") ? RequireTimestamp(j, "created_at", classId)
                                              : std::chrono::system_clock::time_point{};

    RegistryEntry entry;
    try {
        entry.definition = std::make_shared<const ClassDefinition>(classId,
                                                                   OptionalString(j, "name"),
                                                                   OptionalString(j, "description"),
                                                                   DecodeParameterMap(j, "morphometric_params", classId),
                                                                   DecodeParameterMap(j, "technological_params", classId),
                                                                   std::move(gates),
                                                                   threshold,
                                                                   OptionalString(j, "created_by"),
                                                                   StringArray(j, "validated_samples", classId),
                                                                   createdAt);
    } catch (const InvalidParameter& e) {
        throw MalformedImport(e.detail(), classId, e.parameter());
    }

    if (entry.definition->contentHash() != storedHash) {
        throw MalformedImport("content_hash mismatch: stored " + storedHash + ", recomputed " +
                              entry.definition->contentHash(), classId);
    }

    if (j.contains("supersedes") && !j["supersedes"].is_null()) {
        entry.supersedes = RequireString(j, "supersedes", classId);
    }
    entry.supersededBy = StringArray(j, "superseded_by", classId);
    return entry;
}

// --- Change sets ---

json TaxonomyJsonCodec::EncodeChangeSet(const ParameterChangeSet& changes) {
    json params = json::object();
    for (const auto& [name, c] : changes.parameters) {
        json field = json::object();
        if (c.targetValue) field["target_value"] = *c.targetValue;
        if (c.minThreshold) field["min_threshold"] = *c.minThreshold;
        if (c.maxThreshold) field["max_threshold"] = *c.maxThreshold;
        if (c.tolerance) field["tolerance"] = *c.tolerance;
        if (c.weight) field["weight"] = *c.weight;
        params[name] = field;
    }
    json gates = json::object();
    for (const auto& [feature, required] : changes.gates) {
        gates[feature] = required ? json(*required) : json(nullptr);
    }
    return {{"parameters", params}, {"gates", gates}};
}

ParameterChangeSet TaxonomyJsonCodec::DecodeChangeSet(const json& j) {
    ParameterChangeSet changes;
    if (j.is_null()) return changes;
    if (!j.is_object()) {
        throw MalformedImport("change set must be an object");
    }
    for (const char* group : {"parameters", "morphometric", "technological"}) {
        if (!j.contains(group) || j[group].is_null()) continue;
        if (!j[group].is_object()) {
            throw MalformedImport(std::string("change group '") + group + "' must be an object");
        }
        for (auto it = j[group].begin(); it != j[group].end(); ++it) {
            changes.parameters[it.key()] = DecodeParameterChange(it.value(), it.key());
        }
    }
    if (j.contains("gates") && !j["gates"].is_null()) {
        if (!j["gates"].is_object()) {
            throw MalformedImport("change group 'gates' must be an object");
        }
        for (auto it = j["gates"].begin(); it != j["gates"].end(); ++it) {
            if (it.value().is_null()) {
                changes.gates[it.key()] = std::nullopt;
            } else if (it.value().is_boolean()) {
                changes.gates[it.key()] = it.value().get<bool>();
            } else {
                throw MalformedImport("gate change '" + it.key() + "' must be boolean or null");
            }
        }
    }
    return changes;
}

// --- Snapshot ---

json TaxonomyJsonCodec::EncodeSnapshot(const TaxonomySnapshot& snapshot) {
    json classes = json::object();
    json order = json::array();
    for (const auto& entry : snapshot.entries) {
        classes[entry.definition->classId()] = EncodeClass(entry);
        order.push_back(entry.definition->classId());
    }

    json records = json::array();
    for (const auto& r : snapshot.changeRecords) {
        records.push_back({
            {"from_class_id", r.fromClassId},
            {"to_class_id", r.toClassId},
            {"from_hash", r.fromHash},
            {"to_hash", r.toHash},
            {"changes", EncodeChangeSet(r.changes)},
            {"justification", r.justification},
            {"operator", r.operatorName},
            {"timestamp", ToMillis(r.timestamp)}
        });
    }

    json log = json::array();
    for (const auto& e : snapshot.classificationLog) {
        log.push_back({
            {"timestamp", ToMillis(e.timestamp)},
            {"artifact_id", e.artifactId},
            {"best_class_id", e.bestClassId ? json(*e.bestClassId) : json(nullptr)},
            {"confidence", e.confidence}
        });
    }

    return {
        {"format", FormatName},
        {"format_version", FormatVersion},
        {"exported_at", ToMillis(std::chrono::system_clock::now())},
        {"class_order", order},
        {"classes", classes},
        {"change_records", records},
        {"classification_log", log}
    };
}

TaxonomySnapshot TaxonomyJsonCodec::DecodeSnapshot(const json& document) {
    if (!document.is_object()) {
        throw MalformedImport("taxonomy document must be a JSON object");
    }
    if (document.contains("format_version") &&
        (!document["format_version"].is_number_integer() || document["format_version"].get<int>() > FormatVersion)) {
        throw MalformedImport("unsupported format_version");
    }
    if (!document.contains("classes") || !document["classes"].is_object()) {
        throw MalformedImport("missing 'classes' object");
    }
    const json& classes = document["classes"];

    std::vector<std::string> order;
    if (document.contains("class_order")) {
        order = StringArray(document, "class_order", "");
        std::set<std::string> listed(order.begin(), order.end());
        if (listed.size() != order.size() || listed.size() != classes.size()) {
            throw MalformedImport("class_order does not list every class exactly once");
        }
        for (const auto& id : order) {
            if (!classes.contains(id)) {
                throw MalformedImport("class_order names a missing class", id);
            }
        }
    } else {
        for (auto it = classes.begin(); it != classes.end(); ++it) {
            order.push_back(it.key());
        }
    }

    TaxonomySnapshot snapshot;
    for (const auto& id : order) {
        snapshot.entries.push_back(DecodeClass(id, classes[id]));
    }

    if (document.contains("change_records") && !document["change_records"].is_null()) {
        if (!document["change_records"].is_array()) {
            throw MalformedImport("change_records must be an array");
        }
        for (const auto& r : document["change_records"]) {
            if (!r.is_object()) throw MalformedImport("change record must be an object");
            ClassModified record;
            record.fromClassId = RequireString(r, "from_class_id", "");
            record.toClassId = RequireString(r, "to_class_id", record.fromClassId);
            record.fromHash = OptionalString(r, "from_hash");
            record.toHash = OptionalString(r, "to_hash");
            if (r.contains("changes")) record.changes = DecodeChangeSet(r["changes"]);
            record.justification = RequireString(r, "justification", record.toClassId);
            record.operatorName = RequireString(r, "operator", record.toClassId);
            record.timestamp = RequireTimestamp(r, "timestamp", record.toClassId);
            snapshot.changeRecords.push_back(std::move(record));
        }
    }

    if (document.contains("classification_log") && document["classification_log"].is_array()) {
        for (const auto& e : document["classification_log"]) {
            if (!e.is_object()) throw MalformedImport("classification log entry must be an object");
            ClassificationLogged entry;
            entry.timestamp = RequireTimestamp(e, "timestamp", "");
            entry.artifactId = OptionalString(e, "artifact_id", "unknown");
            if (e.contains("best_class_id") && e["best_class_id"].is_string()) {
                entry.bestClassId = e["best_class_id"].get<std::string>();
            }
            entry.confidence = e.contains("confidence") ? RequireNumber(e, "confidence", "", "") : 0.0;
            snapshot.classificationLog.push_back(std::move(entry));
        }
    }
    return snapshot;
}

// --- Collaborator inputs ---

FeatureMap TaxonomyJsonCodec::DecodeFeatureMap(const json& j) {
    if (!j.is_object()) {
        throw MalformedImport("feature map must be a JSON object");
    }
    FeatureMap features;
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (it.key() == "id") continue;
        if (it.value().is_boolean()) {
            features.emplace(it.key(), it.value().get<bool>());
        } else if (it.value().is_number()) {
            features.emplace(it.key(), it.value().get<double>());
        }
    }
    return features;
}

Artifact TaxonomyJsonCodec::DecodeArtifact(const json& j, const std::string& fallbackId) {
    Artifact artifact;
    artifact.features = DecodeFeatureMap(j);
    if (j.contains("id") && j["id"].is_string()) {
        artifact.id = j["id"].get<std::string>();
    } else if (j.contains("id") && j["id"].is_number_integer()) {
        artifact.id = std::to_string(j["id"].get<long long>());
    } else {
        artifact.id = fallbackId;
    }
    return artifact;
}

std::vector<Artifact> TaxonomyJsonCodec::DecodeArtifacts(const json& j) {
    if (!j.is_array()) {
        throw MalformedImport("artifact list must be a JSON array");
    }
    std::vector<Artifact> artifacts;
    for (std::size_t i = 0; i < j.size(); ++i) {
        artifacts.push_back(DecodeArtifact(j[i], "ref_" + std::to_string(i)));
    }
    return artifacts;
}

std::map<std::string, std::string> TaxonomyJsonCodec::DecodeClusterAssignments(const json& j) {
    if (!j.is_object()) {
        throw MalformedImport("cluster assignments must be a JSON object");
    }
    std::map<std::string, std::string> assignments;
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (it.value().is_string()) {
            assignments[it.key()] = it.value().get<std::string>();
        } else if (it.value().is_number_integer()) {
            assignments[it.key()] = std::to_string(it.value().get<long long>());
        } else {
            throw MalformedImport("cluster label for '" + it.key() + "' must be a string or integer");
        }
    }
    return assignments;
}

std::map<std::string, double> TaxonomyJsonCodec::DecodeWeights(const json& j) {
    if (!j.is_object()) {
        throw MalformedImport("weights must be a JSON object");
    }
    std::map<std::string, double> weights;
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!it.value().is_number()) {
            throw MalformedImport("weight must be numeric", "", it.key());
        }
        weights[it.key()] = it.value().get<double>();
    }
    return weights;
}

// --- Reports ---

json TaxonomyJsonCodec::EncodeResult(const ClassificationResult& r) {
    json diagnostic = json::object();
    for (const auto& [name, d] : r.diagnostic) {
        diagnostic[name] = {
            {"observed", OptionalNumber(d.observed)},
            {"expected_range", {d.expectedMin, d.expectedMax}},
            {"target", d.target},
            {"weight", d.weight},
            {"score", d.score},
            {"section", SectionToString(d.section)},
            {"status", ParameterStatusToString(d.status)}
        };
    }
    json gates = json::object();
    for (const auto& [name, g] : r.gates) {
        gates[name] = {
            {"required", g.required},
            {"observed", g.observed ? json(*g.observed) : json(nullptr)},
            {"satisfied", g.satisfied}
        };
    }
    return {
        {"class_id", r.classId},
        {"class_name", r.className},
        {"is_member", r.isMember},
        {"confidence", r.confidence},
        {"diagnostic", diagnostic},
        {"gates", gates},
        {"failed_gate", r.failedGate ? json(*r.failedGate) : json(nullptr)}
    };
}

json TaxonomyJsonCodec::EncodeResults(const std::vector<ClassificationResult>& results) {
    json out = json::array();
    for (const auto& r : results) out.push_back(EncodeResult(r));
    return out;
}

json TaxonomyJsonCodec::EncodeSavignanoResult(const SavignanoResult& r) {
    return {
        {"artifact_id", r.artifactId},
        {"classified", r.classified},
        {"type", r.type ? json(*r.type) : json(nullptr)},
        {"class_id", r.classId ? json(*r.classId) : json(nullptr)},
        {"confidence", r.confidence},
        {"reason", r.reason},
        {"missing_features", r.missingFeatures},
        {"all_results", EncodeResults(r.allResults)}
    };
}

json TaxonomyJsonCodec::EncodeStatistics(const TaxonomyStatistics& stats) {
    json classes = json::object();
    for (const auto& c : stats.classes) {
        classes[c.classId] = {
            {"name", c.name},
            {"n_validated_samples", c.validatedSampleCount},
            {"n_parameters", c.parameterCount},
            {"confidence_threshold", c.confidenceThreshold}
        };
    }
    return {
        {"n_classes", stats.classCount},
        {"total_classifications", stats.classificationCount},
        {"total_modifications", stats.modificationCount},
        {"classes", classes}
    };
}

json TaxonomyJsonCodec::EncodeDiscoveryReport(const DiscoveryReport& report) {
    json clusters = json::array();
    for (const auto& c : report.clusters) {
        clusters.push_back({
            {"label", c.label},
            {"size", c.size},
            {"promoted", c.promoted},
            {"class_id", c.classId ? json(*c.classId) : json(nullptr)}
        });
    }
    json promoted = json::array();
    for (const auto& def : report.promoted) {
        promoted.push_back(def->classId());
    }
    return {
        {"promoted", promoted},
        {"clusters", clusters},
        {"noise", report.noiseCount},
        {"unassigned", report.unassignedCount}
    };
}

} // namespace typolab::infrastructure
