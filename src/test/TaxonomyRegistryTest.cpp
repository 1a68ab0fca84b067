#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

#include "application/taxonomy/TaxonomyRegistry.hpp"

using namespace typolab::application::taxonomy;
using namespace typolab::domain::taxonomy;

namespace {

bool Near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) < eps;
}

ClassDefinition MakeBlade(const std::string& id) {
    ParameterMap params;
    params.emplace("length", Parameter("length", 120.0, 110.0, 130.0, 20.0));
    params.emplace("width", Parameter("width", 60.0, 50.0, 70.0, 10.0));
    return ClassDefinition(id, "Blade", "test blade", std::move(params), {}, {{"retouched", true}}, 0.75, "tester",
                           {"b1", "b2"});
}

ParameterChangeSet WidenLength(double max) {
    ParameterChangeSet changes;
    changes.parameters["length"].maxThreshold = max;
    return changes;
}

} // namespace

int main() {
    std::cout << "[Test] Starting TaxonomyRegistry Test..." << std::endl;

    TaxonomyRegistry registry;
    assert(!registry.Classify({{"length", 120.0}}).has_value() && "Empty registry yields no best match.");

    auto blade = registry.Register(MakeBlade("TYPE_BLADE"));
    assert(registry.Contains("TYPE_BLADE") && registry.Size() == 1);
    assert(registry.Find("TYPE_BLADE") == blade);
    assert(registry.Find("TYPE_NONE") == nullptr);

    try {
        registry.Register(MakeBlade("TYPE_BLADE"));
        assert(false && "Duplicate ids must be rejected.");
    } catch (const DuplicateClassId& e) {
        assert(e.classId() == "TYPE_BLADE");
    }
    assert(registry.Size() == 1);
    std::cout << "[PASS] Register and duplicates." << std::endl;

    const FeatureMap sample = {{"length", 128.0}, {"width", 60.0}, {"retouched", true}};
    auto before = registry.Classify(sample, "sample-1");
    assert(before && before->classId == "TYPE_BLADE");

    // Modify: length max 130 -> 135.
    ModifyOutcome outcome = registry.Modify("TYPE_BLADE", WidenLength(135.0), "wider range observed", "curator");
    assert(outcome.created);
    assert(outcome.classId == "TYPE_BLADE_v2");
    auto v2 = registry.Find("TYPE_BLADE_v2");
    assert(v2 && v2->contentHash() != blade->contentHash());
    assert(v2->morphometricParams().at("length").maxThreshold() == 135.0);
    assert(v2->createdBy() == "curator");
    assert(v2->validatedSamples() == blade->validatedSamples());
    assert(v2->name() == blade->name());

    RegistryEntry original = registry.Entry("TYPE_BLADE");
    assert(original.supersededBy == std::vector<std::string>({"TYPE_BLADE_v2"}));
    assert(registry.Entry("TYPE_BLADE_v2").supersedes == std::optional<std::string>("TYPE_BLADE"));
    assert(registry.Find("TYPE_BLADE")->contentHash() == blade->contentHash());

    auto ranked = registry.ClassifyAll(sample, "sample-2");
    assert(ranked.size() == 2);
    for (const auto& r : ranked) {
        if (r.classId == "TYPE_BLADE") assert(Near(r.confidence, before->confidence));
    }

    auto records = registry.ChangeRecords();
    assert(records.size() == 1);
    assert(records[0].fromClassId == "TYPE_BLADE" && records[0].toClassId == "TYPE_BLADE_v2");
    assert(records[0].fromHash == blade->contentHash() && records[0].toHash == v2->contentHash());
    assert(records[0].justification == "wider range observed" && records[0].operatorName == "curator");
    std::cout << "[PASS] Modify creates a superseding version." << std::endl;

    // Idempotent: same values again is a no-op.
    ModifyOutcome noop = registry.Modify("TYPE_BLADE_v2", WidenLength(135.0), "again", "curator");
    assert(!noop.created && noop.classId == "TYPE_BLADE_v2");
    assert(registry.Size() == 2 && registry.ChangeRecords().size() == 1);

    // An empty change set never creates a version.
    ModifyOutcome empty = registry.Modify("TYPE_BLADE", ParameterChangeSet{}, "nothing to change", "curator");
    assert(!empty.created && empty.classId == "TYPE_BLADE");
    assert(registry.Size() == 2 && registry.ChangeRecords().size() == 1);

    // Versions count from the highest sharing the base id.
    ModifyOutcome v3 = registry.Modify("TYPE_BLADE", WidenLength(140.0), "from the root", "curator");
    assert(v3.classId == "TYPE_BLADE_v3");
    assert(registry.Entry("TYPE_BLADE").supersededBy.size() == 2);

    ParameterChangeSet gateOnly;
    gateOnly.gates["retouched"] = std::nullopt;
    gateOnly.gates["polished"] = false;
    ModifyOutcome v4 = registry.Modify("TYPE_BLADE_v3", gateOnly, "gate review", "curator");
    assert(v4.classId == "TYPE_BLADE_v4");
    auto gates = registry.Find("TYPE_BLADE_v4")->optionalFeatures();
    assert(gates.count("retouched") == 0 && gates.at("polished") == false);
    std::cout << "[PASS] Idempotent modify and version numbering." << std::endl;

    // Rejected modifications.
    try {
        registry.Modify("TYPE_GHOST", WidenLength(140.0), "x", "y");
        assert(false);
    } catch (const UnknownClassId& e) {
        assert(e.classId() == "TYPE_GHOST");
    }
    try {
        registry.Modify("TYPE_BLADE", WidenLength(150.0), "", "curator");
        assert(false);
    } catch (const InvalidChange&) {
    }
    try {
        ParameterChangeSet unknown;
        unknown.parameters["thickness"].targetValue = 3.0;
        registry.Modify("TYPE_BLADE", unknown, "x", "curator");
        assert(false);
    } catch (const InvalidChange&) {
    }
    try {
        registry.Modify("TYPE_BLADE", WidenLength(100.0), "x", "curator");
        assert(false && "max below target breaks the parameter invariant.");
    } catch (const InvalidParameter& e) {
        assert(e.parameter() == "length" && e.classId() == "TYPE_BLADE");
    }
    try {
        registry.Entry("TYPE_GHOST");
        assert(false);
    } catch (const UnknownClassId&) {
    }
    assert(registry.Size() == 4);
    std::cout << "[PASS] Invalid modifications rejected." << std::endl;

    // Gate names holding delimiter characters are a real edit.
    TaxonomyRegistry gated;
    gated.Register(ClassDefinition("TYPE_G", "G", "", {}, {}, {{"a", true}, {"b", true}}));
    ParameterChangeSet respliced;
    respliced.gates["a"] = std::nullopt;
    respliced.gates["b"] = std::nullopt;
    respliced.gates["a|1\ng|b"] = true;
    ModifyOutcome spliced = gated.Modify("TYPE_G", respliced, "rename gates", "curator");
    assert(spliced.created && spliced.classId == "TYPE_G_v2");
    auto splicedBest = gated.ClassifyAll({{"a", true}, {"b", true}});
    assert(splicedBest.size() == 2);
    for (const auto& r : splicedBest) {
        if (r.classId == "TYPE_G_v2") assert(r.failedGate && r.confidence == 0.0);
    }

    // The version counter cannot run past the int range.
    TaxonomyRegistry exhausted;
    exhausted.Register(ClassDefinition("TYPE_X_v2147483647", "X", "", {}, {}, {{"a", true}}));
    ParameterChangeSet flip;
    flip.gates["a"] = false;
    try {
        exhausted.Modify("TYPE_X_v2147483647", flip, "overflow", "curator");
        assert(false && "Version counter overflow must be rejected.");
    } catch (const InvalidChange& e) {
        assert(e.classId() == "TYPE_X_v2147483647");
    }
    assert(exhausted.Size() == 1 && exhausted.ChangeRecords().empty());
    assert(TaxonomyRegistry::VersionOf("TYPE_X_v99999999999") == std::numeric_limits<int>::max());
    std::cout << "[PASS] Delimiter-safe gates and bounded version counter." << std::endl;

    assert(TaxonomyRegistry::BaseId("TYPE_A_v12") == "TYPE_A");
    assert(TaxonomyRegistry::BaseId("TYPE_A_vx") == "TYPE_A_vx");
    assert(TaxonomyRegistry::BaseId("TYPE_A_v") == "TYPE_A_v");
    assert(TaxonomyRegistry::VersionOf("TYPE_A") == 1);
    assert(TaxonomyRegistry::VersionOf("TYPE_A_v7") == 7);

    // Discovery from external cluster labels.
    std::vector<Artifact> artifacts;
    std::map<std::string, std::string> labels;
    for (int i = 0; i < 6; ++i) {
        std::string id = "c0_" + std::to_string(i);
        artifacts.push_back({id, {{"length", 40.0 + i}, {"width", 20.0}}});
        labels[id] = "0";
    }
    for (int i = 0; i < 3; ++i) {
        std::string id = "c1_" + std::to_string(i);
        artifacts.push_back({id, {{"length", 80.0 + i}}});
        labels[id] = "1";
    }
    for (int i = 0; i < 7; ++i) {
        std::string id = "noise_" + std::to_string(i);
        artifacts.push_back({id, {{"length", 5.0 * i}}});
        labels[id] = TaxonomyRegistry::NoiseLabel;
    }
    artifacts.push_back({"stray", {{"length", 1.0}}});

    DiscoveryReport report = registry.Discover(artifacts, labels);
    assert(report.promoted.size() == 1);
    assert(report.promoted[0]->classId() == "TYPE_DISCOVEREDTYPE_0");
    assert(report.promoted[0]->name() == "DiscoveredType_0");
    assert(report.promoted[0]->validatedSamples().size() == 6);
    assert(report.noiseCount == 7 && report.unassignedCount == 1);
    assert(report.clusters.size() == 2);
    assert(!report.clusters[1].promoted && report.clusters[1].size == 3);
    assert(registry.Contains("TYPE_DISCOVEREDTYPE_0"));

    // Re-running collides with the promoted class and registers nothing.
    DiscoveryOptions small;
    small.minClusterSize = 3;
    const std::size_t sizeBefore = registry.Size();
    try {
        registry.Discover(artifacts, labels, small);
        assert(false);
    } catch (const DuplicateClassId&) {
    }
    assert(registry.Size() == sizeBefore && !registry.Contains("TYPE_DISCOVEREDTYPE_1"));
    std::cout << "[PASS] Discovery promotes large clusters only." << std::endl;

    TaxonomyStatistics stats = registry.Statistics();
    assert(stats.classCount == 5);
    assert(stats.modificationCount == 3);
    assert(stats.classificationCount == 3);
    assert(stats.classes[0].classId == "TYPE_BLADE" && stats.classes[0].parameterCount == 2);
    assert(registry.ClassificationLog().front().artifactId == "unknown");
    assert(registry.ClassificationLog().back().artifactId == "sample-2");
    assert(registry.ClassIds().front() == "TYPE_BLADE");
    std::cout << "[PASS] Statistics." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
