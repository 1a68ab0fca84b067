#include <cassert>
#include <filesystem>
#include <iostream>
#include <limits>

#include <nlohmann/json.hpp>

#include "application/taxonomy/ClassBuilder.hpp"
#include "application/taxonomy/TaxonomyRegistry.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/TaxonomyFileStore.hpp"
#include "infrastructure/TaxonomyJsonCodec.hpp"

using namespace typolab::application::taxonomy;
using namespace typolab::domain::taxonomy;
using namespace typolab::infrastructure;

namespace {

template <typename Fn>
bool RejectsImport(Fn fn) {
    try {
        fn();
    } catch (const MalformedImport& e) {
        std::cout << "[Test] Rejected as expected: " << e.what() << std::endl;
        return true;
    }
    return false;
}

void Populate(TaxonomyRegistry& registry) {
    std::vector<Artifact> refs = {
        {"a1", {{"length", 120.0}, {"width", 65.0}, {"socket_depth", 10.0}, {"has_socket", true}}},
        {"a2", {{"length", 122.0}, {"width", 64.0}, {"socket_depth", 12.0}, {"has_socket", true}}},
        {"a3", {{"length", 121.0}, {"width", 66.0}, {"socket_depth", 11.0}, {"has_socket", true}}},
    };
    registry.Register(ClassBuilder::DefineFromReferenceGroup("Socketed", refs, {{"width", 0.5}}));

    ParameterMap flat;
    flat.emplace("length", Parameter("length", 0.1, -0.0, 0.30000000000000004, 0.05, 1.0, "cm"));
    registry.Register(ClassDefinition("TYPE_FLAT", "Flat", "edge values", flat, {}, {{"has_socket", false}}, 0.9));

    ParameterChangeSet changes;
    changes.parameters["length"].maxThreshold = 130.0;
    registry.Modify("TYPE_SOCKETED", changes, "museum recheck", "curator");
}

} // namespace

int main() {
    std::cout << "[Test] Starting Taxonomy Round-Trip Test..." << std::endl;

    std::string testRoot = "test_taxonomy_roundtrip";
    std::filesystem::remove_all(testRoot);
    std::filesystem::create_directories(testRoot);
    const std::string path = testRoot + "/taxonomy.json";

    TaxonomyRegistry source;
    Populate(source);
    const FeatureMap sample = {{"length", 121.5}, {"width", 65.0}, {"socket_depth", 11.0}, {"has_socket", true}};
    auto expected = source.ClassifyAll(sample, "sample");
    assert(source.Size() == 3);

    auto persistence = std::make_shared<PersistenceService>();
    TaxonomyFileStore store(persistence);
    store.Save(path, source.Export());
    assert(std::filesystem::exists(path));

    TaxonomyRegistry restored;
    restored.Import(store.Load(path));
    assert(restored.Size() == 3);
    assert(restored.ClassIds() == source.ClassIds());
    for (const auto& id : source.ClassIds()) {
        auto a = source.Find(id);
        auto b = restored.Find(id);
        assert(b && a->contentHash() == b->contentHash());
        assert(a->name() == b->name() && a->createdBy() == b->createdBy());
        assert(a->validatedSamples() == b->validatedSamples());
        assert(a->confidenceThreshold() == b->confidenceThreshold());
        assert(TaxonomyJsonCodec::ToMillis(a->createdAt()) == TaxonomyJsonCodec::ToMillis(b->createdAt()));
        assert(source.Entry(id).supersededBy == restored.Entry(id).supersededBy);
        assert(source.Entry(id).supersedes == restored.Entry(id).supersedes);
    }
    assert(restored.Find("TYPE_FLAT")->morphometricParams().at("length").unit() == "cm");

    auto actual = restored.ClassifyAll(sample, "sample");
    assert(actual.size() == expected.size());
    for (std::size_t i = 0; i < actual.size(); ++i) {
        assert(actual[i].classId == expected[i].classId);
        assert(actual[i].confidence == expected[i].confidence);
        assert(actual[i].isMember == expected[i].isMember);
    }

    auto records = restored.ChangeRecords();
    assert(records.size() == 1 && records[0].toClassId == "TYPE_SOCKETED_v2");
    assert(records[0].changes.parameters.at("length").maxThreshold == 130.0);
    assert(restored.ClassificationLog().size() == 2);
    std::cout << "[PASS] Export/import preserves classes, links and outcomes." << std::endl;

    // Tampering: edit a parameter value without updating the stored hash.
    nlohmann::json document = nlohmann::json::parse(persistence->loadText(path));
    nlohmann::json tampered = document;
    tampered["classes"]["TYPE_FLAT"]["morphometric_params"]["length"]["target_value"] = 0.2;
    persistence->saveText(path, tampered.dump());

    const std::size_t sizeBefore = restored.Size();
    const std::string hashBefore = restored.Find("TYPE_FLAT")->contentHash();
    assert(RejectsImport([&] { restored.Import(store.Load(path)); }));
    assert(restored.Size() == sizeBefore);
    assert(restored.Find("TYPE_FLAT")->contentHash() == hashBefore);
    std::cout << "[PASS] Tampered hash rejected; prior state intact." << std::endl;

    // Structural defects.
    nlohmann::json missingField = document;
    missingField["classes"]["TYPE_FLAT"]["morphometric_params"]["length"].erase("tolerance");
    assert(RejectsImport([&] { TaxonomyJsonCodec::DecodeSnapshot(missingField); }));
    try {
        TaxonomyJsonCodec::DecodeSnapshot(missingField);
    } catch (const MalformedImport& e) {
        assert(e.classId() == "TYPE_FLAT" && e.parameter() == "length");
    }

    nlohmann::json badOrder = document;
    badOrder["class_order"].push_back("TYPE_GHOST");
    assert(RejectsImport([&] { TaxonomyJsonCodec::DecodeSnapshot(badOrder); }));

    nlohmann::json badLink = document;
    badLink["classes"]["TYPE_FLAT"]["superseded_by"] = nlohmann::json::array({"TYPE_GHOST"});
    assert(RejectsImport([&] { restored.Import(TaxonomyJsonCodec::DecodeSnapshot(badLink)); }));

    nlohmann::json badRange = document;
    badRange["classes"]["TYPE_FLAT"]["morphometric_params"]["length"]["min_threshold"] = 5.0;
    assert(RejectsImport([&] { TaxonomyJsonCodec::DecodeSnapshot(badRange); }));

    nlohmann::json farFuture = document;
    farFuture["classes"]["TYPE_FLAT"]["created_at"] = std::numeric_limits<long long>::max();
    assert(RejectsImport([&] { TaxonomyJsonCodec::DecodeSnapshot(farFuture); }));
    farFuture["classes"]["TYPE_FLAT"]["created_at"] = std::numeric_limits<long long>::min();
    assert(RejectsImport([&] { TaxonomyJsonCodec::DecodeSnapshot(farFuture); }));
    nlohmann::json badRecordTime = document;
    badRecordTime["change_records"][0]["timestamp"] = std::numeric_limits<long long>::max();
    assert(RejectsImport([&] { TaxonomyJsonCodec::DecodeSnapshot(badRecordTime); }));
    assert(RejectsImport([] { TaxonomyJsonCodec::FromMillis(std::numeric_limits<long long>::max()); }));

    const long long year2255 = 9000000000000LL;
    assert(TaxonomyJsonCodec::ToMillis(TaxonomyJsonCodec::FromMillis(year2255)) == year2255);
    nlohmann::json lateDate = document;
    lateDate["classes"]["TYPE_FLAT"]["created_at"] = year2255;
    auto lateSnapshot = TaxonomyJsonCodec::DecodeSnapshot(lateDate);
    for (const auto& entry : lateSnapshot.entries) {
        if (entry.definition->classId() == "TYPE_FLAT") {
            assert(TaxonomyJsonCodec::ToMillis(entry.definition->createdAt()) == year2255);
        }
    }

    persistence->saveText(path, "{ not json");
    assert(RejectsImport([&] { store.Load(path); }));
    assert(RejectsImport([&] { store.Load(testRoot + "/missing.json"); }));
    assert(store.LoadOrEmpty(testRoot + "/missing.json").entries.empty());
    assert(restored.Size() == sizeBefore);
    std::cout << "[PASS] Malformed documents rejected." << std::endl;

    // Collaborator inputs.
    nlohmann::json input = {{"id", "axe1"}, {"length", 12.5}, {"socket", true}, {"label", "text"}};
    Artifact artifact = TaxonomyJsonCodec::DecodeArtifact(input);
    assert(artifact.id == "axe1");
    assert(artifact.features.size() == 2);
    assert(GetNumber(artifact.features, "length") == 12.5);
    assert(GetFlag(artifact.features, "socket") == true);

    auto clusters = TaxonomyJsonCodec::DecodeClusterAssignments({{"a", 0}, {"b", -1}, {"c", "x"}});
    assert(clusters.at("a") == "0" && clusters.at("b") == TaxonomyRegistry::NoiseLabel && clusters.at("c") == "x");

    ParameterChangeSet changes = TaxonomyJsonCodec::DecodeChangeSet(
        {{"morphometric", {{"length", {{"max_threshold", 135}}}}}, {"gates", {{"socket", nullptr}, {"lunate", true}}}});
    assert(changes.parameters.at("length").maxThreshold == 135.0);
    assert(!changes.parameters.at("length").targetValue);
    assert(!changes.gates.at("socket").has_value() && changes.gates.at("lunate") == true);
    std::cout << "[PASS] Collaborator inputs decoded." << std::endl;

    std::filesystem::remove_all(testRoot);
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
