/**
 * @file TypoLabCli.cpp
 * @brief Implementation of the typolab command-line front end.
 */

#include "app/TypoLabCli.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

#include "application/taxonomy/ClassBuilder.hpp"
#include "application/taxonomy/SavignanoTaxonomy.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/TaxonomyJsonCodec.hpp"

namespace typolab::app {

using namespace typolab::application::taxonomy;
using namespace typolab::domain::taxonomy;
using namespace typolab::infrastructure;
using nlohmann::json;

namespace {

// Upper bound for count options such as --min-size.
constexpr double MaxCount = 1e9;

double ParseNumber(const std::string& text, const char* option) {
    try {
        std::size_t used = 0;
        double value = std::stod(text, &used);
        if (used == text.size() && std::isfinite(value)) return value;
    } catch (const std::logic_error&) {
    }
    throw std::invalid_argument(std::string("option ") + option + " expects a number, got '" + text + "'");
}

std::size_t ParseCount(const std::string& text, const char* option) {
    const double value = ParseNumber(text, option);
    if (value < 1 || value > MaxCount || std::floor(value) != value) {
        throw std::invalid_argument(std::string("option ") + option + " expects a whole number between 1 and 1000000000, got '" + text + "'");
    }
    return static_cast<std::size_t>(value);
}

json ReadJsonFile(PersistenceService& persistence, const std::string& path) {
    try {
        return json::parse(persistence.loadText(path));
    } catch (const json::parse_error& e) {
        throw MalformedImport("invalid JSON in " + path + ": " + e.what());
    }
}

} // namespace

void PrintUsage(std::ostream& out) {
    out <<
        "Usage: typolab [--taxonomy FILE] [--config FILE] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  define-class NAME REFERENCES.json [--weights W.json] [--tolerance F]\n"
        "               [--class-id ID] [--description TEXT] [--threshold T]\n"
        "  classify FEATURES.json [--all] [--artifact-id ID]\n"
        "  list-classes\n"
        "  modify CLASS_ID CHANGES.json --justification TEXT [--operator NAME]\n"
        "  discover ARTIFACTS.json CLUSTERS.json [--min-size N] [--tolerance F]\n"
        "  stats\n"
        "  savignano FEATURES.json [--artifact-id ID]\n";
}

// --- CommandLine ---

CommandLine CommandLine::Parse(const std::vector<std::string>& args) {
    static const std::vector<std::string> switches = {"--all", "--help"};
    CommandLine cl;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg.rfind("--", 0) != 0) {
            cl.positional.push_back(arg);
            continue;
        }
        if (std::find(switches.begin(), switches.end(), arg) != switches.end()) {
            cl.options[arg] = "1";
            continue;
        }
        if (i + 1 >= args.size()) {
            throw std::invalid_argument("option " + arg + " needs a value");
        }
        cl.options[arg] = args[++i];
    }
    return cl;
}

CommandLine CommandLine::Parse(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    return Parse(args);
}

std::optional<std::string> CommandLine::get(const std::string& name) const {
    auto it = options.find(name);
    if (it == options.end()) return std::nullopt;
    return it->second;
}

const std::string& CommandLine::arg(std::size_t index, const char* what) const {
    // positional[0] is the command itself
    if (index + 1 >= positional.size()) {
        throw std::invalid_argument(std::string("missing argument: ") + what);
    }
    return positional[index + 1];
}

// --- TypoLabCli ---

TypoLabCli::TypoLabCli(const CommandLine& cl, TaxonomySettings settings, std::string taxonomyPath, std::ostream& out)
    : m_cl(cl),
      m_settings(std::move(settings)),
      m_taxonomyPath(std::move(taxonomyPath)),
      m_out(out),
      m_persistence(std::make_shared<PersistenceService>()),
      m_store(m_persistence) {}

int TypoLabCli::Run() {
    const std::string& command = m_cl.positional.front();
    if (command == "savignano") return Savignano();

    m_registry.Import(m_store.LoadOrEmpty(m_taxonomyPath));

    if (command == "define-class") return DefineClass();
    if (command == "classify") return Classify();
    if (command == "list-classes") return ListClasses();
    if (command == "modify") return Modify();
    if (command == "discover") return Discover();
    if (command == "stats") return Stats();

    std::cerr << "[typolab] Error: unknown command '" << command << "'" << std::endl;
    PrintUsage(std::cerr);
    return EXIT_FAILURE;
}

BuilderOptions TypoLabCli::MakeBuilderOptions() const {
    BuilderOptions options;
    options.classId = m_cl.get("--class-id");
    options.description = m_cl.get("--description");
    options.confidenceThreshold = m_cl.has("--threshold")
        ? ParseNumber(*m_cl.get("--threshold"), "--threshold")
        : m_settings.confidenceThreshold;
    options.technologicalKeys = m_settings.technologicalKeys;
    if (!m_settings.operatorName.empty()) options.createdBy = m_settings.operatorName;
    return options;
}

double TypoLabCli::ToleranceFactor() const {
    return m_cl.has("--tolerance") ? ParseNumber(*m_cl.get("--tolerance"), "--tolerance")
                                   : m_settings.toleranceFactor;
}

void TypoLabCli::Persist() {
    m_store.Save(m_taxonomyPath, m_registry.Export());
}

void TypoLabCli::Print(const json& j) {
    m_out << j.dump(2) << std::endl;
}

int TypoLabCli::DefineClass() {
    const std::string& name = m_cl.arg(0, "NAME");
    auto references = TaxonomyJsonCodec::DecodeArtifacts(ReadJsonFile(*m_persistence, m_cl.arg(1, "REFERENCES.json")));
    std::map<std::string, double> weights;
    if (auto path = m_cl.get("--weights")) {
        weights = TaxonomyJsonCodec::DecodeWeights(ReadJsonFile(*m_persistence, *path));
    }

    auto def = m_registry.Register(
        ClassBuilder::DefineFromReferenceGroup(name, references, weights, ToleranceFactor(), MakeBuilderOptions()));
    Persist();
    Print(TaxonomyJsonCodec::EncodeClass(m_registry.Entry(def->classId())));
    return EXIT_SUCCESS;
}

int TypoLabCli::Classify() {
    json input = ReadJsonFile(*m_persistence, m_cl.arg(0, "FEATURES.json"));
    const bool all = m_cl.has("--all");

    json output;
    if (input.is_array()) {
        auto artifacts = TaxonomyJsonCodec::DecodeArtifacts(input);
        auto ranked = m_registry.ClassifyBatch(artifacts);
        output = json::array();
        for (std::size_t i = 0; i < artifacts.size(); ++i) {
            json item = {{"artifact_id", artifacts[i].id}};
            if (all) {
                item["results"] = TaxonomyJsonCodec::EncodeResults(ranked[i]);
            } else {
                item["best"] = ranked[i].empty() ? json(nullptr) : TaxonomyJsonCodec::EncodeResult(ranked[i].front());
            }
            output.push_back(item);
        }
    } else {
        Artifact artifact = TaxonomyJsonCodec::DecodeArtifact(input, m_cl.get("--artifact-id").value_or("unknown"));
        if (auto id = m_cl.get("--artifact-id")) artifact.id = *id;
        if (all) {
            output = TaxonomyJsonCodec::EncodeResults(m_registry.ClassifyAll(artifact.features, artifact.id));
        } else {
            auto best = m_registry.Classify(artifact.features, artifact.id);
            output = best ? TaxonomyJsonCodec::EncodeResult(*best) : json(nullptr);
        }
    }
    Persist(); // classification log
    Print(output);
    return EXIT_SUCCESS;
}

int TypoLabCli::ListClasses() {
    json output = json::array();
    for (const auto& id : m_registry.ClassIds()) {
        const RegistryEntry entry = m_registry.Entry(id);
        output.push_back({
            {"class_id", id},
            {"name", entry.definition->name()},
            {"content_hash", entry.definition->contentHash()},
            {"n_parameters", entry.definition->parameterCount()},
            {"confidence_threshold", entry.definition->confidenceThreshold()},
            {"supersedes", entry.supersedes ? json(*entry.supersedes) : json(nullptr)},
            {"superseded_by", entry.supersededBy}
        });
    }
    Print(output);
    return EXIT_SUCCESS;
}

int TypoLabCli::Modify() {
    const std::string& classId = m_cl.arg(0, "CLASS_ID");
    ParameterChangeSet changes = TaxonomyJsonCodec::DecodeChangeSet(ReadJsonFile(*m_persistence, m_cl.arg(1, "CHANGES.json")));
    const std::string justification = m_cl.get("--justification").value_or("");
    const std::string operatorName = m_cl.get("--operator").value_or(m_settings.operatorName);

    ModifyOutcome outcome = m_registry.Modify(classId, changes, justification, operatorName);
    if (outcome.created) Persist();
    Print({{"class_id", outcome.classId}, {"created", outcome.created}, {"from_class_id", classId}});
    return EXIT_SUCCESS;
}

int TypoLabCli::Discover() {
    auto artifacts = TaxonomyJsonCodec::DecodeArtifacts(ReadJsonFile(*m_persistence, m_cl.arg(0, "ARTIFACTS.json")));
    auto assignments = TaxonomyJsonCodec::DecodeClusterAssignments(ReadJsonFile(*m_persistence, m_cl.arg(1, "CLUSTERS.json")));

    DiscoveryOptions options;
    options.minClusterSize = m_settings.minClusterSize;
    if (auto minSize = m_cl.get("--min-size")) {
        options.minClusterSize = ParseCount(*minSize, "--min-size");
    }
    options.toleranceFactor = ToleranceFactor();
    options.builder = MakeBuilderOptions();

    DiscoveryReport report = m_registry.Discover(artifacts, assignments, options);
    if (!report.promoted.empty()) Persist();
    Print(TaxonomyJsonCodec::EncodeDiscoveryReport(report));
    return EXIT_SUCCESS;
}

int TypoLabCli::Stats() {
    Print(TaxonomyJsonCodec::EncodeStatistics(m_registry.Statistics()));
    return EXIT_SUCCESS;
}

int TypoLabCli::Savignano() {
    json input = ReadJsonFile(*m_persistence, m_cl.arg(0, "FEATURES.json"));
    Artifact artifact = TaxonomyJsonCodec::DecodeArtifact(input);
    if (auto id = m_cl.get("--artifact-id")) artifact.id = *id;

    SavignanoClassifier classifier;
    Print(TaxonomyJsonCodec::EncodeSavignanoResult(classifier.Classify(artifact)));
    return EXIT_SUCCESS;
}

// --- Entry point ---

int RunCommandLine(const CommandLine& cl, std::ostream& out) {
    if (cl.positional.empty() || cl.has("--help")) {
        PrintUsage(std::cerr);
        return cl.has("--help") ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    const std::string configPath = cl.get("--config").value_or(PathUtils::GetDefaultSettingsPath().string());
    const std::string taxonomyPath = cl.get("--taxonomy").value_or(PathUtils::GetDefaultTaxonomyPath().string());

    try {
        TypoLabCli cli(cl, ConfigLoader::Load(configPath), taxonomyPath, out);
        return cli.Run();
    } catch (const TaxonomyError& e) {
        std::cerr << "[typolab] Error: " << e.what() << std::endl;
    } catch (const std::invalid_argument& e) {
        std::cerr << "[typolab] Error: " << e.what() << std::endl;
        PrintUsage(std::cerr);
    } catch (const std::runtime_error& e) {
        std::cerr << "[typolab] Error: " << e.what() << std::endl;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[typolab] Error: " << e.what() << std::endl;
    }
    return EXIT_FAILURE;
}

} // namespace typolab::app
