/**
 * @file TypoLabCli.hpp
 * @brief Command-line front end: define, classify, modify and discover classes.
 *
 * The taxonomy lives in one JSON document (default under $XDG_DATA_HOME/typolab),
 * loaded at start and saved after every mutating command. Results are written
 * as JSON to the output stream; diagnostics go to stderr/clog.
 */

#pragma once

#include <iosfwd>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "application/taxonomy/TaxonomyRegistry.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/TaxonomyFileStore.hpp"

namespace typolab::app {

void PrintUsage(std::ostream& out);

/**
 * @struct CommandLine
 * @brief Positionals and --options. "--all" and "--help" take no value.
 */
struct CommandLine {
    std::vector<std::string> positional;
    std::map<std::string, std::string> options;

    /** @throws std::invalid_argument when an option is missing its value. */
    static CommandLine Parse(const std::vector<std::string>& args);
    static CommandLine Parse(int argc, char** argv);

    bool has(const std::string& name) const { return options.count(name) > 0; }
    std::optional<std::string> get(const std::string& name) const;

    /** @brief Positional argument after the command; throws invalid_argument if absent. */
    const std::string& arg(std::size_t index, const char* what) const;
};

/**
 * @class TypoLabCli
 * @brief Runs one command against the taxonomy file.
 *
 * Exceptions from the engine propagate out of Run(); RunCommandLine maps
 * them to an exit code.
 */
class TypoLabCli {
public:
    TypoLabCli(const CommandLine& cl, infrastructure::TaxonomySettings settings,
               std::string taxonomyPath, std::ostream& out);

    int Run();

private:
    application::taxonomy::BuilderOptions MakeBuilderOptions() const;
    double ToleranceFactor() const;
    void Persist();
    void Print(const nlohmann::json& j);

    int DefineClass();
    int Classify();
    int ListClasses();
    int Modify();
    int Discover();
    int Stats();
    int Savignano();

    const CommandLine& m_cl;
    infrastructure::TaxonomySettings m_settings;
    std::string m_taxonomyPath;
    std::ostream& m_out;
    std::shared_ptr<infrastructure::PersistenceService> m_persistence;
    infrastructure::TaxonomyFileStore m_store;
    application::taxonomy::TaxonomyRegistry m_registry;
};

/**
 * @brief Resolves --config/--taxonomy, runs the command and reports errors.
 * @return EXIT_SUCCESS or EXIT_FAILURE.
 */
int RunCommandLine(const CommandLine& cl, std::ostream& out);

} // namespace typolab::app
