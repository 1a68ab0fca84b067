#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>

#include "domain/taxonomy/ClassDefinition.hpp"
#include "domain/taxonomy/Scorer.hpp"

using namespace typolab::domain::taxonomy;

namespace {

bool Near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) < eps;
}

std::shared_ptr<const ClassDefinition> MakeClass(const std::string& id, double target, double weight = 1.0,
                                                 GateMap gates = {}) {
    ParameterMap params;
    params.emplace("length", Parameter("length", target, target - 10.0, target + 10.0, 20.0, weight));
    return std::make_shared<const ClassDefinition>(id, id, "", std::move(params), ParameterMap{}, std::move(gates));
}

} // namespace

int main() {
    std::cout << "[Test] Starting Scorer Test..." << std::endl;

    // Gate short-circuit: a perfect continuous fit is still rejected.
    auto socketed = MakeClass("TYPE_SOCKETED", 100.0, 1.0, {{"has_socket", true}});
    auto rejected = Scorer::Classify(*socketed, {{"length", 100.0}, {"has_socket", false}});
    assert(!rejected.isMember);
    assert(rejected.confidence == 0.0);
    assert(rejected.failedGate && *rejected.failedGate == "has_socket");
    assert(rejected.diagnostic.empty() && "No parameter is scored after a failed gate.");

    auto missingGate = Scorer::Classify(*socketed, {{"length", 100.0}});
    assert(missingGate.failedGate && missingGate.confidence == 0.0);
    assert(!missingGate.gates.at("has_socket").observed.has_value());

    auto accepted = Scorer::Classify(*socketed, {{"length", 100.0}, {"has_socket", true}});
    assert(accepted.isMember && accepted.confidence == 1.0);
    assert(!accepted.failedGate);
    assert(accepted.gates.at("has_socket").satisfied);
    std::cout << "[PASS] Gates short-circuit scoring." << std::endl;

    // Weighted average across both namespaces.
    ParameterMap morph;
    morph.emplace("length", Parameter("length", 100.0, 90.0, 110.0, 10.0, 3.0));
    ParameterMap tech;
    tech.emplace("socket_depth", Parameter("socket_depth", 20.0, 15.0, 25.0, 5.0, 1.0));
    ClassDefinition mixed("TYPE_MIXED", "Mixed", "", morph, tech, {}, 0.8);
    auto r = Scorer::Classify(mixed, {{"length", 105.0}, {"socket_depth", 20.0}});
    // (3 * 0.5 + 1 * 1.0) / 4
    assert(Near(r.confidence, 0.625));
    assert(!r.isMember);
    assert(r.diagnostic.at("socket_depth").section == ParameterSection::Technological);
    assert(r.diagnostic.at("length").section == ParameterSection::Morphometric);
    assert(Near(r.diagnostic.at("length").score, 0.5));
    std::cout << "[PASS] Weighted confidence over both namespaces." << std::endl;

    // Membership threshold is inclusive.
    ClassDefinition inclusive("TYPE_INC", "Inc", "", morph, tech, {}, 0.625);
    assert(Scorer::Classify(inclusive, {{"length", 105.0}, {"socket_depth", 20.0}}).isMember);

    // Zero weights: excluded from the average; all-zero means confidence 0.
    ParameterMap zeroed;
    zeroed.emplace("length", Parameter("length", 100.0, 90.0, 110.0, 10.0, 0.0));
    zeroed.emplace("width", Parameter("width", 50.0, 40.0, 60.0, 10.0, 1.0));
    ClassDefinition partlyZero("TYPE_Z", "Z", "", zeroed, {}, {});
    auto z = Scorer::Classify(partlyZero, {{"width", 50.0}});
    assert(z.confidence == 1.0 && "Zero-weight parameters do not dilute confidence.");
    assert(z.diagnostic.count("length") == 1);

    ParameterMap allZero;
    allZero.emplace("length", Parameter("length", 100.0, 90.0, 110.0, 10.0, 0.0));
    ClassDefinition weightless("TYPE_W", "W", "", allZero, {}, {});
    assert(Scorer::Classify(weightless, {{"length", 100.0}}).confidence == 0.0);

    ClassDefinition empty("TYPE_EMPTY", "Empty", "", {}, {}, {});
    auto e = Scorer::Classify(empty, {{"length", 100.0}});
    assert(e.confidence == 0.0 && !e.isMember);
    std::cout << "[PASS] Zero and empty weights." << std::endl;

    // Ranking: confidence desc, then class_id asc.
    std::vector<std::shared_ptr<const ClassDefinition>> classes = {
        MakeClass("TYPE_C", 100.0), MakeClass("TYPE_A", 100.0), MakeClass("TYPE_B", 110.0), socketed};
    auto ranked = Scorer::ClassifyAll(classes, {{"length", 100.0}});
    assert(ranked.size() == 4);
    assert(ranked[0].classId == "TYPE_A");
    assert(ranked[1].classId == "TYPE_C");
    assert(ranked[2].classId == "TYPE_B");
    assert(ranked[3].classId == "TYPE_SOCKETED");
    assert(Near(ranked[2].confidence, 0.5));
    assert(Scorer::ClassifyAll({}, {{"length", 1.0}}).empty());
    std::cout << "[PASS] Ranking with ties." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
