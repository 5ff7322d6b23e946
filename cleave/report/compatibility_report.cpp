// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <cleave/analysis/call_graph.hpp>
#include <cleave/core/config.hpp>
#include <cleave/core/string_util.hpp>
#include <cleave/model/contract_model.hpp>
#include <cleave/model/model_json.hpp>
#include <cleave/partition/facet.hpp>
#include <cleave/report/compatibility_report.hpp>
#include <cleave/simulation/sim_hash.hpp>
#include <cleave/simulation/simulator.hpp>
#include <cleave/storage/storage_layout.hpp>

#include <nlohmann/json.hpp>
#include <quill/Quill.h>
#include <quill/bundled/fmt/format.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <map>
#include <span>
#include <string>
#include <utility>
#include <vector>

CLEAVE_NAMESPACE_BEGIN

CLEAVE_ANONYMOUS_NAMESPACE_BEGIN

constexpr double TARGET_FACET_COUNT = 5.0;
constexpr double TARGET_AVERAGE_DEPENDENCIES = 1.5;
constexpr std::size_t MAX_FACET_DEPENDENCIES = 2;
constexpr std::size_t MAX_FACETS_PER_MANIFEST = 32;
constexpr uint64_t MAX_TOTAL_FACET_SIZE = 500'000;
constexpr std::size_t MAX_STATE_VARIABLES = 50;

constexpr uint64_t DEPLOYMENT_BASE_GAS = 100'000;
constexpr uint64_t DEPLOYMENT_GAS_PER_BYTE = 10;
constexpr uint64_t ROUTE_SETUP_GAS = 30'000;

std::string signature(FunctionDescriptor const &fn)
{
    std::string sig = fn.name + "(";
    for (std::size_t i = 0; i < fn.parameters.size(); ++i) {
        if (i != 0) {
            sig += ',';
        }
        sig += fn.parameters[i].type;
    }
    return sig + ")";
}

bool near_ceiling(FacetCandidate const &facet, uint64_t const safe_facet_size)
{
    return static_cast<double>(facet.estimated_size) >
           0.9 * static_cast<double>(safe_facet_size);
}

bool large(FacetCandidate const &facet, uint64_t const safe_facet_size)
{
    return static_cast<double>(facet.estimated_size) >
           0.7 * static_cast<double>(safe_facet_size);
}

bool worth_splitting(
    FacetCandidate const &facet, uint64_t const safe_facet_size)
{
    return static_cast<double>(facet.estimated_size) >
           0.8 * static_cast<double>(safe_facet_size);
}

std::vector<std::string> layout_warnings(
    ContractModel const &model, std::span<FacetCandidate const> const facets)
{
    std::vector<std::string> warnings;
    if (facets.size() > MAX_FACETS_PER_MANIFEST) {
        warnings.push_back(fmt::format(
            "Facet count ({}) exceeds recommended limit ({})",
            facets.size(),
            MAX_FACETS_PER_MANIFEST));
    }
    uint64_t total_size = 0;
    for (auto const &facet : facets) {
        total_size += facet.estimated_size;
    }
    if (total_size > MAX_TOTAL_FACET_SIZE) {
        warnings.emplace_back(
            "Total deployment size is very large - consider further "
            "optimization");
    }
    if (model.variables.size() > MAX_STATE_VARIABLES) {
        warnings.emplace_back(
            "Large number of state variables may require Diamond storage "
            "patterns");
    }
    return warnings;
}

std::vector<std::string> layout_recommendations(
    CallGraph const &graph, std::span<FacetCandidate const> const facets,
    uint64_t const safe_facet_size)
{
    std::vector<std::string> recommendations;
    if (std::ranges::any_of(facets, [&](FacetCandidate const &facet) {
            return worth_splitting(facet, safe_facet_size);
        })) {
        recommendations.emplace_back(
            "Consider splitting large facets to maintain upgrade flexibility");
    }
    if (std::ranges::count_if(facets, [](FacetCandidate const &facet) {
            return facet.security_level == SecurityLevel::Critical;
        }) > 1) {
        recommendations.emplace_back(
            "Consolidate admin functions into a single AdminFacet for better "
            "security");
    }
    if (!graph.cycles.empty()) {
        recommendations.emplace_back(
            "Refactor circular dependencies to improve facet modularity");
    }
    return recommendations;
}

CLEAVE_ANONYMOUS_NAMESPACE_END

char const *to_string(DeploymentStrategy const s)
{
    switch (s) {
    case DeploymentStrategy::Sequential:
        return "sequential";
    case DeploymentStrategy::Parallel:
        return "parallel";
    case DeploymentStrategy::Mixed:
        return "mixed";
    }
    std::unreachable();
}

nlohmann::json CompatibilityReport::to_json() const
{
    nlohmann::json res{};
    res["facetSize"] = {{"passed", size_ok}, {"violations", size_violations}};
    res["storage"] = {{"passed", storage_ok}, {"conflicts", storage_conflicts}};
    res["selectors"] = {
        {"passed", selectors_ok}, {"collisions", selector_collisions}};
    res["diamond"] = {{"passed", diamond_ok}, {"issues", diamond_issues}};
    res["upgradePath"] = {{"passed", upgrade_ok}, {"blockers", upgrade_blockers}};
    res["compatible"] = compatible();
    res["gasOptimizationScore"] = gas_optimization_score;
    res["deploymentStrategy"] = to_string(strategy);
    res["estimatedTotalGas"] = estimated_total_gas;
    res["warnings"] = warnings;
    res["recommendations"] = recommendations;
    return res;
}

unsigned gas_optimization_score(
    std::span<FacetCandidate const> const facets,
    uint64_t const safe_facet_size)
{
    if (facets.empty()) {
        return 0;
    }
    auto const n = static_cast<double>(facets.size());
    std::size_t oversized = 0;
    std::size_t critical = 0;
    std::size_t dependencies = 0;
    for (auto const &facet : facets) {
        if (facet.estimated_size > safe_facet_size) {
            ++oversized;
        }
        if (facet.security_level == SecurityLevel::Critical) {
            ++critical;
        }
        dependencies += facet.dependencies.size();
    }
    double const count_term =
        std::max(0.0, 1.0 - std::abs(n - TARGET_FACET_COUNT) / TARGET_FACET_COUNT);
    double const size_term = 1.0 - static_cast<double>(oversized) / n;
    double const security_term = critical == 1 ? 1.0 : 0.5;
    double const average = static_cast<double>(dependencies) / n;
    double const dependency_term = std::max(
        0.0,
        1.0 - std::abs(average - TARGET_AVERAGE_DEPENDENCIES) /
                  TARGET_AVERAGE_DEPENDENCIES);
    double const score = 20.0 * count_term + 25.0 * size_term +
                         25.0 * security_term + 30.0 * dependency_term;
    return static_cast<unsigned>(std::clamp(std::lround(score), 0l, 100l));
}

DeploymentStrategy recommend_strategy(
    std::span<FacetCandidate const> const facets,
    uint64_t const safe_facet_size)
{
    std::size_t critical = 0;
    std::size_t large_facets = 0;
    for (auto const &facet : facets) {
        if (facet.security_level == SecurityLevel::Critical) {
            ++critical;
        }
        if (large(facet, safe_facet_size)) {
            ++large_facets;
        }
    }
    double const half = static_cast<double>(facets.size()) / 2.0;
    if (static_cast<double>(critical) > half ||
        static_cast<double>(large_facets) > half) {
        return DeploymentStrategy::Sequential;
    }
    if (facets.size() <= 3 && critical <= 1 && large_facets == 0) {
        return DeploymentStrategy::Parallel;
    }
    return DeploymentStrategy::Mixed;
}

std::vector<std::string> find_selector_collisions(ContractModel const &model)
{
    std::vector<std::string> collisions;
    std::map<uint32_t, std::string> declared;
    std::map<uint32_t, std::string> simulated;
    for (auto const &fn : model.functions) {
        // zero means the front end left the selector out
        if (fn.selector != 0) {
            auto const [it, inserted] = declared.emplace(fn.selector, fn.name);
            if (!inserted) {
                collisions.push_back(fmt::format(
                    "Functions {} and {} share selector {}",
                    it->second,
                    fn.name,
                    selector_to_string(fn.selector)));
            }
        }
        auto const sim = sim_selector(signature(fn));
        auto const [it, inserted] = simulated.emplace(sim, fn.name);
        if (!inserted) {
            collisions.push_back(fmt::format(
                "Simulated selectors of {} and {} coincide at {}",
                it->second,
                fn.name,
                selector_to_string(sim)));
        }
    }
    return collisions;
}

uint64_t
estimate_total_deployment_gas(std::span<FacetCandidate const> const facets)
{
    uint64_t gas = DEPLOYMENT_BASE_GAS;
    for (auto const &facet : facets) {
        gas += facet.estimated_size * DEPLOYMENT_GAS_PER_BYTE + ROUTE_SETUP_GAS;
    }
    return gas;
}

CompatibilityReport aggregate(
    ContractModel const &model, CallGraph const &graph,
    std::span<FacetCandidate const> const facets,
    StorageLayoutReport const &storage,
    std::span<SimulationResult const> const simulations,
    uint64_t const safe_facet_size)
{
    CompatibilityReport report;

    for (auto const &facet : facets) {
        if (facet.estimated_size > safe_facet_size) {
            report.size_violations.push_back(fmt::format(
                "{}: {} bytes exceeds {} bytes",
                facet.name,
                facet.estimated_size,
                safe_facet_size));
        }
        if (near_ceiling(facet, safe_facet_size)) {
            report.upgrade_blockers.push_back(fmt::format(
                "{} is within 10% of the size ceiling ({} bytes)",
                facet.name,
                facet.estimated_size));
        }
        if (facet.dependencies.size() > MAX_FACET_DEPENDENCIES) {
            report.upgrade_blockers.push_back(fmt::format(
                "{} depends on {} facets",
                facet.name,
                facet.dependencies.size()));
        }
    }
    report.size_ok = report.size_violations.empty();
    report.upgrade_ok = report.upgrade_blockers.empty();

    for (auto const &conflict : storage.conflicts) {
        report.storage_conflicts.push_back(fmt::format(
            "slot {} ({}): {}",
            conflict.slot,
            to_string(conflict.severity),
            fmt::join(conflict.facets(), ", ")));
    }
    report.storage_ok = report.storage_conflicts.empty();

    report.selector_collisions = find_selector_collisions(model);
    report.selectors_ok = report.selector_collisions.empty();

    for (auto const &var : model.variables) {
        if (var.name.find("__gap") != std::string::npos) {
            report.diamond_issues.push_back(fmt::format(
                "{} is a storage gap; facets use namespaced storage instead",
                var.name));
        }
        else if (
            !model.inheritance.empty() && var.occupies_storage() &&
            var.slot == 0) {
            report.diamond_issues.push_back(fmt::format(
                "{} occupies slot 0 of an inherited layout", var.name));
        }
    }
    for (auto const &pattern : storage.diamond_patterns) {
        if (!pattern.valid) {
            report.diamond_issues.push_back(fmt::format(
                "{} has no unique storage namespace", pattern.facet));
        }
    }
    report.diamond_ok = report.diamond_issues.empty();

    report.gas_optimization_score =
        gas_optimization_score(facets, safe_facet_size);
    report.strategy = recommend_strategy(facets, safe_facet_size);
    report.estimated_total_gas = estimate_total_deployment_gas(facets);

    report.warnings = layout_warnings(model, facets);
    for (auto const &result : simulations) {
        if (!result.success) {
            report.warnings.push_back(fmt::format(
                "Simulation {} failed: {}",
                result.name,
                fmt::join(result.warnings, "; ")));
        }
    }
    for (auto const &issue : storage.security_issues) {
        report.warnings.push_back(issue);
    }
    report.recommendations = storage.recommendations;
    for (auto const &hint : storage.gas_optimizations) {
        report.recommendations.push_back(hint);
    }
    for (auto &hint : layout_recommendations(graph, facets, safe_facet_size)) {
        report.recommendations.push_back(std::move(hint));
    }
    if (report.strategy == DeploymentStrategy::Sequential) {
        report.recommendations.emplace_back(
            "Deploy facets one at a time and verify each before routing");
    }

    LOG_INFO(
        "report {}: compatible={} score={} strategy={}",
        model.name,
        report.compatible(),
        report.gas_optimization_score,
        to_string(report.strategy));
    return report;
}

CLEAVE_NAMESPACE_END
