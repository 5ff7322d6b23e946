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
#include <cleave/analysis/function_metrics.hpp>
#include <cleave/core/config.hpp>
#include <cleave/model/contract_model.hpp>
#include <cleave/partition/facet.hpp>
#include <cleave/report/compatibility_report.hpp>
#include <cleave/report/refactor_plan.hpp>

#include <nlohmann/json.hpp>
#include <quill/bundled/fmt/format.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <utility>
#include <vector>

CLEAVE_NAMESPACE_BEGIN

CLEAVE_ANONYMOUS_NAMESPACE_BEGIN

constexpr uint64_t MONOLITH_BASE_GAS = 50'000;
constexpr uint64_t VARIABLE_GAS = 20'000;
constexpr uint64_t FACET_BASE_GAS = 30'000;
constexpr uint64_t DISPATCHER_SETUP_GAS = 25'000;
// per-facet savings from smaller dispatch tables and cheaper upgrades
constexpr uint64_t FACET_DISPATCH_SAVINGS = 5'000;
constexpr uint64_t FACET_UPGRADE_SAVINGS = 2'000;
constexpr uint64_t ROUTING_OVERHEAD_PER_FUNCTION = 300;

constexpr std::size_t MAX_RECOMMENDED_FACETS = 8;
constexpr std::size_t MAX_RECOMMENDED_VARIABLES = 20;
constexpr std::size_t MAX_CRITICAL_FACETS = 2;
constexpr std::size_t MAX_FACET_DEPENDENCIES = 2;

CLEAVE_ANONYMOUS_NAMESPACE_END

nlohmann::json RefactorPlan::to_json() const
{
    nlohmann::json res{};
    res["facets"] = nlohmann::json::array();
    for (auto const &facet : facets) {
        res["facets"].push_back(facet.to_json());
    }
    res["sharedComponents"] = shared_components;
    res["deploymentStrategy"] = to_string(strategy);
    res["estimatedGasSavings"] = estimated_gas_savings;
    res["warnings"] = warnings;
    res["callGraph"] = call_graph.to_json();
    res["compatibilityReport"] = compatibility.to_json();
    return res;
}

std::vector<std::string> shared_components(
    ContractModel const &model, std::span<FacetCandidate const> const facets)
{
    std::vector<std::string> components{"LibDiamond", "LibStorage"};
    if (std::ranges::any_of(facets, [](FacetCandidate const &facet) {
            return facet.category == FacetCategory::Admin;
        })) {
        components.emplace_back("AccessControlLib");
    }
    if (std::ranges::any_of(model.functions, [](FunctionDescriptor const &fn) {
            return fn.mutability == Mutability::Payable;
        })) {
        components.emplace_back("ReentrancyGuard");
    }
    if (!model.events.empty()) {
        components.emplace_back("EventEmitter");
    }
    return components;
}

uint64_t estimate_gas_savings(
    ContractModel const &model, std::span<FacetCandidate const> const facets)
{
    uint64_t monolith = MONOLITH_BASE_GAS + VARIABLE_GAS * model.variables.size();
    for (auto const &fn : model.functions) {
        monolith += estimate_function_gas(fn);
    }
    uint64_t faceted = DISPATCHER_SETUP_GAS + FACET_BASE_GAS * facets.size();
    for (auto const &facet : facets) {
        faceted += facet.estimated_size;
    }
    uint64_t const gains = monolith + (FACET_DISPATCH_SAVINGS +
                                       FACET_UPGRADE_SAVINGS) *
                                          facets.size();
    uint64_t const costs =
        faceted + ROUTING_OVERHEAD_PER_FUNCTION * model.functions.size();
    return gains > costs ? gains - costs : 0;
}

std::vector<std::string> plan_warnings(
    ContractModel const &model, CallGraph const &graph,
    std::span<FacetCandidate const> const facets,
    uint64_t const safe_facet_size)
{
    std::vector<std::string> warnings;
    if (facets.size() > MAX_RECOMMENDED_FACETS) {
        warnings.push_back(fmt::format(
            "{} facets increase routing complexity", facets.size()));
    }
    if (model.variables.size() > MAX_RECOMMENDED_VARIABLES) {
        warnings.push_back(fmt::format(
            "{} state variables; review shared storage carefully",
            model.variables.size()));
    }
    auto const critical =
        std::ranges::count_if(facets, [](FacetCandidate const &facet) {
            return facet.security_level == SecurityLevel::Critical;
        });
    if (static_cast<std::size_t>(critical) > MAX_CRITICAL_FACETS) {
        warnings.push_back(fmt::format(
            "{} facets hold critical functions; consolidate access control",
            critical));
    }
    for (auto const &facet : facets) {
        if (facet.estimated_size > safe_facet_size) {
            warnings.push_back(fmt::format(
                "{} exceeds the {} byte working ceiling",
                facet.name,
                safe_facet_size));
        }
        if (facet.dependencies.size() > MAX_FACET_DEPENDENCIES) {
            warnings.push_back(fmt::format(
                "{} depends on {} other facets",
                facet.name,
                facet.dependencies.size()));
        }
    }
    for (auto const &cycle : graph.cycles) {
        warnings.push_back(
            fmt::format("Call cycle: {}", fmt::join(cycle, " -> ")));
    }
    return warnings;
}

RefactorPlan build_refactor_plan(
    ContractModel const &model, CallGraph graph,
    std::vector<FacetCandidate> facets, CompatibilityReport compatibility,
    uint64_t const safe_facet_size)
{
    RefactorPlan plan;
    plan.shared_components = shared_components(model, facets);
    plan.strategy = compatibility.strategy;
    plan.estimated_gas_savings = estimate_gas_savings(model, facets);
    plan.warnings = plan_warnings(model, graph, facets, safe_facet_size);
    plan.facets = std::move(facets);
    plan.call_graph = std::move(graph);
    plan.compatibility = std::move(compatibility);
    return plan;
}

CLEAVE_NAMESPACE_END
