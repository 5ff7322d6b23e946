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

#include <cleave/core/config.hpp>
#include <cleave/core/config_error.hpp>
#include <cleave/core/result.hpp>
#include <cleave/partition/facet.hpp>
#include <cleave/simulation/route_manifest.hpp>
#include <cleave/simulation/sim_hash.hpp>
#include <cleave/simulation/simulation_config.hpp>
#include <cleave/simulation/simulator.hpp>
#include <cleave/storage/storage_layout.hpp>

#include <nlohmann/json.hpp>
#include <quill/Quill.h>
#include <quill/bundled/fmt/format.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <map>
#include <span>
#include <string>
#include <utility>
#include <vector>

CLEAVE_NAMESPACE_BEGIN

CLEAVE_ANONYMOUS_NAMESPACE_BEGIN

uint64_t total_steps_gas(std::vector<SimulationStep> const &steps)
{
    uint64_t total = 0;
    for (auto const &step : steps) {
        total += step.gas_used;
    }
    return total;
}

SimulationResult simulate_deployment(
    FacetCandidate const &facet, SimulationConfig const &config)
{
    auto const gas = estimate_deployment_gas(facet);
    auto const stage_gas = gas * 3 / 10;
    auto const verify_gas = gas / 10;
    bool const fits = gas <= config.gas_limit;

    SimulationResult result{
        .name = "Deploy " + facet.name,
        .description = fmt::format(
            "Deterministic deployment of {} ({} functions, {} bytes)",
            facet.name,
            facet.functions.size(),
            facet.estimated_size),
        .success = fits,
        .gas_estimate = gas,
        .gas_used = gas};
    result.steps = {
        {.action = "Predict Address",
         .target = facet.name,
         .result = to_hex(predict_facet_address(facet))},
        {.action = "Stage Chunk",
         .target = facet.name,
         .gas_used = stage_gas,
         .result = "bytecode staged"},
        {.action = "Deploy Facet",
         .target = facet.name,
         .success = fits,
         .gas_used = gas - stage_gas - verify_gas,
         .result = fits ? "deployed" : "out of gas"},
        {.action = "Verify Deployment",
         .target = facet.name,
         .success = fits,
         .gas_used = verify_gas,
         .result = to_hex(predict_codehash(facet))},
    };
    if (!fits) {
        result.warnings.emplace_back("Deployment exceeds gas limit");
        LOG_WARNING(
            "simulation: deploying {} needs {} gas, limit is {}",
            facet.name,
            gas,
            config.gas_limit);
    }
    if (gas > HIGH_DEPLOYMENT_GAS) {
        result.warnings.emplace_back("High deployment gas cost");
    }
    return result;
}

SimulationResult simulate_routing(std::vector<SimulatedRoute> const &routes)
{
    auto const root = route_root(routes);
    SimulationResult result{
        .name = "Manifest Routing",
        .description = fmt::format(
            "Commit, apply and activate {} routes", routes.size()),
        .gas_estimate = routes.size() * ROUTE_GAS_ESTIMATE};

    result.steps.push_back(
        {.action = "Commit Root",
         .target = "dispatcher",
         .gas_used = ROUTE_COMMIT_GAS,
         .result = to_hex(root)});
    for (std::size_t begin = 0; begin < routes.size();
         begin += ROUTES_PER_BATCH) {
        auto const end = std::min(begin + ROUTES_PER_BATCH, routes.size());
        std::string selectors;
        for (std::size_t i = begin; i < end; ++i) {
            if (!selectors.empty()) {
                selectors += ',';
            }
            selectors += routes[i].function;
        }
        result.steps.push_back(
            {.action = fmt::format(
                 "Apply Routes batch {}", begin / ROUTES_PER_BATCH + 1),
             .target = "dispatcher",
             .gas_used = (end - begin) * ROUTE_APPLY_GAS,
             .result = selectors});
    }
    result.steps.push_back(
        {.action = "Activate Root",
         .target = "dispatcher",
         .gas_used = ROUTE_ACTIVATE_GAS,
         .result = to_hex(root)});
    result.gas_used = total_steps_gas(result.steps);
    if (routes.empty()) {
        result.warnings.emplace_back("No routes to commit");
    }
    return result;
}

std::vector<SimulationResult> simulate_isolation(
    std::span<FacetCandidate const> const facets, StorageConfig const &config)
{
    std::map<bytes32_t, unsigned> slot_uses;
    std::vector<std::pair<std::string, bytes32_t>> derived;
    for (auto const &facet : facets) {
        auto namespace_id = derive_namespace(facet.name, config);
        auto const slot = derive_storage_slot(namespace_id);
        ++slot_uses[slot];
        derived.emplace_back(std::move(namespace_id), slot);
    }

    std::vector<SimulationResult> results;
    for (std::size_t i = 0; i < facets.size(); ++i) {
        auto const &[namespace_id, slot] = derived[i];
        bool const unique = slot_uses[slot] == 1;
        SimulationResult result{
            .name = "Storage Isolation " + facets[i].name,
            .description = "Namespace " + namespace_id,
            .success = unique,
            .gas_estimate = ISOLATION_CHECK_GAS,
            .gas_used = ISOLATION_CHECK_GAS};
        result.steps.push_back(
            {.action = "Verify Namespace",
             .target = facets[i].name,
             .success = unique,
             .gas_used = ISOLATION_CHECK_GAS,
             .result = to_hex(slot)});
        if (!unique) {
            result.warnings.push_back(
                "Storage namespace shared with another facet");
        }
        results.push_back(std::move(result));
    }
    return results;
}

SimulationResult simulate_integrity(std::span<FacetCandidate const> const facets)
{
    SimulationResult result{
        .name = "Integrity Verification",
        .description = "Codehash checks on routed functions"};
    for (auto const &facet : facets) {
        auto const source = facet_source(facet);
        auto const count =
            std::min(facet.functions.size(), INTEGRITY_FUNCTIONS_PER_FACET);
        for (std::size_t i = 0; i < count; ++i) {
            auto const &fn = facet.functions[i];
            result.steps.push_back(
                {.action = "Verify Codehash",
                 .target = fn.name,
                 .gas_used = INTEGRITY_CALL_GAS + INTEGRITY_VERIFY_GAS,
                 .result = to_hex(sim_hash(source + "#" + fn.name))});
        }
    }
    result.gas_estimate =
        result.steps.size() * (INTEGRITY_CALL_GAS + INTEGRITY_VERIFY_GAS);
    result.gas_used = total_steps_gas(result.steps);
    return result;
}

SimulationResult simulate_interaction(
    InteractionTest const &test, std::vector<SimulatedRoute> const &routes)
{
    uint64_t const gas = TEST_BASE_GAS + test.expected_gas +
                         (test.requires_proof ? TEST_PROOF_GAS : 0);
    auto const route = std::ranges::find(routes, test.function, &SimulatedRoute::function);
    bool const routed = route != routes.end();
    bool const success = routed && test.expected_result != "revert";

    SimulationResult result{
        .name = test.name,
        .description = "Interaction test calling " + test.function,
        .success = success,
        .gas_estimate = gas,
        .gas_used = gas};
    result.steps.push_back(
        {.action = "Call",
         .target = test.function,
         .success = success,
         .gas_used = gas,
         .result = routed ? route->facet_name : "unrouted"});
    if (!routed) {
        result.warnings.push_back(
            "Function " + test.function + " is not routed to any facet");
    }
    if (test.expected_result == "revert") {
        result.warnings.emplace_back("Call expected to revert");
    }
    return result;
}

SimulationResult simulate_emergency()
{
    SimulationResult result{
        .name = "Emergency Controls",
        .description = "Pause, remove routes and unpause",
        .gas_estimate = EMERGENCY_PAUSE_GAS + EMERGENCY_REMOVE_GAS +
                        EMERGENCY_UNPAUSE_GAS};
    result.steps = {
        {.action = "Pause",
         .target = "dispatcher",
         .gas_used = EMERGENCY_PAUSE_GAS,
         .result = "paused"},
        {.action = "Remove Routes",
         .target = "dispatcher",
         .gas_used = EMERGENCY_REMOVE_GAS,
         .result = "routes removed"},
        {.action = "Unpause",
         .target = "dispatcher",
         .gas_used = EMERGENCY_UNPAUSE_GAS,
         .result = "unpaused"},
    };
    result.gas_used = total_steps_gas(result.steps);
    return result;
}

nlohmann::json step_to_json(SimulationStep const &step)
{
    nlohmann::json res{};
    res["action"] = step.action;
    res["target"] = step.target;
    res["success"] = step.success;
    res["gasUsed"] = step.gas_used;
    res["result"] = step.result;
    return res;
}

CLEAVE_ANONYMOUS_NAMESPACE_END

Result<void> validate(SimulationConfig const &config)
{
    if (config.gas_limit == 0) {
        return ConfigError::InvalidGasLimit;
    }
    return validate(config.storage);
}

nlohmann::json SimulationResult::to_json() const
{
    nlohmann::json res{};
    res["name"] = name;
    res["description"] = description;
    res["success"] = success;
    res["gasEstimate"] = gas_estimate;
    res["gasUsed"] = gas_used;
    res["warnings"] = warnings;
    res["steps"] = nlohmann::json::array();
    for (auto const &step : steps) {
        res["steps"].push_back(step_to_json(step));
    }
    return res;
}

nlohmann::json DeploymentPlan::to_json() const
{
    nlohmann::json res{};
    res["phases"] = nlohmann::json::array();
    for (auto const &phase : phases) {
        res["phases"].push_back(
            {{"name", phase.name},
             {"dependencies", phase.dependencies},
             {"gas", phase.gas},
             {"rollback", phase.rollback},
             {"estimatedMinutes", phase.estimated_minutes}});
    }
    res["totalGas"] = total_gas;
    res["estimatedMinutes"] = estimated_minutes;
    res["warnings"] = warnings;
    return res;
}

uint64_t estimate_deployment_gas(FacetCandidate const &facet)
{
    return DEPLOY_BASE_GAS + DEPLOY_GAS_PER_BYTE * facet.estimated_size +
           DEPLOY_GAS_PER_FUNCTION * facet.functions.size();
}

Result<std::vector<SimulationResult>> simulate(
    std::span<FacetCandidate const> const facets,
    SimulationConfig const &config)
{
    if (auto res = validate(config); res.has_error()) {
        LOG_ERROR("simulation: {}", res.error().message().c_str());
        return std::move(res).error();
    }

    std::vector<SimulationResult> results;
    for (auto const &facet : facets) {
        results.push_back(simulate_deployment(facet, config));
    }
    auto const routes = build_routes(facets);
    results.push_back(simulate_routing(routes));
    for (auto &result : simulate_isolation(facets, config.storage)) {
        results.push_back(std::move(result));
    }
    if (config.verify_integrity) {
        results.push_back(simulate_integrity(facets));
    }
    for (auto const &test : config.custom_tests) {
        results.push_back(simulate_interaction(test, routes));
    }
    results.push_back(simulate_emergency());

    auto const failed = std::ranges::count_if(
        results, [](SimulationResult const &r) { return !r.success; });
    LOG_INFO(
        "simulation: {} phases, {} failed, {} routes",
        results.size(),
        failed,
        routes.size());
    return results;
}

Result<DeploymentPlan> plan_full_deployment(
    std::span<FacetCandidate const> const facets,
    SimulationConfig const &config)
{
    if (auto res = validate(config); res.has_error()) {
        LOG_ERROR("simulation: {}", res.error().message().c_str());
        return std::move(res).error();
    }

    uint64_t facets_gas = 0;
    std::size_t route_count = 0;
    for (auto const &facet : facets) {
        facets_gas += estimate_deployment_gas(facet);
        route_count += facet.functions.size();
    }

    DeploymentPlan plan;
    plan.phases = {
        {.name = "factory",
         .gas = FACTORY_DEPLOY_GAS,
         .rollback = "Abandon the factory; nothing depends on it yet"},
        {.name = "dispatcher",
         .dependencies = {"factory"},
         .gas = DISPATCHER_DEPLOY_GAS,
         .rollback = "Redeploy the dispatcher through the factory"},
        {.name = "facets",
         .dependencies = {"factory"},
         .gas = facets_gas,
         .rollback = "Discard staged facet bytecode"},
        {.name = "routes",
         .dependencies = {"dispatcher", "facets"},
         .gas = route_count * ROUTE_GAS_ESTIMATE,
         .rollback = "Drop the pending manifest root before activation"},
        {.name = "activation",
         .dependencies = {"routes"},
         .gas = ACTIVATION_GAS,
         .rollback = "Pause the dispatcher and reactivate the previous root"},
    };
    for (auto const &phase : plan.phases) {
        plan.total_gas += phase.gas;
        plan.estimated_minutes += phase.estimated_minutes;
        if (phase.gas > config.gas_limit) {
            plan.warnings.push_back(fmt::format(
                "Phase {} needs {} gas, above the {} gas limit",
                phase.name,
                phase.gas,
                config.gas_limit));
        }
    }
    LOG_INFO(
        "simulation: deployment plan {} phases, {} gas, ~{} minutes",
        plan.phases.size(),
        plan.total_gas,
        plan.estimated_minutes);
    return plan;
}

double gas_efficiency(std::span<SimulationResult const> const results)
{
    uint64_t estimated = 0;
    uint64_t used = 0;
    for (auto const &result : results) {
        estimated += result.gas_estimate;
        used += result.gas_used;
    }
    if (used == 0) {
        return 1.0;
    }
    return std::min(
        1.0, static_cast<double>(estimated) / static_cast<double>(used));
}

CLEAVE_NAMESPACE_END
