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

#include <cleave/core/config_error.hpp>
#include <cleave/partition/facet.hpp>
#include <cleave/simulation/simulation_config.hpp>
#include <cleave/simulation/simulator.hpp>
#include <cleave/test/model_builder.hpp>

#include <nlohmann/json.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <cstddef>
#include <string>
#include <vector>

using namespace cleave;
using namespace cleave::test;

namespace
{
    // two facets, seven routed functions
    std::vector<FacetCandidate> two_facets()
    {
        return {make_routed_facet("A", 2), make_routed_facet("B", 5)};
    }

    SimulationResult const *find_result(
        std::vector<SimulationResult> const &results, std::string const &name)
    {
        auto const it = std::ranges::find(results, name, &SimulationResult::name);
        return it == results.end() ? nullptr : &*it;
    }
}

TEST(Simulator, deployment_gas)
{
    EXPECT_EQ(
        estimate_deployment_gas(make_routed_facet("Big", 10, 14'250)),
        3'000'000);
    EXPECT_EQ(estimate_deployment_gas(make_facet("Empty", {}, 0)), 100'000);
}

TEST(Simulator, over_limit_deployment_fails_but_simulation_continues)
{
    std::vector<FacetCandidate> const facets{
        make_routed_facet("CoreFacet1", 10, 14'250)};

    auto const res = simulate(facets, SimulationConfig{.gas_limit = 2'000'000});
    ASSERT_FALSE(res.has_error());
    auto const &results = res.value();

    // deploy, routing, isolation, integrity, emergency
    ASSERT_EQ(results.size(), 5);
    auto const &deploy = results[0];
    EXPECT_EQ(deploy.name, "Deploy CoreFacet1");
    EXPECT_FALSE(deploy.success);
    EXPECT_EQ(deploy.gas_estimate, 3'000'000);
    EXPECT_EQ(
        deploy.warnings,
        (std::vector<std::string>{
            "Deployment exceeds gas limit", "High deployment gas cost"}));
    ASSERT_EQ(deploy.steps.size(), 4);
    EXPECT_EQ(deploy.steps[0].action, "Predict Address");
    EXPECT_EQ(deploy.steps[1].action, "Stage Chunk");
    EXPECT_EQ(deploy.steps[1].gas_used, 900'000);
    EXPECT_EQ(deploy.steps[2].action, "Deploy Facet");
    EXPECT_FALSE(deploy.steps[2].success);
    EXPECT_EQ(deploy.steps[3].action, "Verify Deployment");
    EXPECT_EQ(deploy.steps[3].gas_used, 300'000);

    for (std::size_t i = 1; i < results.size(); ++i) {
        EXPECT_TRUE(results[i].success) << results[i].name;
    }
    EXPECT_NE(find_result(results, "Manifest Routing"), nullptr);
    EXPECT_NE(find_result(results, "Emergency Controls"), nullptr);
}

TEST(Simulator, deployment_within_limit)
{
    std::vector<FacetCandidate> const facets{make_routed_facet("A", 2)};
    auto const res = simulate(facets);
    ASSERT_FALSE(res.has_error());
    auto const &deploy = res.value()[0];
    EXPECT_TRUE(deploy.success);
    EXPECT_TRUE(deploy.warnings.empty());
    EXPECT_EQ(deploy.gas_used, 510'000);
}

TEST(Simulator, routing_batches)
{
    auto const facets = two_facets();
    auto const res = simulate(facets);
    ASSERT_FALSE(res.has_error());

    auto const *const routing = find_result(res.value(), "Manifest Routing");
    ASSERT_NE(routing, nullptr);
    ASSERT_EQ(routing->steps.size(), 5);
    EXPECT_EQ(routing->steps[0].action, "Commit Root");
    EXPECT_EQ(routing->steps[1].action, "Apply Routes batch 1");
    EXPECT_EQ(routing->steps[1].gas_used, 90'000);
    EXPECT_EQ(routing->steps[3].action, "Apply Routes batch 3");
    EXPECT_EQ(routing->steps[3].gas_used, 30'000);
    EXPECT_EQ(routing->steps[4].action, "Activate Root");
    EXPECT_EQ(routing->steps[0].result, routing->steps[4].result);
    EXPECT_EQ(routing->gas_used, 285'000);
    EXPECT_EQ(routing->gas_estimate, 245'000);
}

TEST(Simulator, integrity_checks_first_functions_of_each_facet)
{
    auto const facets = two_facets();
    auto const res = simulate(facets);
    ASSERT_FALSE(res.has_error());

    auto const *const integrity =
        find_result(res.value(), "Integrity Verification");
    ASSERT_NE(integrity, nullptr);
    ASSERT_EQ(integrity->steps.size(), 5);
    EXPECT_EQ(integrity->steps[2].target, "BFn0");
    EXPECT_EQ(integrity->steps[4].target, "BFn2");
    EXPECT_EQ(integrity->gas_used, 175'500);
    EXPECT_EQ(integrity->gas_estimate, 175'500);

    auto const skipped =
        simulate(facets, SimulationConfig{.verify_integrity = false});
    ASSERT_FALSE(skipped.has_error());
    EXPECT_EQ(find_result(skipped.value(), "Integrity Verification"), nullptr);
}

TEST(Simulator, storage_isolation_per_facet)
{
    std::vector<FacetCandidate> const facets{
        make_routed_facet("Vault", 1), make_routed_facet("vault", 1)};
    auto const res = simulate(facets);
    ASSERT_FALSE(res.has_error());

    auto const *const isolation =
        find_result(res.value(), "Storage Isolation Vault");
    ASSERT_NE(isolation, nullptr);
    EXPECT_FALSE(isolation->success);
    EXPECT_EQ(isolation->gas_used, 5'000);
    EXPECT_EQ(isolation->description, "Namespace payrox.facets.vault.v1");

    auto const distinct = simulate(two_facets());
    ASSERT_FALSE(distinct.has_error());
    auto const *const a = find_result(distinct.value(), "Storage Isolation A");
    ASSERT_NE(a, nullptr);
    EXPECT_TRUE(a->success);
}

TEST(Simulator, custom_interaction_tests)
{
    auto const facets = two_facets();
    SimulationConfig const config{
        .custom_tests = {
            {.name = "proved call",
             .function = "AFn0",
             .expected_gas = 40'000,
             .requires_proof = true},
            {.name = "expected revert",
             .function = "AFn1",
             .expected_result = "revert"},
            {.name = "unknown", .function = "missing"}}};

    auto const res = simulate(facets, config);
    ASSERT_FALSE(res.has_error());

    auto const *const proved = find_result(res.value(), "proved call");
    ASSERT_NE(proved, nullptr);
    EXPECT_TRUE(proved->success);
    EXPECT_EQ(proved->gas_used, 66'000);
    EXPECT_EQ(proved->steps[0].result, "A");

    auto const *const revert = find_result(res.value(), "expected revert");
    ASSERT_NE(revert, nullptr);
    EXPECT_FALSE(revert->success);
    EXPECT_EQ(revert->gas_used, 21'000);

    auto const *const unknown = find_result(res.value(), "unknown");
    ASSERT_NE(unknown, nullptr);
    EXPECT_FALSE(unknown->success);
    EXPECT_EQ(
        unknown->warnings,
        (std::vector<std::string>{"Function missing is not routed to any facet"}));
}

TEST(Simulator, emergency_controls)
{
    auto const res = simulate(two_facets());
    ASSERT_FALSE(res.has_error());
    auto const &emergency = res.value().back();
    EXPECT_EQ(emergency.name, "Emergency Controls");
    ASSERT_EQ(emergency.steps.size(), 3);
    EXPECT_EQ(emergency.gas_used, 100'000);
    EXPECT_EQ(emergency.gas_estimate, 100'000);
    EXPECT_TRUE(emergency.success);
}

TEST(Simulator, no_facets)
{
    auto const res = simulate(std::vector<FacetCandidate>{});
    ASSERT_FALSE(res.has_error());
    auto const *const routing = find_result(res.value(), "Manifest Routing");
    ASSERT_NE(routing, nullptr);
    EXPECT_EQ(routing->steps.size(), 2);
    EXPECT_EQ(
        routing->warnings, (std::vector<std::string>{"No routes to commit"}));
}

TEST(Simulator, invalid_config)
{
    auto const no_gas = simulate(two_facets(), SimulationConfig{.gas_limit = 0});
    ASSERT_TRUE(no_gas.has_error());
    EXPECT_EQ(no_gas.assume_error(), ConfigError::InvalidGasLimit);

    auto const no_version = plan_full_deployment(
        two_facets(), SimulationConfig{.storage = {.version = ""}});
    ASSERT_TRUE(no_version.has_error());
    EXPECT_EQ(no_version.assume_error(), ConfigError::InvalidNamespace);
}

TEST(Simulator, deployment_plan)
{
    auto const res = plan_full_deployment(two_facets());
    ASSERT_FALSE(res.has_error());
    auto const &plan = res.value();

    ASSERT_EQ(plan.phases.size(), 5);
    EXPECT_EQ(plan.phases[0].name, "factory");
    EXPECT_TRUE(plan.phases[0].dependencies.empty());
    EXPECT_EQ(plan.phases[0].gas, 2'100'000);
    EXPECT_EQ(plan.phases[1].name, "dispatcher");
    EXPECT_EQ(plan.phases[1].gas, 1'800'000);
    EXPECT_EQ(plan.phases[2].name, "facets");
    EXPECT_EQ(plan.phases[2].gas, 510'000 + 525'000);
    EXPECT_EQ(plan.phases[3].name, "routes");
    EXPECT_EQ(
        plan.phases[3].dependencies,
        (std::vector<std::string>{"dispatcher", "facets"}));
    EXPECT_EQ(plan.phases[3].gas, 245'000);
    EXPECT_EQ(plan.phases[4].name, "activation");
    EXPECT_EQ(plan.phases[4].gas, 50'000);
    EXPECT_EQ(plan.total_gas, 5'230'000);
    EXPECT_EQ(plan.estimated_minutes, 10);
    EXPECT_TRUE(plan.warnings.empty());

    auto const tight =
        plan_full_deployment(two_facets(), SimulationConfig{.gas_limit = 2'000'000});
    ASSERT_FALSE(tight.has_error());
    ASSERT_EQ(tight.value().warnings.size(), 1);
    EXPECT_EQ(
        tight.value().warnings[0],
        "Phase factory needs 2100000 gas, above the 2000000 gas limit");
}

TEST(Simulator, gas_efficiency)
{
    EXPECT_DOUBLE_EQ(gas_efficiency(std::vector<SimulationResult>{}), 1.0);

    std::vector<SimulationResult> const over{
        {.gas_estimate = 100, .gas_used = 200}};
    EXPECT_DOUBLE_EQ(gas_efficiency(over), 0.5);

    std::vector<SimulationResult> const under{
        {.gas_estimate = 300, .gas_used = 200}};
    EXPECT_DOUBLE_EQ(gas_efficiency(under), 1.0);
}

TEST(Simulator, result_json)
{
    auto const res = simulate(two_facets());
    ASSERT_FALSE(res.has_error());
    auto const j = res.value().front().to_json();
    EXPECT_EQ(j["name"], "Deploy A");
    EXPECT_EQ(j["success"], true);
    EXPECT_EQ(j["steps"].size(), 4);
    EXPECT_EQ(j["steps"][1]["action"], "Stage Chunk");

    auto const plan = plan_full_deployment(two_facets());
    ASSERT_FALSE(plan.has_error());
    EXPECT_EQ(plan.value().to_json()["totalGas"], 5'230'000);
}
