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

#pragma once

#include <cleave/core/config.hpp>
#include <cleave/core/result.hpp>
#include <cleave/partition/facet.hpp>
#include <cleave/simulation/simulation_config.hpp>

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

CLEAVE_NAMESPACE_BEGIN

static constexpr uint64_t DEPLOY_BASE_GAS = 100'000;
static constexpr uint64_t DEPLOY_GAS_PER_BYTE = 200;
static constexpr uint64_t DEPLOY_GAS_PER_FUNCTION = 5'000;
static constexpr uint64_t HIGH_DEPLOYMENT_GAS = 2'000'000;
static constexpr uint64_t ROUTE_COMMIT_GAS = 50'000;
static constexpr uint64_t ROUTE_APPLY_GAS = 30'000;
static constexpr uint64_t ROUTE_ACTIVATE_GAS = 25'000;
static constexpr uint64_t ROUTE_GAS_ESTIMATE = 35'000;
static constexpr std::size_t ROUTES_PER_BATCH = 3;
static constexpr std::size_t INTEGRITY_FUNCTIONS_PER_FACET = 3;
static constexpr uint64_t INTEGRITY_CALL_GAS = 33'000;
static constexpr uint64_t INTEGRITY_VERIFY_GAS = 2'100;
static constexpr uint64_t ISOLATION_CHECK_GAS = 5'000;
static constexpr uint64_t TEST_BASE_GAS = 21'000;
static constexpr uint64_t TEST_PROOF_GAS = 5'000;
static constexpr uint64_t EMERGENCY_PAUSE_GAS = 30'000;
static constexpr uint64_t EMERGENCY_REMOVE_GAS = 45'000;
static constexpr uint64_t EMERGENCY_UNPAUSE_GAS = 25'000;
static constexpr uint64_t FACTORY_DEPLOY_GAS = 2'100'000;
static constexpr uint64_t DISPATCHER_DEPLOY_GAS = 1'800'000;
static constexpr uint64_t ACTIVATION_GAS = 50'000;
static constexpr unsigned MINUTES_PER_PHASE = 2;

struct SimulationStep
{
    std::string action{};
    std::string target{};
    bool success{true};
    uint64_t gas_used{0};
    std::string result{};
};

struct SimulationResult
{
    std::string name{};
    std::string description{};
    bool success{true};
    uint64_t gas_estimate{0};
    uint64_t gas_used{0};
    std::vector<std::string> warnings{};
    std::vector<SimulationStep> steps{};

    nlohmann::json to_json() const;
};

struct DeploymentPhase
{
    std::string name{};
    std::vector<std::string> dependencies{};
    uint64_t gas{0};
    std::string rollback{};
    unsigned estimated_minutes{MINUTES_PER_PHASE};
};

struct DeploymentPlan
{
    std::vector<DeploymentPhase> phases{};
    uint64_t total_gas{0};
    unsigned estimated_minutes{0};
    std::vector<std::string> warnings{};

    nlohmann::json to_json() const;
};

uint64_t estimate_deployment_gas(FacetCandidate const &);

// Runs every phase even when some fail; failures are reported in the
// results, only an invalid configuration is an error.
Result<std::vector<SimulationResult>>
simulate(std::span<FacetCandidate const>, SimulationConfig const & = {});

Result<DeploymentPlan> plan_full_deployment(
    std::span<FacetCandidate const>, SimulationConfig const & = {});

// min(1, estimated / used) over all results; 1 when nothing was used
double gas_efficiency(std::span<SimulationResult const>);

CLEAVE_NAMESPACE_END
