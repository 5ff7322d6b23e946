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

#include <cleave/analysis/call_graph.hpp>
#include <cleave/core/config.hpp>
#include <cleave/model/contract_model.hpp>
#include <cleave/partition/facet.hpp>
#include <cleave/partition/partition_config.hpp>
#include <cleave/simulation/simulator.hpp>
#include <cleave/storage/storage_layout.hpp>

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

CLEAVE_NAMESPACE_BEGIN

enum class DeploymentStrategy : uint8_t
{
    Sequential,
    Parallel,
    Mixed,
};

char const *to_string(DeploymentStrategy);

struct CompatibilityReport
{
    bool size_ok{true};
    std::vector<std::string> size_violations{};
    bool storage_ok{true};
    std::vector<std::string> storage_conflicts{};
    bool selectors_ok{true};
    std::vector<std::string> selector_collisions{};
    bool diamond_ok{true};
    std::vector<std::string> diamond_issues{};
    bool upgrade_ok{true};
    std::vector<std::string> upgrade_blockers{};
    unsigned gas_optimization_score{0};
    DeploymentStrategy strategy{DeploymentStrategy::Mixed};
    uint64_t estimated_total_gas{0};
    std::vector<std::string> warnings{};
    std::vector<std::string> recommendations{};

    bool compatible() const noexcept
    {
        return size_ok && storage_ok && selectors_ok && diamond_ok &&
               upgrade_ok;
    }

    nlohmann::json to_json() const;
};

unsigned gas_optimization_score(
    std::span<FacetCandidate const>, uint64_t safe_facet_size);

DeploymentStrategy recommend_strategy(
    std::span<FacetCandidate const>, uint64_t safe_facet_size);

std::vector<std::string> find_selector_collisions(ContractModel const &);

// infrastructure, code deposit and route registration for every facet
uint64_t estimate_total_deployment_gas(std::span<FacetCandidate const>);

CompatibilityReport aggregate(
    ContractModel const &, CallGraph const &, std::span<FacetCandidate const>,
    StorageLayoutReport const &, std::span<SimulationResult const>,
    uint64_t safe_facet_size = SAFE_FACET_SIZE);

CLEAVE_NAMESPACE_END
