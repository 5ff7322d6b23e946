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
#include <cleave/report/compatibility_report.hpp>

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <vector>

CLEAVE_NAMESPACE_BEGIN

struct RefactorPlan
{
    std::vector<FacetCandidate> facets{};
    std::vector<std::string> shared_components{};
    DeploymentStrategy strategy{DeploymentStrategy::Mixed};
    uint64_t estimated_gas_savings{0};
    std::vector<std::string> warnings{};
    CallGraph call_graph{};
    CompatibilityReport compatibility{};

    nlohmann::json to_json() const;
};

std::vector<std::string>
shared_components(ContractModel const &, std::span<FacetCandidate const>);

uint64_t estimate_gas_savings(
    ContractModel const &, std::span<FacetCandidate const>);

std::vector<std::string> plan_warnings(
    ContractModel const &, CallGraph const &, std::span<FacetCandidate const>,
    uint64_t safe_facet_size = SAFE_FACET_SIZE);

RefactorPlan build_refactor_plan(
    ContractModel const &, CallGraph, std::vector<FacetCandidate>,
    CompatibilityReport, uint64_t safe_facet_size = SAFE_FACET_SIZE);

CLEAVE_NAMESPACE_END
