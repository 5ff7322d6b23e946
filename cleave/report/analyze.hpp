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
#include <cleave/model/contract_model.hpp>
#include <cleave/partition/partition_config.hpp>
#include <cleave/report/refactor_plan.hpp>
#include <cleave/simulation/simulation_config.hpp>
#include <cleave/simulation/simulator.hpp>
#include <cleave/storage/storage_layout.hpp>

#include <nlohmann/json_fwd.hpp>

#include <vector>

CLEAVE_NAMESPACE_BEGIN

struct AnalysisOptions
{
    PartitionConfig partition{};
    // storage namespaces are taken from simulation.storage
    SimulationConfig simulation{};
};

struct AnalysisReport
{
    RefactorPlan plan{};
    StorageLayoutReport storage{};
    std::vector<SimulationResult> simulations{};
    DeploymentPlan deployment{};
    double gas_efficiency{1.0};

    nlohmann::json to_json() const;
};

Result<AnalysisReport>
analyze_contract(ContractModel const &, AnalysisOptions const & = {});

CLEAVE_NAMESPACE_END
