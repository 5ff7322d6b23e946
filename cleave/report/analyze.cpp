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
#include <cleave/core/result.hpp>
#include <cleave/model/contract_model.hpp>
#include <cleave/partition/partitioner.hpp>
#include <cleave/report/analyze.hpp>
#include <cleave/report/compatibility_report.hpp>
#include <cleave/report/refactor_plan.hpp>
#include <cleave/simulation/simulator.hpp>
#include <cleave/storage/storage_layout.hpp>

#include <nlohmann/json.hpp>
#include <quill/Quill.h>

#include <utility>
#include <vector>

CLEAVE_NAMESPACE_BEGIN

CLEAVE_ANONYMOUS_NAMESPACE_BEGIN

template <class T>
Result<T> log_stage_failure(
    Result<T> res, char const *const stage, ContractModel const &model)
{
    if (res.has_error()) {
        LOG_ERROR(
            "analysis of {} aborted in {} stage: {}",
            model.name,
            stage,
            res.error().message().c_str());
    }
    return res;
}

CLEAVE_ANONYMOUS_NAMESPACE_END

nlohmann::json AnalysisReport::to_json() const
{
    nlohmann::json res{};
    res["refactorPlan"] = plan.to_json();
    res["storageLayout"] = storage.to_json();
    res["simulations"] = nlohmann::json::array();
    for (auto const &result : simulations) {
        res["simulations"].push_back(result.to_json());
    }
    res["deploymentPlan"] = deployment.to_json();
    res["gasEfficiency"] = gas_efficiency;
    return res;
}

Result<AnalysisReport>
analyze_contract(ContractModel const &model, AnalysisOptions const &options)
{
    LOG_INFO(
        "analyzing {}: {} functions, {} variables",
        model.name,
        model.functions.size(),
        model.variables.size());

    BOOST_OUTCOME_TRY(
        auto graph,
        log_stage_failure(
            build_call_graph(model, options.partition.heuristics),
            "call graph",
            model));
    BOOST_OUTCOME_TRY(
        auto facets,
        log_stage_failure(
            partition(model, graph, options.partition), "partition", model));
    BOOST_OUTCOME_TRY(
        auto storage,
        log_stage_failure(
            check_storage(facets, options.simulation.storage),
            "storage",
            model));
    BOOST_OUTCOME_TRY(
        auto simulations,
        log_stage_failure(
            simulate(facets, options.simulation), "simulation", model));
    BOOST_OUTCOME_TRY(
        auto deployment,
        log_stage_failure(
            plan_full_deployment(facets, options.simulation),
            "simulation",
            model));

    auto compatibility = aggregate(
        model,
        graph,
        facets,
        storage,
        simulations,
        options.partition.safe_facet_size);

    AnalysisReport report;
    report.gas_efficiency = gas_efficiency(simulations);
    report.plan = build_refactor_plan(
        model,
        std::move(graph),
        std::move(facets),
        std::move(compatibility),
        options.partition.safe_facet_size);
    report.storage = std::move(storage);
    report.simulations = std::move(simulations);
    report.deployment = std::move(deployment);

    LOG_INFO(
        "analysis of {} complete: {} facets, strategy {}, score {}",
        model.name,
        report.plan.facets.size(),
        to_string(report.plan.strategy),
        report.plan.compatibility.gas_optimization_score);
    return report;
}

CLEAVE_NAMESPACE_END
