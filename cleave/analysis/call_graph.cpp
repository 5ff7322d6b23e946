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

#include <cleave/analysis/body_scan.hpp>
#include <cleave/analysis/call_graph.hpp>
#include <cleave/analysis/function_metrics.hpp>
#include <cleave/analysis/heuristics.hpp>
#include <cleave/core/config.hpp>
#include <cleave/core/result.hpp>
#include <cleave/model/contract_model.hpp>
#include <cleave/model/model_json.hpp>
#include <cleave/model/validate_model.hpp>

#include <nlohmann/json.hpp>
#include <quill/Quill.h>

#include <algorithm>
#include <cstddef>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

CLEAVE_NAMESPACE_BEGIN

CLEAVE_ANONYMOUS_NAMESPACE_BEGIN

class CycleSearch
{
    CallGraph const &graph_;
    std::unordered_set<std::string> visited_{};
    std::unordered_set<std::string> on_stack_{};
    std::vector<std::string> path_{};
    std::vector<std::vector<std::string>> cycles_{};

    void visit(std::string const &name)
    {
        if (on_stack_.contains(name)) {
            auto const start = std::ranges::find(path_, name);
            cycles_.emplace_back(start, path_.end());
            return;
        }
        if (!visited_.insert(name).second) {
            return;
        }
        auto const *const node = graph_.find(name);
        if (node == nullptr) {
            return;
        }
        on_stack_.insert(name);
        path_.push_back(name);
        for (auto const &dep : node->dependencies) {
            visit(dep);
        }
        path_.pop_back();
        on_stack_.erase(name);
    }

public:
    explicit CycleSearch(CallGraph const &graph)
        : graph_{graph}
    {
    }

    std::vector<std::vector<std::string>> run() &&
    {
        for (auto const &node : graph_.nodes) {
            if (!visited_.contains(node.name)) {
                visit(node.name);
            }
        }
        return std::move(cycles_);
    }
};

// visited holds the ancestors of name on this branch only
std::vector<std::string> longest_walk(
    CallGraph const &graph, std::string const &name,
    std::set<std::string> visited)
{
    visited.insert(name);
    std::vector<std::string> best;
    if (auto const *const node = graph.find(name); node != nullptr) {
        for (auto const &dep : node->dependencies) {
            if (visited.contains(dep) || graph.find(dep) == nullptr) {
                continue;
            }
            auto walk = longest_walk(graph, dep, visited);
            if (walk.size() > best.size()) {
                best = std::move(walk);
            }
        }
    }
    std::vector<std::string> result{name};
    result.insert(
        result.end(),
        std::make_move_iterator(best.begin()),
        std::make_move_iterator(best.end()));
    return result;
}

// without cycles the longest walk below a node does not depend on the path
// taken to reach it
std::vector<std::string> const &longest_acyclic_walk(
    CallGraph const &graph, std::string const &name,
    std::unordered_map<std::string, std::vector<std::string>> &memo)
{
    if (auto const it = memo.find(name); it != memo.end()) {
        return it->second;
    }
    std::vector<std::string> const *best = nullptr;
    if (auto const *const node = graph.find(name); node != nullptr) {
        for (auto const &dep : node->dependencies) {
            if (graph.find(dep) == nullptr) {
                continue;
            }
            auto const &walk = longest_acyclic_walk(graph, dep, memo);
            if (best == nullptr || walk.size() > best->size()) {
                best = &walk;
            }
        }
    }
    std::vector<std::string> result{name};
    if (best != nullptr) {
        result.insert(result.end(), best->begin(), best->end());
    }
    return memo.emplace(name, std::move(result)).first->second;
}

CLEAVE_ANONYMOUS_NAMESPACE_END

char const *to_string(EdgeKind const kind)
{
    switch (kind) {
    case EdgeKind::Call:
        return "call";
    case EdgeKind::Modifier:
        return "modifier";
    case EdgeKind::StorageAccess:
        return "storage";
    }
    std::unreachable();
}

nlohmann::json CallGraphNode::to_json() const
{
    nlohmann::json res{};
    res["name"] = name;
    res["selector"] = selector_to_string(selector);
    res["dependencies"] = dependencies;
    res["dependents"] = dependents;
    res["complexity"] = complexity;
    res["gasEstimate"] = gas_estimate;
    res["securityLevel"] = to_string(security_level);
    return res;
}

CallGraphNode const *CallGraph::find(std::string_view const name) const
{
    auto const it = index_.find(std::string{name});
    return it == index_.end() ? nullptr : &nodes[it->second];
}

std::vector<std::string>
CallGraph::storage_accesses(std::string_view const fn) const
{
    std::vector<std::string> vars;
    for (auto const &edge : edges) {
        if (edge.kind == EdgeKind::StorageAccess && edge.from == fn) {
            vars.push_back(edge.to);
        }
    }
    return vars;
}

nlohmann::json CallGraph::to_json() const
{
    nlohmann::json res{};
    res["nodes"] = nlohmann::json::array();
    for (auto const &node : nodes) {
        res["nodes"].push_back(node.to_json());
    }
    res["edges"] = nlohmann::json::array();
    for (auto const &edge : edges) {
        res["edges"].push_back(
            {{"from", edge.from},
             {"to", edge.to},
             {"type", to_string(edge.kind)}});
    }
    res["cycles"] = cycles;
    res["criticalPaths"] = critical_paths;
    return res;
}

std::vector<std::vector<std::string>> detect_cycles(CallGraph const &graph)
{
    return CycleSearch{graph}.run();
}

std::vector<std::vector<std::string>>
find_critical_paths(CallGraph const &graph)
{
    std::vector<std::vector<std::string>> paths;
    std::unordered_map<std::string, std::vector<std::string>> memo;
    for (auto const &node : graph.nodes) {
        if (!node.dependents.empty()) {
            continue;
        }
        auto walk = graph.cycles.empty()
                        ? longest_acyclic_walk(graph, node.name, memo)
                        : longest_walk(graph, node.name, {});
        if (walk.size() > 2) {
            paths.push_back(std::move(walk));
        }
    }
    std::ranges::stable_sort(paths, [](auto const &a, auto const &b) {
        return a.size() > b.size();
    });
    if (paths.size() > CallGraph::MAX_CRITICAL_PATHS) {
        paths.resize(CallGraph::MAX_CRITICAL_PATHS);
    }
    return paths;
}

CallGraph finalize_call_graph(CallGraph graph)
{
    graph.index_.clear();
    for (std::size_t i = 0; i < graph.nodes.size(); ++i) {
        graph.index_.emplace(graph.nodes[i].name, i);
        graph.nodes[i].dependents.clear();
    }
    for (auto const &node : graph.nodes) {
        for (auto const &dep : node.dependencies) {
            // recursion does not make a function its own caller
            if (auto const it = graph.index_.find(dep);
                it != graph.index_.end() && dep != node.name) {
                graph.nodes[it->second].dependents.insert(node.name);
            }
        }
    }
    graph.cycles = detect_cycles(graph);
    graph.critical_paths = find_critical_paths(graph);
    return graph;
}

Result<CallGraph> build_call_graph(
    ContractModel const &model, HeuristicTable const &heuristics)
{
    BOOST_OUTCOME_TRY(validate_model(model));

    std::unordered_set<std::string_view> function_names;
    std::unordered_set<std::string_view> variable_names;
    std::unordered_set<std::string_view> modifier_names;
    for (auto const &fn : model.functions) {
        function_names.insert(fn.name);
        modifier_names.insert(fn.modifiers.begin(), fn.modifiers.end());
    }
    for (auto const &var : model.variables) {
        variable_names.insert(var.name);
    }
    modifier_names.insert(model.modifiers.begin(), model.modifiers.end());

    CallGraph graph;
    graph.nodes.reserve(model.functions.size());
    for (auto const &fn : model.functions) {
        auto const summary = fn.body.has_value()
                                 ? summarize_body(std::string_view{*fn.body})
                                 : BodySummary{};

        CallGraphNode node{
            .name = fn.name,
            .selector = fn.selector,
            .complexity = complexity_score(fn, summary),
            .gas_estimate = estimate_function_gas(fn),
            .security_level = assess_security(fn, heuristics)};

        std::set<std::string_view> modifiers_seen;
        std::set<std::string_view> variables_seen;
        for (auto const &m : fn.modifiers) {
            if (modifiers_seen.insert(m).second) {
                graph.edges.push_back({fn.name, m, EdgeKind::Modifier});
            }
        }
        for (auto const id : summary.identifiers) {
            if (function_names.contains(id)) {
                if (node.dependencies.emplace(id).second) {
                    graph.edges.push_back(
                        {fn.name, std::string{id}, EdgeKind::Call});
                }
            }
            else if (
                modifier_names.contains(id) && modifiers_seen.insert(id).second) {
                graph.edges.push_back(
                    {fn.name, std::string{id}, EdgeKind::Modifier});
            }
            if (variable_names.contains(id) && variables_seen.insert(id).second) {
                graph.edges.push_back(
                    {fn.name, std::string{id}, EdgeKind::StorageAccess});
            }
        }
        graph.nodes.push_back(std::move(node));
    }

    graph = finalize_call_graph(std::move(graph));
    LOG_INFO(
        "call graph {}: {} nodes, {} edges, {} cycles, {} critical paths",
        model.name,
        graph.nodes.size(),
        graph.edges.size(),
        graph.cycles.size(),
        graph.critical_paths.size());
    return graph;
}

CLEAVE_NAMESPACE_END
