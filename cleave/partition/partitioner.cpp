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
#include <cleave/analysis/heuristics.hpp>
#include <cleave/core/assert.h>
#include <cleave/core/config.hpp>
#include <cleave/core/config_error.hpp>
#include <cleave/core/result.hpp>
#include <cleave/model/contract_model.hpp>
#include <cleave/partition/facet.hpp>
#include <cleave/partition/partition_config.hpp>
#include <cleave/partition/partition_error.hpp>
#include <cleave/partition/partitioner.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

CLEAVE_NAMESPACE_BEGIN

CLEAVE_ANONYMOUS_NAMESPACE_BEGIN

struct Domain
{
    std::string base_name;
    FacetCategory category;
    std::vector<std::size_t> members;
};

class Partitioner
{
    ContractModel const &model_;
    CallGraph const &graph_;
    PartitionConfig const &config_;
    std::vector<uint64_t> sizes_{};
    std::unordered_map<std::string, std::size_t> index_{};

    std::vector<std::size_t> bfs_cluster(
        std::size_t const seed, std::vector<bool> const &candidate,
        std::vector<bool> &assigned) const
    {
        std::vector<std::size_t> cluster;
        std::deque<std::size_t> queue{seed};
        while (!queue.empty() &&
               cluster.size() < config_.max_functions_per_facet) {
            auto const i = queue.front();
            queue.pop_front();
            if (assigned[i]) {
                continue;
            }
            assigned[i] = true;
            cluster.push_back(i);

            auto const *const node = graph_.find(model_.functions[i].name);
            if (node == nullptr) {
                continue;
            }
            for (auto const *const neighbours :
                 {&node->dependencies, &node->dependents}) {
                for (auto const &name : *neighbours) {
                    auto const it = index_.find(name);
                    if (it != index_.end() && candidate[it->second] &&
                        !assigned[it->second]) {
                        queue.push_back(it->second);
                    }
                }
            }
        }
        return cluster;
    }

    std::vector<std::vector<std::size_t>>
    repack(std::vector<std::size_t> const &members) const
    {
        std::vector<std::vector<std::size_t>> parts;
        std::vector<std::size_t> current;
        uint64_t current_size = config_.facet_overhead;
        for (auto const i : members) {
            if (!current.empty() &&
                (current.size() == config_.max_functions_per_facet ||
                 current_size + sizes_[i] > config_.safe_facet_size)) {
                parts.push_back(std::move(current));
                current.clear();
                current_size = config_.facet_overhead;
            }
            current.push_back(i);
            current_size += sizes_[i];
        }
        if (!current.empty()) {
            parts.push_back(std::move(current));
        }
        return parts;
    }

    FacetCandidate make_facet(
        std::string name, FacetCategory const category, std::size_t const part,
        std::vector<std::size_t> const &members) const
    {
        FacetCandidate facet{
            .name = std::move(name),
            .category = category,
            .estimated_size = config_.facet_overhead};
        bool guarded = false;
        bool all_declared = true;
        std::vector<bool> touched(model_.variables.size(), false);
        for (auto const i : members) {
            auto const &fn = model_.functions[i];
            guarded = guarded ||
                      std::ranges::any_of(
                          fn.modifiers, [this](std::string const &m) {
                              return config_.heuristics.is_guard(m);
                          });
            all_declared = all_declared && fn.security_level.has_value();
            auto const *const node = graph_.find(fn.name);
            auto const level = node != nullptr
                                   ? node->security_level
                                   : assess_security(fn, config_.heuristics);
            facet.functions.push_back(
                {.name = fn.name,
                 .selector = fn.selector,
                 .gas_estimate = estimate_function_gas(fn),
                 .estimated_size = sizes_[i],
                 .security_level = level});
            facet.estimated_size += sizes_[i];
            facet.security_level = std::max(facet.security_level, level);
            for (auto const &var : graph_.storage_accesses(fn.name)) {
                for (std::size_t v = 0; v < model_.variables.size(); ++v) {
                    if (model_.variables[v].name == var) {
                        touched[v] = true;
                    }
                }
            }
        }
        for (std::size_t v = 0; v < model_.variables.size(); ++v) {
            if (touched[v]) {
                facet.storage.push_back(model_.variables[v]);
            }
        }
        facet.security_classified = guarded || all_declared;
        facet.optimization_tier = classify_optimization_tier(
            facet.functions.size(), facet.estimated_size);
        facet.description =
            describe_facet(category, part, facet.functions.size());
        facet.reasoning = explain_facet(
            category, facet.estimated_size, config_.safe_facet_size);
        return facet;
    }

    bool references_admin_guard(FacetCandidate const &facet) const
    {
        for (auto const &fn : facet.functions) {
            for (auto const &edge : graph_.edges) {
                if (edge.from == fn.name && edge.kind != EdgeKind::Call &&
                    config_.heuristics.matches(edge.to, FacetCategory::Admin)) {
                    return true;
                }
            }
        }
        return false;
    }

    void infer_dependencies(std::vector<FacetCandidate> &facets) const
    {
        std::unordered_map<std::string, std::string> owner;
        std::optional<std::string> admin_facet;
        for (auto const &facet : facets) {
            for (auto const &fn : facet.functions) {
                owner.emplace(fn.name, facet.name);
            }
            if (facet.category == FacetCategory::Admin &&
                !admin_facet.has_value()) {
                admin_facet = facet.name;
            }
        }
        for (auto &facet : facets) {
            for (auto const &fn : facet.functions) {
                auto const *const node = graph_.find(fn.name);
                if (node == nullptr) {
                    continue;
                }
                for (auto const &callee : node->dependencies) {
                    auto const it = owner.find(callee);
                    if (it != owner.end() && it->second != facet.name) {
                        facet.dependencies.insert(it->second);
                    }
                }
            }
            if (!admin_facet.has_value() ||
                facet.category == FacetCategory::Admin) {
                continue;
            }
            if (facet.category == FacetCategory::Storage ||
                references_admin_guard(facet)) {
                facet.dependencies.insert(admin_facet.value());
            }
        }
    }

public:
    Partitioner(
        ContractModel const &model, CallGraph const &graph,
        PartitionConfig const &config)
        : model_{model}
        , graph_{graph}
        , config_{config}
    {
        sizes_.reserve(model.functions.size());
        for (std::size_t i = 0; i < model.functions.size(); ++i) {
            sizes_.push_back(estimate_function_size(model.functions[i]));
            index_.emplace(model.functions[i].name, i);
        }
    }

    Result<std::vector<FacetCandidate>> run() const
    {
        auto const &heuristics = config_.heuristics;
        auto const &functions = model_.functions;
        auto const n = functions.size();

        for (std::size_t i = 0; i < n; ++i) {
            if (sizes_[i] + config_.facet_overhead > config_.safe_facet_size) {
                LOG_ERROR(
                    "partition {}: function {} estimated at {} bytes exceeds "
                    "the {} byte facet ceiling",
                    model_.name,
                    functions[i].name,
                    sizes_[i],
                    config_.safe_facet_size);
                return PartitionError::SizeLimitExceeded;
            }
        }

        std::vector<bool> assigned(n, false);
        std::vector<Domain> domains;

        Domain admin{"AdminFacet", FacetCategory::Admin, {}};
        for (std::size_t i = 0; i < n; ++i) {
            if (heuristics.is_administrative(functions[i])) {
                admin.members.push_back(i);
                assigned[i] = true;
            }
        }

        Domain view{"ViewFacet", FacetCategory::View, {}};
        for (std::size_t i = 0; i < n; ++i) {
            if (!assigned[i] && functions[i].is_read_only()) {
                view.members.push_back(i);
                assigned[i] = true;
            }
        }

        Domain storage{"StorageFacet", FacetCategory::Storage, {}};
        if (config_.consolidate_storage) {
            for (std::size_t i = 0; i < n; ++i) {
                if (!assigned[i] &&
                    heuristics.is_storage_intensive(functions[i])) {
                    storage.members.push_back(i);
                }
            }
            if (storage.members.size() >
                heuristics.storage_consolidation_threshold) {
                for (auto const i : storage.members) {
                    assigned[i] = true;
                }
            }
            else {
                storage.members.clear();
            }
        }

        for (auto *const domain : {&admin, &view, &storage}) {
            if (!domain->members.empty()) {
                domains.push_back(std::move(*domain));
            }
        }

        std::vector<bool> candidate(n, false);
        for (std::size_t i = 0; i < n; ++i) {
            candidate[i] = !assigned[i];
        }
        unsigned core_count = 0;
        for (std::size_t seed = 0; seed < n; ++seed) {
            if (assigned[seed]) {
                continue;
            }
            auto cluster = bfs_cluster(seed, candidate, assigned);
            CLEAVE_ASSERT(!cluster.empty());
            domains.push_back(
                {"CoreFacet" + std::to_string(++core_count),
                 FacetCategory::Core,
                 std::move(cluster)});
        }
        CLEAVE_ASSERT(std::all_of(
            assigned.begin(), assigned.end(), [](bool const b) { return b; }));

        std::vector<FacetCandidate> facets;
        for (auto const &domain : domains) {
            auto const parts = repack(domain.members);
            for (std::size_t p = 0; p < parts.size(); ++p) {
                auto name = parts.size() == 1
                                ? domain.base_name
                                : domain.base_name + "Part" +
                                      std::to_string(p + 1);
                facets.push_back(make_facet(
                    std::move(name), domain.category, p, parts[p]));
            }
        }
        infer_dependencies(facets);

        for (auto const &facet : facets) {
            LOG_DEBUG(
                "partition {}: {} [{}] {} functions, {} bytes",
                model_.name,
                facet.name,
                to_string(facet.category),
                facet.functions.size(),
                facet.estimated_size);
        }
        LOG_INFO(
            "partition {}: {} functions into {} facets (heuristics {})",
            model_.name,
            n,
            facets.size(),
            heuristics.version);
        return facets;
    }
};

CLEAVE_ANONYMOUS_NAMESPACE_END

Result<void> validate(PartitionConfig const &config)
{
    if (config.max_functions_per_facet == 0) {
        return ConfigError::InvalidFunctionCap;
    }
    if (config.safe_facet_size == 0 ||
        config.safe_facet_size > config.max_facet_size ||
        config.facet_overhead >= config.safe_facet_size) {
        return ConfigError::InvalidSizeCeiling;
    }
    return outcome::success();
}

Result<std::vector<FacetCandidate>> partition(
    ContractModel const &model, CallGraph const &graph,
    PartitionConfig const &config)
{
    auto res = validate(config);
    if (res.has_error()) {
        LOG_ERROR(
            "partition {}: {}", model.name, res.error().message().c_str());
        return std::move(res).error();
    }
    return Partitioner{model, graph, config}.run();
}

CLEAVE_NAMESPACE_END
