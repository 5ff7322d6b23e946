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

#include <cleave/analysis/heuristics.hpp>
#include <cleave/core/config.hpp>
#include <cleave/core/result.hpp>
#include <cleave/model/contract_model.hpp>

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <cstdint>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

CLEAVE_NAMESPACE_BEGIN

enum class EdgeKind : uint8_t
{
    Call,
    Modifier,
    StorageAccess,
};

char const *to_string(EdgeKind);

struct CallEdge
{
    std::string from{};
    // callee, modifier or variable name depending on kind
    std::string to{};
    EdgeKind kind{EdgeKind::Call};

    friend bool operator==(CallEdge const &, CallEdge const &) = default;
};

struct CallGraphNode
{
    std::string name{};
    uint32_t selector{0};
    std::set<std::string> dependencies{};
    std::set<std::string> dependents{};
    unsigned complexity{1};
    uint64_t gas_estimate{0};
    SecurityLevel security_level{SecurityLevel::Low};

    nlohmann::json to_json() const;
};

struct CallGraph
{
    static constexpr std::size_t MAX_CRITICAL_PATHS = 10;

    std::vector<CallGraphNode> nodes{}; // model order
    std::vector<CallEdge> edges{};
    std::vector<std::vector<std::string>> cycles{};
    std::vector<std::vector<std::string>> critical_paths{};

    CallGraphNode const *find(std::string_view) const;

    // variables read or written by the function's body
    std::vector<std::string> storage_accesses(std::string_view fn) const;

    nlohmann::json to_json() const;

private:
    friend CallGraph finalize_call_graph(CallGraph);

    std::unordered_map<std::string, std::size_t> index_{};
};

Result<CallGraph> build_call_graph(
    ContractModel const &, HeuristicTable const & = default_heuristics());

// Indexes nodes and fills dependents, cycles and critical paths from the
// nodes' dependency sets.
CallGraph finalize_call_graph(CallGraph);

std::vector<std::vector<std::string>> detect_cycles(CallGraph const &);

std::vector<std::vector<std::string>> find_critical_paths(CallGraph const &);

CLEAVE_NAMESPACE_END
