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

#include <cleave/analysis/heuristics.hpp>
#include <cleave/core/config.hpp>
#include <cleave/core/string_util.hpp>
#include <cleave/model/contract_model.hpp>

#include <algorithm>
#include <string>
#include <string_view>
#include <utility>

CLEAVE_NAMESPACE_BEGIN

char const *to_string(FacetCategory const c)
{
    switch (c) {
    case FacetCategory::Admin:
        return "admin";
    case FacetCategory::View:
        return "view";
    case FacetCategory::Core:
        return "core";
    case FacetCategory::Storage:
        return "storage";
    }
    std::unreachable();
}

bool HeuristicTable::matches(
    std::string_view const word, FacetCategory const category) const
{
    auto const lower = to_lower(word);
    return std::ranges::any_of(rules, [&](KeywordRule const &rule) {
        return rule.category == category &&
               lower.find(rule.keyword) != std::string::npos;
    });
}

bool HeuristicTable::is_administrative(FunctionDescriptor const &fn) const
{
    if (matches(fn.name, FacetCategory::Admin)) {
        return true;
    }
    return std::ranges::any_of(fn.modifiers, [this](std::string const &m) {
        return matches(m, FacetCategory::Admin);
    });
}

bool HeuristicTable::is_storage_intensive(FunctionDescriptor const &fn) const
{
    if (fn.is_read_only()) {
        return false;
    }
    return matches(fn.name, FacetCategory::Storage) ||
           fn.parameters.size() > storage_parameter_threshold;
}

bool HeuristicTable::is_guard(std::string_view const modifier) const
{
    auto const lower = to_lower(modifier);
    return std::ranges::any_of(guard_markers, [&](std::string const &marker) {
        return lower.find(marker) != std::string::npos;
    });
}

HeuristicTable default_heuristics()
{
    HeuristicTable table{.version = "v1"};
    for (char const *const keyword :
         {"admin",
          "owner",
          "authorize",
          "permission",
          "pause",
          "unpause",
          "emergency",
          "upgrade",
          "initialize",
          "setup",
          "governance",
          "vote",
          "proposal",
          "timelock",
          "multisig"}) {
        table.rules.push_back({keyword, FacetCategory::Admin});
    }
    for (char const *const keyword :
         {"store", "save", "update", "delete", "batch", "bulk", "mass"}) {
        table.rules.push_back({keyword, FacetCategory::Storage});
    }
    table.guard_markers = {"only", "require"};
    return table;
}

CLEAVE_NAMESPACE_END
