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
#include <cleave/model/contract_model.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

CLEAVE_NAMESPACE_BEGIN

enum class FacetCategory : uint8_t
{
    Admin,
    View,
    Core,
    Storage,
};

char const *to_string(FacetCategory);

struct KeywordRule
{
    std::string keyword{}; // lower case, matched as a substring
    FacetCategory category{FacetCategory::Core};
};

// Versioned keyword table driving classification. Passed by value into
// every stage that classifies functions.
struct HeuristicTable
{
    std::string version{};
    std::vector<KeywordRule> rules{};
    // a mutating function with more parameters than this is storage heavy
    std::size_t storage_parameter_threshold{3};
    // a storage domain is formed only above this many storage heavy functions
    std::size_t storage_consolidation_threshold{3};
    // modifier fragments that mark an access guard
    std::vector<std::string> guard_markers{};

    bool matches(std::string_view word, FacetCategory) const;
    bool is_administrative(FunctionDescriptor const &) const;
    bool is_storage_intensive(FunctionDescriptor const &) const;
    bool is_guard(std::string_view modifier) const;
};

HeuristicTable default_heuristics();

CLEAVE_NAMESPACE_END
