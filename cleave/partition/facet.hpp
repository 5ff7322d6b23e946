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
#include <cleave/model/contract_model.hpp>

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <cstdint>
#include <set>
#include <string>
#include <vector>

CLEAVE_NAMESPACE_BEGIN

enum class OptimizationTier : uint8_t
{
    Low,
    Medium,
    High,
};

char const *to_string(OptimizationTier);

struct FacetFunction
{
    std::string name{};
    uint32_t selector{0};
    uint64_t gas_estimate{0};
    uint64_t estimated_size{0};
    SecurityLevel security_level{SecurityLevel::Low};
};

struct FacetCandidate
{
    std::string name{};
    FacetCategory category{FacetCategory::Core};
    std::string description{};
    std::string reasoning{};
    std::vector<FacetFunction> functions{};
    uint64_t estimated_size{0};
    SecurityLevel security_level{SecurityLevel::Low};
    // a member carries an access guard, or every member declares its level
    bool security_classified{false};
    std::set<std::string> dependencies{};
    OptimizationTier optimization_tier{OptimizationTier::Low};
    // variables the members touch, in declaration order
    std::vector<VariableDescriptor> storage{};

    std::vector<std::string> function_names() const;

    nlohmann::json to_json() const;
};

OptimizationTier
classify_optimization_tier(std::size_t functions, uint64_t size);

// part is the zero based index of the facet within its split domain
std::string describe_facet(
    FacetCategory, std::size_t part, std::size_t functions);

std::string explain_facet(
    FacetCategory, uint64_t estimated_size, uint64_t safe_facet_size);

CLEAVE_NAMESPACE_END
