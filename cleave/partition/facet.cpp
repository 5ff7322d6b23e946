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

#include <cleave/core/config.hpp>
#include <cleave/model/model_json.hpp>
#include <cleave/partition/facet.hpp>

#include <nlohmann/json.hpp>
#include <quill/bundled/fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

CLEAVE_NAMESPACE_BEGIN

char const *to_string(OptimizationTier const tier)
{
    switch (tier) {
    case OptimizationTier::Low:
        return "low";
    case OptimizationTier::Medium:
        return "medium";
    case OptimizationTier::High:
        return "high";
    }
    std::unreachable();
}

OptimizationTier
classify_optimization_tier(std::size_t const functions, uint64_t const size)
{
    if (functions > 10 || size > 15'000) {
        return OptimizationTier::High;
    }
    if (functions > 5 || size > 8'000) {
        return OptimizationTier::Medium;
    }
    return OptimizationTier::Low;
}

std::string describe_facet(
    FacetCategory const category, std::size_t const part,
    std::size_t const functions)
{
    char const *base = nullptr;
    switch (category) {
    case FacetCategory::Admin:
        base = "Administrative and ownership functions for secure access "
               "control";
        break;
    case FacetCategory::View:
        base = "Read-only functions optimized for gas-efficient queries";
        break;
    case FacetCategory::Core:
        base = "Core business logic and primary contract functionality";
        break;
    case FacetCategory::Storage:
        base = "Storage-intensive operations for data management";
        break;
    }
    if (part == 0) {
        return fmt::format("{} - {} functions", base, functions);
    }
    return fmt::format("{} (Part {}) - {} functions", base, part + 1, functions);
}

std::string explain_facet(
    FacetCategory const category, uint64_t const estimated_size,
    uint64_t const safe_facet_size)
{
    std::string reasoning;
    switch (category) {
    case FacetCategory::Admin:
        reasoning = "Isolated administrative functions for enhanced security, "
                    "emergency controls, and governance.";
        break;
    case FacetCategory::View:
        reasoning = "Grouped view functions reduce gas costs for read "
                    "operations and enable efficient caching strategies.";
        break;
    case FacetCategory::Core:
        reasoning = "Core business logic separated for modularity, "
                    "maintainability, and efficient routing.";
        break;
    case FacetCategory::Storage:
        reasoning = "Storage operations isolated to prevent conflicts and "
                    "enable specialized optimization for data-heavy "
                    "functions.";
        break;
    }
    // above 80% of the working ceiling
    if (estimated_size * 5 > safe_facet_size * 4) {
        reasoning += " Size optimized to stay within EIP-170 limits.";
    }
    return reasoning;
}

std::vector<std::string> FacetCandidate::function_names() const
{
    std::vector<std::string> names;
    names.reserve(functions.size());
    for (auto const &fn : functions) {
        names.push_back(fn.name);
    }
    return names;
}

nlohmann::json FacetCandidate::to_json() const
{
    nlohmann::json res{};
    res["name"] = name;
    res["category"] = to_string(category);
    res["description"] = description;
    res["reasoning"] = reasoning;
    res["functions"] = nlohmann::json::array();
    for (auto const &fn : functions) {
        res["functions"].push_back(
            {{"name", fn.name},
             {"selector", selector_to_string(fn.selector)},
             {"gasEstimate", fn.gas_estimate},
             {"estimatedSize", fn.estimated_size},
             {"securityLevel", to_string(fn.security_level)}});
    }
    res["estimatedSize"] = estimated_size;
    res["securityLevel"] = to_string(security_level);
    res["securityClassified"] = security_classified;
    res["dependencies"] = dependencies;
    res["gasOptimization"] = to_string(optimization_tier);
    res["storage"] = nlohmann::json::array();
    for (auto const &var : storage) {
        res["storage"].push_back(
            {{"name", var.name}, {"type", var.type}, {"slot", var.slot}});
    }
    return res;
}

CLEAVE_NAMESPACE_END
