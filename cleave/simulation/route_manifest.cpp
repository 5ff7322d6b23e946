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

#include <cleave/core/address.hpp>
#include <cleave/core/bytes.hpp>
#include <cleave/core/config.hpp>
#include <cleave/model/model_json.hpp>
#include <cleave/partition/facet.hpp>
#include <cleave/simulation/route_manifest.hpp>
#include <cleave/simulation/sim_hash.hpp>

#include <nlohmann/json.hpp>
#include <quill/bundled/fmt/format.h>

#include <cstddef>
#include <span>
#include <string>
#include <utility>
#include <vector>

CLEAVE_NAMESPACE_BEGIN

nlohmann::json SimulatedRoute::to_json() const
{
    nlohmann::json res{};
    res["selector"] = selector_to_string(selector);
    res["facet"] = to_hex(facet);
    res["facetName"] = facet_name;
    res["codehash"] = to_hex(codehash);
    res["function"] = function;
    res["gasEstimate"] = gas_estimate;
    res["securityLevel"] = to_string(security_level);
    return res;
}

std::string facet_source(FacetCandidate const &facet)
{
    std::string source = facet.name;
    for (auto const &fn : facet.functions) {
        source += fmt::format("|{}:{}", fn.name, selector_to_string(fn.selector));
    }
    return source;
}

Address predict_facet_address(FacetCandidate const &facet)
{
    return sim_address(facet.name, facet_source(facet));
}

bytes32_t predict_codehash(FacetCandidate const &facet)
{
    return sim_hash(facet_source(facet));
}

std::vector<SimulatedRoute>
build_routes(std::span<FacetCandidate const> const facets)
{
    std::vector<SimulatedRoute> routes;
    for (auto const &facet : facets) {
        auto const address = predict_facet_address(facet);
        auto const codehash = predict_codehash(facet);
        for (auto const &fn : facet.functions) {
            routes.push_back(
                {.selector = fn.selector,
                 .facet = address,
                 .codehash = codehash,
                 .function = fn.name,
                 .facet_name = facet.name,
                 .gas_estimate = fn.gas_estimate,
                 .security_level = fn.security_level});
        }
    }
    return routes;
}

bytes32_t route_leaf(SimulatedRoute const &route)
{
    return sim_hash(fmt::format(
        "{}{}{}{}",
        selector_to_string(route.selector),
        to_hex(route.facet),
        to_hex(route.codehash),
        route.function));
}

bytes32_t route_root(std::span<SimulatedRoute const> const routes)
{
    if (routes.empty()) {
        return bytes32_t{};
    }
    std::vector<bytes32_t> level;
    level.reserve(routes.size());
    for (auto const &route : routes) {
        level.push_back(route_leaf(route));
    }
    while (level.size() > 1) {
        std::vector<bytes32_t> next;
        next.reserve((level.size() + 1) / 2);
        for (std::size_t i = 0; i < level.size(); i += 2) {
            if (i + 1 < level.size()) {
                next.push_back(sim_hash_pair(level[i], level[i + 1]));
            }
            else {
                next.push_back(level[i]);
            }
        }
        level = std::move(next);
    }
    return level.front();
}

CLEAVE_NAMESPACE_END
