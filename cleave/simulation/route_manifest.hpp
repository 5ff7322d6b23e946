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

#include <cleave/core/address.hpp>
#include <cleave/core/bytes.hpp>
#include <cleave/core/config.hpp>
#include <cleave/model/contract_model.hpp>
#include <cleave/partition/facet.hpp>

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <vector>

CLEAVE_NAMESPACE_BEGIN

struct SimulatedRoute
{
    uint32_t selector{0};
    Address facet{};
    bytes32_t codehash{};
    std::string function{};
    std::string facet_name{};
    uint64_t gas_estimate{0};
    SecurityLevel security_level{SecurityLevel::Low};

    nlohmann::json to_json() const;
};

// canonical text the simulated address and codehash are derived from
std::string facet_source(FacetCandidate const &);

Address predict_facet_address(FacetCandidate const &);

bytes32_t predict_codehash(FacetCandidate const &);

std::vector<SimulatedRoute> build_routes(std::span<FacetCandidate const>);

bytes32_t route_leaf(SimulatedRoute const &);

// Pairs adjacent nodes bottom-up; an odd node is carried to the next level
// unchanged. The root of an empty set is zero.
bytes32_t route_root(std::span<SimulatedRoute const>);

CLEAVE_NAMESPACE_END
