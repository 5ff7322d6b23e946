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

#include <cleave/model/contract_model.hpp>
#include <cleave/partition/facet.hpp>
#include <cleave/test/config.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

CLEAVE_TEST_NAMESPACE_BEGIN

inline FunctionDescriptor make_function(
    std::string name, Mutability const mutability = Mutability::NonPayable,
    std::optional<std::string> body = std::nullopt,
    std::vector<std::string> modifiers = {})
{
    return FunctionDescriptor{
        .name = std::move(name),
        .mutability = mutability,
        .modifiers = std::move(modifiers),
        .body = std::move(body)};
}

inline VariableDescriptor
make_variable(std::string name, uint64_t const slot, std::string type = "uint256")
{
    return VariableDescriptor{
        .name = std::move(name), .type = std::move(type), .slot = slot};
}

inline FacetCandidate make_facet(
    std::string name, std::vector<VariableDescriptor> storage = {},
    uint64_t const estimated_size = 2'000)
{
    return FacetCandidate{
        .name = std::move(name),
        .estimated_size = estimated_size,
        .security_classified = true,
        .storage = std::move(storage)};
}

// a facet with n routed functions named <prefix>0 .. <prefix>n-1
inline FacetCandidate make_routed_facet(
    std::string name, std::size_t const n, uint64_t const estimated_size = 2'000)
{
    auto facet = make_facet(name, {}, estimated_size);
    for (std::size_t i = 0; i < n; ++i) {
        facet.functions.push_back(
            {.name = name + "Fn" + std::to_string(i),
             .selector = static_cast<uint32_t>(0x10000000 + i),
             .gas_estimate = 30'000,
             .estimated_size = 1'000});
    }
    return facet;
}

CLEAVE_TEST_NAMESPACE_END
