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
#include <cleave/core/result.hpp>
#include <cleave/storage/storage_layout.hpp>

#include <cstdint>
#include <string>
#include <vector>

CLEAVE_NAMESPACE_BEGIN

static constexpr uint64_t DEFAULT_SIMULATION_GAS_LIMIT = 30'000'000;

struct InteractionTest
{
    std::string name{};
    std::string function{};
    uint64_t expected_gas{0};
    bool requires_proof{false};
    // "success" or "revert"
    std::string expected_result{"success"};
};

struct SimulationConfig
{
    uint64_t gas_limit{DEFAULT_SIMULATION_GAS_LIMIT};
    bool verify_integrity{true};
    std::vector<InteractionTest> custom_tests{};
    StorageConfig storage{};
};

Result<void> validate(SimulationConfig const &);

CLEAVE_NAMESPACE_END
