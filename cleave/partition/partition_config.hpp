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

#include <cstddef>
#include <cstdint>

CLEAVE_NAMESPACE_BEGIN

// EIP-170
static constexpr uint64_t MAX_CODE_SIZE = 24'576;
static constexpr uint64_t SAFE_FACET_SIZE = 22'000;
static constexpr std::size_t MAX_FUNCTIONS_PER_FACET = 20;
static constexpr uint64_t FACET_OVERHEAD_BYTES = 1'000;

struct PartitionConfig
{
    std::size_t max_functions_per_facet{MAX_FUNCTIONS_PER_FACET};
    uint64_t max_facet_size{MAX_CODE_SIZE};
    // working ceiling every emitted facet stays under
    uint64_t safe_facet_size{SAFE_FACET_SIZE};
    uint64_t facet_overhead{FACET_OVERHEAD_BYTES};
    bool consolidate_storage{true};
    HeuristicTable heuristics{default_heuristics()};
};

Result<void> validate(PartitionConfig const &);

CLEAVE_NAMESPACE_END
