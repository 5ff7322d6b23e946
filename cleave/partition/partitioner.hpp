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

#include <cleave/analysis/call_graph.hpp>
#include <cleave/core/config.hpp>
#include <cleave/core/result.hpp>
#include <cleave/model/contract_model.hpp>
#include <cleave/partition/facet.hpp>
#include <cleave/partition/partition_config.hpp>

#include <vector>

CLEAVE_NAMESPACE_BEGIN

// Every function of the model lands in exactly one facet. Facets come out
// admin first, then view, storage and core, each split by the function cap
// and the working size ceiling.
Result<std::vector<FacetCandidate>> partition(
    ContractModel const &, CallGraph const &, PartitionConfig const & = {});

CLEAVE_NAMESPACE_END
