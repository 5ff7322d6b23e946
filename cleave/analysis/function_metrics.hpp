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

#include <cleave/analysis/body_scan.hpp>
#include <cleave/analysis/heuristics.hpp>
#include <cleave/core/config.hpp>
#include <cleave/model/contract_model.hpp>

#include <cstdint>

CLEAVE_NAMESPACE_BEGIN

static constexpr uint64_t BASE_TRANSACTION_GAS = 21'000;
static constexpr uint64_t PARAMETER_GAS = 800;
static constexpr uint64_t READ_ONLY_GAS = 2'000;
static constexpr uint64_t PAYABLE_PREMIUM_GAS = 7'000;
static constexpr uint64_t MUTATING_GAS = 3'000;
static constexpr uint64_t BODY_GAS_DIVISOR = 20;
static constexpr uint64_t MAX_BODY_GAS = 10'000;
static constexpr uint64_t DEFAULT_BODY_LENGTH = 50;
static constexpr uint64_t MODIFIER_GAS = 500;
static constexpr uint64_t GAS_PER_BYTE_ESTIMATE = 10;

// heuristic cost, used when the front end supplies no estimate
uint64_t heuristic_function_gas(FunctionDescriptor const &);

uint64_t estimate_function_gas(FunctionDescriptor const &);

uint64_t estimate_function_size(FunctionDescriptor const &);

unsigned complexity_score(FunctionDescriptor const &, BodySummary const &);

SecurityLevel assess_security(FunctionDescriptor const &, HeuristicTable const &);

CLEAVE_NAMESPACE_END
