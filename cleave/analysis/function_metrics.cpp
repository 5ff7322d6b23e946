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

#include <cleave/analysis/body_scan.hpp>
#include <cleave/analysis/function_metrics.hpp>
#include <cleave/analysis/heuristics.hpp>
#include <cleave/core/config.hpp>
#include <cleave/model/contract_model.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>

CLEAVE_NAMESPACE_BEGIN

uint64_t heuristic_function_gas(FunctionDescriptor const &fn)
{
    uint64_t gas = BASE_TRANSACTION_GAS + PARAMETER_GAS * fn.parameters.size();
    if (fn.is_read_only()) {
        gas = READ_ONLY_GAS;
    }
    else if (fn.mutability == Mutability::Payable) {
        gas += PAYABLE_PREMIUM_GAS;
    }
    else {
        gas += MUTATING_GAS;
    }
    uint64_t const body_length =
        fn.body.has_value() ? fn.body->size() : DEFAULT_BODY_LENGTH;
    gas += std::min(body_length / BODY_GAS_DIVISOR, MAX_BODY_GAS);
    gas += MODIFIER_GAS * fn.modifiers.size();
    return gas;
}

uint64_t estimate_function_gas(FunctionDescriptor const &fn)
{
    return fn.gas_estimate != 0 ? fn.gas_estimate : heuristic_function_gas(fn);
}

uint64_t estimate_function_size(FunctionDescriptor const &fn)
{
    if (fn.code_size != 0) {
        return fn.code_size;
    }
    return estimate_function_gas(fn) / GAS_PER_BYTE_ESTIMATE;
}

unsigned
complexity_score(FunctionDescriptor const &fn, BodySummary const &summary)
{
    double const score = 1.0 + 0.5 * static_cast<double>(fn.parameters.size()) +
                         static_cast<double>(fn.modifiers.size()) +
                         2.0 * summary.control_flow_count + summary.max_depth;
    return static_cast<unsigned>(std::lround(score));
}

SecurityLevel
assess_security(FunctionDescriptor const &fn, HeuristicTable const &table)
{
    if (fn.security_level.has_value()) {
        return fn.security_level.value();
    }
    if (table.is_administrative(fn)) {
        return SecurityLevel::Critical;
    }
    if (!fn.is_read_only()) {
        return SecurityLevel::High;
    }
    if (std::ranges::any_of(fn.modifiers, [&](auto const &m) {
            return table.is_guard(m);
        })) {
        return SecurityLevel::Medium;
    }
    return SecurityLevel::Low;
}

CLEAVE_NAMESPACE_END
