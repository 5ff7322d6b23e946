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
#include <cleave/core/result.hpp>
#include <cleave/model/contract_model.hpp>
#include <cleave/model/model_error.hpp>
#include <cleave/model/model_json.hpp>
#include <cleave/model/validate_model.hpp>

#include <quill/Quill.h>

#include <cstdint>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

CLEAVE_NAMESPACE_BEGIN

Result<void> validate_model(ContractModel const &model)
{
    if (model.name.empty()) {
        return ModelError::EmptyContractName;
    }

    // facets, call graph nodes and routes are keyed by function name
    std::unordered_map<std::string_view, uint32_t> selectors;
    for (auto const &fn : model.functions) {
        if (fn.name.empty()) {
            return ModelError::EmptyFunctionName;
        }
        auto const [it, inserted] = selectors.emplace(fn.name, fn.selector);
        if (inserted) {
            continue;
        }
        if (it->second != 0 && fn.selector != 0 &&
            it->second != fn.selector) {
            LOG_ERROR(
                "model {}: function {} is overloaded ({} and {})",
                model.name,
                fn.name,
                selector_to_string(it->second),
                selector_to_string(fn.selector));
            return ModelError::OverloadedFunction;
        }
        LOG_ERROR("model {}: function {} declared twice", model.name, fn.name);
        return ModelError::DuplicateFunction;
    }

    std::unordered_set<std::string_view> seen;
    for (auto const &var : model.variables) {
        if (var.name.empty()) {
            return ModelError::EmptyVariableName;
        }
        if (!seen.insert(var.name).second) {
            LOG_ERROR(
                "model {}: variable {} declared twice", model.name, var.name);
            return ModelError::DuplicateVariable;
        }
        if (var.offset + var.size > 32 || var.size == 0) {
            LOG_ERROR(
                "model {}: variable {} has offset {} size {}",
                model.name,
                var.name,
                var.offset,
                var.size);
            return ModelError::InvalidVariableLayout;
        }
    }

    return outcome::success();
}

CLEAVE_NAMESPACE_END
