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

#include <cleave/model/model_error.hpp>

#include <initializer_list>

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<cleave::ModelError>::mapping> const &
quick_status_code_from_enum<cleave::ModelError>::value_mappings()
{
    using cleave::ModelError;

    static std::initializer_list<mapping> const v = {
        {ModelError::Success, "success", {errc::success}},
        {ModelError::FileNotFound, "model: file not found", {}},
        {ModelError::ParseFailure, "model: document is not valid json", {}},
        {ModelError::MissingField, "model: missing required field", {}},
        {ModelError::InvalidFieldType, "model: field has the wrong type", {}},
        {ModelError::InvalidEnumValue, "model: unknown enumeration value", {}},
        {ModelError::InvalidSelector,
         "model: selector must be 0x followed by 8 hex digits",
         {}},
        {ModelError::EmptyContractName, "model: contract name is empty", {}},
        {ModelError::EmptyFunctionName, "model: function name is empty", {}},
        {ModelError::DuplicateFunction, "model: duplicate function name", {}},
        {ModelError::OverloadedFunction,
         "model: overloaded functions are not supported",
         {}},
        {ModelError::EmptyVariableName, "model: variable name is empty", {}},
        {ModelError::DuplicateVariable, "model: duplicate variable name", {}},
        {ModelError::InvalidVariableLayout,
         "model: variable offset and size exceed a 32 byte slot",
         {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
