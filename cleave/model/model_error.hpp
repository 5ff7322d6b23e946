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

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

CLEAVE_NAMESPACE_BEGIN

enum class ModelError
{
    Success = 0,
    FileNotFound,
    ParseFailure,
    MissingField,
    InvalidFieldType,
    InvalidEnumValue,
    InvalidSelector,
    EmptyContractName,
    EmptyFunctionName,
    DuplicateFunction,
    OverloadedFunction,
    EmptyVariableName,
    DuplicateVariable,
    InvalidVariableLayout,
};

CLEAVE_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<cleave::ModelError>
    : quick_status_code_from_enum_defaults<cleave::ModelError>
{
    static constexpr auto const domain_name = "Model Error";
    static constexpr auto const domain_uuid =
        "8f0c3a6e-4b1d-4a57-9d2e-6c1b7e5f2a90";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
