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

#include <cleave/core/config_error.hpp>

#include <initializer_list>

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<cleave::ConfigError>::mapping> const &
quick_status_code_from_enum<cleave::ConfigError>::value_mappings()
{
    using cleave::ConfigError;

    static std::initializer_list<mapping> const v = {
        {ConfigError::Success, "success", {errc::success}},
        {ConfigError::InvalidGasLimit,
         "config: gas limit must be positive",
         {}},
        {ConfigError::InvalidFunctionCap,
         "config: function cap per facet must be positive",
         {}},
        {ConfigError::InvalidSizeCeiling,
         "config: working size ceiling must be positive and within the hard "
         "ceiling",
         {}},
        {ConfigError::InvalidNamespace,
         "config: storage namespace prefix and version must be non-empty",
         {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
