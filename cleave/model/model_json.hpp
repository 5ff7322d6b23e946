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
#include <cleave/model/contract_model.hpp>

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

CLEAVE_NAMESPACE_BEGIN

// "0x" followed by exactly 8 hex digits
std::optional<uint32_t> parse_selector(std::string_view);
std::string selector_to_string(uint32_t);

Result<ContractModel> parse_contract_model(nlohmann::json const &);
Result<ContractModel> load_contract_model(std::filesystem::path const &);

CLEAVE_NAMESPACE_END
