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

#include <cleave/core/address.hpp>
#include <cleave/core/bytes.hpp>
#include <cleave/core/config.hpp>

#include <cstdint>
#include <string_view>

CLEAVE_NAMESPACE_BEGIN

// Dry-run digests built on FNV-1a. They are NOT keccak256 and must never
// stand in for real selectors, CREATE2 addresses or code hashes.

bytes32_t sim_hash(std::string_view);

bytes32_t sim_hash_pair(bytes32_t const &, bytes32_t const &);

// last 20 bytes of sim_hash(facet name + source)
Address sim_address(std::string_view name, std::string_view source);

// first 4 bytes of sim_hash(signature)
uint32_t sim_selector(std::string_view signature);

CLEAVE_NAMESPACE_END
