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

#include <cleave/core/bytes.hpp>
#include <cleave/core/config.hpp>
#include <cleave/core/keccak.hpp>

#include <ethash/keccak.hpp>

#include <cstdint>
#include <cstring>
#include <string_view>

CLEAVE_NAMESPACE_BEGIN

bytes32_t keccak256(std::string_view const data)
{
    auto const hash = ethash::keccak256(
        reinterpret_cast<uint8_t const *>(data.data()), data.size());
    bytes32_t result;
    std::memcpy(result.bytes, hash.bytes, sizeof(result.bytes));
    return result;
}

CLEAVE_NAMESPACE_END
