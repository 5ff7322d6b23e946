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

#include <cleave/core/address.hpp>
#include <cleave/core/bytes.hpp>
#include <cleave/core/config.hpp>

#include <quill/bundled/fmt/format.h>

#include <span>
#include <string>

CLEAVE_NAMESPACE_BEGIN

std::string to_hex(bytes32_t const &b)
{
    return fmt::format("0x{:02x}", fmt::join(std::span(b.bytes), ""));
}

std::string to_hex(Address const &a)
{
    return fmt::format("0x{:02x}", fmt::join(std::span(a.bytes), ""));
}

CLEAVE_NAMESPACE_END
