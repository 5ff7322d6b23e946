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
#include <cleave/simulation/sim_hash.hpp>

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>

CLEAVE_NAMESPACE_BEGIN

CLEAVE_ANONYMOUS_NAMESPACE_BEGIN

constexpr uint64_t FNV_OFFSET_BASIS = 0xcbf29ce484222325ull;
constexpr uint64_t FNV_PRIME = 0x100000001b3ull;

uint64_t fnv1a(std::string_view const data, uint64_t const lane)
{
    uint64_t h = FNV_OFFSET_BASIS ^ (lane * 0x9e3779b97f4a7c15ull);
    for (unsigned char const c : data) {
        h ^= c;
        h *= FNV_PRIME;
    }
    return h;
}

CLEAVE_ANONYMOUS_NAMESPACE_END

bytes32_t sim_hash(std::string_view const data)
{
    bytes32_t out;
    for (std::size_t lane = 0; lane < 4; ++lane) {
        uint64_t const h = fnv1a(data, lane);
        for (std::size_t i = 0; i < 8; ++i) {
            out.bytes[lane * 8 + i] =
                static_cast<uint8_t>(h >> (56 - 8 * i));
        }
    }
    return out;
}

bytes32_t sim_hash_pair(bytes32_t const &left, bytes32_t const &right)
{
    std::string buf(64, '\0');
    std::memcpy(buf.data(), left.bytes, 32);
    std::memcpy(buf.data() + 32, right.bytes, 32);
    return sim_hash(buf);
}

Address sim_address(std::string_view const name, std::string_view const source)
{
    std::string buf{name};
    buf += source;
    auto const h = sim_hash(buf);
    Address addr;
    std::memcpy(addr.bytes, h.bytes + 12, sizeof(addr.bytes));
    return addr;
}

uint32_t sim_selector(std::string_view const signature)
{
    auto const h = sim_hash(signature);
    return static_cast<uint32_t>(h.bytes[0]) << 24 |
           static_cast<uint32_t>(h.bytes[1]) << 16 |
           static_cast<uint32_t>(h.bytes[2]) << 8 |
           static_cast<uint32_t>(h.bytes[3]);
}

CLEAVE_NAMESPACE_END
