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
#include <cleave/core/string_util.hpp>

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

CLEAVE_NAMESPACE_BEGIN

std::string to_lower(std::string_view const s)
{
    std::string out{s};
    std::ranges::transform(out, out.begin(), [](unsigned char const c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

bool contains_lower(std::string_view const haystack, std::string_view const needle)
{
    return to_lower(haystack).find(needle) != std::string::npos;
}

CLEAVE_NAMESPACE_END
