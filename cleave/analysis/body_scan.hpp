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

#include <cstdint>
#include <span>
#include <string_view>
#include <variant>
#include <vector>

CLEAVE_NAMESPACE_BEGIN

enum class ControlFlow : uint8_t
{
    If,
    For,
    While,
    Do,
    Try,
    Catch,
};

struct Identifier
{
    std::string_view text;
};

struct ControlKeyword
{
    ControlFlow kind;
};

// language primitives that never name a user function
struct Builtin
{
    std::string_view text;
};

struct OpenBrace
{
};

struct CloseBrace
{
};

using BodyToken =
    std::variant<Identifier, ControlKeyword, Builtin, OpenBrace, CloseBrace>;

// Tokens view into the argument, which must outlive them. String literals,
// comments and numeric literals produce no tokens.
std::vector<BodyToken> tokenize_body(std::string_view);

struct BodySummary
{
    std::vector<std::string_view> identifiers{};
    unsigned control_flow_count{0};
    unsigned max_depth{0};
};

BodySummary summarize_body(std::span<BodyToken const>);

inline BodySummary summarize_body(std::string_view const body)
{
    auto const tokens = tokenize_body(body);
    return summarize_body(tokens);
}

CLEAVE_NAMESPACE_END
