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

#include <cleave/analysis/body_scan.hpp>
#include <cleave/core/config.hpp>
#include <cleave/core/variant.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <optional>
#include <span>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

CLEAVE_NAMESPACE_BEGIN

CLEAVE_ANONYMOUS_NAMESPACE_BEGIN

constexpr std::array<std::pair<std::string_view, ControlFlow>, 6>
    CONTROL_KEYWORDS = {{
        {"if", ControlFlow::If},
        {"for", ControlFlow::For},
        {"while", ControlFlow::While},
        {"do", ControlFlow::Do},
        {"try", ControlFlow::Try},
        {"catch", ControlFlow::Catch},
    }};

constexpr std::array<std::string_view, 12> BUILTINS = {
    "require",
    "assert",
    "revert",
    "emit",
    "return",
    "new",
    "delete",
    "push",
    "pop",
    "length",
    "call",
    "delegatecall",
};

bool is_ident_start(char const c)
{
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

bool is_ident_char(char const c)
{
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

std::optional<ControlFlow> control_keyword(std::string_view const word)
{
    for (auto const &[text, kind] : CONTROL_KEYWORDS) {
        if (word == text) {
            return kind;
        }
    }
    return std::nullopt;
}

bool is_builtin(std::string_view const word)
{
    for (auto const b : BUILTINS) {
        if (word == b) {
            return true;
        }
    }
    return false;
}

// returns the index one past the end of the literal or comment at i
std::size_t skip_trivia(std::string_view const s, std::size_t i)
{
    char const c = s[i];
    if (c == '"' || c == '\'') {
        ++i;
        while (i < s.size() && s[i] != c) {
            i += (s[i] == '\\') ? 2 : 1;
        }
        return std::min(i + 1, s.size());
    }
    if (c == '/' && i + 1 < s.size() && s[i + 1] == '/') {
        auto const end = s.find('\n', i);
        return end == std::string_view::npos ? s.size() : end + 1;
    }
    if (c == '/' && i + 1 < s.size() && s[i + 1] == '*') {
        auto const end = s.find("*/", i + 2);
        return end == std::string_view::npos ? s.size() : end + 2;
    }
    return i;
}

CLEAVE_ANONYMOUS_NAMESPACE_END

std::vector<BodyToken> tokenize_body(std::string_view const body)
{
    std::vector<BodyToken> tokens;
    std::size_t i = 0;
    while (i < body.size()) {
        auto const next = skip_trivia(body, i);
        if (next != i) {
            i = next;
            continue;
        }
        char const c = body[i];
        if (c == '{') {
            tokens.emplace_back(OpenBrace{});
            ++i;
        }
        else if (c == '}') {
            tokens.emplace_back(CloseBrace{});
            ++i;
        }
        else if (is_ident_start(c)) {
            std::size_t const begin = i;
            while (i < body.size() && is_ident_char(body[i])) {
                ++i;
            }
            auto const word = body.substr(begin, i - begin);
            if (auto const kind = control_keyword(word); kind.has_value()) {
                tokens.emplace_back(ControlKeyword{kind.value()});
            }
            else if (is_builtin(word)) {
                tokens.emplace_back(Builtin{word});
            }
            else {
                tokens.emplace_back(Identifier{word});
            }
        }
        else if (std::isdigit(static_cast<unsigned char>(c))) {
            // numeric literals, including 0x and 1e18 forms
            while (i < body.size() && is_ident_char(body[i])) {
                ++i;
            }
        }
        else {
            ++i;
        }
    }
    return tokens;
}

BodySummary summarize_body(std::span<BodyToken const> const tokens)
{
    BodySummary summary;
    unsigned depth = 0;
    for (auto const &token : tokens) {
        std::visit(
            overloaded{
                [&](Identifier const &id) {
                    summary.identifiers.push_back(id.text);
                },
                [&](ControlKeyword const &) { ++summary.control_flow_count; },
                [](Builtin const &) {},
                [&](OpenBrace const &) {
                    ++depth;
                    summary.max_depth = std::max(summary.max_depth, depth);
                },
                [&](CloseBrace const &) {
                    if (depth > 0) {
                        --depth;
                    }
                },
            },
            token);
    }
    return summary;
}

CLEAVE_NAMESPACE_END
