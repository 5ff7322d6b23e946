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
#include <cleave/model/contract_model.hpp>

#include <algorithm>
#include <optional>
#include <string_view>
#include <utility>

CLEAVE_NAMESPACE_BEGIN

FunctionDescriptor const *
ContractModel::find_function(std::string_view const fn_name) const noexcept
{
    auto const it = std::ranges::find(functions, fn_name, &FunctionDescriptor::name);
    return it == functions.end() ? nullptr : &*it;
}

char const *to_string(Visibility const v)
{
    switch (v) {
    case Visibility::Public:
        return "public";
    case Visibility::External:
        return "external";
    case Visibility::Internal:
        return "internal";
    case Visibility::Private:
        return "private";
    }
    std::unreachable();
}

char const *to_string(Mutability const m)
{
    switch (m) {
    case Mutability::Pure:
        return "pure";
    case Mutability::View:
        return "view";
    case Mutability::Payable:
        return "payable";
    case Mutability::NonPayable:
        return "nonpayable";
    }
    std::unreachable();
}

char const *to_string(SecurityLevel const s)
{
    switch (s) {
    case SecurityLevel::Low:
        return "low";
    case SecurityLevel::Medium:
        return "medium";
    case SecurityLevel::High:
        return "high";
    case SecurityLevel::Critical:
        return "critical";
    }
    std::unreachable();
}

std::optional<Visibility> visibility_from_string(std::string_view const s)
{
    for (auto const v :
         {Visibility::Public,
          Visibility::External,
          Visibility::Internal,
          Visibility::Private}) {
        if (s == to_string(v)) {
            return v;
        }
    }
    return std::nullopt;
}

std::optional<Mutability> mutability_from_string(std::string_view const s)
{
    for (auto const m :
         {Mutability::Pure,
          Mutability::View,
          Mutability::Payable,
          Mutability::NonPayable}) {
        if (s == to_string(m)) {
            return m;
        }
    }
    return std::nullopt;
}

std::optional<SecurityLevel>
security_level_from_string(std::string_view const s)
{
    for (auto const l :
         {SecurityLevel::Low,
          SecurityLevel::Medium,
          SecurityLevel::High,
          SecurityLevel::Critical}) {
        if (s == to_string(l)) {
            return l;
        }
    }
    return std::nullopt;
}

CLEAVE_NAMESPACE_END
