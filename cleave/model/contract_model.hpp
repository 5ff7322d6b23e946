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
#include <optional>
#include <string>
#include <string_view>
#include <vector>

CLEAVE_NAMESPACE_BEGIN

enum class Visibility : uint8_t
{
    Public,
    External,
    Internal,
    Private,
};

enum class Mutability : uint8_t
{
    Pure,
    View,
    Payable,
    NonPayable,
};

enum class SecurityLevel : uint8_t
{
    Low = 0,
    Medium,
    High,
    Critical,
};

struct Parameter
{
    std::string name{};
    std::string type{};
};

struct FunctionDescriptor
{
    std::string name{};
    uint32_t selector{0};
    Visibility visibility{Visibility::Public};
    Mutability mutability{Mutability::NonPayable};
    std::vector<Parameter> parameters{};
    std::vector<std::string> modifiers{};
    // zero means not provided by the front end
    uint64_t gas_estimate{0};
    uint64_t code_size{0};
    std::optional<std::string> body{};
    std::optional<SecurityLevel> security_level{};

    bool is_read_only() const noexcept
    {
        return mutability == Mutability::Pure ||
               mutability == Mutability::View;
    }
};

struct VariableDescriptor
{
    std::string name{};
    std::string type{};
    uint64_t slot{0};
    uint32_t offset{0};
    uint32_t size{32};
    bool is_constant{false};
    bool is_immutable{false};
    Visibility visibility{Visibility::Internal};

    bool occupies_storage() const noexcept
    {
        return !is_constant && !is_immutable;
    }
};

struct ContractModel
{
    std::string name{};
    std::vector<FunctionDescriptor> functions{};
    std::vector<VariableDescriptor> variables{};
    std::vector<std::string> events{};
    std::vector<std::string> modifiers{};
    std::vector<std::string> inheritance{};
    uint64_t estimated_size{0};

    FunctionDescriptor const *find_function(std::string_view) const noexcept;
};

char const *to_string(Visibility);
char const *to_string(Mutability);
char const *to_string(SecurityLevel);

std::optional<Visibility> visibility_from_string(std::string_view);
std::optional<Mutability> mutability_from_string(std::string_view);
std::optional<SecurityLevel> security_level_from_string(std::string_view);

CLEAVE_NAMESPACE_END
