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

#include <cleave/model/contract_model.hpp>
#include <cleave/model/model_error.hpp>
#include <cleave/model/validate_model.hpp>

#include <gtest/gtest.h>

using namespace cleave;

TEST(ValidateModel, accepts_empty_contract)
{
    EXPECT_FALSE(validate_model(ContractModel{.name = "Empty"}).has_error());
}

TEST(ValidateModel, empty_contract_name)
{
    auto const res = validate_model(ContractModel{});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), ModelError::EmptyContractName);
}

TEST(ValidateModel, empty_function_name)
{
    auto const res = validate_model(
        ContractModel{.name = "C", .functions = {FunctionDescriptor{}}});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), ModelError::EmptyFunctionName);
}

TEST(ValidateModel, duplicate_function)
{
    auto const res = validate_model(ContractModel{
        .name = "C",
        .functions = {
            {.name = "f", .selector = 0x11111111}, {.name = "f"}}});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), ModelError::DuplicateFunction);
}

TEST(ValidateModel, overloads_are_rejected_explicitly)
{
    auto const res = validate_model(ContractModel{
        .name = "Token",
        .functions = {
            {.name = "transfer", .selector = 0xa9059cbb},
            {.name = "transfer", .selector = 0xbe45fd62}}});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), ModelError::OverloadedFunction);
    EXPECT_STREQ(
        res.error().message().c_str(),
        "model: overloaded functions are not supported");
}

TEST(ValidateModel, duplicate_variable)
{
    auto const res = validate_model(ContractModel{
        .name = "C",
        .variables = {
            {.name = "x", .type = "uint256"}, {.name = "x", .type = "bool"}}});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), ModelError::DuplicateVariable);
}

TEST(ValidateModel, variable_overflows_slot)
{
    auto const res = validate_model(ContractModel{
        .name = "C",
        .variables = {
            {.name = "x", .type = "uint128", .offset = 20, .size = 16}}});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), ModelError::InvalidVariableLayout);
}

TEST(ValidateModel, error_message_names_stage)
{
    auto const res = validate_model(ContractModel{});
    ASSERT_TRUE(res.has_error());
    EXPECT_STREQ(
        res.error().message().c_str(), "model: contract name is empty");
}
