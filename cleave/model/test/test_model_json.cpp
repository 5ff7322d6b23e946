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
#include <cleave/model/model_json.hpp>

#include <nlohmann/json.hpp>

#include <gtest/gtest.h>

#include <optional>

using namespace cleave;

namespace
{
    nlohmann::json const token_model = nlohmann::json::parse(R"json({
        "name": "Token",
        "functions": [
            {
                "name": "transfer",
                "selector": "0xa9059cbb",
                "visibility": "external",
                "stateMutability": "nonpayable",
                "parameters": [
                    {"name": "to", "type": "address"},
                    {"name": "amount", "type": "uint256"}
                ],
                "modifiers": ["whenNotPaused"],
                "body": "_move(msg.sender, to, amount);"
            },
            {
                "name": "balanceOf",
                "selector": "0x70a08231",
                "stateMutability": "view",
                "parameters": [{"type": "address"}],
                "gasEstimate": 2600,
                "codeSize": 180,
                "securityLevel": "low"
            }
        ],
        "variables": [
            {"name": "balances", "type": "mapping(address => uint256)", "slot": 0},
            {"name": "paused", "type": "bool", "slot": 1, "offset": 0, "size": 1},
            {"name": "DECIMALS", "type": "uint8", "slot": 0, "size": 1, "constant": true}
        ],
        "events": ["Transfer", {"name": "Approval"}],
        "modifiers": ["whenNotPaused"],
        "inheritance": ["ERC20"],
        "estimatedSize": 9000
    })json");

    nlohmann::json with_function(nlohmann::json const &fn)
    {
        return {{"name", "C"}, {"functions", nlohmann::json::array({fn})}};
    }
}

TEST(ModelJson, parses_full_model)
{
    auto const res = parse_contract_model(token_model);
    ASSERT_FALSE(res.has_error()) << res.error().message().c_str();
    auto const &model = res.value();

    EXPECT_EQ(model.name, "Token");
    ASSERT_EQ(model.functions.size(), 2);

    auto const &transfer = model.functions[0];
    EXPECT_EQ(transfer.selector, 0xa9059cbb);
    EXPECT_EQ(transfer.visibility, Visibility::External);
    EXPECT_EQ(transfer.mutability, Mutability::NonPayable);
    ASSERT_EQ(transfer.parameters.size(), 2);
    EXPECT_EQ(transfer.parameters[1].type, "uint256");
    EXPECT_EQ(transfer.modifiers, (std::vector<std::string>{"whenNotPaused"}));
    EXPECT_EQ(transfer.gas_estimate, 0);
    EXPECT_EQ(transfer.body, "_move(msg.sender, to, amount);");
    EXPECT_FALSE(transfer.security_level.has_value());

    auto const *const balance_of = model.find_function("balanceOf");
    ASSERT_NE(balance_of, nullptr);
    EXPECT_TRUE(balance_of->is_read_only());
    EXPECT_EQ(balance_of->visibility, Visibility::Public);
    EXPECT_EQ(balance_of->parameters[0].name, "");
    EXPECT_EQ(balance_of->gas_estimate, 2600);
    EXPECT_EQ(balance_of->code_size, 180);
    EXPECT_EQ(balance_of->security_level, SecurityLevel::Low);
    EXPECT_FALSE(balance_of->body.has_value());

    ASSERT_EQ(model.variables.size(), 3);
    EXPECT_EQ(model.variables[1].size, 1);
    EXPECT_EQ(model.variables[0].size, 32);
    EXPECT_TRUE(model.variables[2].is_constant);
    EXPECT_FALSE(model.variables[2].occupies_storage());
    EXPECT_EQ(model.events, (std::vector<std::string>{"Transfer", "Approval"}));
    EXPECT_EQ(model.inheritance, (std::vector<std::string>{"ERC20"}));
    EXPECT_EQ(model.estimated_size, 9000);
}

TEST(ModelJson, missing_functions)
{
    auto const res = parse_contract_model(nlohmann::json{{"name", "C"}});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), ModelError::MissingField);
}

TEST(ModelJson, missing_name)
{
    auto const res = parse_contract_model(
        nlohmann::json{{"functions", nlohmann::json::array()}});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), ModelError::MissingField);
}

TEST(ModelJson, wrong_type)
{
    auto const res = parse_contract_model(
        nlohmann::json{{"name", 7}, {"functions", nlohmann::json::array()}});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), ModelError::InvalidFieldType);

    auto const not_object = parse_contract_model(nlohmann::json::array());
    ASSERT_TRUE(not_object.has_error());
    EXPECT_EQ(not_object.assume_error(), ModelError::InvalidFieldType);
}

TEST(ModelJson, bad_selector)
{
    auto const res = parse_contract_model(
        with_function({{"name", "f"}, {"selector", "0x123"}}));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), ModelError::InvalidSelector);
}

TEST(ModelJson, bad_mutability)
{
    auto const res = parse_contract_model(with_function(
        {{"name", "f"},
         {"selector", "0x00000001"},
         {"stateMutability", "constant"}}));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), ModelError::InvalidEnumValue);
}

TEST(ModelJson, negative_gas)
{
    auto const res = parse_contract_model(with_function(
        {{"name", "f"}, {"selector", "0x00000001"}, {"gasEstimate", -5}}));
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), ModelError::InvalidFieldType);
}

TEST(ModelJson, duplicate_function_is_rejected)
{
    nlohmann::json doc = with_function({{"name", "f"}, {"selector", "0x00000001"}});
    doc["functions"].push_back({{"name", "f"}, {"selector", "0x00000001"}});
    auto const res = parse_contract_model(doc);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), ModelError::DuplicateFunction);
}

TEST(ModelJson, selector)
{
    EXPECT_EQ(parse_selector("0xa9059cbb"), 0xa9059cbb);
    EXPECT_EQ(parse_selector("0xA9059CBB"), 0xa9059cbb);
    EXPECT_EQ(parse_selector("a9059cbb"), std::nullopt);
    EXPECT_EQ(parse_selector("0xa9059cb"), std::nullopt);
    EXPECT_EQ(parse_selector("0xa9059cbg"), std::nullopt);
    EXPECT_EQ(selector_to_string(0x70a08231), "0x70a08231");
    EXPECT_EQ(selector_to_string(0x1), "0x00000001");
}

TEST(ModelJson, missing_file)
{
    auto const res = load_contract_model("/nonexistent/cleave/model.json");
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.assume_error(), ModelError::FileNotFound);
}
