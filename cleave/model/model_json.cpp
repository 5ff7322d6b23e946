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
#include <cleave/core/result.hpp>
#include <cleave/model/contract_model.hpp>
#include <cleave/model/model_error.hpp>
#include <cleave/model/model_json.hpp>
#include <cleave/model/validate_model.hpp>

#include <nlohmann/json.hpp>
#include <quill/Quill.h>
#include <quill/bundled/fmt/format.h>

#include <charconv>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

CLEAVE_NAMESPACE_BEGIN

CLEAVE_ANONYMOUS_NAMESPACE_BEGIN

using nlohmann::json;

Result<std::string> get_string(json const &j, char const *const key)
{
    if (!j.contains(key)) {
        LOG_ERROR("model: missing field \"{}\"", key);
        return ModelError::MissingField;
    }
    auto const &v = j.at(key);
    if (!v.is_string()) {
        LOG_ERROR("model: field \"{}\" is not a string", key);
        return ModelError::InvalidFieldType;
    }
    return v.get<std::string>();
}

Result<std::optional<std::string>>
get_optional_string(json const &j, char const *const key)
{
    if (!j.contains(key) || j.at(key).is_null()) {
        return std::optional<std::string>{};
    }
    BOOST_OUTCOME_TRY(auto s, get_string(j, key));
    return std::optional<std::string>{std::move(s)};
}

Result<uint64_t>
get_uint(json const &j, char const *const key, uint64_t const default_value)
{
    if (!j.contains(key) || j.at(key).is_null()) {
        return default_value;
    }
    auto const &v = j.at(key);
    if (v.is_number_unsigned()) {
        return v.get<uint64_t>();
    }
    if (v.is_number_integer() && v.get<int64_t>() >= 0) {
        return static_cast<uint64_t>(v.get<int64_t>());
    }
    LOG_ERROR("model: field \"{}\" is not an unsigned integer", key);
    return ModelError::InvalidFieldType;
}

Result<bool> get_bool(json const &j, char const *const key)
{
    if (!j.contains(key) || j.at(key).is_null()) {
        return false;
    }
    auto const &v = j.at(key);
    if (!v.is_boolean()) {
        LOG_ERROR("model: field \"{}\" is not a boolean", key);
        return ModelError::InvalidFieldType;
    }
    return v.get<bool>();
}

Result<std::vector<std::string>>
get_string_array(json const &j, char const *const key)
{
    std::vector<std::string> out;
    if (!j.contains(key) || j.at(key).is_null()) {
        return out;
    }
    auto const &v = j.at(key);
    if (!v.is_array()) {
        LOG_ERROR("model: field \"{}\" is not an array", key);
        return ModelError::InvalidFieldType;
    }
    for (auto const &e : v) {
        // the front end emits either plain names or {"name": ...} objects
        if (e.is_string()) {
            out.push_back(e.get<std::string>());
        }
        else if (e.is_object()) {
            BOOST_OUTCOME_TRY(auto name, get_string(e, "name"));
            out.push_back(std::move(name));
        }
        else {
            LOG_ERROR("model: element of \"{}\" is not a name", key);
            return ModelError::InvalidFieldType;
        }
    }
    return out;
}

Result<json const *> get_array(json const &j, char const *const key)
{
    if (!j.contains(key) || j.at(key).is_null()) {
        return static_cast<json const *>(nullptr);
    }
    auto const &v = j.at(key);
    if (!v.is_array()) {
        LOG_ERROR("model: field \"{}\" is not an array", key);
        return ModelError::InvalidFieldType;
    }
    return &v;
}

Result<FunctionDescriptor> parse_function(json const &j)
{
    if (!j.is_object()) {
        return ModelError::InvalidFieldType;
    }
    FunctionDescriptor fn;
    BOOST_OUTCOME_TRY(fn.name, get_string(j, "name"));

    BOOST_OUTCOME_TRY(auto const selector, get_string(j, "selector"));
    auto const parsed_selector = parse_selector(selector);
    if (!parsed_selector.has_value()) {
        LOG_ERROR("model: function {} has selector \"{}\"", fn.name, selector);
        return ModelError::InvalidSelector;
    }
    fn.selector = parsed_selector.value();

    BOOST_OUTCOME_TRY(auto const visibility, get_optional_string(j, "visibility"));
    if (visibility.has_value()) {
        auto const v = visibility_from_string(visibility.value());
        if (!v.has_value()) {
            LOG_ERROR(
                "model: function {} has visibility \"{}\"",
                fn.name,
                visibility.value());
            return ModelError::InvalidEnumValue;
        }
        fn.visibility = v.value();
    }

    BOOST_OUTCOME_TRY(
        auto const mutability, get_optional_string(j, "stateMutability"));
    if (mutability.has_value()) {
        auto const m = mutability_from_string(mutability.value());
        if (!m.has_value()) {
            LOG_ERROR(
                "model: function {} has state mutability \"{}\"",
                fn.name,
                mutability.value());
            return ModelError::InvalidEnumValue;
        }
        fn.mutability = m.value();
    }

    BOOST_OUTCOME_TRY(auto const params, get_array(j, "parameters"));
    if (params != nullptr) {
        for (auto const &p : *params) {
            if (!p.is_object()) {
                return ModelError::InvalidFieldType;
            }
            Parameter param;
            BOOST_OUTCOME_TRY(auto name, get_optional_string(p, "name"));
            param.name = name.value_or("");
            BOOST_OUTCOME_TRY(param.type, get_string(p, "type"));
            fn.parameters.push_back(std::move(param));
        }
    }

    BOOST_OUTCOME_TRY(fn.modifiers, get_string_array(j, "modifiers"));
    BOOST_OUTCOME_TRY(fn.gas_estimate, get_uint(j, "gasEstimate", 0));
    BOOST_OUTCOME_TRY(fn.code_size, get_uint(j, "codeSize", 0));
    BOOST_OUTCOME_TRY(fn.body, get_optional_string(j, "body"));

    BOOST_OUTCOME_TRY(auto const level, get_optional_string(j, "securityLevel"));
    if (level.has_value()) {
        auto const l = security_level_from_string(level.value());
        if (!l.has_value()) {
            LOG_ERROR(
                "model: function {} has security level \"{}\"",
                fn.name,
                level.value());
            return ModelError::InvalidEnumValue;
        }
        fn.security_level = l;
    }
    return fn;
}

Result<VariableDescriptor> parse_variable(json const &j)
{
    if (!j.is_object()) {
        return ModelError::InvalidFieldType;
    }
    VariableDescriptor var;
    BOOST_OUTCOME_TRY(var.name, get_string(j, "name"));
    BOOST_OUTCOME_TRY(var.type, get_string(j, "type"));
    BOOST_OUTCOME_TRY(var.slot, get_uint(j, "slot", 0));
    BOOST_OUTCOME_TRY(auto const offset, get_uint(j, "offset", 0));
    BOOST_OUTCOME_TRY(auto const size, get_uint(j, "size", 32));
    if (offset > 32 || size > 32) {
        return ModelError::InvalidVariableLayout;
    }
    var.offset = static_cast<uint32_t>(offset);
    var.size = static_cast<uint32_t>(size);
    BOOST_OUTCOME_TRY(var.is_constant, get_bool(j, "constant"));
    BOOST_OUTCOME_TRY(var.is_immutable, get_bool(j, "immutable"));

    BOOST_OUTCOME_TRY(auto const visibility, get_optional_string(j, "visibility"));
    if (visibility.has_value()) {
        auto const v = visibility_from_string(visibility.value());
        if (!v.has_value()) {
            return ModelError::InvalidEnumValue;
        }
        var.visibility = v.value();
    }
    return var;
}

CLEAVE_ANONYMOUS_NAMESPACE_END

std::optional<uint32_t> parse_selector(std::string_view const s)
{
    if (s.size() != 10 || !s.starts_with("0x")) {
        return std::nullopt;
    }
    uint32_t value = 0;
    auto const *const first = s.data() + 2;
    auto const *const last = s.data() + s.size();
    auto const [ptr, ec] = std::from_chars(first, last, value, 16);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return value;
}

std::string selector_to_string(uint32_t const selector)
{
    return fmt::format("0x{:08x}", selector);
}

Result<ContractModel> parse_contract_model(nlohmann::json const &j)
{
    if (!j.is_object()) {
        LOG_ERROR("model: document root is not an object");
        return ModelError::InvalidFieldType;
    }

    ContractModel model;
    BOOST_OUTCOME_TRY(model.name, get_string(j, "name"));

    BOOST_OUTCOME_TRY(auto const functions, get_array(j, "functions"));
    if (functions == nullptr) {
        LOG_ERROR("model {}: missing field \"functions\"", model.name);
        return ModelError::MissingField;
    }
    for (auto const &f : *functions) {
        BOOST_OUTCOME_TRY(auto fn, parse_function(f));
        model.functions.push_back(std::move(fn));
    }

    BOOST_OUTCOME_TRY(auto const variables, get_array(j, "variables"));
    if (variables != nullptr) {
        for (auto const &v : *variables) {
            BOOST_OUTCOME_TRY(auto var, parse_variable(v));
            model.variables.push_back(std::move(var));
        }
    }

    BOOST_OUTCOME_TRY(model.events, get_string_array(j, "events"));
    BOOST_OUTCOME_TRY(model.modifiers, get_string_array(j, "modifiers"));
    BOOST_OUTCOME_TRY(model.inheritance, get_string_array(j, "inheritance"));
    BOOST_OUTCOME_TRY(model.estimated_size, get_uint(j, "estimatedSize", 0));

    BOOST_OUTCOME_TRY(validate_model(model));
    return model;
}

Result<ContractModel> load_contract_model(std::filesystem::path const &path)
{
    std::ifstream in{path};
    if (!in) {
        LOG_ERROR("model: cannot open {}", path.string());
        return ModelError::FileNotFound;
    }
    auto const j = nlohmann::json::parse(in, nullptr, false);
    if (j.is_discarded()) {
        LOG_ERROR("model: {} is not valid json", path.string());
        return ModelError::ParseFailure;
    }
    return parse_contract_model(j);
}

CLEAVE_NAMESPACE_END
