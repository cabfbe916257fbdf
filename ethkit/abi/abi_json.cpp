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

#include <ethkit/abi/abi_item.hpp>
#include <ethkit/abi/abi_json.hpp>
#include <ethkit/abi/abi_json_error.hpp>
#include <ethkit/abi/abi_type.hpp>
#include <ethkit/abi/abi_type_error.hpp>
#include <ethkit/abi/abi_value.hpp>
#include <ethkit/core/address.hpp>
#include <ethkit/core/byte_string.hpp>
#include <ethkit/core/config.hpp>
#include <ethkit/core/int.hpp>
#include <ethkit/core/likely.h>
#include <ethkit/core/result.hpp>

#include <boost/outcome/try.hpp>
#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>
#include <intx/intx.hpp>
#include <nlohmann/json.hpp>
#include <quill/Quill.h>

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

ETHKIT_ANONYMOUS_NAMESPACE_BEGIN

using json = nlohmann::json;

bool is_hex_digit(char const c)
{
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') ||
           (c >= 'A' && c <= 'F');
}

std::optional<uint256_t> parse_uint256(std::string_view const s)
{
    bool const hex = s.starts_with("0x") || s.starts_with("0X");
    auto const digits = hex ? s.substr(2) : s;
    if (digits.empty() || digits.size() > (hex ? 64u : 78u)) {
        return std::nullopt;
    }
    bool const valid = hex ? std::ranges::all_of(digits, is_hex_digit)
                           : std::ranges::all_of(digits, [](char const c) {
                                 return c >= '0' && c <= '9';
                             });
    if (!valid) {
        return std::nullopt;
    }
    try {
        return intx::from_string<uint256_t>(std::string{s});
    }
    catch (std::out_of_range const &) {
        // decimal input above 2^256 - 1
        return std::nullopt;
    }
}

// intN spans [-2^(N-1), 2^(N-1) - 1] and uintN spans [0, 2^N - 1]
bool integer_fits(
    AbiType const &type, bool const negative, uint256_t const &magnitude)
{
    unsigned const bits = type.bits();
    if (type.kind() == AbiType::Kind::Uint) {
        return !negative && (bits == 256 || (magnitude >> bits) == 0);
    }
    uint256_t const limit = uint256_t{1} << (bits - 1);
    return negative ? magnitude <= limit : magnitude < limit;
}

Result<AbiValue> integer_from_json(AbiType const &type, json const &j)
{
    bool negative = false;
    uint256_t magnitude{};
    if (j.is_number_unsigned()) {
        magnitude = j.get<uint64_t>();
    }
    else if (j.is_number_integer()) {
        auto const v = j.get<int64_t>();
        negative = v < 0;
        // two's complement negation is exact for INT64_MIN as well
        magnitude = negative ? uint64_t{0} - static_cast<uint64_t>(v)
                             : static_cast<uint64_t>(v);
    }
    else if (j.is_string()) {
        std::string_view sv{j.get_ref<std::string const &>()};
        negative = sv.starts_with('-');
        if (negative) {
            sv.remove_prefix(1);
        }
        auto const parsed = parse_uint256(sv);
        if (ETHKIT_UNLIKELY(!parsed.has_value())) {
            return AbiJsonError::InvalidValue;
        }
        magnitude = *parsed;
    }
    else {
        return AbiJsonError::InvalidValue;
    }

    if (ETHKIT_UNLIKELY(!integer_fits(type, negative, magnitude))) {
        return AbiJsonError::InvalidValue;
    }
    return abi_uint(negative ? uint256_t{0} - magnitude : magnitude);
}

std::string to_hex(byte_string_view const b)
{
    return "0x" + evmc::hex(b);
}

// Applies "[k]" / "[]" suffixes left to right around `base`
Result<AbiType> apply_array_suffixes(AbiType base, std::string_view suffix)
{
    while (!suffix.empty()) {
        auto const close = suffix.find(']');
        if (ETHKIT_UNLIKELY(
                suffix.front() != '[' || close == std::string_view::npos)) {
            return AbiTypeError::UnbalancedBrackets;
        }
        BOOST_OUTCOME_TRY(
            auto const length, parse_array_length(suffix.substr(1, close - 1)));
        BOOST_OUTCOME_TRY(base, AbiType::array(std::move(base), length));
        suffix.remove_prefix(close + 1);
    }
    return base;
}

Result<std::vector<AbiParam>> parse_params(json const &j)
{
    if (ETHKIT_UNLIKELY(!j.is_array())) {
        return AbiJsonError::InvalidInputs;
    }
    std::vector<AbiParam> params;
    params.reserve(j.size());
    for (auto const &p : j) {
        BOOST_OUTCOME_TRY(auto param, parse_abi_param_json(p));
        params.emplace_back(std::move(param));
    }
    return params;
}

Result<std::vector<AbiParam>>
parse_optional_params(json const &entry, char const *const key)
{
    auto const it = entry.find(key);
    if (it == entry.end() || it->is_null()) {
        return std::vector<AbiParam>{};
    }
    return parse_params(*it);
}

Result<std::string> parse_name(json const &entry)
{
    auto const it = entry.find("name");
    if (ETHKIT_UNLIKELY(it == entry.end() || !it->is_string())) {
        return AbiJsonError::MissingName;
    }
    return it->get<std::string>();
}

bool flag_set(json const &entry, char const *const key)
{
    auto const it = entry.find(key);
    return it != entry.end() && it->is_boolean() && it->get<bool>();
}

std::string entry_name(json const &entry)
{
    if (!entry.is_object()) {
        return {};
    }
    auto const it = entry.find("name");
    return it != entry.end() && it->is_string() ? it->get<std::string>()
                                                : std::string{};
}

Result<StateMutability> parse_mutability(json const &entry)
{
    if (auto const it = entry.find("stateMutability"); it != entry.end()) {
        if (ETHKIT_UNLIKELY(!it->is_string())) {
            return AbiJsonError::InvalidStateMutability;
        }
        auto const m =
            parse_state_mutability(it->get_ref<std::string const &>());
        if (ETHKIT_UNLIKELY(!m.has_value())) {
            return AbiJsonError::InvalidStateMutability;
        }
        return *m;
    }
    // solc < 0.4.16 only emitted the constant and payable flags
    if (flag_set(entry, "payable")) {
        return StateMutability::payable;
    }
    if (flag_set(entry, "constant")) {
        return StateMutability::view;
    }
    return StateMutability::nonpayable;
}

Result<AbiFunction> parse_function(json const &entry)
{
    BOOST_OUTCOME_TRY(auto name, parse_name(entry));
    BOOST_OUTCOME_TRY(auto inputs, parse_optional_params(entry, "inputs"));
    BOOST_OUTCOME_TRY(auto outputs, parse_optional_params(entry, "outputs"));
    BOOST_OUTCOME_TRY(auto const mutability, parse_mutability(entry));
    return AbiFunction{
        .name = std::move(name),
        .inputs = std::move(inputs),
        .outputs = std::move(outputs),
        .state_mutability = mutability};
}

Result<AbiEvent> parse_event(json const &entry)
{
    AbiEvent e;
    BOOST_OUTCOME_TRY(auto name, parse_name(entry));
    BOOST_OUTCOME_TRY(auto inputs, parse_optional_params(entry, "inputs"));
    e.name = std::move(name);
    e.inputs = std::move(inputs);
    if (auto const it = entry.find("anonymous"); it != entry.end()) {
        if (ETHKIT_UNLIKELY(!it->is_boolean())) {
            return AbiJsonError::InvalidValue;
        }
        e.anonymous = it->get<bool>();
    }
    return e;
}

Result<AbiError> parse_error(json const &entry)
{
    BOOST_OUTCOME_TRY(auto name, parse_name(entry));
    BOOST_OUTCOME_TRY(auto inputs, parse_optional_params(entry, "inputs"));
    return AbiError{.name = std::move(name), .inputs = std::move(inputs)};
}

// Parses one top level entry into `abi`
Result<void> parse_entry(json const &entry, Abi &abi)
{
    if (ETHKIT_UNLIKELY(!entry.is_object())) {
        return AbiJsonError::MalformedJson;
    }
    std::string kind = "function";
    if (auto const it = entry.find("type"); it != entry.end()) {
        if (ETHKIT_UNLIKELY(!it->is_string())) {
            return AbiJsonError::MissingType;
        }
        kind = it->get<std::string>();
    }

    if (kind == "function") {
        BOOST_OUTCOME_TRY(auto f, parse_function(entry));
        abi.functions.emplace_back(std::move(f));
    }
    else if (kind == "event") {
        BOOST_OUTCOME_TRY(auto e, parse_event(entry));
        abi.events.emplace_back(std::move(e));
    }
    else if (kind == "error") {
        BOOST_OUTCOME_TRY(auto e, parse_error(entry));
        abi.errors.emplace_back(std::move(e));
    }
    else if (kind == "constructor" || kind == "fallback" || kind == "receive") {
        // still validated so malformed inputs are reported
        BOOST_OUTCOME_TRY(parse_optional_params(entry, "inputs"));
    }
    else {
        return AbiJsonError::MissingType;
    }
    return outcome::success();
}

json params_to_json(std::vector<AbiParam> const &params)
{
    json j = json::array();
    for (auto const &p : params) {
        j.push_back(to_json(p));
    }
    return j;
}

ETHKIT_ANONYMOUS_NAMESPACE_END

ETHKIT_NAMESPACE_BEGIN

Result<AbiParam> parse_abi_param_json(nlohmann::json const &j)
{
    if (ETHKIT_UNLIKELY(!j.is_object())) {
        return AbiJsonError::InvalidInputs;
    }

    AbiParam param;
    if (auto const it = j.find("name"); it != j.end() && !it->is_null()) {
        if (ETHKIT_UNLIKELY(!it->is_string())) {
            return AbiJsonError::MissingName;
        }
        param.name = it->get<std::string>();
    }

    if (auto const it = j.find("indexed"); it != j.end()) {
        if (ETHKIT_UNLIKELY(!it->is_boolean())) {
            return AbiJsonError::InvalidIndexed;
        }
        param.indexed = it->get<bool>();
    }

    auto const type_it = j.find("type");
    if (ETHKIT_UNLIKELY(type_it == j.end() || !type_it->is_string())) {
        return AbiJsonError::MissingType;
    }
    std::string_view const type_str = type_it->get_ref<std::string const &>();

    if (!type_str.starts_with("tuple")) {
        BOOST_OUTCOME_TRY(auto type, parse_abi_type(type_str));
        param.type = std::move(type);
        return param;
    }

    auto const components_it = j.find("components");
    if (ETHKIT_UNLIKELY(
            components_it == j.end() || !components_it->is_array())) {
        return AbiJsonError::InvalidComponents;
    }
    auto components = parse_params(*components_it);
    if (ETHKIT_UNLIKELY(components.has_error())) {
        return AbiJsonError::InvalidComponents;
    }
    param.components = std::move(components).value();
    BOOST_OUTCOME_TRY(
        auto tuple, AbiType::tuple(param_types(param.components)));
    BOOST_OUTCOME_TRY(
        auto type, apply_array_suffixes(std::move(tuple), type_str.substr(5)));
    param.type = std::move(type);
    return param;
}

Result<Abi> parse_abi_json(nlohmann::json const &j)
{
    if (ETHKIT_UNLIKELY(!j.is_array())) {
        LOG_WARNING("abi json is not an array");
        return AbiJsonError::NotAnArray;
    }

    Abi abi;
    for (size_t i = 0; i < j.size(); ++i) {
        auto res = parse_entry(j[i], abi);
        if (ETHKIT_UNLIKELY(res.has_error())) {
            LOG_WARNING(
                "invalid abi json entry index={} name={} error={}",
                i,
                entry_name(j[i]),
                res.error().message().c_str());
            return std::move(res).error();
        }
    }
    return abi;
}

Result<Abi> parse_abi_json(std::string_view const text)
{
    auto const j = nlohmann::json::parse(text, nullptr, false);
    if (ETHKIT_UNLIKELY(j.is_discarded())) {
        LOG_WARNING("abi json could not be parsed");
        return AbiJsonError::MalformedJson;
    }
    return parse_abi_json(j);
}

nlohmann::json to_json(AbiParam const &param)
{
    json j;
    j["name"] = param.name;

    // tuples are written as "tuple" plus their array suffixes
    std::string suffix;
    AbiType const *base = &param.type;
    while (base->kind() == AbiType::Kind::Array) {
        auto const &length = base->array_length();
        auto const digits =
            length.has_value() ? std::to_string(*length) : std::string{};
        suffix = "[" + digits + "]" + suffix;
        base = &base->element();
    }
    if (base->kind() == AbiType::Kind::Tuple) {
        j["type"] = "tuple" + suffix;
        if (param.components.size() == base->components().size()) {
            j["components"] = params_to_json(param.components);
        }
        else {
            std::vector<AbiParam> unnamed;
            for (auto const &t : base->components()) {
                unnamed.push_back(AbiParam{.type = t});
            }
            j["components"] = params_to_json(unnamed);
        }
    }
    else {
        j["type"] = param.type.to_string();
    }
    return j;
}

nlohmann::json to_json(AbiFunction const &f)
{
    json j;
    j["type"] = "function";
    j["name"] = f.name;
    j["inputs"] = params_to_json(f.inputs);
    j["outputs"] = params_to_json(f.outputs);
    j["stateMutability"] = std::string{to_string(f.state_mutability)};
    return j;
}

nlohmann::json to_json(AbiEvent const &e)
{
    json j;
    j["type"] = "event";
    j["name"] = e.name;
    j["inputs"] = json::array();
    for (auto const &p : e.inputs) {
        auto pj = to_json(p);
        pj["indexed"] = p.indexed;
        j["inputs"].push_back(std::move(pj));
    }
    j["anonymous"] = e.anonymous;
    return j;
}

nlohmann::json to_json(AbiError const &e)
{
    json j;
    j["type"] = "error";
    j["name"] = e.name;
    j["inputs"] = params_to_json(e.inputs);
    return j;
}

nlohmann::json to_json(Abi const &abi)
{
    json j = json::array();
    for (auto const &f : abi.functions) {
        j.push_back(to_json(f));
    }
    for (auto const &e : abi.events) {
        j.push_back(to_json(e));
    }
    for (auto const &e : abi.errors) {
        j.push_back(to_json(e));
    }
    return j;
}

Result<AbiValue>
abi_value_from_json(AbiType const &type, nlohmann::json const &j)
{
    using Kind = AbiType::Kind;
    switch (type.kind()) {
    case Kind::Address: {
        if (ETHKIT_UNLIKELY(!j.is_string())) {
            return AbiJsonError::InvalidValue;
        }
        auto const &s = j.get_ref<std::string const &>();
        auto const a = evmc::from_hex<Address>(s);
        if (ETHKIT_UNLIKELY(
                !a.has_value() || s.size() != 2 + 2 * sizeof(Address))) {
            return AbiJsonError::InvalidValue;
        }
        return abi_address(*a);
    }
    case Kind::Bool:
        if (ETHKIT_UNLIKELY(!j.is_boolean())) {
            return AbiJsonError::InvalidValue;
        }
        return abi_bool(j.get<bool>());
    case Kind::Uint:
    case Kind::Int:
        return integer_from_json(type, j);
    case Kind::FixedBytes:
    case Kind::Bytes: {
        if (ETHKIT_UNLIKELY(!j.is_string())) {
            return AbiJsonError::InvalidValue;
        }
        auto const b = evmc::from_hex(j.get_ref<std::string const &>());
        if (ETHKIT_UNLIKELY(!b.has_value())) {
            return AbiJsonError::InvalidValue;
        }
        return abi_bytes(*b);
    }
    case Kind::String:
        if (ETHKIT_UNLIKELY(!j.is_string())) {
            return AbiJsonError::InvalidValue;
        }
        return abi_string(j.get<std::string>());
    case Kind::Array:
    case Kind::Tuple: {
        if (ETHKIT_UNLIKELY(!j.is_array())) {
            return AbiJsonError::InvalidValue;
        }
        bool const is_tuple = type.kind() == Kind::Tuple;
        if (ETHKIT_UNLIKELY(
                is_tuple && j.size() != type.components().size())) {
            return AbiJsonError::InvalidValue;
        }
        AbiValueList list;
        list.reserve(j.size());
        for (size_t i = 0; i < j.size(); ++i) {
            BOOST_OUTCOME_TRY(
                auto v,
                abi_value_from_json(
                    is_tuple ? type.components()[i] : type.element(), j[i]));
            list.emplace_back(std::move(v));
        }
        return abi_list(std::move(list));
    }
    }
    return AbiJsonError::InvalidValue;
}

nlohmann::json abi_value_to_json(AbiType const &type, AbiValue const &value)
{
    using Kind = AbiType::Kind;
    return std::visit(
        [&](auto const &v) -> json {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::same_as<T, Address>) {
                return to_hex({v.bytes, sizeof(v.bytes)});
            }
            else if constexpr (std::same_as<T, bool>) {
                return v;
            }
            else if constexpr (std::same_as<T, uint256_t>) {
                if (type.kind() == Kind::Int && is_negative(v)) {
                    return "-" + intx::to_string(uint256_t{0} - v);
                }
                return intx::to_string(v);
            }
            else if constexpr (std::same_as<T, byte_string>) {
                return to_hex(v);
            }
            else if constexpr (std::same_as<T, std::string>) {
                return v;
            }
            else {
                json j = json::array();
                for (size_t i = 0; i < v.size(); ++i) {
                    AbiType const &t =
                        type.kind() == Kind::Tuple ? type.components()[i]
                                                   : type.element();
                    j.push_back(abi_value_to_json(t, v[i]));
                }
                return j;
            }
        },
        value.value);
}

ETHKIT_NAMESPACE_END
