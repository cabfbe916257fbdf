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

#include <ethkit/abi/abi_encode.hpp>
#include <ethkit/abi/abi_json.hpp>
#include <ethkit/abi/abi_type.hpp>
#include <ethkit/abi/abi_value.hpp>
#include <ethkit/abi/typed_data.hpp>
#include <ethkit/abi/typed_data_error.hpp>
#include <ethkit/core/byte_string.hpp>
#include <ethkit/core/bytes.hpp>
#include <ethkit/core/config.hpp>
#include <ethkit/core/int.hpp>
#include <ethkit/core/likely.h>
#include <ethkit/core/result.hpp>
#include <ethkit/crypto/hasher.hpp>

#include <boost/outcome/try.hpp>
#include <nlohmann/json.hpp>
#include <quill/Quill.h>

#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

ETHKIT_ANONYMOUS_NAMESPACE_BEGIN

using json = nlohmann::json;

constexpr std::string_view DOMAIN_TYPE = "EIP712Domain";

struct ArrayType
{
    std::string_view element;
    std::optional<size_t> length;
};

// Splits the outermost array suffix: "Person[2][]" is an unsized array of
// "Person[2]"
Result<std::optional<ArrayType>> split_array(std::string_view const type)
{
    if (!type.ends_with(']')) {
        return std::optional<ArrayType>{};
    }
    auto const open = type.rfind('[');
    if (ETHKIT_UNLIKELY(open == std::string_view::npos || open == 0)) {
        return TypedDataError::InvalidFieldType;
    }
    BOOST_OUTCOME_TRY(
        auto const length,
        parse_array_length(type.substr(open + 1, type.size() - open - 2)));
    return std::optional<ArrayType>{ArrayType{type.substr(0, open), length}};
}

std::string_view base_type(std::string_view const type)
{
    return type.substr(0, type.find('['));
}

Result<void>
check_field_type(TypedDataTypes const &types, std::string_view const type)
{
    auto const base = base_type(type);
    if (base.size() != type.size()) {
        // validates every suffix
        std::string_view t = type;
        for (;;) {
            BOOST_OUTCOME_TRY(auto const array, split_array(t));
            if (!array.has_value()) {
                break;
            }
            t = array->element;
        }
    }
    if (types.contains(base)) {
        return outcome::success();
    }
    auto const abi_type = parse_abi_type(base);
    if (ETHKIT_UNLIKELY(
            abi_type.has_error() ||
            abi_type.value().kind() == AbiType::Kind::Tuple)) {
        return TypedDataError::UnknownType;
    }
    return outcome::success();
}

void collect_dependencies(
    TypedDataTypes const &types, std::string_view const name,
    std::set<std::string_view> &found)
{
    auto const it = types.find(name);
    if (it == types.end() || !found.insert(it->first).second) {
        return;
    }
    for (auto const &field : it->second) {
        collect_dependencies(types, base_type(field.type), found);
    }
}

std::string encode_struct(
    std::string_view const name, std::vector<TypedDataField> const &fields)
{
    std::string result{name};
    result += '(';
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) {
            result += ',';
        }
        result += fields[i].type;
        result += ' ';
        result += fields[i].name;
    }
    result += ')';
    return result;
}

void add_hash(AbiEncoder &encoder, bytes32_t const &hash)
{
    encoder.add_uint(from_bytes_be(hash));
}

Result<void> encode_field(
    Hasher const &hasher, TypedDataTypes const &types,
    std::string_view const type, json const &value, AbiEncoder &encoder)
{
    BOOST_OUTCOME_TRY(auto const array, split_array(type));
    if (array.has_value()) {
        if (ETHKIT_UNLIKELY(!value.is_array())) {
            return TypedDataError::MalformedTypedData;
        }
        if (ETHKIT_UNLIKELY(
                array->length.has_value() && *array->length != value.size())) {
            return TypedDataError::LengthMismatch;
        }
        AbiEncoder elements;
        for (auto const &element : value) {
            BOOST_OUTCOME_TRY(encode_field(
                hasher, types, array->element, element, elements));
        }
        add_hash(encoder, hasher.keccak256(elements.encode_final()));
        return outcome::success();
    }

    if (types.contains(type)) {
        BOOST_OUTCOME_TRY(
            auto const hash, hash_struct(hasher, types, type, value));
        add_hash(encoder, hash);
        return outcome::success();
    }

    BOOST_OUTCOME_TRY(auto const abi_type, parse_abi_type(type));
    BOOST_OUTCOME_TRY(auto const abi_value, abi_value_from_json(abi_type, value));
    switch (abi_type.kind()) {
    case AbiType::Kind::String:
        add_hash(
            encoder,
            hasher.keccak256(
                to_byte_string_view(std::get<std::string>(abi_value.value))));
        break;
    case AbiType::Kind::Bytes:
        add_hash(
            encoder,
            hasher.keccak256(std::get<byte_string>(abi_value.value)));
        break;
    case AbiType::Kind::Array:
    case AbiType::Kind::Tuple:
        return TypedDataError::InvalidFieldType;
    default:
        BOOST_OUTCOME_TRY(encoder.add(abi_type, abi_value));
        break;
    }
    return outcome::success();
}

std::vector<TypedDataField> derive_domain_fields(json const &domain)
{
    static constexpr std::pair<char const *, char const *> known[] = {
        {"name", "string"},
        {"version", "string"},
        {"chainId", "uint256"},
        {"verifyingContract", "address"},
        {"salt", "bytes32"},
    };

    std::vector<TypedDataField> fields;
    for (auto const &[name, type] : known) {
        if (domain.contains(name)) {
            fields.push_back(TypedDataField{.name = name, .type = type});
        }
    }
    return fields;
}

Result<std::vector<TypedDataField>> parse_fields(json const &j)
{
    if (ETHKIT_UNLIKELY(!j.is_array())) {
        return TypedDataError::MalformedTypedData;
    }
    std::vector<TypedDataField> fields;
    fields.reserve(j.size());
    for (auto const &f : j) {
        if (ETHKIT_UNLIKELY(
                !f.is_object() || !f.contains("name") || !f.contains("type") ||
                !f["name"].is_string() || !f["type"].is_string())) {
            return TypedDataError::MalformedTypedData;
        }
        fields.push_back(TypedDataField{
            .name = f["name"].get<std::string>(),
            .type = f["type"].get<std::string>()});
    }
    return fields;
}

ETHKIT_ANONYMOUS_NAMESPACE_END

ETHKIT_NAMESPACE_BEGIN

Result<TypedData> parse_typed_data_json(nlohmann::json const &j)
{
    if (ETHKIT_UNLIKELY(
            !j.is_object() || !j.contains("types") || !j["types"].is_object() ||
            !j.contains("primaryType") || !j["primaryType"].is_string() ||
            !j.contains("message") || !j["message"].is_object())) {
        LOG_WARNING("typed data json is missing types, primaryType or message");
        return TypedDataError::MalformedTypedData;
    }

    TypedData data;
    for (auto const &[name, fields] : j["types"].items()) {
        BOOST_OUTCOME_TRY(auto parsed, parse_fields(fields));
        data.types.emplace(name, std::move(parsed));
    }
    for (auto const &[name, fields] : data.types) {
        for (auto const &field : fields) {
            auto res = check_field_type(data.types, field.type);
            if (ETHKIT_UNLIKELY(res.has_error())) {
                LOG_WARNING(
                    "invalid typed data field struct={} field={} type={}",
                    name,
                    field.name,
                    field.type);
                return std::move(res).error();
            }
        }
    }

    data.primary_type = j["primaryType"].get<std::string>();
    if (ETHKIT_UNLIKELY(!data.types.contains(data.primary_type))) {
        LOG_WARNING("unknown typed data primary type {}", data.primary_type);
        return TypedDataError::UnknownType;
    }

    if (j.contains("domain")) {
        if (ETHKIT_UNLIKELY(!j["domain"].is_object())) {
            return TypedDataError::MalformedTypedData;
        }
        data.domain = j["domain"];
    }
    data.message = j["message"];
    return data;
}

Result<TypedData> parse_typed_data_json(std::string_view const text)
{
    auto const j = nlohmann::json::parse(text, nullptr, false);
    if (ETHKIT_UNLIKELY(j.is_discarded())) {
        LOG_WARNING("typed data json could not be parsed");
        return TypedDataError::MalformedTypedData;
    }
    return parse_typed_data_json(j);
}

nlohmann::json to_json(TypedData const &data)
{
    json types = json::object();
    auto const add_type = [&types](
                              std::string_view const name,
                              std::vector<TypedDataField> const &fields) {
        json j = json::array();
        for (auto const &field : fields) {
            j.push_back({{"name", field.name}, {"type", field.type}});
        }
        types[std::string{name}] = std::move(j);
    };

    for (auto const &[name, fields] : data.types) {
        add_type(name, fields);
    }
    if (!data.types.contains(DOMAIN_TYPE)) {
        add_type(DOMAIN_TYPE, derive_domain_fields(data.domain));
    }

    json j;
    j["types"] = std::move(types);
    j["primaryType"] = data.primary_type;
    j["domain"] = data.domain;
    j["message"] = data.message;
    return j;
}

Result<std::string>
encode_type(TypedDataTypes const &types, std::string_view const primary_type)
{
    auto const primary = types.find(primary_type);
    if (ETHKIT_UNLIKELY(primary == types.end())) {
        return TypedDataError::UnknownType;
    }

    std::set<std::string_view> dependencies;
    collect_dependencies(types, primary_type, dependencies);
    dependencies.erase(primary->first);

    std::string result = encode_struct(primary->first, primary->second);
    for (auto const name : dependencies) {
        result += encode_struct(name, types.find(name)->second);
    }
    return result;
}

Result<bytes32_t> type_hash(
    Hasher const &hasher, TypedDataTypes const &types,
    std::string_view const primary_type)
{
    BOOST_OUTCOME_TRY(auto const encoded, encode_type(types, primary_type));
    return hasher.keccak256(to_byte_string_view(encoded));
}

Result<bytes32_t> hash_struct(
    Hasher const &hasher, TypedDataTypes const &types,
    std::string_view const primary_type, nlohmann::json const &data)
{
    auto const it = types.find(primary_type);
    if (ETHKIT_UNLIKELY(it == types.end())) {
        return TypedDataError::UnknownType;
    }
    if (ETHKIT_UNLIKELY(!data.is_object())) {
        return TypedDataError::MalformedTypedData;
    }

    BOOST_OUTCOME_TRY(auto const hash, type_hash(hasher, types, primary_type));
    AbiEncoder encoder;
    add_hash(encoder, hash);
    for (auto const &field : it->second) {
        auto const value = data.find(field.name);
        if (ETHKIT_UNLIKELY(value == data.end())) {
            LOG_WARNING(
                "typed data value missing struct={} field={}",
                it->first,
                field.name);
            return TypedDataError::MissingField;
        }
        BOOST_OUTCOME_TRY(
            encode_field(hasher, types, field.type, *value, encoder));
    }
    return hasher.keccak256(encoder.encode_final());
}

Result<bytes32_t>
domain_separator(Hasher const &hasher, TypedData const &data)
{
    if (data.types.contains(DOMAIN_TYPE)) {
        return hash_struct(hasher, data.types, DOMAIN_TYPE, data.domain);
    }
    TypedDataTypes types = data.types;
    types.emplace(DOMAIN_TYPE, derive_domain_fields(data.domain));
    return hash_struct(hasher, types, DOMAIN_TYPE, data.domain);
}

Result<bytes32_t> typed_data_hash(Hasher const &hasher, TypedData const &data)
{
    BOOST_OUTCOME_TRY(auto const separator, domain_separator(hasher, data));

    byte_string preimage{0x19, 0x01};
    preimage += to_byte_string_view(separator.bytes);
    // signing the domain alone carries no message hash
    if (data.primary_type != DOMAIN_TYPE) {
        BOOST_OUTCOME_TRY(
            auto const message,
            hash_struct(hasher, data.types, data.primary_type, data.message));
        preimage += to_byte_string_view(message.bytes);
    }
    return hasher.keccak256(preimage);
}

ETHKIT_NAMESPACE_END
