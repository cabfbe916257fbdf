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

#include <ethkit/core/bytes.hpp>
#include <ethkit/core/config.hpp>
#include <ethkit/core/result.hpp>
#include <ethkit/crypto/hasher.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

ETHKIT_NAMESPACE_BEGIN

// EIP-712 structured data
// https://eips.ethereum.org/EIPS/eip-712

struct TypedDataField
{
    std::string name{};
    std::string type{};

    friend bool
    operator==(TypedDataField const &, TypedDataField const &) = default;
};

using TypedDataTypes =
    std::map<std::string, std::vector<TypedDataField>, std::less<>>;

/// The eth_signTypedData_v4 payload. Values in `domain` and `message` keep
/// their JSON form and are checked against the field types when hashed.
struct TypedData
{
    TypedDataTypes types{};
    std::string primary_type{};
    nlohmann::json domain = nlohmann::json::object();
    nlohmann::json message = nlohmann::json::object();
};

/// Validates that every field type is either a known struct or an ABI type
Result<TypedData> parse_typed_data_json(std::string_view);
Result<TypedData> parse_typed_data_json(nlohmann::json const &);

inline Result<TypedData> parse_typed_data_json(char const *const text)
{
    return parse_typed_data_json(std::string_view{text});
}

nlohmann::json to_json(TypedData const &);

/// "Mail(Person from,Person to,string contents)Person(string name,...)":
/// the primary type followed by its referenced struct types in name order
Result<std::string>
encode_type(TypedDataTypes const &, std::string_view primary_type);

Result<bytes32_t> type_hash(
    Hasher const &, TypedDataTypes const &, std::string_view primary_type);

Result<bytes32_t> hash_struct(
    Hasher const &, TypedDataTypes const &, std::string_view primary_type,
    nlohmann::json const &data);

// Uses the EIP712Domain entry of `types` when present, otherwise the type
// is derived from the keys of `domain` in the order name, version, chainId,
// verifyingContract, salt.
Result<bytes32_t> domain_separator(Hasher const &, TypedData const &);

/// keccak256(0x19 0x01 || domain separator || hash_struct(message))
Result<bytes32_t> typed_data_hash(Hasher const &, TypedData const &);

ETHKIT_NAMESPACE_END
