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

#include <ethkit/abi/abi_item.hpp>
#include <ethkit/abi/abi_type.hpp>
#include <ethkit/abi/abi_value.hpp>
#include <ethkit/core/config.hpp>
#include <ethkit/core/result.hpp>

#include <nlohmann/json.hpp>

#include <string_view>

ETHKIT_NAMESPACE_BEGIN

// JSON ABI as emitted by solc
// https://docs.soliditylang.org/en/latest/abi-spec.html#json
//
// Constructor, fallback and receive entries are accepted and skipped.
Result<Abi> parse_abi_json(std::string_view);
Result<Abi> parse_abi_json(nlohmann::json const &);

inline Result<Abi> parse_abi_json(char const *const text)
{
    return parse_abi_json(std::string_view{text});
}

/// One parameter object: `{name, type, indexed, components}`
Result<AbiParam> parse_abi_param_json(nlohmann::json const &);

nlohmann::json to_json(AbiParam const &);
nlohmann::json to_json(AbiFunction const &);
nlohmann::json to_json(AbiEvent const &);
nlohmann::json to_json(AbiError const &);
nlohmann::json to_json(Abi const &);

// Values as they appear in JSON-RPC and tooling: addresses, bytes and bytesN
// as 0x-prefixed hex, integers as decimal or 0x hex strings (or JSON numbers),
// negative integers with a leading '-', arrays and tuples as JSON arrays.
Result<AbiValue> abi_value_from_json(AbiType const &, nlohmann::json const &);
nlohmann::json abi_value_to_json(AbiType const &, AbiValue const &);

ETHKIT_NAMESPACE_END
