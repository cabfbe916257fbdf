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
#include <ethkit/core/byte_string.hpp>
#include <ethkit/core/config.hpp>
#include <ethkit/core/result.hpp>
#include <ethkit/crypto/hasher.hpp>

#include <cstdint>
#include <span>

ETHKIT_NAMESPACE_BEGIN

/// selector || abi_encode(inputs, args)
Result<byte_string> encode_function_call(
    uint32_t selector, std::span<AbiType const> inputs,
    AbiValueList const &args);

Result<byte_string> encode_function_call(
    Hasher const &, AbiFunction const &, AbiValueList const &args);

/// Decodes return data. No selector is stripped.
Result<AbiValueList>
decode_function_result(AbiFunction const &, byte_string_view data);

/// Checks and strips the selector of `function`, then decodes the arguments
Result<AbiValueList> decode_function_input(
    Hasher const &, AbiFunction const &, byte_string_view call_data);

ETHKIT_NAMESPACE_END
