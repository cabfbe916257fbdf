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

#include <ethkit/abi/abi_decode_error.hpp>
#include <ethkit/abi/abi_type.hpp>
#include <ethkit/abi/abi_value.hpp>
#include <ethkit/core/address.hpp>
#include <ethkit/core/byte_string.hpp>
#include <ethkit/core/bytes.hpp>
#include <ethkit/core/config.hpp>
#include <ethkit/core/int.hpp>
#include <ethkit/core/likely.h>
#include <ethkit/core/result.hpp>

#include <cstring>
#include <span>

ETHKIT_NAMESPACE_BEGIN

// All solidity uints are are left padded to fit in 32 bytes. An address is
// treated as a uint160 by the decoder.
// https://docs.soliditylang.org/en/latest/abi-spec.html
//
// Note that any dirty higher order bits are ignored and not checked for
// overflow. This is in line with solidity's behavior as of version 0.5.0
//
// https://docs.soliditylang.org/en/v0.8.30/050-breaking-changes.html
inline Result<bytes32_t> abi_decode_word(byte_string_view &enc)
{
    if (ETHKIT_UNLIKELY(enc.size() < sizeof(bytes32_t))) {
        return AbiDecodeError::InputTooShort;
    }

    bytes32_t output{};
    std::memcpy(output.bytes, enc.data(), sizeof(bytes32_t));
    enc.remove_prefix(sizeof(bytes32_t));
    return output;
}

/// Decodes a single value starting at the beginning of `data`. A dynamic
/// value's offsets are relative to the beginning of `data`.
Result<AbiValue> abi_decode_value(AbiType const &, byte_string_view data);

/// Decodes `data` as the tuple `types`
Result<AbiValueList>
abi_decode(std::span<AbiType const> types, byte_string_view data);

ETHKIT_NAMESPACE_END
