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

#include <ethkit/abi/abi_type.hpp>
#include <ethkit/abi/abi_value.hpp>
#include <ethkit/core/address.hpp>
#include <ethkit/core/byte_string.hpp>
#include <ethkit/core/bytes.hpp>
#include <ethkit/core/config.hpp>
#include <ethkit/core/int.hpp>
#include <ethkit/core/math.hpp>
#include <ethkit/core/result.hpp>
#include <ethkit/core/unaligned.hpp>

#include <algorithm>
#include <cstddef>
#include <span>
#include <utility>
#include <vector>

ETHKIT_NAMESPACE_BEGIN

// Helpers for encoding values into the solidity contract ABI, for call data,
// return data and event payloads alike.

//////////////////////////////////////////////////////////////
// Standalone functions for encoding single words.
//
// https://docs.soliditylang.org/en/latest/abi-spec.html#types
//////////////////////////////////////////////////////////////
constexpr bytes32_t abi_encode_address(Address const &address)
{
    bytes32_t output{};
    unaligned_store(&output.bytes[12], address);
    return output;
}

inline bytes32_t abi_encode_uint(uint256_t const &i)
{
    return to_bytes_be(i);
}

inline bytes32_t abi_encode_bool(bool const b)
{
    return abi_encode_uint(b ? 1 : 0);
}

/// bytesN, right padded
inline bytes32_t abi_encode_fixed_bytes(byte_string_view const input)
{
    bytes32_t output{};
    std::copy_n(
        input.begin(), std::min(input.size(), sizeof(output)), output.bytes);
    return output;
}

/// Length word followed by the content padded to a multiple of 32
inline byte_string abi_encode_bytes(byte_string_view const input)
{
    byte_string output;
    size_t const padding =
        round_up(input.size(), sizeof(bytes32_t)) - input.size();
    output += abi_encode_uint(input.size());
    output += input;
    output = output.append(padding, 0);
    return output;
}

// Encodes a tuple
//  * static types : inline words, added to the "head".
//  * dynamic types: the "head" stores the offset in the tail, and the actual
//                   data is stored in the tail.
//
// Offsets are relative to the start of the block being encoded, so nested
// dynamic values use their own encoder.
//
// https://docs.soliditylang.org/en/latest/abi-spec.html#formal-specification-of-the-encoding
class AbiEncoder
{
    byte_string head_;
    byte_string tail_;
    std::vector<std::pair<size_t, size_t>> unresolved_offsets_;

    void add_static(byte_string_view const data)
    {
        head_ += data;
    }

    void add_dynamic(byte_string_view const data)
    {
        unresolved_offsets_.emplace_back(head_.size(), tail_.size());
        head_ += bytes32_t{};
        tail_ += data;
    }

public:
    void add_address(Address const &address)
    {
        add_static(abi_encode_address(address));
    }

    void add_uint(uint256_t const &i)
    {
        add_static(abi_encode_uint(i));
    }

    void add_bool(bool const b)
    {
        add_static(abi_encode_bool(b));
    }

    void add_bytes(byte_string_view const data)
    {
        add_dynamic(abi_encode_bytes(data));
    }

    /// Checks `value` against `type` and appends it
    Result<void> add(AbiType const &type, AbiValue const &value);

    byte_string encode_final();
};

/// Encoding of a single value: the inline words of a static value or the
/// tail of a dynamic one
Result<byte_string> abi_encode_value(AbiType const &, AbiValue const &);

/// Encodes `values` as the tuple `types`
Result<byte_string>
abi_encode(std::span<AbiType const> types, AbiValueList const &values);

/// Non-standard packed mode (`abi.encodePacked`)
Result<byte_string>
abi_encode_packed(std::span<AbiType const> types, AbiValueList const &values);

/// Range check of an integer word against a uintN / intN type
bool abi_integer_in_range(AbiType const &, uint256_t const &) noexcept;

ETHKIT_NAMESPACE_END
