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

#include <ethkit/core/address.hpp>
#include <ethkit/core/byte_string.hpp>
#include <ethkit/core/config.hpp>
#include <ethkit/core/int.hpp>

#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

ETHKIT_NAMESPACE_BEGIN

struct AbiValue;

using AbiValueList = std::vector<AbiValue>;

// Runtime value for an AbiType. `uint256_t` carries both uintN and intN, the
// latter as the 256-bit two's complement word. `byte_string` carries bytes and
// bytesN; arrays and tuples are lists.
struct AbiValue
{
    std::variant<
        Address, bool, uint256_t, byte_string, std::string, AbiValueList>
        value;

    friend bool operator==(AbiValue const &, AbiValue const &) = default;
};

inline AbiValue abi_address(Address const &a)
{
    return AbiValue{a};
}

inline AbiValue abi_bool(bool const b)
{
    return AbiValue{b};
}

inline AbiValue abi_uint(uint256_t const &v)
{
    return AbiValue{v};
}

inline AbiValue abi_int(int64_t const v)
{
    // sign extend to 256 bits
    uint256_t const w{static_cast<uint64_t>(v)};
    return AbiValue{v < 0 ? w | (UINT256_MAX << 64) : w};
}

inline AbiValue abi_bytes(byte_string_view const b)
{
    return AbiValue{byte_string{b}};
}

inline AbiValue abi_string(std::string s)
{
    return AbiValue{std::move(s)};
}

inline AbiValue abi_list(AbiValueList l)
{
    return AbiValue{std::move(l)};
}

/// Interprets the word as a signed integer
inline bool is_negative(uint256_t const &v) noexcept
{
    return (v >> 255) != 0;
}

ETHKIT_NAMESPACE_END
