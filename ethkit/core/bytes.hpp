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

#include <ethkit/core/config.hpp>

#include <ethkit/core/assert.h>
#include <ethkit/core/byte_string.hpp>
#include <ethkit/core/int.hpp>
#include <ethkit/core/keccak.hpp>

#include <evmc/evmc.hpp>

#include <algorithm>
#include <bit>
#include <cstddef>

ETHKIT_NAMESPACE_BEGIN

using bytes32_t = ::evmc::bytes32;

static_assert(sizeof(bytes32_t) == 32);
static_assert(alignof(bytes32_t) == 1);

constexpr bytes32_t to_bytes(hash256 const n) noexcept
{
    return std::bit_cast<bytes32_t>(n);
}

/// Right-aligns `data` in a zeroed word
constexpr bytes32_t to_bytes(byte_string_view const data) noexcept
{
    ETHKIT_ASSERT(data.size() <= sizeof(bytes32_t));

    bytes32_t byte;
    std::copy_n(
        data.begin(),
        data.size(),
        byte.bytes + sizeof(bytes32_t) - data.size());
    return byte;
}

inline byte_string to_byte_string(bytes32_t const &b)
{
    return {b.bytes, sizeof(b.bytes)};
}

inline bytes32_t to_bytes_be(uint256_t const &n) noexcept
{
    return intx::be::store<bytes32_t>(n);
}

inline uint256_t from_bytes_be(bytes32_t const &b) noexcept
{
    return intx::be::load<uint256_t>(b);
}

using namespace evmc::literals;
inline constexpr bytes32_t NULL_HASH{
    0xc5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470_bytes32};

ETHKIT_NAMESPACE_END
