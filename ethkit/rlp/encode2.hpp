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

#include <ethkit/core/assert.h>
#include <ethkit/core/byte_string.hpp>
#include <ethkit/core/int.hpp>
#include <ethkit/rlp/config.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>

ETHKIT_RLP_NAMESPACE_BEGIN

inline byte_string const EMPTY_STRING = {0x80};

constexpr byte_string_view zeroless_view(byte_string_view const string_view)
{
    auto b = string_view.begin();
    auto const e = string_view.end();
    while (b < e && *b == 0) {
        ++b;
    }
    return {b, e};
}

inline byte_string to_big_compact(unsigned_integral auto n)
{
    n = intx::to_big_endian(n);
    return byte_string(
        zeroless_view({reinterpret_cast<unsigned char *>(&n), sizeof(n)}));
}

inline byte_string encode_length(unsigned char const base, size_t const size)
{
    byte_string result;
    if (size > 55) {
        auto const size_str = to_big_compact(size);
        ETHKIT_ASSERT(size_str.size() <= 8u);
        result.push_back(
            static_cast<unsigned char>(base + 55 + size_str.size()));
        result += size_str;
    }
    else {
        result.push_back(static_cast<unsigned char>(base + size));
    }
    return result;
}

inline byte_string encode_string2(byte_string_view const string_view)
{
    if (string_view.size() == 1 && string_view[0] <= 0x7f) {
        return byte_string{string_view};
    }
    return encode_length(0x80, string_view.size()) + byte_string{string_view};
}

template <std::convertible_to<byte_string_view>... Args>
byte_string encode_list2(Args const &...args)
{
    size_t size = 0;
    ([&] { size += byte_string_view{args}.size(); }(), ...);
    byte_string result = encode_length(0xc0, size);
    result.reserve(result.size() + size);
    ([&] { result += byte_string_view{args}; }(), ...);
    return result;
}

ETHKIT_RLP_NAMESPACE_END
