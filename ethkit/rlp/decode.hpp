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

#include <ethkit/core/byte_string.hpp>
#include <ethkit/core/int.hpp>
#include <ethkit/core/likely.h>
#include <ethkit/core/result.hpp>
#include <ethkit/rlp/config.hpp>
#include <ethkit/rlp/decode_error.hpp>

#include <boost/outcome/try.hpp>

#include <cstddef>
#include <cstdint>
#include <cstring>

ETHKIT_RLP_NAMESPACE_BEGIN

template <unsigned_integral T>
constexpr Result<T> decode_raw_num(byte_string_view const enc)
{
    if (ETHKIT_UNLIKELY(enc.size() > sizeof(T))) {
        return DecodeError::Overflow;
    }

    if (enc.empty()) {
        return 0;
    }

    if (enc[0] == 0) {
        return DecodeError::LeadingZero;
    }

    T result{};
    std::memcpy(
        &intx::as_bytes(result)[sizeof(T) - enc.size()],
        enc.data(),
        enc.size());
    result = intx::to_big_endian(result);
    return result;
}

// Long form lengths must not fit the short form
constexpr Result<size_t> decode_length(byte_string_view const enc)
{
    BOOST_OUTCOME_TRY(auto const length, decode_raw_num<size_t>(enc));
    if (ETHKIT_UNLIKELY(length < 56)) {
        return DecodeError::NonCanonicalSize;
    }
    return length;
}

constexpr Result<byte_string_view> parse_string_metadata(byte_string_view &enc)
{
    size_t i = 0;
    size_t end = 0;

    if (ETHKIT_UNLIKELY(enc.empty())) {
        return DecodeError::InputTooShort;
    }

    if (ETHKIT_UNLIKELY(enc[0] >= 0xc0)) {
        return DecodeError::TypeUnexpected;
    }

    if (enc[0] < 0x80) // [0x00, 0x7f]
    {
        end = i + 1;
    }
    else if (enc[0] < 0xb8) // [0x80, 0xb7]
    {
        ++i;
        uint8_t const length = enc[0] - 0x80;
        end = i + length;
        if (ETHKIT_UNLIKELY(
                length == 1 && enc.size() > 1 && enc[1] < 0x80)) {
            return DecodeError::NonCanonicalSize;
        }
    }
    else // [0xb8, 0xbf]
    {
        ++i;
        uint8_t const length_of_length = enc[0] - 0xb7;

        if (ETHKIT_UNLIKELY(i + length_of_length >= enc.size())) {
            return DecodeError::InputTooShort;
        }

        BOOST_OUTCOME_TRY(
            auto const length, decode_length(enc.substr(i, length_of_length)));
        i += length_of_length;
        if (ETHKIT_UNLIKELY(length > enc.size() - i)) {
            return DecodeError::InputTooShort;
        }
        end = i + length;
    }

    if (ETHKIT_UNLIKELY(end > enc.size())) {
        return DecodeError::InputTooShort;
    }

    auto const payload = enc.substr(i, end - i);
    enc = enc.substr(end);
    return payload;
}

constexpr Result<byte_string_view> parse_list_metadata(byte_string_view &enc)
{
    size_t i = 0;
    size_t length;
    ++i;

    if (ETHKIT_UNLIKELY(enc.empty())) {
        return DecodeError::InputTooShort;
    }

    if (ETHKIT_UNLIKELY(enc[0] < 0xc0)) {
        return DecodeError::TypeUnexpected;
    }

    if (enc[0] < 0xf8) {
        length = enc[0] - 0xc0;
    }
    else {
        size_t const length_of_length = enc[0] - 0xf7;

        if (ETHKIT_UNLIKELY(i + length_of_length >= enc.size())) {
            return DecodeError::InputTooShort;
        }

        BOOST_OUTCOME_TRY(
            length, decode_length(enc.substr(i, length_of_length)));
        i += length_of_length;
    }

    if (ETHKIT_UNLIKELY(length > enc.size() - i)) {
        return DecodeError::InputTooShort;
    }
    auto const end = i + length;

    auto const payload = enc.substr(i, end - i);
    enc = enc.substr(end);
    return payload;
}

constexpr Result<byte_string_view> decode_string(byte_string_view &enc)
{
    return parse_string_metadata(enc);
}

template <size_t N>
constexpr Result<byte_string_fixed<N>>
decode_byte_string_fixed(byte_string_view &enc)
{
    byte_string_fixed<N> bsf;
    BOOST_OUTCOME_TRY(auto const payload, parse_string_metadata(enc));
    if (ETHKIT_UNLIKELY(payload.size() != N)) {
        return DecodeError::ArrayLengthUnexpected;
    }
    std::memcpy(bsf.data(), payload.data(), N);
    return bsf;
}

ETHKIT_RLP_NAMESPACE_END
