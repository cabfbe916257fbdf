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

#include <ethkit/abi/abi_decode.hpp>
#include <ethkit/abi/abi_decode_error.hpp>
#include <ethkit/abi/abi_type.hpp>
#include <ethkit/abi/abi_value.hpp>
#include <ethkit/core/address.hpp>
#include <ethkit/core/byte_string.hpp>
#include <ethkit/core/bytes.hpp>
#include <ethkit/core/config.hpp>
#include <ethkit/core/int.hpp>
#include <ethkit/core/likely.h>
#include <ethkit/core/math.hpp>
#include <ethkit/core/result.hpp>
#include <ethkit/core/unaligned.hpp>
#include <ethkit/core/utf8.hpp>

#include <boost/outcome/try.hpp>

#include <algorithm>
#include <cstddef>
#include <span>
#include <string>

ETHKIT_ANONYMOUS_NAMESPACE_BEGIN

constexpr size_t WORD_SIZE = sizeof(bytes32_t);

// Reads a length or count word that must not exceed `limit`
Result<size_t> decode_length(byte_string_view &enc, size_t const limit)
{
    BOOST_OUTCOME_TRY(auto const word, abi_decode_word(enc));
    uint256_t const length = from_bytes_be(word);
    if (ETHKIT_UNLIKELY(length > limit)) {
        return AbiDecodeError::LengthOutOfBounds;
    }
    return static_cast<size_t>(length);
}

// Decodes `count` values laid out head-tail in `block`
Result<AbiValueList> decode_sequence(
    size_t const count, auto const &type_at, byte_string_view const block)
{
    AbiValueList values;
    values.reserve(count);
    size_t cursor = 0;
    for (size_t i = 0; i < count; ++i) {
        AbiType const &type = type_at(i);
        if (ETHKIT_UNLIKELY(block.size() - cursor < type.static_size())) {
            return AbiDecodeError::InputTooShort;
        }
        if (type.is_dynamic()) {
            auto head = block.substr(cursor);
            BOOST_OUTCOME_TRY(auto const word, abi_decode_word(head));
            uint256_t const offset = from_bytes_be(word);
            if (ETHKIT_UNLIKELY(offset >= block.size())) {
                return AbiDecodeError::OffsetOutOfBounds;
            }
            BOOST_OUTCOME_TRY(
                auto value,
                abi_decode_value(
                    type, block.substr(static_cast<size_t>(offset))));
            values.emplace_back(std::move(value));
        }
        else {
            BOOST_OUTCOME_TRY(
                auto value, abi_decode_value(type, block.substr(cursor)));
            values.emplace_back(std::move(value));
        }
        cursor += type.static_size();
    }
    return values;
}

Result<AbiValue> decode_list(AbiType const &type, byte_string_view data)
{
    if (type.kind() == AbiType::Kind::Tuple) {
        auto const &components = type.components();
        BOOST_OUTCOME_TRY(
            auto list,
            decode_sequence(
                components.size(),
                [&](size_t const i) -> AbiType const & {
                    return components[i];
                },
                data));
        return abi_list(std::move(list));
    }

    auto const &element = type.element();
    // every element needs at least its head in the remaining input
    size_t const head = std::max<size_t>(element.static_size(), 1);
    size_t count;
    if (type.array_length().has_value()) {
        count = *type.array_length();
        if (ETHKIT_UNLIKELY(count > data.size() / head)) {
            return AbiDecodeError::InputTooShort;
        }
    }
    else {
        if (ETHKIT_UNLIKELY(data.size() < WORD_SIZE)) {
            return AbiDecodeError::InputTooShort;
        }
        BOOST_OUTCOME_TRY(
            auto const length,
            decode_length(data, (data.size() - WORD_SIZE) / head));
        count = length;
    }
    BOOST_OUTCOME_TRY(
        auto list,
        decode_sequence(
            count,
            [&](size_t) -> AbiType const & { return element; },
            data));
    return abi_list(std::move(list));
}

ETHKIT_ANONYMOUS_NAMESPACE_END

ETHKIT_NAMESPACE_BEGIN

Result<AbiValue> abi_decode_value(AbiType const &type, byte_string_view data)
{
    using Kind = AbiType::Kind;
    switch (type.kind()) {
    case Kind::Address: {
        BOOST_OUTCOME_TRY(auto const word, abi_decode_word(data));
        return abi_address(unaligned_load<Address>(&word.bytes[12]));
    }
    case Kind::Bool: {
        BOOST_OUTCOME_TRY(auto const word, abi_decode_word(data));
        uint256_t const v = from_bytes_be(word);
        if (ETHKIT_UNLIKELY(v > 1)) {
            return AbiDecodeError::InvalidBool;
        }
        return abi_bool(v == 1);
    }
    case Kind::Uint: {
        BOOST_OUTCOME_TRY(auto const word, abi_decode_word(data));
        uint256_t const v = from_bytes_be(word);
        unsigned const bits = type.bits();
        return abi_uint(bits == 256 ? v : v & ((uint256_t{1} << bits) - 1));
    }
    case Kind::Int: {
        BOOST_OUTCOME_TRY(auto const word, abi_decode_word(data));
        uint256_t v = from_bytes_be(word);
        unsigned const bits = type.bits();
        if (bits < 256) {
            uint256_t const mask = (uint256_t{1} << bits) - 1;
            v &= mask;
            if (((v >> (bits - 1)) & 1) != 0) {
                v |= ~mask;
            }
        }
        return abi_uint(v);
    }
    case Kind::FixedBytes: {
        BOOST_OUTCOME_TRY(auto const word, abi_decode_word(data));
        return abi_bytes({word.bytes, type.bytes_length()});
    }
    case Kind::Bytes:
    case Kind::String: {
        BOOST_OUTCOME_TRY(
            auto const length,
            decode_length(
                data,
                data.size() < WORD_SIZE ? 0 : data.size() - WORD_SIZE));
        auto const content = data.substr(0, length);
        if (type.kind() == Kind::Bytes) {
            return abi_bytes(content);
        }
        auto const s = to_string_view(content);
        if (ETHKIT_UNLIKELY(!is_valid_utf8(s))) {
            return AbiDecodeError::InvalidUtf8;
        }
        return abi_string(std::string{s});
    }
    case Kind::Array:
    case Kind::Tuple:
        return decode_list(type, data);
    }
    ETHKIT_ABORT("unknown abi type kind");
}

Result<AbiValueList>
abi_decode(std::span<AbiType const> const types, byte_string_view const data)
{
    return decode_sequence(
        types.size(),
        [&](size_t const i) -> AbiType const & { return types[i]; },
        data);
}

ETHKIT_NAMESPACE_END
