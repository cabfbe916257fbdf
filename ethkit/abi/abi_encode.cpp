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

#include <ethkit/abi/abi_encode.hpp>
#include <ethkit/abi/abi_encode_error.hpp>
#include <ethkit/abi/abi_type.hpp>
#include <ethkit/abi/abi_value.hpp>
#include <ethkit/core/assert.h>
#include <ethkit/core/byte_string.hpp>
#include <ethkit/core/bytes.hpp>
#include <ethkit/core/config.hpp>
#include <ethkit/core/int.hpp>
#include <ethkit/core/likely.h>
#include <ethkit/core/result.hpp>
#include <ethkit/core/utf8.hpp>

#include <boost/outcome/try.hpp>

#include <cstddef>
#include <cstring>
#include <span>
#include <string>
#include <utility>
#include <variant>

ETHKIT_ANONYMOUS_NAMESPACE_BEGIN

template <class T>
Result<T const *> get_as(AbiValue const &value)
{
    auto const *const p = std::get_if<T>(&value.value);
    if (ETHKIT_UNLIKELY(p == nullptr)) {
        return AbiEncodeError::TypeMismatch;
    }
    return p;
}

Result<byte_string> encode_sequence(
    size_t const count, auto const &type_at, AbiValueList const &values)
{
    AbiEncoder encoder;
    for (size_t i = 0; i < count; ++i) {
        BOOST_OUTCOME_TRY(encoder.add(type_at(i), values[i]));
    }
    return encoder.encode_final();
}

Result<byte_string> encode_list(AbiType const &type, AbiValue const &value)
{
    BOOST_OUTCOME_TRY(auto const *const list, get_as<AbiValueList>(value));

    if (type.kind() == AbiType::Kind::Tuple) {
        auto const &components = type.components();
        if (ETHKIT_UNLIKELY(list->size() != components.size())) {
            return AbiEncodeError::ArityMismatch;
        }
        return encode_sequence(
            components.size(),
            [&](size_t const i) -> AbiType const & { return components[i]; },
            *list);
    }

    auto const &length = type.array_length();
    if (ETHKIT_UNLIKELY(length.has_value() && list->size() != *length)) {
        return AbiEncodeError::LengthMismatch;
    }
    BOOST_OUTCOME_TRY(
        auto const body,
        encode_sequence(
            list->size(),
            [&](size_t) -> AbiType const & { return type.element(); },
            *list));
    if (length.has_value()) {
        return body;
    }
    byte_string output;
    output += abi_encode_uint(list->size());
    output += body;
    return output;
}

// Raw content of a packed value, or its padded word when inside an array
Result<byte_string>
encode_packed_value(AbiType const &type, AbiValue const &value, bool const pad)
{
    using Kind = AbiType::Kind;
    switch (type.kind()) {
    case Kind::Address: {
        BOOST_OUTCOME_TRY(auto const *const a, get_as<Address>(value));
        if (pad) {
            return to_byte_string(abi_encode_address(*a));
        }
        return byte_string{a->bytes, sizeof(a->bytes)};
    }
    case Kind::Bool: {
        BOOST_OUTCOME_TRY(auto const *const b, get_as<bool>(value));
        if (pad) {
            return to_byte_string(abi_encode_bool(*b));
        }
        return byte_string(1, *b ? 1 : 0);
    }
    case Kind::Uint:
    case Kind::Int: {
        BOOST_OUTCOME_TRY(auto const *const v, get_as<uint256_t>(value));
        if (ETHKIT_UNLIKELY(!abi_integer_in_range(type, *v))) {
            return AbiEncodeError::IntegerOutOfRange;
        }
        bytes32_t const word = abi_encode_uint(*v);
        if (pad) {
            return to_byte_string(word);
        }
        size_t const width = type.bits() / 8;
        return byte_string{word.bytes + sizeof(word) - width, width};
    }
    case Kind::FixedBytes: {
        BOOST_OUTCOME_TRY(auto const *const b, get_as<byte_string>(value));
        if (ETHKIT_UNLIKELY(b->size() != type.bytes_length())) {
            return AbiEncodeError::LengthMismatch;
        }
        if (pad) {
            return to_byte_string(abi_encode_fixed_bytes(*b));
        }
        return *b;
    }
    case Kind::Bytes: {
        BOOST_OUTCOME_TRY(auto const *const b, get_as<byte_string>(value));
        return *b;
    }
    case Kind::String: {
        BOOST_OUTCOME_TRY(auto const *const s, get_as<std::string>(value));
        if (ETHKIT_UNLIKELY(!is_valid_utf8(*s))) {
            return AbiEncodeError::InvalidUtf8;
        }
        return byte_string{to_byte_string_view(*s)};
    }
    case Kind::Array:
    case Kind::Tuple:
        break;
    }
    return AbiEncodeError::UnsupportedPackedType;
}

ETHKIT_ANONYMOUS_NAMESPACE_END

ETHKIT_NAMESPACE_BEGIN

bool abi_integer_in_range(AbiType const &type, uint256_t const &v) noexcept
{
    unsigned const bits = type.bits();
    if (bits == 256) {
        return true;
    }
    if (type.kind() == AbiType::Kind::Uint) {
        return (v >> bits) == 0;
    }
    // the bits above the sign bit must all equal the sign bit
    uint256_t const high = v >> (bits - 1);
    return high == 0 || high == (UINT256_MAX >> (bits - 1));
}

Result<byte_string>
abi_encode_value(AbiType const &type, AbiValue const &value)
{
    using Kind = AbiType::Kind;
    switch (type.kind()) {
    case Kind::Address: {
        BOOST_OUTCOME_TRY(auto const *const a, get_as<Address>(value));
        return to_byte_string(abi_encode_address(*a));
    }
    case Kind::Bool: {
        BOOST_OUTCOME_TRY(auto const *const b, get_as<bool>(value));
        return to_byte_string(abi_encode_bool(*b));
    }
    case Kind::Uint:
    case Kind::Int: {
        BOOST_OUTCOME_TRY(auto const *const v, get_as<uint256_t>(value));
        if (ETHKIT_UNLIKELY(!abi_integer_in_range(type, *v))) {
            return AbiEncodeError::IntegerOutOfRange;
        }
        return to_byte_string(abi_encode_uint(*v));
    }
    case Kind::FixedBytes: {
        BOOST_OUTCOME_TRY(auto const *const b, get_as<byte_string>(value));
        if (ETHKIT_UNLIKELY(b->size() != type.bytes_length())) {
            return AbiEncodeError::LengthMismatch;
        }
        return to_byte_string(abi_encode_fixed_bytes(*b));
    }
    case Kind::Bytes: {
        BOOST_OUTCOME_TRY(auto const *const b, get_as<byte_string>(value));
        return abi_encode_bytes(*b);
    }
    case Kind::String: {
        BOOST_OUTCOME_TRY(auto const *const s, get_as<std::string>(value));
        if (ETHKIT_UNLIKELY(!is_valid_utf8(*s))) {
            return AbiEncodeError::InvalidUtf8;
        }
        return abi_encode_bytes(to_byte_string_view(*s));
    }
    case Kind::Array:
    case Kind::Tuple:
        return encode_list(type, value);
    }
    ETHKIT_ABORT("unknown abi type kind");
}

Result<void> AbiEncoder::add(AbiType const &type, AbiValue const &value)
{
    BOOST_OUTCOME_TRY(auto const encoded, abi_encode_value(type, value));
    if (type.is_dynamic()) {
        add_dynamic(encoded);
    }
    else {
        ETHKIT_ASSERT(encoded.size() == type.static_size());
        add_static(encoded);
    }
    return outcome::success();
}

byte_string AbiEncoder::encode_final()
{
    for (auto const [unresolved, tail_cumsum] : unresolved_offsets_) {
        bytes32_t const encoded = abi_encode_uint(head_.size() + tail_cumsum);
        std::memcpy(&head_[unresolved], encoded.bytes, sizeof(bytes32_t));
    }
    unresolved_offsets_.clear();

    return std::move(head_) + std::move(tail_);
}

Result<byte_string>
abi_encode(std::span<AbiType const> const types, AbiValueList const &values)
{
    if (ETHKIT_UNLIKELY(types.size() != values.size())) {
        return AbiEncodeError::ArityMismatch;
    }
    return encode_sequence(
        types.size(),
        [&](size_t const i) -> AbiType const & { return types[i]; },
        values);
}

Result<byte_string> abi_encode_packed(
    std::span<AbiType const> const types, AbiValueList const &values)
{
    if (ETHKIT_UNLIKELY(types.size() != values.size())) {
        return AbiEncodeError::ArityMismatch;
    }

    byte_string output;
    for (size_t i = 0; i < types.size(); ++i) {
        auto const &type = types[i];
        if (type.kind() != AbiType::Kind::Array) {
            BOOST_OUTCOME_TRY(
                auto const encoded,
                encode_packed_value(type, values[i], false));
            output += encoded;
            continue;
        }

        // array elements are padded to 32 bytes each
        auto const &element = type.element();
        if (ETHKIT_UNLIKELY(!element.is_value_type())) {
            return AbiEncodeError::UnsupportedPackedType;
        }
        BOOST_OUTCOME_TRY(
            auto const *const list, get_as<AbiValueList>(values[i]));
        auto const &length = type.array_length();
        if (ETHKIT_UNLIKELY(length.has_value() && list->size() != *length)) {
            return AbiEncodeError::LengthMismatch;
        }
        for (auto const &v : *list) {
            BOOST_OUTCOME_TRY(
                auto const encoded, encode_packed_value(element, v, true));
            output += encoded;
        }
    }
    return output;
}

ETHKIT_NAMESPACE_END
