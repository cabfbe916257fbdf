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

#include <ethkit/core/byte_string.hpp>
#include <ethkit/core/likely.h>
#include <ethkit/core/result.hpp>
#include <ethkit/rlp/config.hpp>
#include <ethkit/rlp/decode.hpp>
#include <ethkit/rlp/decode_error.hpp>
#include <ethkit/rlp/encode2.hpp>
#include <ethkit/rlp/rlp_item.hpp>

#include <boost/outcome/try.hpp>

#include <cstddef>
#include <utility>

ETHKIT_RLP_ANONYMOUS_NAMESPACE_BEGIN

// Bounds recursion on hostile input
constexpr size_t MAX_DEPTH = 1024;

Result<RlpItem> decode_rlp_item_impl(byte_string_view &enc, size_t const depth)
{
    if (ETHKIT_UNLIKELY(enc.empty())) {
        return DecodeError::InputTooShort;
    }
    if (ETHKIT_UNLIKELY(depth > MAX_DEPTH)) {
        return DecodeError::Overflow;
    }

    if (enc[0] < 0xc0) {
        BOOST_OUTCOME_TRY(auto const payload, parse_string_metadata(enc));
        return RlpItem{byte_string{payload}};
    }

    BOOST_OUTCOME_TRY(auto payload, parse_list_metadata(enc));
    RlpItem::List items;
    while (!payload.empty()) {
        BOOST_OUTCOME_TRY(auto item, decode_rlp_item_impl(payload, depth + 1));
        items.emplace_back(std::move(item));
    }
    return RlpItem{std::move(items)};
}

ETHKIT_RLP_ANONYMOUS_NAMESPACE_END

ETHKIT_RLP_NAMESPACE_BEGIN

byte_string encode_rlp_item(RlpItem const &item)
{
    if (!item.is_list()) {
        return encode_string2(item.bytes());
    }

    byte_string payload;
    for (auto const &child : item.list()) {
        payload += encode_rlp_item(child);
    }
    return encode_list2(payload);
}

Result<RlpItem> decode_rlp_item(byte_string_view &enc)
{
    return decode_rlp_item_impl(enc, 0);
}

Result<RlpItem> decode_rlp_item_exact(byte_string_view enc)
{
    BOOST_OUTCOME_TRY(auto item, decode_rlp_item(enc));
    if (ETHKIT_UNLIKELY(!enc.empty())) {
        return DecodeError::InputTooLong;
    }
    return item;
}

ETHKIT_RLP_NAMESPACE_END
