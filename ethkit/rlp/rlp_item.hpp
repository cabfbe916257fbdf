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
#include <ethkit/core/result.hpp>
#include <ethkit/rlp/config.hpp>

#include <variant>
#include <vector>

ETHKIT_RLP_NAMESPACE_BEGIN

/// Generic RLP tree: a leaf byte string or a list of items
struct RlpItem
{
    using List = std::vector<RlpItem>;

    std::variant<byte_string, List> value{};

    bool is_list() const noexcept
    {
        return std::holds_alternative<List>(value);
    }

    byte_string const &bytes() const
    {
        return std::get<byte_string>(value);
    }

    List const &list() const
    {
        return std::get<List>(value);
    }

    friend bool operator==(RlpItem const &, RlpItem const &) = default;
};

byte_string encode_rlp_item(RlpItem const &);

/// Decodes one item from the front of `enc` and advances past it
Result<RlpItem> decode_rlp_item(byte_string_view &enc);

/// Decodes `enc` as exactly one item; trailing bytes are an error
Result<RlpItem> decode_rlp_item_exact(byte_string_view enc);

ETHKIT_RLP_NAMESPACE_END
