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
#include <ethkit/core/int.hpp>
#include <ethkit/rlp/decode.hpp>
#include <ethkit/rlp/decode_error.hpp>
#include <ethkit/rlp/encode2.hpp>
#include <ethkit/rlp/int_rlp.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <string>

using namespace ethkit;
using namespace ethkit::rlp;

TEST(Rlp, DecodeAfterEncodeString)
{
    for (std::string const s :
         {"",
          "a",
          "hello world",
          "Lorem ipsum dolor sit amet, consectetur adipisicing elit"}) {
        auto const encoding = encode_string2(to_byte_string_view(s));

        byte_string_view view{encoding};
        auto const decoded = decode_string(view);
        ASSERT_FALSE(decoded.has_error());
        EXPECT_EQ(view.size(), 0);
        EXPECT_EQ(decoded.value(), to_byte_string_view(s));
    }
}

TEST(Rlp, DecodeUnsigned)
{
    byte_string const zero{0x80};
    byte_string_view view{zero};
    auto const decoded_zero = decode_unsigned<uint64_t>(view);
    ASSERT_FALSE(decoded_zero.has_error());
    EXPECT_EQ(decoded_zero.value(), 0);

    byte_string const kilo{0x82, 0x04, 0x00};
    view = kilo;
    auto const decoded_kilo = decode_unsigned<uint256_t>(view);
    ASSERT_FALSE(decoded_kilo.has_error());
    EXPECT_EQ(decoded_kilo.value(), 1024);

    byte_string const padded{0x82, 0x00, 0x01};
    view = padded;
    EXPECT_EQ(
        decode_unsigned<uint64_t>(view).assume_error(),
        DecodeError::LeadingZero);

    byte_string const too_big{0x83, 0x01, 0x00, 0x00};
    view = too_big;
    EXPECT_EQ(
        decode_unsigned<uint16_t>(view).assume_error(), DecodeError::Overflow);

    byte_string const two{0x02};
    view = two;
    EXPECT_EQ(decode_bool(view).assume_error(), DecodeError::Overflow);
}

TEST(Rlp, DecodeTruncated)
{
    byte_string const truncated_string{0x83, 'd', 'o'};
    byte_string_view view{truncated_string};
    EXPECT_EQ(decode_string(view).assume_error(), DecodeError::InputTooShort);

    byte_string const truncated_list{0xc8, 0x83, 'c', 'a', 't'};
    view = truncated_list;
    EXPECT_EQ(
        parse_list_metadata(view).assume_error(), DecodeError::InputTooShort);

    byte_string const missing_length{0xb9, 0x04};
    view = missing_length;
    EXPECT_EQ(decode_string(view).assume_error(), DecodeError::InputTooShort);

    byte_string const empty{};
    view = empty;
    EXPECT_EQ(decode_string(view).assume_error(), DecodeError::InputTooShort);
}

TEST(Rlp, DecodeNonCanonical)
{
    // a single byte below 0x80 must not carry a prefix
    byte_string const wrapped_byte{0x81, 0x05};
    byte_string_view view{wrapped_byte};
    EXPECT_EQ(
        decode_string(view).assume_error(), DecodeError::NonCanonicalSize);

    // long form for a short payload
    byte_string const long_short{0xb8, 0x01, 0xaa};
    view = long_short;
    EXPECT_EQ(
        decode_string(view).assume_error(), DecodeError::NonCanonicalSize);

    byte_string const long_short_list{0xf8, 0x01, 0x01};
    view = long_short_list;
    EXPECT_EQ(
        parse_list_metadata(view).assume_error(),
        DecodeError::NonCanonicalSize);

    byte_string padded_length{0xb9, 0x00, 0x38};
    padded_length.append(0x38, 0x61);
    view = padded_length;
    EXPECT_EQ(decode_string(view).assume_error(), DecodeError::LeadingZero);
}

TEST(Rlp, DecodeTypeMismatch)
{
    byte_string const list{0xc0};
    byte_string_view view{list};
    EXPECT_EQ(decode_string(view).assume_error(), DecodeError::TypeUnexpected);

    byte_string const str{0x80};
    view = str;
    EXPECT_EQ(
        parse_list_metadata(view).assume_error(), DecodeError::TypeUnexpected);
}
