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
#include <ethkit/rlp/encode2.hpp>
#include <ethkit/rlp/int_rlp.hpp>

#include <gtest/gtest.h>

#include <intx/intx.hpp>

#include <array>
#include <cstdint>

using namespace ethkit;
using namespace ethkit::rlp;

TEST(Rlp, ToBigEndianCompacted)
{
    auto bytes_1 = to_big_compact(uint16_t{1024});
    auto bytes_2 = to_big_compact(unsigned{1024});
    auto bytes_3 = to_big_compact(uint256_t{1024});

    EXPECT_EQ(bytes_1, byte_string({0x04, 0x00}));
    EXPECT_EQ(bytes_1, bytes_2);
    EXPECT_EQ(bytes_2, bytes_3);
    EXPECT_TRUE(to_big_compact(uint64_t{0}).empty());
}

TEST(Rlp, EncodeString)
{
    // single byte below 0x80 is its own encoding
    auto encoding = encode_string2(byte_string({0x00}));
    EXPECT_EQ(encoding, byte_string({0x00}));

    encoding = encode_string2(byte_string({0x80}));
    EXPECT_EQ(encoding, byte_string({0x81, 0x80}));

    encoding = encode_string2(to_byte_string_view("dog"));
    EXPECT_EQ(encoding, byte_string({0x83, 'd', 'o', 'g'}));

    encoding = encode_string2(to_byte_string_view(""));
    EXPECT_EQ(encoding, byte_string({0x80}));

    // 56 characters crosses into the long form
    auto const *const fifty_six_char_string =
        "Lorem ipsum dolor sit amet, consectetur adipisicing elit";
    encoding = encode_string2(to_byte_string_view(fifty_six_char_string));
    ASSERT_EQ(encoding.size(), 58);
    EXPECT_EQ(encoding[0], 0xb8);
    EXPECT_EQ(encoding[1], 0x38);
    EXPECT_EQ(encoding[2], 'L');

    std::array<unsigned char, 4> const an_array{0x00, 0x01, 0x02, 0x03};
    encoding = encode_string2(to_byte_string_view(an_array));
    EXPECT_EQ(encoding, byte_string({0x84, 0x00, 0x01, 0x02, 0x03}));

    byte_string const big(1024, 0xaa);
    encoding = encode_string2(big);
    EXPECT_EQ(encoding.substr(0, 3), byte_string({0xb9, 0x04, 0x00}));
    EXPECT_EQ(encoding.size(), 1027);
}

TEST(Rlp, EncodeList)
{
    auto encoding = encode_list2();
    EXPECT_EQ(encoding, byte_string({0xc0}));

    encoding = encode_list2(
        encode_string2(to_byte_string_view("cat")),
        encode_string2(to_byte_string_view("dog")));
    EXPECT_EQ(
        encoding,
        byte_string({0xc8, 0x83, 'c', 'a', 't', 0x83, 'd', 'o', 'g'}));

    // [ [], [[]], [ [], [[]] ] ]
    auto const empty = encode_list2();
    encoding = encode_list2(
        empty,
        encode_list2(empty),
        encode_list2(empty, encode_list2(empty)));
    EXPECT_EQ(
        encoding,
        byte_string({0xc7, 0xc0, 0xc1, 0xc0, 0xc3, 0xc0, 0xc1, 0xc0}));

    byte_string const long_payload(60, 0x01);
    encoding = encode_list2(long_payload);
    EXPECT_EQ(encoding.substr(0, 2), byte_string({0xf8, 0x3c}));
}

TEST(Rlp, EncodeUnsigned)
{
    using namespace intx::literals;

    EXPECT_EQ(encode_unsigned(0u), byte_string({0x80}));
    EXPECT_EQ(encode_unsigned(uint256_t{0}), byte_string({0x80}));
    EXPECT_EQ(encode_unsigned(1u), byte_string({0x01}));
    EXPECT_EQ(encode_unsigned(0x7fu), byte_string({0x7f}));
    EXPECT_EQ(encode_unsigned(0x80u), byte_string({0x81, 0x80}));
    EXPECT_EQ(encode_unsigned(1024u), byte_string({0x82, 0x04, 0x00}));
    EXPECT_EQ(
        encode_unsigned(0xde0b6b3a7640000_u256),
        byte_string({0x88, 0x0d, 0xe0, 0xb6, 0xb3, 0xa7, 0x64, 0x00, 0x00}));

    auto const max = encode_unsigned(UINT256_MAX);
    ASSERT_EQ(max.size(), 33);
    EXPECT_EQ(max[0], 0xa0);
}
