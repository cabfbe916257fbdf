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
#include <ethkit/abi/abi_signatures.hpp>
#include <ethkit/abi/abi_type.hpp>
#include <ethkit/abi/abi_value.hpp>
#include <ethkit/core/address.hpp>
#include <ethkit/core/byte_string.hpp>
#include <ethkit/core/bytes.hpp>
#include <ethkit/core/int.hpp>
#include <ethkit/crypto/hasher.hpp>

#include <evmc/evmc.hpp>
#include <gtest/gtest.h>
#include <intx/intx.hpp>

#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace ethkit;
using namespace evmc::literals;
using namespace intx::literals;

namespace
{
    std::vector<AbiType> types(std::initializer_list<std::string_view> strs)
    {
        std::vector<AbiType> result;
        for (auto const s : strs) {
            result.push_back(parse_abi_type(s).value());
        }
        return result;
    }

    byte_string bytes(std::string_view const s)
    {
        return byte_string{to_byte_string_view(s)};
    }

    byte_string call(std::string_view const signature, byte_string const &args)
    {
        KeccakHasher const hasher;
        byte_string out{
            to_byte_string_view(selector_bytes(abi_selector(hasher, signature)))};
        return out + args;
    }
}

TEST(AbiEncode, boolean)
{
    constexpr auto expected_true =
        evmc::from_hex<bytes32_t>(
            "0000000000000000000000000000000000000000000000000000000000000001")
            .value();
    EXPECT_EQ(abi_encode_bool(true), expected_true);
    EXPECT_EQ(abi_encode_bool(false), bytes32_t{});
}

TEST(AbiEncode, address)
{
    constexpr Address input{0xDEADBEEF000000000000000000F00D0000000100_address};
    constexpr auto expected =
        evmc::from_hex<bytes32_t>(
            "000000000000000000000000deadbeef000000000000000000f00d0000000100")
            .value();
    constexpr auto actual = abi_encode_address(input);
    EXPECT_EQ(actual, expected);
}

TEST(AbiEncode, static_call)
{
    // baz(uint32 69, bool true)
    auto const args =
        abi_encode(types({"uint32", "bool"}), {abi_uint(69), abi_bool(true)});
    ASSERT_TRUE(args.has_value());
    EXPECT_EQ(
        call("baz(uint32,bool)", args.value()),
        evmc::from_hex(
            "0xcdcd77c0"
            "0000000000000000000000000000000000000000000000000000000000000045"
            "0000000000000000000000000000000000000000000000000000000000000001")
            .value());
}

TEST(AbiEncode, dynamic_call)
{
    // sam(bytes "dave", bool true, uint256[] [1, 2, 3])
    auto const args = abi_encode(
        types({"bytes", "bool", "uint256[]"}),
        {abi_bytes(bytes("dave")),
         abi_bool(true),
         abi_list({abi_uint(1), abi_uint(2), abi_uint(3)})});
    ASSERT_TRUE(args.has_value());
    EXPECT_EQ(
        call("sam(bytes,bool,uint256[])", args.value()),
        evmc::from_hex(
            "0xa5643bf2"
            "0000000000000000000000000000000000000000000000000000000000000060"
            "0000000000000000000000000000000000000000000000000000000000000001"
            "00000000000000000000000000000000000000000000000000000000000000a0"
            "0000000000000000000000000000000000000000000000000000000000000004"
            "6461766500000000000000000000000000000000000000000000000000000000"
            "0000000000000000000000000000000000000000000000000000000000000003"
            "0000000000000000000000000000000000000000000000000000000000000001"
            "0000000000000000000000000000000000000000000000000000000000000002"
            "0000000000000000000000000000000000000000000000000000000000000003")
            .value());
}

TEST(AbiEncode, mixed_call)
{
    // f(uint256 0x123, uint32[] [0x456, 0x789], bytes10 "1234567890",
    //   bytes "Hello, world!")
    auto const args = abi_encode(
        types({"uint256", "uint32[]", "bytes10", "bytes"}),
        {abi_uint(0x123),
         abi_list({abi_uint(0x456), abi_uint(0x789)}),
         abi_bytes(bytes("1234567890")),
         abi_bytes(bytes("Hello, world!"))});
    ASSERT_TRUE(args.has_value());
    EXPECT_EQ(
        call("f(uint256,uint32[],bytes10,bytes)", args.value()),
        evmc::from_hex(
            "0x8be65246"
            "0000000000000000000000000000000000000000000000000000000000000123"
            "0000000000000000000000000000000000000000000000000000000000000080"
            "3132333435363738393000000000000000000000000000000000000000000000"
            "00000000000000000000000000000000000000000000000000000000000000e0"
            "0000000000000000000000000000000000000000000000000000000000000002"
            "0000000000000000000000000000000000000000000000000000000000000456"
            "0000000000000000000000000000000000000000000000000000000000000789"
            "000000000000000000000000000000000000000000000000000000000000000d"
            "48656c6c6f2c20776f726c642100000000000000000000000000000000000000")
            .value());
}

TEST(AbiEncode, nested_dynamic_call)
{
    // g(uint256[][] [[1, 2], [3]], string[] ["one", "two", "three"])
    auto const args = abi_encode(
        types({"uint256[][]", "string[]"}),
        {abi_list(
             {abi_list({abi_uint(1), abi_uint(2)}), abi_list({abi_uint(3)})}),
         abi_list(
             {abi_string("one"), abi_string("two"), abi_string("three")})});
    ASSERT_TRUE(args.has_value());
    EXPECT_EQ(
        call("g(uint256[][],string[])", args.value()),
        evmc::from_hex(
            "0x2289b18c"
            "0000000000000000000000000000000000000000000000000000000000000040"
            "0000000000000000000000000000000000000000000000000000000000000140"
            "0000000000000000000000000000000000000000000000000000000000000002"
            "0000000000000000000000000000000000000000000000000000000000000040"
            "00000000000000000000000000000000000000000000000000000000000000a0"
            "0000000000000000000000000000000000000000000000000000000000000002"
            "0000000000000000000000000000000000000000000000000000000000000001"
            "0000000000000000000000000000000000000000000000000000000000000002"
            "0000000000000000000000000000000000000000000000000000000000000001"
            "0000000000000000000000000000000000000000000000000000000000000003"
            "0000000000000000000000000000000000000000000000000000000000000003"
            "0000000000000000000000000000000000000000000000000000000000000060"
            "00000000000000000000000000000000000000000000000000000000000000a0"
            "00000000000000000000000000000000000000000000000000000000000000e0"
            "0000000000000000000000000000000000000000000000000000000000000003"
            "6f6e650000000000000000000000000000000000000000000000000000000000"
            "0000000000000000000000000000000000000000000000000000000000000003"
            "74776f0000000000000000000000000000000000000000000000000000000000"
            "0000000000000000000000000000000000000000000000000000000000000005"
            "7468726565000000000000000000000000000000000000000000000000000000")
            .value());
}

TEST(AbiEncode, uint_and_string_layout)
{
    auto const encoded = abi_encode(
        types({"uint256", "string"}), {abi_uint(42), abi_string("hi")});
    ASSERT_TRUE(encoded.has_value());
    EXPECT_EQ(
        encoded.value(),
        evmc::from_hex(
            "000000000000000000000000000000000000000000000000000000000000002a"
            "0000000000000000000000000000000000000000000000000000000000000040"
            "0000000000000000000000000000000000000000000000000000000000000002"
            "6869000000000000000000000000000000000000000000000000000000000000")
            .value());
}

TEST(AbiEncode, static_tuple_is_inlined)
{
    auto const encoded = abi_encode(
        types({"((uint256,address),bool)"}),
        {abi_list(
            {abi_list(
                 {abi_uint(1),
                  abi_address(0x00000000000000000000000000000000000000ff_address)}),
             abi_bool(true)})});
    ASSERT_TRUE(encoded.has_value());
    EXPECT_EQ(encoded.value().size(), 96);
    EXPECT_EQ(encoded.value()[31], 1);
    EXPECT_EQ(encoded.value()[63], 0xff);
    EXPECT_EQ(encoded.value()[95], 1);
}

TEST(AbiEncode, signed_integers)
{
    auto const encoded = abi_encode(
        types({"int8", "int256"}), {abi_int(-1), abi_int(-128)});
    ASSERT_TRUE(encoded.has_value());
    EXPECT_EQ(
        encoded.value(),
        evmc::from_hex(
            "ffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff"
            "ffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff80")
            .value());
}

TEST(AbiEncode, utf8_length_is_byte_length)
{
    std::string const s = "你好世界🎉";
    ASSERT_EQ(s.size(), 16);
    auto const encoded = abi_encode(types({"string"}), {abi_string(s)});
    ASSERT_TRUE(encoded.has_value());
    ASSERT_EQ(encoded.value().size(), 96);
    EXPECT_EQ(encoded.value()[63], 16);
    EXPECT_EQ(
        to_string_view(byte_string_view{encoded.value()}.substr(64, 16)), s);
}

TEST(AbiEncode, errors)
{
    EXPECT_EQ(
        abi_encode(types({"uint256", "bool"}), {abi_uint(1)}).assume_error(),
        AbiEncodeError::ArityMismatch);
    EXPECT_EQ(
        abi_encode(types({"uint256"}), {abi_bool(true)}).assume_error(),
        AbiEncodeError::TypeMismatch);
    EXPECT_EQ(
        abi_encode(types({"uint8"}), {abi_uint(256)}).assume_error(),
        AbiEncodeError::IntegerOutOfRange);
    EXPECT_EQ(
        abi_encode(types({"int8"}), {abi_int(-129)}).assume_error(),
        AbiEncodeError::IntegerOutOfRange);
    EXPECT_EQ(
        abi_encode(types({"int8"}), {abi_uint(128)}).assume_error(),
        AbiEncodeError::IntegerOutOfRange);
    EXPECT_EQ(
        abi_encode(types({"bytes4"}), {abi_bytes(bytes("abc"))})
            .assume_error(),
        AbiEncodeError::LengthMismatch);
    EXPECT_EQ(
        abi_encode(types({"uint256[2]"}), {abi_list({abi_uint(1)})})
            .assume_error(),
        AbiEncodeError::LengthMismatch);
    EXPECT_EQ(
        abi_encode(types({"(uint256,bool)"}), {abi_list({abi_uint(1)})})
            .assume_error(),
        AbiEncodeError::ArityMismatch);
    EXPECT_EQ(
        abi_encode(types({"string"}), {abi_string("\xc3\x28")}).assume_error(),
        AbiEncodeError::InvalidUtf8);
}

TEST(AbiEncode, integer_range)
{
    auto const uint8 = AbiType::uint_n(8).value();
    auto const int16 = AbiType::int_n(16).value();
    EXPECT_TRUE(abi_integer_in_range(uint8, 255));
    EXPECT_FALSE(abi_integer_in_range(uint8, 256));
    EXPECT_TRUE(abi_integer_in_range(int16, 32767));
    EXPECT_FALSE(abi_integer_in_range(int16, 32768));
    EXPECT_TRUE(abi_integer_in_range(
        int16, std::get<uint256_t>(abi_int(-32768).value)));
    EXPECT_FALSE(abi_integer_in_range(
        int16, std::get<uint256_t>(abi_int(-32769).value)));
    EXPECT_TRUE(abi_integer_in_range(AbiType::uint256(), UINT256_MAX));
}

TEST(AbiEncode, packed)
{
    auto const encoded = abi_encode_packed(
        types({"int16", "bytes1", "uint16", "string"}),
        {abi_int(-1),
         abi_bytes(evmc::from_hex("42").value()),
         abi_uint(3),
         abi_string("Hello, world!")});
    ASSERT_TRUE(encoded.has_value());
    EXPECT_EQ(
        encoded.value(),
        evmc::from_hex("0xffff42000348656c6c6f2c20776f726c6421").value());
}

TEST(AbiEncode, packed_arrays_and_scalars)
{
    auto const encoded = abi_encode_packed(
        types({"address", "bool", "uint8[]"}),
        {abi_address(0x0000000000000000000000000000000000000001_address),
         abi_bool(true),
         abi_list({abi_uint(1), abi_uint(2)})});
    ASSERT_TRUE(encoded.has_value());
    EXPECT_EQ(
        encoded.value(),
        evmc::from_hex(
            "0000000000000000000000000000000000000001"
            "01"
            "0000000000000000000000000000000000000000000000000000000000000001"
            "0000000000000000000000000000000000000000000000000000000000000002")
            .value());

    EXPECT_EQ(
        abi_encode_packed(
            types({"(uint256,bool)"}), {abi_list({abi_uint(1), abi_bool(true)})})
            .assume_error(),
        AbiEncodeError::UnsupportedPackedType);
    EXPECT_EQ(
        abi_encode_packed(types({"string[]"}), {abi_list({abi_string("a")})})
            .assume_error(),
        AbiEncodeError::UnsupportedPackedType);
}

TEST(AbiEncode, encoder_builder)
{
    AbiEncoder encoder;
    encoder.add_uint(1);
    encoder.add_bytes(bytes("ab"));
    encoder.add_address(0x0000000000000000000000000000000000000002_address);
    auto const encoded = encoder.encode_final();
    EXPECT_EQ(
        encoded,
        evmc::from_hex(
            "0000000000000000000000000000000000000000000000000000000000000001"
            "0000000000000000000000000000000000000000000000000000000000000060"
            "0000000000000000000000000000000000000000000000000000000000000002"
            "0000000000000000000000000000000000000000000000000000000000000002"
            "6162000000000000000000000000000000000000000000000000000000000000")
            .value());
}
