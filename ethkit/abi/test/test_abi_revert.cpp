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

#include <ethkit/abi/abi_call.hpp>
#include <ethkit/abi/abi_decode_error.hpp>
#include <ethkit/abi/abi_encode.hpp>
#include <ethkit/abi/abi_item.hpp>
#include <ethkit/abi/abi_revert.hpp>
#include <ethkit/abi/abi_signatures.hpp>
#include <ethkit/abi/abi_type.hpp>
#include <ethkit/abi/abi_value.hpp>
#include <ethkit/core/byte_string.hpp>
#include <ethkit/crypto/hasher.hpp>

#include <evmc/evmc.hpp>
#include <gtest/gtest.h>

#include <string>
#include <variant>
#include <vector>

using namespace ethkit;
using namespace evmc::literals;

namespace
{
    AbiFunction balance_of()
    {
        return AbiFunction{
            .name = "balanceOf",
            .inputs = {AbiParam{.name = "owner", .type = AbiType::address()}},
            .outputs = {AbiParam{.type = AbiType::uint256()}},
            .state_mutability = StateMutability::view};
    }
}

TEST(AbiCall, encode_function_call)
{
    KeccakHasher const hasher;
    auto const data = encode_function_call(
        hasher,
        balance_of(),
        {abi_address(0x000000000000000000000000000000000000beef_address)});
    ASSERT_TRUE(data.has_value());
    EXPECT_EQ(
        data.value(),
        evmc::from_hex(
            "0x70a08231"
            "000000000000000000000000000000000000000000000000000000000000beef")
            .value());

    auto const inputs = decode_function_input(hasher, balance_of(), data.value());
    ASSERT_TRUE(inputs.has_value());
    EXPECT_EQ(
        inputs.value()[0],
        abi_address(0x000000000000000000000000000000000000beef_address));
}

TEST(AbiCall, decode_function_result)
{
    auto const result = decode_function_result(
        balance_of(),
        evmc::from_hex(
            "00000000000000000000000000000000000000000000000000000000000003e8")
            .value());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value()[0], abi_uint(1000));
}

TEST(AbiCall, decode_function_input_errors)
{
    KeccakHasher const hasher;
    EXPECT_EQ(
        decode_function_input(
            hasher, balance_of(), evmc::from_hex("70a082").value())
            .assume_error(),
        AbiDecodeError::InputTooShort);
    EXPECT_EQ(
        decode_function_input(
            hasher,
            balance_of(),
            evmc::from_hex(
                "0xa9059cbb"
                "000000000000000000000000000000000000000000000000000000000000beef")
                .value())
            .assume_error(),
        AbiDecodeError::SelectorMismatch);
}

TEST(AbiRevert, error_string)
{
    KeccakHasher const hasher;
    auto const data =
        evmc::from_hex(
            "0x08c379a0"
            "0000000000000000000000000000000000000000000000000000000000000020"
            "000000000000000000000000000000000000000000000000000000000000001a"
            "4e6f7420656e6f7567682045746865722070726f76696465642e000000000000")
            .value();
    auto const reason = decode_revert(hasher, data);
    ASSERT_TRUE(std::holds_alternative<ErrorMessage>(reason));
    EXPECT_EQ(std::get<ErrorMessage>(reason).message, "Not enough Ether provided.");
    EXPECT_EQ(to_string(reason), "Not enough Ether provided.");
}

TEST(AbiRevert, panic)
{
    KeccakHasher const hasher;
    auto const data =
        evmc::from_hex(
            "0x4e487b71"
            "0000000000000000000000000000000000000000000000000000000000000011")
            .value();
    auto const reason = decode_revert(hasher, data);
    ASSERT_TRUE(std::holds_alternative<PanicCode>(reason));
    EXPECT_EQ(std::get<PanicCode>(reason).code, 0x11);
    EXPECT_EQ(
        panic_description(0x11), "arithmetic overflow or underflow");
    EXPECT_EQ(panic_description(0x32), "array index out of bounds");
    EXPECT_EQ(panic_description(0x1234), "unknown panic code");
    EXPECT_EQ(
        to_string(reason), "panic 0x11: arithmetic overflow or underflow");
}

TEST(AbiRevert, custom_error)
{
    KeccakHasher const hasher;
    std::vector<AbiError> const errors{AbiError{
        .name = "InsufficientBalance",
        .inputs = {
            AbiParam{.name = "available", .type = AbiType::uint256()},
            AbiParam{.name = "required", .type = AbiType::uint256()}}}};
    std::vector<AbiType> const types{AbiType::uint256(), AbiType::uint256()};
    auto const data = encode_function_call(
        abi_selector(hasher, errors[0].signature()),
        types,
        {abi_uint(5), abi_uint(10)});
    ASSERT_TRUE(data.has_value());

    auto const reason = decode_revert(hasher, data.value(), errors);
    ASSERT_TRUE(std::holds_alternative<CustomError>(reason));
    EXPECT_EQ(std::get<CustomError>(reason).name, "InsufficientBalance");
    EXPECT_EQ(
        std::get<CustomError>(reason).values,
        (AbiValueList{abi_uint(5), abi_uint(10)}));

    // unknown without the interface
    EXPECT_TRUE(
        std::holds_alternative<UnknownRevert>(
            decode_revert(hasher, data.value())));
}

TEST(AbiRevert, unknown)
{
    KeccakHasher const hasher;
    auto const empty = decode_revert(hasher, {});
    ASSERT_TRUE(std::holds_alternative<UnknownRevert>(empty));
    EXPECT_EQ(to_string(empty), "execution reverted");

    // selector matches Error(string) but the payload is truncated
    auto const truncated = decode_revert(
        hasher, evmc::from_hex("0x08c379a00000").value());
    ASSERT_TRUE(std::holds_alternative<UnknownRevert>(truncated));
    EXPECT_EQ(to_string(truncated), "0x08c379a00000");
}
