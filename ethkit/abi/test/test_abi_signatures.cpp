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

#include <ethkit/abi/abi_signatures.hpp>
#include <ethkit/abi/abi_type.hpp>
#include <ethkit/core/bytes.hpp>
#include <ethkit/crypto/hasher.hpp>

#include <evmc/evmc.hpp>
#include <gtest/gtest.h>

#include <vector>

using namespace ethkit;
using namespace evmc::literals;

TEST(AbiSignatures, selector)
{
    KeccakHasher const hasher;
    EXPECT_EQ(abi_selector(hasher, "transfer(address,uint256)"), 0xa9059cbb);
    EXPECT_EQ(abi_selector(hasher, "balanceOf(address)"), 0x70a08231);
    EXPECT_EQ(abi_selector(hasher, "baz(uint32,bool)"), 0xcdcd77c0);

    std::vector<AbiType> const inputs{
        AbiType::address(), AbiType::uint256()};
    EXPECT_EQ(abi_selector(hasher, "transfer", inputs), 0xa9059cbb);
}

TEST(AbiSignatures, compile_time_selector)
{
    static_assert(abi_encode_selector("transfer(address,uint256)") == 0xa9059cbb);
    static_assert(ERROR_STRING_SELECTOR == 0x08c379a0);
    static_assert(PANIC_SELECTOR == 0x4e487b71);

    KeccakHasher const hasher;
    EXPECT_EQ(
        abi_selector(hasher, "Error(string)"), ERROR_STRING_SELECTOR);
}

TEST(AbiSignatures, topic)
{
    KeccakHasher const hasher;
    constexpr auto transfer =
        0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef_bytes32;
    EXPECT_EQ(
        abi_topic(hasher, "Transfer(address,address,uint256)"), transfer);
    EXPECT_EQ(
        abi_encode_event_signature("Transfer(address,address,uint256)"),
        transfer);
}

TEST(AbiSignatures, selector_bytes)
{
    constexpr auto b = selector_bytes(0xa9059cbb);
    static_assert(b[0] == 0xa9 && b[3] == 0xbb);
    EXPECT_EQ(selector_from_bytes(to_byte_string_view(b)), 0xa9059cbb);
}
