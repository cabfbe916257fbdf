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

#include <ethkit/abi/abi_decode_error.hpp>
#include <ethkit/abi/abi_encode.hpp>
#include <ethkit/abi/abi_encode_error.hpp>
#include <ethkit/abi/abi_event.hpp>
#include <ethkit/abi/abi_item.hpp>
#include <ethkit/abi/abi_type.hpp>
#include <ethkit/abi/abi_value.hpp>
#include <ethkit/core/address.hpp>
#include <ethkit/core/bytes.hpp>
#include <ethkit/crypto/hasher.hpp>

#include <evmc/evmc.hpp>
#include <gtest/gtest.h>

#include <string>

using namespace ethkit;
using namespace evmc::literals;

namespace
{
    constexpr auto TRANSFER_TOPIC =
        0xddf252ad1be2c89b69c2b068fc378daa952ba7f163c4a11628f55a4df523b3ef_bytes32;
    constexpr auto TOKEN = 0x6b175474e89094c44da98b954eedeac495271d0f_address;
    constexpr auto FROM = 0x000000000000000000000000000000000000dead_address;
    constexpr auto TO = 0x000000000000000000000000000000000000beef_address;

    AbiEvent transfer_event()
    {
        return AbiEvent{
            .name = "Transfer",
            .inputs =
                {AbiParam{
                     .name = "from", .type = AbiType::address(), .indexed = true},
                 AbiParam{
                     .name = "to", .type = AbiType::address(), .indexed = true},
                 AbiParam{.name = "value", .type = AbiType::uint256()}}};
    }
}

TEST(AbiEvent, builder)
{
    auto const log = EventBuilder(TOKEN, TRANSFER_TOPIC)
                         .add_topic(abi_encode_address(FROM))
                         .add_topic(abi_encode_address(TO))
                         .add_data(abi_encode_uint(1000))
                         .build();
    EXPECT_EQ(log.address, TOKEN);
    ASSERT_EQ(log.topics.size(), 3);
    EXPECT_EQ(log.topics[0], TRANSFER_TOPIC);
    EXPECT_EQ(log.data.size(), 32);
}

TEST(AbiEvent, encode_and_decode)
{
    KeccakHasher const hasher;
    auto const event = transfer_event();
    AbiValueList const values{
        abi_address(FROM), abi_address(TO), abi_uint(1000)};

    auto const log = encode_event_log(hasher, event, TOKEN, values);
    ASSERT_TRUE(log.has_value());
    ASSERT_EQ(log.value().topics.size(), 3);
    EXPECT_EQ(log.value().topics[0], TRANSFER_TOPIC);
    EXPECT_EQ(log.value().topics[1], abi_encode_address(FROM));
    EXPECT_EQ(log.value().data, to_byte_string(abi_encode_uint(1000)));

    auto const decoded = decode_event_log(hasher, event, log.value());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded.value(), values);
}

TEST(AbiEvent, indexed_dynamic_values_are_hashed)
{
    KeccakHasher const hasher;
    AbiEvent const event{
        .name = "Named",
        .inputs = {
            AbiParam{.name = "key", .type = AbiType::string(), .indexed = true},
            AbiParam{.name = "note", .type = AbiType::string()}}};

    auto const log = encode_event_log(
        hasher, event, TOKEN, {abi_string("alice"), abi_string("hello")});
    ASSERT_TRUE(log.has_value());
    auto const key_hash = hasher.keccak256(to_byte_string_view("alice"));
    EXPECT_EQ(log.value().topics[1], key_hash);

    auto const decoded = decode_event_log(hasher, event, log.value());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(
        decoded.value()[0], abi_bytes(to_byte_string_view(key_hash.bytes)));
    EXPECT_EQ(decoded.value()[1], abi_string("hello"));

    AbiEvent const composite{
        .name = "Batch",
        .inputs = {AbiParam{
            .name = "ids",
            .type = AbiType::array(AbiType::uint256()).value(),
            .indexed = true}}};
    EXPECT_EQ(
        encode_event_log(hasher, composite, TOKEN, {abi_list({})})
            .assume_error(),
        AbiEncodeError::UnsupportedIndexedType);
}

TEST(AbiEvent, anonymous)
{
    KeccakHasher const hasher;
    auto event = transfer_event();
    event.anonymous = true;
    auto const log = encode_event_log(
        hasher, event, TOKEN, {abi_address(FROM), abi_address(TO), abi_uint(1)});
    ASSERT_TRUE(log.has_value());
    ASSERT_EQ(log.value().topics.size(), 2);
    auto const decoded = decode_event_log(hasher, event, log.value());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded.value()[2], abi_uint(1));
}

TEST(AbiEvent, decode_errors)
{
    KeccakHasher const hasher;
    auto const event = transfer_event();

    auto const wrong_topic = EventBuilder(TOKEN, bytes32_t{})
                                 .add_topic(abi_encode_address(FROM))
                                 .add_topic(abi_encode_address(TO))
                                 .add_data(abi_encode_uint(1))
                                 .build();
    EXPECT_EQ(
        decode_event_log(hasher, event, wrong_topic).assume_error(),
        AbiDecodeError::TopicMismatch);

    auto const missing_topic = EventBuilder(TOKEN, TRANSFER_TOPIC)
                                   .add_topic(abi_encode_address(FROM))
                                   .add_data(abi_encode_uint(1))
                                   .build();
    EXPECT_EQ(
        decode_event_log(hasher, event, missing_topic).assume_error(),
        AbiDecodeError::TopicCountMismatch);

    auto const no_data = EventBuilder(TOKEN, TRANSFER_TOPIC)
                             .add_topic(abi_encode_address(FROM))
                             .add_topic(abi_encode_address(TO))
                             .build();
    EXPECT_EQ(
        decode_event_log(hasher, event, no_data).assume_error(),
        AbiDecodeError::InputTooShort);

    EXPECT_EQ(
        encode_event_log(hasher, event, TOKEN, {abi_address(FROM)})
            .assume_error(),
        AbiEncodeError::ArityMismatch);
}
