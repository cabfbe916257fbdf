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

#include <ethkit/abi/abi_type.hpp>
#include <ethkit/core/byte_string.hpp>
#include <ethkit/core/bytes.hpp>
#include <ethkit/core/config.hpp>
#include <ethkit/crypto/hasher.hpp>

#include <array>
#include <bit>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include <cthash/sha3/common.hpp>

// cthash only provides sha3 and not keccak. this function modifies the suffix
// in the trait to return keccaked values
namespace cthash
{
    struct keccak_config
    {
        static constexpr size_t digest_length_bit = 256u;
        static constexpr size_t capacity_bit = 512u;
        static constexpr size_t rate_bit = 1600u - capacity_bit;

        // The library combines the suffix with the padding start bit, so
        // this yields domain bit = 0x01
        static constexpr auto suffix = keccak_suffix(0, 0x00);
    };

    static_assert(
        keccak_config::rate_bit + keccak_config::capacity_bit == 1600u);

    using keccak_256 = keccak_hasher<keccak_config>;
}

ETHKIT_NAMESPACE_BEGIN

/// Selector of a literal signature, computed at compile time
consteval uint32_t abi_encode_selector(std::string_view const signature)
{
    auto const h = cthash::keccak_256{}.update(std::span{signature}).final();

    // convert to big endian
    return (static_cast<uint32_t>(h[0]) << 24) |
           (static_cast<uint32_t>(h[1]) << 16) |
           (static_cast<uint32_t>(h[2]) << 8) | static_cast<uint32_t>(h[3]);
}

consteval bytes32_t abi_encode_event_signature(std::string_view const event)
{
    auto const h = cthash::keccak_256{}.update(std::span{event}).final();
    return std::bit_cast<bytes32_t>(h);
}

inline constexpr uint32_t ERROR_STRING_SELECTOR =
    abi_encode_selector("Error(string)");
inline constexpr uint32_t PANIC_SELECTOR =
    abi_encode_selector("Panic(uint256)");

/// First four bytes of the hash of the signature, as a big endian integer
uint32_t abi_selector(Hasher const &, std::string_view signature);

/// Hash of the signature, the first topic of a non-anonymous event
bytes32_t abi_topic(Hasher const &, std::string_view signature);

/// Selector of `name` applied to `inputs`, from canonical type strings
uint32_t abi_selector(
    Hasher const &, std::string_view name, std::vector<AbiType> const &inputs);

bytes32_t abi_topic(
    Hasher const &, std::string_view name, std::vector<AbiType> const &inputs);

constexpr std::array<unsigned char, 4> selector_bytes(uint32_t const selector)
{
    return {
        static_cast<unsigned char>(selector >> 24),
        static_cast<unsigned char>(selector >> 16),
        static_cast<unsigned char>(selector >> 8),
        static_cast<unsigned char>(selector)};
}

/// Reads the selector from the first four bytes of call data
constexpr uint32_t selector_from_bytes(byte_string_view const data)
{
    return (static_cast<uint32_t>(data[0]) << 24) |
           (static_cast<uint32_t>(data[1]) << 16) |
           (static_cast<uint32_t>(data[2]) << 8) |
           static_cast<uint32_t>(data[3]);
}

ETHKIT_NAMESPACE_END
