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

#include <ethkit/abi/abi_item.hpp>
#include <ethkit/abi/abi_value.hpp>
#include <ethkit/core/address.hpp>
#include <ethkit/core/byte_string.hpp>
#include <ethkit/core/bytes.hpp>
#include <ethkit/core/config.hpp>
#include <ethkit/core/result.hpp>
#include <ethkit/crypto/hasher.hpp>

#include <utility>
#include <vector>

ETHKIT_NAMESPACE_BEGIN

struct EventLog
{
    Address address{};
    std::vector<bytes32_t> topics{};
    byte_string data{};

    friend bool operator==(EventLog const &, EventLog const &) = default;
};

// Simple API for building events in a solidity compatible manner. Data should
// be encoded using the abi helpers.
class EventBuilder
{
    EventLog event_;

public:
    explicit EventBuilder(Address const &account)
    {
        event_.address = account;
    }

    explicit EventBuilder(Address const &account, bytes32_t const &signature)
        : EventBuilder{account}
    {
        event_.topics.push_back(signature);
    }

    // Add an indexed parameter
    EventBuilder &&add_topic(bytes32_t const &topic) &&
    {
        event_.topics.push_back(topic);
        return std::move(*this);
    }

    // Add a non-indexed parameter
    EventBuilder &&add_data(byte_string_view const data) &&
    {
        event_.data += data;
        return std::move(*this);
    }

    EventLog &&build() &&
    {
        return std::move(event_);
    }
};

/// Values of all inputs in declaration order. Indexed inputs of a dynamic
/// or composite type are only present as their 32-byte hash, returned as
/// bytes.
Result<AbiValueList>
decode_event_log(Hasher const &, AbiEvent const &, EventLog const &);

/// Indexed bytes and string inputs become the hash of their content; other
/// composite indexed inputs are rejected
Result<EventLog> encode_event_log(
    Hasher const &, AbiEvent const &, Address const &,
    AbiValueList const &values);

ETHKIT_NAMESPACE_END
