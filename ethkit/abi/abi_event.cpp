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

#include <ethkit/abi/abi_decode.hpp>
#include <ethkit/abi/abi_decode_error.hpp>
#include <ethkit/abi/abi_encode.hpp>
#include <ethkit/abi/abi_encode_error.hpp>
#include <ethkit/abi/abi_event.hpp>
#include <ethkit/abi/abi_item.hpp>
#include <ethkit/abi/abi_signatures.hpp>
#include <ethkit/abi/abi_type.hpp>
#include <ethkit/abi/abi_value.hpp>
#include <ethkit/core/address.hpp>
#include <ethkit/core/byte_string.hpp>
#include <ethkit/core/bytes.hpp>
#include <ethkit/core/config.hpp>
#include <ethkit/core/likely.h>
#include <ethkit/core/result.hpp>
#include <ethkit/crypto/hasher.hpp>

#include <boost/outcome/try.hpp>

#include <cstddef>
#include <ranges>
#include <string>
#include <utility>
#include <variant>
#include <vector>

ETHKIT_ANONYMOUS_NAMESPACE_BEGIN

Result<bytes32_t>
encode_topic(Hasher const &hasher, AbiType const &type, AbiValue const &value)
{
    if (type.is_value_type()) {
        BOOST_OUTCOME_TRY(auto const word, abi_encode_value(type, value));
        return to_bytes(byte_string_view{word});
    }
    if (type.kind() == AbiType::Kind::Bytes) {
        auto const *const b = std::get_if<byte_string>(&value.value);
        if (ETHKIT_UNLIKELY(b == nullptr)) {
            return AbiEncodeError::TypeMismatch;
        }
        return hasher.keccak256(*b);
    }
    if (type.kind() == AbiType::Kind::String) {
        auto const *const s = std::get_if<std::string>(&value.value);
        if (ETHKIT_UNLIKELY(s == nullptr)) {
            return AbiEncodeError::TypeMismatch;
        }
        return hasher.keccak256(to_byte_string_view(*s));
    }
    return AbiEncodeError::UnsupportedIndexedType;
}

ETHKIT_ANONYMOUS_NAMESPACE_END

ETHKIT_NAMESPACE_BEGIN

Result<AbiValueList> decode_event_log(
    Hasher const &hasher, AbiEvent const &event, EventLog const &log)
{
    size_t const indexed = static_cast<size_t>(
        std::ranges::count_if(event.inputs, &AbiParam::indexed));
    size_t const first = event.anonymous ? 0 : 1;

    if (!event.anonymous) {
        if (ETHKIT_UNLIKELY(log.topics.empty())) {
            return AbiDecodeError::TopicCountMismatch;
        }
        if (ETHKIT_UNLIKELY(
                log.topics[0] != abi_topic(hasher, event.signature()))) {
            return AbiDecodeError::TopicMismatch;
        }
    }
    if (ETHKIT_UNLIKELY(log.topics.size() != first + indexed)) {
        return AbiDecodeError::TopicCountMismatch;
    }

    std::vector<AbiType> data_types;
    for (auto const &p : event.inputs) {
        if (!p.indexed) {
            data_types.push_back(p.type);
        }
    }
    BOOST_OUTCOME_TRY(auto data_values, abi_decode(data_types, log.data));

    AbiValueList values;
    values.reserve(event.inputs.size());
    size_t topic = first;
    size_t data = 0;
    for (auto const &p : event.inputs) {
        if (!p.indexed) {
            values.emplace_back(std::move(data_values[data++]));
            continue;
        }
        auto const &word = log.topics[topic++];
        if (p.type.is_value_type()) {
            BOOST_OUTCOME_TRY(
                auto v,
                abi_decode_value(p.type, to_byte_string_view(word.bytes)));
            values.emplace_back(std::move(v));
        }
        else {
            values.emplace_back(abi_bytes(to_byte_string_view(word.bytes)));
        }
    }
    return values;
}

Result<EventLog> encode_event_log(
    Hasher const &hasher, AbiEvent const &event, Address const &address,
    AbiValueList const &values)
{
    if (ETHKIT_UNLIKELY(values.size() != event.inputs.size())) {
        return AbiEncodeError::ArityMismatch;
    }

    EventBuilder builder =
        event.anonymous
            ? EventBuilder{address}
            : EventBuilder{address, abi_topic(hasher, event.signature())};
    AbiEncoder data;
    for (size_t i = 0; i < values.size(); ++i) {
        auto const &p = event.inputs[i];
        if (p.indexed) {
            BOOST_OUTCOME_TRY(
                auto const topic, encode_topic(hasher, p.type, values[i]));
            std::move(builder).add_topic(topic);
        }
        else {
            BOOST_OUTCOME_TRY(data.add(p.type, values[i]));
        }
    }
    return std::move(builder).add_data(data.encode_final()).build();
}

ETHKIT_NAMESPACE_END
