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
#include <ethkit/abi/abi_decode.hpp>
#include <ethkit/abi/abi_decode_error.hpp>
#include <ethkit/abi/abi_encode.hpp>
#include <ethkit/abi/abi_item.hpp>
#include <ethkit/abi/abi_signatures.hpp>
#include <ethkit/abi/abi_type.hpp>
#include <ethkit/abi/abi_value.hpp>
#include <ethkit/core/byte_string.hpp>
#include <ethkit/core/config.hpp>
#include <ethkit/core/likely.h>
#include <ethkit/core/result.hpp>
#include <ethkit/crypto/hasher.hpp>

#include <boost/outcome/try.hpp>

#include <cstdint>
#include <span>

ETHKIT_NAMESPACE_BEGIN

Result<byte_string> encode_function_call(
    uint32_t const selector, std::span<AbiType const> const inputs,
    AbiValueList const &args)
{
    BOOST_OUTCOME_TRY(auto const encoded, abi_encode(inputs, args));
    byte_string output{to_byte_string_view(selector_bytes(selector))};
    output += encoded;
    return output;
}

Result<byte_string> encode_function_call(
    Hasher const &hasher, AbiFunction const &function,
    AbiValueList const &args)
{
    auto const inputs = param_types(function.inputs);
    return encode_function_call(
        abi_selector(hasher, function.signature()), inputs, args);
}

Result<AbiValueList> decode_function_result(
    AbiFunction const &function, byte_string_view const data)
{
    auto const outputs = param_types(function.outputs);
    return abi_decode(outputs, data);
}

Result<AbiValueList> decode_function_input(
    Hasher const &hasher, AbiFunction const &function,
    byte_string_view const call_data)
{
    if (ETHKIT_UNLIKELY(call_data.size() < 4)) {
        return AbiDecodeError::InputTooShort;
    }
    if (ETHKIT_UNLIKELY(
            selector_from_bytes(call_data) !=
            abi_selector(hasher, function.signature()))) {
        return AbiDecodeError::SelectorMismatch;
    }
    auto const inputs = param_types(function.inputs);
    return abi_decode(inputs, call_data.substr(4));
}

ETHKIT_NAMESPACE_END
