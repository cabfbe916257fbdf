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
#include <ethkit/abi/abi_item.hpp>
#include <ethkit/abi/abi_revert.hpp>
#include <ethkit/abi/abi_signatures.hpp>
#include <ethkit/abi/abi_type.hpp>
#include <ethkit/abi/abi_value.hpp>
#include <ethkit/core/byte_string.hpp>
#include <ethkit/core/cases.hpp>
#include <ethkit/core/config.hpp>
#include <ethkit/core/int.hpp>
#include <ethkit/crypto/hasher.hpp>

#include <evmc/hex.hpp>
#include <intx/intx.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

ETHKIT_NAMESPACE_BEGIN

RevertReason decode_revert(
    Hasher const &hasher, byte_string_view const data,
    std::span<AbiError const> const errors)
{
    UnknownRevert unknown{byte_string{data}};
    if (data.size() < 4) {
        return unknown;
    }
    uint32_t const selector = selector_from_bytes(data);
    auto const args = data.substr(4);

    if (selector == ERROR_STRING_SELECTOR) {
        AbiType const types[] = {AbiType::string()};
        auto res = abi_decode(types, args);
        if (res.has_value()) {
            return ErrorMessage{
                std::get<std::string>(std::move(res).value()[0].value)};
        }
        return unknown;
    }
    if (selector == PANIC_SELECTOR) {
        AbiType const types[] = {AbiType::uint256()};
        auto res = abi_decode(types, args);
        if (res.has_value()) {
            return PanicCode{std::get<uint256_t>(res.value()[0].value)};
        }
        return unknown;
    }
    for (auto const &error : errors) {
        if (selector != abi_selector(hasher, error.signature())) {
            continue;
        }
        auto const types = param_types(error.inputs);
        auto res = abi_decode(types, args);
        if (res.has_value()) {
            return CustomError{error.name, std::move(res).value()};
        }
    }
    return unknown;
}

std::string_view panic_description(uint256_t const &code) noexcept
{
    // https://docs.soliditylang.org/en/latest/control-structures.html#panic-via-assert-and-error-via-require
    if (code > 0xff) {
        return "unknown panic code";
    }
    switch (static_cast<uint8_t>(code)) {
    case 0x00:
        return "generic compiler inserted panic";
    case 0x01:
        return "assertion failed";
    case 0x11:
        return "arithmetic overflow or underflow";
    case 0x12:
        return "division or modulo by zero";
    case 0x21:
        return "invalid enum value";
    case 0x22:
        return "incorrectly encoded storage byte array";
    case 0x31:
        return "pop on empty array";
    case 0x32:
        return "array index out of bounds";
    case 0x41:
        return "out of memory";
    case 0x51:
        return "call to zero-initialized function pointer";
    default:
        return "unknown panic code";
    }
}

std::string to_string(RevertReason const &reason)
{
    return std::visit(
        Cases{
            [](ErrorMessage const &e) { return e.message; },
            [](PanicCode const &p) {
                return "panic 0x" + intx::hex(p.code) + ": " +
                       std::string{panic_description(p.code)};
            },
            [](CustomError const &e) { return "custom error " + e.name; },
            [](UnknownRevert const &u) {
                return u.data.empty() ? std::string{"execution reverted"}
                                      : "0x" + evmc::hex(u.data);
            }},
        reason);
}

ETHKIT_NAMESPACE_END
