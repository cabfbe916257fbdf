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
#include <ethkit/core/byte_string.hpp>
#include <ethkit/core/config.hpp>
#include <ethkit/core/int.hpp>
#include <ethkit/crypto/hasher.hpp>

#include <span>
#include <string>
#include <string_view>
#include <variant>

ETHKIT_NAMESPACE_BEGIN

/// `Error(string)`, emitted by require and revert with a message
struct ErrorMessage
{
    std::string message{};

    friend bool
    operator==(ErrorMessage const &, ErrorMessage const &) = default;
};

/// `Panic(uint256)`, emitted by the compiler on failed internal checks
struct PanicCode
{
    uint256_t code{};

    friend bool operator==(PanicCode const &, PanicCode const &) = default;
};

/// A custom `error` declared in the contract interface
struct CustomError
{
    std::string name{};
    AbiValueList values{};

    friend bool operator==(CustomError const &, CustomError const &) = default;
};

/// Empty or unrecognised revert data, kept verbatim
struct UnknownRevert
{
    byte_string data{};

    friend bool
    operator==(UnknownRevert const &, UnknownRevert const &) = default;
};

using RevertReason =
    std::variant<ErrorMessage, PanicCode, CustomError, UnknownRevert>;

/// Never fails: data that matches no known shape is returned as
/// `UnknownRevert`
RevertReason decode_revert(
    Hasher const &, byte_string_view data,
    std::span<AbiError const> errors = {});

/// Compiler description of a panic code, or "unknown panic code"
std::string_view panic_description(uint256_t const &code) noexcept;

std::string to_string(RevertReason const &);

ETHKIT_NAMESPACE_END
