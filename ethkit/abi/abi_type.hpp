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

#include <ethkit/core/config.hpp>
#include <ethkit/core/result.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

ETHKIT_NAMESPACE_BEGIN

// Recursive Solidity ABI type. Dynamic-ness and the head size are derived
// once in the factories and never change afterwards.
//
// https://docs.soliditylang.org/en/latest/abi-spec.html#types
class AbiType
{
public:
    enum class Kind : uint8_t
    {
        Address,
        Bool,
        Uint,
        Int,
        FixedBytes,
        Bytes,
        String,
        Array,
        Tuple,
    };

private:
    Kind kind_{Kind::Tuple};
    unsigned size_{}; // bits for Uint/Int, length for FixedBytes
    std::optional<size_t> array_length_{};
    std::vector<AbiType> children_{}; // element for Array, else components
    bool dynamic_{};
    size_t static_size_{};

    AbiType(
        Kind, unsigned size, std::optional<size_t> array_length,
        std::vector<AbiType> children);

public:
    AbiType() = default; // empty tuple

    static AbiType address();
    static AbiType boolean();
    static Result<AbiType> uint_n(unsigned bits);
    static Result<AbiType> int_n(unsigned bits);
    static Result<AbiType> bytes_n(unsigned n);
    static AbiType bytes();
    static AbiType string();
    /// Fails with InvalidArrayLength on a zero length or when the head size
    /// of a static array or tuple does not fit a size_t
    static Result<AbiType>
    array(AbiType element, std::optional<size_t> length = {});
    static Result<AbiType> tuple(std::vector<AbiType> components);

    static AbiType uint256();

    Kind kind() const noexcept
    {
        return kind_;
    }

    /// Width of Uint/Int
    unsigned bits() const noexcept
    {
        return size_;
    }

    /// Length of FixedBytes
    unsigned bytes_length() const noexcept
    {
        return size_;
    }

    std::optional<size_t> const &array_length() const noexcept
    {
        return array_length_;
    }

    AbiType const &element() const;

    std::vector<AbiType> const &components() const;

    bool is_dynamic() const noexcept
    {
        return dynamic_;
    }

    /// Bytes the type occupies in a head; 32 for every dynamic type
    size_t static_size() const noexcept
    {
        return static_size_;
    }

    /// Elementary types that fit a single word
    bool is_value_type() const noexcept;

    /// Canonical type string, as used in signatures
    std::string to_string() const;

    friend bool operator==(AbiType const &, AbiType const &) = default;
};

Result<AbiType> parse_abi_type(std::string_view);

/// Digits between the brackets of an array suffix; empty for T[]
Result<std::optional<size_t>> parse_array_length(std::string_view);

struct AbiSignature
{
    std::string name{};
    std::vector<AbiType> inputs{};

    friend bool
    operator==(AbiSignature const &, AbiSignature const &) = default;
};

/// Parses a human readable signature such as "transfer(address,uint256)" or
/// "function transfer(address to, uint256 amount)"
Result<AbiSignature> parse_signature(std::string_view);

/// "name(type1,type2,...)" from canonical type strings
std::string canonical_signature(
    std::string_view name, std::vector<AbiType> const &types);

inline std::string canonical_signature(AbiSignature const &sig)
{
    return canonical_signature(sig.name, sig.inputs);
}

ETHKIT_NAMESPACE_END
