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
#include <ethkit/core/config.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

ETHKIT_NAMESPACE_BEGIN

enum class StateMutability : uint8_t
{
    pure,
    view,
    nonpayable,
    payable,
};

std::string_view to_string(StateMutability) noexcept;

std::optional<StateMutability> parse_state_mutability(std::string_view);

struct AbiParam
{
    std::string name{};
    AbiType type{};
    bool indexed{false};
    // names of the tuple components, kept for JSON round trips
    std::vector<AbiParam> components{};

    friend bool operator==(AbiParam const &, AbiParam const &) = default;
};

std::vector<AbiType> param_types(std::vector<AbiParam> const &);

struct AbiFunction
{
    std::string name{};
    std::vector<AbiParam> inputs{};
    std::vector<AbiParam> outputs{};
    StateMutability state_mutability{StateMutability::nonpayable};

    bool is_read_only() const noexcept
    {
        return state_mutability == StateMutability::view ||
               state_mutability == StateMutability::pure;
    }

    bool is_payable() const noexcept
    {
        return state_mutability == StateMutability::payable;
    }

    std::string signature() const;

    friend bool operator==(AbiFunction const &, AbiFunction const &) = default;
};

struct AbiEvent
{
    std::string name{};
    std::vector<AbiParam> inputs{};
    bool anonymous{false};

    std::string signature() const;

    friend bool operator==(AbiEvent const &, AbiEvent const &) = default;
};

struct AbiError
{
    std::string name{};
    std::vector<AbiParam> inputs{};

    std::string signature() const;

    friend bool operator==(AbiError const &, AbiError const &) = default;
};

/// Contract interface: the descriptors of a JSON ABI, in source order
struct Abi
{
    std::vector<AbiFunction> functions{};
    std::vector<AbiEvent> events{};
    std::vector<AbiError> errors{};

    /// First function with this name. Overloads are told apart with
    /// `find_function_by_signature`.
    AbiFunction const *find_function(std::string_view name) const;
    AbiFunction const *
    find_function_by_signature(std::string_view signature) const;
    AbiEvent const *find_event(std::string_view name) const;
    AbiError const *find_error(std::string_view name) const;

    friend bool operator==(Abi const &, Abi const &) = default;
};

ETHKIT_NAMESPACE_END
