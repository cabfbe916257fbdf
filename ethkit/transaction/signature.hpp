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
#include <ethkit/core/int.hpp>
#include <ethkit/crypto/signer.hpp>

#include <cstdint>
#include <optional>

ETHKIT_NAMESPACE_BEGIN

/// Signature as carried by a transaction envelope. `chain_id` is empty only
/// for pre EIP-155 legacy transactions.
struct SignatureAndChain
{
    uint256_t r{};
    uint256_t s{};
    std::optional<uint256_t> chain_id{};
    uint8_t y_parity{};

    /// Fails on a legacy v that is neither 27 / 28 nor at least 35
    bool from_v(uint256_t const &);

    Signature signature() const noexcept
    {
        return Signature{.r = r, .s = s, .y_parity = y_parity};
    }

    friend bool
    operator==(SignatureAndChain const &, SignatureAndChain const &) = default;
};

static_assert(sizeof(SignatureAndChain) == 112);
static_assert(alignof(SignatureAndChain) == 8);

uint256_t get_v(SignatureAndChain const &) noexcept;

SignatureAndChain
with_chain(Signature const &, std::optional<uint256_t> const &chain_id);

ETHKIT_NAMESPACE_END
