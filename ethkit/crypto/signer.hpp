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

#include <ethkit/core/bytes.hpp>
#include <ethkit/core/config.hpp>
#include <ethkit/core/int.hpp>
#include <ethkit/core/result.hpp>
#include <ethkit/crypto/signer_error.hpp>

#include <cstdint>

ETHKIT_NAMESPACE_BEGIN

/// secp256k1 signature with the recovery id of the signing key
struct Signature
{
    uint256_t r{};
    uint256_t s{};
    uint8_t y_parity{};

    friend bool operator==(Signature const &, Signature const &) = default;
};

/// Signing capability. Implementations may block (hardware or remote
/// signers) and report refusal, cancellation and timeouts as `SignerError`.
/// Callers invoke `sign` once per request and never retry.
class Signer
{
public:
    virtual ~Signer() = default;

    virtual Result<Signature> sign(bytes32_t const &hash) = 0;
};

ETHKIT_NAMESPACE_END
