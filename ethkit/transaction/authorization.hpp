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

#include <ethkit/core/address.hpp>
#include <ethkit/core/byte_string.hpp>
#include <ethkit/core/bytes.hpp>
#include <ethkit/core/config.hpp>
#include <ethkit/core/int.hpp>
#include <ethkit/core/result.hpp>
#include <ethkit/crypto/hasher.hpp>
#include <ethkit/crypto/signer.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

ETHKIT_NAMESPACE_BEGIN

/// EIP-7702 delegation of an externally owned account to `address`. The zero
/// address revokes an existing delegation. A chain id of zero is valid on
/// every chain.
struct Authorization
{
    uint256_t chain_id{};
    Address address{};
    uint64_t nonce{};
    std::optional<Signature> signature{};

    bool is_signed() const noexcept
    {
        return signature.has_value();
    }

    bool is_revocation() const noexcept
    {
        return address == Address{};
    }

    friend bool
    operator==(Authorization const &, Authorization const &) = default;
};

using AuthorizationList = std::vector<Authorization>;

enum class AuthorizationPreimage : uint8_t
{
    // 0x05 || chain_id (32 bytes) || address (20 bytes) || nonce (32 bytes)
    packed,
    // 0x05 || rlp([chain_id, address, nonce]), as specified by EIP-7702
    rlp,
};

byte_string authorization_signing_payload(
    Authorization const &,
    AuthorizationPreimage = AuthorizationPreimage::packed);

bytes32_t authorization_signing_hash(
    Hasher const &, Authorization const &,
    AuthorizationPreimage = AuthorizationPreimage::packed);

/// Returns a signed copy of `auth`; an existing signature is replaced
Result<Authorization> sign_authorization(
    Authorization const &auth, Hasher const &, Signer &,
    AuthorizationPreimage = AuthorizationPreimage::packed);

/// Account that signed `auth`
Result<Address> recover_authority(
    Authorization const &auth, Hasher const &,
    AuthorizationPreimage = AuthorizationPreimage::packed);

// Checks that need no recovery. A signed entry must carry a y parity of 0 or
// 1 and r, s in [1, n) where n is the secp256k1 group order.
bool is_valid_authorization_format(Authorization const &) noexcept;

/// True when `auth` is signed and recovers to `expected`
bool verify_authorization(
    Authorization const &auth, Address const &expected, Hasher const &,
    AuthorizationPreimage = AuthorizationPreimage::packed);

/// Authority of every entry in order; fails on the first entry that does not
/// recover
Result<std::vector<Address>> recover_authorities(
    AuthorizationList const &, Hasher const &,
    AuthorizationPreimage = AuthorizationPreimage::packed);

/// verify_authorization for each entry against the signer at the same index
Result<std::vector<bool>> verify_authorization_list(
    AuthorizationList const &, std::span<Address const> expected,
    Hasher const &, AuthorizationPreimage = AuthorizationPreimage::packed);

/// Signs every entry with `signer`, stopping at the first failure
Result<AuthorizationList> sign_authorization_list(
    AuthorizationList const &, Hasher const &, Signer &,
    AuthorizationPreimage = AuthorizationPreimage::packed);

ETHKIT_NAMESPACE_END
