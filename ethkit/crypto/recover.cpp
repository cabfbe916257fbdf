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

#include <ethkit/core/address.hpp>
#include <ethkit/core/byte_string.hpp>
#include <ethkit/core/bytes.hpp>
#include <ethkit/core/config.hpp>
#include <ethkit/core/keccak.hpp>
#include <ethkit/core/likely.h>
#include <ethkit/core/result.hpp>
#include <ethkit/crypto/recover.hpp>
#include <ethkit/crypto/signer.hpp>
#include <ethkit/crypto/signer_error.hpp>

#include <intx/intx.hpp>

#include <secp256k1.h>
#include <secp256k1_recovery.h>

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>

ETHKIT_NAMESPACE_BEGIN

Address public_key_to_address(byte_string_view const public_key)
{
    auto const hash = keccak256(public_key);
    Address result;
    std::memcpy(
        result.bytes, hash.bytes + sizeof(hash.bytes) - sizeof(result.bytes),
        sizeof(result.bytes));
    return result;
}

Result<Address> recover_address(bytes32_t const &hash, Signature const &sig)
{
    if (ETHKIT_UNLIKELY(sig.y_parity > 1)) {
        return SignerError::InvalidRecoveryId;
    }

    thread_local std::unique_ptr<
        secp256k1_context,
        decltype(&secp256k1_context_destroy)> const
        context(
            secp256k1_context_create(
                SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY),
            &secp256k1_context_destroy);

    uint8_t compact[sizeof(sig.r) * 2];
    intx::be::unsafe::store(compact, sig.r);
    intx::be::unsafe::store(compact + sizeof(sig.r), sig.s);

    secp256k1_ecdsa_recoverable_signature parsed;
    if (ETHKIT_UNLIKELY(!secp256k1_ecdsa_recoverable_signature_parse_compact(
            context.get(), &parsed, compact, sig.y_parity))) {
        return SignerError::InvalidSignature;
    }

    secp256k1_pubkey pubkey;
    if (ETHKIT_UNLIKELY(!secp256k1_ecdsa_recover(
            context.get(), &pubkey, &parsed, hash.bytes))) {
        return SignerError::RecoveryFailed;
    }

    unsigned char serialized[65];
    size_t len = sizeof(serialized);
    secp256k1_ec_pubkey_serialize(
        context.get(), serialized, &len, &pubkey, SECP256K1_EC_UNCOMPRESSED);
    return public_key_to_address(byte_string_view{serialized + 1, len - 1});
}

ETHKIT_NAMESPACE_END
