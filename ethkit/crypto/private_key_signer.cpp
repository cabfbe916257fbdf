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
#include <ethkit/core/likely.h>
#include <ethkit/core/result.hpp>
#include <ethkit/crypto/private_key_signer.hpp>
#include <ethkit/crypto/recover.hpp>
#include <ethkit/crypto/signer.hpp>
#include <ethkit/crypto/signer_error.hpp>

#include <intx/intx.hpp>

#include <secp256k1.h>
#include <secp256k1_recovery.h>

#include <cstddef>
#include <cstring>
#include <utility>

#include <string.h>

ETHKIT_NAMESPACE_BEGIN

void PrivateKeySigner::ContextDeleter::operator()(
    secp256k1_context *const ctx) const noexcept
{
    secp256k1_context_destroy(ctx);
}

PrivateKeySigner::~PrivateKeySigner()
{
    explicit_bzero(secret_.data(), secret_.size());
}

Result<PrivateKeySigner> PrivateKeySigner::create(bytes32_t const &secret)
{
    PrivateKeySigner signer;
    signer.context_.reset(secp256k1_context_create(
        SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY));
    std::memcpy(signer.secret_.data(), secret.bytes, sizeof(secret.bytes));

    if (ETHKIT_UNLIKELY(!secp256k1_ec_seckey_verify(
            signer.context_.get(), signer.secret_.data()))) {
        return SignerError::InvalidKey;
    }

    secp256k1_pubkey pubkey;
    if (ETHKIT_UNLIKELY(!secp256k1_ec_pubkey_create(
            signer.context_.get(), &pubkey, signer.secret_.data()))) {
        return SignerError::InvalidKey;
    }

    unsigned char serialized[65];
    size_t len = sizeof(serialized);
    secp256k1_ec_pubkey_serialize(
        signer.context_.get(),
        serialized,
        &len,
        &pubkey,
        SECP256K1_EC_UNCOMPRESSED);
    signer.address_ =
        public_key_to_address(byte_string_view{serialized + 1, len - 1});

    return signer;
}

Result<Signature> PrivateKeySigner::sign(bytes32_t const &hash)
{
    secp256k1_ecdsa_recoverable_signature sig;
    if (ETHKIT_UNLIKELY(!secp256k1_ecdsa_sign_recoverable(
            context_.get(),
            &sig,
            hash.bytes,
            secret_.data(),
            nullptr,
            nullptr))) {
        return SignerError::InvalidKey;
    }

    unsigned char compact[64];
    int recid = 0;
    secp256k1_ecdsa_recoverable_signature_serialize_compact(
        context_.get(), compact, &recid, &sig);

    return Signature{
        .r = intx::be::unsafe::load<uint256_t>(compact),
        .s = intx::be::unsafe::load<uint256_t>(compact + 32),
        .y_parity = static_cast<uint8_t>(recid)};
}

ETHKIT_NAMESPACE_END
