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
#include <ethkit/core/int.hpp>
#include <ethkit/core/likely.h>
#include <ethkit/core/result.hpp>
#include <ethkit/crypto/hasher.hpp>
#include <ethkit/crypto/recover.hpp>
#include <ethkit/crypto/signer.hpp>
#include <ethkit/crypto/signer_error.hpp>
#include <ethkit/rlp/address_rlp.hpp>
#include <ethkit/rlp/encode2.hpp>
#include <ethkit/rlp/int_rlp.hpp>
#include <ethkit/transaction/authorization.hpp>
#include <ethkit/transaction/transaction_error.hpp>

#include <boost/outcome/try.hpp>
#include <intx/intx.hpp>
#include <quill/Quill.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

ETHKIT_ANONYMOUS_NAMESPACE_BEGIN

constexpr unsigned char AUTHORIZATION_MAGIC = 0x05;

constexpr uint256_t SECP256K1_ORDER = intx::from_string<uint256_t>(
    "0xfffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141");

ETHKIT_ANONYMOUS_NAMESPACE_END

ETHKIT_NAMESPACE_BEGIN

byte_string authorization_signing_payload(
    Authorization const &auth, AuthorizationPreimage const preimage)
{
    byte_string result(1, AUTHORIZATION_MAGIC);
    switch (preimage) {
    case AuthorizationPreimage::packed:
        result += to_bytes_be(auth.chain_id);
        result += to_byte_string_view(auth.address.bytes);
        result += to_bytes_be(uint256_t{auth.nonce});
        break;
    case AuthorizationPreimage::rlp:
        result += rlp::encode_list2(
            rlp::encode_unsigned(auth.chain_id),
            rlp::encode_address(auth.address),
            rlp::encode_unsigned(auth.nonce));
        break;
    }
    return result;
}

bytes32_t authorization_signing_hash(
    Hasher const &hasher, Authorization const &auth,
    AuthorizationPreimage const preimage)
{
    return hasher.keccak256(authorization_signing_payload(auth, preimage));
}

Result<Authorization> sign_authorization(
    Authorization const &auth, Hasher const &hasher, Signer &signer,
    AuthorizationPreimage const preimage)
{
    auto const hash = authorization_signing_hash(hasher, auth, preimage);
    auto sig = signer.sign(hash);
    if (ETHKIT_UNLIKELY(sig.has_error())) {
        LOG_WARNING(
            "authorization signing failed: {}", sig.error().message().c_str());
        return std::move(sig).error();
    }
    if (ETHKIT_UNLIKELY(sig.value().y_parity > 1)) {
        return SignerError::InvalidRecoveryId;
    }
    if (ETHKIT_UNLIKELY(sig.value().r == 0 || sig.value().s == 0)) {
        return SignerError::InvalidSignature;
    }

    Authorization signed_auth = auth;
    signed_auth.signature = sig.value();
    return signed_auth;
}

Result<Address> recover_authority(
    Authorization const &auth, Hasher const &hasher,
    AuthorizationPreimage const preimage)
{
    if (ETHKIT_UNLIKELY(!auth.signature.has_value())) {
        return TransactionError::UnsignedAuthorization;
    }
    return recover_address(
        authorization_signing_hash(hasher, auth, preimage), *auth.signature);
}

bool is_valid_authorization_format(Authorization const &auth) noexcept
{
    if (!auth.signature.has_value()) {
        return true;
    }
    auto const &sig = *auth.signature;
    return sig.y_parity <= 1 && sig.r != 0 && sig.s != 0 &&
           sig.r < SECP256K1_ORDER && sig.s < SECP256K1_ORDER;
}

bool verify_authorization(
    Authorization const &auth, Address const &expected, Hasher const &hasher,
    AuthorizationPreimage const preimage)
{
    if (!auth.is_signed() || !is_valid_authorization_format(auth)) {
        return false;
    }
    auto const authority = recover_authority(auth, hasher, preimage);
    if (authority.has_error()) {
        LOG_DEBUG(
            "authorization does not recover: {}",
            authority.error().message().c_str());
        return false;
    }
    return authority.value() == expected;
}

Result<std::vector<Address>> recover_authorities(
    AuthorizationList const &list, Hasher const &hasher,
    AuthorizationPreimage const preimage)
{
    std::vector<Address> authorities;
    authorities.reserve(list.size());
    for (size_t i = 0; i < list.size(); ++i) {
        auto authority = recover_authority(list[i], hasher, preimage);
        if (ETHKIT_UNLIKELY(authority.has_error())) {
            LOG_WARNING(
                "authorization {} does not recover: {}",
                i,
                authority.error().message().c_str());
            return std::move(authority).error();
        }
        authorities.push_back(authority.value());
    }
    return authorities;
}

Result<std::vector<bool>> verify_authorization_list(
    AuthorizationList const &list, std::span<Address const> const expected,
    Hasher const &hasher, AuthorizationPreimage const preimage)
{
    if (ETHKIT_UNLIKELY(list.size() != expected.size())) {
        return TransactionError::AuthorizationCountMismatch;
    }
    std::vector<bool> result;
    result.reserve(list.size());
    for (size_t i = 0; i < list.size(); ++i) {
        result.push_back(
            verify_authorization(list[i], expected[i], hasher, preimage));
    }
    return result;
}

Result<AuthorizationList> sign_authorization_list(
    AuthorizationList const &list, Hasher const &hasher, Signer &signer,
    AuthorizationPreimage const preimage)
{
    AuthorizationList signed_list;
    signed_list.reserve(list.size());
    for (auto const &auth : list) {
        BOOST_OUTCOME_TRY(
            auto signed_auth,
            sign_authorization(auth, hasher, signer, preimage));
        signed_list.push_back(std::move(signed_auth));
    }
    return signed_list;
}

ETHKIT_NAMESPACE_END
