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

#include <ethkit/core/byte_string.hpp>
#include <ethkit/core/bytes.hpp>
#include <ethkit/core/result.hpp>
#include <ethkit/crypto/hasher.hpp>
#include <ethkit/crypto/private_key_signer.hpp>
#include <ethkit/crypto/signer.hpp>
#include <ethkit/crypto/signer_error.hpp>
#include <ethkit/transaction/authorization.hpp>
#include <ethkit/transaction/transaction_error.hpp>

#include <evmc/evmc.hpp>

#include <gtest/gtest.h>

#include <span>
#include <utility>
#include <vector>

using namespace ethkit;
using namespace evmc::literals;

namespace
{
    constexpr auto key_one =
        0x0000000000000000000000000000000000000000000000000000000000000001_bytes32;
    constexpr auto key_one_address =
        0x7E5F4552091A69125d5DfCb7b8C2659029395Bdf_address;
    constexpr auto delegate = 0x000000000000000000000000000000000000aaaa_address;

    class RefusingSigner final : public Signer
    {
    public:
        int calls{0};

        Result<Signature> sign(bytes32_t const &) override
        {
            ++calls;
            return SignerError::Rejected;
        }
    };

    class FixedSigner final : public Signer
    {
    public:
        Signature signature{};

        Result<Signature> sign(bytes32_t const &) override
        {
            return signature;
        }
    };

    // fails every call after the first `remaining` ones
    class LimitedSigner final : public Signer
    {
    public:
        PrivateKeySigner inner;
        int remaining{};

        LimitedSigner(PrivateKeySigner signer, int const n)
            : inner{std::move(signer)}
            , remaining{n}
        {
        }

        Result<Signature> sign(bytes32_t const &hash) override
        {
            if (remaining-- <= 0) {
                return SignerError::Rejected;
            }
            return inner.sign(hash);
        }
    };
}

TEST(Authorization, packed_payload)
{
    Authorization const auth{.chain_id = 0x0a, .address = delegate, .nonce = 3};
    auto const payload = authorization_signing_payload(auth);
    ASSERT_EQ(payload.size(), 1 + 32 + 20 + 32);
    EXPECT_EQ(payload[0], 0x05);
    EXPECT_EQ(payload[32], 0x0a);
    EXPECT_EQ(
        payload.substr(33, 20), byte_string(delegate.bytes, sizeof(delegate)));
    EXPECT_EQ(payload[84], 0x03);
    for (size_t i = 1; i < 32; ++i) {
        EXPECT_EQ(payload[i], 0);
    }
}

TEST(Authorization, rlp_payload)
{
    Authorization const auth{.chain_id = 1, .address = delegate, .nonce = 0};
    EXPECT_EQ(
        authorization_signing_payload(auth, AuthorizationPreimage::rlp),
        evmc::from_hex("05d70194000000000000000000000000000000000000aaaa80")
            .value());
}

TEST(Authorization, sign_and_recover)
{
    KeccakHasher const hasher;
    auto signer = PrivateKeySigner::create(key_one).value();
    ASSERT_EQ(signer.address(), key_one_address);

    Authorization const auth{.chain_id = 1, .address = delegate, .nonce = 7};
    EXPECT_FALSE(auth.is_signed());
    EXPECT_FALSE(auth.is_revocation());

    for (auto const preimage :
         {AuthorizationPreimage::packed, AuthorizationPreimage::rlp}) {
        auto const signed_auth =
            sign_authorization(auth, hasher, signer, preimage);
        ASSERT_FALSE(signed_auth.has_error());
        EXPECT_TRUE(signed_auth.value().is_signed());
        EXPECT_EQ(signed_auth.value().chain_id, auth.chain_id);
        EXPECT_EQ(signed_auth.value().address, auth.address);
        EXPECT_EQ(signed_auth.value().nonce, auth.nonce);
        EXPECT_LE(signed_auth.value().signature->y_parity, 1);

        auto const authority =
            recover_authority(signed_auth.value(), hasher, preimage);
        ASSERT_FALSE(authority.has_error());
        EXPECT_EQ(authority.value(), key_one_address);
    }

    auto const packed = sign_authorization(auth, hasher, signer);
    auto const rlp =
        sign_authorization(auth, hasher, signer, AuthorizationPreimage::rlp);
    EXPECT_NE(packed.value().signature, rlp.value().signature);
}

TEST(Authorization, revocation)
{
    Authorization const auth{.chain_id = 0, .address = {}, .nonce = 1};
    EXPECT_TRUE(auth.is_revocation());

    KeccakHasher const hasher;
    auto signer = PrivateKeySigner::create(key_one).value();
    auto const signed_auth = sign_authorization(auth, hasher, signer);
    ASSERT_FALSE(signed_auth.has_error());
    EXPECT_EQ(
        recover_authority(signed_auth.value(), hasher).value(),
        key_one_address);
}

TEST(Authorization, errors)
{
    KeccakHasher const hasher;
    Authorization const auth{.chain_id = 1, .address = delegate, .nonce = 0};

    EXPECT_EQ(
        recover_authority(auth, hasher).assume_error(),
        TransactionError::UnsignedAuthorization);

    RefusingSigner signer;
    EXPECT_EQ(
        sign_authorization(auth, hasher, signer).assume_error(),
        SignerError::Rejected);
    EXPECT_EQ(signer.calls, 1);
}

TEST(Authorization, zero_signature_component)
{
    KeccakHasher const hasher;
    Authorization const auth{.chain_id = 1, .address = delegate, .nonce = 0};

    FixedSigner signer;
    signer.signature = {.r = 0, .s = 1, .y_parity = 0};
    EXPECT_EQ(
        sign_authorization(auth, hasher, signer).assume_error(),
        SignerError::InvalidSignature);

    signer.signature = {.r = 1, .s = 0, .y_parity = 1};
    EXPECT_EQ(
        sign_authorization(auth, hasher, signer).assume_error(),
        SignerError::InvalidSignature);

    signer.signature = {.r = 1, .s = 1, .y_parity = 2};
    EXPECT_EQ(
        sign_authorization(auth, hasher, signer).assume_error(),
        SignerError::InvalidRecoveryId);
}

TEST(Authorization, format)
{
    Authorization auth{.chain_id = 0, .address = delegate, .nonce = 0};
    EXPECT_TRUE(is_valid_authorization_format(auth));

    auth.signature = Signature{.r = 1, .s = 1, .y_parity = 1};
    EXPECT_TRUE(is_valid_authorization_format(auth));

    auth.signature = Signature{.r = 1, .s = 1, .y_parity = 2};
    EXPECT_FALSE(is_valid_authorization_format(auth));

    auth.signature = Signature{.r = 0, .s = 1, .y_parity = 0};
    EXPECT_FALSE(is_valid_authorization_format(auth));

    auth.signature = Signature{.r = 1, .s = 0, .y_parity = 0};
    EXPECT_FALSE(is_valid_authorization_format(auth));

    // secp256k1 group order
    auto const n = from_bytes_be(
        0xfffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141_bytes32);
    auth.signature = Signature{.r = n, .s = 1, .y_parity = 0};
    EXPECT_FALSE(is_valid_authorization_format(auth));

    auth.signature = Signature{.r = 1, .s = n - 1, .y_parity = 0};
    EXPECT_TRUE(is_valid_authorization_format(auth));
}

TEST(Authorization, list)
{
    KeccakHasher const hasher;
    auto signer = PrivateKeySigner::create(key_one).value();
    auto other = PrivateKeySigner::create(
                     0x0000000000000000000000000000000000000000000000000000000000000002_bytes32)
                     .value();

    AuthorizationList const list{
        {.chain_id = 1, .address = delegate, .nonce = 0},
        {.chain_id = 0, .address = {}, .nonce = 1}};

    auto const signed_list =
        sign_authorization_list(list, hasher, signer).value();
    ASSERT_EQ(signed_list.size(), 2u);
    EXPECT_TRUE(signed_list[0].is_signed());
    EXPECT_TRUE(signed_list[1].is_signed());
    EXPECT_EQ(signed_list[1].nonce, 1u);

    auto const authorities = recover_authorities(signed_list, hasher).value();
    EXPECT_EQ(
        authorities, (std::vector<Address>{key_one_address, key_one_address}));

    std::vector<Address> const expected{key_one_address, other.address()};
    EXPECT_EQ(
        verify_authorization_list(signed_list, expected, hasher).value(),
        (std::vector<bool>{true, false}));
    EXPECT_TRUE(verify_authorization(signed_list[0], key_one_address, hasher));
    EXPECT_FALSE(verify_authorization(list[0], key_one_address, hasher));
    EXPECT_FALSE(verify_authorization(
        signed_list[0], key_one_address, hasher, AuthorizationPreimage::rlp));

    EXPECT_EQ(
        verify_authorization_list(
            signed_list, std::span<Address const>{expected}.first(1), hasher)
            .assume_error(),
        TransactionError::AuthorizationCountMismatch);

    AuthorizationList mixed = signed_list;
    mixed[1].signature.reset();
    EXPECT_EQ(
        recover_authorities(mixed, hasher).assume_error(),
        TransactionError::UnsignedAuthorization);
    EXPECT_EQ(
        verify_authorization_list(
            mixed, std::vector<Address>{key_one_address, key_one_address},
            hasher)
            .value(),
        (std::vector<bool>{true, false}));
}

TEST(Authorization, list_stops_at_signer_failure)
{
    KeccakHasher const hasher;
    LimitedSigner signer{PrivateKeySigner::create(key_one).value(), 1};

    AuthorizationList const list{
        {.chain_id = 1, .address = delegate, .nonce = 0},
        {.chain_id = 1, .address = delegate, .nonce = 1},
        {.chain_id = 1, .address = delegate, .nonce = 2}};
    EXPECT_EQ(
        sign_authorization_list(list, hasher, signer).assume_error(),
        SignerError::Rejected);
    EXPECT_EQ(signer.remaining, -1);

    EXPECT_TRUE(sign_authorization_list({}, hasher, signer).value().empty());
}
