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
#include <ethkit/rlp/decode_error.hpp>
#include <ethkit/transaction/authorization.hpp>
#include <ethkit/transaction/rlp/transaction_rlp.hpp>
#include <ethkit/transaction/signature.hpp>
#include <ethkit/transaction/transaction.hpp>
#include <ethkit/transaction/transaction_error.hpp>
#include <ethkit/transaction/transaction_signer.hpp>

#include <evmc/evmc.hpp>

#include <intx/intx.hpp>

#include <gtest/gtest.h>

#include <variant>

using namespace ethkit;
using namespace evmc::literals;
using intx::operator""_u256;

namespace
{
    constexpr auto eip155_key =
        0x4646464646464646464646464646464646464646464646464646464646464646_bytes32;
    constexpr auto eip155_sender =
        0x9d8A62f656a8d1615C1294fd71e9CFb3E4855A4F_address;
    constexpr auto to_addr = 0x3535353535353535353535353535353535353535_address;

    PrivateKeySigner make_signer(bytes32_t const &key)
    {
        return PrivateKeySigner::create(key).value();
    }

    TransactionRequest eip155_request()
    {
        return TransactionRequest{
            .chain_id = 1,
            .nonce = 9,
            .to = to_addr,
            .value = 0xde0b6b3a7640000_u256,
            .gas_limit = 21'000,
            .gas_price = 20'000'000'000};
    }

    // Hands out a fixed answer and counts requests
    class ScriptedSigner final : public Signer
    {
        Result<Signature> (*answer_)();

    public:
        int calls{0};

        explicit ScriptedSigner(Result<Signature> (*answer)())
            : answer_{answer}
        {
        }

        Result<Signature> sign(bytes32_t const &) override
        {
            ++calls;
            return answer_();
        }
    };
}

// Example data from: EIP-155
TEST(TransactionSigner, eip155_reference)
{
    KeccakHasher const hasher;
    auto signer = make_signer(eip155_key);
    EXPECT_EQ(signer.address(), eip155_sender);

    auto const tx = resolve_transaction(eip155_request());
    ASSERT_FALSE(tx.has_error());

    auto const hash = signing_hash(hasher, tx.value());
    ASSERT_FALSE(hash.has_error());
    EXPECT_EQ(
        hash.value(),
        0xdaf5a779ae972f972197303d7b574746c7ef83eadac0f2791ad23db92e4c8e53_bytes32);

    auto const raw = sign_transaction_raw(tx.value(), hasher, signer);
    ASSERT_FALSE(raw.has_error());
    EXPECT_EQ(
        raw.value(),
        evmc::from_hex(
            "f86c098504a817c800825208943535353535353535353535353535353535353535"
            "880de0b6b3a76400008025a028ef61340bd939bc2195fe537567866003e1a15d3c"
            "71ff63e1590620aa636276a067cbe9d8997f761aecb703304b3800ccf555c9f3dc"
            "64214b297fb1966a3b6d83")
            .value());

    auto const signed_txn = sign_transaction(eip155_request(), hasher, signer);
    ASSERT_FALSE(signed_txn.has_error());
    EXPECT_EQ(get_v(signed_txn.value().sc), 37);
    EXPECT_EQ(
        signed_txn.value().sc.r,
        0x28ef61340bd939bc2195fe537567866003e1a15d3c71ff63e1590620aa636276_u256);
    EXPECT_EQ(
        signed_txn.value().sc.s,
        0x67cbe9d8997f761aecb703304b3800ccf555c9f3dc64214b297fb1966a3b6d83_u256);
}

TEST(TransactionSigner, legacy_v_tracks_parity)
{
    KeccakHasher const hasher;
    auto signer = make_signer(eip155_key);

    bool seen[2] = {false, false};
    for (uint64_t nonce = 0; nonce < 16 && !(seen[0] && seen[1]); ++nonce) {
        auto req = eip155_request();
        req.nonce = nonce;
        auto const signed_txn = sign_transaction(req, hasher, signer);
        ASSERT_FALSE(signed_txn.has_error());
        auto const &sc = signed_txn.value().sc;
        seen[sc.y_parity] = true;
        EXPECT_EQ(get_v(sc), sc.y_parity ? 38 : 37);

        auto const raw = rlp::encode_transaction(signed_txn.value());
        ASSERT_FALSE(raw.has_error());
        auto const decoded = decode_transaction(raw.value());
        ASSERT_FALSE(decoded.has_error());
        EXPECT_EQ(decoded.value(), signed_txn.value());
    }
    EXPECT_TRUE(seen[0] && seen[1]);
}

TEST(TransactionSigner, deterministic)
{
    KeccakHasher const hasher;
    auto signer = make_signer(eip155_key);

    auto req = eip155_request();
    req.gas_price.reset();
    req.max_fee_per_gas = 30'000'000'000;
    req.max_priority_fee_per_gas = 1'000'000'000;

    auto const first = sign_transaction_raw(req, hasher, signer);
    auto const second = sign_transaction_raw(req, hasher, signer);
    ASSERT_FALSE(first.has_error());
    ASSERT_FALSE(second.has_error());
    EXPECT_EQ(first.value(), second.value());
    EXPECT_EQ(first.value()[0], 0x02);
}

TEST(TransactionSigner, fee_sensitive)
{
    KeccakHasher const hasher;
    auto signer = make_signer(eip155_key);

    auto req = eip155_request();
    req.gas_price.reset();
    req.max_fee_per_gas = 30'000'000'000;
    req.max_priority_fee_per_gas = 1'000'000'000;
    auto const a = sign_transaction(req, hasher, signer);

    req.max_priority_fee_per_gas = 1'000'000'001;
    auto const b = sign_transaction(req, hasher, signer);

    ASSERT_FALSE(a.has_error());
    ASSERT_FALSE(b.has_error());
    EXPECT_NE(a.value().sc, b.value().sc);
}

TEST(TransactionSigner, round_trip_every_type)
{
    KeccakHasher const hasher;
    auto signer = make_signer(eip155_key);
    auto authority = make_signer(
        0x0000000000000000000000000000000000000000000000000000000000000001_bytes32);

    auto const auth = sign_authorization(
        Authorization{
            .chain_id = 1,
            .address = 0x000000000000000000000000000000000000aaaa_address,
            .nonce = 0},
        hasher,
        authority);
    ASSERT_FALSE(auth.has_error());

    auto const blob_hash =
        0x01a915e4d060149eb4365960e6a7a45f334393093061116b197e3240065ff2d8_bytes32;

    TransactionRequest requests[5];
    for (auto &req : requests) {
        req = eip155_request();
        req.data = byte_string{0xde, 0xad, 0xbe, 0xef};
    }
    requests[1].access_list = AccessList{AccessEntry{
        .a = to_addr,
        .keys = {
            0x0000000000000000000000000000000000000000000000000000000000000007_bytes32}}};
    for (auto *req : {&requests[2], &requests[3], &requests[4]}) {
        req->gas_price.reset();
        req->max_fee_per_gas = 30'000'000'000;
        req->max_priority_fee_per_gas = 1'000'000'000;
    }
    requests[3].max_fee_per_blob_gas = 5;
    requests[3].blob_versioned_hashes = std::vector{blob_hash};
    requests[4].authorization_list = AuthorizationList{auth.value()};

    for (uint8_t i = 0; i < 5; ++i) {
        auto const signed_txn = sign_transaction(requests[i], hasher, signer);
        ASSERT_FALSE(signed_txn.has_error());
        EXPECT_EQ(
            get_type(signed_txn.value().transaction),
            static_cast<TransactionType>(i));

        auto const raw = rlp::encode_transaction(signed_txn.value());
        ASSERT_FALSE(raw.has_error());
        auto const decoded = decode_transaction(raw.value());
        ASSERT_FALSE(decoded.has_error());
        EXPECT_EQ(decoded.value(), signed_txn.value());

        auto const sender = recover_sender(hasher, decoded.value());
        ASSERT_FALSE(sender.has_error());
        EXPECT_EQ(sender.value(), eip155_sender);

        auto const hash = transaction_hash(hasher, decoded.value());
        ASSERT_FALSE(hash.has_error());
        EXPECT_EQ(hash.value(), hasher.keccak256(raw.value()));
    }
}

TEST(TransactionSigner, decode_trailing_bytes)
{
    KeccakHasher const hasher;
    auto signer = make_signer(eip155_key);
    auto raw = sign_transaction_raw(eip155_request(), hasher, signer);
    ASSERT_FALSE(raw.has_error());
    raw.value().push_back(0x00);
    EXPECT_EQ(
        decode_transaction(raw.value()).assume_error(),
        rlp::DecodeError::InputTooLong);
}

TEST(TransactionSigner, signer_failure_is_propagated)
{
    KeccakHasher const hasher;

    ScriptedSigner cancelled{
        []() -> Result<Signature> { return SignerError::Cancelled; }};
    EXPECT_EQ(
        sign_transaction(eip155_request(), hasher, cancelled).assume_error(),
        SignerError::Cancelled);
    EXPECT_EQ(cancelled.calls, 1);

    ScriptedSigner timeout{
        []() -> Result<Signature> { return SignerError::Timeout; }};
    EXPECT_EQ(
        sign_transaction_raw(eip155_request(), hasher, timeout).assume_error(),
        SignerError::Timeout);
    EXPECT_EQ(timeout.calls, 1);
}

TEST(TransactionSigner, invalid_signature_rejected)
{
    KeccakHasher const hasher;

    ScriptedSigner bad_parity{[]() -> Result<Signature> {
        return Signature{.r = 1, .s = 1, .y_parity = 2};
    }};
    EXPECT_EQ(
        sign_transaction(eip155_request(), hasher, bad_parity).assume_error(),
        SignerError::InvalidRecoveryId);
    EXPECT_EQ(bad_parity.calls, 1);

    ScriptedSigner zero_r{[]() -> Result<Signature> {
        return Signature{.r = 0, .s = 1, .y_parity = 0};
    }};
    EXPECT_EQ(
        sign_transaction(eip155_request(), hasher, zero_r).assume_error(),
        SignerError::InvalidSignature);
}

TEST(TransactionSigner, request_errors_skip_signer)
{
    KeccakHasher const hasher;
    ScriptedSigner signer{
        []() -> Result<Signature> { return SignerError::Rejected; }};

    auto req = eip155_request();
    req.chain_id.reset();
    EXPECT_EQ(
        sign_transaction(req, hasher, signer).assume_error(),
        TransactionError::MissingChainId);

    req = eip155_request();
    req.type = 9;
    EXPECT_EQ(
        sign_transaction_raw(req, hasher, signer).assume_error(),
        TransactionError::UnsupportedTransactionType);

    EXPECT_EQ(signer.calls, 0);
}
