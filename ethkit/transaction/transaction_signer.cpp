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
#include <ethkit/core/fmt/bytes_fmt.hpp>
#include <ethkit/core/likely.h>
#include <ethkit/core/result.hpp>
#include <ethkit/crypto/hasher.hpp>
#include <ethkit/crypto/recover.hpp>
#include <ethkit/crypto/signer.hpp>
#include <ethkit/crypto/signer_error.hpp>
#include <ethkit/rlp/decode_error.hpp>
#include <ethkit/transaction/fmt/transaction_fmt.hpp>
#include <ethkit/transaction/rlp/transaction_rlp.hpp>
#include <ethkit/transaction/signature.hpp>
#include <ethkit/transaction/transaction.hpp>
#include <ethkit/transaction/transaction_signer.hpp>

#include <boost/outcome/try.hpp>
#include <quill/Quill.h>

#include <utility>

ETHKIT_NAMESPACE_BEGIN

Result<bytes32_t> signing_hash(Hasher const &hasher, Transaction const &txn)
{
    BOOST_OUTCOME_TRY(
        auto const preimage, rlp::encode_transaction_for_signing(txn));
    return hasher.keccak256(preimage);
}

Result<SignedTransaction> sign_transaction(
    Transaction const &txn, Hasher const &hasher, Signer &signer)
{
    BOOST_OUTCOME_TRY(auto const hash, signing_hash(hasher, txn));
    LOG_DEBUG("signing transaction type={} hash={}", get_type(txn), hash);

    auto sig = signer.sign(hash);
    if (ETHKIT_UNLIKELY(sig.has_error())) {
        LOG_WARNING(
            "transaction signing failed type={} hash={} error={}",
            get_type(txn),
            hash,
            sig.error().message().c_str());
        return std::move(sig).error();
    }

    auto const &value = sig.value();
    if (ETHKIT_UNLIKELY(value.y_parity > 1)) {
        return SignerError::InvalidRecoveryId;
    }
    if (ETHKIT_UNLIKELY(value.r == 0 || value.s == 0)) {
        return SignerError::InvalidSignature;
    }

    return SignedTransaction{
        .transaction = txn, .sc = with_chain(value, get_chain_id(txn))};
}

Result<SignedTransaction> sign_transaction(
    TransactionRequest const &req, Hasher const &hasher, Signer &signer)
{
    BOOST_OUTCOME_TRY(auto const txn, resolve_transaction(req));
    return sign_transaction(txn, hasher, signer);
}

Result<byte_string> sign_transaction_raw(
    Transaction const &txn, Hasher const &hasher, Signer &signer)
{
    BOOST_OUTCOME_TRY(
        auto const signed_txn, sign_transaction(txn, hasher, signer));
    return rlp::encode_transaction(signed_txn);
}

Result<byte_string> sign_transaction_raw(
    TransactionRequest const &req, Hasher const &hasher, Signer &signer)
{
    BOOST_OUTCOME_TRY(auto const txn, resolve_transaction(req));
    return sign_transaction_raw(txn, hasher, signer);
}

Result<bytes32_t>
transaction_hash(Hasher const &hasher, SignedTransaction const &signed_txn)
{
    BOOST_OUTCOME_TRY(auto const envelope, rlp::encode_transaction(signed_txn));
    return hasher.keccak256(envelope);
}

Result<SignedTransaction> decode_transaction(byte_string_view enc)
{
    BOOST_OUTCOME_TRY(auto signed_txn, rlp::decode_transaction(enc));
    if (ETHKIT_UNLIKELY(!enc.empty())) {
        return rlp::DecodeError::InputTooLong;
    }
    return signed_txn;
}

Result<Address>
recover_sender(Hasher const &hasher, SignedTransaction const &signed_txn)
{
    BOOST_OUTCOME_TRY(
        auto const hash, signing_hash(hasher, signed_txn.transaction));
    return recover_address(hash, signed_txn.sc.signature());
}

ETHKIT_NAMESPACE_END
