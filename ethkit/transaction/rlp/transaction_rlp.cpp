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
#include <ethkit/core/cases.hpp>
#include <ethkit/core/int.hpp>
#include <ethkit/core/likely.h>
#include <ethkit/core/result.hpp>
#include <ethkit/crypto/signer.hpp>
#include <ethkit/rlp/address_rlp.hpp>
#include <ethkit/rlp/bytes_rlp.hpp>
#include <ethkit/rlp/config.hpp>
#include <ethkit/rlp/decode.hpp>
#include <ethkit/rlp/decode_error.hpp>
#include <ethkit/rlp/encode2.hpp>
#include <ethkit/rlp/int_rlp.hpp>
#include <ethkit/transaction/authorization.hpp>
#include <ethkit/transaction/rlp/transaction_rlp.hpp>
#include <ethkit/transaction/signature.hpp>
#include <ethkit/transaction/transaction.hpp>
#include <ethkit/transaction/transaction_error.hpp>

#include <boost/outcome/try.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

ETHKIT_RLP_ANONYMOUS_NAMESPACE_BEGIN

byte_string encode_blob_versioned_hashes(std::vector<bytes32_t> const &hashes)
{
    byte_string result;
    for (auto const &hash : hashes) {
        result += encode_bytes32(hash);
    }
    return encode_list2(result);
}

byte_string encode_legacy_base(LegacyTransaction const &txn)
{
    byte_string encoding{};

    encoding += encode_unsigned(txn.nonce);
    encoding += encode_unsigned(txn.gas_price);
    encoding += encode_unsigned(txn.gas_limit);
    encoding += encode_address(txn.to);
    encoding += encode_unsigned(txn.value);
    encoding += encode_string2(txn.data);

    return encoding;
}

// chain id through access list of the fee market shapes
template <class T>
byte_string encode_fee_market_base(T const &txn)
{
    byte_string encoding{};

    encoding += encode_unsigned(txn.chain_id);
    encoding += encode_unsigned(txn.nonce);
    encoding += encode_unsigned(txn.max_priority_fee_per_gas);
    encoding += encode_unsigned(txn.max_fee_per_gas);
    encoding += encode_unsigned(txn.gas_limit);
    encoding += encode_address(txn.to);
    encoding += encode_unsigned(txn.value);
    encoding += encode_string2(txn.data);
    encoding += encode_access_list(txn.access_list);

    return encoding;
}

// Fields of a typed transaction ahead of the signature
Result<byte_string> encode_eip2718_base(Transaction const &txn)
{
    return std::visit(
        Cases{
            [](LegacyTransaction const &) -> Result<byte_string> {
                return TransactionError::UnsupportedTransactionType;
            },
            [](Eip2930Transaction const &t) -> Result<byte_string> {
                byte_string encoding{};
                encoding += encode_unsigned(t.chain_id);
                encoding += encode_unsigned(t.nonce);
                encoding += encode_unsigned(t.gas_price);
                encoding += encode_unsigned(t.gas_limit);
                encoding += encode_address(t.to);
                encoding += encode_unsigned(t.value);
                encoding += encode_string2(t.data);
                encoding += encode_access_list(t.access_list);
                return encoding;
            },
            [](Eip1559Transaction const &t) -> Result<byte_string> {
                return encode_fee_market_base(t);
            },
            [](Eip4844Transaction const &t) -> Result<byte_string> {
                auto encoding = encode_fee_market_base(t);
                encoding += encode_unsigned(t.max_fee_per_blob_gas);
                encoding += encode_blob_versioned_hashes(
                    t.blob_versioned_hashes);
                return encoding;
            },
            [](Eip7702Transaction const &t) -> Result<byte_string> {
                auto encoding = encode_fee_market_base(t);
                BOOST_OUTCOME_TRY(
                    auto const auth_list,
                    encode_authorization_list(t.authorization_list));
                encoding += auth_list;
                return encoding;
            }},
        txn);
}

byte_string type_prefix(Transaction const &txn)
{
    return byte_string(1, static_cast<unsigned char>(get_type(txn)));
}

Result<std::vector<bytes32_t>> decode_access_entry_keys(byte_string_view &enc)
{
    std::vector<bytes32_t> keys;
    BOOST_OUTCOME_TRY(auto payload, parse_list_metadata(enc));
    constexpr size_t key_size = 33; // 1 byte for header, 32 bytes for byte32_t
    keys.reserve(payload.size() / key_size);

    while (payload.size() > 0) {
        BOOST_OUTCOME_TRY(auto key, decode_bytes32(payload));
        keys.emplace_back(std::move(key));
    }

    return keys;
}

Result<AccessEntry> decode_access_entry(byte_string_view &enc)
{
    AccessEntry access_entry;
    BOOST_OUTCOME_TRY(auto payload, parse_list_metadata(enc));
    BOOST_OUTCOME_TRY(access_entry.a, decode_address(payload));
    BOOST_OUTCOME_TRY(access_entry.keys, decode_access_entry_keys(payload));

    if (ETHKIT_UNLIKELY(!payload.empty())) {
        return DecodeError::InputTooLong;
    }

    return access_entry;
}

Result<Authorization> decode_authorization_entry(byte_string_view &enc)
{
    Authorization auth;
    Signature sig;
    BOOST_OUTCOME_TRY(auto payload, parse_list_metadata(enc));

    BOOST_OUTCOME_TRY(auth.chain_id, decode_unsigned<uint256_t>(payload));
    BOOST_OUTCOME_TRY(auth.address, decode_address(payload));
    BOOST_OUTCOME_TRY(auth.nonce, decode_unsigned<uint64_t>(payload));
    BOOST_OUTCOME_TRY(sig.y_parity, decode_unsigned<uint8_t>(payload));
    BOOST_OUTCOME_TRY(sig.r, decode_unsigned<uint256_t>(payload));
    BOOST_OUTCOME_TRY(sig.s, decode_unsigned<uint256_t>(payload));

    if (ETHKIT_UNLIKELY(!payload.empty())) {
        return DecodeError::InputTooLong;
    }

    auth.signature = sig;
    return auth;
}

Result<std::vector<bytes32_t>>
decode_blob_versioned_hashes(byte_string_view &enc)
{
    std::vector<bytes32_t> hashes;
    BOOST_OUTCOME_TRY(auto payload, parse_list_metadata(enc));
    while (!payload.empty()) {
        BOOST_OUTCOME_TRY(auto const hash, decode_bytes32(payload));
        hashes.emplace_back(hash);
    }
    return hashes;
}

// y_parity, r, s of a typed envelope
Result<SignatureAndChain> decode_typed_signature(
    byte_string_view &payload, uint256_t const &chain_id)
{
    SignatureAndChain sc;
    sc.chain_id = chain_id;
    BOOST_OUTCOME_TRY(sc.y_parity, decode_unsigned<uint8_t>(payload));
    if (ETHKIT_UNLIKELY(sc.y_parity > 1)) {
        return DecodeError::TypeUnexpected;
    }
    BOOST_OUTCOME_TRY(sc.r, decode_unsigned<uint256_t>(payload));
    BOOST_OUTCOME_TRY(sc.s, decode_unsigned<uint256_t>(payload));
    return sc;
}

template <class T>
Result<void> decode_fee_market_base(T &txn, byte_string_view &payload)
{
    BOOST_OUTCOME_TRY(txn.chain_id, decode_unsigned<uint256_t>(payload));
    BOOST_OUTCOME_TRY(txn.nonce, decode_unsigned<uint64_t>(payload));
    BOOST_OUTCOME_TRY(
        txn.max_priority_fee_per_gas, decode_unsigned<uint256_t>(payload));
    BOOST_OUTCOME_TRY(txn.max_fee_per_gas, decode_unsigned<uint256_t>(payload));
    BOOST_OUTCOME_TRY(txn.gas_limit, decode_unsigned<uint64_t>(payload));
    if constexpr (std::is_same_v<decltype(txn.to), Address>) {
        // blob and set code transactions cannot create contracts
        BOOST_OUTCOME_TRY(txn.to, decode_address(payload));
    }
    else {
        BOOST_OUTCOME_TRY(txn.to, decode_optional_address(payload));
    }
    BOOST_OUTCOME_TRY(txn.value, decode_unsigned<uint256_t>(payload));
    BOOST_OUTCOME_TRY(txn.data, decode_string(payload));
    BOOST_OUTCOME_TRY(txn.access_list, decode_access_list(payload));
    return outcome::success();
}

Result<SignedTransaction> decode_transaction_legacy(byte_string_view &enc)
{
    LegacyTransaction txn;
    SignatureAndChain sc;
    BOOST_OUTCOME_TRY(auto payload, parse_list_metadata(enc));

    BOOST_OUTCOME_TRY(txn.nonce, decode_unsigned<uint64_t>(payload));
    BOOST_OUTCOME_TRY(txn.gas_price, decode_unsigned<uint256_t>(payload));
    BOOST_OUTCOME_TRY(txn.gas_limit, decode_unsigned<uint64_t>(payload));
    BOOST_OUTCOME_TRY(txn.to, decode_optional_address(payload));
    BOOST_OUTCOME_TRY(txn.value, decode_unsigned<uint256_t>(payload));
    BOOST_OUTCOME_TRY(txn.data, decode_string(payload));
    BOOST_OUTCOME_TRY(sc, decode_sc(payload));
    BOOST_OUTCOME_TRY(sc.r, decode_unsigned<uint256_t>(payload));
    BOOST_OUTCOME_TRY(sc.s, decode_unsigned<uint256_t>(payload));

    if (ETHKIT_UNLIKELY(!payload.empty())) {
        return DecodeError::InputTooLong;
    }

    txn.chain_id = sc.chain_id;
    return SignedTransaction{.transaction = std::move(txn), .sc = sc};
}

Result<SignedTransaction> decode_transaction_eip2718(byte_string_view &enc)
{
    if (ETHKIT_UNLIKELY(
            enc[0] == static_cast<unsigned char>(TransactionType::legacy) ||
            enc[0] >= static_cast<unsigned char>(TransactionType::LAST))) {
        return DecodeError::InvalidTxnType;
    }
    auto const type = static_cast<TransactionType>(enc[0]);
    enc = enc.substr(1);
    BOOST_OUTCOME_TRY(auto payload, parse_list_metadata(enc));

    Transaction transaction;
    uint256_t chain_id{};
    switch (type) {
    case TransactionType::eip2930: {
        Eip2930Transaction txn;
        BOOST_OUTCOME_TRY(txn.chain_id, decode_unsigned<uint256_t>(payload));
        BOOST_OUTCOME_TRY(txn.nonce, decode_unsigned<uint64_t>(payload));
        BOOST_OUTCOME_TRY(txn.gas_price, decode_unsigned<uint256_t>(payload));
        BOOST_OUTCOME_TRY(txn.gas_limit, decode_unsigned<uint64_t>(payload));
        BOOST_OUTCOME_TRY(txn.to, decode_optional_address(payload));
        BOOST_OUTCOME_TRY(txn.value, decode_unsigned<uint256_t>(payload));
        BOOST_OUTCOME_TRY(txn.data, decode_string(payload));
        BOOST_OUTCOME_TRY(txn.access_list, decode_access_list(payload));
        chain_id = txn.chain_id;
        transaction = std::move(txn);
        break;
    }
    case TransactionType::eip1559: {
        Eip1559Transaction txn;
        BOOST_OUTCOME_TRY(decode_fee_market_base(txn, payload));
        chain_id = txn.chain_id;
        transaction = std::move(txn);
        break;
    }
    case TransactionType::eip4844: {
        Eip4844Transaction txn;
        BOOST_OUTCOME_TRY(decode_fee_market_base(txn, payload));
        BOOST_OUTCOME_TRY(
            txn.max_fee_per_blob_gas, decode_unsigned<uint256_t>(payload));
        BOOST_OUTCOME_TRY(
            txn.blob_versioned_hashes, decode_blob_versioned_hashes(payload));
        chain_id = txn.chain_id;
        transaction = std::move(txn);
        break;
    }
    case TransactionType::eip7702: {
        Eip7702Transaction txn;
        BOOST_OUTCOME_TRY(decode_fee_market_base(txn, payload));
        BOOST_OUTCOME_TRY(
            txn.authorization_list, decode_authorization_list(payload));
        chain_id = txn.chain_id;
        transaction = std::move(txn);
        break;
    }
    case TransactionType::legacy:
    case TransactionType::LAST:
        return DecodeError::InvalidTxnType;
    }

    BOOST_OUTCOME_TRY(auto const sc, decode_typed_signature(payload, chain_id));

    if (ETHKIT_UNLIKELY(!payload.empty())) {
        return DecodeError::InputTooLong;
    }

    return SignedTransaction{.transaction = std::move(transaction), .sc = sc};
}

ETHKIT_RLP_ANONYMOUS_NAMESPACE_END

ETHKIT_RLP_NAMESPACE_BEGIN

// Encode
byte_string encode_access_list(AccessList const &access_list)
{
    byte_string result;
    byte_string temp;
    for (auto const &[addr, keys] : access_list) {
        temp.clear();
        for (auto const &key : keys) {
            temp += encode_bytes32(key);
        }
        result += encode_list2(encode_address(addr) + encode_list2(temp));
    }

    return encode_list2(result);
}

Result<byte_string>
encode_authorization_list(AuthorizationList const &auth_list)
{
    byte_string result;

    for (auto const &auth : auth_list) {
        if (ETHKIT_UNLIKELY(!auth.signature.has_value())) {
            return TransactionError::UnsignedAuthorization;
        }
        result += encode_list2(
            encode_unsigned(auth.chain_id),
            encode_address(auth.address),
            encode_unsigned(auth.nonce),
            encode_unsigned(auth.signature->y_parity),
            encode_unsigned(auth.signature->r),
            encode_unsigned(auth.signature->s));
    }

    return encode_list2(result);
}

Result<byte_string> encode_transaction_for_signing(Transaction const &txn)
{
    if (auto const *const legacy = std::get_if<LegacyTransaction>(&txn)) {
        if (legacy->chain_id.has_value()) {
            return encode_list2(
                encode_legacy_base(*legacy),
                encode_unsigned(*legacy->chain_id),
                encode_unsigned(0u),
                encode_unsigned(0u));
        }
        return encode_list2(encode_legacy_base(*legacy));
    }

    BOOST_OUTCOME_TRY(auto const base, encode_eip2718_base(txn));
    return type_prefix(txn) + encode_list2(base);
}

Result<byte_string> encode_transaction(SignedTransaction const &signed_txn)
{
    auto const &txn = signed_txn.transaction;
    auto const &sc = signed_txn.sc;

    if (auto const *const legacy = std::get_if<LegacyTransaction>(&txn)) {
        auto const v = get_v(with_chain(sc.signature(), legacy->chain_id));
        return encode_list2(
            encode_legacy_base(*legacy),
            encode_unsigned(v),
            encode_unsigned(sc.r),
            encode_unsigned(sc.s));
    }

    BOOST_OUTCOME_TRY(auto const base, encode_eip2718_base(txn));
    return type_prefix(txn) + encode_list2(
                                  base,
                                  encode_unsigned(sc.y_parity),
                                  encode_unsigned(sc.r),
                                  encode_unsigned(sc.s));
}

// Decode
Result<SignatureAndChain> decode_sc(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto const v, decode_unsigned<uint256_t>(enc));

    SignatureAndChain sc;
    if (ETHKIT_UNLIKELY(!sc.from_v(v))) {
        return DecodeError::TypeUnexpected;
    }
    return sc;
}

Result<AccessList> decode_access_list(byte_string_view &enc)
{
    AccessList access_list;
    BOOST_OUTCOME_TRY(auto payload, parse_list_metadata(enc));
    constexpr size_t approx_num_keys = 10;
    // 20 bytes for address, 33 bytes per key
    constexpr size_t access_entry_size_approx = 20 + 33 * approx_num_keys;
    access_list.reserve(payload.size() / access_entry_size_approx);

    while (payload.size() > 0) {
        BOOST_OUTCOME_TRY(auto access_entry, decode_access_entry(payload));
        access_list.emplace_back(std::move(access_entry));
    }

    return access_list;
}

Result<AuthorizationList> decode_authorization_list(byte_string_view &enc)
{
    AuthorizationList auth_list;
    BOOST_OUTCOME_TRY(auto payload, parse_list_metadata(enc));

    while (payload.size() > 0) {
        BOOST_OUTCOME_TRY(auto auth, decode_authorization_entry(payload));
        auth_list.emplace_back(std::move(auth));
    }

    return auth_list;
}

Result<SignedTransaction> decode_transaction(byte_string_view &enc)
{
    if (ETHKIT_UNLIKELY(enc.empty())) {
        return DecodeError::InputTooShort;
    }

    if (enc[0] >= 0xc0) {
        return decode_transaction_legacy(enc);
    }
    return decode_transaction_eip2718(enc);
}

ETHKIT_RLP_NAMESPACE_END
