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

#include <ethkit/core/cases.hpp>
#include <ethkit/core/config.hpp>
#include <ethkit/core/int.hpp>
#include <ethkit/core/likely.h>
#include <ethkit/core/result.hpp>
#include <ethkit/transaction/transaction.hpp>
#include <ethkit/transaction/transaction_error.hpp>

#include <boost/outcome/try.hpp>

#include <optional>
#include <utility>
#include <variant>

ETHKIT_ANONYMOUS_NAMESPACE_BEGIN

bool has_fee_market(TransactionRequest const &req)
{
    return req.max_fee_per_gas.has_value() ||
           req.max_priority_fee_per_gas.has_value();
}

bool has_blob(TransactionRequest const &req)
{
    return req.max_fee_per_blob_gas.has_value() ||
           req.blob_versioned_hashes.has_value();
}

// Whether every populated field of `req` has a place in `type`
bool fits(TransactionRequest const &req, TransactionType const type)
{
    bool const gas_price = req.gas_price.has_value();
    bool const fee_market = has_fee_market(req);
    bool const access_list = req.access_list.has_value();
    bool const blob = has_blob(req);
    bool const authorization = req.authorization_list.has_value();

    switch (type) {
    case TransactionType::legacy:
        return !fee_market && !access_list && !blob && !authorization;
    case TransactionType::eip2930:
        return !fee_market && !blob && !authorization;
    case TransactionType::eip1559:
        return !gas_price && !blob && !authorization;
    case TransactionType::eip4844:
        return !gas_price && !authorization;
    case TransactionType::eip7702:
        return !gas_price && !blob;
    case TransactionType::LAST:
        break;
    }
    return false;
}

template <class T>
T fee_market_fields(TransactionRequest const &req)
{
    T tx;
    tx.chain_id = *req.chain_id;
    tx.nonce = req.nonce.value_or(0);
    tx.max_priority_fee_per_gas = req.max_priority_fee_per_gas.value_or(0);
    tx.max_fee_per_gas = req.max_fee_per_gas.value_or(0);
    tx.gas_limit = req.gas_limit.value_or(0);
    tx.value = req.value.value_or(0);
    tx.data = req.data.value_or(byte_string{});
    tx.access_list = req.access_list.value_or(AccessList{});
    return tx;
}

ETHKIT_ANONYMOUS_NAMESPACE_END

ETHKIT_NAMESPACE_BEGIN

TransactionType get_type(Transaction const &tx) noexcept
{
    return std::visit(
        Cases{
            [](LegacyTransaction const &) { return TransactionType::legacy; },
            [](Eip2930Transaction const &) {
                return TransactionType::eip2930;
            },
            [](Eip1559Transaction const &) {
                return TransactionType::eip1559;
            },
            [](Eip4844Transaction const &) {
                return TransactionType::eip4844;
            },
            [](Eip7702Transaction const &) {
                return TransactionType::eip7702;
            }},
        tx);
}

std::optional<uint256_t> get_chain_id(Transaction const &tx) noexcept
{
    return std::visit(
        [](auto const &t) -> std::optional<uint256_t> { return t.chain_id; },
        tx);
}

Result<TransactionType> infer_transaction_type(TransactionRequest const &req)
{
    if (req.type.has_value()) {
        if (ETHKIT_UNLIKELY(
                *req.type >= static_cast<uint8_t>(TransactionType::LAST))) {
            return TransactionError::UnsupportedTransactionType;
        }
        auto const type = static_cast<TransactionType>(*req.type);
        if (ETHKIT_UNLIKELY(!fits(req, type))) {
            return TransactionError::ConflictingFields;
        }
        return type;
    }

    bool const blob = has_blob(req);
    bool const authorization = req.authorization_list.has_value();
    bool const fee_market = has_fee_market(req);
    if (ETHKIT_UNLIKELY(blob && authorization)) {
        return TransactionError::ConflictingFields;
    }
    if (ETHKIT_UNLIKELY(
            req.gas_price.has_value() &&
            (fee_market || blob || authorization))) {
        return TransactionError::ConflictingFields;
    }

    if (blob) {
        return TransactionType::eip4844;
    }
    if (authorization) {
        return TransactionType::eip7702;
    }
    if (fee_market) {
        return TransactionType::eip1559;
    }
    if (req.access_list.has_value()) {
        return TransactionType::eip2930;
    }
    return TransactionType::legacy;
}

Result<Transaction> resolve_transaction(TransactionRequest const &req)
{
    BOOST_OUTCOME_TRY(auto const type, infer_transaction_type(req));

    if (ETHKIT_UNLIKELY(!req.chain_id.has_value())) {
        return TransactionError::MissingChainId;
    }
    if (ETHKIT_UNLIKELY(
            (type == TransactionType::eip4844 ||
             type == TransactionType::eip7702) &&
            !req.to.has_value())) {
        return TransactionError::MissingRecipient;
    }

    switch (type) {
    case TransactionType::legacy:
        return Transaction{LegacyTransaction{
            .chain_id = req.chain_id,
            .nonce = req.nonce.value_or(0),
            .gas_price = req.gas_price.value_or(0),
            .gas_limit = req.gas_limit.value_or(0),
            .to = req.to,
            .value = req.value.value_or(0),
            .data = req.data.value_or(byte_string{})}};
    case TransactionType::eip2930:
        return Transaction{Eip2930Transaction{
            .chain_id = *req.chain_id,
            .nonce = req.nonce.value_or(0),
            .gas_price = req.gas_price.value_or(0),
            .gas_limit = req.gas_limit.value_or(0),
            .to = req.to,
            .value = req.value.value_or(0),
            .data = req.data.value_or(byte_string{}),
            .access_list = req.access_list.value_or(AccessList{})}};
    case TransactionType::eip1559: {
        auto tx = fee_market_fields<Eip1559Transaction>(req);
        tx.to = req.to;
        return Transaction{std::move(tx)};
    }
    case TransactionType::eip4844: {
        auto tx = fee_market_fields<Eip4844Transaction>(req);
        tx.to = *req.to;
        tx.max_fee_per_blob_gas = req.max_fee_per_blob_gas.value_or(0);
        tx.blob_versioned_hashes =
            req.blob_versioned_hashes.value_or(std::vector<bytes32_t>{});
        return Transaction{std::move(tx)};
    }
    case TransactionType::eip7702: {
        auto tx = fee_market_fields<Eip7702Transaction>(req);
        tx.to = *req.to;
        tx.authorization_list =
            req.authorization_list.value_or(AuthorizationList{});
        return Transaction{std::move(tx)};
    }
    case TransactionType::LAST:
        break;
    }
    return TransactionError::UnsupportedTransactionType;
}

ETHKIT_NAMESPACE_END
