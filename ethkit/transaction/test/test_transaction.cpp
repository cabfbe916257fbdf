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
#include <ethkit/transaction/authorization.hpp>
#include <ethkit/transaction/signature.hpp>
#include <ethkit/transaction/transaction.hpp>
#include <ethkit/transaction/transaction_error.hpp>

#include <evmc/evmc.hpp>

#include <gtest/gtest.h>

#include <variant>
#include <vector>

using namespace ethkit;
using namespace evmc::literals;

namespace
{
    constexpr auto to_addr = 0x3535353535353535353535353535353535353535_address;
    constexpr auto blob_hash =
        0x01a915e4d060149eb4365960e6a7a45f334393093061116b197e3240065ff2d8_bytes32;

    TransactionRequest base_request()
    {
        return TransactionRequest{.chain_id = 1, .nonce = 7, .to = to_addr};
    }
}

TEST(Signature, get_v)
{
    // Legacy - no chain id
    EXPECT_EQ(get_v({.y_parity = 0}), 27);
    EXPECT_EQ(get_v({.y_parity = 1}), 28);
    // EIP-155
    EXPECT_EQ(get_v({.chain_id = 1, .y_parity = 0}), 37);
    EXPECT_EQ(get_v({.chain_id = 1, .y_parity = 1}), 38);
    EXPECT_EQ(get_v({.chain_id = 5, .y_parity = 0}), 45);
    EXPECT_EQ(get_v({.chain_id = 5, .y_parity = 1}), 46);
}

TEST(Signature, from_v)
{
    // Legacy - no chain id
    {
        SignatureAndChain sc{};
        EXPECT_TRUE(sc.from_v(27));
        EXPECT_EQ(sc.y_parity, 0);
        EXPECT_FALSE(sc.chain_id.has_value());
        EXPECT_TRUE(sc.from_v(28));
        EXPECT_EQ(sc.y_parity, 1);
    }

    // EIP-155
    {
        SignatureAndChain sc{};
        EXPECT_TRUE(sc.from_v(37));
        EXPECT_EQ(sc.chain_id, 1);
        EXPECT_EQ(sc.y_parity, 0);
        EXPECT_TRUE(sc.from_v(38));
        EXPECT_EQ(sc.chain_id, 1);
        EXPECT_EQ(sc.y_parity, 1);
    }
    {
        SignatureAndChain sc{};
        EXPECT_TRUE(sc.from_v(45));
        EXPECT_EQ(sc.chain_id, 5);
        EXPECT_EQ(sc.y_parity, 0);
    }

    {
        SignatureAndChain sc{};
        EXPECT_FALSE(sc.from_v(0));
        EXPECT_FALSE(sc.from_v(29));
        EXPECT_FALSE(sc.from_v(34));
    }
}

TEST(Transaction, infer_type)
{
    auto req = base_request();
    EXPECT_EQ(infer_transaction_type(req).value(), TransactionType::legacy);

    req.gas_price = 1;
    EXPECT_EQ(infer_transaction_type(req).value(), TransactionType::legacy);

    req.access_list = AccessList{};
    EXPECT_EQ(infer_transaction_type(req).value(), TransactionType::eip2930);

    req = base_request();
    req.max_fee_per_gas = 10;
    EXPECT_EQ(infer_transaction_type(req).value(), TransactionType::eip1559);

    req.access_list = AccessList{};
    EXPECT_EQ(infer_transaction_type(req).value(), TransactionType::eip1559);

    req = base_request();
    req.max_priority_fee_per_gas = 1;
    EXPECT_EQ(infer_transaction_type(req).value(), TransactionType::eip1559);

    req = base_request();
    req.blob_versioned_hashes = std::vector{blob_hash};
    EXPECT_EQ(infer_transaction_type(req).value(), TransactionType::eip4844);

    req = base_request();
    req.max_fee_per_blob_gas = 1;
    EXPECT_EQ(infer_transaction_type(req).value(), TransactionType::eip4844);

    req = base_request();
    req.authorization_list = AuthorizationList{};
    EXPECT_EQ(infer_transaction_type(req).value(), TransactionType::eip7702);
}

TEST(Transaction, explicit_type_wins)
{
    auto req = base_request();
    req.type = 2;
    EXPECT_EQ(infer_transaction_type(req).value(), TransactionType::eip1559);

    req.type = 1;
    req.gas_price = 5;
    auto const tx = resolve_transaction(req);
    ASSERT_FALSE(tx.has_error());
    auto const &t = std::get<Eip2930Transaction>(tx.value());
    EXPECT_EQ(t.gas_price, 5);
    EXPECT_TRUE(t.access_list.empty());
}

TEST(Transaction, unsupported_type)
{
    auto req = base_request();
    req.type = 5;
    EXPECT_EQ(
        resolve_transaction(req).assume_error(),
        TransactionError::UnsupportedTransactionType);
    req.type = 0x7f;
    EXPECT_EQ(
        infer_transaction_type(req).assume_error(),
        TransactionError::UnsupportedTransactionType);
}

TEST(Transaction, conflicting_fields)
{
    {
        auto req = base_request();
        req.gas_price = 1;
        req.max_fee_per_gas = 2;
        EXPECT_EQ(
            resolve_transaction(req).assume_error(),
            TransactionError::ConflictingFields);
    }
    {
        auto req = base_request();
        req.blob_versioned_hashes = std::vector{blob_hash};
        req.authorization_list = AuthorizationList{};
        EXPECT_EQ(
            resolve_transaction(req).assume_error(),
            TransactionError::ConflictingFields);
    }
    {
        auto req = base_request();
        req.gas_price = 1;
        req.authorization_list = AuthorizationList{};
        EXPECT_EQ(
            resolve_transaction(req).assume_error(),
            TransactionError::ConflictingFields);
    }
    {
        // explicit legacy cannot carry an access list
        auto req = base_request();
        req.type = 0;
        req.access_list = AccessList{};
        EXPECT_EQ(
            resolve_transaction(req).assume_error(),
            TransactionError::ConflictingFields);
    }
    {
        auto req = base_request();
        req.type = 2;
        req.gas_price = 1;
        EXPECT_EQ(
            resolve_transaction(req).assume_error(),
            TransactionError::ConflictingFields);
    }
}

TEST(Transaction, missing_fields)
{
    {
        auto req = base_request();
        req.chain_id.reset();
        EXPECT_EQ(
            resolve_transaction(req).assume_error(),
            TransactionError::MissingChainId);
    }
    {
        auto req = base_request();
        req.to.reset();
        req.max_fee_per_blob_gas = 1;
        EXPECT_EQ(
            resolve_transaction(req).assume_error(),
            TransactionError::MissingRecipient);
    }
    {
        auto req = base_request();
        req.to.reset();
        req.authorization_list = AuthorizationList{};
        EXPECT_EQ(
            resolve_transaction(req).assume_error(),
            TransactionError::MissingRecipient);
    }
    {
        // contract creation
        auto req = base_request();
        req.to.reset();
        req.max_fee_per_gas = 1;
        auto const tx = resolve_transaction(req);
        ASSERT_FALSE(tx.has_error());
        EXPECT_FALSE(std::get<Eip1559Transaction>(tx.value()).to.has_value());
    }
}

TEST(Transaction, resolve_defaults)
{
    TransactionRequest const req{.chain_id = 10};
    auto const tx = resolve_transaction(req);
    ASSERT_FALSE(tx.has_error());
    EXPECT_EQ(get_type(tx.value()), TransactionType::legacy);
    EXPECT_EQ(get_chain_id(tx.value()), 10);
    auto const &t = std::get<LegacyTransaction>(tx.value());
    EXPECT_EQ(t.nonce, 0);
    EXPECT_EQ(t.gas_price, 0);
    EXPECT_EQ(t.gas_limit, 0);
    EXPECT_EQ(t.value, 0);
    EXPECT_TRUE(t.data.empty());
    EXPECT_FALSE(t.to.has_value());
}

TEST(Transaction, resolve_blob)
{
    auto req = base_request();
    req.max_fee_per_gas = 30;
    req.max_priority_fee_per_gas = 2;
    req.max_fee_per_blob_gas = 3;
    req.blob_versioned_hashes = std::vector{blob_hash};
    req.data = byte_string{0x01};

    auto const tx = resolve_transaction(req);
    ASSERT_FALSE(tx.has_error());
    auto const &t = std::get<Eip4844Transaction>(tx.value());
    EXPECT_EQ(t.chain_id, 1);
    EXPECT_EQ(t.nonce, 7);
    EXPECT_EQ(t.to, to_addr);
    EXPECT_EQ(t.max_fee_per_gas, 30);
    EXPECT_EQ(t.max_priority_fee_per_gas, 2);
    EXPECT_EQ(t.max_fee_per_blob_gas, 3);
    ASSERT_EQ(t.blob_versioned_hashes.size(), 1);
    EXPECT_EQ(t.blob_versioned_hashes[0], blob_hash);
    EXPECT_EQ(t.data, byte_string{0x01});
}

TEST(Transaction, resolve_set_code)
{
    auto req = base_request();
    req.authorization_list = AuthorizationList{Authorization{
        .chain_id = 0,
        .address = 0x000000000000000000000000000000000000aaaa_address,
        .nonce = 1}};

    auto const tx = resolve_transaction(req);
    ASSERT_FALSE(tx.has_error());
    auto const &t = std::get<Eip7702Transaction>(tx.value());
    ASSERT_EQ(t.authorization_list.size(), 1);
    EXPECT_EQ(t.authorization_list[0].nonce, 1);
    EXPECT_FALSE(t.authorization_list[0].is_signed());
}
