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

#include <ethkit/core/config.hpp>

#include <ethkit/core/address.hpp>
#include <ethkit/core/byte_string.hpp>
#include <ethkit/core/bytes.hpp>
#include <ethkit/core/int.hpp>
#include <ethkit/core/result.hpp>
#include <ethkit/transaction/authorization.hpp>
#include <ethkit/transaction/signature.hpp>

#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

ETHKIT_NAMESPACE_BEGIN

enum class TransactionType : uint8_t
{
    legacy = 0,
    eip2930,
    eip1559,
    eip4844,
    eip7702,
    LAST,
};

struct AccessEntry
{
    Address a{};
    std::vector<bytes32_t> keys{};

    friend bool operator==(AccessEntry const &, AccessEntry const &) = default;
};

static_assert(sizeof(AccessEntry) == 48);
static_assert(alignof(AccessEntry) == 8);

using AccessList = std::vector<AccessEntry>;

/// Without a chain id this is a pre EIP-155 transaction, signed with
/// v = 27 / 28
struct LegacyTransaction
{
    std::optional<uint256_t> chain_id{};
    uint64_t nonce{};
    uint256_t gas_price{};
    uint64_t gas_limit{};
    std::optional<Address> to{};
    uint256_t value{};
    byte_string data{};

    friend bool
    operator==(LegacyTransaction const &, LegacyTransaction const &) = default;
};

struct Eip2930Transaction
{
    uint256_t chain_id{};
    uint64_t nonce{};
    uint256_t gas_price{};
    uint64_t gas_limit{};
    std::optional<Address> to{};
    uint256_t value{};
    byte_string data{};
    AccessList access_list{};

    friend bool operator==(
        Eip2930Transaction const &, Eip2930Transaction const &) = default;
};

struct Eip1559Transaction
{
    uint256_t chain_id{};
    uint64_t nonce{};
    uint256_t max_priority_fee_per_gas{};
    uint256_t max_fee_per_gas{};
    uint64_t gas_limit{};
    std::optional<Address> to{};
    uint256_t value{};
    byte_string data{};
    AccessList access_list{};

    friend bool operator==(
        Eip1559Transaction const &, Eip1559Transaction const &) = default;
};

/// Blob transaction; cannot create contracts
struct Eip4844Transaction
{
    uint256_t chain_id{};
    uint64_t nonce{};
    uint256_t max_priority_fee_per_gas{};
    uint256_t max_fee_per_gas{};
    uint64_t gas_limit{};
    Address to{};
    uint256_t value{};
    byte_string data{};
    AccessList access_list{};
    uint256_t max_fee_per_blob_gas{};
    std::vector<bytes32_t> blob_versioned_hashes{};

    friend bool operator==(
        Eip4844Transaction const &, Eip4844Transaction const &) = default;
};

/// Set code transaction; cannot create contracts
struct Eip7702Transaction
{
    uint256_t chain_id{};
    uint64_t nonce{};
    uint256_t max_priority_fee_per_gas{};
    uint256_t max_fee_per_gas{};
    uint64_t gas_limit{};
    Address to{};
    uint256_t value{};
    byte_string data{};
    AccessList access_list{};
    AuthorizationList authorization_list{};

    friend bool operator==(
        Eip7702Transaction const &, Eip7702Transaction const &) = default;
};

using Transaction = std::variant<
    LegacyTransaction, Eip2930Transaction, Eip1559Transaction,
    Eip4844Transaction, Eip7702Transaction>;

TransactionType get_type(Transaction const &) noexcept;

std::optional<uint256_t> get_chain_id(Transaction const &) noexcept;

struct SignedTransaction
{
    Transaction transaction{};
    SignatureAndChain sc{};

    friend bool
    operator==(SignedTransaction const &, SignedTransaction const &) = default;
};

/// Loosely specified transaction. Copy it and change fields to amend it;
/// `resolve_transaction` picks exactly one concrete shape.
struct TransactionRequest
{
    // raw type byte, so unsupported types can be reported
    std::optional<uint8_t> type{};
    std::optional<uint256_t> chain_id{};
    std::optional<uint64_t> nonce{};
    std::optional<Address> to{};
    std::optional<uint256_t> value{};
    std::optional<byte_string> data{};
    std::optional<uint64_t> gas_limit{};
    std::optional<uint256_t> gas_price{};
    std::optional<uint256_t> max_fee_per_gas{};
    std::optional<uint256_t> max_priority_fee_per_gas{};
    std::optional<AccessList> access_list{};
    std::optional<uint256_t> max_fee_per_blob_gas{};
    std::optional<std::vector<bytes32_t>> blob_versioned_hashes{};
    std::optional<AuthorizationList> authorization_list{};

    friend bool operator==(
        TransactionRequest const &, TransactionRequest const &) = default;
};

/// Shape the request resolves to, without building it
Result<TransactionType> infer_transaction_type(TransactionRequest const &);

Result<Transaction> resolve_transaction(TransactionRequest const &);

ETHKIT_NAMESPACE_END
