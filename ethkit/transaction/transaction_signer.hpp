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

#include <ethkit/core/address.hpp>
#include <ethkit/core/byte_string.hpp>
#include <ethkit/core/bytes.hpp>
#include <ethkit/core/config.hpp>
#include <ethkit/core/result.hpp>
#include <ethkit/crypto/hasher.hpp>
#include <ethkit/crypto/signer.hpp>
#include <ethkit/transaction/transaction.hpp>

ETHKIT_NAMESPACE_BEGIN

/// keccak of the signing preimage
Result<bytes32_t> signing_hash(Hasher const &, Transaction const &);

/// Asks `signer` once for a signature over the signing hash. The signature
/// must carry a recovery id of 0 or 1 and non-zero r and s.
Result<SignedTransaction>
sign_transaction(Transaction const &, Hasher const &, Signer &);

Result<SignedTransaction>
sign_transaction(TransactionRequest const &, Hasher const &, Signer &);

/// Signed envelope bytes, ready for broadcast
Result<byte_string>
sign_transaction_raw(Transaction const &, Hasher const &, Signer &);

Result<byte_string>
sign_transaction_raw(TransactionRequest const &, Hasher const &, Signer &);

/// keccak of the signed envelope
Result<bytes32_t> transaction_hash(Hasher const &, SignedTransaction const &);

/// Parses exactly one envelope; trailing bytes are an error
Result<SignedTransaction> decode_transaction(byte_string_view);

Result<Address> recover_sender(Hasher const &, SignedTransaction const &);

ETHKIT_NAMESPACE_END
