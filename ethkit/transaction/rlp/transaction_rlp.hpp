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

#include <ethkit/core/byte_string.hpp>
#include <ethkit/core/result.hpp>
#include <ethkit/rlp/config.hpp>
#include <ethkit/transaction/authorization.hpp>
#include <ethkit/transaction/signature.hpp>
#include <ethkit/transaction/transaction.hpp>

ETHKIT_RLP_NAMESPACE_BEGIN

byte_string encode_access_list(AccessList const &);

/// Entries are `[chain_id, address, nonce, y_parity, r, s]`; every entry
/// must be signed
Result<byte_string> encode_authorization_list(AuthorizationList const &);

/// Preimage whose keccak is signed
Result<byte_string> encode_transaction_for_signing(Transaction const &);

/// Signed envelope: a bare list for legacy transactions, the type byte
/// followed by the list otherwise
Result<byte_string> encode_transaction(SignedTransaction const &);

Result<SignatureAndChain> decode_sc(byte_string_view &);
Result<AccessList> decode_access_list(byte_string_view &);
Result<AuthorizationList> decode_authorization_list(byte_string_view &);

/// Consumes one envelope from the front of `enc`
Result<SignedTransaction> decode_transaction(byte_string_view &enc);

ETHKIT_RLP_NAMESPACE_END
