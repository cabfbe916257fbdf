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
#include <ethkit/core/bytes.hpp>
#include <ethkit/core/config.hpp>
#include <ethkit/core/result.hpp>
#include <ethkit/crypto/hasher.hpp>
#include <ethkit/crypto/signer.hpp>

ETHKIT_NAMESPACE_BEGIN

/// EIP-191 version 0x45:
/// keccak("\x19Ethereum Signed Message:\n" || len(message) || message)
bytes32_t personal_message_hash(Hasher const &, byte_string_view message);

/// 65 bytes: r || s || v with v = 27 + recovery id
Result<byte_string> sign_personal_message(
    byte_string_view message, Hasher const &, Signer &);

ETHKIT_NAMESPACE_END
