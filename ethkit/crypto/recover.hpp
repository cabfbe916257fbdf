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
#include <ethkit/crypto/signer.hpp>

ETHKIT_NAMESPACE_BEGIN

/// Address of a 64 byte uncompressed public key (without the 0x04 tag)
Address public_key_to_address(byte_string_view public_key);

/// Recovers the address that produced `sig` over `hash`
Result<Address> recover_address(bytes32_t const &hash, Signature const &sig);

ETHKIT_NAMESPACE_END
