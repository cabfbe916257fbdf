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

#include <ethkit/abi/abi_signatures.hpp>
#include <ethkit/abi/abi_type.hpp>
#include <ethkit/core/byte_string.hpp>
#include <ethkit/core/bytes.hpp>
#include <ethkit/core/config.hpp>
#include <ethkit/crypto/hasher.hpp>

#include <cstdint>
#include <string_view>
#include <vector>

ETHKIT_NAMESPACE_BEGIN

uint32_t abi_selector(Hasher const &hasher, std::string_view const signature)
{
    auto const h = hasher.keccak256(to_byte_string_view(signature));
    return selector_from_bytes({h.bytes, 4});
}

bytes32_t abi_topic(Hasher const &hasher, std::string_view const signature)
{
    return hasher.keccak256(to_byte_string_view(signature));
}

uint32_t abi_selector(
    Hasher const &hasher, std::string_view const name,
    std::vector<AbiType> const &inputs)
{
    return abi_selector(hasher, canonical_signature(name, inputs));
}

bytes32_t abi_topic(
    Hasher const &hasher, std::string_view const name,
    std::vector<AbiType> const &inputs)
{
    return abi_topic(hasher, canonical_signature(name, inputs));
}

ETHKIT_NAMESPACE_END
