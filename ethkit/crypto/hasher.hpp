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

ETHKIT_NAMESPACE_BEGIN

/// Hash capability used for selectors, topics and signing preimages
class Hasher
{
public:
    virtual ~Hasher() = default;

    virtual bytes32_t keccak256(byte_string_view) const = 0;
};

class KeccakHasher final : public Hasher
{
public:
    bytes32_t keccak256(byte_string_view) const override;
};

ETHKIT_NAMESPACE_END
