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

#include <memory>

struct secp256k1_context_struct;

ETHKIT_NAMESPACE_BEGIN

/// In-process signer over a raw secp256k1 secret. Nonces are RFC 6979, so
/// signatures are deterministic and low-s normalized.
class PrivateKeySigner final : public Signer
{
    struct ContextDeleter
    {
        void operator()(secp256k1_context_struct *) const noexcept;
    };

    std::unique_ptr<secp256k1_context_struct, ContextDeleter> context_;
    byte_string_fixed<32> secret_;
    Address address_;

    PrivateKeySigner() = default;

public:
    PrivateKeySigner(PrivateKeySigner &&) = default;
    PrivateKeySigner &operator=(PrivateKeySigner &&) = default;
    ~PrivateKeySigner() override;

    static Result<PrivateKeySigner> create(bytes32_t const &secret);

    Result<Signature> sign(bytes32_t const &hash) override;

    Address const &address() const noexcept
    {
        return address_;
    }
};

ETHKIT_NAMESPACE_END
