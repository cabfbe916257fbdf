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
#include <ethkit/core/bytes.hpp>
#include <ethkit/core/config.hpp>
#include <ethkit/core/likely.h>
#include <ethkit/core/result.hpp>
#include <ethkit/crypto/hasher.hpp>
#include <ethkit/crypto/signer.hpp>
#include <ethkit/crypto/signer_error.hpp>
#include <ethkit/transaction/message.hpp>

#include <quill/Quill.h>

#include <string>
#include <string_view>
#include <utility>

ETHKIT_ANONYMOUS_NAMESPACE_BEGIN

constexpr std::string_view MESSAGE_PREFIX = "\x19"
                                            "Ethereum Signed Message:\n";

ETHKIT_ANONYMOUS_NAMESPACE_END

ETHKIT_NAMESPACE_BEGIN

bytes32_t
personal_message_hash(Hasher const &hasher, byte_string_view const message)
{
    auto const length = std::to_string(message.size());
    byte_string preimage;
    preimage.reserve(MESSAGE_PREFIX.size() + length.size() + message.size());
    preimage += to_byte_string_view(MESSAGE_PREFIX);
    preimage += to_byte_string_view(length);
    preimage += message;
    return hasher.keccak256(preimage);
}

Result<byte_string> sign_personal_message(
    byte_string_view const message, Hasher const &hasher, Signer &signer)
{
    auto sig = signer.sign(personal_message_hash(hasher, message));
    if (ETHKIT_UNLIKELY(sig.has_error())) {
        LOG_WARNING(
            "message signing failed: {}", sig.error().message().c_str());
        return std::move(sig).error();
    }
    auto const &value = sig.value();
    if (ETHKIT_UNLIKELY(value.y_parity > 1)) {
        return SignerError::InvalidRecoveryId;
    }

    byte_string result;
    result.reserve(65);
    result += to_bytes_be(value.r);
    result += to_bytes_be(value.s);
    result.push_back(static_cast<unsigned char>(27 + value.y_parity));
    return result;
}

ETHKIT_NAMESPACE_END
