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

#include <ethkit/core/basic_formatter.hpp>
#include <ethkit/core/fmt/int_fmt.hpp>
#include <ethkit/transaction/signature.hpp>

#include <quill/Quill.h>
#include <quill/bundled/fmt/format.h>

#include <string>

template <>
struct quill::copy_loggable<ethkit::SignatureAndChain> : std::true_type
{
};

template <>
struct fmt::formatter<ethkit::SignatureAndChain>
    : public ethkit::BasicFormatter
{
    template <typename FormatContext>
    auto
    format(ethkit::SignatureAndChain const &value, FormatContext &ctx) const
    {
        fmt::format_to(
            ctx.out(),
            "SignatureAndChain{{r={} s={} chain_id={} y_parity={}}}",
            value.r,
            value.s,
            value.chain_id.has_value() ? intx::to_string(*value.chain_id)
                                       : std::string{"none"},
            value.y_parity);
        return ctx.out();
    }
};
