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
#include <ethkit/transaction/transaction.hpp>

#include <quill/Quill.h>
#include <quill/bundled/fmt/format.h>

#include <string_view>

template <>
struct quill::copy_loggable<ethkit::TransactionType> : std::true_type
{
};

template <>
struct fmt::formatter<ethkit::TransactionType> : public ethkit::BasicFormatter
{
    template <typename FormatContext>
    auto format(ethkit::TransactionType const &value, FormatContext &ctx) const
    {
        std::string_view name = "unknown";
        switch (value) {
        case ethkit::TransactionType::legacy:
            name = "legacy";
            break;
        case ethkit::TransactionType::eip2930:
            name = "eip2930";
            break;
        case ethkit::TransactionType::eip1559:
            name = "eip1559";
            break;
        case ethkit::TransactionType::eip4844:
            name = "eip4844";
            break;
        case ethkit::TransactionType::eip7702:
            name = "eip7702";
            break;
        case ethkit::TransactionType::LAST:
            break;
        }
        fmt::format_to(ctx.out(), "{}", name);
        return ctx.out();
    }
};
