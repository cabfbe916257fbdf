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

#include <ethkit/abi/abi_item.hpp>
#include <ethkit/abi/abi_type.hpp>
#include <ethkit/core/config.hpp>

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

ETHKIT_ANONYMOUS_NAMESPACE_BEGIN

template <class T>
T const *find_by_name(std::vector<T> const &items, std::string_view const name)
{
    auto const it = std::ranges::find_if(
        items, [&](T const &item) { return item.name == name; });
    return it == items.end() ? nullptr : &*it;
}

ETHKIT_ANONYMOUS_NAMESPACE_END

ETHKIT_NAMESPACE_BEGIN

std::string_view to_string(StateMutability const m) noexcept
{
    switch (m) {
    case StateMutability::pure:
        return "pure";
    case StateMutability::view:
        return "view";
    case StateMutability::nonpayable:
        return "nonpayable";
    case StateMutability::payable:
        return "payable";
    }
    return "unknown";
}

std::optional<StateMutability>
parse_state_mutability(std::string_view const s)
{
    for (auto const m :
         {StateMutability::pure,
          StateMutability::view,
          StateMutability::nonpayable,
          StateMutability::payable}) {
        if (to_string(m) == s) {
            return m;
        }
    }
    return std::nullopt;
}

std::vector<AbiType> param_types(std::vector<AbiParam> const &params)
{
    std::vector<AbiType> types;
    types.reserve(params.size());
    for (auto const &p : params) {
        types.push_back(p.type);
    }
    return types;
}

std::string AbiFunction::signature() const
{
    return canonical_signature(name, param_types(inputs));
}

std::string AbiEvent::signature() const
{
    return canonical_signature(name, param_types(inputs));
}

std::string AbiError::signature() const
{
    return canonical_signature(name, param_types(inputs));
}

AbiFunction const *Abi::find_function(std::string_view const name) const
{
    return find_by_name(functions, name);
}

AbiFunction const *
Abi::find_function_by_signature(std::string_view const signature) const
{
    auto const it = std::ranges::find_if(functions, [&](AbiFunction const &f) {
        return f.signature() == signature;
    });
    return it == functions.end() ? nullptr : &*it;
}

AbiEvent const *Abi::find_event(std::string_view const name) const
{
    return find_by_name(events, name);
}

AbiError const *Abi::find_error(std::string_view const name) const
{
    return find_by_name(errors, name);
}

ETHKIT_NAMESPACE_END
