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

#include <ethkit/abi/abi_type.hpp>
#include <ethkit/abi/abi_type_error.hpp>
#include <ethkit/core/assert.h>
#include <ethkit/core/config.hpp>
#include <ethkit/core/likely.h>
#include <ethkit/core/result.hpp>

#include <boost/outcome/try.hpp>

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

ETHKIT_ANONYMOUS_NAMESPACE_BEGIN

constexpr size_t WORD_SIZE = 32;

std::string_view trim(std::string_view s)
{
    auto const is_space = [](char const c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r';
    };
    while (!s.empty() && is_space(s.front())) {
        s.remove_prefix(1);
    }
    while (!s.empty() && is_space(s.back())) {
        s.remove_suffix(1);
    }
    return s;
}

// Strict decimal: no sign, no leading zeros
std::optional<size_t> parse_decimal(std::string_view const s)
{
    if (s.empty() || (s.size() > 1 && s[0] == '0')) {
        return std::nullopt;
    }
    size_t value = 0;
    auto const [ptr, ec] =
        std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return value;
}

// Splits at commas outside of any parentheses or brackets
Result<std::vector<std::string_view>> split_components(std::string_view const s)
{
    std::vector<std::string_view> parts;
    int depth = 0;
    size_t start = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        char const c = s[i];
        if (c == '(' || c == '[') {
            ++depth;
        }
        else if (c == ')' || c == ']') {
            if (ETHKIT_UNLIKELY(--depth < 0)) {
                return AbiTypeError::UnbalancedBrackets;
            }
        }
        else if (c == ',' && depth == 0) {
            parts.push_back(s.substr(start, i - start));
            start = i + 1;
        }
    }
    if (ETHKIT_UNLIKELY(depth != 0)) {
        return AbiTypeError::UnbalancedBrackets;
    }
    parts.push_back(s.substr(start));
    return parts;
}

Result<std::vector<AbiType>> parse_component_list(std::string_view inner)
{
    std::vector<AbiType> components;
    inner = trim(inner);
    if (inner.empty()) {
        return components;
    }
    BOOST_OUTCOME_TRY(auto const parts, split_components(inner));
    components.reserve(parts.size());
    for (auto const part : parts) {
        auto const type_str = trim(part);
        if (ETHKIT_UNLIKELY(type_str.empty())) {
            return AbiTypeError::EmptyComponent;
        }
        BOOST_OUTCOME_TRY(auto type, parse_abi_type(type_str));
        components.emplace_back(std::move(type));
    }
    return components;
}

Result<AbiType> parse_elementary(std::string_view const s)
{
    if (s == "address") {
        return AbiType::address();
    }
    if (s == "bool") {
        return AbiType::boolean();
    }
    if (s == "string") {
        return AbiType::string();
    }
    if (s == "bytes") {
        return AbiType::bytes();
    }
    if (s.starts_with("bytes")) {
        auto const n = parse_decimal(s.substr(5));
        if (ETHKIT_UNLIKELY(!n.has_value() || *n > 32)) {
            return AbiTypeError::InvalidBytesLength;
        }
        return AbiType::bytes_n(static_cast<unsigned>(*n));
    }
    if (s.starts_with("uint") || s.starts_with("int")) {
        bool const is_signed = s[0] == 'i';
        auto const suffix = s.substr(is_signed ? 3 : 4);
        if (suffix.empty()) {
            return is_signed ? AbiType::int_n(256) : AbiType::uint_n(256);
        }
        auto const bits = parse_decimal(suffix);
        if (ETHKIT_UNLIKELY(!bits.has_value() || *bits > 256)) {
            return AbiTypeError::InvalidIntegerWidth;
        }
        auto const width = static_cast<unsigned>(*bits);
        return is_signed ? AbiType::int_n(width) : AbiType::uint_n(width);
    }
    return AbiTypeError::UnknownType;
}

bool is_identifier(std::string_view const s)
{
    if (s.empty()) {
        return false;
    }
    auto const ident_char = [](char const c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
               (c >= '0' && c <= '9') || c == '_' || c == '$';
    };
    if (s[0] >= '0' && s[0] <= '9') {
        return false;
    }
    return std::ranges::all_of(s, ident_char);
}

// Drops a trailing parameter name and data location keywords
std::string_view strip_parameter_name(std::string_view s)
{
    s = trim(s);
    int depth = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        char const c = s[i];
        if (c == '(' || c == '[') {
            ++depth;
        }
        else if (c == ')' || c == ']') {
            --depth;
        }
        else if ((c == ' ' || c == '\t') && depth == 0) {
            return s.substr(0, i);
        }
    }
    return s;
}

ETHKIT_ANONYMOUS_NAMESPACE_END

ETHKIT_NAMESPACE_BEGIN

AbiType::AbiType(
    Kind const kind, unsigned const size,
    std::optional<size_t> const array_length, std::vector<AbiType> children)
    : kind_{kind}
    , size_{size}
    , array_length_{array_length}
    , children_{std::move(children)}
{
    switch (kind_) {
    case Kind::Bytes:
    case Kind::String:
        dynamic_ = true;
        static_size_ = WORD_SIZE;
        break;
    case Kind::Array: {
        auto const &element = children_.front();
        dynamic_ = !array_length_.has_value() || element.is_dynamic();
        static_size_ = dynamic_ ? WORD_SIZE
                                : *array_length_ * element.static_size();
        break;
    }
    case Kind::Tuple:
        dynamic_ = std::ranges::any_of(
            children_, [](AbiType const &t) { return t.is_dynamic(); });
        if (dynamic_) {
            static_size_ = WORD_SIZE;
        }
        else {
            static_size_ = 0;
            for (auto const &t : children_) {
                static_size_ += t.static_size();
            }
        }
        break;
    default:
        dynamic_ = false;
        static_size_ = WORD_SIZE;
        break;
    }
}

AbiType AbiType::address()
{
    return AbiType{Kind::Address, 160, std::nullopt, {}};
}

AbiType AbiType::boolean()
{
    return AbiType{Kind::Bool, 0, std::nullopt, {}};
}

Result<AbiType> AbiType::uint_n(unsigned const bits)
{
    if (ETHKIT_UNLIKELY(bits == 0 || bits > 256 || bits % 8 != 0)) {
        return AbiTypeError::InvalidIntegerWidth;
    }
    return AbiType{Kind::Uint, bits, std::nullopt, {}};
}

Result<AbiType> AbiType::int_n(unsigned const bits)
{
    if (ETHKIT_UNLIKELY(bits == 0 || bits > 256 || bits % 8 != 0)) {
        return AbiTypeError::InvalidIntegerWidth;
    }
    return AbiType{Kind::Int, bits, std::nullopt, {}};
}

Result<AbiType> AbiType::bytes_n(unsigned const n)
{
    if (ETHKIT_UNLIKELY(n == 0 || n > 32)) {
        return AbiTypeError::InvalidBytesLength;
    }
    return AbiType{Kind::FixedBytes, n, std::nullopt, {}};
}

AbiType AbiType::bytes()
{
    return AbiType{Kind::Bytes, 0, std::nullopt, {}};
}

AbiType AbiType::string()
{
    return AbiType{Kind::String, 0, std::nullopt, {}};
}

Result<AbiType>
AbiType::array(AbiType element, std::optional<size_t> const length)
{
    if (length.has_value()) {
        size_t head;
        if (ETHKIT_UNLIKELY(*length == 0)) {
            return AbiTypeError::InvalidArrayLength;
        }
        if (ETHKIT_UNLIKELY(
                !element.is_dynamic() &&
                __builtin_mul_overflow(
                    *length, element.static_size(), &head))) {
            return AbiTypeError::InvalidArrayLength;
        }
    }
    std::vector<AbiType> children;
    children.emplace_back(std::move(element));
    return AbiType{Kind::Array, 0, length, std::move(children)};
}

Result<AbiType> AbiType::tuple(std::vector<AbiType> components)
{
    // the head of a static tuple is the sum of its components' heads
    size_t size = 0;
    for (auto const &t : components) {
        if (ETHKIT_UNLIKELY(
                !t.is_dynamic() &&
                __builtin_add_overflow(size, t.static_size(), &size))) {
            return AbiTypeError::InvalidArrayLength;
        }
    }
    return AbiType{Kind::Tuple, 0, std::nullopt, std::move(components)};
}

AbiType AbiType::uint256()
{
    return AbiType{Kind::Uint, 256, std::nullopt, {}};
}

AbiType const &AbiType::element() const
{
    ETHKIT_ASSERT(kind_ == Kind::Array);
    return children_.front();
}

std::vector<AbiType> const &AbiType::components() const
{
    ETHKIT_ASSERT(kind_ == Kind::Tuple);
    return children_;
}

bool AbiType::is_value_type() const noexcept
{
    switch (kind_) {
    case Kind::Address:
    case Kind::Bool:
    case Kind::Uint:
    case Kind::Int:
    case Kind::FixedBytes:
        return true;
    default:
        return false;
    }
}

std::string AbiType::to_string() const
{
    switch (kind_) {
    case Kind::Address:
        return "address";
    case Kind::Bool:
        return "bool";
    case Kind::Uint:
        return "uint" + std::to_string(size_);
    case Kind::Int:
        return "int" + std::to_string(size_);
    case Kind::FixedBytes:
        return "bytes" + std::to_string(size_);
    case Kind::Bytes:
        return "bytes";
    case Kind::String:
        return "string";
    case Kind::Array:
        return children_.front().to_string() + "[" +
               (array_length_.has_value() ? std::to_string(*array_length_)
                                          : std::string{}) +
               "]";
    case Kind::Tuple: {
        std::string result = "(";
        for (size_t i = 0; i < children_.size(); ++i) {
            if (i != 0) {
                result += ',';
            }
            result += children_[i].to_string();
        }
        result += ')';
        return result;
    }
    }
    ETHKIT_ABORT("unknown abi type kind");
}

Result<std::optional<size_t>> parse_array_length(std::string_view const s)
{
    if (s.empty()) {
        return std::optional<size_t>{};
    }
    auto const length = parse_decimal(s);
    if (ETHKIT_UNLIKELY(!length.has_value() || *length == 0)) {
        return AbiTypeError::InvalidArrayLength;
    }
    return length;
}

Result<AbiType> parse_abi_type(std::string_view s)
{
    s = trim(s);
    if (ETHKIT_UNLIKELY(s.empty())) {
        return AbiTypeError::EmptyComponent;
    }

    // Array suffixes bind from the end: T[2][] is an array of T[2]
    if (s.back() == ']') {
        auto const open = s.rfind('[');
        if (ETHKIT_UNLIKELY(open == std::string_view::npos)) {
            return AbiTypeError::UnbalancedBrackets;
        }
        BOOST_OUTCOME_TRY(
            auto const length,
            parse_array_length(s.substr(open + 1, s.size() - open - 2)));
        BOOST_OUTCOME_TRY(auto element, parse_abi_type(s.substr(0, open)));
        return AbiType::array(std::move(element), length);
    }

    if (s.starts_with("tuple(")) {
        s.remove_prefix(5);
    }

    if (s.front() == '(') {
        if (ETHKIT_UNLIKELY(s.back() != ')')) {
            return AbiTypeError::UnbalancedBrackets;
        }
        BOOST_OUTCOME_TRY(
            auto components,
            parse_component_list(s.substr(1, s.size() - 2)));
        return AbiType::tuple(std::move(components));
    }

    if (ETHKIT_UNLIKELY(
            s.find_first_of("()[],") != std::string_view::npos)) {
        return AbiTypeError::UnbalancedBrackets;
    }
    return parse_elementary(s);
}

Result<AbiSignature> parse_signature(std::string_view s)
{
    s = trim(s);
    for (std::string_view const keyword : {"function ", "event ", "error "}) {
        if (s.starts_with(keyword)) {
            s = trim(s.substr(keyword.size()));
            break;
        }
    }

    auto const open = s.find('(');
    if (ETHKIT_UNLIKELY(open == std::string_view::npos)) {
        return AbiTypeError::InvalidSignature;
    }

    AbiSignature sig;
    sig.name = std::string{trim(s.substr(0, open))};
    if (ETHKIT_UNLIKELY(!is_identifier(sig.name))) {
        return AbiTypeError::InvalidSignature;
    }

    // find the parenthesis matching `open`; anything after it (modifiers,
    // return lists) is ignored
    int depth = 0;
    size_t close = std::string_view::npos;
    for (size_t i = open; i < s.size(); ++i) {
        if (s[i] == '(') {
            ++depth;
        }
        else if (s[i] == ')' && --depth == 0) {
            close = i;
            break;
        }
    }
    if (ETHKIT_UNLIKELY(close == std::string_view::npos)) {
        return AbiTypeError::UnbalancedBrackets;
    }

    auto const inner = trim(s.substr(open + 1, close - open - 1));
    if (inner.empty()) {
        return sig;
    }
    BOOST_OUTCOME_TRY(auto const parts, split_components(inner));
    for (auto const part : parts) {
        auto const type_str = strip_parameter_name(part);
        if (ETHKIT_UNLIKELY(type_str.empty())) {
            return AbiTypeError::EmptyComponent;
        }
        BOOST_OUTCOME_TRY(auto type, parse_abi_type(type_str));
        sig.inputs.emplace_back(std::move(type));
    }
    return sig;
}

std::string canonical_signature(
    std::string_view const name, std::vector<AbiType> const &types)
{
    std::string result{name};
    result += '(';
    for (size_t i = 0; i < types.size(); ++i) {
        if (i != 0) {
            result += ',';
        }
        result += types[i].to_string();
    }
    result += ')';
    return result;
}

ETHKIT_NAMESPACE_END
