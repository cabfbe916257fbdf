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

#include <ethkit/abi/abi_encode_error.hpp>

// TODO unstable paths between versions
#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/generic_code.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <initializer_list>

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<ethkit::AbiEncodeError>::mapping> const &
quick_status_code_from_enum<ethkit::AbiEncodeError>::value_mappings()
{
    using ethkit::AbiEncodeError;

    static std::initializer_list<mapping> const v = {
        {AbiEncodeError::Success, "success", {errc::success}},
        {AbiEncodeError::ArityMismatch, "arity mismatch", {}},
        {AbiEncodeError::TypeMismatch, "value does not match type", {}},
        {AbiEncodeError::IntegerOutOfRange, "integer out of range", {}},
        {AbiEncodeError::LengthMismatch, "length mismatch", {}},
        {AbiEncodeError::InvalidUtf8, "invalid utf-8 string", {}},
        {AbiEncodeError::UnsupportedPackedType,
         "type not supported in packed encoding",
         {}},
        {AbiEncodeError::UnsupportedIndexedType,
         "type not supported as indexed parameter",
         {}},
    };

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
