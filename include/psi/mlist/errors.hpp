////////////////////////////////////////////////////////////////////////////////
///
/// \file errors.hpp
/// ----------------
///
/// Exception types reported by psi::mlist containers.
///
/// Copyright (c) Domagoj Saric.
///
/// Use, modification and distribution is subject to the
/// Boost Software License, Version 1.0.
/// (See accompanying file LICENSE_1_0.txt or copy at
/// http://www.boost.org/LICENSE_1_0.txt)
///
/// For more information, see http://www.boost.org
///
////////////////////////////////////////////////////////////////////////////////
//------------------------------------------------------------------------------
#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
//------------------------------------------------------------------------------
namespace psi::mlist
{
//------------------------------------------------------------------------------

/// Thrown by every mutating operation of a locked (immutable) object.
class immutable_error : public std::logic_error
{
public:
    immutable_error();
}; // class immutable_error

/// Thrown by mapped_list::get() when no entry carries the requested key.
class missing_key_error : public std::out_of_range
{
public:
    explicit missing_key_error( std::string key );

    [[ nodiscard ]] std::string const & key() const noexcept { return key_; }

private:
    std::string key_;
}; // class missing_key_error

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_immutable();
    [[ noreturn, gnu::cold ]] void throw_missing_key( std::string_view key );
} // namespace detail

//------------------------------------------------------------------------------
} // namespace psi::mlist
//------------------------------------------------------------------------------
