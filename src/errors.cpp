////////////////////////////////////////////////////////////////////////////////
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
#include <psi/mlist/errors.hpp>

#include <utility>
//------------------------------------------------------------------------------
namespace psi::mlist
{
//------------------------------------------------------------------------------

immutable_error::immutable_error() : std::logic_error( "psi::mlist: object is immutable" ) {}

missing_key_error::missing_key_error( std::string key )
    : std::out_of_range( "Missing: " + key ), key_{ std::move( key ) } {}

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_immutable() { throw immutable_error(); }
    [[ noreturn, gnu::cold ]] void throw_missing_key( std::string_view const key ) { throw missing_key_error( std::string{ key } ); }
} // namespace detail

//------------------------------------------------------------------------------
} // namespace psi::mlist
//------------------------------------------------------------------------------
