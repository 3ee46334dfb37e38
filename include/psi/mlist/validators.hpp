////////////////////////////////////////////////////////////////////////////////
/// Key and value validation policies for psi::mlist containers.
///
/// A validator is a default constructible, stateless callable that receives a
/// key (or value) by value and returns the (possibly normalised) version to be
/// stored or compared against. Rejection is reported by throwing; whatever the
/// validator throws reaches the caller unchanged.
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

#include <concepts>
#include <string>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::mlist
{
//------------------------------------------------------------------------------

/// Identity validator (accepts and returns everything unchanged).
struct passthrough
{
    template <typename T>
    [[ nodiscard ]] constexpr std::remove_cvref_t<T> operator()( T && value ) const
    {
        return std::forward<T>( value );
    }
}; // struct passthrough

template <typename V>
concept key_validator =
    std::default_initializable<V> &&
    std::is_invocable_r_v<std::string, V const &, std::string>;

template <typename V, typename Value>
concept value_validator =
    std::default_initializable<V> &&
    std::is_invocable_r_v<Value, V const &, Value>;

//------------------------------------------------------------------------------
} // namespace psi::mlist
//------------------------------------------------------------------------------
