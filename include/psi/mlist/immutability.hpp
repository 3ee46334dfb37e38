////////////////////////////////////////////////////////////////////////////////
/// One-way immutability lock for psi::mlist containers.
///
/// A class embeds the capability by (publicly) deriving from
/// with_immutability<itself> (CRTP) and calling throw_if_immutable() at the
/// start of each of its mutating members. Once make_immutable() has been
/// called there is no way back.
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

#include "errors.hpp"
//------------------------------------------------------------------------------
namespace psi::mlist
{
//------------------------------------------------------------------------------

template <typename Derived>
class with_immutability
{
public:
    /// Locks the object and returns it for chaining.
    constexpr Derived & make_immutable() noexcept
    {
        immutable_ = true;
        return static_cast<Derived &>( *this );
    }

    [[ nodiscard ]] constexpr bool immutable() const noexcept { return immutable_; }

    constexpr void throw_if_immutable() const
    {
        if ( immutable_ ) [[ unlikely ]]
            detail::throw_immutable();
    }

protected:
    constexpr  with_immutability() noexcept = default;
    constexpr ~with_immutability() noexcept = default;

    constexpr with_immutability( with_immutability const & ) noexcept = default;
    constexpr with_immutability( with_immutability      && ) noexcept = default;
    constexpr with_immutability & operator=( with_immutability const & ) noexcept = default;
    constexpr with_immutability & operator=( with_immutability      && ) noexcept = default;

private:
    bool immutable_{ false };
}; // class with_immutability

//------------------------------------------------------------------------------
} // namespace psi::mlist
//------------------------------------------------------------------------------
