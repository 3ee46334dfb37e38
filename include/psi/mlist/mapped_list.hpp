////////////////////////////////////////////////////////////////////////////////
/// Ordered string-keyed multi-map ('mapped list')
///
/// A list of (key, value) entries in which keys need not be unique and the
/// insertion order is preserved (until an explicit sort()). Lookups are
/// linear scans over the backing vector; there is no index of any kind.
///
/// Architecture:
///   mapped_list publicly inherits with_immutability (the one-way lock) and
///   owns a single std::vector of std::pair<std::string, Value> entries.
///   Entries are exposed only through const references: an entry is never
///   modified in place, replacing a value means erase + append.
///
/// Validation:
///   The KeyValidator and ValueValidator policies are stateless callables
///   fixed by the container type. Every key/value entering the container
///   (append, set, construction) or used as a lookup argument (get, has,
///   erase, ...) passes through them exactly once; stored entries are never
///   revalidated. Validation order is key, then value.
///
/// Mutating members check the lock first, then validate, and only then touch
/// the entries, so a failing call never leaves a partially modified list.
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
#include "immutability.hpp"
#include "validators.hpp"

#include <boost/assert.hpp>

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <ranges>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace psi::mlist
{
//------------------------------------------------------------------------------

//==============================================================================
// Construction source tags
//==============================================================================
struct from_range_t   { explicit from_range_t  () = default; };
struct from_mapping_t { explicit from_mapping_t() = default; };

inline constexpr from_range_t   from_range  {};
inline constexpr from_mapping_t from_mapping{};

namespace detail {

    // pair-like: anything std::get<0>/<1> can take apart into a key and a value
    template <typename E, typename Value>
    concept key_value_pair = requires( E && e ) {
        { std::get<0>( std::forward<E>( e ) ) } -> std::convertible_to<std::string>;
        { std::get<1>( std::forward<E>( e ) ) } -> std::convertible_to<Value>;
    };

    template <typename R, typename Value>
    concept key_value_range =
        std::ranges::input_range<R> &&
        key_value_pair<std::ranges::range_reference_t<R>, Value>;

    // associative containers (std::map, boost::container::flat_map, ...)
    template <typename M, typename Value>
    concept key_value_mapping =
        key_value_range<M, Value> &&
        requires {
            typename std::remove_cvref_t<M>::key_type;
            typename std::remove_cvref_t<M>::mapped_type;
        };

} // namespace detail


//==============================================================================
// mapped_list
//==============================================================================

template
<
    typename Value,
    key_validator          KeyValidator   = passthrough,
    value_validator<Value> ValueValidator = passthrough,
    typename Tag                          = void
>
class mapped_list : public with_immutability<mapped_list<Value, KeyValidator, ValueValidator, Tag>>
{
    using storage = std::vector<std::pair<std::string, Value>>;
    using lock    = with_immutability<mapped_list>;

public:
    //--------------------------------------------------------------------------
    // Member types
    //--------------------------------------------------------------------------
    using key_type             = std::string;
    using mapped_type          = Value;
    using value_type           = typename storage::value_type;
    using const_reference      = value_type const &;
    using reference            = const_reference;
    using size_type            = typename storage::size_type;
    using difference_type      = typename storage::difference_type;
    using const_iterator       = typename storage::const_iterator;
    using iterator             = const_iterator;
    using key_validator_type   = KeyValidator;
    using value_validator_type = ValueValidator;
    using tag_type             = Tag;

    //--------------------------------------------------------------------------
    // Constructors
    //--------------------------------------------------------------------------
    mapped_list() = default;

    template <std::input_iterator InputIt, std::sentinel_for<InputIt> Sentinel>
    requires detail::key_value_pair<std::iter_reference_t<InputIt>, Value>
    mapped_list( InputIt first, Sentinel const last )
    {
        for ( ; first != last; ++first )
            seed( *first );
    }

    template <detail::key_value_range<Value> R>
    mapped_list( from_range_t, R && rg )
        : mapped_list( std::ranges::begin( rg ), std::ranges::end( rg ) ) {}

    /// Each mapping entry becomes one list entry, in the mapping's iteration order.
    template <detail::key_value_mapping<Value> M>
    mapped_list( from_mapping_t, M && mapping )
        : mapped_list( std::ranges::begin( mapping ), std::ranges::end( mapping ) ) {}

    mapped_list( std::initializer_list<value_type> const il )
        : mapped_list( il.begin(), il.end() ) {}

    mapped_list( mapped_list const & ) = default;
    // A locked source is read-only for good: moving from it copies.
    mapped_list( mapped_list && other )
        : lock( std::move( other ) ), entries_( other.immutable() ? other.entries_ : std::move( other.entries_ ) ) {}

    // Assignment replaces the entries and so is refused by a locked target.
    mapped_list & operator=( mapped_list const & other )
    {
        this->throw_if_immutable();
        entries_ = other.entries_;
        lock::operator=( other );
        return *this;
    }

    mapped_list & operator=( mapped_list && other )
    {
        this->throw_if_immutable();
        if ( other.immutable() )
            entries_ = other.entries_;
        else
            entries_ = std::move( other.entries_ );
        lock::operator=( std::move( other ) );
        return *this;
    }

    ~mapped_list() noexcept = default;

    //--------------------------------------------------------------------------
    // Capacity
    //--------------------------------------------------------------------------
    [[ nodiscard ]] size_type size () const noexcept { return entries_.size (); }
    [[ nodiscard ]] bool      empty() const noexcept { return entries_.empty(); }

    void reserve( size_type const n )
    {
        this->throw_if_immutable();
        entries_.reserve( n );
    }

    //--------------------------------------------------------------------------
    // Modifiers
    //--------------------------------------------------------------------------

    /// Adds an entry at the end (existing entries with the same key are kept).
    mapped_list & append( key_type key, mapped_type value )
    {
        this->throw_if_immutable();
        auto validKey  { validate_key  ( std::move( key   ) ) };
        auto validValue{ validate_value( std::move( value ) ) };
        entries_.emplace_back( std::move( validKey ), std::move( validValue ) );
        return *this;
    }

    /// Removes every entry with the given key; returns the number removed.
    size_type erase( key_type key )
    {
        this->throw_if_immutable();
        auto const validKey{ validate_key( std::move( key ) ) };
        return erase_all( validKey );
    }

    /// Removes every entry with the given key and value; returns the number
    /// removed. Any supplied value is a filter, including empty/zero ones.
    size_type erase( key_type key, mapped_type value ) requires std::equality_comparable<mapped_type>
    {
        this->throw_if_immutable();
        auto const validKey  { validate_key  ( std::move( key   ) ) };
        auto const validValue{ validate_value( std::move( value ) ) };
        return static_cast<size_type>( std::erase_if( entries_, [&]( value_type const & e ) {
            return e.first == validKey && e.second == validValue;
        } ) );
    }

    /// Replaces all entries with the given key by a single one, placed at the
    /// end of the list.
    mapped_list & set( key_type key, mapped_type value )
    {
        this->throw_if_immutable();
        auto validKey  { validate_key  ( std::move( key   ) ) };
        auto validValue{ validate_value( std::move( value ) ) };
        // append first: a failed (re)allocation leaves the old entries intact
        entries_.emplace_back( std::move( validKey ), std::move( validValue ) );
        auto const added { std::prev( entries_.end() ) };
        auto const newEnd{ std::remove_if( entries_.begin(), added, [&]( value_type const & e ) { return e.first == added->first; } ) };
        entries_.erase( newEnd, added );
        return *this;
    }

    void clear()
    {
        this->throw_if_immutable();
        entries_.clear();
    }

    /// Stable sort by key, in ascending code point order (std::string compares
    /// as unsigned char, i.e. UTF-8 byte order == code point order).
    mapped_list & sort()
    {
        this->throw_if_immutable();
        std::ranges::stable_sort( entries_, std::ranges::less{}, &value_type::first );
        return *this;
    }

    //--------------------------------------------------------------------------
    // Lookup
    //--------------------------------------------------------------------------

    /// First value stored under the key; throws missing_key_error if none.
    [[ nodiscard ]] mapped_type const & get( key_type key ) const
    {
        auto const validKey{ validate_key( std::move( key ) ) };
        auto const pos     { find_first( validKey ) };
        if ( pos == entries_.end() ) [[ unlikely ]]
            detail::throw_missing_key( validKey );
        return pos->second;
    }

    [[ nodiscard ]] std::optional<mapped_type> get_optional( key_type key ) const
    {
        auto const validKey{ validate_key( std::move( key ) ) };
        auto const pos     { find_first( validKey ) };
        if ( pos == entries_.end() )
            return std::nullopt;
        return pos->second;
    }

    /// All values stored under the key, in list order (empty if none).
    [[ nodiscard ]] std::vector<mapped_type> get_all( key_type key ) const
    {
        auto const validKey{ validate_key( std::move( key ) ) };
        std::vector<mapped_type> result;
        for ( auto const & [k, v] : entries_ )
        {
            if ( k == validKey )
                result.push_back( v );
        }
        return result;
    }

    [[ nodiscard ]] bool has( key_type key ) const
    {
        auto const validKey{ validate_key( std::move( key ) ) };
        return find_first( validKey ) != entries_.end();
    }

    [[ nodiscard ]] bool has( key_type key, mapped_type value ) const requires std::equality_comparable<mapped_type>
    {
        auto const validKey  { validate_key  ( std::move( key   ) ) };
        auto const validValue{ validate_value( std::move( value ) ) };
        return std::ranges::any_of( entries_, [&]( value_type const & e ) {
            return e.first == validKey && e.second == validValue;
        } );
    }

    //--------------------------------------------------------------------------
    // Iteration
    //
    // keys()/values()/entries() are lazy views over the current entries; each
    // call produces a new view. Like std::vector iterators, they are
    // invalidated by a subsequent mutation of the list.
    //--------------------------------------------------------------------------
    [[ nodiscard ]] const_iterator begin () const noexcept { return entries_.begin (); }
    [[ nodiscard ]] const_iterator end   () const noexcept { return entries_.end   (); }
    [[ nodiscard ]] const_iterator cbegin() const noexcept { return entries_.cbegin(); }
    [[ nodiscard ]] const_iterator cend  () const noexcept { return entries_.cend  (); }

    [[ nodiscard ]] auto keys   () const noexcept { return std::views::all( entries_ ) | std::views::keys;   }
    [[ nodiscard ]] auto values () const noexcept { return std::views::all( entries_ ) | std::views::values; }
    [[ nodiscard ]] auto entries() const noexcept { return std::views::all( entries_ ); }

    /// Invokes callback( value, key ) for each entry, in list order (note the
    /// value-first argument order). The callback must not modify the list.
    template <std::invocable<mapped_type const &, key_type const &> Callback>
    void for_each( Callback && callback ) const
    {
        for ( auto const & [key, value] : entries_ )
            std::invoke( callback, value, key );
    }

    //--------------------------------------------------------------------------
    // Comparison (entries only, order significant; the lock is not compared)
    //--------------------------------------------------------------------------
    friend bool operator==( mapped_list const & a, mapped_list const & b ) requires std::equality_comparable<mapped_type>
    {
        return a.entries_ == b.entries_;
    }

private:
    static key_type    validate_key  ( key_type    key   ) { return KeyValidator  {}( std::move( key   ) ); }
    static mapped_type validate_value( mapped_type value ) { return ValueValidator{}( std::move( value ) ); }

    template <typename E>
    void seed( E && element )
    {
        auto validKey  { validate_key  ( key_type   ( std::get<0>( std::forward<E>( element ) ) ) ) };
        auto validValue{ validate_value( mapped_type( std::get<1>( std::forward<E>( element ) ) ) ) };
        entries_.emplace_back( std::move( validKey ), std::move( validValue ) );
    }

    [[ nodiscard ]] const_iterator find_first( key_type const & validKey ) const noexcept
    {
        return std::ranges::find( entries_, validKey, &value_type::first );
    }

    size_type erase_all( key_type const & validKey )
    {
        auto const oldSize{ entries_.size() };
        auto const erased { std::erase_if( entries_, [&]( value_type const & e ) { return e.first == validKey; } ) };
        BOOST_ASSERT( entries_.size() + erased == oldSize );
        return static_cast<size_type>( erased );
    }

    storage entries_;
}; // class mapped_list


//==============================================================================
// mapped_list_factory
//
// Manufactures a container type from a value type and a pair of validation
// policies. The result is an alias: identical arguments (the default
// Tag = void included) name the same type, so a distinct type needs a
// distinct Tag. Every distinct Tag yields a distinct type, so two lists with
// the same options can still be kept apart by the type system:
//
//   struct header_tag;
//   using headers = mapped_list_t<std::string, lowercase_key, passthrough, header_tag>;
//==============================================================================

template
<
    typename Value,
    key_validator          KeyValidator   = passthrough,
    value_validator<Value> ValueValidator = passthrough,
    typename Tag                          = void
>
struct mapped_list_factory
{
    using type = mapped_list<Value, KeyValidator, ValueValidator, Tag>;
};

template
<
    typename Value,
    key_validator          KeyValidator   = passthrough,
    value_validator<Value> ValueValidator = passthrough,
    typename Tag                          = void
>
using mapped_list_t = typename mapped_list_factory<Value, KeyValidator, ValueValidator, Tag>::type;

//------------------------------------------------------------------------------
} // namespace psi::mlist
//------------------------------------------------------------------------------
