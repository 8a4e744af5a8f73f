////////////////////////////////////////////////////////////////////////////////
/// Shared lookup infrastructure for hashvec hashed containers.
///
/// Provides:
///   - transparent_hash_lookup: do Hash and KeyEqual both opt into
///                               heterogeneous lookup?
///   - LookupType concept     : constrains heterogeneous lookup key types
///   - detail::throw_out_of_range: cold, out-of-line checked-access failure
///
/// Used by position_index and hash_vec to merge the traditional
/// two-overload lookup pattern (non-template + constrained template) into a
/// single constrained template per function.
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
#include <type_traits>
//------------------------------------------------------------------------------
namespace hashvec
{
//------------------------------------------------------------------------------

/// Unordered containers only accept heterogeneous keys in find/contains when
/// both the hasher and the equality predicate carry the is_transparent tag.
template <typename Hash, typename KeyEqual>
constexpr bool transparent_hash_lookup
{
    requires{ typename Hash::is_transparent; } &&
    requires{ typename KeyEqual::is_transparent; }
};

/// LookupType: constrains which key types a hashed container's lookup
/// functions accept.
///
/// A type K is a valid lookup key if either:
///   (a) the hasher and key equality are transparent, allowing heterogeneous
///       lookup with any type they can hash and compare, or
///   (b) K is implicitly convertible to key_type (the conversion then happens
///       inside the underlying hash table lookup). This subsumes the
///       K == key_type case via identity conversion.
///
/// This replaces the two-overloads-per-lookup pattern:
///   iterator find( key_type const & );                                   // always
///   template<class K> iterator find( K const & ) requires transparent;   // conditional
/// with a single constrained template, usable in explicit or abbreviated form:
///   template <LookupType<transparent, key_type> K = key_type>
///   iterator find( K const & );
/// or:
///   bool swap_keys( LookupType<transparent, key_type> auto const &, LookupType<transparent, key_type> auto const & );
template <typename K, bool transparent_lookup, typename StoredKeyType>
concept LookupType =
    transparent_lookup ||
    std::convertible_to<K const &, StoredKeyType const &>;


namespace detail { [[ noreturn, gnu::cold ]] void throw_out_of_range( char const * msg ); }

//------------------------------------------------------------------------------
} // namespace hashvec
//------------------------------------------------------------------------------
