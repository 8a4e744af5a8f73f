////////////////////////////////////////////////////////////////////////////////
/// hashvec::position_index: key -> position hash index
///
/// Maps every key of an ordered_store to its current position. Holds copies
/// of the keys and treats positions as opaque integers: it has no knowledge
/// of the store and it is up to the owning container to keep the two in
/// sync (after shifting the store it calls shift_positions_above()).
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

#include "lookup.hpp"

#include <boost/assert.hpp>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <functional>
#include <optional>
#include <type_traits>
#include <unordered_map>
#include <utility>
//------------------------------------------------------------------------------
namespace hashvec
{
//------------------------------------------------------------------------------

template
<
    typename Key,
    typename Hash     = std::hash<Key>,
    typename KeyEqual = std::equal_to<Key>,
    typename SizeType = std::size_t
>
class position_index
{
public:
    using key_type        = Key;
    using hasher          = Hash;
    using key_equal       = KeyEqual;
    using size_type       = SizeType;
    using difference_type = std::make_signed_t<SizeType>;
    using map_type        = std::unordered_map<key_type, size_type, hasher, key_equal>;

    static constexpr bool transparent_lookup{ transparent_hash_lookup<Hash, KeyEqual> };

    position_index() = default;

    explicit position_index( hasher const & hash, key_equal const & equal = key_equal{} )
        : map_( 0, hash, equal ) {}

    //--------------------------------------------------------------------------
    // Lookup
    //--------------------------------------------------------------------------
    template <LookupType<transparent_lookup, key_type> K = key_type>
    [[ nodiscard ]] std::optional<size_type> lookup( K const & key ) const
    {
        auto const it{ map_.find( key ) };
        if ( it == map_.end() )
            return std::nullopt;
        return it->second;
    }

    template <LookupType<transparent_lookup, key_type> K = key_type>
    [[ nodiscard ]] bool contains( K const & key ) const { return map_.find( key ) != map_.end(); }

    //--------------------------------------------------------------------------
    // Modifiers
    //--------------------------------------------------------------------------

    // Inserts or overwrites the mapping for key.
    void set( key_type const & key, size_type const pos ) { map_.insert_or_assign( key, pos ); }

    // Overwrites the position of a key that is known to be present (never
    // allocates).
    void update( key_type const & key, size_type const pos )
    {
        auto const it{ map_.find( key ) };
        BOOST_ASSERT_MSG( it != map_.end(), "position_index: updating an untracked key" );
        it->second = pos;
    }

    // Replaces the tracked copy of old_key with new_key (an equivalent key
    // that is to be stored instead) and sets its position. The node is
    // reused, so nothing is allocated.
    void rekey( key_type const & old_key, key_type const & new_key, size_type const pos )
    {
        auto node{ map_.extract( old_key ) };
        BOOST_ASSERT_MSG( !node.empty(), "position_index: rekeying an untracked key" );
        try {
            node.key() = new_key;
        } catch ( ... ) {
            map_.insert( std::move( node ) );
            throw;
        }
        node.mapped() = pos;
        [[ maybe_unused ]] auto const result{ map_.insert( std::move( node ) ) };
        BOOST_ASSERT_MSG( result.inserted, "position_index: rekeying onto another tracked key" );
    }

    template <LookupType<transparent_lookup, key_type> K = key_type>
    bool remove( K const & key )
    {
        auto const it{ map_.find( key ) };
        if ( it == map_.end() )
            return false;
        map_.erase( it );
        return true;
    }

    /// Restores position consistency after the tracked sequence was shifted
    /// around threshold:
    ///   - delta < 0 (an element at threshold was erased): positions
    ///     > threshold are adjusted,
    ///   - delta > 0 (an element was inserted at threshold): positions
    ///     >= threshold are adjusted.
    /// Linear in the number of tracked keys.
    void shift_positions_above( size_type const threshold, difference_type const delta ) noexcept
    {
        BOOST_ASSERT( delta != 0 );
        for ( auto & mapping : map_ )
        {
            auto & pos{ mapping.second };
            bool const affected{ ( delta < 0 ) ? ( pos > threshold ) : ( pos >= threshold ) };
            if ( affected )
            {
                BOOST_ASSERT( delta > 0 || pos >= static_cast<size_type>( -delta ) );
                pos = static_cast<size_type>( static_cast<difference_type>( pos ) + delta );
            }
        }
    }

    void clear() noexcept { map_.clear(); }

    void reserve( size_type const n ) { map_.reserve( n ); }

    void shrink_to_fit() { map_.rehash( 0 ); }

    // Rehashes for at least max( min_capacity, size() ) keys.
    void shrink_to( size_type const min_capacity )
    {
        auto const target{ std::max( min_capacity, size() ) };
        map_.rehash( static_cast<size_type>( std::ceil( static_cast<double>( target ) / map_.max_load_factor() ) ) );
    }

    void swap( position_index & other ) noexcept { map_.swap( other.map_ ); }

    //--------------------------------------------------------------------------
    // Capacity & observers
    //--------------------------------------------------------------------------
    [[ nodiscard ]] size_type size () const noexcept { return static_cast<size_type>( map_.size() ); }
    [[ nodiscard ]] bool      empty() const noexcept { return map_.empty(); }

    // Number of keys that can be tracked without a rehash.
    [[ nodiscard ]] size_type capacity() const noexcept
    {
        return static_cast<size_type>( std::floor( static_cast<double>( map_.bucket_count() ) * map_.max_load_factor() ) );
    }

    [[ nodiscard ]] hasher    hash_function() const { return map_.hash_function(); }
    [[ nodiscard ]] key_equal key_eq       () const { return map_.key_eq       (); }

    [[ nodiscard ]] map_type const & mappings() const noexcept { return map_; }

private:
    map_type map_;
}; // class position_index

//------------------------------------------------------------------------------
} // namespace hashvec
//------------------------------------------------------------------------------
