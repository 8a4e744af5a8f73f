////////////////////////////////////////////////////////////////////////////////
/// hashvec::ordered_store: densely indexed (key, value) sequence
///
/// Holds the entries of a hash_vec as two parallel sequence containers (keys
/// and values) kept in lock-step: position i of both containers forms entry i.
/// All operations are positional; the store knows nothing about hashing or
/// key uniqueness (that is the job of position_index and of the owning
/// hash_vec).
///
/// Exception safety: the two-container operations roll back the first
/// container if the second one throws, so the containers never go out of
/// sync (strong guarantee for append and insert_element_at).
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

#include <boost/assert.hpp>

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace hashvec
{
//------------------------------------------------------------------------------

template <typename KeyContainer, typename MappedContainer>
struct ordered_store
{
    using size_type = std::conditional_t
    <
        ( sizeof( typename KeyContainer::size_type ) <= sizeof( typename MappedContainer::size_type ) ),
        typename KeyContainer   ::size_type,
        typename MappedContainer::size_type
    >;
    using difference_type = std::ptrdiff_t;

    KeyContainer    keys;
    MappedContainer values;

    //--------------------------------------------------------------------------
    // Capacity
    //--------------------------------------------------------------------------
    [[ nodiscard ]] size_type size () const noexcept { return static_cast<size_type>( keys.size() ); }
    [[ nodiscard ]] bool      empty() const noexcept { return keys.empty(); }

    [[ nodiscard ]] size_type capacity() const noexcept
    {
        if constexpr ( requires { keys.capacity(); values.capacity(); } )
            return static_cast<size_type>( std::min<std::size_t>( keys.capacity(), values.capacity() ) );
        else
            return size();
    }

    void reserve( size_type const n )
    {
        if constexpr ( requires { keys.reserve( n ); } )
            keys.reserve( n );
        if constexpr ( requires { values.reserve( n ); } )
            values.reserve( n );
    }

    void shrink_to_fit() noexcept
    {
        keys  .shrink_to_fit();
        values.shrink_to_fit();
    }

    // Reduces the capacity of both containers to max( min_capacity, size() )
    // (containers without capacity() just get shrink_to_fit()).
    void shrink_to( size_type const min_capacity )
    {
        auto const target{ std::max( min_capacity, size() ) };
        shrink_container( keys  , target );
        shrink_container( values, target );
    }

    //--------------------------------------------------------------------------
    // Append at the back (exception-safe)
    //--------------------------------------------------------------------------
    template <typename K, typename V>
    void append( K && key, V && val )
    {
        keys.emplace_back( std::forward<K>( key ) );
        try {
            values.emplace_back( std::forward<V>( val ) );
        } catch ( ... ) {
            keys.pop_back();
            throw;
        }
        BOOST_ASSERT( keys.size() == values.size() );
    }

    //--------------------------------------------------------------------------
    // Synchronized single-element insert at position (exception-safe)
    //--------------------------------------------------------------------------
    template <typename K, typename V>
    void insert_element_at( size_type const pos, K && key, V && val )
    {
        BOOST_ASSERT( pos <= size() );
        auto const p{ static_cast<difference_type>( pos ) };
        keys.insert( keys.begin() + p, std::forward<K>( key ) );
        try {
            values.insert( values.begin() + p, std::forward<V>( val ) );
        } catch ( ... ) {
            keys.erase( keys.begin() + p );
            throw;
        }
    }

    //--------------------------------------------------------------------------
    // Synchronized erase
    //--------------------------------------------------------------------------
    void erase_element_at( size_type const pos ) noexcept
    {
        BOOST_ASSERT( pos < size() );
        auto const p{ static_cast<difference_type>( pos ) };
        keys  .erase( keys  .begin() + p );
        values.erase( values.begin() + p );
    }

    void pop_back() noexcept
    {
        BOOST_ASSERT( !empty() );
        keys  .pop_back();
        values.pop_back();
    }

    //--------------------------------------------------------------------------
    // Reordering
    //--------------------------------------------------------------------------
    void swap_elements( size_type const a, size_type const b ) noexcept
    {
        BOOST_ASSERT( a < size() && b < size() );
        using std::swap;
        swap( keys  [ a ], keys  [ b ] );
        swap( values[ a ], values[ b ] );
    }

    // Moves entry pos to the last slot, the entries after it move down one
    // slot each (relative order otherwise preserved).
    void rotate_to_back( size_type const pos ) noexcept
    {
        BOOST_ASSERT( pos < size() );
        auto const p{ static_cast<difference_type>( pos ) };
        std::rotate( keys  .begin() + p, keys  .begin() + p + 1, keys  .end() );
        std::rotate( values.begin() + p, values.begin() + p + 1, values.end() );
    }

    //--------------------------------------------------------------------------
    // Clear / Swap
    //--------------------------------------------------------------------------
    void clear() noexcept
    {
        keys  .clear();
        values.clear();
    }

    void swap_storage( ordered_store & other ) noexcept
    {
        using std::swap;
        swap( keys,   other.keys   );
        swap( values, other.values );
    }

    friend bool operator==( ordered_store const & a, ordered_store const & b )
    {
        return a.keys == b.keys && a.values == b.values;
    }

private:
    template <typename Container>
    static void shrink_container( Container & container, size_type const target )
    {
        if constexpr ( requires { container.capacity(); container.reserve( target ); } )
        {
            if ( container.capacity() <= target )
                return;
            using element = typename Container::value_type;
            Container shrunk;
            shrunk.reserve( target );
            if constexpr ( std::is_nothrow_move_constructible_v<element> || !std::is_copy_constructible_v<element> )
                shrunk.insert( shrunk.end(), std::make_move_iterator( container.begin() ), std::make_move_iterator( container.end() ) );
            else
                shrunk.insert( shrunk.end(), container.begin(), container.end() );
            container.swap( shrunk );
        }
        else
        {
            container.shrink_to_fit();
        }
    }
}; // struct ordered_store

//------------------------------------------------------------------------------
} // namespace hashvec
//------------------------------------------------------------------------------
