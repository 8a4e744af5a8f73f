////////////////////////////////////////////////////////////////////////////////
/// hashvec::hash_vec: insertion ordered hash map with positional access
///
/// A map whose unique-key entries are kept (and iterated) in an explicit,
/// caller controlled order: by default the order in which they were added,
/// changeable through push(), insert_at(), swap_keys() and swap_indices().
/// Entries can be retrieved by key (O(1) amortized) or by position (O(1)).
///
/// Architecture:
///   hash_vec privately owns
///     - an ordered_store<KC, MC>: the entries as parallel key and value
///       containers (position i of both forms entry i) and
///     - a position_index<Key, Hash, KeyEqual>: key -> position.
///   Every modifier is a single coordinated update of both, after which:
///     1. index.size() == store.size()
///     2. index[ k ] == i implies i < size() && store.keys[ i ] == k
///     3. index[ store.keys[ i ] ] == i for every position i
///     4. store keys are unique
///   Positional insertion and removal shift the store and then the recorded
///   positions (O(n)); appends, pushes of new keys and pops are O(1)
///   amortized.
///
/// Upserts:
///   - insert( k, v ) overwrites the value of an existing key in place,
///   - push  ( k, v ) overwrites the value and moves the entry to the back.
///
/// Invalidation: every modifier (including reserve() and extract()) may
/// relocate or destroy entries and invalidates all iterators, references
/// and pointers previously obtained from the container. Modifying the
/// container while iterating over it is a precondition violation. No
/// internal synchronization is done.
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
#include "ordered_store.hpp"
#include "position_index.hpp"

#include <boost/assert.hpp>

#include <algorithm>
#include <compare>
#include <concepts>
#include <cstddef>
#include <deque>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <ranges>
#include <type_traits>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace hashvec
{
//------------------------------------------------------------------------------

struct with_capacity_t { explicit with_capacity_t() = default; };
inline constexpr with_capacity_t with_capacity{};

namespace detail
{
    // std::vector<bool> hands out proxies instead of references
    template <typename T>
    using default_sequence = std::conditional_t<std::is_same_v<T, bool>, std::deque<T>, std::vector<T>>;
} // namespace detail

//==============================================================================
// hash_vec
//==============================================================================

template
<
    typename Key,
    typename T,
    typename Hash            = std::hash<Key>,
    typename KeyEqual        = std::equal_to<Key>,
    typename KeyContainer    = detail::default_sequence<Key>,
    typename MappedContainer = detail::default_sequence<T>
>
class hash_vec
{
    using store_type = ordered_store<KeyContainer, MappedContainer>;
    using index_type = position_index<Key, Hash, KeyEqual, typename store_type::size_type>;

    static_assert( std::is_same_v<Key, typename KeyContainer   ::value_type>, "KeyContainer::value_type must be Key" );
    static_assert( std::is_same_v<T,   typename MappedContainer::value_type>, "MappedContainer::value_type must be T" );
    static_assert( std::is_copy_constructible_v<Key>, "keys are copied into the position index" );
    static_assert( std::is_reference_v<decltype( std::declval<KeyContainer    &>()[ 0 ] )>, "KeyContainer must return real references (e.g. not std::vector<bool>)" );
    static_assert( std::is_reference_v<decltype( std::declval<MappedContainer &>()[ 0 ] )>, "MappedContainer must return real references (e.g. not std::vector<bool>)" );

public:
    //--------------------------------------------------------------------------
    // Member types
    //--------------------------------------------------------------------------
    using key_type              = Key;
    using mapped_type           = T;
    using value_type            = std::pair<key_type, mapped_type>;
    using hasher                = Hash;
    using key_equal             = KeyEqual;
    using reference             = std::pair<key_type const &, mapped_type       &>;
    using const_reference       = std::pair<key_type const &, mapped_type const &>;
    using size_type             = typename store_type::size_type;
    using difference_type       = typename store_type::difference_type;
    using key_container_type    = KeyContainer;
    using mapped_container_type = MappedContainer;
    using containers            = store_type;

    static constexpr bool transparent_lookup{ index_type::transparent_lookup };

    //--------------------------------------------------------------------------
    // Iterator
    //--------------------------------------------------------------------------
private:
    // (container, position) pair; dereferencing asserts the position is in
    // range.
    template <bool IsConst>
    class iterator_impl
    {
        using container_ptr    = std::conditional_t<IsConst, hash_vec const *, hash_vec *>;
        using mapped_reference = std::conditional_t<IsConst, mapped_type const &, mapped_type &>;

    public:
        using iterator_concept  = std::random_access_iterator_tag;
        using iterator_category = std::random_access_iterator_tag;
        using value_type        = hash_vec::value_type;
        using difference_type   = hash_vec::difference_type;
        using reference         = std::conditional_t<IsConst, hash_vec::const_reference, hash_vec::reference>;

        // operator-> target: holds the (key, value) reference pair for the
        // duration of the member access
        struct pointer
        {
            reference entry;
            constexpr reference const * operator->() const noexcept { return &entry; }
        };

        constexpr iterator_impl() noexcept = default;

        constexpr iterator_impl( iterator_impl<!IsConst> const & other ) noexcept requires IsConst
            : owner_{ other.owner_ }, pos_{ other.pos_ } {}

        constexpr reference operator* () const noexcept { return owner_->entry_at( pos_ ); }
        constexpr pointer   operator->() const noexcept { return { **this }; }

        constexpr reference operator[]( difference_type const n ) const noexcept { return *( *this + n ); }

        [[ nodiscard ]] constexpr key_type const & key  () const noexcept { return owner_->entry_at( pos_ ).first;  }
        [[ nodiscard ]] constexpr mapped_reference value() const noexcept { return owner_->entry_at( pos_ ).second; }

        /// Position of the referenced entry
        [[ nodiscard ]] constexpr size_type position() const noexcept { return pos_; }

        constexpr iterator_impl & operator+=( difference_type const n ) noexcept
        {
            pos_ = static_cast<size_type>( static_cast<difference_type>( pos_ ) + n );
            return *this;
        }
        constexpr iterator_impl & operator-=( difference_type const n ) noexcept { return *this += -n; }

        constexpr iterator_impl & operator++() noexcept { ++pos_; return *this; }
        constexpr iterator_impl & operator--() noexcept { --pos_; return *this; }
        constexpr iterator_impl   operator++( int ) noexcept { auto const prev{ *this }; ++pos_; return prev; }
        constexpr iterator_impl   operator--( int ) noexcept { auto const prev{ *this }; --pos_; return prev; }

        friend constexpr iterator_impl operator+( iterator_impl it, difference_type const n ) noexcept { return it += n; }
        friend constexpr iterator_impl operator+( difference_type const n, iterator_impl it ) noexcept { return it += n; }
        friend constexpr iterator_impl operator-( iterator_impl it, difference_type const n ) noexcept { return it -= n; }

        friend constexpr difference_type operator-( iterator_impl const & a, iterator_impl const & b ) noexcept
        {
            BOOST_ASSERT_MSG( a.owner_ == b.owner_, "hash_vec: subtracting iterators into different containers" );
            return static_cast<difference_type>( a.pos_ ) - static_cast<difference_type>( b.pos_ );
        }

        friend constexpr bool operator==( iterator_impl const & a, iterator_impl const & b ) noexcept
        {
            BOOST_ASSERT_MSG( a.owner_ == b.owner_, "hash_vec: comparing iterators into different containers" );
            return a.pos_ == b.pos_;
        }
        friend constexpr std::strong_ordering operator<=>( iterator_impl const & a, iterator_impl const & b ) noexcept
        {
            BOOST_ASSERT_MSG( a.owner_ == b.owner_, "hash_vec: comparing iterators into different containers" );
            return a.pos_ <=> b.pos_;
        }

    private:
        friend hash_vec;
        friend iterator_impl<!IsConst>;

        constexpr iterator_impl( container_ptr const owner, size_type const pos ) noexcept : owner_{ owner }, pos_{ pos } {}

        container_ptr owner_{ nullptr };
        size_type     pos_  { 0 };
    }; // iterator_impl

public:
    using iterator               = iterator_impl<false>;
    using const_iterator         = iterator_impl<true>;
    using reverse_iterator       = std::reverse_iterator<iterator>;
    using const_reverse_iterator = std::reverse_iterator<const_iterator>;

    //--------------------------------------------------------------------------
    // Constructors
    //--------------------------------------------------------------------------
    hash_vec() = default;

    explicit hash_vec( hasher const & hash, key_equal const & equal = key_equal{} )
        : index_{ hash, equal } {}

    hash_vec( with_capacity_t, size_type const n ) { reserve( n ); }

    // Range construction applies push() semantics to every entry in order:
    // of duplicate keys the last one wins, both value and position.
    template <std::input_iterator InputIt>
    hash_vec( InputIt first, InputIt const last )
    {
        if constexpr ( std::forward_iterator<InputIt> )
            reserve( static_cast<size_type>( std::distance( first, last ) ) );
        for ( ; first != last; ++first )
            push( value_type( *first ) );
    }

    template <std::ranges::input_range R>
    hash_vec( std::from_range_t, R && rg )
    {
        append_range( std::forward<R>( rg ) );
    }

    hash_vec( std::initializer_list<value_type> const il )
        : hash_vec( il.begin(), il.end() ) {}

    hash_vec( hash_vec const & ) = default;
    hash_vec( hash_vec && )      = default;

    hash_vec & operator=( hash_vec const & ) = default;
    hash_vec & operator=( hash_vec && )      = default;

    hash_vec & operator=( std::initializer_list<value_type> const il ) {
        clear();
        append_range( il );
        return *this;
    }

    //--------------------------------------------------------------------------
    // Iterators
    //--------------------------------------------------------------------------
    iterator       begin()       noexcept { return make_iter( 0      ); }
    const_iterator begin() const noexcept { return make_iter( 0      ); }
    iterator       end  ()       noexcept { return make_iter( size() ); }
    const_iterator end  () const noexcept { return make_iter( size() ); }

    const_iterator cbegin() const noexcept { return begin(); }
    const_iterator cend  () const noexcept { return end  (); }

    reverse_iterator       rbegin()       noexcept { return reverse_iterator      { end  () }; }
    const_reverse_iterator rbegin() const noexcept { return const_reverse_iterator{ end  () }; }
    reverse_iterator       rend  ()       noexcept { return reverse_iterator      { begin() }; }
    const_reverse_iterator rend  () const noexcept { return const_reverse_iterator{ begin() }; }

    const_reverse_iterator crbegin() const noexcept { return rbegin(); }
    const_reverse_iterator crend  () const noexcept { return rend  (); }

    iterator       nth( size_type const pos )       noexcept { BOOST_ASSERT( pos <= size() ); return make_iter( pos ); }
    const_iterator nth( size_type const pos ) const noexcept { BOOST_ASSERT( pos <= size() ); return make_iter( pos ); }

    //--------------------------------------------------------------------------
    // Capacity
    //--------------------------------------------------------------------------
    [[ nodiscard ]] bool      empty() const noexcept { return store_.empty(); }
    [[ nodiscard ]] size_type size () const noexcept { return store_.size (); }

    [[ nodiscard ]] size_type capacity() const noexcept { return std::min( store_.capacity(), index_.capacity() ); }

    void reserve( size_type const n )
    {
        store_.reserve( n );
        index_.reserve( n );
    }

    void shrink_to_fit()
    {
        store_.shrink_to_fit();
        index_.shrink_to_fit();
    }

    /// Reduces the capacity to (at least) max( min_capacity, size() ).
    void shrink_to( size_type const min_capacity )
    {
        store_.shrink_to( min_capacity );
        index_.shrink_to( min_capacity );
    }

    //--------------------------------------------------------------------------
    // Positional access
    //--------------------------------------------------------------------------
    reference       operator[]( size_type const pos )       noexcept { return entry_at( pos ); }
    const_reference operator[]( size_type const pos ) const noexcept { return entry_at( pos ); }

    reference       at( size_type const pos )       { check_position( pos, "hashvec::hash_vec::at" ); return (*this)[ pos ]; }
    const_reference at( size_type const pos ) const { check_position( pos, "hashvec::hash_vec::at" ); return (*this)[ pos ]; }

    reference       front()       noexcept { return (*this)[ 0 ]; }
    const_reference front() const noexcept { return (*this)[ 0 ]; }
    reference       back ()       noexcept { return (*this)[ size() - 1 ]; }
    const_reference back () const noexcept { return (*this)[ size() - 1 ]; }

    //--------------------------------------------------------------------------
    // Lookup (absence is an expected outcome: nullptr/nullopt/end()/false)
    //--------------------------------------------------------------------------
    template <LookupType<transparent_lookup, key_type> K = key_type>
    [[ nodiscard ]] mapped_type * get( K const & key )
    {
        auto const pos{ index_.lookup( key ) };
        return pos ? &store_.values[ *pos ] : nullptr;
    }
    template <LookupType<transparent_lookup, key_type> K = key_type>
    [[ nodiscard ]] mapped_type const * get( K const & key ) const
    {
        auto const pos{ index_.lookup( key ) };
        return pos ? &store_.values[ *pos ] : nullptr;
    }

    template <LookupType<transparent_lookup, key_type> K = key_type>
    [[ nodiscard ]] std::optional<size_type> index( K const & key ) const { return index_.lookup( key ); }

    template <LookupType<transparent_lookup, key_type> K = key_type>
    [[ nodiscard ]] iterator find( K const & key )
    {
        auto const pos{ index_.lookup( key ) };
        return pos ? make_iter( *pos ) : end();
    }
    template <LookupType<transparent_lookup, key_type> K = key_type>
    [[ nodiscard ]] const_iterator find( K const & key ) const
    {
        auto const pos{ index_.lookup( key ) };
        return pos ? make_iter( *pos ) : end();
    }

    template <LookupType<transparent_lookup, key_type> K = key_type>
    [[ nodiscard ]] bool contains( K const & key ) const { return index_.contains( key ); }

    //--------------------------------------------------------------------------
    // Modifiers
    //--------------------------------------------------------------------------

    /// HashMap-style upsert: overwrites the value of an existing key in place
    /// (its position is unchanged) or appends a new entry at the back.
    /// Returns the entry and whether it was newly added.
    template <typename K, typename M>
    std::pair<iterator, bool> insert( K && key, M && value )
    {
        if ( auto const pos{ index_.lookup( key ) } )
        {
            store_.values[ *pos ] = std::forward<M>( value );
            return { make_iter( *pos ), false };
        }
        return { append_new( std::forward<K>( key ), std::forward<M>( value ) ), true };
    }

    /// Vector-style upsert: the entry ends up at the back. An existing entry
    /// is replaced by the pushed key and value and moved to the back, the
    /// entries that followed it move one position down (size is unchanged).
    template <typename K, typename M>
    std::pair<iterator, bool> push( K && key, M && value )
    {
        auto const pos{ index_.lookup( key ) };
        if ( !pos )
            return { append_new( std::forward<K>( key ), std::forward<M>( value ) ), true };

        // the pushed key is equivalent to the stored one but need not be
        // identical: both the store and the index take the pushed one
        key_type pushed_key( std::forward<K>( key ) );
        index_.rekey( store_.keys[ *pos ], pushed_key, *pos );
        store_.keys  [ *pos ] = std::move( pushed_key );
        store_.values[ *pos ] = std::forward<M>( value );
        relocate_to_back( *pos );
        return { make_iter( size() - 1 ), false };
    }

    std::pair<iterator, bool> push( value_type entry ) { return push( std::move( entry.first ), std::move( entry.second ) ); }

    /// Inserts a new entry at pos (<= size()), shifting the entries at and
    /// after pos one position up. An existing key leaves the container
    /// unchanged: { existing entry, false } is returned.
    template <typename K, typename M>
    std::pair<iterator, bool> insert_at( size_type const pos, K && key, M && value )
    {
        if ( pos > size() ) [[ unlikely ]]
            detail::throw_out_of_range( "hashvec::hash_vec::insert_at" );
        if ( auto const existing{ index_.lookup( key ) } )
            return { make_iter( *existing ), false };
        if ( pos == size() )
            return { append_new( std::forward<K>( key ), std::forward<M>( value ) ), true };

        store_.insert_element_at( pos, std::forward<K>( key ), std::forward<M>( value ) );
        index_.shift_positions_above( pos, +1 );
        try {
            index_.set( store_.keys[ pos ], pos );
        } catch ( ... ) {
            index_.shift_positions_above( pos, -1 );
            store_.erase_element_at( pos );
            throw;
        }
        verify();
        return { make_iter( pos ), true };
    }

    /// Changes the key of an entry, preserving its position and value.
    /// Returns:
    ///   - { entry, true }            on success (also for new == old),
    ///   - { end(), false }           if old_key is not present,
    ///   - { colliding entry, false } if new_key already names another entry
    ///                                (nothing is changed).
    template <LookupType<transparent_lookup, key_type> K = key_type>
    std::pair<iterator, bool> rename( K const & old_key, key_type new_key )
    {
        auto const pos{ index_.lookup( old_key ) };
        if ( !pos )
            return { end(), false };
        if ( auto const other{ index_.lookup( new_key ) } )
            return { make_iter( *other ), *other == *pos };

        // old_key may refer to the stored key: only the stored copy is used
        // from here on (and it is overwritten last).
        index_.set   ( new_key, *pos );
        index_.remove( store_.keys[ *pos ] );
        store_.keys[ *pos ] = std::move( new_key );
        verify();
        return { make_iter( *pos ), true };
    }

    /// Removes the entry with the given key (the following entries move one
    /// position down) and returns its value.
    template <LookupType<transparent_lookup, key_type> K = key_type>
    std::optional<mapped_type> remove( K const & key )
    {
        auto const pos{ index_.lookup( key ) };
        if ( !pos )
            return std::nullopt;
        return std::move( take_at( *pos ).second );
    }

    /// Like remove() but returns both the stored key and the value.
    template <LookupType<transparent_lookup, key_type> K = key_type>
    std::optional<value_type> remove_entry( K const & key )
    {
        auto const pos{ index_.lookup( key ) };
        if ( !pos )
            return std::nullopt;
        return take_at( *pos );
    }

    iterator erase( iterator const pos ) { return erase( const_iterator{ pos } ); }

    iterator erase( const_iterator const pos )
    {
        auto const idx{ pos.position() };
        BOOST_ASSERT( idx < size() );
        index_.remove( store_.keys[ idx ] );
        store_.erase_element_at( idx );
        if ( idx != size() )
            index_.shift_positions_above( idx, -1 );
        verify();
        return make_iter( idx );
    }

    /// Removes and returns the last entry (std::nullopt if empty).
    std::optional<value_type> pop()
    {
        if ( empty() )
            return std::nullopt;
        return take_at( size() - 1 );
    }

    /// Swaps the positions of the entries with the given keys. Returns false
    /// (and does nothing) if either key is not present.
    bool swap_keys
    (
        LookupType<transparent_lookup, key_type> auto const & key_a,
        LookupType<transparent_lookup, key_type> auto const & key_b
    )
    {
        auto const pos_a{ index_.lookup( key_a ) };
        auto const pos_b{ index_.lookup( key_b ) };
        if ( !pos_a || !pos_b )
            return false;
        if ( *pos_a != *pos_b )
            swap_positions( *pos_a, *pos_b );
        return true;
    }

    /// Swaps the entries at two positions (throws std::out_of_range if
    /// either position is invalid).
    void swap_indices( size_type const pos_a, size_type const pos_b )
    {
        check_position( std::max( pos_a, pos_b ), "hashvec::hash_vec::swap_indices" );
        if ( pos_a != pos_b )
            swap_positions( pos_a, pos_b );
    }

    /// Pushes every entry of source (in its order) and empties it. If a push
    /// throws, *this keeps the entries transferred until then, the remaining
    /// ones are dropped and source is left empty.
    void append( hash_vec & source )
    {
        if ( this == &source )
            return;
        auto transferred{ source.extract() };
        reserve( size() + transferred.size() );
        for ( size_type pos{ 0 }; pos < transferred.size(); ++pos )
            push( std::move( transferred.keys[ pos ] ), std::move( transferred.values[ pos ] ) );
    }

    void append( hash_vec && source ) { append( source ); }

    /// Pushes every (key, value) of rg in order.
    template <std::ranges::input_range R>
    void append_range( R && rg )
    {
        if constexpr ( std::ranges::sized_range<R> )
            reserve( size() + static_cast<size_type>( std::ranges::size( rg ) ) );
        for ( auto && entry : rg )
            push( value_type( std::forward<decltype( entry )>( entry ) ) );
    }

    void clear() noexcept
    {
        store_.clear();
        index_.clear();
    }

    void swap( hash_vec & other ) noexcept
    {
        store_.swap_storage( other.store_ );
        index_.swap( other.index_ );
    }

    friend void swap( hash_vec & a, hash_vec & b ) noexcept { a.swap( b ); }

    //--------------------------------------------------------------------------
    // Extraction (consuming iteration)
    //--------------------------------------------------------------------------

    /// Moves the entries out (as parallel key and value containers, in
    /// order), leaving the hash_vec empty.
    containers extract() noexcept( std::is_nothrow_move_constructible_v<store_type> )
    {
        containers entries{ std::move( store_ ) };
        clear();
        return entries;
    }

    //--------------------------------------------------------------------------
    // Observers
    //--------------------------------------------------------------------------
    [[ nodiscard ]] hasher    hash_function() const { return index_.hash_function(); }
    [[ nodiscard ]] key_equal key_eq       () const { return index_.key_eq       (); }

    [[ nodiscard ]] key_container_type    const & keys  () const noexcept { return store_.keys;   }
    [[ nodiscard ]] mapped_container_type const & values() const noexcept { return store_.values; }

    /// Full (linear) check of the store/index consistency invariants.
    [[ nodiscard ]] bool consistent() const
    {
        if ( index_.size() != store_.size() )
            return false;
        for ( size_type pos{ 0 }; pos < size(); ++pos )
        {
            auto const indexed{ index_.lookup( store_.keys[ pos ] ) };
            if ( !indexed || *indexed != pos )
                return false;
        }
        return true;
    }

    /// Debug dump in the form {k0: v0, k1: v1, ...} (hash_vec_print.hpp).
    void print() const;

    //--------------------------------------------------------------------------
    // Comparison: same entries in the same order
    //--------------------------------------------------------------------------
    friend bool operator==( hash_vec const & a, hash_vec const & b ) { return a.store_ == b.store_; }

    //--------------------------------------------------------------------------
    // Private helpers
    //--------------------------------------------------------------------------
private:
    iterator       make_iter( size_type const pos )       noexcept { return { this, pos }; }
    const_iterator make_iter( size_type const pos ) const noexcept { return { this, pos }; }

    reference entry_at( size_type const pos ) noexcept
    {
        BOOST_ASSERT_MSG( pos < size(), "hash_vec position out of range (iterator invalidated by a modification?)" );
        return { store_.keys[ pos ], store_.values[ pos ] };
    }
    const_reference entry_at( size_type const pos ) const noexcept
    {
        BOOST_ASSERT_MSG( pos < size(), "hash_vec position out of range (iterator invalidated by a modification?)" );
        return { store_.keys[ pos ], store_.values[ pos ] };
    }

    void check_position( size_type const pos, char const * const what ) const
    {
        if ( pos >= size() ) [[ unlikely ]]
            detail::throw_out_of_range( what );
    }

    void verify() const noexcept { BOOST_ASSERT( index_.size() == store_.size() ); }

    template <typename K, typename M>
    iterator append_new( K && key, M && value )
    {
        auto const pos{ size() };
        store_.append( std::forward<K>( key ), std::forward<M>( value ) );
        try {
            index_.set( store_.keys[ pos ], pos );
        } catch ( ... ) {
            store_.pop_back();
            throw;
        }
        verify();
        return make_iter( pos );
    }

    void relocate_to_back( size_type const pos )
    {
        auto const last{ size() - 1 };
        if ( pos == last )
            return;
        index_.shift_positions_above( pos, -1 );
        index_.update( store_.keys[ pos ], last );
        store_.rotate_to_back( pos );
        verify();
    }

    void swap_positions( size_type const pos_a, size_type const pos_b )
    {
        BOOST_ASSERT( pos_a != pos_b );
        index_.update( store_.keys[ pos_a ], pos_b );
        index_.update( store_.keys[ pos_b ], pos_a );
        store_.swap_elements( pos_a, pos_b );
        verify();
    }

    // Unlinks the entry at pos and returns it (moved out).
    value_type take_at( size_type const pos )
    {
        BOOST_ASSERT( pos < size() );
        value_type entry{ std::move( store_.keys[ pos ] ), std::move( store_.values[ pos ] ) };
        index_.remove( entry.first );
        store_.erase_element_at( pos );
        if ( pos != size() ) // no shifting after a removal from the back
            index_.shift_positions_above( pos, -1 );
        verify();
        return entry;
    }

    //--------------------------------------------------------------------------
    // Data members
    //--------------------------------------------------------------------------
    store_type store_;
    index_type index_;
}; // class hash_vec

//------------------------------------------------------------------------------
// Deduction guides
//------------------------------------------------------------------------------

template <std::input_iterator InputIt>
hash_vec( InputIt, InputIt )
    -> hash_vec<std::remove_const_t<typename std::iterator_traits<InputIt>::value_type::first_type>,
                typename std::iterator_traits<InputIt>::value_type::second_type>;

template <std::ranges::input_range R>
hash_vec( std::from_range_t, R && )
    -> hash_vec<std::remove_const_t<typename std::ranges::range_value_t<R>::first_type>,
                typename std::ranges::range_value_t<R>::second_type>;

template <typename Key, typename T>
hash_vec( std::initializer_list<std::pair<Key, T>> )
    -> hash_vec<Key, T>;

//------------------------------------------------------------------------------
} // namespace hashvec
//------------------------------------------------------------------------------
