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
#pragma once

#include "hash_vec.hpp"

#include <cstdio>
#include <print>
//------------------------------------------------------------------------------
namespace hashvec
{
//------------------------------------------------------------------------------

template <typename Key, typename T, typename Hash, typename KeyEqual, typename KC, typename MC>
void hash_vec<Key, T, Hash, KeyEqual, KC, MC>::print() const
{
    if ( empty() )
    {
        std::puts( "{}" );
        return;
    }

    std::putchar( '{' );
    for ( size_type pos{ 0 }; pos < size(); ++pos )
    {
        std::print( "{}: {}", store_.keys[ pos ], store_.values[ pos ] );
        if ( pos < size() - 1U )
            std::print( ", " );
    }
    std::println( "}} [{} entries]", size() );
}

//------------------------------------------------------------------------------
} // namespace hashvec
//------------------------------------------------------------------------------
