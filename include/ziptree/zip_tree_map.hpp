////////////////////////////////////////////////////////////////////////////////
/// Ordered associative container on top of the zip tree engine.
///
/// Keys live in the engine's node-parallel key array and values in a second
/// array indexed by the very same arena slot. Both are owned by
/// detail::paired_storage<K, V>, which grows them together on insertion and
/// relocates them together when an erasure compacts the arena, so a slot
/// handle names the node, its key and its value at once.
///
/// Interface notes:
///   - put(key, value) inserts or overwrites and reports whether it inserted
///   - insert(key) without a value is a deleted function
///   - values are read through cursor::value() or at(key)
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

#include "zip_tree.hpp"

#include <boost/assert.hpp>

#include <functional>
#include <stdexcept>
#include <utility>
//------------------------------------------------------------------------------
namespace ziptree
{
//------------------------------------------------------------------------------

template <typename Key, typename Mapped, typename Comparator = std::less<>, typename Engine = default_random_engine>
class zip_tree_map
    :
    public zip_tree_impl<Key, detail::paired_storage<Key, Mapped>, Comparator, Engine>
{
private:
    using impl_base = zip_tree_impl<Key, detail::paired_storage<Key, Mapped>, Comparator, Engine>;

public:
    using mapped_type   = Mapped;
    using key_const_arg = typename impl_base::key_const_arg;
    using cursor        = typename impl_base::cursor;

    using impl_base::impl_base;

    // Returns true if a new entry was created, false if an existing value was
    // overwritten (which is not a structural change: cursors stay valid).
    bool put( Key key, Mapped value )
    {
        if ( auto const existing{ impl_base::find_slot( key ) } )
        {
            this->storage_.values[ *existing ] = std::move( value );
            return false;
        }
        impl_base::insert_new( std::move( key ), std::move( value ) );
        return true;
    }

    // a node without a value would leave the value array misaligned
    bool insert( Key ) = delete;

    [[ nodiscard ]] Mapped const & at( key_const_arg key ) const
    {
        auto const slot{ impl_base::find_slot( key ) };
        if ( !slot ) [[ unlikely ]]
            throw std::out_of_range( "ziptree::zip_tree_map::at: key not found" );
        return this->storage_.values[ *slot ];
    }

    [[ nodiscard ]] Mapped & at( key_const_arg key )
    {
        auto const slot{ impl_base::find_slot( key ) };
        if ( !slot ) [[ unlikely ]]
            throw std::out_of_range( "ziptree::zip_tree_map::at: key not found" );
        return this->storage_.values[ *slot ];
    }

    friend void swap( zip_tree_map & left, zip_tree_map & right ) noexcept { left.swap( right ); }
}; // class zip_tree_map

//------------------------------------------------------------------------------
} // namespace ziptree
//------------------------------------------------------------------------------
