#pragma once

#include "zip_tree.hpp"

#include <ostream>
#include <sstream>
#include <string>
//------------------------------------------------------------------------------
namespace ziptree
{
//------------------------------------------------------------------------------

template <typename Key, typename Storage, typename Comparator, typename Engine>
void zip_tree_impl<Key, Storage, Comparator, Engine>::print_fields( std::ostream & os, node_slot const slot ) const
{
    auto const & hdr{ node( slot ) };
    os << "Key: " << key_of( slot );
    if constexpr ( is_map )
        os << ", Value: " << storage_.values[ *slot ];
    os << ", Rank: (" << hdr.rank.primary() << ", " << hdr.rank.secondary() << "), Count: " << hdr.count;
}

template <typename Key, typename Storage, typename Comparator, typename Engine>
void zip_tree_impl<Key, Storage, Comparator, Engine>::print_subtree
(
    std::ostream      &       os,
    node_slot           const slot,
    std::string         const & prefix,
    bool                const is_left,
    bool                const has_both
) const
{
    if ( !slot )
        return;

    auto const & hdr{ node( slot ) };
    bool const   fork{ is_left && has_both };

    os << prefix << ( fork ? "├── " : "└── " ) << "Idx: " << *slot << ", ";
    print_fields( os, slot );
    os << ", Parent: " << hdr.parent.index << '\n';

    auto const child_prefix{ prefix + ( fork ? "│   " : "    " ) };
    bool const both        { hdr.left && hdr.right };
    print_subtree( os, hdr.left , child_prefix, true , both );
    print_subtree( os, hdr.right, child_prefix, false, both );
}

// pre-order, root first
template <typename Key, typename Storage, typename Comparator, typename Engine>
void zip_tree_impl<Key, Storage, Comparator, Engine>::print_tree( std::ostream & os ) const
{
    print_subtree( os, root_, {}, false, false );
}

template <typename Key, typename Storage, typename Comparator, typename Engine>
void zip_tree_impl<Key, Storage, Comparator, Engine>::print_in_order( std::ostream & os ) const
{
    for ( auto pos{ base::minimum() }; pos; pos = this->successor( pos ) )
    {
        print_fields( os, pos );
        os << '\n';
    }
}

template <typename Key, typename Storage, typename Comparator, typename Engine>
std::string zip_tree_impl<Key, Storage, Comparator, Engine>::to_string() const
{
    std::ostringstream dump;
    print_tree( dump );
    return std::move( dump ).str();
}

//------------------------------------------------------------------------------
} // namespace ziptree
//------------------------------------------------------------------------------
