#include <ziptree/zip_tree.hpp>

#include <algorithm>
#include <stdexcept>
//------------------------------------------------------------------------------
namespace ziptree
{
//------------------------------------------------------------------------------

// https://arxiv.org/abs/1806.06726
// https://arxiv.org/abs/2307.07660
// https://en.wikipedia.org/wiki/Order_statistic_tree

zip_tree_base::zip_tree_base( zip_tree_base && other ) noexcept
    :
    nodes_  { std::move( other.nodes_ ) },
    root_   { std::exchange( other.root_, node_slot::null ) },
    version_{ other.version_ }
{
    other.nodes_.clear();
    other.structure_changed();
}

zip_tree_base & zip_tree_base::operator=( zip_tree_base const & other )
{
    nodes_   = other.nodes_;
    root_    = other.root_;
    version_ = std::max( version_, other.version_ ) + 1;
    return *this;
}

zip_tree_base & zip_tree_base::operator=( zip_tree_base && other ) noexcept
{
    nodes_   = std::move( other.nodes_ );
    root_    = std::exchange( other.root_, node_slot::null );
    version_ = std::max( version_, other.version_ ) + 1;
    other.nodes_.clear();
    other.structure_changed();
    return *this;
}

void zip_tree_base::swap( zip_tree_base & other ) noexcept
{
    using std::swap;
    swap( this->nodes_, other.nodes_ );
    swap( this->root_ , other.root_  );
    // cursors issued by either side must not survive the exchange
    this->version_ = other.version_ = std::max( this->version_, other.version_ ) + 1;
}

void zip_tree_base::clear() noexcept
{
    nodes_.clear();
    root_ = node_slot::null;
    structure_changed();
}

[[ gnu::cold ]]
void zip_tree_base::reserve( size_type const new_capacity )
{
    if ( new_capacity > max_size() ) [[ unlikely ]]
        throw std::length_error( "ziptree: requested capacity exceeds the addressable node count" );
    nodes_.reserve( new_capacity );
}

std::uint32_t zip_tree_base::left_count( node_slot const slot ) const noexcept
{
    auto const left{ node( slot ).left };
    return left ? node( left ).count : 0;
}

node_slot zip_tree_base::leftmost( node_slot subtree_root ) const noexcept
{
    if ( subtree_root )
    {
        while ( node( subtree_root ).left )
            subtree_root = node( subtree_root ).left;
    }
    return subtree_root;
}

node_slot zip_tree_base::rightmost( node_slot subtree_root ) const noexcept
{
    if ( subtree_root )
    {
        while ( node( subtree_root ).right )
            subtree_root = node( subtree_root ).right;
    }
    return subtree_root;
}

node_slot zip_tree_base::minimum() const noexcept { return leftmost ( root_ ); }
node_slot zip_tree_base::maximum() const noexcept { return rightmost( root_ ); }

node_slot zip_tree_base::successor( node_slot pos ) const noexcept
{
    BOOST_ASSERT( pos );
    if ( auto const right{ node( pos ).right } )
        return leftmost( right );

    auto parent{ node( pos ).parent };
    while ( parent && ( node( parent ).right == pos ) )
    {
        pos    = parent;
        parent = node( parent ).parent;
    }
    return parent;
}

node_slot zip_tree_base::predecessor( node_slot pos ) const noexcept
{
    BOOST_ASSERT( pos );
    if ( auto const left{ node( pos ).left } )
        return rightmost( left );

    auto parent{ node( pos ).parent };
    while ( parent && ( node( parent ).left == pos ) )
    {
        pos    = parent;
        parent = node( parent ).parent;
    }
    return parent;
}

node_slot zip_tree_base::at_index( size_type index ) const noexcept
{
    if ( index >= size() )
        return node_slot::null;

    auto pos{ root_ };
    for ( ; ; )
    {
        BOOST_ASSERT( pos );
        auto const preceding{ left_count( pos ) };
        if ( index < preceding )
        {
            pos = node( pos ).left;
        }
        else
        if ( index == preceding )
        {
            return pos;
        }
        else
        {
            index -= preceding + 1;
            pos    = node( pos ).right;
        }
    }
}

node_slot zip_tree_base::new_node( zip_rank const rank )
{
    if ( size() >= max_size() ) [[ unlikely ]]
        throw std::length_error( "ziptree: node arena exhausted" );
    nodes_.push_back( node_header{ .rank = rank } );
    return { static_cast<node_slot::value_type>( nodes_.size() - 1 ) };
}

void zip_tree_base::fix_counts( node_slot first, node_slot const limit ) noexcept
{
    for ( auto pos{ first }; pos && ( pos != limit ); pos = node( pos ).parent )
    {
        auto & hdr{ node( pos ) };
        hdr.count = 1 + left_count( pos ) + ( hdr.right ? node( hdr.right ).count : 0 );
    }
}

node_slot & zip_tree_base::child_slot_of( node_slot const parent, node_slot const child ) noexcept
{
    auto & hdr{ node( parent ) };
    if ( hdr.left == child )
        return hdr.left;
    BOOST_ASSERT( hdr.right == child );
    return hdr.right;
}

// Zip: merges the right spine of the victim's left subtree with the left
// spine of its right subtree, highest rank first (ties favour the left,
// smaller key, side), into the hole left by the victim.
void zip_tree_base::unlink( node_slot const victim ) noexcept
{
    auto const & hdr{ node( victim ) };
    auto left { hdr.left  };
    auto right{ hdr.right };

    auto   owner{ hdr.parent };
    auto * hook { owner ? &child_slot_of( owner, victim ) : &root_ };

    for ( ; ; )
    {
        if ( !left || !right )
        {
            auto const rest{ left ? left : right };
            *hook = rest;
            if ( rest )
                node( rest ).parent = owner;
            break;
        }

        if ( node( left ).rank >= node( right ).rank )
        {
            *hook = left;
            node( left ).parent = owner;
            owner = left;
            hook  = &node( left ).right;
            left  = node( left ).right;
        }
        else
        {
            *hook = right;
            node( right ).parent = owner;
            owner = right;
            hook  = &node( right ).left;
            right = node( right ).left;
        }
    }

    // every rewired node lies on the path from 'owner' up to the root
    fix_counts( owner, node_slot::null );

    auto & detached{ node( victim ) };
    detached.left = detached.right = detached.parent = node_slot::null;
    detached.count = 1;
}

void zip_tree_base::relocate_last_into( node_slot const target ) noexcept
{
    BOOST_ASSERT( *target < nodes_.size() );
    node_slot const last{ static_cast<node_slot::value_type>( nodes_.size() - 1 ) };
    if ( target != last )
    {
        auto & moved{ node( target ) };
        moved = node( last );
        if ( moved.left  ) node( moved.left  ).parent = target;
        if ( moved.right ) node( moved.right ).parent = target;
        if ( moved.parent ) child_slot_of( moved.parent, last ) = target;
        else                root_                               = target;
    }
    nodes_.pop_back();
}

bool zip_tree_base::check_structure() const noexcept
{
    if ( empty() )
        return !root_;
    if ( !root_ || ( *root_ >= size() ) || node( root_ ).parent )
        return false;

    size_type parentless{ 0 };
    for ( node_slot::value_type i{ 0 }; i < size(); ++i )
    {
        node_slot const slot{ i };
        auto const & hdr{ node( slot ) };

        std::uint32_t expected_count{ 1 };
        if ( hdr.left )
        {
            if ( *hdr.left >= size() ) return false;
            auto const & child{ node( hdr.left ) };
            // an equal rank child must hang to the right (the smaller key stays above)
            if ( child.parent != slot || !( child.rank < hdr.rank ) ) return false;
            expected_count += child.count;
        }
        if ( hdr.right )
        {
            if ( *hdr.right >= size() ) return false;
            auto const & child{ node( hdr.right ) };
            if ( child.parent != slot || ( child.rank > hdr.rank ) ) return false;
            expected_count += child.count;
        }
        if ( hdr.count != expected_count )
            return false;

        if ( !hdr.parent )
        {
            ++parentless;
        }
        else
        {
            if ( *hdr.parent >= size() ) return false;
            auto const & parent{ node( hdr.parent ) };
            if ( parent.left != slot && parent.right != slot ) return false;
        }
    }
    // with strictly growing subtree counts towards the root, a single
    // parentless node whose count covers the arena implies every node is reachable
    return ( parentless == 1 ) && ( node( root_ ).count == size() );
}

//------------------------------------------------------------------------------
} // namespace ziptree
//------------------------------------------------------------------------------
