#pragma once

#include "komparator.hpp"
#include "rank.hpp"

#include <boost/assert.hpp>
#include <boost/config.hpp>
#include <boost/stl_interfaces/iterator_interface.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <iterator>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>
//------------------------------------------------------------------------------
namespace ziptree
{
//------------------------------------------------------------------------------

// https://arxiv.org/abs/1806.06726 Zip Trees (Tarjan, Levy, Timmel)
// https://arxiv.org/abs/2307.07660 Zip-zip Trees: Making Zip Trees More Balanced, Biased, Compact, or Persistent (Gila, Goodrich, Tarjan)

template <typename T>
bool constexpr can_be_passed_in_reg
{
    std::is_trivially_copyable_v<T> &&
    ( sizeof( T ) <= 2 * sizeof( void * ) ) // assuming a sane ABI like SysV
}; // can_be_passed_in_reg


////////////////////////////////////////////////////////////////////////////////
// \class zip_tree_base
//
// The key-independent part of the tree: the node arena (links, ranks and
// subtree counts), the root, and every algorithm that needs no key
// comparisons (zip on erase, compaction, count repair, in-order stepping,
// selection by index).
////////////////////////////////////////////////////////////////////////////////

class zip_tree_base
{
public:
    using size_type       = std::size_t;
    using difference_type = std::make_signed_t<size_type>;
    using index_type      = std::uint32_t;

    struct [[ nodiscard, clang::trivial_abi ]] node_slot // instead of node pointers we store offsets - slots in the arena
    {
        using value_type = std::uint32_t;
        static node_slot const null;
        value_type index{ static_cast<value_type>( -1 ) }; // in-arena index/offset
        [[ gnu::pure ]] value_type operator*() const noexcept { BOOST_ASSERT( index != null.index ); return index; }
        [[ gnu::pure ]] bool operator==( node_slot const other ) const noexcept { return this->index == other.index; }
        [[ gnu::pure ]] explicit operator bool() const noexcept { return index != null.index; }
    }; // struct node_slot

    struct node_header
    {
        node_slot     left  {};
        node_slot     right {};
        node_slot     parent{};
        zip_rank      rank  {};
        std::uint32_t count { 1 }; // nodes in the subtree rooted here
    }; // struct node_header

    // result of index_of() for absent keys
    static index_type constexpr not_found{ static_cast<index_type>( -1 ) };

    [[ gnu::pure ]] bool      empty() const noexcept { return BOOST_UNLIKELY( nodes_.empty() ); }
    [[ gnu::pure ]] size_type size () const noexcept { return nodes_.size(); }
    // the root's subtree count (always equal to size())
    [[ gnu::pure ]] size_type count() const noexcept { return root_ ? node( root_ ).count : 0; }

    // the all-ones handle is reserved for null
    static constexpr size_type max_size() noexcept { return static_cast<size_type>( static_cast<node_slot::value_type>( -1 ) ) - 1; }

    size_type capacity() const noexcept { return nodes_.capacity(); }

protected:
    zip_tree_base() noexcept = default;
    zip_tree_base( zip_tree_base const &  ) = default;
    zip_tree_base( zip_tree_base       && ) noexcept;
    zip_tree_base & operator=( zip_tree_base const &  );
    zip_tree_base & operator=( zip_tree_base       && ) noexcept;
    ~zip_tree_base() noexcept = default;

    void swap( zip_tree_base & other ) noexcept;

    void clear() noexcept;
    void reserve( size_type new_capacity );

    [[ gnu::pure ]] node_header       & node( node_slot const slot )       noexcept { return nodes_[ *slot ]; }
    [[ gnu::pure ]] node_header const & node( node_slot const slot ) const noexcept { return nodes_[ *slot ]; }

    [[ gnu::pure ]] node_slot root() const noexcept { return root_; }

    [[ gnu::pure ]] std::uint32_t left_count( node_slot slot ) const noexcept;

    [[ gnu::pure ]] node_slot leftmost ( node_slot subtree_root ) const noexcept;
    [[ gnu::pure ]] node_slot rightmost( node_slot subtree_root ) const noexcept;
    [[ gnu::pure ]] node_slot minimum() const noexcept;
    [[ gnu::pure ]] node_slot maximum() const noexcept;

    [[ gnu::pure ]] node_slot successor  ( node_slot ) const noexcept;
    [[ gnu::pure ]] node_slot predecessor( node_slot ) const noexcept;

    [[ gnu::pure ]] node_slot at_index( size_type index ) const noexcept;

    // appends an unlinked node at the end of the arena
    node_slot new_node( zip_rank );

    // recomputes subtree counts walking up from 'first' until (excluding) 'limit'
    void fix_counts( node_slot first, node_slot limit ) noexcept;

    // detaches the node from the tree, zipping its subtrees together
    void unlink( node_slot victim ) noexcept;
    // moves the last arena slot into the (detached) 'target' slot and shrinks the arena
    void relocate_last_into( node_slot target ) noexcept;

    // parent/child symmetry, heap order, counts, single root, reachability
    [[ gnu::pure ]] bool check_structure() const noexcept;

    [[ gnu::pure ]] std::uint32_t version() const noexcept { return version_; }
    void structure_changed() noexcept { ++version_; }

    node_slot & child_slot_of( node_slot parent, node_slot child ) noexcept;

protected:
    std::vector<node_header> nodes_;
    node_slot                root_;
    // bumped by every structural mutation: cursors compare against it
    std::uint32_t            version_{};
}; // class zip_tree_base

inline constexpr zip_tree_base::node_slot const zip_tree_base::node_slot::null{ static_cast<value_type>( -1 ) };

using node_slot = zip_tree_base::node_slot;


namespace detail
{
    ////////////////////////////////////////////////////////////////////////////
    // Per-slot payload arrays, index-aligned with the node arena. Set and map
    // diverge only here: the map carries a second, value, array which is
    // relocated in the very same call as the key array.
    ////////////////////////////////////////////////////////////////////////////

    template <typename Key>
    struct key_storage
    {
        static_assert( std::is_nothrow_move_assignable_v<Key>, "compaction must not fail half way" );

        std::vector<Key> keys;

        void append( Key && key ) { keys.push_back( std::move( key ) ); }

        void pop_back() noexcept { keys.pop_back(); }

        void relocate_last_into( node_slot::value_type const target ) noexcept
        {
            BOOST_ASSERT( target < keys.size() );
            if ( target != keys.size() - 1 )
                keys[ target ] = std::move( keys.back() );
            keys.pop_back();
        }

        void reserve( std::size_t const capacity ) { keys.reserve( capacity ); }
        void clear() noexcept { keys.clear(); }
        void swap( key_storage & other ) noexcept { keys.swap( other.keys ); }
    }; // struct key_storage

    template <typename Key, typename Mapped>
    struct paired_storage
    {
        static_assert( std::is_nothrow_move_assignable_v<Key   >, "compaction must not fail half way" );
        static_assert( std::is_nothrow_move_assignable_v<Mapped>, "compaction must not fail half way" );

        std::vector<Key   > keys;
        std::vector<Mapped> values;

        // synchronized append (exception-safe)
        void append( Key && key, Mapped && value )
        {
            keys.push_back( std::move( key ) );
            try {
                values.push_back( std::move( value ) );
            } catch ( ... ) {
                keys.pop_back();
                throw;
            }
        }

        void pop_back() noexcept
        {
            keys  .pop_back();
            values.pop_back();
        }

        void relocate_last_into( node_slot::value_type const target ) noexcept
        {
            BOOST_ASSERT( keys.size() == values.size() );
            BOOST_ASSERT( target < keys.size() );
            if ( target != keys.size() - 1 )
            {
                keys  [ target ] = std::move( keys  .back() );
                values[ target ] = std::move( values.back() );
            }
            pop_back();
        }

        void reserve( std::size_t const capacity )
        {
            keys  .reserve( capacity );
            values.reserve( capacity );
        }
        void clear() noexcept
        {
            keys  .clear();
            values.clear();
        }
        void swap( paired_storage & other ) noexcept
        {
            keys  .swap( other.keys   );
            values.swap( other.values );
        }
    }; // struct paired_storage

    template <typename Storage>
    concept has_values = requires( Storage & storage ) { storage.values; };
} // namespace detail


////////////////////////////////////////////////////////////////////////////////
// \class zip_tree_impl
//
// Key-dependent half of the tree: descents (find, bounds, rank queries),
// insertion with unzipping and slot removal coupling the node arena with the
// payload arrays.
////////////////////////////////////////////////////////////////////////////////

template <typename Key, typename Storage, typename Comparator, typename Engine>
class zip_tree_impl
    :
    public  zip_tree_base,
    private komparator<Comparator>
{
    static_assert( ordering_predicate<Comparator, Key> );

protected:
    using base       = zip_tree_base;
    using komparator_base = ziptree::komparator<Comparator>;

    using base::node;
    using base::root_;
    using komparator_base::le;
    using komparator_base::ge;
    using komparator_base::leq;
    using komparator_base::geq;
    using komparator_base::eq;

    static constexpr bool is_map{ detail::has_values<Storage> };

public:
    using key_type      = Key;
    using value_type    = Key;
    using key_compare   = Comparator;
    using engine_type   = Engine;
    using key_const_arg = std::conditional_t<can_be_passed_in_reg<Key>, Key const, Key const &>;

    class cursor;

    using       iterator = cursor;
    using const_iterator = cursor;

    using base::empty;
    using base::size;
    using base::count;
    using base::max_size;
    using base::not_found;

    zip_tree_impl() = default;
    explicit zip_tree_impl( Comparator const & comp ) : komparator_base{ comp } {}
    zip_tree_impl( Comparator const & comp, Engine engine ) : komparator_base{ comp }, ranks_{ std::move( engine ) } {}

    zip_tree_impl( zip_tree_impl const &  ) = default;
    zip_tree_impl( zip_tree_impl       && ) = default;
    zip_tree_impl & operator=( zip_tree_impl const &  ) = default;
    zip_tree_impl & operator=( zip_tree_impl       && ) = default;

    [[ nodiscard ]] cursor begin() const noexcept { return make_cursor( base::minimum() ); }
    [[ nodiscard ]] cursor end  () const noexcept { return make_cursor( node_slot::null ); }

    [[ nodiscard ]] cursor new_iterator        () const noexcept { return begin(); }
    [[ nodiscard ]] cursor new_reverse_iterator() const noexcept { return make_cursor( base::maximum() ); }

    [[ nodiscard ]] cursor minimum() const noexcept { return begin(); }
    [[ nodiscard ]] cursor maximum() const noexcept { return new_reverse_iterator(); }

    [[ nodiscard ]] cursor find       ( key_const_arg key ) const noexcept { return make_cursor( find_slot       ( key ) ); }
    [[ nodiscard ]] cursor floor      ( key_const_arg key ) const noexcept { return make_cursor( floor_slot      ( key ) ); }
    [[ nodiscard ]] cursor ceiling    ( key_const_arg key ) const noexcept { return make_cursor( ceiling_slot    ( key ) ); }
    [[ nodiscard ]] cursor lower_bound( key_const_arg key ) const noexcept { return make_cursor( ceiling_slot    ( key ) ); }
    [[ nodiscard ]] cursor upper_bound( key_const_arg key ) const noexcept { return make_cursor( upper_bound_slot( key ) ); }

    [[ nodiscard ]] bool contains( key_const_arg key ) const noexcept { return static_cast<bool>( find_slot( key ) ); }

    [[ nodiscard ]] cursor     at_index( size_type const index ) const noexcept { return make_cursor( base::at_index( index ) ); }
    [[ nodiscard ]] index_type index_of( key_const_arg key ) const noexcept;

    // returns false if the key was not present
    bool erase( key_const_arg key ) noexcept { return remove_slot( find_slot( key ) ); }
    // returns false for an empty or stale cursor and for one issued by another container
    bool erase( cursor const & pos ) noexcept
    {
        return ( pos.tree_ == this ) && !pos.empty() && remove_slot( pos.pos_ );
    }

    void clear() noexcept
    {
        base::clear();
        storage_.clear();
    }

    void reserve( size_type const new_capacity )
    {
        base::reserve( new_capacity );
        storage_.reserve( new_capacity );
    }

    void swap( zip_tree_impl & other ) noexcept
    {
        base::swap( other );
        storage_.swap( other.storage_ );
        komparator_base::swap( other );
        ranks_.swap( other.ranks_ );
    }

    [[ nodiscard ]] Comparator const & comp() const noexcept { return komparator_base::comp(); }

    [[ nodiscard ]] Engine & engine() noexcept { return ranks_.engine(); }

    // full verification: structure (see zip_tree_base::check_structure) plus
    // strictly ascending in-order key sequence
    [[ nodiscard ]] bool check_invariants() const noexcept;

    // diagnostics (include zip_tree_print.hpp)
    void        print_tree    ( std::ostream & ) const;
    void        print_in_order( std::ostream & ) const;
    std::string to_string     (                ) const;

protected:
    [[ gnu::pure ]] Key const & key_of( node_slot const slot ) const noexcept { return storage_.keys[ *slot ]; }

    [[ nodiscard ]] cursor make_cursor( node_slot const slot ) const noexcept { return { *this, slot }; }

    [[ gnu::pure ]] node_slot find_slot       ( key_const_arg ) const noexcept;
    [[ gnu::pure ]] node_slot floor_slot      ( key_const_arg ) const noexcept;
    [[ gnu::pure ]] node_slot ceiling_slot    ( key_const_arg ) const noexcept;
    [[ gnu::pure ]] node_slot upper_bound_slot( key_const_arg ) const noexcept;

    // inserts a key known to be absent, along with its payload (mapped value)
    template <typename... Payload>
    void insert_new( Key && key, Payload &&... payload );

    bool remove_slot( node_slot ) noexcept;

private:
    // does the node at 'slot' stay above a new node of the given rank and key?
    [[ gnu::pure ]] bool outranks( node_slot const slot, zip_rank const rank, Key const & key ) const noexcept
    {
        auto const slot_rank{ node( slot ).rank };
        return ( slot_rank > rank ) || ( ( slot_rank == rank ) && le( key_of( slot ), key ) );
    }

    void link  ( node_slot new_node ) noexcept;
    void unzip ( node_slot new_node, node_slot subtree ) noexcept;

    void print_subtree( std::ostream &, node_slot, std::string const & prefix, bool is_left, bool has_both ) const;
    void print_fields ( std::ostream &, node_slot ) const;

protected:
    Storage                storage_;
    rank_generator<Engine> ranks_;
}; // class zip_tree_impl


////////////////////////////////////////////////////////////////////////////////
// \class zip_tree_impl::cursor
//
// A view into the container's arena: a slot handle plus the container's
// structural version at the time of issue. Any later insertion or erasure
// (other than erase( *this ) itself) makes the cursor report empty().
////////////////////////////////////////////////////////////////////////////////

template <typename Key, typename Storage, typename Comparator, typename Engine>
class zip_tree_impl<Key, Storage, Comparator, Engine>::cursor
    :
    public boost::stl_interfaces::iterator_interface
    <
#   if !BOOST_STL_INTERFACES_USE_DEDUCED_THIS
        cursor,
#   endif
        std::bidirectional_iterator_tag,
        Key const
    >
{
private:
    using impl = boost::stl_interfaces::iterator_interface
    <
#   if !BOOST_STL_INTERFACES_USE_DEDUCED_THIS
        cursor,
#   endif
        std::bidirectional_iterator_tag,
        Key const
    >;

    friend class zip_tree_impl;

    cursor( zip_tree_impl const & tree, node_slot const pos ) noexcept : tree_{ &tree }, pos_{ pos }, version_{ tree.version() } {}

public:
    constexpr cursor() noexcept = default;

    // exhausted, constructed empty or invalidated by a structural mutation
    [[ gnu::pure ]] bool empty() const noexcept { return !pos_ || ( tree_->version() != version_ ); }

    [[ gnu::pure ]] node_slot slot  () const noexcept { return empty() ? node_slot::null : pos_; }
    [[ gnu::pure ]] node_slot parent() const noexcept { return empty() ? node_slot::null : tree_->node( pos_ ).parent; }

    Key const & key() const noexcept
    {
        BOOST_ASSERT_MSG( !empty(), "dereferencing an empty or stale cursor" );
        return tree_->key_of( pos_ );
    }

    auto const & value() const noexcept requires( is_map )
    {
        BOOST_ASSERT_MSG( !empty(), "dereferencing an empty or stale cursor" );
        return tree_->storage_.values[ *pos_ ];
    }

    void next() noexcept { if ( !empty() ) pos_ = tree_->successor  ( pos_ ); }
    void prev() noexcept { if ( !empty() ) pos_ = tree_->predecessor( pos_ ); }

    Key const & operator*() const noexcept { return key(); }

    cursor & operator++() noexcept { next(); return *this; }
    // --end() yields the maximum (bidirectional iterator requirement)
    cursor & operator--() noexcept
    {
        BOOST_ASSERT( tree_ );
        if ( pos_ && empty() )
            return *this;
        pos_ = pos_ ? tree_->predecessor( pos_ ) : tree_->base::maximum();
        return *this;
    }
    using impl::operator++;
    using impl::operator--;

    // stale cursors compare equal to end()
    friend bool operator==( cursor const & left, cursor const & right ) noexcept { return left.slot() == right.slot(); }

private:
    zip_tree_impl const * tree_{};
    node_slot             pos_;
    std::uint32_t         version_{};
}; // class cursor


template <typename Key, typename Storage, typename Comparator, typename Engine>
node_slot zip_tree_impl<Key, Storage, Comparator, Engine>::find_slot( key_const_arg key ) const noexcept
{
    auto pos{ root_ };
    while ( pos )
    {
        auto const & pos_key{ key_of( pos ) };
        if      ( le( key, pos_key ) ) pos = node( pos ).left;
        else if ( ge( key, pos_key ) ) pos = node( pos ).right;
        else                           break;
    }
    return pos;
}

// largest key not greater than 'key'
template <typename Key, typename Storage, typename Comparator, typename Engine>
node_slot zip_tree_impl<Key, Storage, Comparator, Engine>::floor_slot( key_const_arg key ) const noexcept
{
    node_slot result;
    auto pos{ root_ };
    while ( pos )
    {
        if ( le( key, key_of( pos ) ) )
        {
            pos = node( pos ).left;
        }
        else
        {
            result = pos;
            pos    = node( pos ).right;
        }
    }
    return result;
}

// smallest key not less than 'key' (also the lower bound)
template <typename Key, typename Storage, typename Comparator, typename Engine>
node_slot zip_tree_impl<Key, Storage, Comparator, Engine>::ceiling_slot( key_const_arg key ) const noexcept
{
    node_slot result;
    auto pos{ root_ };
    while ( pos )
    {
        if ( le( key_of( pos ), key ) )
        {
            pos = node( pos ).right;
        }
        else
        {
            result = pos;
            pos    = node( pos ).left;
        }
    }
    return result;
}

template <typename Key, typename Storage, typename Comparator, typename Engine>
node_slot zip_tree_impl<Key, Storage, Comparator, Engine>::upper_bound_slot( key_const_arg key ) const noexcept
{
    node_slot result;
    auto pos{ root_ };
    while ( pos )
    {
        if ( geq( key, key_of( pos ) ) )
        {
            pos = node( pos ).right;
        }
        else
        {
            result = pos;
            pos    = node( pos ).left;
        }
    }
    return result;
}

template <typename Key, typename Storage, typename Comparator, typename Engine>
typename zip_tree_base::index_type
zip_tree_impl<Key, Storage, Comparator, Engine>::index_of( key_const_arg key ) const noexcept
{
    index_type preceding{ 0 };
    auto pos{ root_ };
    while ( pos )
    {
        auto const & pos_key{ key_of( pos ) };
        if ( le( key, pos_key ) )
        {
            pos = node( pos ).left;
            continue;
        }
        preceding += this->left_count( pos );
        if ( !ge( key, pos_key ) )
            return preceding;
        ++preceding;
        pos = node( pos ).right;
    }
    return not_found;
}

template <typename Key, typename Storage, typename Comparator, typename Engine>
template <typename... Payload>
void zip_tree_impl<Key, Storage, Comparator, Engine>::insert_new( Key && key, Payload &&... payload )
{
    BOOST_ASSERT( !find_slot( key ) );
    auto const rank{ ranks_( size() ) };
    // grow every array before touching any link: a throw leaves the tree as it was
    storage_.append( std::move( key ), std::forward<Payload>( payload )... );
    node_slot slot;
    try {
        slot = this->new_node( rank );
    } catch ( ... ) {
        storage_.pop_back();
        throw;
    }
    link( slot );
    this->structure_changed();
}

template <typename Key, typename Storage, typename Comparator, typename Engine>
void zip_tree_impl<Key, Storage, Comparator, Engine>::link( node_slot const new_node ) noexcept
{
    auto const & key { key_of( new_node ) };
    auto const   rank{ node( new_node ).rank };

    node_slot prev;
    auto      curr{ root_ };
    while ( curr && outranks( curr, rank, key ) )
    {
        prev = curr;
        curr = le( key, key_of( curr ) ) ? node( curr ).left : node( curr ).right;
    }

    if ( !prev )
    {
        root_ = new_node;
    }
    else
    {
        ( le( key, key_of( prev ) ) ? node( prev ).left : node( prev ).right ) = new_node;
        node( new_node ).parent = prev;
    }

    if ( curr )
        unzip( new_node, curr );

    this->fix_counts( new_node, node_slot::null );
}

// Splits the subtree that the new node displaced into the chain of keys
// smaller than the new key (hung to the left of the new node) and the chain of
// larger keys (to its right). Each pass walks one maximal run of same-side
// nodes and then reattaches the following run of the opposite side.
template <typename Key, typename Storage, typename Comparator, typename Engine>
void zip_tree_impl<Key, Storage, Comparator, Engine>::unzip( node_slot const new_node, node_slot curr ) noexcept
{
    auto const & key{ key_of( new_node ) };

    ( le( key, key_of( curr ) ) ? node( new_node ).right : node( new_node ).left ) = curr;
    node( curr ).parent = new_node;

    auto prev{ new_node };
    while ( curr )
    {
        auto const fix{ prev };
        if ( le( key_of( curr ), key ) )
        {
            do { prev = curr; curr = node( curr ).right; } while ( curr && geq( key, key_of( curr ) ) );
        }
        else
        {
            do { prev = curr; curr = node( curr ).left;  } while ( curr && leq( key, key_of( curr ) ) );
        }

        // 'fix' is the tail of the opposite chain (or the new node itself
        // after the first run): hang the next run there
        bool const attach_left
        {
            ( fix == new_node )
                ? le( key, key_of( prev ) )
                : le( key, key_of( fix  ) )
        };
        ( attach_left ? node( fix ).left : node( fix ).right ) = curr;
        if ( curr )
            node( curr ).parent = fix;
        this->fix_counts( fix, new_node );
    }
}

template <typename Key, typename Storage, typename Comparator, typename Engine>
bool zip_tree_impl<Key, Storage, Comparator, Engine>::remove_slot( node_slot const victim ) noexcept
{
    if ( !victim )
        return false;

    this->unlink( victim );
    // the arena and the payload arrays are compacted in lockstep: whatever
    // occupied the last slot now lives in the victim's slot in all of them
    this->relocate_last_into( victim );
    storage_.relocate_last_into( *victim );
    this->structure_changed();

    BOOST_ASSERT( storage_.keys.size() == size() );
    return true;
}

template <typename Key, typename Storage, typename Comparator, typename Engine>
bool zip_tree_impl<Key, Storage, Comparator, Engine>::check_invariants() const noexcept
{
    if ( storage_.keys.size() != size() )
        return false;
    if constexpr ( is_map )
    {
        if ( storage_.values.size() != size() )
            return false;
    }
    if ( !this->check_structure() )
        return false;

    // BST order: the in-order walk must be strictly ascending
    size_type visited{ 0 };
    node_slot prev;
    for ( auto pos{ base::minimum() }; pos; pos = this->successor( pos ) )
    {
        if ( prev && !le( key_of( prev ), key_of( pos ) ) )
            return false;
        prev = pos;
        ++visited;
    }
    return visited == size();
}


////////////////////////////////////////////////////////////////////////////////
// \class zip_tree_set
////////////////////////////////////////////////////////////////////////////////

template <typename Key, typename Comparator = std::less<>, typename Engine = default_random_engine>
class zip_tree_set
    :
    public zip_tree_impl<Key, detail::key_storage<Key>, Comparator, Engine>
{
private:
    using impl_base = zip_tree_impl<Key, detail::key_storage<Key>, Comparator, Engine>;

public:
    using impl_base::impl_base;

    // returns true if a node was created, false if the key was already present
    bool insert( Key key )
    {
        if ( impl_base::find_slot( key ) )
            return false;
        impl_base::insert_new( std::move( key ) );
        return true;
    }

    friend void swap( zip_tree_set & left, zip_tree_set & right ) noexcept { left.swap( right ); }
}; // class zip_tree_set

//------------------------------------------------------------------------------
} // namespace ziptree
//------------------------------------------------------------------------------
