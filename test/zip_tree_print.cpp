#include <ziptree/zip_tree_map.hpp>
#include <ziptree/zip_tree_print.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <functional>
#include <iostream>
#include <random>
#include <sstream>
#include <string>
//------------------------------------------------------------------------------
namespace ziptree
{
//------------------------------------------------------------------------------

namespace
{
    // every coin flip comes up heads: all ranks collide at the clamp
    struct saturated_engine
    {
        using result_type = std::uint64_t;
        static constexpr result_type min() noexcept { return 0; }
        static constexpr result_type max() noexcept { return ~result_type{ 0 }; }
        result_type operator()() noexcept { return max(); }
    };

    std::size_t count_lines( std::string const & text )
    {
        return static_cast<std::size_t>( std::ranges::count( text, '\n' ) );
    }
} // anonymous namespace

TEST( zip_tree_print, equal_ranks_chain_to_the_right )
{
    zip_tree_set<int, std::less<>, saturated_engine> zt{ std::less<>{}, saturated_engine{} };
    zt.insert( 2 );
    zt.insert( 1 );
    zt.insert( 3 );
    ASSERT_TRUE( zt.check_invariants() );

    // the smaller key stays above on rank ties
    EXPECT_EQ
    (
        zt.to_string(),
        "└── Idx: 1, Key: 1, Rank: (65535, 1), Count: 3, Parent: 4294967295\n"
        "    └── Idx: 0, Key: 2, Rank: (65535, 1), Count: 2, Parent: 1\n"
        "        └── Idx: 2, Key: 3, Rank: (65535, 1), Count: 1, Parent: 0\n"
    );

    std::ostringstream in_order;
    zt.print_in_order( in_order );
    EXPECT_EQ
    (
        in_order.str(),
        "Key: 1, Rank: (65535, 1), Count: 3\n"
        "Key: 2, Rank: (65535, 1), Count: 2\n"
        "Key: 3, Rank: (65535, 1), Count: 1\n"
    );

    // the root goes, the node in the last slot (key 3) is compacted into its slot
    EXPECT_TRUE( zt.erase( 1 ) );
    ASSERT_TRUE( zt.check_invariants() );
    EXPECT_EQ
    (
        zt.to_string(),
        "└── Idx: 0, Key: 2, Rank: (65535, 1), Count: 2, Parent: 4294967295\n"
        "    └── Idx: 1, Key: 3, Rank: (65535, 1), Count: 1, Parent: 0\n"
    );
} // zip_tree_print.equal_ranks_chain_to_the_right

TEST( zip_tree_print, map_values )
{
    zip_tree_map<int, std::string, std::less<>, saturated_engine> zm{ std::less<>{}, saturated_engine{} };
    zm.put( 1, "one" );
    zm.put( 2, "two" );
    EXPECT_EQ
    (
        zm.to_string(),
        "└── Idx: 0, Key: 1, Value: one, Rank: (65535, 1), Count: 2, Parent: 4294967295\n"
        "    └── Idx: 1, Key: 2, Value: two, Rank: (65535, 1), Count: 1, Parent: 0\n"
    );

    zm.put( 2, "deux" );
    std::ostringstream in_order;
    zm.print_in_order( in_order );
    EXPECT_EQ
    (
        in_order.str(),
        "Key: 1, Value: one, Rank: (65535, 1), Count: 2\n"
        "Key: 2, Value: deux, Rank: (65535, 1), Count: 1\n"
    );
}

TEST( zip_tree_print, empty )
{
    zip_tree_set<int> const zt;
    EXPECT_TRUE( zt.to_string().empty() );
    std::ostringstream in_order;
    zt.print_in_order( in_order );
    EXPECT_TRUE( in_order.str().empty() );
}

TEST( zip_tree_print, one_line_per_node )
{
    auto const seed{ std::random_device{}() };
    std::cout << "Seed " << seed << std::endl;

    zip_tree_set<int> first { std::less<>{}, default_random_engine{ seed } };
    zip_tree_set<int> second{ std::less<>{}, default_random_engine{ seed } };
    std::mt19937 rng{ seed };
    for ( auto i{ 0 }; i < 300; ++i )
    {
        auto const key{ std::uniform_int_distribution<int>{ -1000, 1000 }( rng ) };
        first .insert( key );
        second.insert( key );
    }
    for ( auto i{ -1000 }; i <= 1000; i += 7 )
    {
        first .erase( i );
        second.erase( i );
    }
    ASSERT_TRUE( first.check_invariants() );

    auto const dump{ first.to_string() };
    EXPECT_EQ( dump, second.to_string() );
    EXPECT_EQ( count_lines( dump ), first.size() );
    EXPECT_EQ( dump.rfind( "└── Idx: ", 0 ), 0U );
    EXPECT_NE( dump.find( "Parent: 4294967295\n" ), std::string::npos );

    std::ostringstream in_order;
    first.print_in_order( in_order );
    EXPECT_EQ( count_lines( in_order.str() ), first.size() );
    EXPECT_EQ( in_order.str().rfind( "Key: " + std::to_string( first.minimum().key() ) + ",", 0 ), 0U );
}

//------------------------------------------------------------------------------
} // namespace ziptree
//------------------------------------------------------------------------------
