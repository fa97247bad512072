#include <ziptree/komparator.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <cctype>
#include <functional>
#include <string>
//------------------------------------------------------------------------------
namespace ziptree
{
//------------------------------------------------------------------------------

namespace
{
    struct case_insensitive
    {
        bool operator()( std::string const & left, std::string const & right ) const
        {
            return std::ranges::lexicographical_compare
            (
                left, right,
                []( unsigned char const l, unsigned char const r ) { return std::tolower( l ) < std::tolower( r ); }
            );
        }
    };

    struct by_last_digit final
    {
        int modulus{ 10 };
        bool operator()( int const left, int const right ) const noexcept { return left % modulus < right % modulus; }
    };

    bool descending( int const left, int const right ) noexcept { return left > right; }
} // anonymous namespace

static_assert( ordering_predicate<std::less<>, int> );
static_assert( ordering_predicate<case_insensitive, std::string> );
static_assert( !ordering_predicate<case_insensitive, int> );

static_assert( is_simple_comparator<std::less<>> );
static_assert( is_simple_comparator<std::less<int>> );
static_assert( !is_simple_comparator<std::less<std::string>> );
static_assert( !is_simple_comparator<case_insensitive> );

TEST( komparator, derived_relations )
{
    komparator<std::less<>> const k;
    EXPECT_TRUE ( k.le ( 1, 2 ) );
    EXPECT_FALSE( k.le ( 2, 1 ) );
    EXPECT_FALSE( k.le ( 2, 2 ) );
    EXPECT_TRUE ( k.ge ( 2, 1 ) );
    EXPECT_FALSE( k.ge ( 2, 2 ) );
    EXPECT_TRUE ( k.leq( 2, 2 ) );
    EXPECT_TRUE ( k.leq( 1, 2 ) );
    EXPECT_FALSE( k.leq( 3, 2 ) );
    EXPECT_TRUE ( k.geq( 2, 2 ) );
    EXPECT_FALSE( k.geq( 1, 2 ) );
    EXPECT_TRUE ( k.eq ( 3, 3 ) );
    EXPECT_FALSE( k.eq ( 3, 4 ) );
}

TEST( komparator, equivalence_is_derived_from_the_order )
{
    komparator<case_insensitive> const k;
    EXPECT_TRUE ( k.eq( std::string{ "Zip" }, std::string{ "zIP" } ) );
    EXPECT_FALSE( k.le( std::string{ "Zip" }, std::string{ "zIP" } ) );
    EXPECT_TRUE ( k.le( std::string{ "apple" }, std::string{ "Banana" } ) );
    EXPECT_TRUE ( comp_eq( case_insensitive{}, std::string{ "A" }, std::string{ "a" } ) );
}

TEST( komparator, stored_predicates )
{
    komparator<bool (*)( int, int ) noexcept> const by_pointer{ &descending };
    EXPECT_TRUE ( by_pointer.le( 2, 1 ) );
    EXPECT_FALSE( by_pointer.le( 1, 2 ) );
    EXPECT_TRUE ( by_pointer.eq( 5, 5 ) );
    EXPECT_EQ   ( by_pointer.comp(), &descending );

    komparator<by_last_digit> const final_class{ by_last_digit{ 10 } };
    EXPECT_TRUE ( final_class.le( 19, 3 ) == false );
    EXPECT_TRUE ( final_class.le( 21, 13 ) );
    EXPECT_TRUE ( final_class.eq( 7, 17 ) );
    EXPECT_EQ   ( final_class.comp().modulus, 10 );
}

TEST( komparator, swap )
{
    komparator<by_last_digit> first { by_last_digit{ 10 } };
    komparator<by_last_digit> second{ by_last_digit{ 3  } };
    first.swap( second );
    EXPECT_EQ( first .comp().modulus, 3  );
    EXPECT_EQ( second.comp().modulus, 10 );
}

//------------------------------------------------------------------------------
} // namespace ziptree
//------------------------------------------------------------------------------
