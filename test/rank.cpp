#include <ziptree/rank.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <initializer_list>
#include <iostream>
#include <random>
//------------------------------------------------------------------------------
namespace ziptree
{
//------------------------------------------------------------------------------

namespace
{
    // every coin flip comes up heads
    struct saturated_engine
    {
        using result_type = std::uint64_t;
        static constexpr result_type min() noexcept { return 0; }
        static constexpr result_type max() noexcept { return ~result_type{ 0 }; }
        result_type operator()() noexcept { return max(); }
    };
} // anonymous namespace

TEST( zip_rank, packing )
{
    auto const rank{ zip_rank::make( 3, 5 ) };
    EXPECT_EQ( rank.packed, ( 3U << 16 ) | 6U );
    EXPECT_EQ( rank.primary  (), 3U );
    EXPECT_EQ( rank.secondary(), 6U );

    EXPECT_LT( zip_rank::make( 1, 100 ), zip_rank::make( 2, 0 ) );
    EXPECT_LT( zip_rank::make( 2, 1   ), zip_rank::make( 2, 2 ) );
    EXPECT_EQ( zip_rank::make( 4, 7   ), zip_rank::make( 4, 7 ) );

    EXPECT_EQ( zip_rank::make( 70000, 0 ).primary(), zip_rank::max_primary );
    EXPECT_LT( zip_rank{}, zip_rank::make( 0, 0 ) );
}

TEST( zip_rank, primary_is_clamped )
{
    rank_generator<saturated_engine> ranks{ saturated_engine{} };
    EXPECT_EQ( ranks.draw_primary(), zip_rank::max_primary );

    auto const first{ ranks( 0 ) };
    EXPECT_EQ( first.primary  (), zip_rank::max_primary );
    EXPECT_EQ( first.secondary(), 1U );
}

TEST( zip_rank, tie_break_range )
{
    EXPECT_EQ( rank_generator<default_random_engine>{ default_random_engine{ 1 } }.draw_tie_break( 0 ), 0U );

    auto const seed{ std::random_device{}() };
    std::cout << "Seed " << seed << std::endl;
    rank_generator<default_random_engine> ranks{ default_random_engine{ seed } };

    for ( std::uint32_t const n : { 1U, 2U, 3U, 6U, 7U, 100U, 1000U, 1U << 20 } )
    {
        std::uint32_t log2n{ 0 };
        while ( ( std::uint64_t{ 2 } << log2n ) <= n + 1ULL )
            ++log2n;
        auto const bound{ log2n * log2n * log2n };
        for ( auto i{ 0 }; i < 1000; ++i )
        {
            auto const tie_break{ ranks.draw_tie_break( n ) };
            EXPECT_LT( tie_break, bound ) << "n = " << n;
        }
    }
}

TEST( zip_rank, primary_is_geometric )
{
    auto const seed{ std::random_device{}() };
    std::cout << "Seed " << seed << std::endl;
    rank_generator<default_random_engine> ranks{ default_random_engine{ seed } };

    auto const samples{ 100'000 };
    auto zeros{ 0 };
    std::uint64_t sum{ 0 };
    for ( auto i{ 0 }; i < samples; ++i )
    {
        auto const primary{ ranks.draw_primary() };
        zeros += ( primary == 0 );
        sum   += primary;
    }
    // P(0) == 1/2, E == 1
    EXPECT_NEAR( double( zeros ) / samples, 0.5, 0.02 );
    EXPECT_NEAR( double( sum   ) / samples, 1.0, 0.05 );
}

TEST( zip_rank, same_seed_same_ranks )
{
    rank_generator<default_random_engine> first { default_random_engine{ 77 } };
    rank_generator<default_random_engine> second{ default_random_engine{ 77 } };
    for ( std::size_t n{ 0 }; n < 500; ++n )
        EXPECT_EQ( first( n ), second( n ) );
}

//------------------------------------------------------------------------------
} // namespace ziptree
//------------------------------------------------------------------------------
