#pragma once

#include <algorithm>
#include <bit>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <random>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace ziptree
{
//------------------------------------------------------------------------------

////////////////////////////////////////////////////////////////////////////////
// \struct zip_rank
//
// Zip-zip tree rank: the (r1, r2) pair packed as ( r1 << 16 ) | ( 1 + r2 ) so
// that the lexicographic pair order is plain integer order.
////////////////////////////////////////////////////////////////////////////////

struct zip_rank
{
    using value_type = std::uint32_t;

    static value_type constexpr secondary_bits{ 16 };
    static value_type constexpr secondary_mask{ ( value_type{ 1 } << secondary_bits ) - 1 };
    static value_type constexpr max_primary   { secondary_mask };

    value_type packed{};

    [[ gnu::const ]] static constexpr zip_rank make( value_type const primary, value_type const tie_break ) noexcept
    {
        return { ( std::min( primary, max_primary ) << secondary_bits ) | ( ( tie_break + 1 ) & secondary_mask ) };
    }

    // r1
    [[ gnu::pure ]] constexpr value_type primary  () const noexcept { return packed >> secondary_bits; }
    // stored 1 + r2 (0 only for a default constructed, never assigned, rank)
    [[ gnu::pure ]] constexpr value_type secondary() const noexcept { return packed & secondary_mask; }

    constexpr auto operator<=>( zip_rank const & ) const noexcept = default;
}; // struct zip_rank

static_assert( sizeof( zip_rank ) == sizeof( std::uint32_t ) );


using default_random_engine = std::mt19937_64;

[[ nodiscard ]] inline default_random_engine make_seeded_engine()
{
    std::random_device entropy;
    std::seed_seq      seeds{ entropy(), entropy(), entropy(), entropy() };
    return default_random_engine{ seeds };
}


////////////////////////////////////////////////////////////////////////////////
// \class rank_generator
//
// Owns the injected random engine exclusively. Every insertion consumes at
// least one draw.
////////////////////////////////////////////////////////////////////////////////

template <std::uniform_random_bit_generator Engine>
class rank_generator
{
public:
    using engine_type = Engine;

    rank_generator() requires std::is_same_v<Engine, default_random_engine> : engine_{ make_seeded_engine() } {}
    explicit rank_generator( Engine engine ) noexcept( std::is_nothrow_move_constructible_v<Engine> ) : engine_{ std::move( engine ) } {}

    // current_size: number of nodes in the tree before the insertion
    [[ nodiscard ]] zip_rank operator()( std::size_t const current_size )
    {
        return zip_rank::make( draw_primary(), draw_tie_break( current_size ) );
    }

    // Geometric(1/2): fair coin flips before the first tails
    [[ nodiscard ]] zip_rank::value_type draw_primary()
    {
        std::uniform_int_distribution<std::uint64_t> coins;
        zip_rank::value_type heads{ 0 };
        for ( ; ; )
        {
            auto const flips{ static_cast<zip_rank::value_type>( std::countr_one( coins( engine_ ) ) ) };
            heads += flips;
            if ( flips != 64 || heads >= zip_rank::max_primary ) [[ likely ]]
                break;
        }
        return std::min( heads, zip_rank::max_primary );
    }

    // uniform in [0, floor(log2(n+1))^3), 0 for an empty tree
    [[ nodiscard ]] zip_rank::value_type draw_tie_break( std::size_t const current_size )
    {
        auto const log2n{ static_cast<zip_rank::value_type>( std::bit_width( static_cast<std::uint64_t>( current_size ) + 1 ) - 1 ) };
        auto const bound{ log2n * log2n * log2n };
        if ( !bound ) [[ unlikely ]]
            return 0;
        return std::uniform_int_distribution<zip_rank::value_type>{ 0, bound - 1 }( engine_ );
    }

    [[ nodiscard ]] Engine       & engine()       noexcept { return engine_; }
    [[ nodiscard ]] Engine const & engine() const noexcept { return engine_; }

    void swap( rank_generator & other ) noexcept( std::is_nothrow_swappable_v<Engine> ) { using std::swap; swap( engine_, other.engine_ ); }

private:
    Engine engine_;
}; // class rank_generator

//------------------------------------------------------------------------------
} // namespace ziptree
//------------------------------------------------------------------------------
