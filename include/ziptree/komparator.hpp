////////////////////////////////////////////////////////////////////////////////
/// Ordering adapter for the ziptree containers.
///
/// Contents:
///   - ordering_predicate<C, K>   : concept: a strict weak order over K
///   - is_simple_comparator<T>    : trait: may a single == test equivalence?
///   - comp_eq(comp, a, b)        : equality derived from a strict-weak comparator
///   - komparator<Comparator>     : predicate holder with le/ge/eq/leq/geq
///
/// The containers take a single "less than" predicate and every other relation
/// is derived from it here. le/ge are the strict relations, leq/geq the
/// non-strict ones.
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

#include <concepts>
#include <functional>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace ziptree
{
//------------------------------------------------------------------------------

template <typename Comparator, typename Key>
concept ordering_predicate = std::predicate<Comparator const &, Key const &, Key const &>;


// Comparators for which key equivalence may be tested with a single ==
// instead of two predicate calls. Specialize for user comparators.
template <typename Comparator>
bool constexpr is_simple_comparator
{
    std::is_same_v<Comparator, std::ranges::less> || std::is_same_v<Comparator, std::ranges::greater>
};
// void (the transparent specialization) counts as fundamental
template <typename T> bool constexpr is_simple_comparator<std::less   <T>>{ std::is_fundamental_v<T> };
template <typename T> bool constexpr is_simple_comparator<std::greater<T>>{ std::is_fundamental_v<T> };


// equivalence under the strict weak order 'comp'
template <typename Comparator>
[[ gnu::pure ]] constexpr bool comp_eq( Comparator const & comp, auto const & a, auto const & b ) noexcept
{
    if constexpr ( is_simple_comparator<Comparator> && requires{ { a == b } -> std::convertible_to<bool>; } )
        return a == b;
    else
        return !( comp( a, b ) || comp( b, a ) );
}


namespace detail
{
    // function pointers and final classes cannot be inherited from
    template <typename Predicate>
    struct stored_predicate
    {
        Predicate pred;

        constexpr bool operator()( auto const & left, auto const & right ) const { return pred( left, right ); }
    };

    template <typename Predicate>
    using predicate_base = std::conditional_t
    <
        std::is_class_v<Predicate> && !std::is_final_v<Predicate>,
        Predicate,
        stored_predicate<Predicate>
    >;
} // namespace detail


//==============================================================================
// komparator: the single source of every key relation used by a zip tree
//==============================================================================

/// Empty class predicates (std::less<>, captureless lambdas) are held through
/// the empty base optimisation and cost no storage in the containers.
template <typename Comparator>
class komparator : private detail::predicate_base<Comparator>
{
private:
    using base = detail::predicate_base<Comparator>;

    static constexpr bool stored{ std::is_same_v<base, detail::stored_predicate<Comparator>> };

public:
    constexpr komparator() = default;
    constexpr explicit komparator( Comparator const & comp ) noexcept( std::is_nothrow_copy_constructible_v<Comparator> ) : base{ comp } {}

    [[ nodiscard ]] constexpr Comparator const & comp() const noexcept
    {
        if constexpr ( stored ) return base::pred;
        else                    return *this;
    }

    [[ gnu::pure ]] constexpr bool le ( auto const & left, auto const & right ) const noexcept { return comp()( left, right ); }
    [[ gnu::pure ]] constexpr bool ge ( auto const & left, auto const & right ) const noexcept { return comp()( right, left ); }
    [[ gnu::pure ]] constexpr bool leq( auto const & left, auto const & right ) const noexcept { return !comp()( right, left ); }
    [[ gnu::pure ]] constexpr bool geq( auto const & left, auto const & right ) const noexcept { return !comp()( left, right ); }
    [[ gnu::pure ]] constexpr bool eq ( auto const & left, auto const & right ) const noexcept { return comp_eq( comp(), left, right ); }

    void swap( komparator & other ) noexcept( std::is_nothrow_swappable_v<Comparator> )
    {
        using std::swap;
        if constexpr ( !std::is_empty_v<Comparator> )
            swap( static_cast<base &>( *this ), static_cast<base &>( other ) );
    }
}; // class komparator

//------------------------------------------------------------------------------
} // namespace ziptree
//------------------------------------------------------------------------------
