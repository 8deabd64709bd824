#ifndef ROULETTE_GEOMETRY_HPP
#define ROULETTE_GEOMETRY_HPP

#include <array>
#include "Bets.hpp"
#include "Types.hpp"

// Layout predicates for the single-zero table.
//
// The grid is numbered 1..36 in streets of three (1-2-3, 4-5-6, ..., 34-35-36),
// twelve streets side by side, with 0 running along the first street. A number
// n sits at offset (n - 1) % 3 within its street, so n % 3 == 0 is the far cell
// and (n - 1) % 3 == 0 the near one. Everything is arithmetic on the raw values;
// number sets are expected in ascending order.
namespace roulette::core::geometry
{
    auto IsStraight(Number n) noexcept -> bool;
    auto IsSplit(std::array<Number, 2> const& v) noexcept -> bool;
    auto IsStreet(std::array<Number, 3> const& v) noexcept -> bool;
    auto IsBasket(std::array<Number, 3> const& v) noexcept -> bool;
    auto IsTopline(std::array<Number, 4> const& v) noexcept -> bool;
    auto IsCorner(std::array<Number, 4> const& v) noexcept -> bool;
    auto IsDoubleLine(std::array<Number, 6> const& v) noexcept -> bool;

    // Total over every BetCategory value.
    auto IsLegal(BetCategory const& c) noexcept -> bool;
}

#endif //ROULETTE_GEOMETRY_HPP
