#ifndef ROULETTE_PAYOUT_HPP
#define ROULETTE_PAYOUT_HPP

#include <optional>
#include <span>
#include <vector>
#include "Bets.hpp"
#include "Types.hpp"

namespace roulette::core::payout
{
    // Zero wins only the number bets that cover it; it has no color, parity or half.
    auto Wins(BetCategory const& c, Number winning, std::optional<Color> colour) noexcept -> bool;

    // wager * multiplier on a win, 0 otherwise.
    auto PayoutFor(Bet const& b, Number winning, std::optional<Color> colour) noexcept -> Amount;

    auto Evaluate(Number winning, std::optional<Color> colour,
                  std::span<Bet const> bets) -> std::vector<BetResult>;
}

#endif //ROULETTE_PAYOUT_HPP
