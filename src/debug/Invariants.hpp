#ifndef ROULETTE_INVARIANTS_HPP
#define ROULETTE_INVARIANTS_HPP

#include <cstddef>
#include <span>

#include "../core/Engine.hpp"
#include "../core/Exception.hpp"
#include "../core/Payout.hpp"
#include "../core/Util.hpp"

namespace roulette::core::debug
{
    // A second layer of checks run after an accepted Spin(). Breaches raise AssertionError.
    inline auto CheckInvariants(SpinEngine const& table,
                                std::span<Bet const> bets,
                                SpinOutcome const& out,
                                std::size_t history_before) -> void
    {
#if RLT_ENABLE_TEST_HOOKS == false
        (void)table; (void)bets; (void)out; (void)history_before;
#else
        // 1) Ball on the wheel, colour derived from it, recorded exactly once
        RLT_ASSERT(out.winning <= constants::MaxNumber, "Winning number off the wheel");
        RLT_ASSERT(out.colour == util::ColorOf(out.winning), "Colour does not match winning number");
        RLT_ASSERT(table.History().size() == history_before + 1, "History did not grow by exactly one");
        RLT_ASSERT(table.History().back() == out.winning, "Last history entry is not the winning number");

        // 2) Results are parallel to the slip
        RLT_ASSERT(out.results.size() == bets.size(), "Result count != bet count");

        for (std::size_t i{}; i < bets.size(); ++i)
        {
            BetResult const& r = out.results[i];
            RLT_ASSERT(r.index == i, "Result out of order");
            RLT_ASSERT(r.bet.Wager() == bets[i].Wager() && r.bet.Kind() == bets[i].Kind(),
                       "Result does not reference its bet");

            // 3) All or nothing, and reproducible from the inputs alone
            RLT_ASSERT(r.payout == 0 || r.payout == bets[i].WinValue(), "Partial payout");
            RLT_ASSERT(r.payout == payout::PayoutFor(bets[i], out.winning, out.colour),
                       "Payout depends on more than (number, colour, bet)");
        }
#endif
    }
}
#endif //ROULETTE_INVARIANTS_HPP
