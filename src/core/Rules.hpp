#ifndef ROULETTE_RULES_HPP
#define ROULETTE_RULES_HPP

#include <optional>
#include <span>
#include <vector>
#include "Bets.hpp"
#include "Types.hpp"
#include "Exception.hpp"

namespace roulette::core
{
    class Rules
    {
    public:
        using CheckResult = error::ValidateResult;

        virtual ~Rules() = default;

        // Table geometry only. Total: never throws, never looks at the wager.
        virtual auto IsLegal(BetCategory const& c) const -> bool = 0;

        // Geometry plus wager limits for one bet. Returns unexpected(reason) for a
        // refused bet (NOT an exception).
        virtual auto Validate(Bet const& b, Config const& limits) const -> CheckResult = 0;

        // One result per bet, same order. No state is read or written.
        virtual auto Evaluate(Number winning, std::optional<Color> colour,
                              std::span<Bet const> bets) const -> std::vector<BetResult> = 0;
    };
}

#endif //ROULETTE_RULES_HPP
