#ifndef ROULETTE_SINGLEZERORULES_HPP
#define ROULETTE_SINGLEZERORULES_HPP
#include "Rules.hpp"

namespace roulette::core
{
    class SingleZeroRules final : public Rules
    {
    public:
        auto IsLegal(BetCategory const& c) const -> bool override;
        auto Validate(Bet const& b, Config const& limits) const -> CheckResult override;
        auto Evaluate(Number winning, std::optional<Color> colour,
                      std::span<Bet const> bets) const -> std::vector<BetResult> override;

        static auto EffectiveMinimum(Category c, Config const& limits) noexcept -> Amount;
        // Configured maximum, lowered so that wager x multiplier always fits in an Amount.
        static auto EffectiveMaximum(Category c, Config const& limits) noexcept -> Amount;
    };
}

#endif //ROULETTE_SINGLEZERORULES_HPP
