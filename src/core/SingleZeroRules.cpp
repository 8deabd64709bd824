#include "SingleZeroRules.hpp"

#include <algorithm>
#include <limits>

#include "Geometry.hpp"
#include "Payout.hpp"

namespace roulette::core
{
    auto SingleZeroRules::EffectiveMinimum(Category const c, Config const& limits) noexcept -> Amount
    {
        return limits.min_bet_floor * limits.min_multipliers[static_cast<std::size_t>(c)];
    }

    auto SingleZeroRules::EffectiveMaximum(Category const c, Config const& limits) noexcept -> Amount
    {
        Amount const payable = std::numeric_limits<Amount>::max() / Multiplier(c);
        return limits.max_bet ? std::min(*limits.max_bet, payable) : payable;
    }

    auto SingleZeroRules::IsLegal(BetCategory const& c) const -> bool
    {
        return geometry::IsLegal(c);
    }

    auto SingleZeroRules::Validate(Bet const& b, Config const& limits) const -> CheckResult
    {
        // A misplaced bet is reported once; its wager is not looked at.
        if (!IsLegal(b.Type()))
            return std::unexpected(error::InvalidGeometry{ .bet = b });

        if (Amount const minimum = EffectiveMinimum(b.Kind(), limits); b.Wager() < minimum)
            return std::unexpected(error::BelowMinimum{ .bet = b, .minimum = minimum });

        if (Amount const maximum = EffectiveMaximum(b.Kind(), limits); b.Wager() > maximum)
            return std::unexpected(error::AboveMaximum{ .bet = b, .maximum = maximum });

        return {};
    }

    auto SingleZeroRules::Evaluate(Number const winning, std::optional<Color> const colour,
                                   std::span<Bet const> bets) const -> std::vector<BetResult>
    {
        return payout::Evaluate(winning, colour, bets);
    }
}
