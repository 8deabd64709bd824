#include "Engine.hpp"

#include <algorithm>
#include <limits>
#include <numeric>
#include <string>
#include <utility>

#include "SingleZeroRules.hpp"
#include "Util.hpp"

namespace roulette::core
{
    auto SpinOutcome::TotalPayout() const noexcept -> Amount
    {
        return std::accumulate(results.cbegin(), results.cend(), Amount{},
                               [](Amount acc, BetResult const& r) { return acc + r.payout; });
    }

    SpinEngine::SpinEngine(Config const& config,
                           std::unique_ptr<Rules> rules,
                           std::unique_ptr<NumberSource> wheel) :
        cfg_(config),
        rules_(std::move(rules)),
        wheel_(std::move(wheel))
    {
        RLT_ASSERT(rules_ != nullptr, "Invalid rules while initalising engine");
        RLT_ASSERT(wheel_ != nullptr, "Invalid number source while initalising engine");
        CheckConfig(cfg_);
    }

    auto SpinEngine::CheckConfig(Config const& cfg) -> void
    {
        using error::Code;
        if (cfg.min_bet_floor == 0)
            RLT_THROW(Code::Configuration, "Minimum bet floor must be at least 1");

        if (std::ranges::any_of(cfg.min_multipliers, [](Amount m) { return m == 0; }))
            RLT_THROW(Code::Configuration, "Per-category minimum multipliers must be at least 1");

        if (cfg.max_bet && *cfg.max_bet < cfg.min_bet_floor)
            RLT_THROW(Code::Configuration,
                      "Maximum bet " + std::to_string(*cfg.max_bet) +
                      " is below the minimum floor " + std::to_string(cfg.min_bet_floor));

        for (std::size_t i{}; i < cfg.min_multipliers.size(); ++i)
        {
            auto const c = static_cast<Category>(i);
            if (cfg.min_multipliers[i] > std::numeric_limits<Amount>::max() / cfg.min_bet_floor ||
                SingleZeroRules::EffectiveMinimum(c, cfg) > SingleZeroRules::EffectiveMaximum(c, cfg))
                RLT_THROW(Code::Configuration,
                          "Minimum bet for " + std::string(CategoryName(c)) + " can never be met");
        }
    }

    auto SpinEngine::MinimumFor(Category const c) const noexcept -> Amount
    {
        return SingleZeroRules::EffectiveMinimum(c, cfg_);
    }

    auto SpinEngine::SetMinimumFloor(Amount const floor) -> void
    {
        Config next = cfg_;
        next.min_bet_floor = floor;
        CheckConfig(next);
        cfg_ = next;
    }

    auto SpinEngine::ValidateBets(std::span<Bet const> bets) const -> std::expected<void, error::ValidationErrors>
    {
        error::ValidationErrors errors;
        // Sum of the win values accepted so far; the whole slip winning must still fit in an Amount.
        Amount reserved = 0;

        for (Bet const& bet : bets)
        {
            if (auto ok = rules_->Validate(bet, cfg_); !ok.has_value())
            {
                errors.push_back(std::move(ok.error()));
                continue;
            }

            Amount const headroom = std::numeric_limits<Amount>::max() - reserved;
            if (bet.Wager() > headroom / bet.Multiplier())
            {
                errors.push_back(error::AboveMaximum{ .bet = bet, .maximum = headroom / bet.Multiplier() });
                continue;
            }
            reserved += bet.WinValue();
        }

        if (!errors.empty()) return std::unexpected(std::move(errors));
        return {};
    }

    auto SpinEngine::Spin(std::span<Bet const> bets) -> SpinResult
    {
        if (auto ok = ValidateBets(bets); !ok.has_value())
        {
            return std::unexpected(std::move(ok.error()));
        }

        Number const number = wheel_->Draw();
        if (number > constants::MaxNumber)
            RLT_THROW(error::Code::State,
                      "Number source produced " + std::to_string(static_cast<int>(number)) + ", outside the wheel");

        std::optional<Color> const colour = util::ColorOf(number);
        SpinOutcome out{ .winning = number,
                         .colour = colour,
                         .results = rules_->Evaluate(number, colour, bets) };

        if (out.results.size() != bets.size())
            RLT_THROW(error::Code::Rules,
                      "Rules returned " + std::to_string(out.results.size()) +
                      " results for " + std::to_string(bets.size()) + " bets");

        history_.push_back(number);
        return out;
    }

    auto MakeTable(Config const& config) -> SpinEngine
    {
        return SpinEngine(config,
                          std::make_unique<SingleZeroRules>(),
                          std::make_unique<UniformWheel>(config.seed));
    }
}
