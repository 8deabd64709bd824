#ifndef ROULETTE_ENGINE_HPP
#define ROULETTE_ENGINE_HPP

#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <vector>
#include "Types.hpp"
#include "Bets.hpp"
#include "Exception.hpp"
#include "Rules.hpp"
#include "Wheel.hpp"

namespace roulette::core
{
    struct SpinOutcome
    {
        Number winning{};
        std::optional<Color> colour{};
        std::vector<BetResult> results; // parallel to the submitted bets

        auto TotalPayout() const noexcept -> Amount;
    };

    using SpinResult = std::expected<SpinOutcome, error::ValidationErrors>;

    // One table. Not safe for concurrent Spin() calls; run one engine per table.
    class SpinEngine
    {
    public:
        SpinEngine() = delete;
        SpinEngine(Config const& config,
                   std::unique_ptr<Rules> rules,
                   std::unique_ptr<NumberSource> wheel);

        // Validate every bet, then draw and evaluate. On any refusal all reasons are
        // returned together and nothing is drawn or recorded.
        auto Spin(std::span<Bet const> bets) -> SpinResult;

        // Validation pass of Spin() on its own; never mutates.
        auto ValidateBets(std::span<Bet const> bets) const -> std::expected<void, error::ValidationErrors>;

        auto History() const noexcept -> std::vector<Number> const& { return history_; }
        auto Limits()  const noexcept -> Config const& { return cfg_; }
        auto RulesInUse() const noexcept -> Rules const& { return *rules_; }

        auto MinimumFor(Category c) const noexcept -> Amount;
        // Throws ConfigurationError for a floor of 0 or one above the maximum.
        auto SetMinimumFloor(Amount floor) -> void;

    private:
        static auto CheckConfig(Config const& cfg) -> void;

    private:
        Config cfg_;
        std::unique_ptr<Rules> rules_;
        std::unique_ptr<NumberSource> wheel_;

        // Winning numbers, oldest first. Observational only.
        std::vector<Number> history_;
    };

    // Single-zero rules on a uniform wheel seeded from config.seed.
    auto MakeTable(Config const& config) -> SpinEngine;
}
#endif //ROULETTE_ENGINE_HPP
