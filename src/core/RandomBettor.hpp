#ifndef ROULETTE_RANDOMBETTOR_HPP
#define ROULETTE_RANDOMBETTOR_HPP

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>
#include "Bets.hpp"
#include "Types.hpp"

namespace roulette::core
{
    // Places random bets that are always legal on the single-zero layout.
    class RandomBettor final
    {
    public:
        explicit RandomBettor(std::uint64_t rng_seed);

        // count bets, each wagering 1 to 5 times its category minimum, clamped to the maximum.
        auto PlaceBets(std::size_t count, Config const& limits) -> std::vector<Bet>;
        auto RandomPlacement() -> BetCategory;

    private:
        template <class T>
        auto pick(T lo, T hi) -> T
        {
            return static_cast<T>(std::uniform_int_distribution<int>{static_cast<int>(lo), static_cast<int>(hi)}(rng_));
        }

        auto RandomSplit() -> Split;
        auto RandomCorner() -> Corner;

    private:
        std::mt19937 rng_;
    };
}

#endif //ROULETTE_RANDOMBETTOR_HPP
