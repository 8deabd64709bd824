#ifndef ROULETTE_WHEEL_HPP
#define ROULETTE_WHEEL_HPP

#include <cstdint>
#include <random>
#include "Types.hpp"

namespace roulette::core
{
    // Where the ball lands. The engine trusts nothing else about the source.
    class NumberSource
    {
    public:
        virtual ~NumberSource() = default;

        // Expected to be uniform over [0, constants::MaxNumber].
        virtual auto Draw() -> Number = 0;
    };

    class UniformWheel final : public NumberSource
    {
    public:
        explicit UniformWheel(std::uint64_t seed) :
            rng_{seed}, dist_{0, constants::MaxNumber} {}

        auto Draw() -> Number override
        {
            return static_cast<Number>(dist_(rng_));
        }

    private:
        std::mt19937_64 rng_;
        std::uniform_int_distribution<int> dist_;
    };
}

#endif //ROULETTE_WHEEL_HPP
