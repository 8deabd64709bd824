#ifndef ROULETTE_TYPES_HPP
#define ROULETTE_TYPES_HPP

#define RLT_ENABLE_TEST_HOOKS true

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>

namespace roulette::core::constants
{
    inline constexpr std::uint8_t MaxNumber = 36;
    inline constexpr std::size_t NumberCount = MaxNumber + 1;
    inline constexpr std::size_t CategoryCount = 12;
}

namespace roulette::core
{
    // Raw table value. Wide enough to carry out-of-range attempts (37, 129, ...).
    using Number = std::uint8_t;
    // Smallest currency unit.
    using Amount = std::uint64_t;

    enum class Color : std::uint8_t
    {
        Red = 0,
        Black
    };

    enum class Category : std::uint8_t
    {
        Straight = 0,
        Split,
        Street,
        Basket,
        Topline,
        Corner,
        DoubleLine,
        Dozens,
        Columns,
        EvenOdd,
        HighLow,
        RedBlack
    };

    using CategoryTable = std::array<Amount, constants::CategoryCount>;

    struct Config
    {
        // Global minimum wager; the effective minimum of a category is
        // min_bet_floor * min_multipliers[category].
        Amount        min_bet_floor{1};
        CategoryTable min_multipliers{1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1};
        // Unlimited when empty.
        std::optional<Amount> max_bet{};
        std::uint64_t seed{std::random_device{}()};
    };
}

#endif //ROULETTE_TYPES_HPP
