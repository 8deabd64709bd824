#ifndef ROULETTE_UTIL_HPP
#define ROULETTE_UTIL_HPP

#include <algorithm>
#include <optional>
#include <span>
#include <string>
#include "Types.hpp"

namespace roulette::core::util
{
    // For the trailing else of an if constexpr chain over BetCategory.
    template <typename>
    inline constexpr bool always_false_v = false;

    inline auto Contains(std::span<Number const> numbers, Number const n) -> bool
    {
        return std::ranges::find(numbers, n) != numbers.end();
    }

    inline auto Join(std::span<Number const> numbers) -> std::string
    {
        std::string s;
        for (std::size_t i{}; i < numbers.size(); ++i)
        {
            s += (i ? ", " : "");
            s += std::to_string(static_cast<int>(numbers[i]));
        }
        return s;
    }

    constexpr auto IsRed(Number const n) noexcept -> bool
    {
        switch (n)
        {
            case 1: case 3: case 5: case 7: case 9:
            case 12: case 14: case 16: case 18: case 19:
            case 21: case 23: case 25: case 27: case 30:
            case 32: case 34: case 36:
                return true;
            default:
                return false;
        }
    }

    // 0 (and anything off the layout) has no color.
    constexpr auto ColorOf(Number const n) noexcept -> std::optional<Color>
    {
        if (n == 0 || n > constants::MaxNumber) return std::nullopt;
        return IsRed(n) ? Color::Red : Color::Black;
    }
}

#endif //ROULETTE_UTIL_HPP
