#include "Geometry.hpp"

#include <type_traits>
#include <variant>
#include "Util.hpp"

namespace roulette::core::geometry
{
    namespace
    {
        constexpr int Max = constants::MaxNumber;

        inline auto InRange(std::uint8_t const v, int const lo, int const hi) noexcept -> bool
        {
            return v >= lo && v <= hi;
        }
    }

    auto IsStraight(Number const n) noexcept -> bool
    {
        return n <= Max;
    }

    auto IsSplit(std::array<Number, 2> const& v) noexcept -> bool
    {
        int const a = v[0];
        int const b = v[1];

        if (a >= b || b > Max) return false;

        // 0 borders the whole first street
        if (a == 0) return b == 1 || b == 2 || b == 3;

        // bottom edge: 34-35, 35-36
        if (a >= 34) return b - a == 1;

        // inside one street; the far cell has no right-hand neighbour
        if (b - a == 1) return a % 3 != 0;

        // across neighbouring streets; 33-36 is not offered
        if (b - a == 3) return a <= 32;

        return false;
    }

    auto IsStreet(std::array<Number, 3> const& v) noexcept -> bool
    {
        int const n = v[0];
        return n >= 1 &&
               n <= Max - 2 &&
               (n - 1) % 3 == 0 &&
               v[1] == n + 1 &&
               v[2] == n + 2;
    }

    auto IsBasket(std::array<Number, 3> const& v) noexcept -> bool
    {
        return v[0] == 0 &&
               ((v[1] == 1 && v[2] == 2) ||
                (v[1] == 2 && v[2] == 3));
    }

    auto IsTopline(std::array<Number, 4> const& v) noexcept -> bool
    {
        return v[0] == 0 && v[1] == 1 && v[2] == 2 && v[3] == 3;
    }

    auto IsCorner(std::array<Number, 4> const& v) noexcept -> bool
    {
        int const n = v[0];
        return n >= 1 &&
               n % 3 != 0 &&
               v[1] == n + 1 &&
               v[2] == n + 3 &&
               v[3] == n + 4 &&
               v[3] <= Max;
    }

    auto IsDoubleLine(std::array<Number, 6> const& v) noexcept -> bool
    {
        std::array<Number, 3> const first{v[0], v[1], v[2]};
        std::array<Number, 3> const second{v[3], v[4], v[5]};
        return IsStreet(first) && IsStreet(second) && v[3] == v[2] + 1;
    }

    auto IsLegal(BetCategory const& c) noexcept -> bool
    {
        return std::visit([]<typename T0>(T0 const& bet) -> bool
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, Straight>)        return IsStraight(bet.number);
            else if constexpr (std::is_same_v<T, Split>)      return IsSplit(bet.numbers);
            else if constexpr (std::is_same_v<T, Street>)     return IsStreet(bet.numbers);
            else if constexpr (std::is_same_v<T, Basket>)     return IsBasket(bet.numbers);
            else if constexpr (std::is_same_v<T, Topline>)    return IsTopline(bet.numbers);
            else if constexpr (std::is_same_v<T, Corner>)     return IsCorner(bet.numbers);
            else if constexpr (std::is_same_v<T, DoubleLine>) return IsDoubleLine(bet.numbers);
            else if constexpr (std::is_same_v<T, Dozens>)     return InRange(bet.group, 1, 3);
            else if constexpr (std::is_same_v<T, Columns>)    return InRange(bet.column, 1, 3);
            else if constexpr (std::is_same_v<T, EvenOdd>)    return bet.selector <= 1;
            else if constexpr (std::is_same_v<T, HighLow>)    return bet.selector <= 1;
            else if constexpr (std::is_same_v<T, RedBlack>)   return bet.selector <= 1;
            else static_assert(util::always_false_v<T>, "Unhandled bet category in IsLegal");
        }, c);
    }
}
