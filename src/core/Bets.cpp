#include "Bets.hpp"

#include <type_traits>
#include "Util.hpp"

namespace roulette::core
{
    static auto SelectorLabel(std::uint8_t const v, std::string_view zero, std::string_view one) -> std::string_view
    {
        switch (v)
        {
        case 0: return zero;
        case 1: return one;
        default: return "INVALID";
        }
    }

    auto CategoryName(Category const c) -> std::string_view
    {
        switch (c)
        {
        case Category::Straight:   return "Straight";
        case Category::Split:      return "Split";
        case Category::Street:     return "Street";
        case Category::Basket:     return "Basket";
        case Category::Topline:    return "Topline";
        case Category::Corner:     return "Corner";
        case Category::DoubleLine: return "DoubleLine";
        case Category::Dozens:     return "Dozens";
        case Category::Columns:    return "Columns";
        case Category::EvenOdd:    return "EvenOdd";
        case Category::HighLow:    return "HighLow";
        case Category::RedBlack:   return "RedBlack";
        }
        return "Unknown";
    }

    auto ToString(BetCategory const& c) -> std::string
    {
        std::string body = std::visit([]<typename T0>(T0 const& bet) -> std::string
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, Straight>)
                return std::to_string(static_cast<int>(bet.number));
            else if constexpr (std::is_same_v<T, Split> || std::is_same_v<T, Street> ||
                               std::is_same_v<T, Basket> || std::is_same_v<T, Topline> ||
                               std::is_same_v<T, Corner> || std::is_same_v<T, DoubleLine>)
                return util::Join(bet.numbers);
            else if constexpr (std::is_same_v<T, Dozens>)
                return std::to_string(static_cast<int>(bet.group));
            else if constexpr (std::is_same_v<T, Columns>)
                return std::to_string(static_cast<int>(bet.column));
            else if constexpr (std::is_same_v<T, EvenOdd>)
                return std::string{SelectorLabel(bet.selector, "even", "odd")};
            else if constexpr (std::is_same_v<T, HighLow>)
                return std::string{SelectorLabel(bet.selector, "1-18", "19-36")};
            else if constexpr (std::is_same_v<T, RedBlack>)
                return std::string{SelectorLabel(bet.selector, "red", "black")};
            else
                static_assert(util::always_false_v<T>, "Unhandled bet category in ToString");
        }, c);

        return std::string{CategoryName(KindOf(c))} + "(" + body + ")";
    }

    auto ToString(Bet const& b) -> std::string
    {
        return "type: " + ToString(b.Type()) + ", wager: " + std::to_string(b.Wager());
    }
}
