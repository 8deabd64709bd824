#include "Payout.hpp"

#include <type_traits>
#include <variant>
#include "Util.hpp"

namespace roulette::core::payout
{
    auto Wins(BetCategory const& c, Number const winning, std::optional<Color> const colour) noexcept -> bool
    {
        int const n = winning;
        bool const on_layout = n >= 1 && n <= constants::MaxNumber;

        return std::visit([&]<typename T0>(T0 const& bet) -> bool
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, Straight>)
            {
                return bet.number == winning;
            }
            else if constexpr (std::is_same_v<T, Split> || std::is_same_v<T, Street> ||
                               std::is_same_v<T, Basket> || std::is_same_v<T, Topline> ||
                               std::is_same_v<T, Corner> || std::is_same_v<T, DoubleLine>)
            {
                return util::Contains(bet.numbers, winning);
            }
            else if constexpr (std::is_same_v<T, Dozens>)
            {
                int const g = bet.group;
                if (g < 1 || g > 3) return false;
                return n >= (g - 1) * 12 + 1 && n <= g * 12;
            }
            else if constexpr (std::is_same_v<T, Columns>)
            {
                int const col = bet.column;
                if (col < 1 || col > 3) return false;
                return on_layout && n >= col && (n - col) % 3 == 0;
            }
            else if constexpr (std::is_same_v<T, EvenOdd>)
            {
                return on_layout && bet.selector <= 1 && n % 2 == bet.selector;
            }
            else if constexpr (std::is_same_v<T, HighLow>)
            {
                return (bet.selector == 0 && n >= 1 && n <= 18) ||
                       (bet.selector == 1 && n >= 19 && n <= constants::MaxNumber);
            }
            else if constexpr (std::is_same_v<T, RedBlack>)
            {
                return colour.has_value() && bet.selector == static_cast<std::uint8_t>(*colour);
            }
            else
            {
                static_assert(util::always_false_v<T>, "Unhandled bet category in Wins");
            }
        }, c);
    }

    auto PayoutFor(Bet const& b, Number const winning, std::optional<Color> const colour) noexcept -> Amount
    {
        return Wins(b.Type(), winning, colour) ? b.WinValue() : 0;
    }

    auto Evaluate(Number const winning, std::optional<Color> const colour,
                  std::span<Bet const> bets) -> std::vector<BetResult>
    {
        std::vector<BetResult> results;
        results.reserve(bets.size());

        for (std::size_t i{}; i < bets.size(); ++i)
        {
            results.push_back(BetResult{ .index = i,
                                         .bet = bets[i],
                                         .payout = PayoutFor(bets[i], winning, colour) });
        }
        return results;
    }
}
