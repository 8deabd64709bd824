#ifndef ROULETTE_BETS_HPP
#define ROULETTE_BETS_HPP

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <variant>
#include "Types.hpp"

namespace roulette::core
{
    // Inside bets: number sets are given in ascending order.
    struct Straight   { Number number{}; };
    struct Split      { std::array<Number, 2> numbers{}; };
    struct Street     { std::array<Number, 3> numbers{}; };
    struct Basket     { std::array<Number, 3> numbers{}; };
    struct Topline    { std::array<Number, 4> numbers{}; };
    struct Corner     { std::array<Number, 4> numbers{}; };
    struct DoubleLine { std::array<Number, 6> numbers{}; };

    // Outside bets: a small selector.
    struct Dozens     { std::uint8_t group{};    }; // 1: 1-12, 2: 13-24, 3: 25-36
    struct Columns    { std::uint8_t column{};   }; // lowest number of the column
    struct EvenOdd    { std::uint8_t selector{}; }; // 0: even, 1: odd
    struct HighLow    { std::uint8_t selector{}; }; // 0: 1-18, 1: 19-36
    struct RedBlack   { std::uint8_t selector{}; }; // 0: red, 1: black

    // Alternative order matches Category.
    using BetCategory = std::variant<
        Straight, Split, Street, Basket, Topline, Corner, DoubleLine,
        Dozens, Columns, EvenOdd, HighLow, RedBlack>;

    static_assert(std::variant_size_v<BetCategory> == constants::CategoryCount,
                  "BetCategory and Category are out of sync");

    inline auto KindOf(BetCategory const& c) noexcept -> Category
    {
        return static_cast<Category>(c.index());
    }

    constexpr auto Multiplier(Category const c) noexcept -> Amount
    {
        switch (c)
        {
        case Category::Straight:   return 36;
        case Category::Split:      return 18;
        case Category::Street:     return 12;
        case Category::Basket:     return 12;
        case Category::Topline:    return 9;
        case Category::Corner:     return 9;
        case Category::DoubleLine: return 6;
        case Category::Dozens:     return 3;
        case Category::Columns:    return 3;
        case Category::EvenOdd:    return 2;
        case Category::HighLow:    return 2;
        case Category::RedBlack:   return 2;
        }
        return 0;
    }

    // An attempted placement. Legality is checked by the rules, not here.
    class Bet
    {
    public:
        Bet(BetCategory type, Amount wager) :
            type_{type}, wager_{wager} {}

        auto Type()  const noexcept -> BetCategory const& { return type_; }
        auto Kind()  const noexcept -> Category { return KindOf(type_); }
        auto Wager() const noexcept -> Amount { return wager_; }
        auto Multiplier() const noexcept -> Amount { return core::Multiplier(Kind()); }
        auto WinValue() const noexcept -> Amount { return wager_ * Multiplier(); }

    private:
        BetCategory type_;
        Amount wager_;
    };

    struct BetResult
    {
        std::size_t index{}; // position of the bet in the submitted slip
        Bet bet;
        Amount payout{};

        [[nodiscard]]
        auto Won() const noexcept -> bool { return payout != 0; }
    };

    auto CategoryName(Category c) -> std::string_view;
    auto ToString(BetCategory const& c) -> std::string;
    auto ToString(Bet const& b) -> std::string;
}

#endif //ROULETTE_BETS_HPP
