#include <gtest/gtest.h>
#include <optional>
#include <vector>

#include "../core/Bets.hpp"
#include "../core/Payout.hpp"
#include "../core/Util.hpp"

using namespace roulette::core;
using roulette::core::payout::Evaluate;
using roulette::core::util::ColorOf;

namespace
{
    auto N(int v) -> Number { return static_cast<Number>(v); }

    // Payout of a single bet against a winning number, colour derived from the number.
    auto PayFor(BetCategory c, Amount wager, int winning) -> Amount
    {
        std::vector<Bet> const bets{Bet{c, wager}};
        auto const results = Evaluate(N(winning), ColorOf(N(winning)), bets);
        return results.at(0).payout;
    }

    auto OneOfEach(Amount wager) -> std::vector<Bet>
    {
        return {
            Bet{Straight{1}, wager},
            Bet{Split{{1, 2}}, wager},
            Bet{Street{{1, 2, 3}}, wager},
            Bet{Basket{{0, 1, 2}}, wager},
            Bet{Topline{{0, 1, 2, 3}}, wager},
            Bet{Corner{{1, 2, 4, 5}}, wager},
            Bet{DoubleLine{{1, 2, 3, 4, 5, 6}}, wager},
            Bet{Dozens{1}, wager},
            Bet{Columns{1}, wager},
            Bet{EvenOdd{0}, wager},
            Bet{HighLow{0}, wager},
            Bet{RedBlack{1}, wager},
        };
    }
}

TEST(Payout, Multiplier_Per_Category)
{
    for (Amount i = 1; i < 100; ++i)
    {
        EXPECT_EQ(Bet(Straight{1}, i).WinValue(), i * 36);
        EXPECT_EQ(Bet(Corner{{2, 3, 5, 6}}, i).WinValue(), i * 9);
    }

    // Parameters never change the multiplier, legal or not.
    EXPECT_EQ(Bet(Straight{0}, 1).Multiplier(), Bet(Straight{200}, 1).Multiplier());
    EXPECT_EQ(Bet(Split{{1, 2}}, 1).Multiplier(), Bet(Split{{9, 9}}, 1).Multiplier());

    EXPECT_EQ(Multiplier(Category::Straight), 36u);
    EXPECT_EQ(Multiplier(Category::Split), 18u);
    EXPECT_EQ(Multiplier(Category::Street), 12u);
    EXPECT_EQ(Multiplier(Category::Basket), 12u);
    EXPECT_EQ(Multiplier(Category::Topline), 9u);
    EXPECT_EQ(Multiplier(Category::Corner), 9u);
    EXPECT_EQ(Multiplier(Category::DoubleLine), 6u);
    EXPECT_EQ(Multiplier(Category::Dozens), 3u);
    EXPECT_EQ(Multiplier(Category::Columns), 3u);
    EXPECT_EQ(Multiplier(Category::EvenOdd), 2u);
    EXPECT_EQ(Multiplier(Category::HighLow), 2u);
    EXPECT_EQ(Multiplier(Category::RedBlack), 2u);
}

TEST(Payout, Straight_Scenario)
{
    EXPECT_EQ(PayFor(Straight{1}, 10, 1), 360u);
    EXPECT_EQ(PayFor(Straight{2}, 10, 1), 0u);
    EXPECT_EQ(PayFor(Straight{0}, 10, 0), 360u);
}

TEST(Payout, Dozens_Boundaries)
{
    EXPECT_EQ(PayFor(Dozens{1}, 10, 12), 30u);
    EXPECT_EQ(PayFor(Dozens{1}, 10, 13), 0u);
    EXPECT_EQ(PayFor(Dozens{1}, 10, 1), 30u);
    EXPECT_EQ(PayFor(Dozens{2}, 10, 13), 30u);
    EXPECT_EQ(PayFor(Dozens{2}, 10, 24), 30u);
    EXPECT_EQ(PayFor(Dozens{3}, 10, 25), 30u);
    EXPECT_EQ(PayFor(Dozens{3}, 10, 36), 30u);

    for (int g = 1; g <= 3; ++g)
    {
        EXPECT_EQ(PayFor(Dozens{N(g)}, 10, 0), 0u) << g;
    }
    // an unvalidated selector never wins, not even on zero
    EXPECT_EQ(PayFor(Dozens{0}, 10, 0), 0u);
    EXPECT_EQ(PayFor(Dozens{4}, 10, 37), 0u);
}

TEST(Payout, Columns_Membership)
{
    EXPECT_EQ(PayFor(Columns{2}, 10, 11), 30u);
    EXPECT_EQ(PayFor(Columns{2}, 10, 10), 0u);

    for (int c = 1; c <= 3; ++c)
    {
        for (int n = 0; n <= 36; ++n)
        {
            bool const member = n > 0 && (n - c) >= 0 && (n - c) % 3 == 0;
            EXPECT_EQ(PayFor(Columns{N(c)}, 10, n), member ? 30u : 0u) << c << "/" << n;
        }
    }
    EXPECT_EQ(PayFor(Columns{0}, 10, 3), 0u);
}

TEST(Payout, Zero_Is_Neither_Even_High_Low_Nor_Coloured)
{
    EXPECT_FALSE(ColorOf(0).has_value());

    EXPECT_EQ(PayFor(EvenOdd{0}, 10, 0), 0u);
    EXPECT_EQ(PayFor(EvenOdd{1}, 10, 0), 0u);
    EXPECT_EQ(PayFor(HighLow{0}, 10, 0), 0u);
    EXPECT_EQ(PayFor(HighLow{1}, 10, 0), 0u);
    EXPECT_EQ(PayFor(RedBlack{0}, 10, 0), 0u);
    EXPECT_EQ(PayFor(RedBlack{1}, 10, 0), 0u);

    // but the number bets covering it still pay
    EXPECT_EQ(PayFor(Basket{{0, 1, 2}}, 10, 0), 120u);
    EXPECT_EQ(PayFor(Topline{{0, 1, 2, 3}}, 10, 0), 90u);
    EXPECT_EQ(PayFor(Split{{0, 3}}, 10, 0), 180u);
}

TEST(Payout, Even_Odd_High_Low_Red_Black)
{
    for (int n = 1; n <= 36; ++n)
    {
        EXPECT_EQ(PayFor(EvenOdd{0}, 10, n), n % 2 == 0 ? 20u : 0u) << n;
        EXPECT_EQ(PayFor(EvenOdd{1}, 10, n), n % 2 == 1 ? 20u : 0u) << n;
        EXPECT_EQ(PayFor(HighLow{0}, 10, n), n <= 18 ? 20u : 0u) << n;
        EXPECT_EQ(PayFor(HighLow{1}, 10, n), n >= 19 ? 20u : 0u) << n;
        EXPECT_EQ(PayFor(RedBlack{0}, 10, n), util::IsRed(N(n)) ? 20u : 0u) << n;
        EXPECT_EQ(PayFor(RedBlack{1}, 10, n), util::IsRed(N(n)) ? 0u : 20u) << n;
    }
}

TEST(Payout, Colour_Table)
{
    int reds = 0;
    for (int n = 1; n <= 36; ++n)
    {
        ASSERT_TRUE(ColorOf(N(n)).has_value());
        reds += (*ColorOf(N(n)) == Color::Red);
    }
    EXPECT_EQ(reds, 18);

    // colour does not follow parity above 10
    EXPECT_EQ(ColorOf(1), Color::Red);
    EXPECT_EQ(ColorOf(2), Color::Black);
    EXPECT_EQ(ColorOf(11), Color::Black);
    EXPECT_EQ(ColorOf(12), Color::Red);
    EXPECT_EQ(ColorOf(19), Color::Red);
    EXPECT_EQ(ColorOf(20), Color::Black);
    EXPECT_EQ(ColorOf(36), Color::Red);
}

TEST(Payout, One_Of_Each_On_Two)
{
    std::vector<Bet> const bets = OneOfEach(10);
    auto const results = Evaluate(2, ColorOf(2), bets);
    ASSERT_EQ(results.size(), bets.size());

    Amount winnings = 0;
    for (std::size_t i{}; i < results.size(); ++i)
    {
        BetResult const& res = results[i];
        EXPECT_EQ(res.index, i);
        switch (res.bet.Kind())
        {
        case Category::Straight:   EXPECT_EQ(res.payout, 0u); break;
        case Category::Split:      EXPECT_EQ(res.payout, 180u); break;
        case Category::Street:     EXPECT_EQ(res.payout, 120u); break;
        case Category::Basket:     EXPECT_EQ(res.payout, 120u); break;
        case Category::Topline:    EXPECT_EQ(res.payout, 90u); break;
        case Category::Corner:     EXPECT_EQ(res.payout, 90u); break;
        case Category::DoubleLine: EXPECT_EQ(res.payout, 60u); break;
        case Category::Dozens:     EXPECT_EQ(res.payout, 30u); break;
        case Category::Columns:    EXPECT_EQ(res.payout, 0u); break;
        case Category::EvenOdd:    EXPECT_EQ(res.payout, 20u); break;
        case Category::HighLow:    EXPECT_EQ(res.payout, 20u); break;
        case Category::RedBlack:   EXPECT_EQ(res.payout, 20u); break;
        }
        winnings += res.payout;
    }

    EXPECT_EQ(winnings, 750u);
}

TEST(Payout, Deterministic_For_Same_Inputs)
{
    std::vector<Bet> const bets = OneOfEach(7);
    for (int n = 0; n <= 36; ++n)
    {
        auto const first = Evaluate(N(n), ColorOf(N(n)), bets);
        auto const second = Evaluate(N(n), ColorOf(N(n)), bets);
        ASSERT_EQ(first.size(), second.size());

        Amount total_first = 0;
        Amount total_second = 0;
        for (std::size_t i{}; i < first.size(); ++i)
        {
            EXPECT_EQ(first[i].payout, second[i].payout);
            EXPECT_TRUE(first[i].payout == 0 || first[i].payout == bets[i].WinValue());
            total_first += first[i].payout;
            total_second += second[i].payout;
        }
        EXPECT_EQ(total_first, total_second) << n;
    }
}

TEST(Payout, Empty_Slip)
{
    std::vector<Bet> const none{};
    EXPECT_TRUE(Evaluate(17, ColorOf(17), none).empty());
}
