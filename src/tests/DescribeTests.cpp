#include <gtest/gtest.h>
#include <sstream>
#include <string>

#include "../core/Bets.hpp"
#include "../core/Exception.hpp"

using namespace roulette::core;

TEST(Describe, Category_Text)
{
    EXPECT_EQ(ToString(Straight{11}), "Straight(11)");
    EXPECT_EQ(ToString(Split{{10, 11}}), "Split(10, 11)");
    EXPECT_EQ(ToString(Street{{1, 2, 3}}), "Street(1, 2, 3)");
    EXPECT_EQ(ToString(Basket{{0, 1, 2}}), "Basket(0, 1, 2)");
    EXPECT_EQ(ToString(Topline{{0, 1, 2, 3}}), "Topline(0, 1, 2, 3)");
    EXPECT_EQ(ToString(Corner{{1, 2, 4, 5}}), "Corner(1, 2, 4, 5)");
    EXPECT_EQ(ToString(DoubleLine{{25, 26, 27, 28, 29, 30}}), "DoubleLine(25, 26, 27, 28, 29, 30)");
    EXPECT_EQ(ToString(Dozens{1}), "Dozens(1)");
    EXPECT_EQ(ToString(Columns{2}), "Columns(2)");
    EXPECT_EQ(ToString(EvenOdd{0}), "EvenOdd(even)");
    EXPECT_EQ(ToString(EvenOdd{1}), "EvenOdd(odd)");
    EXPECT_EQ(ToString(EvenOdd{7}), "EvenOdd(INVALID)");
    EXPECT_EQ(ToString(HighLow{0}), "HighLow(1-18)");
    EXPECT_EQ(ToString(HighLow{1}), "HighLow(19-36)");
    EXPECT_EQ(ToString(RedBlack{0}), "RedBlack(red)");
    EXPECT_EQ(ToString(RedBlack{1}), "RedBlack(black)");
    EXPECT_EQ(ToString(RedBlack{2}), "RedBlack(INVALID)");
}

TEST(Describe, Bet_Text)
{
    Bet const b{Corner{{7, 8, 10, 11}}, 100};
    EXPECT_EQ(ToString(b), "type: Corner(7, 8, 10, 11), wager: 100");
    EXPECT_EQ(b.Kind(), Category::Corner);
    EXPECT_EQ(CategoryName(b.Kind()), "Corner");
}

TEST(Describe, Validation_Errors)
{
    Bet const b{Straight{40}, 3};

    EXPECT_EQ(error::Describe(error::InvalidGeometry{.bet = b}),
              "Invalid Bet Option: type: Straight(40), wager: 3");
    EXPECT_EQ(error::Describe(error::BelowMinimum{.bet = b, .minimum = 5}),
              "Minimum (5) not met for option type: Straight(40), wager: 3");
    EXPECT_EQ(error::Describe(error::AboveMaximum{.bet = b, .maximum = 2}),
              "Max bet of 2 reached on option type: Straight(40), wager: 3");
}

TEST(Describe, Misuse_Carries_Code_And_Location)
{
    try
    {
        RLT_THROW(error::Code::Configuration, "floor");
        FAIL() << "expected a throw";
    }
    catch (error::ConfigurationError const& e)
    {
        EXPECT_EQ(e.what(), "floor");
        EXPECT_EQ(e.data(), error::Code::Configuration);
        EXPECT_NE(std::string(e.where().file_name()).find("DescribeTests"), std::string::npos);

        std::ostringstream os;
        os << e;
        EXPECT_NE(os.str().find("Failed to process with code (3): floor"), std::string::npos);
    }
}

TEST(Describe, Assert_Raises_Assertion_Error)
{
    EXPECT_NO_THROW(RLT_ASSERT(1 + 1 == 2, "arithmetic"));
    EXPECT_THROW(RLT_ASSERT(false, "boom"), error::AssertionError);
}
