#include "RandomBettor.hpp"

#include <utility>

#include "Exception.hpp"
#include "Geometry.hpp"
#include "SingleZeroRules.hpp"

namespace roulette::core
{
    RandomBettor::RandomBettor(std::uint64_t rng_seed):
        rng_(static_cast<std::mt19937::result_type>(rng_seed)) {}

    auto RandomBettor::RandomSplit() -> Split
    {
        // Rejection sampling against the layout; roughly half the draws land.
        for (;;)
        {
            Number const a = pick<Number>(0, constants::MaxNumber - 1);
            Number const gap = pick<int>(0, 1) ? 3 : 1;
            Split const s{{a, static_cast<Number>(a + gap)}};
            if (geometry::IsSplit(s.numbers)) return s;
        }
    }

    auto RandomBettor::RandomCorner() -> Corner
    {
        for (;;)
        {
            Number const n = pick<Number>(1, constants::MaxNumber - 4);
            Corner const c{{n, static_cast<Number>(n + 1), static_cast<Number>(n + 3), static_cast<Number>(n + 4)}};
            if (geometry::IsCorner(c.numbers)) return c;
        }
    }

    auto RandomBettor::RandomPlacement() -> BetCategory
    {
        auto const kind = static_cast<Category>(pick<std::size_t>(0, constants::CategoryCount - 1));

        switch (kind)
        {
        case Category::Straight:
            return Straight{pick<Number>(0, constants::MaxNumber)};
        case Category::Split:
            return RandomSplit();
        case Category::Street:
        {
            auto const n = static_cast<Number>(3 * pick<int>(0, 11) + 1);
            return Street{{n, static_cast<Number>(n + 1), static_cast<Number>(n + 2)}};
        }
        case Category::Basket:
            return pick<int>(0, 1) ? Basket{{0, 1, 2}} : Basket{{0, 2, 3}};
        case Category::Topline:
            return Topline{{0, 1, 2, 3}};
        case Category::Corner:
            return RandomCorner();
        case Category::DoubleLine:
        {
            auto const n = static_cast<Number>(3 * pick<int>(0, 10) + 1);
            DoubleLine d{};
            for (std::size_t i{}; i < d.numbers.size(); ++i) d.numbers[i] = static_cast<Number>(n + i);
            return d;
        }
        case Category::Dozens:
            return Dozens{pick<std::uint8_t>(1, 3)};
        case Category::Columns:
            return Columns{pick<std::uint8_t>(1, 3)};
        case Category::EvenOdd:
            return EvenOdd{pick<std::uint8_t>(0, 1)};
        case Category::HighLow:
            return HighLow{pick<std::uint8_t>(0, 1)};
        case Category::RedBlack:
            return RedBlack{pick<std::uint8_t>(0, 1)};
        }
        RLT_THROW(error::Code::Unknown, "Unreachable category in RandomPlacement");
    }

    auto RandomBettor::PlaceBets(std::size_t const count, Config const& limits) -> std::vector<Bet>
    {
        std::vector<Bet> slip;
        slip.reserve(count);
        for (std::size_t i{}; i < count; ++i)
        {
            BetCategory placement = RandomPlacement();
            Category const kind = KindOf(placement);
            Amount const minimum = SingleZeroRules::EffectiveMinimum(kind, limits);
            Amount const maximum = SingleZeroRules::EffectiveMaximum(kind, limits);

            // Between 1 and 5 minimum units, never above the table maximum.
            Amount const units = pick<int>(1, 5);
            Amount const wager = minimum > maximum / units ? maximum : minimum * units;
            slip.emplace_back(std::move(placement), wager);
        }
        return slip;
    }
}
