//
// Single-table roulette session on the console
//

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <memory>
#include <numeric>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "core/Bets.hpp"
#include "core/Engine.hpp"
#include "core/Exception.hpp"
#include "core/RandomBettor.hpp"
#include "debug/AuditLogger.hpp"

using namespace roulette::core;

namespace
{
    struct SessionConfig
    {
        std::uint64_t seed{std::random_device{}()};
        Amount        balance{10000};
        std::uint64_t rounds{0}; // 0: until the bankroll runs dry
        Amount        min_bet{1};
        std::optional<Amount> max_bet{};
        bool          random_slip{false};
        std::string   audit_path{};
    };

    auto ParseArgs(int argc, char** argv) -> SessionConfig
    {
        SessionConfig cfg{};

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            auto next_uint = [&](std::uint64_t& out)
            {
                if (i + 1 >= argc) { return false; }
                char const* s = argv[++i];
                auto res = std::from_chars(s, s + std::strlen(s), out);
                return res.ec == std::errc{};
            };

            if (arg == "--seed")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.seed = v; }
            }
            else if (arg == "--balance")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.balance = v; }
            }
            else if (arg == "--rounds")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.rounds = v; }
            }
            else if (arg == "--min-bet")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.min_bet = v; }
            }
            else if (arg == "--max-bet")
            {
                std::uint64_t v{};
                if (next_uint(v)) { cfg.max_bet = v; }
            }
            else if (arg == "--random")
            {
                cfg.random_slip = true;
            }
            else if (arg == "--audit")
            {
                if (i + 1 < argc) { cfg.audit_path = argv[++i]; }
            }
            else
            {
                std::cerr << "[roulette] ignoring unknown option " << arg << "\n";
            }
        }
        return cfg;
    }

    auto DefaultSlip() -> std::vector<Bet>
    {
        return {
            Bet{Straight{11}, 100},
            Bet{Split{{10, 11}}, 100},
            Bet{Corner{{7, 8, 10, 11}}, 100},
            Bet{Corner{{8, 9, 11, 12}}, 100},
            Bet{Corner{{10, 11, 13, 14}}, 100},
            Bet{Corner{{11, 12, 14, 15}}, 100},
            Bet{Columns{2}, 300},
            Bet{Basket{{0, 1, 2}}, 100},
            Bet{Dozens{1}, 100},
            Bet{EvenOdd{0}, 100},
            Bet{HighLow{1}, 100},
            Bet{RedBlack{1}, 100},
            Bet{DoubleLine{{25, 26, 27, 28, 29, 30}}, 100},
        };
    }

    auto TotalStake(std::vector<Bet> const& bets) -> Amount
    {
        return std::accumulate(bets.cbegin(), bets.cend(), Amount{},
                               [](Amount acc, Bet const& b) { return acc + b.Wager(); });
    }
}

int main(int argc, char** argv)
{
    SessionConfig const sc = ParseArgs(argc, argv);

    try
    {
        SpinEngine table = MakeTable(Config{
            .min_bet_floor = sc.min_bet,
            .max_bet       = sc.max_bet,
            .seed          = sc.seed
        });
        RandomBettor bettor(sc.seed + 1);

        std::unique_ptr<debug::AuditLogger> audit;
        if (!sc.audit_path.empty())
        {
            audit = std::make_unique<debug::AuditLogger>(sc.audit_path);
            if (!audit->is_open())
            {
                std::cerr << "[roulette] cannot open audit file " << sc.audit_path << "\n";
                return 1;
            }
            audit->start(table, sc.seed, sc.balance);
        }

        std::cout << "[roulette] seed " << sc.seed << ", balance " << sc.balance << "\n";

        Amount balance = sc.balance;
        Amount highest = balance;

        for (std::uint64_t counter = 1; sc.rounds == 0 || counter <= sc.rounds; ++counter)
        {
            std::vector<Bet> const bets = sc.random_slip ? bettor.PlaceBets(5, table.Limits())
                                                         : DefaultSlip();

            std::cout << "\nGame " << counter << "\n";
            Amount const total_bet = TotalStake(bets);
            if (total_bet > balance)
            {
                std::cout << "Not enough balance to place the bet(s)! (balance: " << balance
                          << ", bets: " << total_bet << ")\n";
                break;
            }

            if (audit) audit->round(counter, bets);

            auto const started = std::chrono::steady_clock::now();
            SpinResult const result = table.Spin(bets);
            auto const elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(
                std::chrono::steady_clock::now() - started);
            std::cout << "Game took " << elapsed.count() << "ns to run\n";

            if (!result.has_value())
            {
                std::cout << "Errors found:\n";
                for (error::ValidationError const& e : result.error())
                {
                    std::cout << "- " << error::Describe(e) << "\n";
                }
                if (audit) audit->rejected(result.error());
                break;
            }

            balance -= total_bet;
            std::cout << "Bets placed. Balance = " << balance << "\n";
            std::cout << "Ball dropped on " << static_cast<int>(result->winning) << "\n";
            for (BetResult const& r : result->results)
            {
                std::cout << "Bet " << r.index << ": " << ToString(r.bet) << " wins " << r.payout << "\n";
                balance += r.payout;
            }

            if (audit)
            {
                audit->outcome(*result);
                audit->balance(balance);
                audit->flush();
            }

            highest = std::max(highest, balance);
        }

        std::cout << "Highest balance achieved = " << highest << "\n";
        if (audit) audit->end(table, highest);
    }
    catch (error::ConfigurationError const& e)
    {
        std::cerr << "[roulette] " << e.what() << "\n";
        return 2;
    }
    catch (OmegaException<error::Code> const& e)
    {
        std::cerr << e;
        return 1;
    }
    return 0;
}
