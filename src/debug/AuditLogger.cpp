#include "AuditLogger.hpp"

#include <optional>
#include <string_view>
#include <utility>

using namespace roulette::core;

namespace
{

auto s_colour(std::optional<Color> const c) -> std::string_view
{
    if (!c) return "green";
    return *c == Color::Red ? "red" : "black";
}

auto s_history(std::vector<Number> const& h) -> std::string
{
    std::string body;
    for (std::size_t i{}; i < h.size(); ++i)
    {
        body += (i ? "," : "");
        body += std::to_string(static_cast<int>(h[i]));
    }
    return body;
}

} // anonymous namespace

namespace roulette::core::debug
{

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(SpinEngine const& table, std::uint64_t seed, Amount balance) -> void
{
    Config const& limits = table.Limits();
    out_ << "Seed=" << seed << "\n";
    out_ << "Floor=" << limits.min_bet_floor << "\n";
    out_ << "Max=" << (limits.max_bet ? std::to_string(*limits.max_bet) : std::string("none")) << "\n";
    out_ << "Balance=" << balance << "\n";
    out_.flush();
}

auto AuditLogger::round(std::size_t n, std::span<Bet const> bets) -> void
{
    out_ << "Round " << n << " bets=" << bets.size() << "\n";
    for (std::size_t i{}; i < bets.size(); ++i)
    {
        out_ << "Bet " << i << ": " << ToString(bets[i]) << "\n";
    }
}

auto AuditLogger::outcome(SpinOutcome const& o) -> void
{
    out_ << "Ball=" << static_cast<int>(o.winning) << " colour=" << s_colour(o.colour) << "\n";
    for (BetResult const& r : o.results)
    {
        out_ << "Result " << r.index << ": " << (r.Won() ? "win " : "lose ") << r.payout << "\n";
    }
    out_ << "Paid=" << o.TotalPayout() << "\n";
}

auto AuditLogger::rejected(error::ValidationErrors const& errors) -> void
{
    for (error::ValidationError const& e : errors)
    {
        out_ << "Rejected: " << error::Describe(e) << "\n";
    }
}

auto AuditLogger::balance(Amount now) -> void
{
    out_ << "Balance=" << now << "\n";
}

auto AuditLogger::end(SpinEngine const& table, Amount highest) -> void
{
    out_ << "Spins=" << table.History().size() << "\n";
    out_ << "History=[" << s_history(table.History()) << "]\n";
    out_ << "Highest=" << highest << "\n";
    out_.flush();
}

auto AuditLogger::flush() -> void
{
    out_.flush();
}

} // namespace roulette::core::debug
