#ifndef ROULETTE_AUDITLOGGER_HPP
#define ROULETTE_AUDITLOGGER_HPP

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <span>
#include <string>

#include "../core/Engine.hpp"
#include "../core/Bets.hpp"
#include "../core/Exception.hpp"
#include "../core/Types.hpp"

namespace roulette::core::debug
{
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        AuditLogger(AuditLogger&&) noexcept = default;
        auto operator=(AuditLogger&&) noexcept -> AuditLogger& = default;

        [[nodiscard]]
        auto is_open() const -> bool { return out_.is_open(); }

        // Session header (seed, table limits, starting balance)
        auto start(SpinEngine const& table, std::uint64_t seed, Amount balance) -> void;

        // Bet slip submitted for round n (1-based)
        auto round(std::size_t n, std::span<Bet const> bets) -> void;

        // Accepted round: ball, colour and every payout
        auto outcome(SpinOutcome const& o) -> void;

        // Refused round: every validation error
        auto rejected(error::ValidationErrors const& errors) -> void;

        auto balance(Amount now) -> void;

        // Session footer
        auto end(SpinEngine const& table, Amount highest) -> void;

        // Manual flush
        auto flush() -> void;

    private:
        std::ofstream out_;
    };
}

#endif //ROULETTE_AUDITLOGGER_HPP
