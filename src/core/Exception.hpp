#ifndef ROULETTE_EXCEPTION_HPP
#define ROULETTE_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <expected>
#include <source_location>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include "Types.hpp"
#include "Bets.hpp"

namespace roulette::core::error
{
    enum class Code : unsigned
    {
        Unknown, // unknown error
        Rules, // rules engine misuse (not a rejected bet)
        State, // engine state misuse (not a rejected bet)
        Configuration, // table policy out of range
        Assertion // internal assertion failed
    };

    struct UnknownError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct RulesError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct StateError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct ConfigurationError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg,
                     std::source_location const& loc = std::source_location::current()) -> void
    {
        switch (c)
        {
        case Code::Unknown: throw UnknownError(std::move(msg), c, loc);
        case Code::Rules: throw RulesError(std::move(msg), c, loc);
        case Code::State: throw StateError(std::move(msg), c, loc);
        case Code::Configuration: throw ConfigurationError(std::move(msg), c, loc);
        case Code::Assertion: throw AssertionError(std::move(msg), c, loc);
        }
        throw std::runtime_error(msg);
    }

#define RLT_THROW(code_enum, msg) ::roulette::core::error::fail((code_enum), (msg))
#define RLT_ASSERT(cond, msg) do { if(!(cond)) ::roulette::core::error::fail(::roulette::core::error::Code::Assertion, (msg)); } while(0)

    // Caller-facing reasons a bet was refused. Returned, never thrown.
    struct InvalidGeometry
    {
        Bet bet;
    };

    struct BelowMinimum
    {
        Bet bet;
        Amount minimum{};
    };

    struct AboveMaximum
    {
        Bet bet;
        Amount maximum{};
    };

    using ValidationError = std::variant<InvalidGeometry, BelowMinimum, AboveMaximum>;

    inline auto OffendingBet(ValidationError const& e) -> Bet const&
    {
        return std::visit([](auto const& v) -> Bet const& { return v.bet; }, e);
    }

    inline auto Describe(ValidationError const& e) -> std::string
    {
        if (auto const* g = std::get_if<InvalidGeometry>(&e))
            return "Invalid Bet Option: " + ToString(g->bet);
        if (auto const* lo = std::get_if<BelowMinimum>(&e))
            return "Minimum (" + std::to_string(lo->minimum) + ") not met for option " + ToString(lo->bet);
        auto const& hi = std::get<AboveMaximum>(e);
        return "Max bet of " + std::to_string(hi.maximum) + " reached on option " + ToString(hi.bet);
    }

    using ValidateResult = std::expected<void, ValidationError>;
    using ValidationErrors = std::vector<ValidationError>;
}

#endif //ROULETTE_EXCEPTION_HPP
