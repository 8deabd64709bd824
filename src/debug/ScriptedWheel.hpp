#ifndef ROULETTE_SCRIPTEDWHEEL_HPP
#define ROULETTE_SCRIPTEDWHEEL_HPP

#include <cstddef>
#include <utility>
#include <vector>

#include "../core/Exception.hpp"
#include "../core/Wheel.hpp"

namespace roulette::core::debug
{
    // Replays a fixed sequence of numbers, wrapping around at the end.
    class ScriptedWheel final : public NumberSource
    {
    public:
        explicit ScriptedWheel(std::vector<Number> script)
            : script_{std::move(script)}
        {
            RLT_ASSERT(!script_.empty(), "Scripted wheel needs at least one number");
        }

        auto Draw() -> Number override
        {
            Number const n = script_[next_ % script_.size()];
            ++next_;
            return n;
        }

        auto Draws() const -> std::size_t
        {
            return next_;
        }

    private:
        std::vector<Number> script_;
        std::size_t next_{0};
    };
}

#endif //ROULETTE_SCRIPTEDWHEEL_HPP
