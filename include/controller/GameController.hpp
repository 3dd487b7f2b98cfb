#pragma once

#include "core/GameState.hpp"
#include "controller/InputAction.hpp"
#include <chrono>
#include <cstdint>

namespace blockfall::controller {

class GameController {
public:
    using Clock = std::chrono::steady_clock;
    using Duration = std::chrono::microseconds;

    // The engine is stepped at a fixed 60 Hz regardless of display rate
    static constexpr Duration TickInterval{1'000'000 / 60};

    /// Controller does not own the GameState; caller keeps it alive.
    explicit GameController(blockfall::core::GameState& game);

    /// Handle a single discrete player action (e.g. key press).
    /// While the game is over only Restart is honoured.
    void handleAction(InputAction action);

    /// New session with an explicit seed; also resets the tick accumulator.
    void restart(std::uint32_t seed);

    // Called periodically with elapsed time since last call.
    // Runs one GameState::update() per whole TickInterval accumulated
    // and returns how many ran.
    int update(Duration elapsed);

    // Reset timing accumulator (e.g. when game is reset)
    void resetTiming();

    // Wall-clock seed in [0, 2^31 - 1)
    static std::uint32_t seedFromClock();

private:
    blockfall::core::GameState& game_;
    Duration accumulated_{0};
};

} // namespace blockfall::controller
