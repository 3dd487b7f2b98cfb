#include "controller/GameController.hpp"

#include <chrono>

namespace blockfall::controller {

GameController::GameController(blockfall::core::GameState& game)
    : game_{game}
{
}

void GameController::handleAction(InputAction action) {
    if (action == InputAction::Restart) {
        restart(seedFromClock());
        return;
    }

    // If the game is over (or not started), gameplay input is ignored
    if (game_.status() != core::GameStatus::Running) {
        return;
    }

    switch (action) {
    case InputAction::MoveLeft:
        game_.moveLeft();
        break;
    case InputAction::MoveRight:
        game_.moveRight();
        break;
    case InputAction::Rotate:
        game_.rotate();
        break;
    case InputAction::SoftDrop:
        game_.softDrop();
        break;
    case InputAction::HardDrop:
        game_.hardDrop();
        break;
    case InputAction::Restart:
        break;
    }
}

void GameController::restart(std::uint32_t seed) {
    game_.start(seed);
    resetTiming();
}

int GameController::update(Duration elapsed) {
    if (game_.status() != core::GameStatus::Running) {
        accumulated_ = Duration{0};
        return 0;
    }

    accumulated_ += elapsed;

    // If a lot of time passed (lag), we might need several ticks
    int ticks = 0;
    while (accumulated_ >= TickInterval && game_.status() == core::GameStatus::Running) {
        game_.update();
        accumulated_ -= TickInterval;
        ++ticks;
    }
    return ticks;
}

void GameController::resetTiming() {
    accumulated_ = Duration{0};
}

std::uint32_t GameController::seedFromClock() {
    using namespace std::chrono;
    const auto ms = duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
    return static_cast<std::uint32_t>(static_cast<std::uint64_t>(ms) % 0x7fffffffULL);
}

} // namespace blockfall::controller
