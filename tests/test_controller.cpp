// tests/test_controller.cpp

#include <catch2/catch_test_macros.hpp>

#include "core/GameState.hpp"
#include "core/Board.hpp"
#include "core/Types.hpp"
#include "controller/GameController.hpp"
#include "controller/InputAction.hpp"
#include "controller/KeyRepeat.hpp"

using blockfall::core::Board;
using blockfall::core::GameState;
using blockfall::core::GameStatus;
using blockfall::core::Rotation;
using blockfall::core::Tetromino;
using blockfall::core::TetrominoType;
using blockfall::controller::GameController;
using blockfall::controller::InputAction;
using blockfall::controller::KeyRepeat;

namespace {

void forceGameOver(GameState& game)
{
    Board b;
    for (int x = 3; x <= 6; ++x) {
        b.setCell(x, 0, 4);
        b.setCell(x, 1, 4);
    }
    game.setBoard(b);
    game.setActiveTetromino(Tetromino{TetrominoType::O, Rotation::R0, {0, 18}});
    game.hardDrop();
}

} // namespace

TEST_CASE("GameController maps input actions to GameState", "[controller]")
{
    GameState game;
    GameController controller{game};
    controller.restart(42);

    REQUIRE(game.status() == GameStatus::Running);
    const auto before = game.activeTetromino()->origin();

    controller.handleAction(InputAction::MoveLeft);
    REQUIRE(game.activeTetromino()->origin().x == before.x - 1);

    controller.handleAction(InputAction::MoveRight);
    REQUIRE(game.activeTetromino()->origin().x == before.x);

    controller.handleAction(InputAction::Rotate);
    REQUIRE(game.activeTetromino()->rotation() == Rotation::R90);

    controller.handleAction(InputAction::SoftDrop);
    REQUIRE(game.activeTetromino()->origin().y == before.y + 1);

    controller.handleAction(InputAction::HardDrop);
    REQUIRE(game.lockedPieces() == 1);
    REQUIRE(game.score() > 0);
}

TEST_CASE("GameController ignores gameplay input after game over", "[controller]")
{
    GameState game;
    GameController controller{game};
    controller.restart(42);

    forceGameOver(game);
    REQUIRE(game.isGameOver());

    const auto score = game.score();
    const auto locked = game.lockedPieces();

    controller.handleAction(InputAction::MoveLeft);
    controller.handleAction(InputAction::Rotate);
    controller.handleAction(InputAction::HardDrop);
    REQUIRE(controller.update(GameController::TickInterval * 600) == 0);

    REQUIRE(game.isGameOver());
    REQUIRE(game.score() == score);
    REQUIRE(game.lockedPieces() == locked);

    controller.handleAction(InputAction::Restart);
    REQUIRE(game.status() == GameStatus::Running);
    REQUIRE(game.score() == 0);
    REQUIRE(game.lockedPieces() == 0);
}

TEST_CASE("GameController update runs one engine tick per fixed interval", "[controller]")
{
    GameState game;
    GameController controller{game};
    controller.restart(42);

    // Less than a tick: nothing happens
    REQUIRE(controller.update(GameController::TickInterval / 2) == 0);
    REQUIRE(game.dropCounter() == 0);

    // The remainder carries over
    REQUIRE(controller.update(GameController::TickInterval / 2 + GameController::Duration{1}) == 1);
    REQUIRE(game.dropCounter() == 1);

    REQUIRE(controller.update(GameController::TickInterval * 10) == 10);
    REQUIRE(game.dropCounter() == 11);
}

TEST_CASE("GameController large elapsed time drops the piece", "[controller]")
{
    GameState game;
    GameController controller{game};
    controller.restart(42);

    const int interval = game.dropIntervalTicks();
    REQUIRE(interval == 60);

    const auto before = game.activeTetromino()->origin();
    REQUIRE(controller.update(GameController::TickInterval * (interval * 3)) == interval * 3);

    const auto after = game.activeTetromino()->origin();
    REQUIRE(after.y == before.y + 3);
    REQUIRE(after.x == before.x);
}

TEST_CASE("GameController restart reseeds and resets timing", "[controller]")
{
    GameState game;
    GameController controller{game};

    controller.restart(42);
    controller.update(GameController::TickInterval / 2);
    game.hardDrop();

    controller.restart(42);
    REQUIRE(game.activeTetromino()->type() == TetrominoType::Z);
    REQUIRE(game.nextType() == TetrominoType::I);
    REQUIRE(game.score() == 0);

    // Half a tick from before the restart must not complete a tick now
    REQUIRE(controller.update(GameController::TickInterval / 2) == 0);
}

TEST_CASE("GameController clock seed fits in 31 bits", "[controller]")
{
    for (int i = 0; i < 10; ++i) {
        REQUIRE(GameController::seedFromClock() < 0x7fffffffU);
    }
}

TEST_CASE("KeyRepeat waits for the delay, then repeats at the rate", "[controller][input]")
{
    using ms = std::chrono::milliseconds;
    KeyRepeat repeat;

    REQUIRE(repeat.advance(ms{500}) == 0); // not held

    repeat.press();
    REQUIRE(repeat.held());
    REQUIRE(repeat.advance(ms{169}) == 0);
    REQUIRE(repeat.advance(ms{50}) == 0);   // 219 ms
    REQUIRE(repeat.advance(ms{1}) == 1);    // 220 ms: first repeat
    REQUIRE(repeat.advance(ms{49}) == 0);
    REQUIRE(repeat.advance(ms{101}) == 3);  // 370 ms: 270, 320, 370

    repeat.release();
    REQUIRE_FALSE(repeat.held());
    REQUIRE(repeat.advance(ms{1000}) == 0);

    // A fresh press starts over
    repeat.press();
    REQUIRE(repeat.advance(ms{200}) == 0);
    REQUIRE(repeat.advance(ms{120}) == 3);  // 320 ms -> repeats at 220, 270, 320
}
