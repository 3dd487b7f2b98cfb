#include <iostream>
#include <string>
#include <vector>

#include "core/GameState.hpp"
#include "core/Board.hpp"
#include "core/Tetromino.hpp"
#include "core/Types.hpp"
#include "controller/GameController.hpp"
#include "controller/LaunchOptions.hpp"

using namespace blockfall::core;
using blockfall::controller::GameController;
using blockfall::controller::InputAction;

namespace {

// Helper: render the current board + active tetromino as ASCII
void printGame(const GameState& game) {
    const Board& board = game.board();
    const int rows = board.rows();
    const int cols = board.cols();

    std::vector<std::string> lines(rows, std::string(cols, '.'));

    // Locked blocks show their shape letter
    for (int y = 0; y < rows; ++y) {
        for (int x = 0; x < cols; ++x) {
            const std::uint8_t v = board.cell(x, y);
            if (v != Board::Empty) {
                lines[y][x] = shapeLetterForCell(v);
            }
        }
    }

    if (game.activeTetromino()) {
        const Tetromino& active = *game.activeTetromino();

        if (auto ghostY = game.ghostRow()) {
            const Tetromino ghost = active.movedBy(0, *ghostY - active.origin().y);
            for (const auto& b : ghost.blocks()) {
                if (b.y >= 0 && lines[b.y][b.x] == '.') {
                    lines[b.y][b.x] = ':';
                }
            }
        }
        for (const auto& b : active.blocks()) {
            if (b.y >= 0 && b.y < rows && b.x >= 0 && b.x < cols) {
                lines[b.y][b.x] = '@';
            }
        }
    }

    std::cout << "\n==== BLOCKFALL ====\n";
    std::cout << "Score: " << game.score()
              << " | Level: " << game.level()
              << " | Lines: " << game.linesCleared()
              << " | Next: " << shapeLetter(game.nextType())
              << " | Status: ";

    switch (game.status()) {
    case GameStatus::NotStarted: std::cout << "NotStarted"; break;
    case GameStatus::Running:    std::cout << "Running";    break;
    case GameStatus::GameOver:   std::cout << "GameOver";   break;
    }
    std::cout << '\n';

    // Print board with borders
    std::cout << '+' << std::string(cols, '-') << "+\n";
    for (int r = 0; r < rows; ++r) {
        std::cout << '|' << lines[r] << "|\n";
    }
    std::cout << '+' << std::string(cols, '-') << "+\n";

    std::cout << "Commands:\n"
              << "  a = left, d = right, w = rotate, s = soft drop\n"
              << "  h = hard drop, g = one gravity step\n"
              << "  r = restart, q = quit\n";
}

} // namespace

int main(int argc, char** argv) {
    blockfall::controller::LaunchOptions options;
    std::string error;
    if (!blockfall::controller::parseLaunchOptions(argc, argv, options, error)) {
        std::cerr << error << '\n' << blockfall::controller::launchUsage(argv[0]);
        return 2;
    }
    if (options.showHelp) {
        std::cout << blockfall::controller::launchUsage(argv[0]);
        return 0;
    }

    GameState game;
    GameController controller{game};

    const std::uint32_t seed = options.seed ? *options.seed : GameController::seedFromClock();
    std::cout << "Seed: " << seed << '\n';
    controller.restart(seed);

    std::string cmd;
    printGame(game);

    while (true) {
        std::cout << "\nEnter command: ";
        if (!std::getline(std::cin, cmd)) {
            break; // EOF
        }
        if (cmd.empty()) {
            continue;
        }

        const char c = cmd[0];
        if (c == 'q' || c == 'Q') {
            std::cout << "Quitting.\n";
            break;
        }

        switch (c) {
        case 'a': case 'A':
            controller.handleAction(InputAction::MoveLeft);
            break;
        case 'd': case 'D':
            controller.handleAction(InputAction::MoveRight);
            break;
        case 's': case 'S':
            controller.handleAction(InputAction::SoftDrop);
            break;
        case 'w': case 'W':
            controller.handleAction(InputAction::Rotate);
            break;
        case 'h': case 'H':
            controller.handleAction(InputAction::HardDrop);
            break;
        case 'g': case 'G':
            // Run ticks until the drop timer fires once
            controller.update(GameController::TickInterval * game.dropIntervalTicks());
            break;
        case 'r': case 'R':
            controller.handleAction(InputAction::Restart);
            break;
        default:
            std::cerr << "Unknown command: " << c << '\n';
            break;
        }

        printGame(game);

        if (game.isGameOver()) {
            std::cout << "GAME OVER. Press 'r' to restart or 'q' to quit.\n";
        }
    }

    return 0;
}
