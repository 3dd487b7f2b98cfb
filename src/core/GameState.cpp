#include "core/GameState.hpp"
#include <initializer_list>

namespace blockfall::core {

void GameState::start(std::uint32_t seed) {
    board_.clear();
    factory_.reseed(seed);
    scoreManager_.reset();
    levelManager_.reset();

    activeTetromino_.reset();
    dropCounter_ = 0;
    lockedPieces_ = 0;

    status_ = GameStatus::Running;

    // First draw only fills the preview; spawning promotes it and draws again
    nextType_ = factory_.nextType();
    spawnNewTetromino();
}

bool GameState::update() {
    if (status_ != GameStatus::Running) {
        return false;
    }

    const int interval = levelManager_.dropIntervalTicks();
    ++dropCounter_;
    if (dropCounter_ < interval) {
        return false;
    }

    dropCounter_ = 0;
    softDrop();
    return true;
}

bool GameState::moveLeft() {
    if (!canAct()) return false;
    return tryMove(-1, 0);
}

bool GameState::moveRight() {
    if (!canAct()) return false;
    return tryMove(1, 0);
}

bool GameState::rotate() {
    if (!canAct()) return false;

    const Tetromino rotated = activeTetromino_->rotatedClockwise();

    // In place first, then one column left, then one column right
    for (int kick : {0, -1, 1}) {
        Tetromino candidate = rotated.movedBy(kick, 0);
        if (!board_.collides(candidate)) {
            activeTetromino_ = candidate;
            return true;
        }
    }
    return false;
}

bool GameState::softDrop() {
    if (!canAct()) return false;

    if (tryMove(0, 1)) {
        return true; // still falling
    }

    lockActiveTetrominoAndProcessLines();
    spawnNewTetromino();
    return false;
}

int GameState::hardDrop() {
    if (!canAct()) return 0;

    // Drop until we can't move further
    int rows = 0;
    while (tryMove(0, 1)) {
        ++rows;
    }
    scoreManager_.addHardDropRows(rows);

    lockActiveTetrominoAndProcessLines();
    spawnNewTetromino();
    return rows;
}

std::optional<int> GameState::ghostRow() const noexcept {
    if (!activeTetromino_) {
        return std::nullopt;
    }

    Tetromino ghost = *activeTetromino_;
    while (true) {
        Tetromino below = ghost.movedBy(0, 1);
        if (board_.collides(below)) {
            break;
        }
        ghost = below;
    }
    return ghost.origin().y;
}

bool GameState::spawnNewTetromino() {
    activeTetromino_ = Tetromino{nextType_, Rotation::R0, SpawnOrigin};
    nextType_ = factory_.nextType();

    if (board_.collides(*activeTetromino_)) {
        // Cannot spawn -> game over
        activeTetromino_.reset();
        status_ = GameStatus::GameOver;
        return false;
    }
    return true;
}

void GameState::lockActiveTetrominoAndProcessLines() {
    if (!activeTetromino_) return;

    board_.lockTetromino(*activeTetromino_);
    activeTetromino_.reset();
    ++lockedPieces_;

    const int lines = board_.clearFullLines();
    if (lines > 0) {
        // Score with the level in effect before these lines count
        scoreManager_.addLinesCleared(lines, levelManager_.level());
        levelManager_.onLinesCleared(lines);
    }
}

bool GameState::tryMove(int dx, int dy) {
    if (!activeTetromino_) return false;

    const Tetromino moved = activeTetromino_->movedBy(dx, dy);
    if (board_.collides(moved)) {
        return false;
    }
    activeTetromino_ = moved;
    return true;
}

} // namespace blockfall::core
