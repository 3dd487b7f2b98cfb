#pragma once

#include "Board.hpp"
#include "Tetromino.hpp"
#include "TetrominoFactory.hpp"
#include "ScoreManager.hpp"
#include "LevelManager.hpp"
#include <cstdint>
#include <optional>

namespace blockfall::core {

enum class GameStatus {
    NotStarted,
    Running,
    GameOver
};

// One play session: board, falling piece, preview piece, score and timing.
// Every action is total: a blocked move returns false and leaves the state
// untouched, and all actions are no-ops unless the status is Running.
class GameState {
public:
    static constexpr Position SpawnOrigin{3, 0};

    GameState() = default;

    const Board& board() const noexcept { return board_; }
    const std::optional<Tetromino>& activeTetromino() const noexcept { return activeTetromino_; }
    TetrominoType nextType() const noexcept { return nextType_; }

    std::uint64_t score() const noexcept { return scoreManager_.score(); }
    int level() const noexcept { return levelManager_.level(); }
    int linesCleared() const noexcept { return levelManager_.totalLinesCleared(); }
    std::uint64_t lockedPieces() const noexcept { return lockedPieces_; }
    int dropCounter() const noexcept { return dropCounter_; }
    int dropIntervalTicks() const noexcept { return levelManager_.dropIntervalTicks(); }
    std::uint32_t randomState() const noexcept { return factory_.state(); }

    GameStatus status() const noexcept { return status_; }
    bool isGameOver() const noexcept { return status_ == GameStatus::GameOver; }

    // Reset everything, seed the piece generator and spawn the first piece.
    // This is the only way out of GameOver.
    void start(std::uint32_t seed);

    // One fixed-rate tick. Returns true if the drop timer fired this tick.
    bool update();

    // Player actions
    bool moveLeft();
    bool moveRight();
    bool rotate();    // clockwise, with a one-column kick to either side
    bool softDrop();  // false means the piece landed and the next one spawned
    int hardDrop();   // rows travelled; 2 points per row

    // Row the active piece would rest on if hard-dropped (no mutation)
    std::optional<int> ghostRow() const noexcept;

    // Stage a position directly (puzzles, replays, tests)
    void setBoard(const Board& board) noexcept { board_ = board; }
    void setActiveTetromino(const Tetromino& tetromino) noexcept { activeTetromino_ = tetromino; }

private:
    Board board_;
    TetrominoFactory factory_;
    ScoreManager scoreManager_;
    LevelManager levelManager_;

    std::optional<Tetromino> activeTetromino_;
    TetrominoType nextType_{TetrominoType::I};

    int dropCounter_{0};
    std::uint64_t lockedPieces_{0};

    GameStatus status_{GameStatus::NotStarted};

    bool canAct() const noexcept {
        return status_ == GameStatus::Running && activeTetromino_.has_value();
    }

    bool spawnNewTetromino();
    void lockActiveTetrominoAndProcessLines();

    // Helper to try move active tetromino by dx, dy
    bool tryMove(int dx, int dy);
};

} // namespace blockfall::core
