#pragma once // Include guard

#include <cstdint> // For fixed-width integer types

// Namespace for blockfall core types
namespace blockfall::core {

// A cell on the playfield: x = column, y = row (row 0 is the top).
// y may be negative while a piece is partially above the board.
struct Position {
    int x{};
    int y{};
};

// Block offset relative to a piece origin
struct Offset {
    int dx{};
    int dy{};
};

// Rotation states for Tetrominoes
enum class Rotation : std::uint8_t {
    R0   = 0,
    R90  = 1,
    R180 = 2,
    R270 = 3
};

// Function to get the next rotation state in a clockwise direction
inline Rotation nextRotation(Rotation r) {
    return static_cast<Rotation>((static_cast<std::uint8_t>(r) + 1U) % 4U);
}

// Tetromino types, in shape id order (I = 0 ... L = 6)
enum class TetrominoType : std::uint8_t {
    I, O, T, S, Z, J, L
};

constexpr int TetrominoTypeCount = 7;

inline int shapeId(TetrominoType type) noexcept {
    return static_cast<int>(type);
}

// Value written into the board for a locked block of this type (1..7)
inline std::uint8_t colorIndexFor(TetrominoType type) noexcept {
    return static_cast<std::uint8_t>(shapeId(type) + 1);
}

// Single-letter name for a type
inline char shapeLetter(TetrominoType type) noexcept {
    static constexpr char letters[] = {'I', 'O', 'T', 'S', 'Z', 'J', 'L'};
    return letters[shapeId(type)];
}

// Letter for a board value; '?' when the value is not a color index (1..7)
inline char shapeLetterForCell(std::uint8_t value) noexcept {
    if (value < 1 || value > TetrominoTypeCount) {
        return '?';
    }
    return shapeLetter(static_cast<TetrominoType>(value - 1));
}

} // namespace blockfall::core
