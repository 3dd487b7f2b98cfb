#pragma once

namespace blockfall::controller {

// Discrete player input actions.
// These are UI- and platform-agnostic: keyboard, touch, scripted replay, etc.
enum class InputAction {
    MoveLeft,
    MoveRight,
    Rotate,
    SoftDrop,
    HardDrop,
    Restart
};

} // namespace blockfall::controller
