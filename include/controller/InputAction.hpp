#pragma once

namespace blockfall::controller {

// Discrete player input actions.
// These are UI- and platform-agnostic: keyboard, gamepad, scripted replay, etc.
enum class InputAction {
    MoveLeft,    // left arrow
    MoveRight,   // right arrow
    SoftDrop,    // down arrow
    Rotate,      // up arrow
    HardDrop,    // space
    PauseResume, // P, toggles on the current phase
    NewGame
};

} // namespace blockfall::controller
