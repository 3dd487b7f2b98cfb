#pragma once

#include <SDL.h>

#include "controller/GameController.hpp"

namespace blockfall::gui_sdl {

class Application;

// One full-window view driven by Application::run(). Per frame:
// events, then advance() with the measured wall time, then draw().
class Screen {
public:
    using Duration = controller::GameController::Duration;

    virtual ~Screen() = default;

    virtual void handleEvent(Application& app, const SDL_Event& e) = 0;

    // Feed wall time to the screen's fixed-step controller
    virtual void advance(Application& app, Duration elapsed) = 0;

    // Called between the frame clear and the ImGui pass
    virtual void draw(Application& app) = 0;
};

} // namespace blockfall::gui_sdl
