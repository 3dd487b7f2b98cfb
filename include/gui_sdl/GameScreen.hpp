#pragma once

#include <cstdint>

#include "gui_sdl/Application.hpp"
#include "gui_sdl/Screen.hpp"
#include "core/GameState.hpp"
#include "controller/GameController.hpp"
#include "controller/InputAction.hpp"
#include "controller/KeyRepeat.hpp"
#include "render/BoardRenderer.hpp"
#include "render/Framebuffer.hpp"
#include "render/ScreenLayout.hpp"

namespace blockfall::gui_sdl {

// Single-player screen: keyboard in, software-rendered board out.
// The board is drawn by render::BoardRenderer into a Framebuffer and
// streamed to an SDL texture through Application::blit; score/level/lines
// come from ImGui.
class GameScreen final : public Screen {
public:
    GameScreen(std::uint32_t seed, int scale);

    GameScreen(const GameScreen&) = delete;
    GameScreen& operator=(const GameScreen&) = delete;

    void handleEvent(Application& app, const SDL_Event& e) override;
    void advance(Application& app, Duration elapsed) override;
    void draw(Application& app) override;

private:
    bool ensureTextures(Application& app);
    void renderHUD(const render::ScreenLayout& L);
    void renderGameOverOverlay(const render::ScreenLayout& L) const;

    // Input helpers
    void dispatchAction(controller::InputAction action);
    void releaseAllKeys();
    void pumpRepeat(controller::KeyRepeat& repeat, controller::InputAction action,
                    Duration elapsed);

private:
    core::GameState gameState_;
    controller::GameController controller_;

    render::BoardRenderer renderer_;
    render::Framebuffer frame_;
    render::Framebuffer preview_;

    TexturePtr frameTexture_;
    TexturePtr previewTexture_;

    int preferredScale_;

    // Held-key auto repeat
    controller::KeyRepeat leftRepeat_;
    controller::KeyRepeat rightRepeat_;
    controller::KeyRepeat downRepeat_;
};

} // namespace blockfall::gui_sdl
