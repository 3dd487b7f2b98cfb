#include "gui_sdl/GameScreen.hpp"

#include <cfloat>
#include <cstdio>

#include <imgui.h>
#include <SDL.h>

#include "gui_sdl/Application.hpp"

namespace blockfall::gui_sdl {

using controller::InputAction;
using controller::KeyRepeat;
using render::BoardRenderer;

GameScreen::GameScreen(std::uint32_t seed, int scale)
    : gameState_{}
    , controller_{gameState_}
    , renderer_{}
    , frame_{BoardRenderer::makeFrameBuffer()}
    , preview_{BoardRenderer::makePreviewBuffer()}
    , preferredScale_{scale}
{
    controller_.restart(seed);
}

void GameScreen::dispatchAction(InputAction action)
{
    controller_.handleAction(action);
}

void GameScreen::releaseAllKeys()
{
    leftRepeat_.release();
    rightRepeat_.release();
    downRepeat_.release();
}

void GameScreen::pumpRepeat(KeyRepeat& repeat, InputAction action, Duration elapsed)
{
    const int repeats = repeat.advance(elapsed);
    for (int i = 0; i < repeats; ++i) {
        dispatchAction(action);
    }
}

void GameScreen::handleEvent(Application& app, const SDL_Event& e)
{
    if (e.type == SDL_KEYUP) {
        switch (e.key.keysym.sym) {
            case SDLK_LEFT:
            case SDLK_a:
                leftRepeat_.release();
                break;
            case SDLK_RIGHT:
            case SDLK_d:
                rightRepeat_.release();
                break;
            case SDLK_DOWN:
            case SDLK_s:
                downRepeat_.release();
                break;
            default:
                break;
        }
        return;
    }

    if (e.type != SDL_KEYDOWN || e.key.repeat != 0) {
        return;
    }

    switch (e.key.keysym.sym) {
        case SDLK_LEFT:
        case SDLK_a:
            dispatchAction(InputAction::MoveLeft);
            leftRepeat_.press();
            rightRepeat_.release();
            break;
        case SDLK_RIGHT:
        case SDLK_d:
            dispatchAction(InputAction::MoveRight);
            rightRepeat_.press();
            leftRepeat_.release();
            break;
        case SDLK_DOWN:
        case SDLK_s:
            dispatchAction(InputAction::SoftDrop);
            downRepeat_.press();
            break;
        case SDLK_UP:
        case SDLK_w:
            dispatchAction(InputAction::Rotate);
            break;
        case SDLK_SPACE:
            dispatchAction(InputAction::HardDrop);
            break;
        case SDLK_r:
        case SDLK_RETURN:
            if (gameState_.isGameOver()) {
                dispatchAction(InputAction::Restart);
                releaseAllKeys();
            }
            break;
        case SDLK_ESCAPE:
            app.requestQuit();
            break;
        default:
            break;
    }
}

void GameScreen::advance(Application&, Duration elapsed)
{
    controller_.update(elapsed);

    if (gameState_.isGameOver()) {
        releaseAllKeys();
        return;
    }

    pumpRepeat(leftRepeat_, InputAction::MoveLeft, elapsed);
    pumpRepeat(rightRepeat_, InputAction::MoveRight, elapsed);
    pumpRepeat(downRepeat_, InputAction::SoftDrop, elapsed);
}

bool GameScreen::ensureTextures(Application& app)
{
    if (!frameTexture_) {
        frameTexture_ = app.createStreamingTexture(frame_);
    }
    if (!previewTexture_) {
        previewTexture_ = app.createStreamingTexture(preview_);
    }
    return frameTexture_ && previewTexture_;
}

void GameScreen::draw(Application& app)
{
    const render::WindowSize win = app.windowSize();
    const render::ScreenLayout L = render::computeScreenLayout(win.width, win.height, preferredScale_);

    if (!ensureTextures(app)) {
        app.requestQuit();
        return;
    }

    renderer_.renderFrame(frame_, gameState_);
    if (!app.blit(frameTexture_.get(), frame_, L.board)) {
        app.requestQuit();
        return;
    }

    if (gameState_.status() == core::GameStatus::Running) {
        renderer_.renderNextPreview(preview_, gameState_.nextType());
        if (!app.blit(previewTexture_.get(), preview_, L.preview)) {
            app.requestQuit();
            return;
        }
    }

    renderHUD(L);
    renderGameOverOverlay(L);
}

void GameScreen::renderHUD(const render::ScreenLayout& L)
{
    ImGui::SetNextWindowPos(ImVec2((float)L.panel.x, (float)L.panel.y), ImGuiCond_Always);
    ImGui::SetNextWindowSizeConstraints(ImVec2((float)L.panel.w, 0.0f), ImVec2((float)L.panel.w, 160.0f));
    ImGui::Begin("Game", nullptr,
                 ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_AlwaysAutoResize);

    ImGui::Text("Score: %llu", (unsigned long long)gameState_.score());
    ImGui::Text("Level: %d", gameState_.level());
    ImGui::Text("Lines: %d", gameState_.linesCleared());
    ImGui::Text("Pieces: %llu", (unsigned long long)gameState_.lockedPieces());

    ImGui::Separator();
    ImGui::TextUnformatted("Next:");

    ImGui::End();

    ImGui::SetNextWindowPos(ImVec2((float)L.panel.x, (float)(L.preview.y + L.preview.h + 20)), ImGuiCond_Always);
    ImGui::SetNextWindowSize(ImVec2((float)L.panel.w, 0.0f), ImGuiCond_Always);
    ImGui::SetNextWindowCollapsed(true, ImGuiCond_FirstUseEver);
    ImGui::Begin("Controls", nullptr, ImGuiWindowFlags_NoMove);

    ImGui::TextUnformatted("A/D or Left/Right: Move (hold)");
    ImGui::TextUnformatted("S or Down: Soft drop (hold)");
    ImGui::TextUnformatted("W or Up: Rotate");
    ImGui::TextUnformatted("Space: Hard drop");
    ImGui::TextUnformatted("R or Enter: Restart after game over");
    ImGui::TextUnformatted("Esc: Quit");

    ImGui::Separator();
    ImGui::Text("FPS: %.1f", ImGui::GetIO().Framerate);

    ImGui::End();
}

void GameScreen::renderGameOverOverlay(const render::ScreenLayout& L) const
{
    if (!gameState_.isGameOver()) return;

    ImDrawList* dl = ImGui::GetForegroundDrawList();

    const float cx = L.board.x + L.board.w * 0.5f;
    const float cy = L.board.y + L.board.h * 0.5f;
    const float cardW = L.board.w * 0.90f;
    const float cardH = 120.0f;

    dl->AddRectFilled(ImVec2(cx - cardW * 0.5f, cy - cardH * 0.5f),
                      ImVec2(cx + cardW * 0.5f, cy + cardH * 0.5f),
                      IM_COL32(0, 0, 0, 175), 10.0f);

    char scoreLine[64];
    std::snprintf(scoreLine, sizeof(scoreLine), "Final score: %llu",
                  (unsigned long long)gameState_.score());

    const char* msg = "GAME OVER";
    const char* hint = "Press R or Enter to play again";

    ImFont* font = ImGui::GetFont();
    const float bigSize = ImGui::GetFontSize() * 2.0f;
    const ImVec2 tSize = font->CalcTextSizeA(bigSize, FLT_MAX, 0.0f, msg);
    dl->AddText(font, bigSize, ImVec2(cx - tSize.x * 0.5f, cy - 44.0f),
                IM_COL32(255, 255, 255, 255), msg);

    const ImVec2 sSize = ImGui::CalcTextSize(scoreLine);
    dl->AddText(ImVec2(cx - sSize.x * 0.5f, cy + 2.0f), IM_COL32(220, 220, 220, 255), scoreLine);

    const ImVec2 hSize = ImGui::CalcTextSize(hint);
    dl->AddText(ImVec2(cx - hSize.x * 0.5f, cy + 24.0f), IM_COL32(180, 180, 180, 255), hint);
}

} // namespace blockfall::gui_sdl
