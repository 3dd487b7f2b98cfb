#pragma once

#include <chrono>
#include <memory>

#include <SDL.h>

#include "gui_sdl/Screen.hpp"
#include "controller/LaunchOptions.hpp"
#include "render/Framebuffer.hpp"
#include "render/ScreenLayout.hpp"

namespace blockfall::gui_sdl {

struct TextureDeleter {
    void operator()(SDL_Texture* texture) const noexcept {
        if (texture) SDL_DestroyTexture(texture);
    }
};

// Streaming texture owned by a screen; must be released before the renderer
using TexturePtr = std::unique_ptr<SDL_Texture, TextureDeleter>;

// SDL window + renderer + ImGui context, and the frame loop that measures
// wall time for the active Screen.
class Application {
public:
    using Clock = std::chrono::steady_clock;

    Application();
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    // Window sized for the board at options.scale; vsync from options
    bool init(const char* title, const controller::LaunchOptions& options);
    int run();

    void requestQuit() { m_running = false; }

    void setScreen(std::unique_ptr<Screen> screen);

    SDL_Renderer* renderer() const { return m_renderer; }
    render::WindowSize windowSize() const;

    // RGBA32 streaming texture matching the framebuffer's dimensions.
    // Returns null (and logs) on failure.
    TexturePtr createStreamingTexture(const render::Framebuffer& fb) const;

    // Uploads the framebuffer into the texture and draws it scaled into dst
    bool blit(SDL_Texture* texture, const render::Framebuffer& fb, const render::Rect& dst) const;

private:
    void shutdown();
    void beginFrame();
    void endFrame();

private:
    bool m_running{false};
    bool m_imguiReady{false};

    SDL_Window* m_window{nullptr};
    SDL_Renderer* m_renderer{nullptr};

    std::unique_ptr<Screen> m_screen;
};

} // namespace blockfall::gui_sdl
