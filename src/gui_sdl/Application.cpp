#include "gui_sdl/Application.hpp"

#include <cstdio>

#include <imgui.h>
#include <imgui_impl_sdl2.h>
#include <imgui_impl_sdlrenderer2.h>

#include "render/Palette.hpp"

namespace blockfall::gui_sdl {

Application::Application() = default;

Application::~Application() {
    shutdown();
}

bool Application::init(const char* title, const controller::LaunchOptions& options) {
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS) != 0) {
        std::fprintf(stderr, "SDL_Init failed: %s\n", SDL_GetError());
        return false;
    }

    const render::WindowSize size = render::windowSizeFor(options.scale);
    m_window = SDL_CreateWindow(
        title,
        SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
        size.width, size.height,
        SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE
    );
    if (!m_window) {
        std::fprintf(stderr, "SDL_CreateWindow failed: %s\n", SDL_GetError());
        return false;
    }

    Uint32 rendererFlags = SDL_RENDERER_ACCELERATED;
    if (options.vsync) {
        rendererFlags |= SDL_RENDERER_PRESENTVSYNC;
    }
    m_renderer = SDL_CreateRenderer(m_window, -1, rendererFlags);
    if (!m_renderer) {
        std::fprintf(stderr, "SDL_CreateRenderer failed: %s\n", SDL_GetError());
        return false;
    }

    // Nearest-neighbour scaling keeps the rasterized cells sharp.
    // Must be set before any texture is created.
    SDL_SetHint(SDL_HINT_RENDER_SCALE_QUALITY, "0");

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGui::StyleColorsDark();
    ImGui::GetIO().IniFilename = nullptr; // no imgui.ini next to the binary

    ImGui_ImplSDL2_InitForSDLRenderer(m_window, m_renderer);
    ImGui_ImplSDLRenderer2_Init(m_renderer);
    m_imguiReady = true;

    m_running = true;
    return true;
}

void Application::shutdown() {
    if (!SDL_WasInit(SDL_INIT_VIDEO)) {
        return;
    }

    // Screen textures belong to m_renderer
    m_screen.reset();

    if (m_imguiReady) {
        ImGui_ImplSDLRenderer2_Shutdown();
        ImGui_ImplSDL2_Shutdown();
        ImGui::DestroyContext();
        m_imguiReady = false;
    }

    if (m_renderer) {
        SDL_DestroyRenderer(m_renderer);
        m_renderer = nullptr;
    }
    if (m_window) {
        SDL_DestroyWindow(m_window);
        m_window = nullptr;
    }

    SDL_Quit();
}

void Application::setScreen(std::unique_ptr<Screen> screen) {
    m_screen = std::move(screen);
}

render::WindowSize Application::windowSize() const {
    render::WindowSize size{};
    if (m_window) SDL_GetWindowSize(m_window, &size.width, &size.height);
    return size;
}

TexturePtr Application::createStreamingTexture(const render::Framebuffer& fb) const {
    // Framebuffer bytes are R, G, B, A in memory order, which is RGBA32 on any endianness
    TexturePtr texture{SDL_CreateTexture(m_renderer, SDL_PIXELFORMAT_RGBA32, SDL_TEXTUREACCESS_STREAMING,
                                         fb.width(), fb.height())};
    if (!texture) {
        std::fprintf(stderr, "SDL_CreateTexture (%dx%d) failed: %s\n", fb.width(), fb.height(), SDL_GetError());
    }
    return texture;
}

bool Application::blit(SDL_Texture* texture, const render::Framebuffer& fb, const render::Rect& dst) const {
    if (SDL_UpdateTexture(texture, nullptr, fb.data(), fb.pitch()) != 0) {
        std::fprintf(stderr, "SDL_UpdateTexture failed: %s\n", SDL_GetError());
        return false;
    }
    const SDL_Rect target{dst.x, dst.y, dst.w, dst.h};
    if (SDL_RenderCopy(m_renderer, texture, nullptr, &target) != 0) {
        std::fprintf(stderr, "SDL_RenderCopy failed: %s\n", SDL_GetError());
        return false;
    }
    return true;
}

void Application::beginFrame() {
    // Same colour as the frame buffer's margin so the board blends into the window
    const render::Color bg = render::Palette::frameBackground();
    SDL_SetRenderDrawColor(m_renderer, bg.r, bg.g, bg.b, bg.a);
    SDL_RenderClear(m_renderer);

    ImGui_ImplSDLRenderer2_NewFrame();
    ImGui_ImplSDL2_NewFrame();
    ImGui::NewFrame();
}

void Application::endFrame() {
    ImGui::Render();
    ImGui_ImplSDLRenderer2_RenderDrawData(ImGui::GetDrawData(), m_renderer);
    SDL_RenderPresent(m_renderer);
}

int Application::run() {
    auto last = Clock::now();

    SDL_Event e;
    while (m_running) {
        while (SDL_PollEvent(&e)) {
            ImGui_ImplSDL2_ProcessEvent(&e);

            if (e.type == SDL_QUIT) {
                m_running = false;
            }
            if (m_screen) {
                m_screen->handleEvent(*this, e);
            }
        }
        if (!m_running) {
            break;
        }

        // Whole microseconds go to the screen; the sub-microsecond rest stays in `last`
        const auto elapsed = std::chrono::duration_cast<Screen::Duration>(Clock::now() - last);
        last += elapsed;

        if (m_screen) {
            m_screen->advance(*this, elapsed);
        }

        beginFrame();
        if (m_screen) {
            m_screen->draw(*this);
        }
        endFrame();
    }

    return 0;
}

} // namespace blockfall::gui_sdl
