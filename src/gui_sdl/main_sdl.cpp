#include "gui_sdl/Application.hpp"
#include "gui_sdl/GameScreen.hpp"
#include "controller/GameController.hpp"
#include "controller/LaunchOptions.hpp"

#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>

int main(int argc, char** argv) {
    using namespace blockfall;

    controller::LaunchOptions options;
    std::string error;
    if (!controller::parseLaunchOptions(argc, argv, options, error)) {
        std::fprintf(stderr, "%s\n%s", error.c_str(), controller::launchUsage(argv[0]).c_str());
        return 2;
    }
    if (options.showHelp) {
        std::printf("%s", controller::launchUsage(argv[0]).c_str());
        return 0;
    }

    const std::uint32_t seed = options.seed ? *options.seed : controller::GameController::seedFromClock();
    std::printf("blockfall: seed %u\n", static_cast<unsigned>(seed));

    gui_sdl::Application app;
    if (!app.init("blockfall", options)) {
        return 1;
    }

    app.setScreen(std::make_unique<gui_sdl::GameScreen>(seed, options.scale));
    return app.run();
}
