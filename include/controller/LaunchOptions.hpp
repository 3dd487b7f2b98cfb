#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace blockfall::controller {

// Command-line configuration shared by the frontends
struct LaunchOptions {
    std::optional<std::uint32_t> seed; // empty = seed from the clock
    int scale{1};                      // integer window scale for the GUI
    bool vsync{true};
    bool showHelp{false};
};

constexpr int MinScale = 1;
constexpr int MaxScale = 4;

// Fills `out` from argv. On failure returns false and sets `error`.
bool parseLaunchOptions(int argc, const char* const argv[], LaunchOptions& out, std::string& error);

std::string launchUsage(const std::string& program);

} // namespace blockfall::controller
