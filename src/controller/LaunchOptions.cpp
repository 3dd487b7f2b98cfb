#include "controller/LaunchOptions.hpp"

#include <cerrno>
#include <cstdlib>
#include <sstream>

namespace blockfall::controller {

namespace {

bool parseUnsigned(const std::string& text, unsigned long long maxValue, unsigned long long& value) {
    if (text.empty() || text[0] == '-' || text[0] == '+') {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    const unsigned long long parsed = std::strtoull(text.c_str(), &end, 10);
    if (errno != 0 || end == nullptr || *end != '\0' || parsed > maxValue) {
        return false;
    }
    value = parsed;
    return true;
}

} // namespace

bool parseLaunchOptions(int argc, const char* const argv[], LaunchOptions& out, std::string& error) {
    LaunchOptions opts;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            opts.showHelp = true;
        } else if (arg == "--no-vsync") {
            opts.vsync = false;
        } else if (arg == "--seed" || arg == "--scale") {
            if (i + 1 >= argc) {
                error = "missing value for " + arg;
                return false;
            }
            const std::string value = argv[++i];
            unsigned long long parsed = 0;

            if (arg == "--seed") {
                if (!parseUnsigned(value, 0xFFFFFFFFULL, parsed)) {
                    error = "invalid seed: " + value;
                    return false;
                }
                opts.seed = static_cast<std::uint32_t>(parsed);
            } else {
                if (!parseUnsigned(value, MaxScale, parsed) || parsed < MinScale) {
                    error = "scale must be between 1 and 4: " + value;
                    return false;
                }
                opts.scale = static_cast<int>(parsed);
            }
        } else {
            error = "unknown option: " + arg;
            return false;
        }
    }

    out = opts;
    return true;
}

std::string launchUsage(const std::string& program) {
    std::ostringstream os;
    os << "Usage: " << program << " [options]\n"
       << "  --seed N      start with a fixed piece sequence (default: clock)\n"
       << "  --scale N     window scale, " << MinScale << ".." << MaxScale << " (default: 1)\n"
       << "  --no-vsync    do not wait for vertical sync\n"
       << "  -h, --help    show this text\n";
    return os.str();
}

} // namespace blockfall::controller
