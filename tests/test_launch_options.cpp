#include <catch2/catch_test_macros.hpp>

#include "controller/LaunchOptions.hpp"

#include <string>
#include <vector>

using blockfall::controller::LaunchOptions;
using blockfall::controller::launchUsage;
using blockfall::controller::parseLaunchOptions;

namespace {

bool parse(std::vector<const char*> args, LaunchOptions& out, std::string& error)
{
    args.insert(args.begin(), "blockfall");
    return parseLaunchOptions(static_cast<int>(args.size()), args.data(), out, error);
}

} // namespace

TEST_CASE("LaunchOptions defaults", "[config]")
{
    LaunchOptions opts;
    std::string error;
    REQUIRE(parse({}, opts, error));

    CHECK_FALSE(opts.seed.has_value());
    CHECK(opts.scale == 1);
    CHECK(opts.vsync);
    CHECK_FALSE(opts.showHelp);
}

TEST_CASE("LaunchOptions parses seed, scale and flags", "[config]")
{
    LaunchOptions opts;
    std::string error;
    REQUIRE(parse({"--seed", "42", "--scale", "3", "--no-vsync"}, opts, error));

    REQUIRE(opts.seed.has_value());
    CHECK(*opts.seed == 42U);
    CHECK(opts.scale == 3);
    CHECK_FALSE(opts.vsync);

    REQUIRE(parse({"--seed", "4294967295", "-h"}, opts, error));
    CHECK(*opts.seed == 4294967295U);
    CHECK(opts.showHelp);
}

TEST_CASE("LaunchOptions rejects bad values and leaves output untouched", "[config]")
{
    LaunchOptions opts;
    opts.scale = 2;
    std::string error;

    CHECK_FALSE(parse({"--seed"}, opts, error));
    CHECK(error.find("--seed") != std::string::npos);

    CHECK_FALSE(parse({"--seed", "-3"}, opts, error));
    CHECK_FALSE(parse({"--seed", "12abc"}, opts, error));
    CHECK_FALSE(parse({"--seed", "4294967296"}, opts, error));
    CHECK_FALSE(parse({"--scale", "0"}, opts, error));
    CHECK_FALSE(parse({"--scale", "5"}, opts, error));
    CHECK_FALSE(parse({"--fullscreen"}, opts, error));
    CHECK(error.find("--fullscreen") != std::string::npos);

    CHECK(opts.scale == 2);
}

TEST_CASE("LaunchOptions usage lists every option", "[config]")
{
    const std::string usage = launchUsage("blockfall");
    CHECK(usage.find("--seed") != std::string::npos);
    CHECK(usage.find("--scale") != std::string::npos);
    CHECK(usage.find("--no-vsync") != std::string::npos);
    CHECK(usage.find("--help") != std::string::npos);
}
