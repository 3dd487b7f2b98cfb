#include <catch2/catch_test_macros.hpp>

#include "render/ScreenLayout.hpp"
#include "render/BoardRenderer.hpp"

using namespace blockfall::render;

TEST_CASE("ScreenLayout window size fits the board at the launch scale", "[render][layout]")
{
    const WindowSize one = windowSizeFor(1);
    REQUIRE(one.width == 600);
    REQUIRE(one.height == 660);

    const WindowSize two = windowSizeFor(2);
    REQUIRE(two.width == 920);
    REQUIRE(two.height == 1280);

    // The initial window reproduces the requested scale exactly
    const ScreenLayout L = computeScreenLayout(one.width, one.height, 1);
    CHECK(L.scale == 1.0f);
    CHECK(L.board.x == 20);
    CHECK(L.board.y == 20);
    CHECK(L.board.w == BoardRenderer::FrameWidth);
    CHECK(L.board.h == BoardRenderer::FrameHeight);

    CHECK(L.panel.x == 360);
    CHECK(L.panel.y == 20);
    CHECK(L.panel.w == 220);

    CHECK(L.preview.x == 380);
    CHECK(L.preview.y == 190);
    CHECK(L.preview.w == 180);
    CHECK(L.preview.h == 120);
}

TEST_CASE("ScreenLayout centres board and panel in a wide window", "[render][layout]")
{
    const ScreenLayout L = computeScreenLayout(1120, 1280, 2);
    CHECK(L.scale == 2.0f);
    CHECK(L.board.x == 120);
    CHECK(L.board.w == 640);
    CHECK(L.board.h == 1240);
    CHECK(L.panel.x == 120 + 640 + 20);
}

TEST_CASE("ScreenLayout shrinks to the window but not below half size", "[render][layout]")
{
    // Preferred scale 4, but the window only has room for 2
    const WindowSize two = windowSizeFor(2);
    CHECK(computeScreenLayout(two.width, two.height, 4).scale == 2.0f);

    const ScreenLayout tiny = computeScreenLayout(100, 100, 1);
    CHECK(tiny.scale == ScreenLayout::MinScale);
    CHECK(tiny.board.w == BoardRenderer::FrameWidth / 2);
    CHECK(tiny.board.h == BoardRenderer::FrameHeight / 2);
    CHECK(tiny.board.x == ScreenLayout::Margin);
}
