#include <catch2/catch_test_macros.hpp>

#include "core/TetrominoFactory.hpp"
#include "core/Types.hpp"

#include <vector>

using namespace blockfall::core;

TEST_CASE("TetrominoFactory follows the 31-bit LCG", "[random]") {
    TetrominoFactory factory{42};

    // 42 * 1103515245 + 12345 mod 2^31
    const TetrominoType first = factory.nextType();
    REQUIRE(factory.state() == 1250496027U);
    REQUIRE(first == TetrominoType::Z); // 1250496027 % 7 == 4

    factory.nextType();
    REQUIRE(factory.state() == 1116302264U);
}

TEST_CASE("TetrominoFactory produces a fixed sequence for a seed", "[random]") {
    TetrominoFactory factory{42};

    const std::vector<TetrominoType> expected{
        TetrominoType::Z, TetrominoType::I, TetrominoType::L, TetrominoType::O,
        TetrominoType::O, TetrominoType::I, TetrominoType::Z, TetrominoType::Z,
        TetrominoType::I, TetrominoType::L, TetrominoType::S, TetrominoType::T
    };

    for (auto type : expected) {
        REQUIRE(factory.nextType() == type);
    }
}

TEST_CASE("TetrominoFactory reseed restarts the sequence", "[random]") {
    TetrominoFactory a{123456};
    std::vector<TetrominoType> first;
    for (int i = 0; i < 50; ++i) {
        first.push_back(a.nextType());
    }

    a.reseed(123456);
    for (int i = 0; i < 50; ++i) {
        REQUIRE(a.nextType() == first[static_cast<std::size_t>(i)]);
    }
}

TEST_CASE("TetrominoFactory state stays below 2^31 for large seeds", "[random]") {
    TetrominoFactory factory{0xFFFFFFFFU};
    for (int i = 0; i < 1000; ++i) {
        const auto type = factory.nextType();
        REQUIRE(factory.state() < 0x80000000U);
        REQUIRE(shapeId(type) >= 0);
        REQUIRE(shapeId(type) < TetrominoTypeCount);
    }
}
