#include <catch2/catch_test_macros.hpp>

#include "core/PieceCatalog.hpp"
#include "core/Types.hpp"

#include <set>
#include <string>
#include <stdexcept>
#include <utility>

using namespace blockfall::core;

namespace {

const TetrominoType kAllTypes[] = {
    TetrominoType::I, TetrominoType::O, TetrominoType::T, TetrominoType::S,
    TetrominoType::Z, TetrominoType::J, TetrominoType::L
};

const Rotation kAllRotations[] = {
    Rotation::R0, Rotation::R90, Rotation::R180, Rotation::R270
};

} // namespace

TEST_CASE("Catalog shapes have four distinct blocks inside a 4x4 box", "[catalog]") {
    for (auto type : kAllTypes) {
        for (auto rot : kAllRotations) {
            std::set<std::pair<int, int>> seen;
            for (const auto& o : PieceCatalog::shape(type, rot)) {
                REQUIRE(o.dx >= 0);
                REQUIRE(o.dx <= 3);
                REQUIRE(o.dy >= 0);
                REQUIRE(o.dy <= 3);
                seen.insert({o.dx, o.dy});
            }
            REQUIRE(seen.size() == 4);
        }
    }
}

TEST_CASE("Catalog rotation-0 shapes fit a 4x2 preview box", "[catalog]") {
    for (auto type : kAllTypes) {
        for (const auto& o : PieceCatalog::shape(type, Rotation::R0)) {
            REQUIRE(o.dy <= 1);
        }
    }
}

TEST_CASE("Catalog O piece is identical in every rotation", "[catalog]") {
    const auto& base = PieceCatalog::shape(TetrominoType::O, Rotation::R0);
    for (auto rot : kAllRotations) {
        const auto& s = PieceCatalog::shape(TetrominoType::O, rot);
        for (int i = 0; i < PieceCatalog::BlockCount; ++i) {
            CHECK(s[i].dx == base[i].dx);
            CHECK(s[i].dy == base[i].dy);
        }
    }
}

TEST_CASE("Catalog blockOffset matches the table and rejects bad indices", "[catalog]") {
    // Vertical I sits in column 2 of its box
    for (int i = 0; i < 4; ++i) {
        const Offset o = PieceCatalog::blockOffset(TetrominoType::I, Rotation::R90, i);
        CHECK(o.dx == 2);
        CHECK(o.dy == i);
    }

    REQUIRE_THROWS_AS(PieceCatalog::blockOffset(TetrominoType::T, Rotation::R0, 4), std::out_of_range);
    REQUIRE_THROWS_AS(PieceCatalog::blockOffset(TetrominoType::T, Rotation::R0, -1), std::out_of_range);
}

TEST_CASE("Color index is shape id plus one", "[catalog]") {
    int expected = 1;
    for (auto type : kAllTypes) {
        CHECK(colorIndexFor(type) == expected);
        ++expected;
    }
}

TEST_CASE("Shape letters follow shape id order", "[catalog]") {
    std::string letters;
    for (auto type : kAllTypes) {
        letters += shapeLetter(type);
    }
    REQUIRE(letters == "IOTSZJL");

    // Board values are shape id + 1
    REQUIRE(shapeLetterForCell(colorIndexFor(TetrominoType::I)) == 'I');
    REQUIRE(shapeLetterForCell(7) == 'L');
}

TEST_CASE("Board values outside the color range have no shape letter", "[catalog]") {
    REQUIRE(shapeLetterForCell(0) == '?');
    REQUIRE(shapeLetterForCell(8) == '?');
    REQUIRE(shapeLetterForCell(200) == '?');
    REQUIRE(shapeLetterForCell(255) == '?');
}
