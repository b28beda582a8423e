/// @file test_chip_type.cpp
/// @brief Tests for chip kinds, footprints, categories, and text forms

#include <catch2/catch.hpp>

#include "save/chip_type.hpp"

#include <set>

using namespace tachy;

TEST_CASE("Chip text forms", "[chip_type]") {
    CHECK(ChipType(ChipKind::CMP_EQ).to_string() == "CmpEq");
    CHECK(ChipType::constant(42).to_string() == "Const(42)");
    CHECK(ChipType::toggle(true).to_string() == "Toggle(true)");
    CHECK(ChipType::toggle(false).to_string() == "Toggle(false)");

    CHECK(ChipType::parse("Demux") == ChipType(ChipKind::DEMUX));
    CHECK(ChipType::parse("Const(65535)") == ChipType::constant(65535));
    CHECK(ChipType::parse("Toggle(true)") == ChipType::toggle(true));

    SECTION("Malformed text is rejected") {
        CHECK_FALSE(ChipType::parse("Const").has_value());
        CHECK_FALSE(ChipType::parse("Const()").has_value());
        CHECK_FALSE(ChipType::parse("Const(65536)").has_value());
        CHECK_FALSE(ChipType::parse("Const(-1)").has_value());
        CHECK_FALSE(ChipType::parse("Const(1x)").has_value());
        CHECK_FALSE(ChipType::parse("Toggle(yes)").has_value());
        CHECK_FALSE(ChipType::parse("Toggle").has_value());
        CHECK_FALSE(ChipType::parse("and").has_value());
        CHECK_FALSE(ChipType::parse("").has_value());
    }
}

TEST_CASE("Chip footprints", "[chip_type]") {
    CHECK(ChipType(ChipKind::RAM).size() == CoordsSize{2, 2});
    CHECK(ChipType(ChipKind::DISPLAY).size() == CoordsSize{2, 1});
    CHECK(ChipType(ChipKind::AND).size() == CoordsSize{1, 1});
    CHECK(ChipType::constant(9).size() == CoordsSize{1, 1});
}

TEST_CASE("Chip flags", "[chip_type]") {
    CHECK(ChipType(ChipKind::BUTTON).is_interactive());
    CHECK(ChipType::toggle(false).is_interactive());
    CHECK_FALSE(ChipType(ChipKind::RAM).is_interactive());

    CHECK(is_event_chip(ChipKind::CLOCK));
    CHECK(is_event_chip(ChipKind::RAM));
    CHECK(is_event_chip(ChipKind::INC));
    CHECK_FALSE(is_event_chip(ChipKind::TOGGLE));
    CHECK_FALSE(is_event_chip(ChipKind::DISPLAY));
    CHECK_FALSE(is_event_chip(ChipKind::ADD));
}

TEST_CASE("Every chip kind is in exactly one category", "[chip_type]") {
    std::set<ChipKind> seen;
    size_t total = 0;
    for (const auto& [name, kinds] : chip_categories()) {
        CHECK_FALSE(name.empty());
        for (ChipKind kind : kinds) {
            seen.insert(kind);
            ++total;
            CHECK(chip_kind_name(kind) != "Unknown");
        }
    }
    CHECK(total == seen.size());
    CHECK(seen.size() == static_cast<size_t>(ChipKind::TOGGLE) + 1);
}
