// Copyright 2025 Thattan
// SPDX-License-Identifier: GPL-3.0-or-later

#include "keyboard_layout_provider.h"
#include "tutor_errors.h"

#include <catch2/catch_test_macros.hpp>

using namespace thattan;

TEST_CASE("Tamil99: vowels and consonants are single keystrokes", "[layout][tamil99]") {
    const LayoutTable table = tamil99_layout();

    REQUIRE(table.resolve("அ") == KeySequence{{"A", false}});
    REQUIRE(table.resolve("ஔ") == KeySequence{{"Z", false}});
    REQUIRE(table.resolve("க") == KeySequence{{"H", false}});
    REQUIRE(table.resolve("ந") == KeySequence{{";", false}});
    REQUIRE(table.resolve("ஸ") == KeySequence{{"Q", true}});
}

TEST_CASE("Tamil99: consonant combinations are consonant key then sign key",
          "[layout][tamil99]") {
    const LayoutTable table = tamil99_layout();

    REQUIRE(table.resolve("கா") == KeySequence{{"H", false}, {"Q", false}});
    REQUIRE(table.resolve("மி") == KeySequence{{"K", false}, {"S", false}});
    REQUIRE(table.resolve("க்") == KeySequence{{"H", false}, {"F", false}});
    REQUIRE(table.resolve("ஜை") == KeySequence{{"E", true}, {"R", false}});
}

TEST_CASE("Tamil99: shifted specials and numerals", "[layout][tamil99]") {
    const LayoutTable table = tamil99_layout();

    REQUIRE(table.resolve("ஃ") == KeySequence{{"F", true}});
    REQUIRE(table.resolve("௧") == KeySequence{{"6", true}, {"3", true}, {"1", false}});
    REQUIRE(table.resolve("ா") == KeySequence{{"6", true}, {"Q", false}});
    REQUIRE(table.resolve(" ") == KeySequence{{KEY_SPACE, false}});
    REQUIRE(table.resolve("?") == KeySequence{{"/", true}});
}

TEST_CASE("Tamil99: segmentation of words", "[layout][tamil99][segment]") {
    const LayoutTable table = tamil99_layout();

    REQUIRE(table.segment("தமிழ்") == PracticeLine{"த", "மி", "ழ்"});
    REQUIRE(table.segment("அம்மா") == PracticeLine{"அ", "ம்", "மா"});
    REQUIRE(table.segment("ஶ்ரீ") == PracticeLine{"ஶ்ரீ"});
    REQUIRE(table.segment("ஸ்ரீ") == PracticeLine{"ஸ்", "ரீ"});
    REQUIRE(table.segment("க்ஷா") == PracticeLine{"க்ஷா"});
}

TEST_CASE("Tamil99: Latin letters are not mapped", "[layout][tamil99][errors]") {
    const LayoutTable table = tamil99_layout();
    REQUIRE_THROWS_AS(table.segment("hello"), UnmappedCharacterError);
}

TEST_CASE("Keyboard rows carry Tamil legends", "[layout][keyboard]") {
    const LayoutTable table = tamil99_layout();
    const auto rows = keyboard_layout_get_rows(table);

    REQUIRE(rows.size() == 5);
    REQUIRE(rows[0].size() == 13);
    REQUIRE(rows[2].size() == 11);
    REQUIRE(rows[3].size() == 10);

    SECTION("Home row") {
        const Keycap& a = rows[2][0];
        REQUIRE(a.key_id == "A");
        REQUIRE(a.base == "அ");
        REQUIRE(a.shifted == "௹");

        const Keycap& f = rows[2][3];
        REQUIRE(f.key_id == "F");
        REQUIRE(f.base == "்");
        REQUIRE(f.shifted == "ஃ");
    }

    SECTION("Digits keep their ASCII legend") {
        REQUIRE(rows[0][1].key_id == "1");
        REQUIRE(rows[0][1].base == "1");
    }

    SECTION("Space row") {
        REQUIRE(rows[4].size() == 1);
        REQUIRE(rows[4][0].key_id == KEY_SPACE);
    }
}
