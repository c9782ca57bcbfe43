// Copyright 2025 Thattan
// SPDX-License-Identifier: GPL-3.0-or-later

#include "keyboard_input.h"

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

using namespace thattan;

TEST_CASE("key_event_from_char: letters", "[keyboard][input]") {
    auto lower = key_event_from_char('h');
    REQUIRE(lower.has_value());
    REQUIRE(lower->key_id == "H");
    REQUIRE_FALSE(lower->requires_modifier);

    auto upper = key_event_from_char('H');
    REQUIRE(upper.has_value());
    REQUIRE(upper->key_id == "H");
    REQUIRE(upper->requires_modifier);
}

TEST_CASE("key_event_from_char: punctuation and digits", "[keyboard][input]") {
    REQUIRE(key_event_from_char('!') == KeyStroke{"1", true});
    REQUIRE(key_event_from_char('^') == KeyStroke{"6", true});
    REQUIRE(key_event_from_char(':') == KeyStroke{";", true});
    REQUIRE(key_event_from_char('?') == KeyStroke{"/", true});
    REQUIRE(key_event_from_char(';') == KeyStroke{";", false});
    REQUIRE(key_event_from_char('7') == KeyStroke{"7", false});
    REQUIRE(key_event_from_char(' ') == KeyStroke{KEY_SPACE, false});
}

TEST_CASE("key_event_from_char: bytes without a key", "[keyboard][input]") {
    REQUIRE_FALSE(key_event_from_char('\n').has_value());
    REQUIRE_FALSE(key_event_from_char('\x1b').has_value());
    REQUIRE_FALSE(key_event_from_char(static_cast<char>(0xe0)).has_value());
}

TEST_CASE("keystrokes_from_typed: layout notation", "[keyboard][input]") {
    REQUIRE(keystrokes_from_typed("hq") == KeySequence{{"H", false}, {"Q", false}});
    REQUIRE(keystrokes_from_typed("^#1") ==
            KeySequence{{"6", true}, {"3", true}, {"1", false}});
    REQUIRE(keystrokes_from_typed("").empty());
    REQUIRE_THROWS_AS(keystrokes_from_typed("a\tb"), std::invalid_argument);
}

TEST_CASE("keystroke_label", "[keyboard][input]") {
    REQUIRE(keystroke_label(KeyStroke{"H", false}) == "H");
    REQUIRE(keystroke_label(KeyStroke{"F", true}) == "Shift+F");
    REQUIRE(keystroke_label(KeyStroke{KEY_SPACE, false}) == "Space");
}
