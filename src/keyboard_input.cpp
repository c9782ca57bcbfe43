// Copyright 2025 Thattan
// SPDX-License-Identifier: GPL-3.0-or-later

#include "keyboard_input.h"

#include <cctype>
#include <stdexcept>

namespace thattan {

namespace {

struct ShiftedSymbol {
    char symbol;
    const char* base_key;
};

// US layout: symbol produced with Shift -> unshifted keycap
const ShiftedSymbol SHIFTED_SYMBOLS[] = {
    {'!', "1"}, {'@', "2"},  {'#', "3"}, {'$', "4"}, {'%', "5"}, {'^', "6"}, {'&', "7"},
    {'*', "8"}, {'(', "9"},  {')', "0"}, {'_', "-"}, {'+', "="}, {'{', "["}, {'}', "]"},
    {'|', "\\"}, {':', ";"}, {'"', "'"}, {'<', ","}, {'>', "."}, {'?', "/"}, {'~', "`"},
};

} // namespace

std::optional<KeyStroke> key_event_from_char(char c) {
    const auto uc = static_cast<unsigned char>(c);
    if (uc >= 0x80 || !std::isprint(uc)) {
        return std::nullopt;
    }

    if (c == ' ') {
        return KeyStroke{KEY_SPACE, false};
    }

    if (std::isalpha(uc)) {
        return KeyStroke{std::string(1, static_cast<char>(std::toupper(uc))),
                         std::isupper(uc) != 0};
    }

    for (const auto& entry : SHIFTED_SYMBOLS) {
        if (entry.symbol == c) {
            return KeyStroke{entry.base_key, true};
        }
    }

    return KeyStroke{std::string(1, c), false};
}

KeySequence keystrokes_from_typed(const std::string& typed) {
    KeySequence sequence;
    sequence.reserve(typed.size());
    for (char c : typed) {
        auto stroke = key_event_from_char(c);
        if (!stroke) {
            throw std::invalid_argument("No physical key for byte in '" + typed + "'");
        }
        sequence.push_back(*stroke);
    }
    return sequence;
}

std::string keystroke_label(const KeyStroke& stroke) {
    if (stroke.requires_modifier) {
        return "Shift+" + stroke.key_id;
    }
    return stroke.key_id;
}

} // namespace thattan
