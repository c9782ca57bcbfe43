// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 Thattan Contributors
 *
 * This file is part of Thattan, which is free software: you can
 * redistribute it and/or modify it under the terms of the GNU General
 * Public License as published by the Free Software Foundation, either
 * version 3 of the License, or (at your option) any later version.
 *
 * See <https://www.gnu.org/licenses/>.
 */

#include "keystroke_matcher.h"

#include "tutor_errors.h"

#include <spdlog/spdlog.h>

#include <utility>

namespace thattan {

KeystrokeMatcher::KeystrokeMatcher(const LayoutTable& layout, PracticeLine target)
    : target_(std::move(target)) {
    sequences_.reserve(target_.size());
    for (const auto& character : target_) {
        sequences_.push_back(&layout.resolve(character));
    }
    spdlog::trace("[KeystrokeMatcher] Prepared line of {} characters ({} keystrokes)",
                  target_.size(), total_keystrokes());
}

KeystrokeMatcher::KeystrokeMatcher(const LayoutTable& layout, const std::string& text)
    : KeystrokeMatcher(layout, layout.segment(text)) {}

KeystrokeOutcome KeystrokeMatcher::submit(const std::string& physical_key, bool modifier_held) {
    if (completed()) {
        throw SessionCompleteError("submit");
    }

    const KeySequence& sequence = *sequences_[char_index_];
    KeystrokeOutcome outcome;
    outcome.expected = sequence[keystroke_index_];
    outcome.pressed = KeyStroke{normalize_key_id(physical_key), modifier_held};

    if (outcome.pressed != outcome.expected) {
        outcome.result = KeystrokeResult::Incorrect;
        spdlog::trace("[KeystrokeMatcher] Incorrect: expected {}{} got {}{} at {}:{}",
                      outcome.expected.requires_modifier ? "Shift+" : "",
                      outcome.expected.key_id, modifier_held ? "Shift+" : "",
                      outcome.pressed.key_id, char_index_, keystroke_index_);
        return outcome;
    }

    outcome.result = KeystrokeResult::Correct;
    keystroke_index_++;
    if (keystroke_index_ == sequence.size()) {
        keystroke_index_ = 0;
        char_index_++;
        outcome.character_complete = true;
        outcome.line_complete = completed();
    }

    return outcome;
}

const KeyStroke& KeystrokeMatcher::peek_next() const {
    if (completed()) {
        throw SessionCompleteError("peek_next");
    }
    return (*sequences_[char_index_])[keystroke_index_];
}

size_t KeystrokeMatcher::total_keystrokes() const {
    size_t total = 0;
    for (const auto* sequence : sequences_) {
        total += sequence->size();
    }
    return total;
}

std::string KeystrokeMatcher::typed_text() const {
    std::string typed;
    for (size_t i = 0; i < char_index_; i++) {
        typed += target_[i];
    }
    return typed;
}

std::string KeystrokeMatcher::target_text() const {
    std::string text;
    for (const auto& character : target_) {
        text += character;
    }
    return text;
}

} // namespace thattan
