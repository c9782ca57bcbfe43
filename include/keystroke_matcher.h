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

#pragma once

#include "layout_table.h"

#include <cstddef>
#include <string>
#include <vector>

/**
 * @file keystroke_matcher.h
 * @brief Incremental matching of physical keystrokes against a practice line
 *
 * State machine over (char_index, keystroke_index). One physical key event is
 * consumed per submit(); a correct key advances within the current logical
 * character, and finishing the character's sequence advances to the next
 * character. A wrong key leaves both indices where they are, so the same
 * keystroke is expected again.
 *
 * Invariants:
 * - 0 <= char_index <= length
 * - keystroke_index < sequence length of target[char_index] while not completed
 * - completed iff char_index == length
 */

namespace thattan {

/** @brief Correctness of one submitted keystroke */
enum class KeystrokeResult {
    Correct,  ///< Key and modifier matched the expected keystroke
    Incorrect ///< Anything else; position unchanged
};

/**
 * @brief Result of consuming one keystroke
 *
 * Plain data for the caller (UI highlighting, Session Scorer).
 */
struct KeystrokeOutcome {
    KeystrokeResult result{KeystrokeResult::Incorrect};
    bool character_complete{false}; ///< This keystroke finished a logical character
    bool line_complete{false};      ///< This keystroke finished the whole line
    KeyStroke expected;             ///< Keystroke that was expected
    KeyStroke pressed;              ///< Keystroke that was submitted (normalized)

    bool correct() const {
        return result == KeystrokeResult::Correct;
    }
};

class KeystrokeMatcher {
  public:
    /**
     * @brief Prepare matching of a pre-segmented line
     *
     * Every character is resolved here so that an unmapped character fails
     * before the first keystroke (and before any timer starts).
     *
     * @param layout Shared, immutable layout table (must outlive the matcher)
     * @param target Logical characters of the practice line
     * @throws UnmappedCharacterError if any character has no entry
     */
    KeystrokeMatcher(const LayoutTable& layout, PracticeLine target);

    /**
     * @brief Segment and prepare a UTF-8 practice line
     * @throws UnmappedCharacterError if the text cannot be segmented
     */
    KeystrokeMatcher(const LayoutTable& layout, const std::string& text);

    /**
     * @brief Consume one physical key event
     *
     * @param physical_key Key id (normalized with normalize_key_id)
     * @param modifier_held Whether Shift was held
     * @return Outcome of the keystroke
     * @throws SessionCompleteError if the line is already complete
     */
    KeystrokeOutcome submit(const std::string& physical_key, bool modifier_held);

    /**
     * @brief Expected next keystroke, without consuming input
     * @throws SessionCompleteError if the line is already complete
     */
    const KeyStroke& peek_next() const;

    bool completed() const {
        return char_index_ == target_.size();
    }

    size_t char_index() const {
        return char_index_;
    }

    size_t keystroke_index() const {
        return keystroke_index_;
    }

    /** @brief Number of logical characters in the line */
    size_t length() const {
        return target_.size();
    }

    const PracticeLine& target() const {
        return target_;
    }

    /** @brief Minimum number of keystrokes needed to type the whole line */
    size_t total_keystrokes() const;

    /** @brief Fully typed prefix of the line (characters before char_index) */
    std::string typed_text() const;

    /** @brief Whole target line as UTF-8 text */
    std::string target_text() const;

  private:
    PracticeLine target_;
    std::vector<const KeySequence*> sequences_; ///< Resolved per character
    size_t char_index_{0};
    size_t keystroke_index_{0};
};

} // namespace thattan
