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

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @file layout_table.h
 * @brief Immutable mapping from logical characters to physical keystrokes
 *
 * A logical character is one renderable unit of text: a base letter plus any
 * combining marks (e.g. "கா" = KA + AA sign). Under Tamil99 such a unit is
 * typed as an ordered sequence of 1-3 physical keystrokes.
 *
 * Design:
 * - Built once at startup, read-only afterwards
 * - Safe to share across any number of sessions (no mutation after construction)
 * - O(1) average lookup (hash map keyed by the UTF-8 character)
 * - Greedy longest-match segmentation turns a UTF-8 line into logical characters
 */

namespace thattan {

/// Keycap id of the space bar
constexpr const char* KEY_SPACE = "Space";

/**
 * @brief One physical key press
 *
 * key_id is the canonical keycap label: upper-case letter, unshifted
 * punctuation ("6", ";", "/") or "Space".
 */
struct KeyStroke {
    std::string key_id;             ///< Canonical keycap label
    bool requires_modifier{false};  ///< Shift must be held

    bool operator==(const KeyStroke& other) const {
        return key_id == other.key_id && requires_modifier == other.requires_modifier;
    }
    bool operator!=(const KeyStroke& other) const {
        return !(*this == other);
    }
};

/// Ordered keystrokes producing one logical character
using KeySequence = std::vector<KeyStroke>;

/// A practice line split into logical characters (each a UTF-8 string)
using PracticeLine = std::vector<std::string>;

/**
 * @brief Canonicalize a raw key label
 *
 * Upper-cases ASCII letters and maps " " / "space" to KEY_SPACE, so that
 * front-ends may pass "h" or "H" interchangeably.
 */
std::string normalize_key_id(const std::string& key);

/**
 * @brief Split UTF-8 text into code points (one string per code point)
 * @throws UnmappedCharacterError on malformed UTF-8
 */
std::vector<std::string> split_code_points(const std::string& text);

class LayoutTable {
  public:
    using Entries = std::unordered_map<std::string, KeySequence>;

    /**
     * @brief Build a table from its entries
     *
     * @param entries Logical character -> keystroke sequence
     * @throws std::invalid_argument if any entry is empty or has an empty key
     */
    explicit LayoutTable(Entries entries);

    /**
     * @brief Keystrokes for a logical character
     *
     * @param character UTF-8 logical character
     * @return Non-empty keystroke sequence
     * @throws UnmappedCharacterError if the character has no entry
     */
    const KeySequence& resolve(const std::string& character) const;

    /** @brief Whether @p character has an entry */
    bool contains(const std::string& character) const;

    /**
     * @brief Split a UTF-8 line into logical characters
     *
     * At every position the longest run of code points that has an entry is
     * taken. "கொடு" becomes {"கொ", "டு"}; "க்ஷா" stays one character.
     *
     * @param text UTF-8 practice text
     * @return Logical characters in order (empty for empty text)
     * @throws UnmappedCharacterError naming the first code point that starts no entry
     */
    PracticeLine segment(const std::string& text) const;

    /** @brief Number of logical characters in the table */
    size_t size() const {
        return entries_.size();
    }

    /** @brief Read-only view of all entries (for keyboard legends) */
    const Entries& entries() const {
        return entries_;
    }

  private:
    Entries entries_;
    size_t max_code_points_{0}; ///< Longest entry, in code points
};

} // namespace thattan
