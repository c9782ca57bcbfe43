// Copyright 2025 Thattan
// SPDX-License-Identifier: GPL-3.0-or-later

/*
 * This file is part of Thattan.
 *
 * Thattan is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Thattan is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Thattan. If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once

#include "layout_table.h"

#include <string>
#include <vector>

/**
 * @file keyboard_layout_provider.h
 * @brief Embedded Tamil99 layout data
 *
 * Provides:
 * - The Tamil99 Layout Table (vowels, consonants, consonant+vowel-sign
 *   combinations, pulli forms, Grantha letters, numerals and symbols)
 * - Keycap rows with Tamil legends for an on-screen keyboard
 *
 * Typing follows the consonant-vowel pattern of the standard:
 * - Consonant + vowel key = consonant-vowel combination (கா = h q)
 * - Consonant + f = consonant with pulli (க் = h f)
 * - Standalone vowel signs are prefixed with ^ (ா = Shift+6 q)
 */

namespace thattan {

/**
 * @brief Build the embedded Tamil99 layout table
 *
 * Auto-pulli conjunct shortcuts (க்க = h h) are not entries: under
 * longest-match segmentation they would swallow the first half of the next
 * syllable ("க்கா" must be க் + கா).
 *
 * @return Immutable layout table
 */
LayoutTable tamil99_layout();

/** @brief One keycap of the on-screen keyboard */
struct Keycap {
    std::string key_id;  ///< Physical key ("H", ";", "Space")
    std::string base;    ///< Character produced without Shift (may be empty)
    std::string shifted; ///< Character produced with Shift (may be empty)
};

/**
 * @brief Keycap rows of a US keyboard with legends taken from @p table
 *
 * Legends come from single-keystroke entries of the table. When two
 * characters share a keystroke the Tamil one wins.
 *
 * @param table Layout table to read legends from
 * @return Rows from the number row down to the space bar
 */
std::vector<std::vector<Keycap>> keyboard_layout_get_rows(const LayoutTable& table);

} // namespace thattan
