// Copyright 2025 Thattan
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "layout_table.h"

#include <optional>
#include <string>

/**
 * @file keyboard_input.h
 * @brief Translation between US-layout characters and physical keystrokes
 *
 * Front-ends that only see produced characters (a terminal, a text input)
 * use this to recover the physical key and the Shift state. The Tamil99 table
 * is also written in this notation: "hq" is H then Q, "Qf" is Shift+Q then F,
 * "^q" is Shift+6 then Q.
 */

namespace thattan {

/**
 * @brief Physical keystroke that produces @p c on a US keyboard
 *
 * Letters map to their upper-case keycap (Shift held for upper-case input),
 * shifted symbols map to their base key with Shift ('!' -> 1 + Shift), and
 * space maps to "Space".
 *
 * @param c Printable ASCII character
 * @return Keystroke, or std::nullopt for control / non-ASCII bytes
 */
std::optional<KeyStroke> key_event_from_char(char c);

/**
 * @brief Convert a typed-character notation string to a keystroke sequence
 *
 * @param typed Characters as typed on a US keyboard (e.g. "hq", "^#1")
 * @return One KeyStroke per character
 * @throws std::invalid_argument if a character has no physical key
 */
KeySequence keystrokes_from_typed(const std::string& typed);

/**
 * @brief Human-readable label for a keystroke ("Shift+Q", "H", "Space")
 */
std::string keystroke_label(const KeyStroke& stroke);

} // namespace thattan
