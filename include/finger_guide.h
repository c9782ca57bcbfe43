// Copyright 2025 Thattan
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "layout_table.h"

#include <string>

/**
 * @file finger_guide.h
 * @brief Touch-typing finger assignment for the US keyboard
 *
 * Standard assignment: each home-row finger covers its column, index fingers
 * also cover the inner columns (T/G/B/5 and Y/H/N/6), thumbs take Space.
 * Keys needing Shift are typed with the opposite hand's pinky on Shift.
 */

namespace thattan {

enum class Hand { Left, Right };

enum class Finger { Thumb, Index, Middle, Ring, Pinky };

struct FingerAssignment {
    Hand hand{Hand::Right};
    Finger finger{Finger::Index};

    bool operator==(const FingerAssignment& other) const {
        return hand == other.hand && finger == other.finger;
    }
};

/** @brief What to press for one keystroke */
struct FingerHint {
    FingerAssignment key;      ///< Finger for the key itself
    bool hold_shift{false};    ///< Whether Shift must be held
    Hand shift_hand{Hand::Left}; ///< Hand holding Shift (pinky), if hold_shift

    /** @brief e.g. "Hold Left Shift, Right Index" */
    std::string english() const;

    /** @brief e.g. "இடது சிறுவிரல் + வலது சுட்டுவிரல்" */
    std::string tamil() const;
};

/**
 * @brief Finger for a physical key id
 *
 * Unknown keys fall back to the right index finger.
 */
FingerAssignment finger_for_key(const std::string& key_id);

/** @brief Finger hint for one expected keystroke */
FingerHint hint_for(const KeyStroke& stroke);

/** @brief "Left Index" */
std::string english_name(const FingerAssignment& assignment);

/** @brief "இடது சுட்டுவிரல்" */
std::string tamil_name(const FingerAssignment& assignment);

} // namespace thattan
