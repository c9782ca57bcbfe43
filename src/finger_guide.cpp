// Copyright 2025 Thattan
// SPDX-License-Identifier: GPL-3.0-or-later

#include "finger_guide.h"

#include <initializer_list>
#include <unordered_map>

namespace thattan {

namespace {

const std::unordered_map<std::string, FingerAssignment>& finger_map() {
    static const std::unordered_map<std::string, FingerAssignment> map = [] {
        std::unordered_map<std::string, FingerAssignment> m;
        auto assign = [&m](std::initializer_list<const char*> keys, Hand hand, Finger finger) {
            for (const char* key : keys) {
                m[key] = FingerAssignment{hand, finger};
            }
        };

        assign({"`", "1", "Q", "A", "Z", "TAB", "CAPS", "CTRL"}, Hand::Left, Finger::Pinky);
        assign({"2", "W", "S", "X"}, Hand::Left, Finger::Ring);
        assign({"3", "E", "D", "C"}, Hand::Left, Finger::Middle);
        assign({"4", "5", "R", "T", "F", "G", "V", "B"}, Hand::Left, Finger::Index);
        assign({KEY_SPACE, "ALT"}, Hand::Left, Finger::Thumb);

        assign({"6", "7", "Y", "U", "H", "J", "N", "M"}, Hand::Right, Finger::Index);
        assign({"8", "I", "K", ","}, Hand::Right, Finger::Middle);
        assign({"9", "O", "L", "."}, Hand::Right, Finger::Ring);
        assign({"0", "-", "=", "P", "[", "]", "\\", ";", "'", "/", "ENTER", "BACKSPACE", "SHIFT"},
               Hand::Right, Finger::Pinky);
        return m;
    }();
    return map;
}

Hand opposite(Hand hand) {
    return hand == Hand::Left ? Hand::Right : Hand::Left;
}

const char* hand_english(Hand hand) {
    return hand == Hand::Left ? "Left" : "Right";
}

const char* hand_tamil(Hand hand) {
    return hand == Hand::Left ? "இடது" : "வலது";
}

const char* finger_english(Finger finger) {
    switch (finger) {
    case Finger::Thumb:
        return "Thumb";
    case Finger::Index:
        return "Index";
    case Finger::Middle:
        return "Middle";
    case Finger::Ring:
        return "Ring";
    case Finger::Pinky:
        return "Pinky";
    }
    return "Index";
}

const char* finger_tamil(Finger finger) {
    switch (finger) {
    case Finger::Thumb:
        return "கட்டைவிரல்";
    case Finger::Index:
        return "சுட்டுவிரல்";
    case Finger::Middle:
        return "நடுவிரல்";
    case Finger::Ring:
        return "மோதிரவிரல்";
    case Finger::Pinky:
        return "சிறுவிரல்";
    }
    return "சுட்டுவிரல்";
}

} // namespace

FingerAssignment finger_for_key(const std::string& key_id) {
    const auto& map = finger_map();
    auto it = map.find(normalize_key_id(key_id));
    if (it == map.end()) {
        return FingerAssignment{Hand::Right, Finger::Index};
    }
    return it->second;
}

FingerHint hint_for(const KeyStroke& stroke) {
    FingerHint hint;
    hint.key = finger_for_key(stroke.key_id);
    hint.hold_shift = stroke.requires_modifier;
    hint.shift_hand = opposite(hint.key.hand);
    return hint;
}

std::string english_name(const FingerAssignment& assignment) {
    return std::string(hand_english(assignment.hand)) + " " + finger_english(assignment.finger);
}

std::string tamil_name(const FingerAssignment& assignment) {
    return std::string(hand_tamil(assignment.hand)) + " " + finger_tamil(assignment.finger);
}

std::string FingerHint::english() const {
    if (!hold_shift) {
        return english_name(key);
    }
    return std::string("Hold ") + hand_english(shift_hand) + " Shift, " + english_name(key);
}

std::string FingerHint::tamil() const {
    if (!hold_shift) {
        return tamil_name(key);
    }
    return tamil_name(FingerAssignment{shift_hand, Finger::Pinky}) + " + " + tamil_name(key);
}

} // namespace thattan
