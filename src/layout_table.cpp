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

#include "layout_table.h"

#include "tutor_errors.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace thattan {

// ============================================================================
// UTF-8 Helpers
// ============================================================================

namespace {
// Length of a UTF-8 sequence from its lead byte (0 = invalid lead byte)
size_t utf8_sequence_length(unsigned char lead) {
    if (lead < 0x80)
        return 1;
    if ((lead & 0xE0) == 0xC0)
        return 2;
    if ((lead & 0xF0) == 0xE0)
        return 3;
    if ((lead & 0xF8) == 0xF0)
        return 4;
    return 0;
}

bool is_continuation(unsigned char byte) {
    return (byte & 0xC0) == 0x80;
}
} // namespace

std::vector<std::string> split_code_points(const std::string& text) {
    std::vector<std::string> code_points;
    code_points.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        size_t len = utf8_sequence_length(static_cast<unsigned char>(text[pos]));
        if (len == 0 || pos + len > text.size()) {
            throw UnmappedCharacterError(text.substr(pos, 1));
        }
        for (size_t i = 1; i < len; i++) {
            if (!is_continuation(static_cast<unsigned char>(text[pos + i]))) {
                throw UnmappedCharacterError(text.substr(pos, i + 1));
            }
        }
        code_points.push_back(text.substr(pos, len));
        pos += len;
    }

    return code_points;
}

std::string normalize_key_id(const std::string& key) {
    if (key == " ") {
        return KEY_SPACE;
    }

    std::string lowered = key;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lowered == "space") {
        return KEY_SPACE;
    }

    std::string normalized = key;
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return normalized;
}

// ============================================================================
// LayoutTable
// ============================================================================

LayoutTable::LayoutTable(Entries entries) : entries_(std::move(entries)) {
    for (const auto& [character, sequence] : entries_) {
        if (character.empty()) {
            throw std::invalid_argument("Layout table contains an empty character");
        }
        if (sequence.empty()) {
            throw std::invalid_argument("Layout entry '" + character + "' has no keystrokes");
        }
        for (const auto& stroke : sequence) {
            if (stroke.key_id.empty()) {
                throw std::invalid_argument("Layout entry '" + character +
                                            "' contains an empty key id");
            }
        }
        max_code_points_ = std::max(max_code_points_, split_code_points(character).size());
    }

    spdlog::debug("[LayoutTable] Built table with {} entries (longest {} code points)",
                  entries_.size(), max_code_points_);
}

const KeySequence& LayoutTable::resolve(const std::string& character) const {
    auto it = entries_.find(character);
    if (it == entries_.end()) {
        throw UnmappedCharacterError(character);
    }
    return it->second;
}

bool LayoutTable::contains(const std::string& character) const {
    return entries_.find(character) != entries_.end();
}

PracticeLine LayoutTable::segment(const std::string& text) const {
    const auto code_points = split_code_points(text);

    PracticeLine line;
    size_t i = 0;
    while (i < code_points.size()) {
        size_t longest = std::min(max_code_points_, code_points.size() - i);
        bool matched = false;

        for (size_t len = longest; len > 0; len--) {
            std::string candidate;
            for (size_t j = i; j < i + len; j++) {
                candidate += code_points[j];
            }
            if (contains(candidate)) {
                line.push_back(std::move(candidate));
                i += len;
                matched = true;
                break;
            }
        }

        if (!matched) {
            throw UnmappedCharacterError(code_points[i]);
        }
    }

    return line;
}

} // namespace thattan
