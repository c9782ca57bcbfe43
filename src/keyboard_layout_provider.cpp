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

#include "keyboard_layout_provider.h"

#include "keyboard_input.h"

#include <spdlog/spdlog.h>

#include <map>
#include <utility>

/**
 * @file keyboard_layout_provider.cpp
 * @brief Tamil99 layout data provider
 *
 * Layout data is written in typed-character notation (see keyboard_input.h)
 * and expanded into keystroke sequences when the table is built. Combination
 * entries are generated from the consonant and vowel-sign key lists.
 */

namespace thattan {

//=============================================================================
// LAYOUT DATA
//=============================================================================

namespace {

struct CharKeys {
    const char* character;
    const char* typed;
};

// Standalone vowels
const CharKeys VOWELS[] = {
    {"அ", "a"}, {"ஆ", "q"}, {"இ", "s"}, {"ஈ", "w"}, {"உ", "d"}, {"ஊ", "e"},
    {"எ", "g"}, {"ஏ", "t"}, {"ஐ", "r"}, {"ஒ", "c"}, {"ஓ", "x"}, {"ஔ", "z"},
};

// Consonants with implicit அ, including Grantha (Shift row)
const CharKeys CONSONANTS[] = {
    {"க", "h"},  {"ப", "j"}, {"ம", "k"}, {"த", "l"}, {"ந", ";"}, {"வ", "v"},
    {"ய", "'"},  {"ல", "n"}, {"ர", "m"}, {"ங", "b"}, {"ஞ", "]"}, {"ச", "["},
    {"ழ", "/"},  {"ள", "y"}, {"ற", "u"}, {"ன", "i"}, {"ட", "o"}, {"ண", "p"},
    {"ஸ", "Q"},  {"ஷ", "W"}, {"ஜ", "E"}, {"ஹ", "R"}, {"ஶ", "U"}, {"க்ஷ", "T"},
};

// Vowel signs as typed after a consonant
const CharKeys VOWEL_SIGNS[] = {
    {"ா", "q"}, {"ி", "s"}, {"ீ", "w"}, {"ு", "d"}, {"ூ", "e"}, {"ெ", "g"},
    {"ே", "t"}, {"ை", "r"}, {"ொ", "c"}, {"ோ", "x"}, {"ௌ", "z"},
};

// Vowel signs typed on their own (^ prefix; ொ uses the Shift+C variant)
const CharKeys STANDALONE_SIGNS[] = {
    {"ா", "^q"}, {"ி", "^s"}, {"ீ", "^w"}, {"ு", "^d"}, {"ூ", "^e"}, {"ெ", "^g"},
    {"ே", "^t"}, {"ை", "^r"}, {"ொ", "^C"}, {"ோ", "^x"}, {"ௌ", "^z"},
};

constexpr const char* PULLI = "்";
constexpr const char* PULLI_KEY = "f";

const CharKeys SPECIALS[] = {
    {"ஃ", "F"}, // Aytham
    {"ஶ்ரீ", "Y"}, // Sri
};

// Tamil numerals: ^ # digit
const CharKeys NUMERALS[] = {
    {"௧", "^#1"}, {"௨", "^#2"}, {"௩", "^#3"}, {"௪", "^#4"}, {"௫", "^#5"},
    {"௬", "^#6"}, {"௭", "^#7"}, {"௮", "^#8"}, {"௯", "^#9"}, {"௦", "^#0"},
};

const CharKeys SYMBOLS[] = {
    {"௹", "A"}, // Rupee
    {"௺", "S"}, // Numeral sign
    {"௸", "D"}, // "as above"
    {"௱", "L"}, // Hundred
    {"௳", "Z"}, // Day
    {"௴", "X"}, // Month
    {"௵", "C"}, // Year
    {"௶", "V"}, // Debit
    {"௷", "B"}, // Credit
    {"ௐ", "N"}, // Om
};

// Latin punctuation and digits used in practice text (keys Tamil99 leaves alone)
const char* const ASCII_PASSTHROUGH[] = {
    " ", ",", ".", "-", "!", "?", "(", ")", ":",
    "0", "1", "2", "3", "4", "5", "6", "7", "8", "9",
};

void add_entry(LayoutTable::Entries& entries, const std::string& character,
               const std::string& typed) {
    entries[character] = keystrokes_from_typed(typed);
}

// Keycap rows of a US keyboard (letters as upper-case keycap labels)
const char* const KEY_ROWS[][13] = {
    {"`", "1", "2", "3", "4", "5", "6", "7", "8", "9", "0", "-", "="},
    {"Q", "W", "E", "R", "T", "Y", "U", "I", "O", "P", "[", "]", "\\"},
    {"A", "S", "D", "F", "G", "H", "J", "K", "L", ";", "'", nullptr, nullptr},
    {"Z", "X", "C", "V", "B", "N", "M", ",", ".", "/", nullptr, nullptr, nullptr},
};

bool is_ascii(const std::string& text) {
    for (char c : text) {
        if (static_cast<unsigned char>(c) >= 0x80) {
            return false;
        }
    }
    return true;
}

// Preference order for two characters sharing one keystroke
bool better_legend(const std::string& candidate, const std::string& current) {
    if (current.empty()) {
        return true;
    }
    bool candidate_tamil = !is_ascii(candidate);
    bool current_tamil = !is_ascii(current);
    if (candidate_tamil != current_tamil) {
        return candidate_tamil;
    }
    return candidate < current;
}

} // namespace

//=============================================================================
// PUBLIC API
//=============================================================================

LayoutTable tamil99_layout() {
    LayoutTable::Entries entries;

    for (const auto& vowel : VOWELS) {
        add_entry(entries, vowel.character, vowel.typed);
    }

    for (const auto& consonant : CONSONANTS) {
        const std::string base = consonant.character;
        const std::string key = consonant.typed;

        add_entry(entries, base, key);
        add_entry(entries, base + PULLI, key + PULLI_KEY);
        for (const auto& sign : VOWEL_SIGNS) {
            add_entry(entries, base + sign.character, key + sign.typed);
        }
    }

    add_entry(entries, PULLI, PULLI_KEY);
    for (const auto& sign : STANDALONE_SIGNS) {
        add_entry(entries, sign.character, sign.typed);
    }
    for (const auto& special : SPECIALS) {
        add_entry(entries, special.character, special.typed);
    }
    for (const auto& numeral : NUMERALS) {
        add_entry(entries, numeral.character, numeral.typed);
    }
    for (const auto& symbol : SYMBOLS) {
        add_entry(entries, symbol.character, symbol.typed);
    }
    for (const char* ascii : ASCII_PASSTHROUGH) {
        add_entry(entries, ascii, ascii);
    }

    spdlog::debug("[KeyboardLayout] Tamil99 table: {} logical characters", entries.size());
    return LayoutTable(std::move(entries));
}

std::vector<std::vector<Keycap>> keyboard_layout_get_rows(const LayoutTable& table) {
    // (key_id, shift) -> legend
    std::map<std::pair<std::string, bool>, std::string> legends;
    for (const auto& [character, sequence] : table.entries()) {
        if (sequence.size() != 1) {
            continue;
        }
        auto slot = std::make_pair(sequence[0].key_id, sequence[0].requires_modifier);
        auto& legend = legends[slot];
        if (better_legend(character, legend)) {
            legend = character;
        }
    }

    auto legend_for = [&legends](const std::string& key_id, bool shift) {
        auto it = legends.find(std::make_pair(key_id, shift));
        return it == legends.end() ? std::string() : it->second;
    };

    std::vector<std::vector<Keycap>> rows;
    for (const auto& key_row : KEY_ROWS) {
        std::vector<Keycap> row;
        for (const char* key_id : key_row) {
            if (!key_id) {
                break;
            }
            row.push_back(Keycap{key_id, legend_for(key_id, false), legend_for(key_id, true)});
        }
        rows.push_back(std::move(row));
    }
    rows.push_back({Keycap{KEY_SPACE, legend_for(KEY_SPACE, false), ""}});

    return rows;
}

} // namespace thattan
