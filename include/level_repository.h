// Copyright 2025 Thattan
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "layout_table.h"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace thattan {

/**
 * @brief One level: an ordered list of practice lines (tasks)
 */
struct Level {
    std::string key;                ///< File stem, e.g. "level3"
    std::string name;               ///< Display title
    std::vector<std::string> tasks; ///< Non-empty, trimmed UTF-8 lines
};

/**
 * @brief A task segmented against the Layout Table
 *
 * Lines containing an unmapped character stay in the level (so task indices
 * keep matching the file) but are not offered for practice.
 */
struct PreparedLine {
    std::string text;
    PracticeLine characters; ///< Empty when unavailable
    bool available{false};
    std::string unmapped; ///< Offending character when unavailable
};

/**
 * @brief Level files loaded from a directory
 *
 * Level files are JSON documents named level<N>.json:
 * ```json
 * { "title": "Home row", "content": ["அ ஆ இ", "..."] }
 * ```
 * "content" may also be one string, split into lines. Files are ordered by the
 * numeric suffix (level2 before level10); names without a number sort last.
 *
 * Loading is all-or-nothing: any malformed file throws LevelDataError.
 */
class LevelRepository {
  public:
    /**
     * @brief Load all level files of a directory
     * @throws LevelDataError on a missing directory, malformed file or no levels
     */
    explicit LevelRepository(const std::filesystem::path& directory);

    /** @brief Levels in file order */
    const std::vector<Level>& all() const {
        return levels_;
    }

    /**
     * @brief Level by key
     * @throws LevelDataError for unknown keys
     */
    const Level& get(const std::string& key) const;

    bool contains(const std::string& key) const {
        return index_.count(key) > 0;
    }

    size_t size() const {
        return levels_.size();
    }

    /**
     * @brief Parse one level document
     * @param key Level key (file stem)
     * @param document JSON text
     * @throws LevelDataError if the document is malformed
     */
    static Level parse_level(const std::string& key, const std::string& document);

    /**
     * @brief Segment every task of a level
     *
     * Unmapped characters mark the line unavailable instead of throwing, and so
     * does a line with no characters at all.
     */
    static std::vector<PreparedLine> prepare_lines(const Level& level, const LayoutTable& layout);

  private:
    std::vector<Level> levels_;
    std::map<std::string, size_t> index_;
};

} // namespace thattan
