// Copyright 2025 Thattan
// SPDX-License-Identifier: GPL-3.0-or-later

#include "level_repository.h"

#include "tutor_errors.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <climits>
#include <fstream>
#include <regex>
#include <sstream>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace thattan {

namespace {
constexpr const char* LEVEL_FILE_PREFIX = "level";
constexpr const char* LEVEL_FILE_EXTENSION = ".json";

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    size_t begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

// (number, stem); stems without a numeric suffix sort after all numbered ones
std::pair<long, std::string> level_sort_key(const std::string& stem) {
    static const std::regex numbered("^level(\\d+)$");
    std::smatch match;
    if (std::regex_match(stem, match, numbered)) {
        try {
            return {std::stol(match[1].str()), stem};
        } catch (const std::out_of_range&) {
            // Absurdly long suffix: treat as unnumbered
        }
    }
    return {LONG_MAX, stem};
}
} // namespace

Level LevelRepository::parse_level(const std::string& key, const std::string& document) {
    json raw;
    try {
        raw = json::parse(document);
    } catch (const json::parse_error& e) {
        throw LevelDataError(key + ": invalid JSON: " + e.what());
    }

    if (!raw.is_object()) {
        throw LevelDataError(key + ": expected an object with 'title' and 'content'");
    }

    if (!raw.contains("title") || !raw["title"].is_string() ||
        trim(raw["title"].get<std::string>()).empty()) {
        throw LevelDataError(key + ": missing or invalid 'title'");
    }
    if (!raw.contains("content") || raw["content"].is_null()) {
        throw LevelDataError(key + ": missing 'content'");
    }

    Level level;
    level.key = key;
    level.name = trim(raw["title"].get<std::string>());

    const json& content = raw["content"];
    if (content.is_array()) {
        for (const auto& item : content) {
            std::string text = item.is_string() ? item.get<std::string>() : item.dump();
            text = trim(text);
            if (!text.empty()) {
                level.tasks.push_back(text);
            }
        }
    } else {
        std::string text = content.is_string() ? content.get<std::string>() : content.dump();
        std::istringstream lines(text);
        std::string line;
        while (std::getline(lines, line)) {
            line = trim(line);
            if (!line.empty()) {
                level.tasks.push_back(line);
            }
        }
    }

    if (level.tasks.empty()) {
        throw LevelDataError(key + ": 'content' has no tasks");
    }
    return level;
}

LevelRepository::LevelRepository(const std::filesystem::path& directory) {
    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec)) {
        throw LevelDataError("Levels directory not found: " + directory.string());
    }

    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::directory_iterator(directory, ec)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        const auto& path = entry.path();
        if (path.extension() == LEVEL_FILE_EXTENSION &&
            path.stem().string().rfind(LEVEL_FILE_PREFIX, 0) == 0) {
            files.push_back(path);
        }
    }
    if (ec) {
        throw LevelDataError("Cannot read levels directory " + directory.string() + ": " +
                             ec.message());
    }

    std::sort(files.begin(), files.end(),
              [](const std::filesystem::path& a, const std::filesystem::path& b) {
                  return level_sort_key(a.stem().string()) < level_sort_key(b.stem().string());
              });

    for (const auto& path : files) {
        std::ifstream file(path);
        if (!file.is_open()) {
            throw LevelDataError("Cannot open level file " + path.string());
        }
        std::stringstream buffer;
        buffer << file.rdbuf();

        Level level = parse_level(path.stem().string(), buffer.str());
        spdlog::debug("[LevelRepository] Loaded {} '{}' ({} tasks)", level.key, level.name,
                      level.tasks.size());
        index_[level.key] = levels_.size();
        levels_.push_back(std::move(level));
    }

    if (levels_.empty()) {
        throw LevelDataError("No level files (level*.json) found in " + directory.string());
    }
    spdlog::info("[LevelRepository] Loaded {} levels from {}", levels_.size(),
                 directory.string());
}

const Level& LevelRepository::get(const std::string& key) const {
    auto it = index_.find(key);
    if (it == index_.end()) {
        throw LevelDataError("Unknown level '" + key + "'");
    }
    return levels_[it->second];
}

std::vector<PreparedLine> LevelRepository::prepare_lines(const Level& level,
                                                         const LayoutTable& layout) {
    std::vector<PreparedLine> lines;
    lines.reserve(level.tasks.size());

    for (size_t i = 0; i < level.tasks.size(); i++) {
        PreparedLine line;
        line.text = level.tasks[i];
        try {
            line.characters = layout.segment(line.text);
            line.available = !line.characters.empty();
            if (!line.available) {
                spdlog::warn("[LevelRepository] {} task {} unavailable: empty line", level.key, i);
            }
        } catch (const UnmappedCharacterError& e) {
            line.unmapped = e.character();
            spdlog::warn("[LevelRepository] {} task {} unavailable: {}", level.key, i, e.what());
        }
        lines.push_back(std::move(line));
    }
    return lines;
}

} // namespace thattan
