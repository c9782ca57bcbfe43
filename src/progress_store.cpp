// Copyright 2025 Thattan
// SPDX-License-Identifier: GPL-3.0-or-later

#include "progress_store.h"

#include "session_scorer.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace thattan {

// ============================================================================
// ProgressRecord
// ============================================================================

void ProgressRecord::merge(int task_index, const SessionResult& result) {
    completed_task_indices.insert(task_index);
    best_accuracy = std::max(best_accuracy, result.accuracy);
    best_speed = std::max(best_speed, result.wpm);
}

// ============================================================================
// MemoryProgressStore
// ============================================================================

ProgressRecord MemoryProgressStore::load(const std::string& level_id) const {
    auto it = levels_.find(level_id);
    if (it == levels_.end()) {
        return ProgressRecord{};
    }
    return it->second;
}

bool MemoryProgressStore::save(const std::string& level_id, const ProgressRecord& record) {
    levels_[level_id] = record;
    save_count_++;
    return true;
}

Gamification MemoryProgressStore::load_gamification() const {
    return gamification_;
}

bool MemoryProgressStore::save_gamification(const Gamification& gamification) {
    int best = std::max(gamification_.best_streak, gamification.best_streak);
    gamification_ = gamification;
    gamification_.best_streak = std::max(best, gamification.current_streak);
    save_count_++;
    return true;
}

bool MemoryProgressStore::reset_level(const std::string& level_id) {
    levels_.erase(level_id);
    return true;
}

bool MemoryProgressStore::reset_all() {
    levels_.clear();
    gamification_ = Gamification{};
    return true;
}

bool MemoryProgressStore::flush() {
    return true;
}

// ============================================================================
// JsonProgressStore
// ============================================================================

namespace {
constexpr int PROGRESS_FILE_VERSION = 1;

json record_to_json(const ProgressRecord& record) {
    return json{{"completed_tasks", record.completed_task_indices},
                {"best_accuracy", record.best_accuracy},
                {"best_wpm", record.best_speed}};
}

ProgressRecord record_from_json(const json& j) {
    ProgressRecord record;
    if (j.contains("completed_tasks") && j["completed_tasks"].is_array()) {
        for (const auto& index : j["completed_tasks"]) {
            if (index.is_number_integer() && index.get<int>() >= 0) {
                record.completed_task_indices.insert(index.get<int>());
            }
        }
    }
    record.best_accuracy = j.value("best_accuracy", 0.0);
    record.best_speed = j.value("best_wpm", 0.0);
    return record;
}
} // namespace

JsonProgressStore::JsonProgressStore(std::filesystem::path path) : path_(std::move(path)) {
    load_file();
}

std::filesystem::path JsonProgressStore::default_path() {
    const char* home = std::getenv("HOME");
    std::filesystem::path base = (home && *home) ? home : ".";
    return base / ".thattan" / "progress.json";
}

void JsonProgressStore::load_file() {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        spdlog::debug("[ProgressStore] No progress file at {}, starting fresh", path_.string());
        return;
    }

    try {
        std::ifstream file(path_);
        if (!file.is_open()) {
            spdlog::warn("[ProgressStore] Failed to open {}", path_.string());
            return;
        }

        json data = json::parse(file);
        if (data.value("version", PROGRESS_FILE_VERSION) != PROGRESS_FILE_VERSION) {
            spdlog::warn("[ProgressStore] Unknown progress file version {} in {}, ignoring",
                         data["version"].dump(), path_.string());
            return;
        }

        if (data.contains("levels") && data["levels"].is_object()) {
            for (const auto& [level_id, entry] : data["levels"].items()) {
                if (entry.is_object()) {
                    levels_[level_id] = record_from_json(entry);
                }
            }
        }

        if (data.contains("gamification") && data["gamification"].is_object()) {
            const json& g = data["gamification"];
            gamification_.total_score = g.value("total_score", 0L);
            gamification_.current_streak = g.value("current_streak", 0);
            gamification_.best_streak = g.value("best_streak", 0);
        }

        spdlog::info("[ProgressStore] Loaded progress for {} levels from {}", levels_.size(),
                     path_.string());
    } catch (const std::exception& e) {
        // Start empty; the next save overwrites the corrupt file
        spdlog::warn("[ProgressStore] Failed to parse {}: {}", path_.string(), e.what());
        levels_.clear();
        gamification_ = Gamification{};
    }
}

bool JsonProgressStore::write_file() {
    json data;
    data["version"] = PROGRESS_FILE_VERSION;
    data["levels"] = json::object();
    for (const auto& [level_id, record] : levels_) {
        data["levels"][level_id] = record_to_json(record);
    }
    data["gamification"] = {{"total_score", gamification_.total_score},
                            {"current_streak", gamification_.current_streak},
                            {"best_streak", gamification_.best_streak}};

    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            spdlog::error("[ProgressStore] Cannot create {}: {}", path_.parent_path().string(),
                          ec.message());
            return false;
        }
    }

    std::filesystem::path tmp_path = path_;
    tmp_path += ".tmp";
    {
        std::ofstream file(tmp_path, std::ios::trunc);
        if (!file.is_open()) {
            spdlog::error("[ProgressStore] Cannot write {}", tmp_path.string());
            return false;
        }
        file << data.dump(2) << '\n';
        if (!file.good()) {
            spdlog::error("[ProgressStore] Write to {} failed", tmp_path.string());
            return false;
        }
    }

    std::filesystem::rename(tmp_path, path_, ec);
    if (ec) {
        spdlog::error("[ProgressStore] Cannot replace {}: {}", path_.string(), ec.message());
        std::filesystem::remove(tmp_path, ec);
        return false;
    }

    spdlog::trace("[ProgressStore] Wrote {}", path_.string());
    return true;
}

bool JsonProgressStore::save(const std::string& level_id, const ProgressRecord& record) {
    MemoryProgressStore::save(level_id, record);
    return write_file();
}

bool JsonProgressStore::save_gamification(const Gamification& gamification) {
    MemoryProgressStore::save_gamification(gamification);
    return write_file();
}

bool JsonProgressStore::reset_level(const std::string& level_id) {
    MemoryProgressStore::reset_level(level_id);
    spdlog::info("[ProgressStore] Reset progress of {}", level_id);
    return write_file();
}

bool JsonProgressStore::reset_all() {
    MemoryProgressStore::reset_all();
    spdlog::info("[ProgressStore] Reset all progress");
    return write_file();
}

bool JsonProgressStore::flush() {
    return write_file();
}

} // namespace thattan
