// Copyright 2025 Thattan
// SPDX-License-Identifier: GPL-3.0-or-later

#include "progress_store.h"
#include "session_scorer.h"
#include "test_temp_dir.h"

#include <catch2/catch_test_macros.hpp>

#include <fstream>

#include <nlohmann/json.hpp>

using namespace thattan;
using json = nlohmann::json;

namespace {
SessionResult result_with(double accuracy, double wpm) {
    SessionResult result;
    result.accuracy = accuracy;
    result.wpm = wpm;
    return result;
}

json read_json(const std::filesystem::path& path) {
    std::ifstream file(path);
    return json::parse(file);
}
} // namespace

// ============================================================================
// ProgressRecord
// ============================================================================

TEST_CASE("ProgressRecord: merge keeps completed tasks and maxima", "[progress][record]") {
    ProgressRecord record;
    record.merge(0, result_with(0.9, 10.0));
    record.merge(2, result_with(0.8, 20.0));
    record.merge(0, result_with(0.5, 5.0));

    REQUIRE(record.completed_task_indices == std::set<int>{0, 2});
    REQUIRE(record.completed_count() == 2);
    REQUIRE(record.best_accuracy == 0.9);
    REQUIRE(record.best_speed == 20.0);
}

// ============================================================================
// MemoryProgressStore
// ============================================================================

TEST_CASE("MemoryProgressStore: load after save", "[progress][memory]") {
    MemoryProgressStore store;

    REQUIRE(store.load("level1") == ProgressRecord{});

    ProgressRecord record;
    record.merge(1, result_with(1.0, 12.0));
    REQUIRE(store.save("level1", record));
    REQUIRE(store.load("level1") == record);
    REQUIRE(store.load("level2") == ProgressRecord{});

    SECTION("reset_level clears one level") {
        store.save("level2", record);
        store.reset_level("level1");
        REQUIRE(store.load("level1") == ProgressRecord{});
        REQUIRE(store.load("level2") == record);
    }

    SECTION("reset_all clears everything") {
        store.save_gamification(Gamification{50, 2, 4});
        store.reset_all();
        REQUIRE(store.load("level1") == ProgressRecord{});
        REQUIRE(store.load_gamification() == Gamification{});
    }
}

TEST_CASE("MemoryProgressStore: best streak never decreases", "[progress][gamification]") {
    MemoryProgressStore store;

    store.save_gamification(Gamification{100, 5, 5});
    store.save_gamification(Gamification{120, 0, 0});

    const Gamification g = store.load_gamification();
    REQUIRE(g.total_score == 120);
    REQUIRE(g.current_streak == 0);
    REQUIRE(g.best_streak == 5);
}

// ============================================================================
// JsonProgressStore
// ============================================================================

TEST_CASE("JsonProgressStore: progress survives a restart", "[progress][json]") {
    TempDir dir;
    const auto path = dir.path() / "progress.json";

    ProgressRecord record;
    record.merge(0, result_with(0.95, 14.5));
    record.merge(3, result_with(0.75, 18.0));

    {
        JsonProgressStore store(path);
        REQUIRE(store.save("level1", record));
        REQUIRE(store.save_gamification(Gamification{42, 3, 7}));
    }

    JsonProgressStore reopened(path);
    REQUIRE(reopened.load("level1") == record);
    REQUIRE(reopened.load_gamification() == Gamification{42, 3, 7});
}

TEST_CASE("JsonProgressStore: file layout", "[progress][json]") {
    TempDir dir;
    const auto path = dir.path() / "progress.json";

    JsonProgressStore store(path);
    ProgressRecord record;
    record.merge(0, result_with(0.5, 9.0));
    record.merge(2, result_with(0.5, 9.0));
    store.save("level1", record);

    const json data = read_json(path);
    REQUIRE(data["version"] == 1);
    REQUIRE(data["levels"]["level1"]["completed_tasks"] == json::array({0, 2}));
    REQUIRE(data["levels"]["level1"]["best_accuracy"] == 0.5);
    REQUIRE(data["levels"]["level1"]["best_wpm"] == 9.0);
    REQUIRE(data["gamification"]["best_streak"] == 0);
    REQUIRE_FALSE(std::filesystem::exists(dir.path() / "progress.json.tmp"));
}

TEST_CASE("JsonProgressStore: missing directories are created", "[progress][json]") {
    TempDir dir;
    const auto path = dir.path() / "nested" / "deeper" / "progress.json";

    JsonProgressStore store(path);
    REQUIRE(store.load("level1") == ProgressRecord{});
    REQUIRE(store.flush());
    REQUIRE(std::filesystem::exists(path));
}

TEST_CASE("JsonProgressStore: corrupt file starts empty", "[progress][json][errors]") {
    TempDir dir;
    const auto path = dir.write("progress.json", "{ not json");

    JsonProgressStore store(path);
    REQUIRE(store.load("level1") == ProgressRecord{});
    REQUIRE(store.load_gamification() == Gamification{});

    ProgressRecord record;
    record.merge(0, result_with(1.0, 10.0));
    REQUIRE(store.save("level1", record));
    REQUIRE_NOTHROW(read_json(path));
}

TEST_CASE("JsonProgressStore: tolerates partial entries", "[progress][json]") {
    TempDir dir;
    const auto path = dir.write(
        "progress.json",
        R"({"levels": {"level1": {"completed_tasks": [1, -4, "x"]}, "level2": 7}})");

    JsonProgressStore store(path);
    const ProgressRecord record = store.load("level1");
    REQUIRE(record.completed_task_indices == std::set<int>{1});
    REQUIRE(record.best_accuracy == 0.0);
    REQUIRE(store.load("level2") == ProgressRecord{});
}

TEST_CASE("JsonProgressStore: reset is persisted", "[progress][json]") {
    TempDir dir;
    const auto path = dir.path() / "progress.json";

    {
        JsonProgressStore store(path);
        ProgressRecord record;
        record.merge(0, result_with(1.0, 10.0));
        store.save("level1", record);
        store.save("level2", record);
        store.save_gamification(Gamification{10, 1, 1});
        REQUIRE(store.reset_level("level1"));
    }

    {
        JsonProgressStore store(path);
        REQUIRE(store.load("level1") == ProgressRecord{});
        REQUIRE(store.load("level2").completed_count() == 1);
        REQUIRE(store.reset_all());
    }

    JsonProgressStore store(path);
    REQUIRE(store.load("level2") == ProgressRecord{});
    REQUIRE(store.load_gamification() == Gamification{});
}
