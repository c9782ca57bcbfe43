// Copyright 2025 Thattan
// SPDX-License-Identifier: GPL-3.0-or-later

#include "keyboard_layout_provider.h"
#include "level_repository.h"
#include "test_temp_dir.h"
#include "tutor_errors.h"

#include <catch2/catch_test_macros.hpp>

using namespace thattan;

// ============================================================================
// Test Fixtures
// ============================================================================

class LevelDirFixture {
  protected:
    void write_level(const std::string& name, const std::string& json) {
        dir.write(name, json);
    }

    TempDir dir;
};

// ============================================================================
// Parsing
// ============================================================================

TEST_CASE("LevelRepository: list content is trimmed", "[levels][parse]") {
    Level level = LevelRepository::parse_level(
        "level1", R"({"title": "  Home row ", "content": ["  அ இ ", "", "   ", "க"]})");

    REQUIRE(level.key == "level1");
    REQUIRE(level.name == "Home row");
    REQUIRE(level.tasks == std::vector<std::string>{"அ இ", "க"});
}

TEST_CASE("LevelRepository: string content is split into lines", "[levels][parse]") {
    Level level = LevelRepository::parse_level(
        "level4", R"({"title": "Words", "content": "அம்மா அப்பா\n\n  தமிழ்  \n"})");

    REQUIRE(level.tasks == std::vector<std::string>{"அம்மா அப்பா", "தமிழ்"});
}

TEST_CASE("LevelRepository: malformed documents", "[levels][parse][errors]") {
    SECTION("Invalid JSON") {
        REQUIRE_THROWS_AS(LevelRepository::parse_level("level1", "{ title"), LevelDataError);
    }

    SECTION("Not an object") {
        REQUIRE_THROWS_AS(LevelRepository::parse_level("level1", "[1, 2]"), LevelDataError);
    }

    SECTION("Missing title") {
        REQUIRE_THROWS_AS(LevelRepository::parse_level("level1", R"({"content": ["அ"]})"),
                          LevelDataError);
    }

    SECTION("Blank title") {
        REQUIRE_THROWS_AS(
            LevelRepository::parse_level("level1", R"({"title": "  ", "content": ["அ"]})"),
            LevelDataError);
    }

    SECTION("Missing content") {
        REQUIRE_THROWS_AS(LevelRepository::parse_level("level1", R"({"title": "T"})"),
                          LevelDataError);
    }

    SECTION("Content without tasks") {
        REQUIRE_THROWS_AS(
            LevelRepository::parse_level("level1", R"({"title": "T", "content": ["", " "]})"),
            LevelDataError);
    }
}

// ============================================================================
// Directory loading
// ============================================================================

TEST_CASE_METHOD(LevelDirFixture, "LevelRepository: numeric ordering of level files",
                 "[levels][load]") {
    write_level("level10.json", R"({"title": "Ten", "content": ["அ"]})");
    write_level("level2.json", R"({"title": "Two", "content": ["அ"]})");
    write_level("level1.json", R"({"title": "One", "content": ["அ"]})");
    write_level("levelbonus.json", R"({"title": "Bonus", "content": ["அ"]})");
    write_level("notes.json", R"({"title": "Ignored", "content": ["அ"]})");
    write_level("level3.txt", "not a level");

    LevelRepository repo(dir.path());

    REQUIRE(repo.size() == 4);
    REQUIRE(repo.all()[0].key == "level1");
    REQUIRE(repo.all()[1].key == "level2");
    REQUIRE(repo.all()[2].key == "level10");
    REQUIRE(repo.all()[3].key == "levelbonus");

    REQUIRE(repo.contains("level10"));
    REQUIRE(repo.get("level2").name == "Two");
    REQUIRE_THROWS_AS(repo.get("level3"), LevelDataError);
}

TEST_CASE_METHOD(LevelDirFixture, "LevelRepository: loading errors", "[levels][load][errors]") {
    SECTION("Missing directory") {
        REQUIRE_THROWS_AS(LevelRepository(dir.path() / "missing"), LevelDataError);
    }

    SECTION("No level files") {
        write_level("readme.json", "{}");
        REQUIRE_THROWS_AS(LevelRepository(dir.path()), LevelDataError);
    }

    SECTION("One bad file fails the load") {
        write_level("level1.json", R"({"title": "One", "content": ["அ"]})");
        write_level("level2.json", R"({"title": "Two"})");
        REQUIRE_THROWS_AS(LevelRepository(dir.path()), LevelDataError);
    }
}

// ============================================================================
// Line preparation
// ============================================================================

TEST_CASE("LevelRepository: unmapped lines are unavailable", "[levels][prepare]") {
    const LayoutTable layout = tamil99_layout();
    Level level{"level1", "Mixed", {"அம்மா", "abc", "தமிழ்"}};

    const auto lines = LevelRepository::prepare_lines(level, layout);

    REQUIRE(lines.size() == 3);
    REQUIRE(lines[0].available);
    REQUIRE(lines[0].characters == PracticeLine{"அ", "ம்", "மா"});
    REQUIRE_FALSE(lines[1].available);
    REQUIRE(lines[1].unmapped == "a");
    REQUIRE(lines[1].characters.empty());
    REQUIRE(lines[2].available);
}

TEST_CASE("LevelRepository: empty lines are unavailable", "[levels][prepare]") {
    const LayoutTable layout = tamil99_layout();
    Level level{"level1", "Hand-built", {"", "அ"}};

    const auto lines = LevelRepository::prepare_lines(level, layout);

    REQUIRE(lines.size() == 2);
    REQUIRE_FALSE(lines[0].available);
    REQUIRE(lines[0].characters.empty());
    REQUIRE(lines[0].unmapped.empty());
    REQUIRE(lines[1].available);
}

TEST_CASE("LevelRepository: shipped levels can be typed", "[levels][data]") {
    const LayoutTable layout = tamil99_layout();
    LevelRepository repo(std::filesystem::path(THATTAN_SOURCE_DIR) / "data" / "levels");

    REQUIRE(repo.size() >= 1);
    for (const auto& level : repo.all()) {
        for (const auto& line : LevelRepository::prepare_lines(level, layout)) {
            INFO(level.key << ": " << line.text);
            REQUIRE(line.available);
        }
    }
}
