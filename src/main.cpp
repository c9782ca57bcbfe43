/*
 * Copyright (C) 2025 Thattan Contributors
 *
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

#include "ansi_colors.h"
#include "app_config.h"
#include "finger_guide.h"
#include "keyboard_input.h"
#include "keyboard_layout_provider.h"
#include "level_practice.h"
#include "level_repository.h"
#include "logging_init.h"
#include "progress_store.h"
#include "runtime_config.h"
#include "terminal_input.h"
#include "tutor_clock.h"
#include "tutor_errors.h"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <cstring>
#include <filesystem>
#include <memory>
#include <string>
#include <unistd.h>
#include <vector>

using namespace thattan;

static RuntimeConfig g_runtime_config;

const RuntimeConfig& get_runtime_config() {
    return g_runtime_config;
}

RuntimeConfig* get_mutable_runtime_config() {
    return &g_runtime_config;
}

// Lines drawn by render_practice() (line, hint, 4 key rows, space row)
static constexpr int PRACTICE_SCREEN_LINES = 7;

static void print_usage(const char* argv0) {
    printf("Usage: %s [options]\n", argv0);
    printf("Options:\n");
    printf("  -c, --config <file>    Configuration file (default: %s)\n",
           Config::default_path().string().c_str());
    printf("  -L, --levels <dir>     Level directory (overrides config)\n");
    printf("  -p, --progress <file>  Progress file (overrides config)\n");
    printf("  -l, --level <key>      Level to practice (e.g. level3)\n");
    printf("      --list             List levels with progress and exit\n");
    printf("      --check            Report lines that cannot be typed and exit\n");
    printf("      --reset            Clear all progress and exit\n");
    printf("      --unlock-all       Unlock every level\n");
    printf("      --test             Keep progress in memory only\n");
    printf("      --no-color         Disable colored output\n");
    printf("  -v, --verbose          Increase log verbosity (-v, -vv, -vvv)\n");
    printf("  -h, --help             Show this help message\n");
    printf("\nWhile practicing, type with the US keyboard layout active.\n");
    printf("Press Esc to stop.\n");
}

// Returns -1 to continue, otherwise the process exit code
static int parse_args(int argc, char** argv, RuntimeConfig& config) {
    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];
        auto take_value = [&](const char*& out) {
            if (i + 1 < argc) {
                out = argv[++i];
                return true;
            }
            printf("Error: %s requires an argument\n", arg);
            return false;
        };

        if (strcmp(arg, "-c") == 0 || strcmp(arg, "--config") == 0) {
            if (!take_value(config.config_file))
                return 1;
        } else if (strcmp(arg, "-L") == 0 || strcmp(arg, "--levels") == 0) {
            if (!take_value(config.levels_dir))
                return 1;
        } else if (strcmp(arg, "-p") == 0 || strcmp(arg, "--progress") == 0) {
            if (!take_value(config.progress_file))
                return 1;
        } else if (strcmp(arg, "-l") == 0 || strcmp(arg, "--level") == 0) {
            if (!take_value(config.level_key))
                return 1;
        } else if (strcmp(arg, "--list") == 0) {
            config.list_levels = true;
        } else if (strcmp(arg, "--check") == 0) {
            config.check_levels = true;
        } else if (strcmp(arg, "--reset") == 0) {
            config.reset_progress = true;
        } else if (strcmp(arg, "--unlock-all") == 0) {
            config.unlock_all = true;
        } else if (strcmp(arg, "--test") == 0) {
            config.memory_progress = true;
        } else if (strcmp(arg, "--no-color") == 0) {
            config.no_color = true;
        } else if (strcmp(arg, "-v") == 0 || strcmp(arg, "--verbose") == 0) {
            config.verbosity++;
        } else if (strcmp(arg, "-vv") == 0) {
            config.verbosity += 2;
        } else if (strcmp(arg, "-vvv") == 0) {
            config.verbosity += 3;
        } else if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else {
            printf("Unknown argument: %s\n", arg);
            printf("Use --help for usage information\n");
            return 1;
        }
    }
    return -1;
}

static std::string percent(double ratio) {
    char buf[16];
    snprintf(buf, sizeof(buf), "%.1f%%", ratio * 100.0);
    return buf;
}

static std::string number(double value) {
    char buf[32];
    snprintf(buf, sizeof(buf), "%.1f", value);
    return buf;
}

// ============================================================================
// Commands
// ============================================================================

static int list_levels(const LevelRepository& repo, const LayoutTable& layout,
                       const IProgressStore& store, bool unlock_all) {
    const auto states = build_level_states(repo.all(), layout, store, unlock_all);

    printf("%s\n", ansi::header("Levels").c_str());
    for (const auto& state : states) {
        const ProgressRecord record = store.load(state.key);
        std::string mark = state.complete() ? ansi::success("[done]")
                           : state.unlocked ? ansi::info("[open]")
                                            : ansi::dim("[lock]");
        printf("  %s %-8s %s  %zu/%zu", mark.c_str(), state.key.c_str(), state.name.c_str(),
               state.completed, state.task_count);
        if (record.completed_count() > 0) {
            printf("  best %s / %s wpm", percent(record.best_accuracy).c_str(),
                   number(record.best_speed).c_str());
        }
        if (state.is_current) {
            printf("  %s", ansi::warning("<- current").c_str());
        }
        printf("\n");
    }

    const Gamification g = store.load_gamification();
    printf("\nScore %ld, streak %d (best %d)\n", g.total_score, g.current_streak, g.best_streak);
    return 0;
}

static int check_levels(const LevelRepository& repo, const LayoutTable& layout) {
    size_t unavailable = 0;
    size_t total = 0;
    for (const auto& level : repo.all()) {
        const auto lines = LevelRepository::prepare_lines(level, layout);
        for (size_t i = 0; i < lines.size(); i++) {
            total++;
            if (!lines[i].available) {
                unavailable++;
                printf("%s %s task %zu: unmapped '%s' in \"%s\"\n", ansi::error("FAIL").c_str(),
                       level.key.c_str(), i, lines[i].unmapped.c_str(), lines[i].text.c_str());
            }
        }
    }

    if (unavailable == 0) {
        printf("%s all %zu lines in %zu levels can be typed\n", ansi::success("OK").c_str(),
               total, repo.size());
        return 0;
    }
    printf("%zu of %zu lines cannot be typed\n", unavailable, total);
    return 1;
}

// ============================================================================
// Practice screen
// ============================================================================

static std::string render_keyboard_row(const std::vector<Keycap>& row, const KeyStroke& next) {
    std::string out = "  ";
    for (const auto& cap : row) {
        std::string legend = cap.key_id == KEY_SPACE ? "      Space      " : cap.key_id;
        if (!cap.base.empty() && cap.key_id != KEY_SPACE) {
            legend += " " + cap.base;
        }
        std::string cell = "[" + legend + "]";
        out += (cap.key_id == next.key_id ? ansi::highlight(cell) : ansi::dim(cell)) + " ";
    }
    return out;
}

static void render_practice(const LevelPractice& practice,
                            const std::vector<std::vector<Keycap>>& rows, bool redraw) {
    if (redraw) {
        printf("%s", ansi::cursor_up(PRACTICE_SCREEN_LINES).c_str());
    }

    const PreparedLine& line = practice.current_line();
    size_t typed_chars = 0;
    if (const SessionScorer* session = practice.session()) {
        typed_chars = session->matcher().char_index();
    }

    std::string typed;
    std::string rest;
    for (size_t i = 0; i < line.characters.size(); i++) {
        if (i < typed_chars) {
            typed += line.characters[i];
        } else if (i > typed_chars) {
            rest += line.characters[i];
        }
    }
    std::string current =
        typed_chars < line.characters.size() ? line.characters[typed_chars] : std::string();

    const KeyStroke next = practice.peek_next();
    const FingerHint hint = hint_for(next);

    printf("%s  %s%s%s\n", ansi::CLEAR_LINE, ansi::typed(typed).c_str(),
           ansi::cursor(current).c_str(), rest.c_str());
    printf("%s  next: %s  %s / %s\n", ansi::CLEAR_LINE,
           ansi::key(keystroke_label(next)).c_str(), hint.english().c_str(),
           hint.tamil().c_str());
    for (const auto& row : rows) {
        printf("%s%s\n", ansi::CLEAR_LINE, render_keyboard_row(row, next).c_str());
    }
    fflush(stdout);
}

static void print_line_report(const LineReport& report, const LevelPractice& practice) {
    const SessionResult& r = report.result;
    printf("%s  %s accuracy %s  %s wpm  %s spm  %zu mistakes", ansi::CLEAR_LINE,
           r.perfect() ? ansi::success("perfect").c_str() : ansi::warning("done").c_str(),
           percent(r.accuracy).c_str(), number(r.wpm).c_str(), number(r.spm).c_str(),
           r.incorrect_count);
    if (report.points > 0) {
        printf("  +%ld points (streak %d, combo x%.1f)", report.points,
               practice.gamification().current_streak, practice.combo_multiplier());
    }
    printf("\n");
    if (report.level_complete) {
        printf("%s\n", ansi::success("  Level complete!").c_str());
    }
}

static int practice_level(const Level& level, const LayoutTable& layout, IProgressStore& store) {
    SteadyClock clock;
    LevelPractice practice(level, layout, store, clock);
    if (!practice.has_available_lines()) {
        printf("%s %s has no line that can be typed (run --check)\n",
               ansi::error("Error:").c_str(), level.key.c_str());
        return 1;
    }

    const auto rows = keyboard_layout_get_rows(layout);
    printf("%s\n", ansi::header(level.key + ": " + level.name).c_str());
    printf("%s\n\n", ansi::dim("Esc to stop").c_str());

    RawTerminal terminal(STDIN_FILENO);
    render_practice(practice, rows, false);

    while (true) {
        int c = terminal.read_byte();
        if (c < 0 || c == KEY_ESCAPE || c == KEY_INTERRUPT) {
            practice.abandon();
            break;
        }

        auto event = key_event_from_char(static_cast<char>(c));
        if (!event) {
            if (c >= 0x80) {
                spdlog::debug("[Practice] Ignoring non-ASCII byte 0x{:02x}", c);
            }
            continue;
        }

        PracticeStep step = practice.submit(event->key_id, event->requires_modifier);
        if (!step.outcome.correct()) {
            printf("\a");
        }
        if (step.finished) {
            // Report replaces the finished line; the next line is drawn below it
            printf("%s", ansi::cursor_up(PRACTICE_SCREEN_LINES).c_str());
            print_line_report(*step.finished, practice);
            render_practice(practice, rows, false);
        } else {
            render_practice(practice, rows, true);
        }
    }

    terminal.restore();
    printf("\n%s lines, accuracy %s, %s wpm, score %ld\n",
           std::to_string(practice.lines_finished()).c_str(),
           percent(practice.aggregate_accuracy()).c_str(),
           number(practice.aggregate_wpm()).c_str(), practice.gamification().total_score);
    return 0;
}

// ============================================================================
// main
// ============================================================================

int main(int argc, char** argv) {
    int rc = parse_args(argc, argv, *get_mutable_runtime_config());
    if (rc >= 0) {
        return rc;
    }
    const RuntimeConfig* runtime = &get_runtime_config();
    if (runtime->no_color) {
        ansi::set_enabled(false);
    }

    Config config;
    config.load(runtime->config_file ? std::filesystem::path(runtime->config_file)
                                     : Config::default_path());
    AppConfig app = config.app_config();
    if (runtime->levels_dir)
        app.levels_dir = runtime->levels_dir;
    if (runtime->progress_file)
        app.progress_file = runtime->progress_file;
    if (runtime->unlock_all)
        app.unlock_all_levels = true;

    logging::LogConfig log_config;
    log_config.level = runtime->verbosity > 0 ? logging::level_from_verbosity(runtime->verbosity)
                                              : spdlog::level::from_str(app.log_level);
    log_config.target = logging::parse_log_target(app.log_target);
    log_config.file_path = app.log_file;
    logging::init(log_config);

    try {
        const LayoutTable layout = tamil99_layout();
        const LevelRepository repo(app.levels_dir);

        std::unique_ptr<IProgressStore> store;
        if (runtime->memory_progress) {
            store = std::make_unique<MemoryProgressStore>();
        } else {
            store = std::make_unique<JsonProgressStore>(
                app.progress_file.empty() ? JsonProgressStore::default_path()
                                          : std::filesystem::path(app.progress_file));
        }

        if (runtime->reset_progress) {
            if (!store->reset_all()) {
                printf("%s could not clear progress\n", ansi::error("Error:").c_str());
                return 1;
            }
            printf("%s\n", ansi::success("Progress cleared").c_str());
            return 0;
        }
        if (runtime->list_levels) {
            return list_levels(repo, layout, *store, app.unlock_all_levels);
        }
        if (runtime->check_levels) {
            return check_levels(repo, layout);
        }

        std::string level_key;
        const auto states = build_level_states(repo.all(), layout, *store, app.unlock_all_levels);
        if (runtime->level_key) {
            level_key = runtime->level_key;
            const Level& requested = repo.get(level_key);
            for (const auto& state : states) {
                if (state.key == requested.key && !state.unlocked) {
                    printf("%s %s is locked; finish the previous level or use --unlock-all\n",
                           ansi::error("Error:").c_str(), level_key.c_str());
                    return 1;
                }
            }
        } else {
            level_key = repo.all().front().key;
            for (const auto& state : states) {
                if (state.is_current) {
                    level_key = state.key;
                    break;
                }
            }
        }

        int result = practice_level(repo.get(level_key), layout, *store);
        if (!store->flush()) {
            spdlog::warn("[Main] Progress could not be written on exit");
        }
        return result;
    } catch (const TutorError& e) {
        spdlog::error("[Main] {}", e.what());
        printf("%s %s\n", ansi::error("Error:").c_str(), e.what());
        return 1;
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("[Main] Filesystem error: {}", e.what());
        printf("%s %s\n", ansi::error("Error:").c_str(), e.what());
        return 1;
    }
}
