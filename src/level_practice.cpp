// Copyright 2025 Thattan
// SPDX-License-Identifier: GPL-3.0-or-later

#include "level_practice.h"

#include "tutor_errors.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace thattan {

namespace {
constexpr int COMBO_TIER_1_LINES = 5;
constexpr int COMBO_TIER_2_LINES = 10;
constexpr double COMBO_TIER_1 = 1.5;
constexpr double COMBO_TIER_2 = 2.0;

size_t count_completed(const std::vector<PreparedLine>& lines, const ProgressRecord& record) {
    size_t completed = 0;
    for (size_t i = 0; i < lines.size(); i++) {
        if (lines[i].available && record.completed_task_indices.count(static_cast<int>(i))) {
            completed++;
        }
    }
    return completed;
}

size_t count_available(const std::vector<PreparedLine>& lines) {
    return static_cast<size_t>(std::count_if(lines.begin(), lines.end(),
                                             [](const PreparedLine& l) { return l.available; }));
}
} // namespace

LevelPractice::LevelPractice(const Level& level, const LayoutTable& layout, IProgressStore& store,
                             const Clock& clock)
    : level_(level), layout_(layout), store_(store), clock_(clock),
      lines_(LevelRepository::prepare_lines(level, layout)),
      gamification_(store.load_gamification()) {
    const ProgressRecord record = store_.load(level_.key);

    // Resume at the first available line not completed yet, else start over
    current_ = first_available_from(0);
    for (size_t i = 0; i < lines_.size(); i++) {
        if (lines_[i].available && !record.completed_task_indices.count(static_cast<int>(i))) {
            current_ = i;
            break;
        }
    }

    spdlog::debug("[LevelPractice] {}: {} of {} lines available, starting at task {}", level_.key,
                  count_available(lines_), lines_.size(), current_);
}

bool LevelPractice::has_available_lines() const {
    return count_available(lines_) > 0;
}

size_t LevelPractice::first_available_from(size_t index) const {
    const size_t n = lines_.size();
    for (size_t step = 0; step < n; step++) {
        size_t candidate = (index + step) % n;
        if (lines_[candidate].available) {
            return candidate;
        }
    }
    return 0;
}

SessionScorer& LevelPractice::begin_line() {
    if (!has_available_lines()) {
        throw LevelDataError(level_.key + ": no line can be typed with this layout");
    }

    if (scorer_) {
        spdlog::debug("[LevelPractice] Discarding running line {}", current_);
    }
    scorer_ = std::make_unique<SessionScorer>(
        KeystrokeMatcher(layout_, current_line().characters), clock_);
    scorer_->start();
    return *scorer_;
}

PracticeStep LevelPractice::submit(const std::string& physical_key, bool modifier_held) {
    if (!scorer_) {
        begin_line();
    }

    PracticeStep step;
    step.outcome = scorer_->submit(physical_key, modifier_held);
    if (scorer_->finalized()) {
        finish_line(step);
    }
    return step;
}

void LevelPractice::abandon() {
    if (scorer_) {
        spdlog::info("[LevelPractice] Abandoned {} task {}", level_.key, current_);
        scorer_.reset();
    }
}

KeyStroke LevelPractice::peek_next() const {
    if (scorer_) {
        return scorer_->matcher().peek_next();
    }
    if (!has_available_lines()) {
        throw LevelDataError(level_.key + ": no line can be typed with this layout");
    }
    return layout_.resolve(current_line().characters.front()).front();
}

void LevelPractice::finish_line(PracticeStep& step) {
    const SessionResult result = *scorer_->result();

    ProgressRecord record = store_.load(level_.key);
    record.merge(static_cast<int>(current_), result);
    if (!store_.save(level_.key, record)) {
        spdlog::warn("[LevelPractice] Progress of {} could not be saved", level_.key);
    }

    lines_finished_++;
    total_correct_ += result.correct_count;
    total_incorrect_ += result.incorrect_count;
    total_seconds_ += result.elapsed_seconds;

    LineReport report;
    report.task_index = current_;
    report.result = result;
    report.points = update_gamification(result);
    report.level_complete = count_completed(lines_, record) == count_available(lines_);
    step.finished = report;

    spdlog::info("[LevelPractice] {} task {} done (+{} points, streak {})", level_.key,
                 report.task_index, report.points, gamification_.current_streak);

    scorer_.reset();
    advance();
}

long LevelPractice::update_gamification(const SessionResult& result) {
    long points = 0;
    if (result.perfect()) {
        gamification_.current_streak++;
        gamification_.best_streak =
            std::max(gamification_.best_streak, gamification_.current_streak);
        points = static_cast<long>(
            (BASE_LINE_POINTS + STREAK_BONUS_POINTS * gamification_.current_streak) *
            combo_multiplier_);
        gamification_.total_score += points;
        consecutive_perfect_++;
    } else {
        gamification_.current_streak = 0;
        consecutive_perfect_ = 0;
    }

    if (consecutive_perfect_ >= COMBO_TIER_2_LINES) {
        combo_multiplier_ = COMBO_TIER_2;
    } else if (consecutive_perfect_ >= COMBO_TIER_1_LINES) {
        combo_multiplier_ = COMBO_TIER_1;
    } else {
        combo_multiplier_ = 1.0;
    }

    if (!store_.save_gamification(gamification_)) {
        spdlog::warn("[LevelPractice] Score could not be saved");
    }
    return points;
}

void LevelPractice::advance() {
    current_ = first_available_from(current_ + 1);
}

double LevelPractice::aggregate_accuracy() const {
    size_t total = total_correct_ + total_incorrect_;
    if (total == 0) {
        return 1.0;
    }
    return static_cast<double>(total_correct_) / static_cast<double>(total);
}

double LevelPractice::aggregate_wpm() const {
    if (lines_finished_ == 0) {
        return 0.0;
    }
    const double minutes = std::max(total_seconds_, MIN_ELAPSED_SECONDS) / 60.0;
    return (static_cast<double>(total_correct_) / 5.0) / minutes;
}

size_t LevelPractice::completed_count() const {
    return count_completed(lines_, store_.load(level_.key));
}

bool LevelPractice::level_complete() const {
    return has_available_lines() && completed_count() == count_available(lines_);
}

std::vector<LevelState> build_level_states(const std::vector<Level>& levels,
                                           const LayoutTable& layout,
                                           const IProgressStore& store, bool unlock_all) {
    std::vector<LevelState> states;
    states.reserve(levels.size());

    bool previous_complete = true;
    for (const auto& level : levels) {
        const auto lines = LevelRepository::prepare_lines(level, layout);

        LevelState state;
        state.key = level.key;
        state.name = level.name;
        state.task_count = count_available(lines);
        state.completed = count_completed(lines, store.load(level.key));
        state.unlocked = unlock_all || previous_complete;
        // A level with nothing to type cannot be completed and does not block the next one
        previous_complete = state.complete() || (state.unlocked && state.task_count == 0);
        states.push_back(std::move(state));
    }

    for (auto& state : states) {
        if (state.unlocked && state.task_count > 0 && !state.complete()) {
            state.is_current = true;
            break;
        }
    }
    return states;
}

} // namespace thattan
