// Copyright 2025 Thattan
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef __THATTAN_LEVEL_PRACTICE_H__
#define __THATTAN_LEVEL_PRACTICE_H__

#include "level_repository.h"
#include "progress_store.h"
#include "session_scorer.h"
#include "tutor_clock.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace thattan {

/// Points for a perfect line before streak bonus and combo
constexpr int BASE_LINE_POINTS = 10;
/// Extra points per streak step
constexpr int STREAK_BONUS_POINTS = 2;

/**
 * @brief Summary of one finished line
 */
struct LineReport {
    size_t task_index{0};
    SessionResult result;
    long points{0};           ///< Points awarded for this line (0 if imperfect)
    bool level_complete{false}; ///< Every available line of the level is now completed
};

/**
 * @brief Outcome of one keystroke during level practice
 */
struct PracticeStep {
    KeystrokeOutcome outcome;
    std::optional<LineReport> finished; ///< Set when the keystroke finished the line
};

/**
 * @brief Practice controller for one level
 *
 * Walks the available lines of a level, one Session Scorer per line. Finished
 * lines are merged into the level's ProgressRecord and saved immediately, and
 * the score counters are updated:
 *
 * - A perfect line (no incorrect keystroke) increments the streak and awards
 *   (BASE_LINE_POINTS + STREAK_BONUS_POINTS * streak) * combo points
 * - An imperfect line resets the streak and the combo
 * - combo is 1.0, 1.5 after 5 consecutive perfect lines, 2.0 after 10
 *
 * The combo counter lives only as long as the controller.
 */
class LevelPractice {
  public:
    /**
     * @param level Level to practice
     * @param layout Layout Table (must outlive the controller)
     * @param store Progress store (must outlive the controller)
     * @param clock Clock for scoring (must outlive the controller)
     */
    LevelPractice(const Level& level, const LayoutTable& layout, IProgressStore& store,
                  const Clock& clock);

    const Level& level() const {
        return level_;
    }

    /** @brief All lines of the level, with availability */
    const std::vector<PreparedLine>& lines() const {
        return lines_;
    }

    /** @brief Whether at least one line can be practiced */
    bool has_available_lines() const;

    /** @brief Task index of the current line */
    size_t current_task() const {
        return current_;
    }

    const PreparedLine& current_line() const {
        return lines_[current_];
    }

    /**
     * @brief Start a fresh session on the current line
     *
     * A running line is discarded first.
     *
     * @throws LevelDataError if the level has no available line
     */
    SessionScorer& begin_line();

    /**
     * @brief Submit one keystroke to the running line
     *
     * Starts the current line if none is running. When the keystroke finishes
     * the line, progress is saved and the controller moves to the next
     * available line (wrapping around).
     */
    PracticeStep submit(const std::string& physical_key, bool modifier_held);

    /** @brief Discard the running line; nothing is recorded */
    void abandon();

    bool line_active() const {
        return scorer_ != nullptr;
    }

    /** @brief Running session, or nullptr */
    const SessionScorer* session() const {
        return scorer_.get();
    }

    /** @brief Expected next keystroke of the running (or current) line */
    KeyStroke peek_next() const;

    /** @brief Accuracy over all lines finished with this controller (1.0 if none) */
    double aggregate_accuracy() const;

    /** @brief Speed over all lines finished with this controller (0.0 if none) */
    double aggregate_wpm() const;

    size_t lines_finished() const {
        return lines_finished_;
    }

    /** @brief Completed tasks according to the stored progress */
    size_t completed_count() const;

    /** @brief Every available line has been completed at least once */
    bool level_complete() const;

    const Gamification& gamification() const {
        return gamification_;
    }

    double combo_multiplier() const {
        return combo_multiplier_;
    }

  private:
    void finish_line(PracticeStep& step);
    long update_gamification(const SessionResult& result);
    void advance();
    size_t first_available_from(size_t index) const;

    Level level_;
    const LayoutTable& layout_;
    IProgressStore& store_;
    const Clock& clock_;

    std::vector<PreparedLine> lines_;
    size_t current_ = 0;
    std::unique_ptr<SessionScorer> scorer_;

    Gamification gamification_;
    int consecutive_perfect_ = 0;
    double combo_multiplier_ = 1.0;

    size_t lines_finished_ = 0;
    size_t total_correct_ = 0;
    size_t total_incorrect_ = 0;
    double total_seconds_ = 0.0;
};

/**
 * @brief Unlock and completion state of a level for the level list
 */
struct LevelState {
    std::string key;
    std::string name;
    size_t completed{0};  ///< Completed available tasks
    size_t task_count{0}; ///< Available tasks
    bool unlocked{false};
    bool is_current{false}; ///< First unlocked, incomplete, typeable level

    bool complete() const {
        return task_count > 0 && completed >= task_count;
    }
};

/**
 * @brief Compute the level list state
 *
 * The first level is always unlocked; every other level unlocks when the
 * previous one is complete (or all unlock with @p unlock_all). Unavailable
 * lines do not count towards completion, and an unlocked level without any
 * available line unlocks the next one. The current level is the first
 * unlocked, incomplete level with at least one available line.
 */
std::vector<LevelState> build_level_states(const std::vector<Level>& levels,
                                           const LayoutTable& layout,
                                           const IProgressStore& store, bool unlock_all);

} // namespace thattan

#endif // __THATTAN_LEVEL_PRACTICE_H__
