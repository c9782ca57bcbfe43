// Copyright 2025 Thattan
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef __THATTAN_PROGRESS_STORE_H__
#define __THATTAN_PROGRESS_STORE_H__

#include <filesystem>
#include <map>
#include <set>
#include <string>

namespace thattan {

struct SessionResult;

/**
 * @brief Persisted progress for one level
 */
struct ProgressRecord {
    std::set<int> completed_task_indices; ///< Tasks (lines) finished at least once
    double best_accuracy{0.0};            ///< Best line accuracy, 0.0-1.0
    double best_speed{0.0};               ///< Best line speed, words per minute

    /**
     * @brief Fold a finished line into the record
     *
     * Marks @p task_index completed and keeps the maxima of accuracy and speed.
     */
    void merge(int task_index, const SessionResult& result);

    /** @brief Number of distinct completed tasks */
    size_t completed_count() const {
        return completed_task_indices.size();
    }

    bool operator==(const ProgressRecord& other) const {
        return completed_task_indices == other.completed_task_indices &&
               best_accuracy == other.best_accuracy && best_speed == other.best_speed;
    }
};

/**
 * @brief Score and streak counters shared by all levels
 */
struct Gamification {
    long total_score{0};
    int current_streak{0};
    int best_streak{0}; ///< Never decreases, even when a lower value is saved

    bool operator==(const Gamification& other) const {
        return total_score == other.total_score && current_streak == other.current_streak &&
               best_streak == other.best_streak;
    }
};

/**
 * @brief Persistence of level progress
 *
 * Constructed once at startup and passed by reference to whatever needs it.
 * save() is a whole-record replace and is visible to the next load() of the
 * same level in the same process.
 *
 * Thread safety: single-threaded, main loop only.
 */
class IProgressStore {
  public:
    virtual ~IProgressStore() = default;

    /**
     * @brief Progress of one level
     * @param level_id Level key (e.g. "level3")
     * @return Stored record, or an empty record for unknown levels
     */
    virtual ProgressRecord load(const std::string& level_id) const = 0;

    /**
     * @brief Replace the stored record of one level
     * @return true if the record reached durable storage
     */
    virtual bool save(const std::string& level_id, const ProgressRecord& record) = 0;

    virtual Gamification load_gamification() const = 0;

    /** @brief Replace the score counters (best_streak is kept at its maximum) */
    virtual bool save_gamification(const Gamification& gamification) = 0;

    /** @brief Clear the progress of one level */
    virtual bool reset_level(const std::string& level_id) = 0;

    /** @brief Clear all levels and the score counters */
    virtual bool reset_all() = 0;

    /** @brief Persist any in-memory state (application shutdown) */
    virtual bool flush() = 0;
};

/**
 * @brief In-memory progress store (tests, --test mode)
 */
class MemoryProgressStore : public IProgressStore {
  public:
    ProgressRecord load(const std::string& level_id) const override;
    bool save(const std::string& level_id, const ProgressRecord& record) override;
    Gamification load_gamification() const override;
    bool save_gamification(const Gamification& gamification) override;
    bool reset_level(const std::string& level_id) override;
    bool reset_all() override;
    bool flush() override;

    /** @brief Number of save()/save_gamification() calls (for tests) */
    int save_count() const {
        return save_count_;
    }

  protected:
    std::map<std::string, ProgressRecord> levels_;
    Gamification gamification_;
    int save_count_ = 0;
};

/**
 * @brief JSON file progress store
 *
 * File layout:
 * ```json
 * {
 *   "version": 1,
 *   "levels": {
 *     "level1": { "completed_tasks": [0, 1], "best_accuracy": 0.97, "best_wpm": 11.5 }
 *   },
 *   "gamification": { "total_score": 120, "current_streak": 2, "best_streak": 7 }
 * }
 * ```
 *
 * The whole document is rewritten on every save (temporary file + rename).
 * A missing file starts empty; an unreadable file is logged and ignored.
 */
class JsonProgressStore : public MemoryProgressStore {
  public:
    /**
     * @brief Open (or create on first save) a progress file
     * @param path Location of progress.json
     */
    explicit JsonProgressStore(std::filesystem::path path);

    bool save(const std::string& level_id, const ProgressRecord& record) override;
    bool save_gamification(const Gamification& gamification) override;
    bool reset_level(const std::string& level_id) override;
    bool reset_all() override;
    bool flush() override;

    const std::filesystem::path& path() const {
        return path_;
    }

    /**
     * @brief Default location: ~/.thattan/progress.json
     */
    static std::filesystem::path default_path();

  private:
    void load_file();
    bool write_file();

    std::filesystem::path path_;
};

} // namespace thattan

#endif // __THATTAN_PROGRESS_STORE_H__
