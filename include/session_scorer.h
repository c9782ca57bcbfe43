// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 Thattan Contributors
 *
 * This file is part of Thattan, which is free software: you can
 * redistribute it and/or modify it under the terms of the GNU General
 * Public License as published by the Free Software Foundation, either
 * version 3 of the License, or (at your option) any later version.
 *
 * See <https://www.gnu.org/licenses/>.
 */

#pragma once

#include "keystroke_matcher.h"
#include "tutor_clock.h"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

/**
 * @file session_scorer.h
 * @brief Accuracy and speed scoring for one practice line
 *
 * A session is one attempt at one line. The scorer owns the Matcher for the
 * line, counts keystroke outcomes and turns them into a SessionResult when the
 * line completes.
 *
 * Speed uses the 5-keystrokes-per-word convention over CORRECT keystrokes:
 *   wpm = (correct / 5) / minutes
 *   spm = correct / minutes
 *
 * finalize() is idempotent: after the first call it returns the cached result
 * and never reads the clock again.
 */

namespace thattan {

/// Lower bound on elapsed time, avoids division by zero for same-tick sessions
constexpr double MIN_ELAPSED_SECONDS = 0.001;

/** @brief Immutable summary of a finished session */
struct SessionResult {
    double accuracy{1.0};        ///< correct / (correct + incorrect), 1.0 if no keystrokes
    double wpm{0.0};             ///< Words per minute (5 keystrokes per word)
    double spm{0.0};             ///< Correct strokes per minute
    size_t correct_count{0};
    size_t incorrect_count{0};
    double elapsed_seconds{MIN_ELAPSED_SECONDS};
    double mean_response_ms{0.0}; ///< Mean time between consecutive keystrokes

    /** @brief Whether the line was typed without a single mistake */
    bool perfect() const {
        return incorrect_count == 0;
    }
};

/** @brief Hit counts for one expected key */
struct KeyTally {
    size_t correct{0};
    size_t total{0};
};

/** @brief Live counters of a running session */
struct SessionStats {
    size_t correct_count{0};
    size_t incorrect_count{0};
    std::optional<Clock::time_point> started_at;
    std::optional<Clock::time_point> finished_at;

    std::map<std::string, KeyTally> key_tallies; ///< Keyed by expected keystroke label
    std::map<std::string, size_t> mistakes;      ///< "expected -> pressed" counts
    std::vector<double> response_ms;             ///< Gaps between keystrokes

    /** @brief Accuracy so far (1.0 before any keystroke) */
    double accuracy() const;
};

class SessionScorer {
  public:
    /**
     * @brief Wrap a prepared matcher
     *
     * @param matcher Matcher for the line (ownership taken)
     * @param clock Monotonic clock (must outlive the scorer)
     */
    SessionScorer(KeystrokeMatcher matcher, const Clock& clock);

    /**
     * @brief Start timing and reset counters
     *
     * An empty line is already complete: the session finalizes right away.
     * Calling it again before the first keystroke restarts the timer.
     *
     * @throws SessionCompleteError if the session was already finalized
     * @throws SessionInProgressError if keystrokes were already consumed
     */
    void start();

    /**
     * @brief Account for one submit() outcome
     *
     * LineComplete triggers finalize().
     *
     * @throws SessionCompleteError if the session was already finalized
     */
    void record(const KeystrokeOutcome& outcome);

    /**
     * @brief Submit a keystroke to the matcher and record its outcome
     *
     * Starts the session if start() was not called yet.
     */
    KeystrokeOutcome submit(const std::string& physical_key, bool modifier_held);

    /**
     * @brief Stop timing and compute the result
     *
     * A second call returns the cached result unchanged.
     *
     * @throws SessionNotStartedError if start() was never called
     */
    const SessionResult& finalize();

    bool started() const {
        return stats_.started_at.has_value();
    }

    bool finalized() const {
        return result_.has_value();
    }

    /** @brief Cached result, if finalized */
    const std::optional<SessionResult>& result() const {
        return result_;
    }

    const SessionStats& stats() const {
        return stats_;
    }

    const KeystrokeMatcher& matcher() const {
        return matcher_;
    }

    /** @brief Seconds since start() (0 if not started, frozen once finalized) */
    double elapsed_seconds() const;

  private:
    KeystrokeMatcher matcher_;
    const Clock& clock_;
    SessionStats stats_;
    std::optional<Clock::time_point> last_keystroke_at_;
    std::optional<SessionResult> result_;
};

} // namespace thattan
