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

#include "session_scorer.h"

#include "keyboard_input.h"
#include "tutor_errors.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <numeric>
#include <utility>

namespace thattan {

namespace {
double seconds_between(Clock::time_point from, Clock::time_point to) {
    return std::chrono::duration<double>(to - from).count();
}
} // namespace

double SessionStats::accuracy() const {
    size_t total = correct_count + incorrect_count;
    if (total == 0) {
        return 1.0;
    }
    return static_cast<double>(correct_count) / static_cast<double>(total);
}

SessionScorer::SessionScorer(KeystrokeMatcher matcher, const Clock& clock)
    : matcher_(std::move(matcher)), clock_(clock) {}

void SessionScorer::start() {
    if (finalized()) {
        throw SessionCompleteError("start");
    }
    // Counters must cover the whole line; a restart needs a fresh scorer
    if (stats_.correct_count + stats_.incorrect_count > 0 || matcher_.char_index() > 0 ||
        matcher_.keystroke_index() > 0) {
        throw SessionInProgressError();
    }

    stats_ = SessionStats{};
    stats_.started_at = clock_.now();
    last_keystroke_at_.reset();
    spdlog::debug("[SessionScorer] Started line '{}'", matcher_.target_text());

    if (matcher_.completed()) {
        spdlog::debug("[SessionScorer] Empty line, finalizing immediately");
        finalize();
    }
}

void SessionScorer::record(const KeystrokeOutcome& outcome) {
    if (finalized()) {
        throw SessionCompleteError("record");
    }
    if (!started()) {
        throw SessionNotStartedError();
    }

    const auto now = clock_.now();
    const auto previous = last_keystroke_at_.value_or(*stats_.started_at);
    stats_.response_ms.push_back(seconds_between(previous, now) * 1000.0);
    last_keystroke_at_ = now;

    auto& tally = stats_.key_tallies[keystroke_label(outcome.expected)];
    tally.total++;

    if (outcome.correct()) {
        stats_.correct_count++;
        tally.correct++;
    } else {
        stats_.incorrect_count++;
        stats_.mistakes[keystroke_label(outcome.expected) + " -> " +
                        keystroke_label(outcome.pressed)]++;
    }

    if (outcome.line_complete) {
        finalize();
    }
}

KeystrokeOutcome SessionScorer::submit(const std::string& physical_key, bool modifier_held) {
    if (finalized()) {
        throw SessionCompleteError("submit");
    }
    if (!started()) {
        start();
    }

    KeystrokeOutcome outcome = matcher_.submit(physical_key, modifier_held);
    record(outcome);
    return outcome;
}

const SessionResult& SessionScorer::finalize() {
    if (result_) {
        return *result_;
    }
    if (!started()) {
        throw SessionNotStartedError();
    }

    stats_.finished_at = clock_.now();

    SessionResult result;
    result.correct_count = stats_.correct_count;
    result.incorrect_count = stats_.incorrect_count;
    result.accuracy = stats_.accuracy();
    result.elapsed_seconds = std::max(
        seconds_between(*stats_.started_at, *stats_.finished_at), MIN_ELAPSED_SECONDS);

    const double minutes = result.elapsed_seconds / 60.0;
    result.wpm = (static_cast<double>(result.correct_count) / 5.0) / minutes;
    result.spm = static_cast<double>(result.correct_count) / minutes;

    if (!stats_.response_ms.empty()) {
        result.mean_response_ms =
            std::accumulate(stats_.response_ms.begin(), stats_.response_ms.end(), 0.0) /
            static_cast<double>(stats_.response_ms.size());
    }

    result_ = result;
    spdlog::info("[SessionScorer] Line finished: accuracy={:.1f}% wpm={:.1f} spm={:.1f} "
                 "correct={} incorrect={} elapsed={:.2f}s",
                 result.accuracy * 100.0, result.wpm, result.spm, result.correct_count,
                 result.incorrect_count, result.elapsed_seconds);
    return *result_;
}

double SessionScorer::elapsed_seconds() const {
    if (result_) {
        return result_->elapsed_seconds;
    }
    if (!started()) {
        return 0.0;
    }
    return seconds_between(*stats_.started_at, clock_.now());
}

} // namespace thattan
