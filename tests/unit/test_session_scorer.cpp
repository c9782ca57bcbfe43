// Copyright 2025 Thattan
// SPDX-License-Identifier: GPL-3.0-or-later

#include "session_scorer.h"
#include "tutor_errors.h"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <chrono>

using namespace thattan;
using Catch::Matchers::WithinAbs;
using namespace std::chrono_literals;

// ============================================================================
// Test Fixtures
// ============================================================================

/**
 * @brief One-keystroke layout: அ = A, ம = M, க = H Q
 */
class ScorerFixture {
  protected:
    ScorerFixture() : layout(make_layout()) {}

    static LayoutTable make_layout() {
        LayoutTable::Entries entries;
        entries["அ"] = {KeyStroke{"A", false}};
        entries["ம"] = {KeyStroke{"M", false}};
        entries["கா"] = {KeyStroke{"H", false}, KeyStroke{"Q", false}};
        return LayoutTable(entries);
    }

    SessionScorer scorer_for(const PracticeLine& line) {
        return SessionScorer(KeystrokeMatcher(layout, line), clock);
    }

    LayoutTable layout;
    ManualClock clock;
};

// ============================================================================
// Accuracy
// ============================================================================

TEST_CASE_METHOD(ScorerFixture, "Scorer: one mistake in a two-character line",
                 "[scorer][accuracy]") {
    SessionScorer scorer = scorer_for(PracticeLine{"அ", "ம"});
    scorer.start();

    REQUIRE(scorer.submit("A", false).correct());
    REQUIRE_FALSE(scorer.submit("X", false).correct());
    REQUIRE_FALSE(scorer.finalized());
    REQUIRE(scorer.submit("M", false).line_complete);

    REQUIRE(scorer.finalized());
    const SessionResult& result = *scorer.result();
    REQUIRE(result.correct_count == 2);
    REQUIRE(result.incorrect_count == 1);
    REQUIRE_THAT(result.accuracy, WithinAbs(2.0 / 3.0, 1e-4));
    REQUIRE_FALSE(result.perfect());

    SECTION("Per-key statistics") {
        const SessionStats& stats = scorer.stats();
        REQUIRE(stats.key_tallies.at("A").correct == 1);
        REQUIRE(stats.key_tallies.at("A").total == 1);
        REQUIRE(stats.key_tallies.at("M").correct == 1);
        REQUIRE(stats.key_tallies.at("M").total == 2);
        REQUIRE(stats.mistakes.at("M -> X") == 1);
        REQUIRE(stats.response_ms.size() == 3);
    }
}

TEST_CASE_METHOD(ScorerFixture, "Scorer: keystroke count covers the whole line",
                 "[scorer][accuracy]") {
    SessionScorer scorer = scorer_for(PracticeLine{"கா", "அ"});
    const size_t needed = scorer.matcher().total_keystrokes();

    scorer.submit("H", false);
    scorer.submit("H", false);
    scorer.submit("Q", false);
    scorer.submit("S", false);
    scorer.submit("A", false);

    const SessionResult& result = scorer.finalize();
    REQUIRE(result.correct_count == needed);
    REQUIRE(result.correct_count + result.incorrect_count >= scorer.matcher().length());
    REQUIRE(result.incorrect_count == 2);
}

TEST_CASE_METHOD(ScorerFixture, "Scorer: perfect line has accuracy 1.0", "[scorer][accuracy]") {
    SessionScorer scorer = scorer_for(PracticeLine{"அ", "ம"});
    scorer.submit("A", false);
    scorer.submit("M", false);

    REQUIRE(scorer.result()->accuracy == 1.0);
    REQUIRE(scorer.result()->perfect());
}

// ============================================================================
// Speed
// ============================================================================

TEST_CASE_METHOD(ScorerFixture, "Scorer: speed over a measured minute", "[scorer][speed]") {
    SessionScorer scorer = scorer_for(PracticeLine{"அ", "அ", "அ", "அ", "அ"});
    scorer.start();

    for (int i = 0; i < 5; i++) {
        clock.advance(12s);
        scorer.submit("A", false);
    }

    const SessionResult& result = scorer.finalize();
    REQUIRE_THAT(result.elapsed_seconds, WithinAbs(60.0, 1e-9));
    REQUIRE_THAT(result.wpm, WithinAbs(1.0, 1e-9));
    REQUIRE_THAT(result.spm, WithinAbs(5.0, 1e-9));
    REQUIRE_THAT(result.mean_response_ms, WithinAbs(12000.0, 1e-6));
}

TEST_CASE_METHOD(ScorerFixture, "Scorer: speed counts correct keystrokes only",
                 "[scorer][speed]") {
    SessionScorer scorer = scorer_for(PracticeLine{"அ", "ம"});
    scorer.start();
    clock.advance(6s);
    scorer.submit("A", false);
    scorer.submit("Z", false);
    scorer.submit("Z", false);
    scorer.submit("M", false);

    // 2 correct strokes in 0.1 minutes
    REQUIRE_THAT(scorer.result()->spm, WithinAbs(20.0, 1e-9));
    REQUIRE_THAT(scorer.result()->wpm, WithinAbs(4.0, 1e-9));
}

TEST_CASE_METHOD(ScorerFixture, "Scorer: same-tick session uses the elapsed floor",
                 "[scorer][speed]") {
    SessionScorer scorer = scorer_for(PracticeLine{"அ"});
    scorer.submit("A", false);

    const SessionResult& result = *scorer.result();
    REQUIRE(result.elapsed_seconds == MIN_ELAPSED_SECONDS);
    REQUIRE_THAT(result.spm, WithinAbs(1.0 / (MIN_ELAPSED_SECONDS / 60.0), 1e-6));
}

// ============================================================================
// Lifecycle
// ============================================================================

TEST_CASE_METHOD(ScorerFixture, "Scorer: empty line finalizes at start", "[scorer][lifecycle]") {
    SessionScorer scorer = scorer_for(PracticeLine{});
    scorer.start();

    REQUIRE(scorer.finalized());
    const SessionResult& result = *scorer.result();
    REQUIRE(result.accuracy == 1.0);
    REQUIRE(result.wpm == 0.0);
    REQUIRE(result.correct_count == 0);
    REQUIRE(result.elapsed_seconds == MIN_ELAPSED_SECONDS);
}

TEST_CASE_METHOD(ScorerFixture, "Scorer: finalize is cached", "[scorer][lifecycle]") {
    SessionScorer scorer = scorer_for(PracticeLine{"அ", "ம"});
    scorer.start();
    clock.advance(3s);
    scorer.submit("A", false);

    const SessionResult first = scorer.finalize();
    clock.advance(30s);
    const SessionResult second = scorer.finalize();

    REQUIRE(first.elapsed_seconds == second.elapsed_seconds);
    REQUIRE(first.wpm == second.wpm);
    REQUIRE(first.spm == second.spm);
    REQUIRE(first.accuracy == second.accuracy);
    REQUIRE(first.correct_count == second.correct_count);
    REQUIRE(first.incorrect_count == second.incorrect_count);
    REQUIRE(first.mean_response_ms == second.mean_response_ms);
    REQUIRE(&scorer.finalize() == &*scorer.result());
    REQUIRE(scorer.elapsed_seconds() == first.elapsed_seconds);
}

TEST_CASE_METHOD(ScorerFixture, "Scorer: elapsed time runs until finalized",
                 "[scorer][lifecycle]") {
    SessionScorer scorer = scorer_for(PracticeLine{"அ"});
    REQUIRE(scorer.elapsed_seconds() == 0.0);

    scorer.start();
    clock.advance(2s);
    REQUIRE_THAT(scorer.elapsed_seconds(), WithinAbs(2.0, 1e-9));
}

TEST_CASE_METHOD(ScorerFixture, "Scorer: misuse is reported", "[scorer][errors]") {
    SECTION("finalize before start") {
        SessionScorer scorer = scorer_for(PracticeLine{"அ"});
        REQUIRE_THROWS_AS(scorer.finalize(), SessionNotStartedError);
    }

    SECTION("record before start") {
        SessionScorer scorer = scorer_for(PracticeLine{"அ"});
        KeystrokeOutcome outcome;
        outcome.result = KeystrokeResult::Correct;
        REQUIRE_THROWS_AS(scorer.record(outcome), SessionNotStartedError);
    }

    SECTION("use after completion") {
        SessionScorer scorer = scorer_for(PracticeLine{"அ"});
        scorer.submit("A", false);
        REQUIRE_THROWS_AS(scorer.submit("A", false), SessionCompleteError);
        REQUIRE_THROWS_AS(scorer.record(KeystrokeOutcome{}), SessionCompleteError);
        REQUIRE_THROWS_AS(scorer.start(), SessionCompleteError);
    }
}

TEST_CASE_METHOD(ScorerFixture, "Scorer: start after keystrokes is refused",
                 "[scorer][lifecycle][errors]") {
    SECTION("After a correct keystroke") {
        SessionScorer scorer = scorer_for(PracticeLine{"அ", "ம"});
        scorer.start();
        scorer.submit("A", false);

        REQUIRE_THROWS_AS(scorer.start(), SessionInProgressError);

        auto last = scorer.submit("M", false);
        REQUIRE(last.line_complete);
        const SessionResult& result = *scorer.result();
        REQUIRE(result.correct_count == 2);
        REQUIRE(result.correct_count + result.incorrect_count >= scorer.matcher().length());
    }

    SECTION("After an incorrect keystroke") {
        SessionScorer scorer = scorer_for(PracticeLine{"அ", "ம"});
        scorer.submit("X", false);

        REQUIRE_THROWS_AS(scorer.start(), SessionInProgressError);
        REQUIRE(scorer.stats().incorrect_count == 1);
    }
}

TEST_CASE_METHOD(ScorerFixture, "Scorer: start before any keystroke restarts the timer",
                 "[scorer][lifecycle]") {
    SessionScorer scorer = scorer_for(PracticeLine{"அ"});
    scorer.start();
    clock.advance(10s);
    scorer.start();
    clock.advance(2s);

    REQUIRE_THAT(scorer.elapsed_seconds(), WithinAbs(2.0, 1e-9));
}
