// Copyright 2025 Thattan
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <stdexcept>
#include <string>

/**
 * @file tutor_errors.h
 * @brief Exception taxonomy for the typing tutor core
 *
 * Incorrect keystrokes are NOT errors: they are reported as data through
 * KeystrokeOutcome. The exceptions below signal configuration problems
 * (unmapped characters, malformed level files) or contract violations at the
 * call site (using a session after it completed).
 */

namespace thattan {

/** @brief Base class for all tutor errors */
class TutorError : public std::runtime_error {
  public:
    explicit TutorError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief A practice line contains a character with no Layout Table entry
 *
 * Raised while a line is being set up, before any keystroke is accepted.
 * Callers treat the line as unavailable and continue with the rest of the level.
 */
class UnmappedCharacterError : public TutorError {
  public:
    explicit UnmappedCharacterError(const std::string& character)
        : TutorError("No keystroke mapping for character '" + character + "'"),
          character_(character) {}

    /** @brief The offending character (UTF-8) */
    const std::string& character() const {
        return character_;
    }

  private:
    std::string character_;
};

/** @brief An operation needing an active session was called after completion */
class SessionCompleteError : public TutorError {
  public:
    explicit SessionCompleteError(const std::string& operation)
        : TutorError(operation + "() called on a completed session") {}
};

/** @brief start() called on a session that already consumed keystrokes */
class SessionInProgressError : public TutorError {
  public:
    SessionInProgressError() : TutorError("start() called on a session in progress") {}
};

/** @brief finalize() called before start() */
class SessionNotStartedError : public TutorError {
  public:
    SessionNotStartedError() : TutorError("Session has not been started") {}
};

/** @brief Malformed or missing level data */
class LevelDataError : public TutorError {
  public:
    explicit LevelDataError(const std::string& what) : TutorError(what) {}
};

} // namespace thattan
