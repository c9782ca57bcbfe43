// Copyright 2025 Thattan
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <chrono>

namespace thattan {

/**
 * @brief Monotonic time source for session scoring
 *
 * Sessions read time only through this interface so tests can drive the
 * clock deterministically (see ManualClock).
 */
class Clock {
  public:
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~Clock() = default;

    /** @brief Current monotonic time */
    virtual time_point now() const = 0;
};

/** @brief Clock backed by std::chrono::steady_clock */
class SteadyClock : public Clock {
  public:
    time_point now() const override {
        return std::chrono::steady_clock::now();
    }
};

/**
 * @brief Manually advanced clock for tests and replay
 *
 * Starts at the steady_clock epoch and only moves when advance() is called.
 */
class ManualClock : public Clock {
  public:
    time_point now() const override {
        return now_;
    }

    void advance(std::chrono::steady_clock::duration by) {
        now_ += by;
    }

  private:
    time_point now_{};
};

} // namespace thattan
