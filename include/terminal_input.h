// Copyright 2025 Thattan
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <termios.h>

namespace thattan {

/// Escape key byte
constexpr int KEY_ESCAPE = 27;
/// Ctrl-C byte (ISIG is off in raw mode)
constexpr int KEY_INTERRUPT = 3;

/**
 * @brief Non-canonical, no-echo terminal input for the lifetime of the object
 *
 * Does nothing when the descriptor is not a TTY (piped input). The original
 * settings are restored on destruction or restore().
 */
class RawTerminal {
  public:
    explicit RawTerminal(int fd);
    ~RawTerminal();

    RawTerminal(const RawTerminal&) = delete;
    RawTerminal& operator=(const RawTerminal&) = delete;

    void restore();

    /** @brief Whether raw mode is in effect */
    bool active() const {
        return active_;
    }

    /**
     * @brief Block for one input byte
     * @return Byte value 0-255, or -1 on end of input
     */
    int read_byte() const;

  private:
    int fd_;
    struct termios original_ {};
    bool active_ = false;
};

} // namespace thattan
