// Copyright 2025 Thattan
// SPDX-License-Identifier: GPL-3.0-or-later

#include "terminal_input.h"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <unistd.h>

namespace thattan {

RawTerminal::RawTerminal(int fd) : fd_(fd) {
    if (!isatty(fd_)) {
        spdlog::debug("[RawTerminal] fd {} is not a TTY, reading as-is", fd_);
        return;
    }
    if (tcgetattr(fd_, &original_) != 0) {
        spdlog::warn("[RawTerminal] tcgetattr failed: {}", std::strerror(errno));
        return;
    }

    struct termios raw = original_;
    raw.c_lflag &= ~(ECHO | ICANON | ISIG);
    raw.c_cc[VMIN] = 1;
    raw.c_cc[VTIME] = 0;
    if (tcsetattr(fd_, TCSAFLUSH, &raw) != 0) {
        spdlog::warn("[RawTerminal] tcsetattr failed: {}", std::strerror(errno));
        return;
    }
    active_ = true;
}

RawTerminal::~RawTerminal() {
    restore();
}

void RawTerminal::restore() {
    if (active_) {
        tcsetattr(fd_, TCSAFLUSH, &original_);
        active_ = false;
    }
}

int RawTerminal::read_byte() const {
    unsigned char c = 0;
    while (true) {
        ssize_t n = read(fd_, &c, 1);
        if (n == 1) {
            return c;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        return -1;
    }
}

} // namespace thattan
