// Copyright 2025 Thattan
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file ansi_colors.h
 * @brief ANSI escape codes for the terminal practice screen
 *
 * Colors are emitted only when enabled (stdout is a TTY and --no-color was
 * not given); otherwise every helper returns the plain text.
 */

#pragma once

#include <string>
#include <unistd.h>

namespace thattan {
namespace ansi {

// Check if output is a TTY (for auto-disable when piped)
inline bool is_tty() {
    return isatty(STDOUT_FILENO);
}

inline bool& enabled_flag() {
    static bool enabled = is_tty();
    return enabled;
}

inline void set_enabled(bool enabled) {
    enabled_flag() = enabled;
}

inline bool enabled() {
    return enabled_flag();
}

constexpr const char* RESET = "\033[0m";
constexpr const char* BOLD = "\033[1m";
constexpr const char* DIM = "\033[2m";
constexpr const char* UNDERLINE = "\033[4m";
constexpr const char* REVERSE = "\033[7m";

constexpr const char* CYAN = "\033[36m";
constexpr const char* WHITE = "\033[37m";
constexpr const char* BRIGHT_RED = "\033[91m";
constexpr const char* BRIGHT_GREEN = "\033[92m";
constexpr const char* BRIGHT_YELLOW = "\033[93m";
constexpr const char* BRIGHT_BLUE = "\033[94m";
constexpr const char* BRIGHT_CYAN = "\033[96m";

// Cursor control
constexpr const char* CLEAR_LINE = "\r\033[2K";

inline std::string cursor_up(int lines) {
    if (lines <= 0 || !enabled()) {
        return "";
    }
    return "\033[" + std::to_string(lines) + "A";
}

inline std::string styled(const char* style, const std::string& text) {
    if (!enabled()) {
        return text;
    }
    return std::string(style) + text + RESET;
}

// Semantic colors
inline std::string success(const std::string& text) {
    return styled(BRIGHT_GREEN, text);
}

inline std::string error(const std::string& text) {
    return styled(BRIGHT_RED, text);
}

inline std::string warning(const std::string& text) {
    return styled(BRIGHT_YELLOW, text);
}

inline std::string info(const std::string& text) {
    return styled(BRIGHT_CYAN, text);
}

inline std::string dim(const std::string& text) {
    return styled(DIM, text);
}

inline std::string header(const std::string& text) {
    if (!enabled()) {
        return text;
    }
    return std::string(BOLD) + BRIGHT_CYAN + text + RESET;
}

inline std::string key(const std::string& text) {
    return styled(BRIGHT_BLUE, text);
}

inline std::string value(const std::string& text) {
    return styled(WHITE, text);
}

// Practice line: typed prefix, character under the cursor, keycap to press
inline std::string typed(const std::string& text) {
    return styled(BRIGHT_GREEN, text);
}

inline std::string cursor(const std::string& text) {
    if (!enabled()) {
        return "[" + text + "]";
    }
    return std::string(UNDERLINE) + BOLD + text + RESET;
}

inline std::string highlight(const std::string& text) {
    if (!enabled()) {
        return text;
    }
    return std::string(REVERSE) + CYAN + text + RESET;
}

} // namespace ansi
} // namespace thattan
