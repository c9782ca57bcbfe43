// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

#include <spdlog/spdlog.h>

#include <string>

namespace thattan {
namespace logging {

/**
 * @brief Log destination targets
 *
 * Auto picks syslog when /dev/log exists, else a rotating file under
 * $XDG_STATE_HOME/thattan (or ~/.local/state/thattan).
 */
enum class LogTarget {
    Auto,   ///< Detect best available (default)
    Syslog, ///< Traditional syslog
    File,   ///< Rotating file log
    Console ///< Console only (no system logging)
};

/**
 * @brief Logging configuration
 */
struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::warn;
    bool enable_console = true;         ///< Show console output (stderr)
    LogTarget target = LogTarget::Auto; ///< System log destination
    std::string file_path;              ///< Override file path (empty = auto)
};

/**
 * @brief Initialize logging subsystem
 *
 * Call once at startup before any log calls. Creates a multi-sink logger
 * that writes to the console (if enabled) and the selected system target,
 * and installs it as the spdlog default logger.
 *
 * @param config Logging configuration
 */
void init(const LogConfig& config);

/**
 * @brief Parse log target from string
 *
 * @param str One of: "auto", "syslog", "file", "console"
 * @return Corresponding LogTarget enum value (Auto if unrecognized)
 */
LogTarget parse_log_target(const std::string& str);

/**
 * @brief Get string name for log target
 */
const char* log_target_name(LogTarget target);

/**
 * @brief Map -v count to a level: 0=warn, 1=info, 2=debug, 3+=trace
 */
spdlog::level::level_enum level_from_verbosity(int verbosity);

/**
 * @brief Resolve the rotating log file location
 *
 * @param override_path Explicit path (returned as-is when non-empty)
 */
std::string resolve_log_file(const std::string& override_path);

} // namespace logging
} // namespace thattan
