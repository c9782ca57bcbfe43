// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging_init.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/syslog_sink.h>

#include <syslog.h>

#include <cstdlib>
#include <filesystem>
#include <memory>
#include <system_error>
#include <vector>

namespace thattan {
namespace logging {

namespace {
constexpr const char* LOGGER_NAME = "thattan";
constexpr size_t LOG_FILE_MAX_SIZE = 1024 * 1024;
constexpr size_t LOG_FILE_MAX_FILES = 3;

bool syslog_available() {
    std::error_code ec;
    return std::filesystem::exists("/dev/log", ec);
}
} // namespace

std::string resolve_log_file(const std::string& override_path) {
    if (!override_path.empty()) {
        return override_path;
    }

    std::filesystem::path dir;
    const char* state_home = std::getenv("XDG_STATE_HOME");
    const char* home = std::getenv("HOME");
    if (state_home && *state_home) {
        dir = std::filesystem::path(state_home) / "thattan";
    } else if (home && *home) {
        dir = std::filesystem::path(home) / ".local" / "state" / "thattan";
    } else {
        dir = std::filesystem::temp_directory_path() / "thattan";
    }
    return (dir / "thattan.log").string();
}

void init(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.enable_console) {
        // stderr keeps the practice screen on stdout clean
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }

    LogTarget target = config.target;
    if (target == LogTarget::Auto) {
        target = syslog_available() ? LogTarget::Syslog : LogTarget::File;
    }

    std::string file_path;
    switch (target) {
    case LogTarget::Syslog:
        sinks.push_back(std::make_shared<spdlog::sinks::syslog_sink_mt>(LOGGER_NAME, LOG_PID,
                                                                         LOG_USER, true));
        break;
    case LogTarget::File: {
        file_path = resolve_log_file(config.file_path);
        std::error_code ec;
        std::filesystem::create_directories(std::filesystem::path(file_path).parent_path(), ec);
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                file_path, LOG_FILE_MAX_SIZE, LOG_FILE_MAX_FILES));
        } catch (const spdlog::spdlog_ex& e) {
            // Fall back to console-only logging
            if (sinks.empty()) {
                sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
            }
            auto fallback = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(),
                                                             sinks.end());
            fallback->warn("[Logging] Cannot open log file {}: {}", file_path, e.what());
            file_path.clear();
        }
        break;
    }
    case LogTarget::Console:
    case LogTarget::Auto:
        break;
    }

    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    logger->set_level(config.level);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    spdlog::debug("[Logging] Initialized: level={} target={}{}{}",
                  spdlog::level::to_string_view(config.level), log_target_name(target),
                  file_path.empty() ? "" : " file=", file_path);
}

LogTarget parse_log_target(const std::string& str) {
    if (str == "syslog") {
        return LogTarget::Syslog;
    }
    if (str == "file") {
        return LogTarget::File;
    }
    if (str == "console") {
        return LogTarget::Console;
    }
    return LogTarget::Auto;
}

const char* log_target_name(LogTarget target) {
    switch (target) {
    case LogTarget::Auto:
        return "auto";
    case LogTarget::Syslog:
        return "syslog";
    case LogTarget::File:
        return "file";
    case LogTarget::Console:
        return "console";
    }
    return "unknown";
}

spdlog::level::level_enum level_from_verbosity(int verbosity) {
    switch (verbosity) {
    case 0:
        return spdlog::level::warn;
    case 1:
        return spdlog::level::info;
    case 2:
        return spdlog::level::debug;
    default:
        return verbosity < 0 ? spdlog::level::warn : spdlog::level::trace;
    }
}

} // namespace logging
} // namespace thattan
