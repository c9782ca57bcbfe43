// Copyright 2025 Thattan
// SPDX-License-Identifier: GPL-3.0-or-later

#include "app_config.h"

#include <cstdlib>
#include <fstream>
#include <system_error>
#include <utility>

using json = nlohmann::json;

namespace thattan {

bool Config::load(const std::filesystem::path& path) {
    path_ = path;
    data_ = json::object();

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        spdlog::debug("[Config] No config file at {}, using defaults", path.string());
        return false;
    }

    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            spdlog::warn("[Config] Failed to open {}", path.string());
            return false;
        }
        json parsed = json::parse(file);
        if (!parsed.is_object()) {
            spdlog::warn("[Config] {} is not a JSON object, using defaults", path.string());
            return false;
        }
        data_ = std::move(parsed);
        spdlog::debug("[Config] Loaded {}", path.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::warn("[Config] Failed to parse {}: {}", path.string(), e.what());
        return false;
    }
}

bool Config::save() const {
    if (path_.empty()) {
        spdlog::error("[Config] save() without a config path");
        return false;
    }

    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
    }

    std::ofstream file(path_, std::ios::trunc);
    if (!file.is_open()) {
        spdlog::error("[Config] Cannot write {}", path_.string());
        return false;
    }
    file << data_.dump(2) << '\n';
    return file.good();
}

AppConfig Config::app_config() const {
    AppConfig defaults;
    AppConfig config;
    config.levels_dir = get<std::string>("/levels_dir", defaults.levels_dir);
    config.progress_file = get<std::string>("/progress_file", defaults.progress_file);
    config.log_level = get<std::string>("/log_level", defaults.log_level);
    config.log_target = get<std::string>("/log_target", defaults.log_target);
    config.log_file = get<std::string>("/log_file", defaults.log_file);
    config.unlock_all_levels = get<bool>("/unlock_all_levels", defaults.unlock_all_levels);

    const char* unlock_env = std::getenv("THATTAN_UNLOCK_ALL");
    if (unlock_env && std::string(unlock_env) == "1") {
        config.unlock_all_levels = true;
    }
    return config;
}

std::filesystem::path Config::default_path() {
    const char* config_home = std::getenv("XDG_CONFIG_HOME");
    if (config_home && *config_home) {
        return std::filesystem::path(config_home) / "thattan" / "config.json";
    }
    const char* home = std::getenv("HOME");
    std::filesystem::path base = (home && *home) ? home : ".";
    return base / ".config" / "thattan" / "config.json";
}

} // namespace thattan
