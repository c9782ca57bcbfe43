// Copyright 2025 Thattan
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef __THATTAN_APP_CONFIG_H__
#define __THATTAN_APP_CONFIG_H__

#include <spdlog/spdlog.h>

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

namespace thattan {

/**
 * @brief Resolved application settings
 */
struct AppConfig {
    std::string levels_dir = "data/levels";
    std::string progress_file;      ///< Empty = JsonProgressStore::default_path()
    std::string log_level = "warn"; ///< spdlog level name
    std::string log_target = "auto";
    std::string log_file;           ///< Empty = auto
    bool unlock_all_levels = false;
};

/**
 * @brief JSON configuration file
 *
 * Values are addressed with JSON pointers ("/levels_dir"). A missing file
 * yields defaults; a malformed file is logged and treated as empty.
 *
 * Example:
 * ```json
 * { "levels_dir": "/usr/share/thattan/levels", "log_level": "info" }
 * ```
 */
class Config {
  public:
    Config() = default;

    /**
     * @brief Load a configuration file
     * @return true if the file was read and parsed
     */
    bool load(const std::filesystem::path& path);

    /**
     * @brief Write the configuration back to the loaded path
     * @return true on success
     */
    bool save() const;

    /**
     * @brief Read a value
     * @param json_ptr JSON pointer ("/log_level")
     * @param default_value Returned when missing or of the wrong type
     */
    template <typename T> T get(const std::string& json_ptr, const T& default_value) const {
        try {
            nlohmann::json::json_pointer ptr(json_ptr);
            if (!data_.contains(ptr)) {
                return default_value;
            }
            return data_.at(ptr).get<T>();
        } catch (const nlohmann::json::exception& e) {
            spdlog::warn("[Config] Invalid value at {}: {}", json_ptr, e.what());
            return default_value;
        }
    }

    /** @brief Set a value (not persisted until save()) */
    template <typename T> void set(const std::string& json_ptr, const T& value) {
        data_[nlohmann::json::json_pointer(json_ptr)] = value;
    }

    /**
     * @brief Settings with defaults applied
     *
     * THATTAN_UNLOCK_ALL=1 in the environment forces unlock_all_levels.
     */
    AppConfig app_config() const;

    const std::filesystem::path& path() const {
        return path_;
    }

    /** @brief $XDG_CONFIG_HOME/thattan/config.json or ~/.config/thattan/config.json */
    static std::filesystem::path default_path();

  private:
    std::filesystem::path path_;
    nlohmann::json data_ = nlohmann::json::object();
};

} // namespace thattan

#endif // __THATTAN_APP_CONFIG_H__
