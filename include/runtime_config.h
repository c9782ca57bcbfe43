// Copyright 2025 Thattan
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef RUNTIME_CONFIG_H
#define RUNTIME_CONFIG_H

/**
 * @brief Command-line options of the thattan executable
 *
 * Values given on the command line override the configuration file.
 * nullptr means "not given".
 */
struct RuntimeConfig {
    const char* config_file = nullptr;   ///< Configuration file (--config)
    const char* levels_dir = nullptr;    ///< Level directory (--levels)
    const char* progress_file = nullptr; ///< Progress file (--progress)
    const char* level_key = nullptr;     ///< Level to practice (--level)

    bool list_levels = false;    ///< Print levels and exit (--list)
    bool check_levels = false;   ///< Report unmapped lines and exit (--check)
    bool reset_progress = false; ///< Clear all progress and exit (--reset)
    bool unlock_all = false;     ///< Unlock every level (--unlock-all)
    bool no_color = false;       ///< Disable ANSI colors (--no-color)
    bool memory_progress = false; ///< Keep progress in memory only (--test)

    int verbosity = 0; ///< -v count
};

/**
 * @brief Get global runtime configuration
 * @return Reference to the global runtime configuration
 */
const RuntimeConfig& get_runtime_config();

/**
 * @brief Get mutable runtime configuration (for initialization only)
 * @return Pointer to the global runtime configuration
 */
RuntimeConfig* get_mutable_runtime_config();

#endif // RUNTIME_CONFIG_H
