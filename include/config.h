// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "spdlog/spdlog.h"

#include <string>

#include "hv/json.hpp"

using json = nlohmann::json;

namespace thumbkit {

/**
 * @brief Application configuration manager (singleton)
 *
 * Loads configuration from a JSON file and fills in defaults for every key
 * the file does not set. Uses JSON pointer syntax (RFC 6901) for nested
 * value access.
 *
 * Thread safety: Not thread-safe. Initialize once at startup and read from
 * the main thread.
 *
 * Example usage:
 * ```cpp
 * Config* cfg = Config::get_instance();
 * cfg->init("/home/user/.config/thumbkit/thumbkit.json");
 *
 * int max_mb = cfg->get<int>("/cache/max_size", 1000);
 * cfg->set<int>("/network/concurrent_downloads", 8);
 * cfg->save();
 * ```
 */
class Config {
  private:
    static Config* instance;
    std::string path;

  protected:
    json data;

    /// Allow test fixture to access protected members
    friend class ConfigTestFixture;

  public:
    Config();

    Config(Config& o) = delete;
    void operator=(const Config&) = delete;

    /**
     * @brief Initialize configuration from file
     *
     * Creates the file with defaults if it doesn't exist. A file that fails
     * to parse is moved aside to `<path>.corrupt` and replaced by defaults.
     * Keys missing from an existing file are filled from defaults.
     *
     * @param config_path Path to JSON configuration file
     */
    void init(const std::string& config_path);

    /**
     * @brief Get configuration value at JSON pointer path
     *
     * @throws nlohmann::json::exception if path not found
     */
    template <typename T> T get(const std::string& json_ptr) {
        return data[json::json_pointer(json_ptr)].template get<T>();
    };

    /**
     * @brief Get configuration value with default fallback
     *
     * Returns default_value if the path doesn't exist or holds a value of the
     * wrong type.
     */
    template <typename T> T get(const std::string& json_ptr, const T& default_value) {
        json::json_pointer ptr(json_ptr);
        if (!data.contains(ptr)) {
            return default_value;
        }
        try {
            return data[ptr].template get<T>();
        } catch (const json::exception& e) {
            spdlog::warn("[Config] Wrong type at {}: {}", json_ptr, e.what());
            return default_value;
        }
    };

    /**
     * @brief Set configuration value at JSON pointer path
     *
     * Creates intermediate paths. In-memory only until save() is called.
     */
    template <typename T> T set(const std::string& json_ptr, T v) {
        return data[json::json_pointer(json_ptr)] = v;
    };

    /**
     * @brief Get mutable JSON sub-object at path
     */
    json& get_json(const std::string& json_path);

    /**
     * @brief Write the configuration to disk
     *
     * Written to a temp file and renamed into place.
     *
     * @return true on success
     */
    bool save();

    /// Path of the loaded configuration file
    std::string get_path();

    /**
     * @brief Replace the configuration with defaults (in memory)
     */
    void reset_to_defaults();

    static Config* get_instance();
};

/**
 * @brief Full default configuration
 */
json get_default_config();

/**
 * @brief Recursively add keys from defaults that are missing in target
 *
 * Existing values, including ones of a different type, are left alone.
 *
 * @return true if anything was added
 */
bool merge_missing_defaults(json& target, const json& defaults);

} // namespace thumbkit
