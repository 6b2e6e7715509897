// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace thumbkit {

Config* Config::instance{nullptr};

json get_default_config() {
    // cache/directory empty = platform default (see CacheSettings)
    return {{"log_level", "warn"},
            {"cache",
             {{"directory", ""},
              {"thumbnails_directory", ""},
              {"max_size", 1000},
              {"max_memory", 200}}},
            {"network",
             {{"concurrent_downloads", 5}, {"timeout_sec", 30}, {"user_agent", "thumbkit/1.0"}}},
            {"loader", {{"min_launch_interval_ms", 30}}}};
}

bool merge_missing_defaults(json& target, const json& defaults) {
    if (!target.is_object() || !defaults.is_object()) {
        return false;
    }
    bool modified = false;
    for (auto it = defaults.begin(); it != defaults.end(); ++it) {
        if (!target.contains(it.key())) {
            target[it.key()] = it.value();
            modified = true;
        } else if (it.value().is_object() && target[it.key()].is_object()) {
            modified |= merge_missing_defaults(target[it.key()], it.value());
        }
    }
    return modified;
}

Config::Config() {}

Config* Config::get_instance() {
    if (instance == nullptr) {
        instance = new Config();
    }
    return instance;
}

void Config::init(const std::string& config_path) {
    path = config_path;
    struct stat buffer;

    bool config_modified = false;

    if (stat(config_path.c_str(), &buffer) == 0) {
        spdlog::info("[Config] Loading config from {}", config_path);
        std::string parse_error;
        try {
            data = json::parse(std::fstream(config_path));
            if (!data.is_object()) {
                parse_error = "top-level value is not an object";
            }
        } catch (const json::exception& e) {
            parse_error = e.what();
        }

        if (!parse_error.empty()) {
            spdlog::error("[Config] Failed to parse {}: {}", config_path, parse_error);
            spdlog::warn("[Config] Config file is corrupt, resetting to defaults");

            // Keep the corrupt file for diagnosis
            std::string backup_path = config_path + ".corrupt";
            if (std::rename(config_path.c_str(), backup_path.c_str()) == 0) {
                spdlog::info("[Config] Corrupt config backed up to {}", backup_path);
            } else {
                spdlog::warn("[Config] Could not back up corrupt config to {}", backup_path);
            }

            data = get_default_config();
            config_modified = true;
        }

        if (merge_missing_defaults(data, get_default_config())) {
            config_modified = true;
        }
    } else {
        spdlog::info("[Config] Creating default config at {}", config_path);
        data = get_default_config();
        config_modified = true;
    }

    if (config_modified) {
        fs::path config_dir = fs::path(config_path).parent_path();
        std::error_code ec;
        if (!config_dir.empty()) {
            fs::create_directories(config_dir, ec);
        }
        if (save()) {
            spdlog::debug("[Config] Saved updated config to {}", config_path);
        }
    }

    spdlog::debug("[Config] initialized: cache={} max_size={}MB concurrent={}",
                  get<std::string>("/cache/directory", ""), get<int>("/cache/max_size", 1000),
                  get<int>("/network/concurrent_downloads", 5));
}

std::string Config::get_path() {
    return path;
}

json& Config::get_json(const std::string& json_path) {
    return data[json::json_pointer(json_path)];
}

bool Config::save() {
    spdlog::trace("[Config] Saving config to {}", path);

    std::string temp_path = path + ".tmp";
    {
        std::ofstream o(temp_path);
        if (!o.is_open()) {
            spdlog::error("[Config] Failed to open config file for writing: {}", temp_path);
            return false;
        }

        o << std::setw(2) << data << std::endl;

        if (!o.good()) {
            spdlog::error("[Config] Error writing to config file: {}", temp_path);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(temp_path, path, ec);
    if (ec) {
        spdlog::error("[Config] Failed to replace {}: {}", path, ec.message());
        fs::remove(temp_path, ec);
        return false;
    }

    spdlog::trace("[Config] saved successfully to {}", path);
    return true;
}

void Config::reset_to_defaults() {
    spdlog::info("[Config] Resetting configuration to defaults");
    data = get_default_config();
}

} // namespace thumbkit
