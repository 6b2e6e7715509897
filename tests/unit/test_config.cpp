// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cache_settings.h"
#include "config.h"

#include "../test_fixtures.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include <catch2/catch_test_macros.hpp>

namespace fs = std::filesystem;

namespace thumbkit {

// Test fixture for Config class testing
class ConfigTestFixture : public TempDirFixture {
  protected:
    Config config;

    std::string config_path() const {
        return (temp_dir_ / "thumbkit.json").string();
    }

    void write_config(const std::string& text) {
        std::ofstream f(config_path());
        f << text;
    }

    json read_back() const {
        std::ifstream f(config_path());
        return json::parse(f);
    }

    void set_data(const json& j) {
        config.data = j;
    }

    json& data() {
        return config.data;
    }
};

} // namespace thumbkit

using namespace thumbkit;

// ============================================================================
// get() with and without default
// ============================================================================

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() returns existing values",
                 "[core][config][get]") {
    set_data(get_default_config());

    REQUIRE(config.get<int>("/cache/max_size") == 1000);
    REQUIRE(config.get<std::string>("/network/user_agent") == "thumbkit/1.0");
    REQUIRE(config.get<int>("/loader/min_launch_interval_ms") == 30);
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() with default for missing path",
                 "[core][config][get]") {
    set_data(get_default_config());

    REQUIRE(config.get<int>("/cache/nonexistent", 42) == 42);
    REQUIRE(config.get<std::string>("/missing/deeply/nested", "fallback") == "fallback");
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() with default for wrong type",
                 "[core][config][get]") {
    set_data({{"cache", {{"max_size", "lots"}}}});

    REQUIRE(config.get<int>("/cache/max_size", 1000) == 1000);
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() without default throws on wrong type",
                 "[core][config][get]") {
    set_data({{"cache", {{"max_size", "lots"}}}});

    REQUIRE_THROWS_AS(config.get<int>("/cache/max_size"), json::exception);
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: set() creates intermediate objects",
                 "[core][config][set]") {
    set_data(json::object());

    config.set<int>("/network/timeout_sec", 12);
    config.set<std::string>("/cache/directory", "/var/cache/thumbs");

    REQUIRE(config.get<int>("/network/timeout_sec") == 12);
    REQUIRE(data()["cache"]["directory"] == "/var/cache/thumbs");
    REQUIRE(config.get_json("/network").is_object());
}

// ============================================================================
// init()
// ============================================================================

TEST_CASE_METHOD(ConfigTestFixture, "Config: init() creates missing file with defaults",
                 "[core][config][init]") {
    config.init(config_path());

    REQUIRE(fs::exists(config_path()));
    REQUIRE(config.get_path() == config_path());
    REQUIRE(read_back() == get_default_config());
    REQUIRE(config.get<int>("/network/concurrent_downloads") == 5);
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: init() keeps user values and fills missing keys",
                 "[core][config][init]") {
    write_config(R"({"cache": {"max_size": 4096}, "custom": true})");

    config.init(config_path());

    REQUIRE(config.get<int>("/cache/max_size") == 4096);
    REQUIRE(config.get<int>("/cache/max_memory") == 200);
    REQUIRE(config.get<bool>("/custom"));
    REQUIRE(config.get<std::string>("/log_level") == "warn");

    json saved = read_back();
    REQUIRE(saved["cache"]["max_size"] == 4096);
    REQUIRE(saved["network"]["timeout_sec"] == 30);
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: corrupt file is moved aside and replaced",
                 "[core][config][init]") {
    SECTION("unparseable JSON") {
        write_config("{ this is not json");
    }
    SECTION("top-level array") {
        write_config("[1, 2, 3]");
    }

    config.init(config_path());

    REQUIRE(fs::exists(config_path() + ".corrupt"));
    REQUIRE(read_back() == get_default_config());
    REQUIRE(config.get<int>("/cache/max_size") == 1000);
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: save() then init() round-trips values",
                 "[core][config][save]") {
    config.init(config_path());
    config.set<int>("/cache/max_memory", 512);
    REQUIRE(config.save());

    Config reloaded;
    reloaded.init(config_path());
    REQUIRE(reloaded.get<int>("/cache/max_memory") == 512);
    REQUIRE_FALSE(fs::exists(config_path() + ".tmp"));
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: save() fails for unwritable location",
                 "[core][config][save]") {
    config.init((temp_dir_ / "missing_dir_file" / "x" / "thumbkit.json").string());
    fs::remove_all(temp_dir_ / "missing_dir_file");
    REQUIRE_FALSE(config.save());
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: reset_to_defaults() discards changes",
                 "[core][config]") {
    config.init(config_path());
    config.set<int>("/cache/max_size", 9999);
    config.reset_to_defaults();
    REQUIRE(config.get<int>("/cache/max_size") == 1000);
}

// ============================================================================
// merge_missing_defaults()
// ============================================================================

TEST_CASE("Config: merge_missing_defaults adds only absent keys", "[core][config]") {
    json target = {{"a", 1}, {"nested", {{"x", "keep"}}}, {"typed", "string"}};
    json defaults = {{"a", 2}, {"b", 3}, {"nested", {{"x", "default"}, {"y", 4}}}, {"typed", 5}};

    REQUIRE(merge_missing_defaults(target, defaults));
    REQUIRE(target["a"] == 1);
    REQUIRE(target["b"] == 3);
    REQUIRE(target["nested"]["x"] == "keep");
    REQUIRE(target["nested"]["y"] == 4);
    REQUIRE(target["typed"] == "string");

    REQUIRE_FALSE(merge_missing_defaults(target, defaults));
}

// ============================================================================
// CacheSettings
// ============================================================================

TEST_CASE_METHOD(ConfigTestFixture, "CacheSettings: reads config and applies limits",
                 "[core][config][cache_settings]") {
    unsetenv("THUMBKIT_CACHE_DIR");
    const std::string cache_dir = (temp_dir_ / "cache").string();

    json j = get_default_config();
    j["cache"]["directory"] = cache_dir;
    j["cache"]["max_size"] = 10;
    j["cache"]["max_memory"] = 300;
    j["network"]["concurrent_downloads"] = 500;
    j["network"]["user_agent"] = "custom/2.0";
    j["loader"]["min_launch_interval_ms"] = -5;
    set_data(j);

    CacheSettings s = CacheSettings::from_config(config);
    REQUIRE(s.cache_dir == cache_dir);
    REQUIRE(s.thumbnails_dir == cache_dir + "/thumbnail");
    REQUIRE(s.max_disk_mb == TieredCache::MIN_DISK_MB);
    REQUIRE(s.max_memory_mb == 300);
    REQUIRE(s.concurrent_downloads == 64);
    REQUIRE(s.user_agent == "custom/2.0");
    REQUIRE(s.min_launch_interval_ms == 0);

    TieredCacheOptions opts = s.cache_options();
    REQUIRE(opts.max_memory_bytes == 300ull * 1024 * 1024);
    REQUIRE(opts.max_disk_bytes == TieredCache::MIN_DISK_MB * 1024 * 1024);
    REQUIRE(s.dispatcher_options().max_concurrent == 64);
}

TEST_CASE_METHOD(ConfigTestFixture, "CacheSettings: environment override wins over config",
                 "[core][config][cache_settings]") {
    const std::string env_dir = (temp_dir_ / "from_env").string();
    setenv("THUMBKIT_CACHE_DIR", env_dir.c_str(), 1);

    REQUIRE(resolve_cache_dir((temp_dir_ / "from_config").string()) == env_dir);
    REQUIRE(fs::is_directory(env_dir));

    unsetenv("THUMBKIT_CACHE_DIR");
    REQUIRE(resolve_cache_dir((temp_dir_ / "from_config").string()) ==
            (temp_dir_ / "from_config").string());
}

TEST_CASE_METHOD(ConfigTestFixture, "CacheSettings: XDG cache home used when nothing configured",
                 "[core][config][cache_settings]") {
    unsetenv("THUMBKIT_CACHE_DIR");
    const char* old_xdg = std::getenv("XDG_CACHE_HOME");
    std::string saved = old_xdg ? old_xdg : "";

    setenv("XDG_CACHE_HOME", temp_dir_.c_str(), 1);
    REQUIRE(resolve_cache_dir("") == temp_dir_.string() + "/thumbkit");

    if (old_xdg) {
        setenv("XDG_CACHE_HOME", saved.c_str(), 1);
    } else {
        unsetenv("XDG_CACHE_HOME");
    }
}
