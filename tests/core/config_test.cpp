#include "fcat/core/config.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using fcat::ErrorKind;
using fcat::core::Config;
using json = nlohmann::json;

namespace {

fs::path write_temp_config(const std::string& content) {
    static std::atomic<uint64_t> counter{0};
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    auto path = fs::temp_directory_path() /
                ("fcat_config_" + std::to_string(stamp ^ (counter.fetch_add(1) << 8)) + ".json");
    std::ofstream output(path, std::ios::trunc);
    output << content;
    return path;
}

} // namespace

TEST(ConfigTest, DefaultsAreValid) {
    Config config;
    EXPECT_TRUE(config.validate().is_ok());
    EXPECT_EQ(config.staleness_ttl, std::chrono::milliseconds(5000));
    EXPECT_EQ(config.staleness_cache_max_entries, 1000u);
    EXPECT_EQ(config.max_params_per_statement, 900u);
    EXPECT_TRUE(config.cleanup_orphans);
    EXPECT_GE(config.effective_worker_threads(), 1u);
    EXPECT_LE(config.effective_worker_threads(), 64u);
}

TEST(ConfigTest, LoadsOverridesAndKeepsDefaults) {
    const auto path = write_temp_config(R"({
        "database_path": "/tmp/catalog.db",
        "log_level": "debug",
        "worker_threads": 3,
        "staleness_ttl_ms": 250,
        "cleanup_orphans": false,
        "unknown_key": 42
    })");

    auto loaded = Config::load(path);
    fs::remove(path);

    ASSERT_TRUE(loaded.is_ok()) << loaded.error().message;
    const auto& config = loaded.value();
    EXPECT_EQ(config.database_path, "/tmp/catalog.db");
    EXPECT_EQ(config.log_level, "debug");
    EXPECT_EQ(config.effective_worker_threads(), 3u);
    EXPECT_EQ(config.staleness_ttl, std::chrono::milliseconds(250));
    EXPECT_FALSE(config.cleanup_orphans);
    EXPECT_EQ(config.walker_threads, 4u);
    EXPECT_EQ(config.max_params_per_statement, 900u);
}

TEST(ConfigTest, RejectsMalformedJson) {
    const auto path = write_temp_config("{ not json");
    auto loaded = Config::load(path);
    fs::remove(path);

    ASSERT_TRUE(loaded.is_error());
    EXPECT_EQ(loaded.error().kind, ErrorKind::Config);
}

TEST(ConfigTest, RejectsMissingFile) {
    auto loaded = Config::load("/nonexistent/fcat/config.json");
    ASSERT_TRUE(loaded.is_error());
    EXPECT_EQ(loaded.error().kind, ErrorKind::Config);
}

TEST(ConfigTest, RejectsWrongTypesAndRanges) {
    auto wrong_type = Config::from_json(json{{"worker_threads", "many"}});
    ASSERT_TRUE(wrong_type.is_error());
    EXPECT_EQ(wrong_type.error().kind, ErrorKind::Config);

    auto too_many_params = Config::from_json(json{{"max_params_per_statement", 100000}});
    EXPECT_TRUE(too_many_params.is_error());

    auto bad_level = Config::from_json(json{{"log_level", "chatty"}});
    EXPECT_TRUE(bad_level.is_error());

    auto no_walkers = Config::from_json(json{{"walker_threads", 0}});
    EXPECT_TRUE(no_walkers.is_error());
}
