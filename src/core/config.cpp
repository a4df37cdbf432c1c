#include "fcat/core/config.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <fstream>
#include <thread>

namespace fcat::core {
namespace {

using json = nlohmann::json;

constexpr std::size_t kMaxWorkerThreads = 64;
constexpr std::size_t kSqliteMaxParams = 32766;

constexpr std::array<const char*, 7> kLogLevels = {
    "trace", "debug", "info", "warn", "error", "critical", "off"
};

} // namespace

std::size_t Config::effective_worker_threads() const {
    std::size_t threads = worker_threads;
    if (threads == 0) {
        threads = static_cast<std::size_t>(std::thread::hardware_concurrency()) * 2;
    }
    return std::clamp<std::size_t>(threads, 1, kMaxWorkerThreads);
}

Result<Config> Config::load(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<Config>(Error::config("Cannot open config file: " + path.string()));
    }

    auto document = json::parse(input, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        return Err<Config>(Error::config("Config file is not a JSON object: " + path.string()));
    }
    return from_json(document);
}

Result<Config> Config::from_json(const json& document) {
    Config config;
    try {
        config.database_path = document.value("database_path", config.database_path);
        config.log_level = document.value("log_level", config.log_level);
        config.log_file = document.value("log_file", config.log_file);
        config.worker_threads = document.value("worker_threads", config.worker_threads);
        config.walker_threads = document.value("walker_threads", config.walker_threads);
        config.hash_buffer_size = document.value("hash_buffer_size", config.hash_buffer_size);
        config.staleness_ttl = std::chrono::milliseconds(
            document.value("staleness_ttl_ms", static_cast<std::int64_t>(config.staleness_ttl.count())));
        config.staleness_cache_max_entries =
            document.value("staleness_cache_max_entries", config.staleness_cache_max_entries);
        config.max_params_per_statement =
            document.value("max_params_per_statement", config.max_params_per_statement);
        config.cleanup_orphans = document.value("cleanup_orphans", config.cleanup_orphans);
    } catch (const json::exception& e) {
        return Err<Config>(Error::config(std::string("Invalid config value: ") + e.what()));
    }

    auto valid = config.validate();
    if (valid.is_error()) {
        return Err<Config>(valid.error());
    }
    return Ok(std::move(config));
}

Result<void> Config::validate() const {
    if (database_path.empty()) {
        return Err<void>(Error::config("database_path must not be empty"));
    }
    if (std::find(kLogLevels.begin(), kLogLevels.end(), log_level) == kLogLevels.end()) {
        return Err<void>(Error::config("Unknown log_level: " + log_level));
    }
    if (walker_threads == 0 || walker_threads > kMaxWorkerThreads) {
        return Err<void>(Error::config("walker_threads must be within [1, 64]"));
    }
    if (worker_threads > kMaxWorkerThreads) {
        return Err<void>(Error::config("worker_threads must be within [0, 64]"));
    }
    if (hash_buffer_size < 4096) {
        return Err<void>(Error::config("hash_buffer_size must be at least 4096 bytes"));
    }
    if (staleness_ttl.count() < 0) {
        return Err<void>(Error::config("staleness_ttl_ms must not be negative"));
    }
    if (staleness_cache_max_entries == 0) {
        return Err<void>(Error::config("staleness_cache_max_entries must be positive"));
    }
    if (max_params_per_statement == 0 || max_params_per_statement > kSqliteMaxParams) {
        return Err<void>(Error::config("max_params_per_statement must be within [1, 32766]"));
    }
    return Ok();
}

} // namespace fcat::core
