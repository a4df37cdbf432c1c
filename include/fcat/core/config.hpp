#pragma once

/**
 * @file config.hpp
 * @brief Engine configuration loaded from a JSON file
 *
 * Every key is optional; absent keys keep the defaults below and unknown
 * keys are ignored. Command-line flags of the tools override loaded values.
 *
 * EXAMPLE FILE:
 * {
 *   "database_path": "/var/lib/fcat/catalog.db",
 *   "log_level": "debug",
 *   "worker_threads": 8,
 *   "staleness_ttl_ms": 5000
 * }
 */

#include "fcat/core/result.hpp"

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace fcat::core {

struct Config {
    std::string database_path = "fcat.db";
    std::string log_level = "info";
    std::string log_file;                               ///< Empty: console only

    std::size_t worker_threads = 0;                     ///< 0: derived from hardware concurrency
    std::size_t walker_threads = 4;
    std::size_t hash_buffer_size = 64 * 1024;

    std::chrono::milliseconds staleness_ttl{5000};
    std::size_t staleness_cache_max_entries = 1000;

    std::size_t max_params_per_statement = 900;         ///< SQLite host parameter ceiling per statement
    bool cleanup_orphans = true;

    /**
     * @brief Classification pool width
     *
     * Twice the hardware concurrency when unset, clamped to [1, 64].
     */
    std::size_t effective_worker_threads() const;

    static Result<Config> load(const std::filesystem::path& path);
    static Result<Config> from_json(const nlohmann::json& document);

    Result<void> validate() const;
};

} // namespace fcat::core
