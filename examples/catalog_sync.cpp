#include "fcat/catalog/store.hpp"
#include "fcat/core/clock.hpp"
#include "fcat/core/config.hpp"
#include "fcat/core/logging.hpp"
#include "fcat/events/components.hpp"
#include "fcat/events/event_bus.hpp"
#include "fcat/ingest/fingerprint.hpp"
#include "fcat/ingest/staleness.hpp"
#include "fcat/ingest/staleness_cache.hpp"
#include "fcat/ingest/sync_orchestrator.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <iostream>
#include <optional>
#include <string>
#include <vector>

using fcat::catalog::CatalogStore;
using fcat::catalog::SourceLocation;
using fcat::events::CacheInvalidationComponent;
using fcat::events::EventBus;
using fcat::events::LoggerComponent;
using fcat::events::MetricsComponent;
using fcat::ingest::Sha256Fingerprinter;
using fcat::ingest::StalenessCache;
using fcat::ingest::StalenessVerifier;
using fcat::ingest::SyncOrchestrator;
using fcat::ingest::SyncSummary;

using json = nlohmann::json;

namespace {

struct Options {
    std::optional<std::string> config_path;
    std::optional<std::string> database_path;
    std::optional<std::string> new_case;
    std::optional<std::string> case_id;
    std::vector<std::string> sources;
    std::vector<std::string> remote_sources;
    std::vector<std::string> refresh_ids;
    std::optional<std::string> check_id;
    std::optional<std::string> duplicates_of;
    bool no_cleanup = false;
    bool auto_transition = false;
    bool verbose = false;
};

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options]\n"
              << "  -c, --config FILE          JSON configuration file\n"
              << "  -d, --db PATH              catalog database (overrides config)\n"
              << "      --new-case NAME        create a case and use it\n"
              << "      --case ID              use an existing case\n"
              << "  -s, --source DIR           sync a local source (repeatable)\n"
              << "      --remote-source DESC   register a remote source descriptor\n"
              << "      --refresh ID           re-read one entry from disk (repeatable)\n"
              << "      --auto-transition      demote refreshed reviewed/flagged entries\n"
              << "      --check ID             report whether an entry is stale\n"
              << "      --duplicates ID        list copies of an entry\n"
              << "      --no-cleanup           keep entries of vanished files\n"
              << "  -v, --verbose              debug logging\n"
              << "Without --source, --refresh, --check or --duplicates every local source of the case is synced.\n";
}

std::optional<Options> parse_args(int argc, char* argv[]) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            options.config_path = argv[++i];
        } else if ((arg == "-d" || arg == "--db") && i + 1 < argc) {
            options.database_path = argv[++i];
        } else if (arg == "--new-case" && i + 1 < argc) {
            options.new_case = argv[++i];
        } else if (arg == "--case" && i + 1 < argc) {
            options.case_id = argv[++i];
        } else if ((arg == "-s" || arg == "--source") && i + 1 < argc) {
            options.sources.emplace_back(argv[++i]);
        } else if (arg == "--remote-source" && i + 1 < argc) {
            options.remote_sources.emplace_back(argv[++i]);
        } else if (arg == "--refresh" && i + 1 < argc) {
            options.refresh_ids.emplace_back(argv[++i]);
        } else if (arg == "--check" && i + 1 < argc) {
            options.check_id = argv[++i];
        } else if (arg == "--duplicates" && i + 1 < argc) {
            options.duplicates_of = argv[++i];
        } else if (arg == "--auto-transition") {
            options.auto_transition = true;
        } else if (arg == "--no-cleanup") {
            options.no_cleanup = true;
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else {
            return std::nullopt;
        }
    }
    if (options.new_case.has_value() == options.case_id.has_value()) {
        return std::nullopt;
    }
    return options;
}

json summary_to_json(const SyncSummary& summary) {
    json errors = json::array();
    for (const auto& error : summary.errors) {
        errors.push_back(json{{"path", error.path}, {"message", error.message}});
    }

    json body{
        {"files_inserted", summary.files_inserted},
        {"files_updated", summary.files_updated},
        {"files_renamed", summary.files_renamed},
        {"files_skipped", summary.files_skipped},
        {"files_failed", summary.files_failed},
        {"total_files", summary.total_files},
        {"duplicate_groups_touched", summary.duplicate_groups_touched},
        {"errors", errors},
        {"phase_errors", summary.phase_errors},
        {"duration_ms", summary.duration.count()},
    };
    if (summary.cleanup) {
        body["cleanup"] = json{
            {"files_deleted", summary.cleanup->files_deleted},
            {"files_protected", summary.cleanup->files_protected},
        };
    }
    return body;
}

} // namespace

int main(int argc, char* argv[]) {
    auto options = parse_args(argc, argv);
    if (!options) {
        print_usage(argv[0]);
        return 2;
    }

    fcat::core::Config config;
    if (options->config_path) {
        auto loaded = fcat::core::Config::load(*options->config_path);
        if (loaded.is_error()) {
            std::cerr << loaded.error().describe() << "\n";
            return 1;
        }
        config = loaded.value();
    }
    if (options->database_path) {
        config.database_path = *options->database_path;
    }
    if (options->no_cleanup) {
        config.cleanup_orphans = false;
    }
    if (options->verbose) {
        config.log_level = "debug";
    }

    auto logging = fcat::core::configure_logging(config);
    if (logging.is_error()) {
        std::cerr << logging.error().describe() << "\n";
        return 1;
    }

    auto opened = CatalogStore::open(config.database_path);
    if (opened.is_error()) {
        spdlog::error("Cannot open catalog: {}", opened.error().describe());
        return 1;
    }
    CatalogStore& store = *opened.value();

    std::string case_id;
    if (options->new_case) {
        auto created = store.create_case(*options->new_case);
        if (created.is_error()) {
            spdlog::error("Cannot create case: {}", created.error().describe());
            return 1;
        }
        case_id = created.value().id;
    } else {
        case_id = *options->case_id;
    }

    fcat::core::SystemClock clock;
    StalenessCache cache(clock, config.staleness_ttl, config.staleness_cache_max_entries);

    EventBus bus;
    LoggerComponent logger(bus);
    MetricsComponent metrics(bus);
    CacheInvalidationComponent invalidation(bus, cache);

    Sha256Fingerprinter fingerprinter(config.hash_buffer_size);
    SyncOrchestrator orchestrator(store, bus, fingerprinter, config);

    json output{{"case_id", case_id}};
    int exit_code = 0;

    for (const auto& descriptor : options->remote_sources) {
        auto added = store.add_source(case_id, descriptor, SourceLocation::Remote, "remote");
        if (added.is_error()) {
            spdlog::error("Cannot register remote source {}: {}", descriptor, added.error().describe());
            exit_code = 1;
        }
    }

    const bool query_only = !options->refresh_ids.empty() || options->check_id || options->duplicates_of;

    if (!options->sources.empty() || !query_only) {
        SyncSummary total;
        if (options->sources.empty()) {
            auto synced = orchestrator.sync_case(case_id);
            if (synced.is_error()) {
                spdlog::error("Sync failed: {}", synced.error().describe());
                return 1;
            }
            total = std::move(synced.value());
        }
        for (const auto& source : options->sources) {
            auto synced = orchestrator.sync_source(case_id, source);
            if (synced.is_error()) {
                spdlog::error("Sync of {} failed: {}", source, synced.error().describe());
                exit_code = 1;
                continue;
            }
            total.merge(synced.value());
        }
        output["sync"] = summary_to_json(total);
    }

    if (!options->refresh_ids.empty()) {
        auto refreshed = orchestrator.refresh_entries(case_id, options->refresh_ids, options->auto_transition);
        if (refreshed.is_error()) {
            spdlog::error("Refresh failed: {}", refreshed.error().describe());
            exit_code = 1;
        } else {
            json errors = json::array();
            for (const auto& error : refreshed.value().errors) {
                errors.push_back(json{{"path", error.path}, {"message", error.message}});
            }
            output["refresh"] = json{
                {"files_refreshed", refreshed.value().files_refreshed},
                {"files_failed", refreshed.value().files_failed},
                {"errors", errors},
            };
        }
    }

    if (options->check_id) {
        StalenessVerifier verifier(store, fingerprinter, cache);
        auto verdict = verifier.check(*options->check_id);
        auto detail = verifier.inspect(*options->check_id);
        if (verdict.is_error() || detail.is_error()) {
            const auto& error = verdict.is_error() ? verdict.error() : detail.error();
            spdlog::error("Check failed: {}", error.describe());
            exit_code = 1;
        } else {
            const auto& status = detail.value();
            output["check"] = json{
                {"entry_id", *options->check_id},
                {"staleness", fcat::ingest::to_string(verdict.value())},
                {"changed", status.changed},
                {"file_exists", status.file_exists},
                {"hash_changed", status.hash_changed},
                {"stored_size", status.stored_size},
                {"stored_modified", status.stored_modified},
                {"current_size", status.current_size ? json(*status.current_size) : json(nullptr)},
                {"current_modified", status.current_modified ? json(*status.current_modified) : json(nullptr)},
            };
        }
    }

    if (options->duplicates_of) {
        auto copies = orchestrator.grouper().find_duplicates(case_id, *options->duplicates_of);
        if (copies.is_error()) {
            spdlog::error("Duplicate lookup failed: {}", copies.error().describe());
            exit_code = 1;
        } else {
            json list = json::array();
            for (const auto& copy : copies.value()) {
                list.push_back(json{{"id", copy.id}, {"path", copy.absolute_path}});
            }
            output["duplicates"] = list;
        }
    }

    std::cout << output.dump(2) << std::endl;
    metrics.print_stats();
    return exit_code;
}
