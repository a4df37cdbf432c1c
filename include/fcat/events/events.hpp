/**
 * @file events.hpp
 * @brief Event types emitted by the ingestion engine
 *
 * WHY THIS FILE EXISTS:
 * The orchestrator, grouper and cleanup publish what they did to the
 * catalog; logging, metrics and cache invalidation subscribe without the
 * publishers knowing about them.
 *
 * NAMING CONVENTION:
 * - Events are past-tense: EntryInsertedEvent, EntriesSoftDeletedEvent
 * - Events are emitted only after the owning transaction committed
 */

#pragma once

#include "fcat/catalog/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fcat::events {

// ════════════════════════════════════════════════════════
// Catalog Events
// ════════════════════════════════════════════════════════

/**
 * @brief A walked file entered the catalog
 *
 * WHO EMITS: SyncOrchestrator (insert phase)
 * WHO SUBSCRIBES: Logger, Metrics
 */
struct EntryInsertedEvent {
    catalog::CatalogEntry entry;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

/**
 * @brief An existing entry was rewritten (content change, rename or refresh)
 *
 * WHO EMITS: SyncOrchestrator (update phase, refresh)
 * WHO SUBSCRIBES: Logger, Metrics, cache invalidation
 */
struct EntryUpdatedEvent {
    catalog::CatalogEntry entry;                ///< State after the update
    std::string previous_path;
    std::optional<std::string> previous_hash;
    catalog::LifecycleStatus previous_status = catalog::LifecycleStatus::Unreviewed;
    bool renamed = false;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

/**
 * @brief Entries whose files vanished were soft-deleted
 *
 * WHO EMITS: OrphanCleanup
 * WHO SUBSCRIBES: Logger, Metrics, cache invalidation
 */
struct EntriesSoftDeletedEvent {
    std::string case_id;
    std::string source_path;
    std::vector<std::string> entry_ids;
    std::size_t protected_count = 0;
    std::int64_t deleted_at = 0;
};

/**
 * @brief A new member joined a duplicate group (group created if needed)
 */
struct DuplicateMemberAddedEvent {
    std::string case_id;
    std::string group_id;
    std::string entry_id;
    bool group_created = false;
};

// ════════════════════════════════════════════════════════
// Sync Pass Events
// ════════════════════════════════════════════════════════

struct SyncStartedEvent {
    std::string case_id;
    std::string source_path;
};

struct SyncCompletedEvent {
    std::string case_id;
    std::string source_path;
    std::size_t files_inserted = 0;
    std::size_t files_updated = 0;
    std::size_t files_skipped = 0;
    std::size_t files_failed = 0;
    std::chrono::milliseconds duration{0};
};

} // namespace fcat::events
