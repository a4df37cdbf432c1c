/**
 * @file components.hpp
 * @brief Subscribers attached to the catalog event bus
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * CacheInvalidationComponent invalidation(bus, cache);
 *
 * Components subscribe in their constructor and must outlive any emit on
 * the bus they are attached to.
 */

#pragma once

#include "fcat/catalog/types.hpp"
#include "fcat/events/event_bus.hpp"
#include "fcat/events/events.hpp"
#include "fcat/ingest/staleness_cache.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace fcat::events {

/**
 * @brief Logs every catalog mutation and sync pass through spdlog
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<EntryInsertedEvent>([this](const EntryInsertedEvent& e) {
            on_entry_inserted(e);
        });

        bus_.subscribe<EntryUpdatedEvent>([this](const EntryUpdatedEvent& e) {
            on_entry_updated(e);
        });

        bus_.subscribe<EntriesSoftDeletedEvent>([this](const EntriesSoftDeletedEvent& e) {
            on_entries_soft_deleted(e);
        });

        bus_.subscribe<DuplicateMemberAddedEvent>([this](const DuplicateMemberAddedEvent& e) {
            on_duplicate_member_added(e);
        });

        bus_.subscribe<SyncStartedEvent>([this](const SyncStartedEvent& e) {
            on_sync_started(e);
        });

        bus_.subscribe<SyncCompletedEvent>([this](const SyncCompletedEvent& e) {
            on_sync_completed(e);
        });
    }

private:
    void on_entry_inserted(const EntryInsertedEvent& e) {
        spdlog::debug("[EntryInserted] id={} path={} size={} hash={}",
            e.entry.id,
            e.entry.absolute_path,
            e.entry.file_size,
            e.entry.file_hash.value_or("-"));
    }

    void on_entry_updated(const EntryUpdatedEvent& e) {
        if (e.renamed) {
            spdlog::info("[EntryRenamed] id={} from={} to={}", e.entry.id, e.previous_path, e.entry.absolute_path);
            return;
        }
        spdlog::debug("[EntryUpdated] id={} path={} old_hash={} new_hash={} status={}->{}",
            e.entry.id,
            e.entry.absolute_path,
            e.previous_hash.value_or("-"),
            e.entry.file_hash.value_or("-"),
            catalog::to_string(e.previous_status),
            catalog::to_string(e.entry.status));
    }

    void on_entries_soft_deleted(const EntriesSoftDeletedEvent& e) {
        spdlog::info("[EntriesSoftDeleted] case={} source={} deleted={} protected={}",
            e.case_id, e.source_path, e.entry_ids.size(), e.protected_count);
    }

    void on_duplicate_member_added(const DuplicateMemberAddedEvent& e) {
        spdlog::debug("[DuplicateMemberAdded] case={} group={} entry={} new_group={}",
            e.case_id, e.group_id, e.entry_id, e.group_created);
    }

    void on_sync_started(const SyncStartedEvent& e) {
        spdlog::info("[SyncStarted] case={} source={}", e.case_id, e.source_path);
    }

    void on_sync_completed(const SyncCompletedEvent& e) {
        spdlog::info("[SyncCompleted] case={} source={} inserted={} updated={} skipped={} failed={} duration={}ms",
            e.case_id, e.source_path, e.files_inserted, e.files_updated,
            e.files_skipped, e.files_failed, e.duration.count());
    }

    EventBus& bus_;
};

/**
 * @brief Counts catalog mutations for reporting
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // after a few sync passes...
 * metrics.print_stats();
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> entries_inserted{0};
        std::atomic<uint64_t> entries_updated{0};
        std::atomic<uint64_t> entries_renamed{0};
        std::atomic<uint64_t> entries_soft_deleted{0};
        std::atomic<uint64_t> entries_protected{0};
        std::atomic<uint64_t> bytes_ingested{0};
        std::atomic<uint64_t> duplicate_members_added{0};
        std::atomic<uint64_t> duplicate_groups_created{0};
        std::atomic<uint64_t> sync_passes{0};
        std::atomic<uint64_t> files_failed{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<EntryInsertedEvent>([this](const EntryInsertedEvent& e) {
            stats_.entries_inserted++;
            stats_.bytes_ingested += static_cast<uint64_t>(e.entry.file_size);
        });

        bus_.subscribe<EntryUpdatedEvent>([this](const EntryUpdatedEvent& e) {
            if (e.renamed) {
                stats_.entries_renamed++;
            } else {
                stats_.entries_updated++;
            }
        });

        bus_.subscribe<EntriesSoftDeletedEvent>([this](const EntriesSoftDeletedEvent& e) {
            stats_.entries_soft_deleted += e.entry_ids.size();
            stats_.entries_protected += e.protected_count;
        });

        bus_.subscribe<DuplicateMemberAddedEvent>([this](const DuplicateMemberAddedEvent& e) {
            stats_.duplicate_members_added++;
            if (e.group_created) {
                stats_.duplicate_groups_created++;
            }
        });

        bus_.subscribe<SyncCompletedEvent>([this](const SyncCompletedEvent& e) {
            stats_.sync_passes++;
            stats_.files_failed += e.files_failed;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Catalog Statistics:");
        spdlog::info("  Sync passes:      {}", stats_.sync_passes.load());
        spdlog::info("  Entries inserted: {}", stats_.entries_inserted.load());
        spdlog::info("  Entries updated:  {}", stats_.entries_updated.load());
        spdlog::info("  Entries renamed:  {}", stats_.entries_renamed.load());
        spdlog::info("  Soft-deleted:     {}", stats_.entries_soft_deleted.load());
        spdlog::info("  Protected:        {}", stats_.entries_protected.load());
        spdlog::info("  Bytes ingested:   {}", stats_.bytes_ingested.load());
        spdlog::info("  Duplicate groups: {}", stats_.duplicate_groups_created.load());
        spdlog::info("  Files failed:     {}", stats_.files_failed.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    EventBus& bus_;
    Stats stats_;
};

/**
 * @brief Drops cached staleness verdicts of entries the catalog just changed
 */
class CacheInvalidationComponent {
public:
    CacheInvalidationComponent(EventBus& bus, ingest::StalenessCache& cache) : bus_(bus), cache_(cache) {
        bus_.subscribe<EntryUpdatedEvent>([this](const EntryUpdatedEvent& e) {
            cache_.invalidate(e.entry.id);
        });

        bus_.subscribe<EntriesSoftDeletedEvent>([this](const EntriesSoftDeletedEvent& e) {
            for (const auto& id : e.entry_ids) {
                cache_.invalidate(id);
            }
        });
    }

private:
    EventBus& bus_;
    ingest::StalenessCache& cache_;
};

} // namespace fcat::events
