#include "fcat/ingest/sync_orchestrator.hpp"

#include "fcat/core/clock.hpp"
#include "fcat/core/ids.hpp"
#include "fcat/events/events.hpp"
#include "fcat/ingest/enrichment.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <unordered_map>
#include <unordered_set>

namespace fs = std::filesystem;

namespace fcat::ingest {
namespace {

// Copies what the walker observed about the file onto a catalog entry.
void apply_observation(catalog::CatalogEntry& entry,
                       const WalkedFile& file,
                       const std::optional<std::string>& fingerprint) {
    entry.file_name = file.file_name;
    entry.folder_path = file.folder_path;
    entry.absolute_path = file.absolute_path.string();
    entry.file_type = file.file_type;
    entry.file_size = file.size;
    entry.modified_at = file.modified_at;
    if (fingerprint) {
        entry.file_hash = fingerprint;
    }
}

catalog::EntryWrite make_write(catalog::CatalogEntry entry,
                               const WalkedFile& file,
                               const std::string& source_path,
                               std::int64_t now) {
    catalog::EntryWrite write;
    write.inventory_json = build_inventory(file, source_path).dump();
    write.scanned_at = now;
    write.entry = std::move(entry);
    return write;
}

} // namespace

void SyncSummary::merge(const SyncSummary& other) {
    files_inserted += other.files_inserted;
    files_updated += other.files_updated;
    files_renamed += other.files_renamed;
    files_skipped += other.files_skipped;
    files_failed += other.files_failed;
    total_files += other.total_files;
    duplicate_groups_touched += other.duplicate_groups_touched;
    errors.insert(errors.end(), other.errors.begin(), other.errors.end());
    phase_errors.insert(phase_errors.end(), other.phase_errors.begin(), other.phase_errors.end());
    if (other.cleanup) {
        if (!cleanup) {
            cleanup = CleanupSummary{};
        }
        cleanup->files_deleted += other.cleanup->files_deleted;
        cleanup->files_protected += other.cleanup->files_protected;
    }
    duration += other.duration;
}

SyncOrchestrator::SyncOrchestrator(catalog::CatalogStore& store,
                                   events::EventBus& bus,
                                   const Fingerprinter& fingerprinter,
                                   const core::Config& config)
    : store_(store),
      bus_(bus),
      fingerprinter_(fingerprinter),
      config_(config),
      walker_(config.walker_threads),
      classifier_(store, fingerprinter),
      grouper_(store, bus),
      cleanup_(store, bus, config.max_params_per_statement) {}

Result<void> SyncOrchestrator::require_case(const std::string& case_id) {
    if (!core::is_valid_id(case_id)) {
        return Err<void>(Error::validation("Invalid case id: " + case_id));
    }
    auto found = store_.find_case(case_id);
    if (found.is_error()) {
        return Err<void>(found.error());
    }
    if (!found.value()) {
        return Err<void>(Error::not_found("No case " + case_id));
    }
    return Ok();
}

Result<catalog::CaseSource> SyncOrchestrator::resolve_source(const std::string& case_id,
                                                             const std::string& source_path) {
    auto existing = store_.find_source(case_id, source_path);
    if (existing.is_error()) {
        return Err<catalog::CaseSource>(existing.error());
    }
    if (existing.value()) {
        if (existing.value()->location == catalog::SourceLocation::Remote) {
            return Err<catalog::CaseSource>(
                Error::validation("Source " + source_path + " is remote and cannot be walked"));
        }
        return Ok(*existing.value());
    }
    return store_.add_source(case_id, source_path, catalog::SourceLocation::Local);
}

Result<SyncSummary> SyncOrchestrator::sync_source(const std::string& case_id, const std::string& source_path) {
    const auto started = std::chrono::steady_clock::now();

    auto known = require_case(case_id);
    if (known.is_error()) {
        return Err<SyncSummary>(known.error());
    }

    const fs::path root = normalize_root(source_path);
    const std::string source = root.string();
    if (source_path.empty() || source.size() > OrphanCleanup::kMaxSourcePathLength) {
        return Err<SyncSummary>(Error::validation("Invalid source path: '" + source_path + "'"));
    }

    // A remote descriptor is rejected before anything touches the filesystem
    for (const auto* candidate : {&source_path, &source}) {
        auto registered = store_.find_source(case_id, *candidate);
        if (registered.is_error()) {
            return Err<SyncSummary>(registered.error());
        }
        if (registered.value() && registered.value()->location == catalog::SourceLocation::Remote) {
            return Err<SyncSummary>(Error::validation("Source " + *candidate + " is remote and cannot be walked"));
        }
    }

    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return Err<SyncSummary>(Error::validation("Source is not an existing directory: " + source));
    }

    auto resolved = resolve_source(case_id, source);
    if (resolved.is_error()) {
        return Err<SyncSummary>(resolved.error());
    }

    bus_.emit(events::SyncStartedEvent{case_id, source});

    auto walked = walker_.collect(root);
    if (walked.is_error()) {
        return Err<SyncSummary>(walked.error());
    }
    auto& walk = walked.value();

    SyncSummary summary;
    summary.total_files = walk.files.size();
    for (const auto& error : walk.errors) {
        summary.errors.push_back(FileError{error.path, error.message});
    }

    std::unordered_set<std::string> seen;
    seen.reserve(walk.files.size());
    for (const auto& file : walk.files) {
        seen.insert(file.absolute_path.string());
    }

    auto outcomes = classify_all(case_id, source, std::move(walk.files), summary);

    std::vector<Classification> inserts;
    std::vector<Classification> updates;
    std::unordered_set<std::string> claimed;

    // Path matches own their entry outright; rename claims come second
    for (const auto& outcome : outcomes) {
        if (outcome.kind == ChangeKind::Update && !outcome.renamed) {
            claimed.insert(outcome.existing->id);
        }
    }

    for (auto& outcome : outcomes) {
        switch (outcome.kind) {
            case ChangeKind::Skip:
                ++summary.files_skipped;
                break;
            case ChangeKind::Insert:
                inserts.push_back(std::move(outcome));
                break;
            case ChangeKind::Update:
                if (outcome.renamed && !claimed.insert(outcome.existing->id).second) {
                    spdlog::debug("[SyncOrchestrator] entry {} already reclaimed, {} becomes a new entry",
                                  outcome.existing->id, outcome.file.absolute_path.string());
                    outcome.kind = ChangeKind::Insert;
                    outcome.renamed = false;
                    outcome.existing.reset();
                    inserts.push_back(std::move(outcome));
                } else {
                    updates.push_back(std::move(outcome));
                }
                break;
        }
    }

    apply_inserts(case_id, source, inserts, summary);
    apply_updates(updates, source, summary);

    if (config_.cleanup_orphans) {
        if (!summary.phase_errors.empty()) {
            // Entries of a rolled-back phase still sit at their old paths
            spdlog::warn("[SyncOrchestrator] {} phase(s) of {} failed, skipping cleanup",
                         summary.phase_errors.size(), source);
        } else if (walk.errors.empty()) {
            auto cleaned = cleanup_.cleanup(case_id, source, seen, core::unix_now());
            if (cleaned.is_error()) {
                spdlog::error("[SyncOrchestrator] cleanup of {} failed: {}", source, cleaned.error().message);
                summary.phase_errors.push_back("cleanup: " + cleaned.error().message);
            } else {
                summary.cleanup = cleaned.value();
            }
        } else {
            spdlog::warn("[SyncOrchestrator] walk of {} was incomplete ({} errors), skipping cleanup",
                         source, walk.errors.size());
        }
    }

    summary.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    events::SyncCompletedEvent completed{case_id, source};
    completed.files_inserted = summary.files_inserted;
    completed.files_updated = summary.files_updated;
    completed.files_skipped = summary.files_skipped;
    completed.files_failed = summary.files_failed;
    completed.duration = summary.duration;
    bus_.emit(completed);

    return Ok(std::move(summary));
}

std::vector<Classification> SyncOrchestrator::classify_all(const std::string& case_id,
                                                           const std::string& source_path,
                                                           std::vector<WalkedFile> files,
                                                           SyncSummary& summary) {
    std::sort(files.begin(), files.end(), [](const WalkedFile& lhs, const WalkedFile& rhs) {
        return lhs.absolute_path < rhs.absolute_path;
    });

    std::vector<std::optional<Result<Classification>>> results(files.size());
    {
        boost::asio::thread_pool pool(config_.effective_worker_threads());
        for (std::size_t i = 0; i < files.size(); ++i) {
            boost::asio::post(pool, [this, &results, &files, &case_id, &source_path, i]() {
                try {
                    results[i].emplace(classifier_.classify(case_id, source_path, files[i]));
                } catch (const std::exception& e) {
                    results[i].emplace(Err<Classification>(Error::fingerprint(e.what())));
                }
            });
        }
        pool.join();
    }

    std::vector<Classification> outcomes;
    outcomes.reserve(files.size());
    for (std::size_t i = 0; i < files.size(); ++i) {
        auto& result = *results[i];
        if (result.is_error()) {
            const auto path = files[i].absolute_path.string();
            spdlog::warn("[SyncOrchestrator] {}: {}", path, result.error().describe());
            summary.errors.push_back(FileError{path, result.error().message});
            ++summary.files_failed;
            continue;
        }
        outcomes.push_back(std::move(result.value()));
    }
    return outcomes;
}

void SyncOrchestrator::apply_inserts(const std::string& case_id,
                                     const std::string& source_path,
                                     const std::vector<Classification>& inserts,
                                     SyncSummary& summary) {
    if (inserts.empty()) {
        return;
    }

    const auto now = core::unix_now();
    std::vector<catalog::EntryWrite> writes;
    writes.reserve(inserts.size());

    for (const auto& outcome : inserts) {
        catalog::CatalogEntry entry;
        entry.id = core::generate_id();
        entry.case_id = case_id;
        entry.created_at = outcome.file.created_at;
        entry.added_at = now;
        entry.updated_at = now;
        entry.status = catalog::LifecycleStatus::Unreviewed;
        entry.source_directory = source_path;
        apply_observation(entry, outcome.file, outcome.fingerprint);
        writes.push_back(make_write(std::move(entry), outcome.file, source_path, now));
    }

    auto inserted = store_.insert_batch(writes);
    if (inserted.is_error()) {
        spdlog::error("[SyncOrchestrator] insert batch of {} rolled back: {}", writes.size(), inserted.error().message);
        summary.phase_errors.push_back("insert: " + inserted.error().message);
        summary.files_failed += writes.size();
        return;
    }
    summary.files_inserted += writes.size();

    std::vector<catalog::CatalogEntry> entries;
    entries.reserve(writes.size());
    for (auto& write : writes) {
        bus_.emit(events::EntryInsertedEvent{write.entry});
        entries.push_back(std::move(write.entry));
    }

    auto grouped = grouper_.group_inserted(case_id, entries);
    if (grouped.is_error()) {
        spdlog::error("[SyncOrchestrator] duplicate grouping rolled back: {}", grouped.error().message);
        summary.phase_errors.push_back("duplicate grouping: " + grouped.error().message);
        return;
    }
    summary.duplicate_groups_touched += grouped.value();
}

void SyncOrchestrator::apply_updates(const std::vector<Classification>& updates,
                                     const std::string& source_path,
                                     SyncSummary& summary) {
    if (updates.empty()) {
        return;
    }

    const auto now = core::unix_now();
    std::vector<catalog::EntryWrite> writes;
    std::vector<events::EntryUpdatedEvent> notices;
    writes.reserve(updates.size());
    notices.reserve(updates.size());

    for (const auto& outcome : updates) {
        const auto& previous = *outcome.existing;

        catalog::CatalogEntry entry = previous;
        apply_observation(entry, outcome.file, outcome.fingerprint);
        entry.updated_at = now;
        if (!outcome.renamed) {
            entry.status = catalog::demote_on_change(previous.status);
        }

        events::EntryUpdatedEvent notice;
        notice.previous_path = previous.absolute_path;
        notice.previous_hash = previous.file_hash;
        notice.previous_status = previous.status;
        notice.renamed = outcome.renamed;
        notice.entry = entry;
        notices.push_back(std::move(notice));

        writes.push_back(make_write(std::move(entry), outcome.file, source_path, now));
    }

    auto updated = store_.update_batch(writes);
    if (updated.is_error()) {
        spdlog::error("[SyncOrchestrator] update batch of {} rolled back: {}", writes.size(), updated.error().message);
        summary.phase_errors.push_back("update: " + updated.error().message);
        summary.files_failed += writes.size();
        return;
    }

    for (const auto& notice : notices) {
        if (notice.renamed) {
            ++summary.files_renamed;
        }
        bus_.emit(notice);
    }
    summary.files_updated += writes.size();
}

Result<SyncSummary> SyncOrchestrator::sync_case(const std::string& case_id) {
    auto known = require_case(case_id);
    if (known.is_error()) {
        return Err<SyncSummary>(known.error());
    }

    auto sources = store_.list_sources(case_id);
    if (sources.is_error()) {
        return Err<SyncSummary>(sources.error());
    }

    SyncSummary total;
    for (const auto& source : sources.value()) {
        if (source.location == catalog::SourceLocation::Remote) {
            spdlog::info("[SyncOrchestrator] skipping remote source {}", source.source_path);
            continue;
        }

        auto synced = sync_source(case_id, source.source_path);
        if (synced.is_error()) {
            spdlog::error("[SyncOrchestrator] source {} failed: {}", source.source_path, synced.error().describe());
            total.errors.push_back(FileError{source.source_path, synced.error().message});
            continue;
        }
        total.merge(synced.value());
    }
    return Ok(std::move(total));
}

Result<RefreshSummary> SyncOrchestrator::refresh_entries(const std::string& case_id,
                                                         const std::vector<std::string>& entry_ids,
                                                         bool auto_transition_status) {
    auto known = require_case(case_id);
    if (known.is_error()) {
        return Err<RefreshSummary>(known.error());
    }

    std::vector<catalog::CatalogEntry> targets;
    targets.reserve(entry_ids.size());
    for (const auto& id : entry_ids) {
        if (!core::is_valid_id(id)) {
            return Err<RefreshSummary>(Error::validation("Invalid entry id: " + id));
        }
        auto entry = store_.find_by_id(id);
        if (entry.is_error()) {
            return Err<RefreshSummary>(entry.error());
        }
        if (!entry.value() || entry.value()->case_id != case_id || entry.value()->is_deleted()) {
            return Err<RefreshSummary>(Error::validation("Entry " + id + " is not a live entry of case " + case_id));
        }
        targets.push_back(std::move(*entry.value()));
    }

    RefreshSummary summary;
    const auto now = core::unix_now();
    std::vector<catalog::EntryWrite> writes;
    std::vector<events::EntryUpdatedEvent> notices;

    for (const auto& previous : targets) {
        const fs::path root = previous.source_directory;
        auto observed = describe_file(previous.absolute_path, root);
        if (observed.is_error()) {
            summary.errors.push_back(FileError{previous.absolute_path, observed.error().message});
            ++summary.files_failed;
            continue;
        }

        auto hash = fingerprinter_.fingerprint(previous.absolute_path);
        if (hash.is_error()) {
            summary.errors.push_back(FileError{previous.absolute_path, hash.error().message});
            ++summary.files_failed;
            continue;
        }

        catalog::CatalogEntry entry = previous;
        apply_observation(entry, observed.value(), hash.value());
        entry.updated_at = now;
        if (auto_transition_status) {
            entry.status = catalog::demote_on_change(previous.status);
        }

        events::EntryUpdatedEvent notice;
        notice.previous_path = previous.absolute_path;
        notice.previous_hash = previous.file_hash;
        notice.previous_status = previous.status;
        notice.entry = entry;
        notices.push_back(std::move(notice));

        writes.push_back(make_write(std::move(entry), observed.value(), previous.source_directory, now));
    }

    auto updated = store_.update_batch(writes);
    if (updated.is_error()) {
        return Err<RefreshSummary>(updated.error());
    }
    for (const auto& notice : notices) {
        bus_.emit(notice);
    }

    summary.files_refreshed = writes.size();
    spdlog::info("[SyncOrchestrator] refreshed {} entries of case {} ({} failed)",
                 summary.files_refreshed, case_id, summary.files_failed);
    return Ok(std::move(summary));
}

} // namespace fcat::ingest
