#pragma once

#include "fcat/catalog/store.hpp"
#include "fcat/core/config.hpp"
#include "fcat/core/result.hpp"
#include "fcat/events/event_bus.hpp"
#include "fcat/ingest/change_classifier.hpp"
#include "fcat/ingest/duplicate_grouper.hpp"
#include "fcat/ingest/fingerprint.hpp"
#include "fcat/ingest/orphan_cleanup.hpp"
#include "fcat/ingest/tree_walker.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace fcat::ingest {

struct FileError {
    std::string path;
    std::string message;
};

/**
 * @brief Outcome of one sync pass (or, from sync_case, of several)
 *
 * files_updated includes renames; files_renamed breaks them out.
 * Phase errors are whole-batch failures (rolled back); their files are
 * counted in files_failed.
 */
struct SyncSummary {
    std::size_t files_inserted = 0;
    std::size_t files_updated = 0;
    std::size_t files_renamed = 0;
    std::size_t files_skipped = 0;
    std::size_t files_failed = 0;
    std::size_t total_files = 0;
    std::size_t duplicate_groups_touched = 0;
    std::vector<FileError> errors;
    std::vector<std::string> phase_errors;
    std::optional<CleanupSummary> cleanup;
    std::chrono::milliseconds duration{0};

    void merge(const SyncSummary& other);
};

struct RefreshSummary {
    std::size_t files_refreshed = 0;
    std::size_t files_failed = 0;
    std::vector<FileError> errors;
};

/**
 * @brief Runs incremental sync passes of case sources into the catalog
 *
 * PASS:
 * 1. Validate case and source (unknown local sources are registered,
 *    remote ones rejected)
 * 2. Walk the source
 * 3. Classify every file on a bounded thread pool
 * 4. Apply all inserts in one transaction, then group their duplicates
 * 5. Apply all updates in one transaction (reviewed/flagged entries
 *    whose content changed fall back to in_progress; renames keep status)
 * 6. Retire entries of files no longer present, if enabled and the walk
 *    was complete
 *
 * Per-file failures never abort the pass. A failed phase is rolled back
 * and reported; later phases still run.
 */
class SyncOrchestrator {
public:
    SyncOrchestrator(catalog::CatalogStore& store,
                     events::EventBus& bus,
                     const Fingerprinter& fingerprinter,
                     const core::Config& config);

    Result<SyncSummary> sync_source(const std::string& case_id, const std::string& source_path);

    /**
     * @brief Sync every local source registered for a case
     *
     * A source that cannot be synced is recorded in errors and the rest
     * continue; remote sources are skipped.
     */
    Result<SyncSummary> sync_case(const std::string& case_id);

    /**
     * @brief Re-read specific entries from disk
     *
     * Every id must name a live entry of the case, otherwise nothing is
     * changed. With auto_transition_status, refreshed reviewed/flagged
     * entries fall back to in_progress.
     */
    Result<RefreshSummary> refresh_entries(const std::string& case_id,
                                           const std::vector<std::string>& entry_ids,
                                           bool auto_transition_status);

    DuplicateGrouper& grouper() noexcept { return grouper_; }

private:
    Result<catalog::CaseSource> resolve_source(const std::string& case_id, const std::string& source_path);
    Result<void> require_case(const std::string& case_id);

    std::vector<Classification> classify_all(const std::string& case_id,
                                             const std::string& source_path,
                                             std::vector<WalkedFile> files,
                                             SyncSummary& summary);

    void apply_inserts(const std::string& case_id,
                       const std::string& source_path,
                       const std::vector<Classification>& inserts,
                       SyncSummary& summary);

    void apply_updates(const std::vector<Classification>& updates,
                       const std::string& source_path,
                       SyncSummary& summary);

    catalog::CatalogStore& store_;
    events::EventBus& bus_;
    const Fingerprinter& fingerprinter_;
    const core::Config& config_;

    TreeWalker walker_;
    ChangeClassifier classifier_;
    DuplicateGrouper grouper_;
    OrphanCleanup cleanup_;
};

} // namespace fcat::ingest
