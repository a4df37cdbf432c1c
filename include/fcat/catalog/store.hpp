#pragma once

/**
 * @file store.hpp
 * @brief Persistent catalog of cases, sources, entries and their annotations
 *
 * WHY THIS FILE EXISTS:
 * The ingestion engine never writes SQL itself. Every query it needs is a
 * named operation here, so the invariants that live in the database
 * (one live entry per path, one primary per duplicate group, soft-delete
 * only) are enforced in one place.
 *
 * HOW IT INTEGRATES:
 * - Change Classifier / Rename Resolver: find_by_path, rename_candidates
 * - Sync Orchestrator: insert_batch, update_batch (one transaction each)
 * - Duplicate Grouper: duplicate_candidates, group_exists, add_group_member
 * - Orphan Cleanup: live_entries, protection queries, soft_delete
 * - Staleness Verifier: find_by_id
 *
 * SOFT DELETE:
 * Rows are never removed. deleted_at marks an entry as gone; such entries
 * are invisible to path uniqueness, rename candidates and duplicate
 * grouping but stay addressable by id.
 *
 * THREAD SAFETY:
 * The connection is opened in serialized mode, so concurrent reads from
 * classification workers are safe. Batches that need atomicity take a
 * Transaction; only one writer is expected at a time.
 *
 * The implementation is split across store.cpp (cases, sources,
 * entries), store_annotations.cpp (status, tags, notes, findings,
 * protection) and store_groups.cpp (duplicate groups).
 */

#include "fcat/catalog/database.hpp"
#include "fcat/catalog/types.hpp"
#include "fcat/core/result.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace fcat::catalog {

class CatalogStore {
public:
    /**
     * @brief Open a catalog file (or ":memory:") and apply pending migrations
     */
    static Result<std::unique_ptr<CatalogStore>> open(const std::string& path);

    explicit CatalogStore(std::unique_ptr<Database> db);

    CatalogStore(const CatalogStore&) = delete;
    CatalogStore& operator=(const CatalogStore&) = delete;

    Database& database() noexcept { return *db_; }
    Result<Transaction> begin() { return Transaction::begin(*db_); }

    // ════════════════════════════════════════════════════════
    // Cases and sources
    // ════════════════════════════════════════════════════════

    Result<CaseRecord> create_case(const std::string& name);
    Result<std::optional<CaseRecord>> find_case(const std::string& case_id);

    /**
     * @brief Register a source for a case
     *
     * Registering an already known (case, path) pair returns the existing
     * record unchanged.
     */
    Result<CaseSource> add_source(const std::string& case_id,
                                  const std::string& source_path,
                                  SourceLocation location,
                                  const std::string& source_type = "folder");

    Result<std::optional<CaseSource>> find_source(const std::string& case_id,
                                                  const std::string& source_path);

    /// Sources of a case ordered by registration time.
    Result<std::vector<CaseSource>> list_sources(const std::string& case_id);

    // ════════════════════════════════════════════════════════
    // Entries
    // ════════════════════════════════════════════════════════

    /**
     * @brief Entry recorded at a path
     *
     * A live entry wins; otherwise the most recently soft-deleted one is
     * returned so callers can recognise user-removed files.
     */
    Result<std::optional<CatalogEntry>> find_by_path(const std::string& case_id,
                                                     const std::string& absolute_path);

    /// Any entry by id, soft-deleted ones included.
    Result<std::optional<CatalogEntry>> find_by_id(const std::string& entry_id);

    /**
     * @brief Live entries of the same case, source and content at another path
     *
     * Ordered by added_at, then absolute_path.
     */
    Result<std::vector<CatalogEntry>> rename_candidates(const std::string& case_id,
                                                        const std::string& source_directory,
                                                        const std::string& file_hash,
                                                        const std::string& exclude_path);

    Result<std::vector<CatalogEntry>> live_entries(const std::string& case_id,
                                                   const std::string& source_directory);

    /// Live entries of a case sharing a fingerprint, ordered by added_at, path.
    Result<std::vector<CatalogEntry>> live_entries_by_hash(const std::string& case_id,
                                                           const std::string& file_hash);

    Result<std::int64_t> count_live(const std::string& case_id);

    /// Stored enrichment JSON of an entry, if any.
    Result<std::optional<std::string>> inventory(const std::string& entry_id);

    /**
     * @brief Insert entries and their enrichment records atomically
     *
     * Either every row is written or none is.
     */
    Result<void> insert_batch(const std::vector<EntryWrite>& writes);

    /**
     * @brief Rewrite live entries (content, location and status) atomically
     *
     * Fails, rolling back the whole batch, if any target entry is no longer
     * live.
     */
    Result<void> update_batch(const std::vector<EntryWrite>& writes);

    /**
     * @brief Mark live entries as deleted
     *
     * Issues one statement; callers keep ids within the statement
     * parameter limit and own the surrounding transaction.
     *
     * RETURNS: rows affected
     */
    Result<std::int64_t> soft_delete(const std::vector<std::string>& entry_ids, std::int64_t deleted_at);

    // ════════════════════════════════════════════════════════
    // Annotations and protection
    // ════════════════════════════════════════════════════════

    Result<void> set_status(const std::string& entry_id, LifecycleStatus status);
    Result<void> set_tags(const std::string& entry_id, std::vector<std::string> tags);

    Result<std::string> add_note(const std::string& case_id,
                                 const std::string& entry_id,
                                 const std::string& content);

    Result<std::string> add_finding(const std::string& case_id,
                                    const std::string& title,
                                    const std::vector<std::string>& linked_entry_ids);

    /// Subset of ids whose status is not unreviewed (one statement).
    Result<std::unordered_set<std::string>> ids_with_review_status(const std::vector<std::string>& entry_ids);

    /// Subset of ids with at least one note (one statement).
    Result<std::unordered_set<std::string>> ids_with_notes(const std::vector<std::string>& entry_ids);

    /// Every entry id referenced by any finding of the case.
    Result<std::unordered_set<std::string>> finding_linked_ids(const std::string& case_id);

    // ════════════════════════════════════════════════════════
    // Duplicate groups
    // ════════════════════════════════════════════════════════

    /**
     * @brief Live entries from local sources sharing a fingerprint
     *
     * Excludes exclude_id; ordered by added_at, then absolute_path.
     */
    Result<std::vector<CatalogEntry>> duplicate_candidates(const std::string& case_id,
                                                           const std::string& file_hash,
                                                           const std::string& exclude_id,
                                                           std::size_t limit);

    Result<bool> group_exists(const std::string& case_id, const std::string& group_id);

    /**
     * @brief Append a member; an existing (group, file) row is left untouched
     *
     * RETURNS: true if a row was added
     */
    Result<bool> add_group_member(const std::string& case_id,
                                  const std::string& group_id,
                                  const std::string& entry_id,
                                  bool is_primary,
                                  std::int64_t created_at);

    /// Members ordered primary first, then by absolute_path.
    Result<std::vector<DuplicateMember>> group_members(const std::string& case_id,
                                                       const std::string& group_id);

    Result<std::int64_t> count_groups(const std::string& case_id);

private:
    static const char* entry_columns();
    static CatalogEntry read_entry(const Statement& stmt);

    Result<std::vector<CatalogEntry>> query_entries(Statement& stmt);

    std::unique_ptr<Database> db_;
};

} // namespace fcat::catalog
