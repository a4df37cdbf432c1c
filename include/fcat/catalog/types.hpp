#pragma once

/**
 * @file types.hpp
 * @brief Catalog record types shared by the store and the ingestion engine
 *
 * TIMESTAMPS:
 * Every *_at field is Unix seconds. File timestamps come from the
 * filesystem; added_at/updated_at/deleted_at are catalog bookkeeping.
 *
 * IDENTITY:
 * A CatalogEntry is identified by its id, never by its path. A rename
 * rewrites absolute_path/file_name/folder_path and keeps the id, so
 * status, notes and finding links follow the file.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fcat::catalog {

/**
 * @brief Review lifecycle of a catalog entry
 *
 * unreviewed -> in_progress -> reviewed | flagged -> finalized
 */
enum class LifecycleStatus {
    Unreviewed,
    InProgress,
    Reviewed,
    Flagged,
    Finalized
};

const char* to_string(LifecycleStatus status);
std::optional<LifecycleStatus> parse_status(std::string_view text);

/// Reviewed, flagged and finalized entries always get a content check.
bool is_critical(LifecycleStatus status);

/// Reviewed and flagged fall back to in_progress when their content changes.
LifecycleStatus demote_on_change(LifecycleStatus status);

enum class SourceLocation {
    Local,
    Remote
};

const char* to_string(SourceLocation location);
std::optional<SourceLocation> parse_location(std::string_view text);

/// Absolute, lexically normalised directory path without a trailing separator.
std::string normalize_local_path(const std::string& path);

struct CaseRecord {
    std::string id;
    std::string name;
    std::int64_t created_at = 0;
};

/**
 * @brief A registered origin of files for a case
 *
 * Remote sources are opaque descriptors: they are listed but never walked,
 * hashed, grouped or cleaned.
 */
struct CaseSource {
    std::string id;
    std::string case_id;
    std::string source_path;
    std::string source_type = "folder";
    SourceLocation location = SourceLocation::Local;
    std::int64_t added_at = 0;
};

struct CatalogEntry {
    std::string id;
    std::string case_id;
    std::string file_name;
    std::string folder_path;                  ///< Relative to source root, '/'-separated, empty at root
    std::string absolute_path;
    std::optional<std::string> file_hash;     ///< SHA-256, lowercase hex
    std::string file_type;                    ///< Upper-case extension without the dot
    std::int64_t file_size = 0;
    std::int64_t created_at = 0;
    std::int64_t modified_at = 0;
    std::int64_t added_at = 0;
    std::int64_t updated_at = 0;
    LifecycleStatus status = LifecycleStatus::Unreviewed;
    std::vector<std::string> tags;
    std::string source_directory;
    std::optional<std::int64_t> deleted_at;

    bool is_deleted() const { return deleted_at.has_value(); }
};

/// One row for a batched insert or update: the entry plus its enrichment record.
struct EntryWrite {
    CatalogEntry entry;
    std::string inventory_json;
    std::int64_t scanned_at = 0;
};

struct DuplicateMember {
    std::string group_id;
    std::string file_id;
    std::string absolute_path;
    bool is_primary = false;
    std::int64_t created_at = 0;
};

} // namespace fcat::catalog
