#pragma once

#include "fcat/catalog/store.hpp"
#include "fcat/core/result.hpp"
#include "fcat/ingest/fingerprint.hpp"
#include "fcat/ingest/staleness_cache.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace fcat::ingest {

/**
 * @brief Detailed comparison of an entry with its file on disk
 */
struct FileChangeStatus {
    bool changed = false;
    bool file_exists = false;
    std::optional<std::int64_t> current_size;       ///< Absent when the file is gone
    std::optional<std::int64_t> current_modified;
    std::int64_t stored_size = 0;
    std::int64_t stored_modified = 0;
    bool hash_changed = false;
};

/**
 * @brief Answers "is this catalog entry still accurate?"
 *
 * check() goes through the cache; inspect() always looks at the disk.
 * A hash is computed only when the entry has a stored one and either its
 * size/mtime moved or its status is critical. Unknown and soft-deleted
 * ids are NotFound errors.
 */
class StalenessVerifier {
public:
    StalenessVerifier(catalog::CatalogStore& store, const Fingerprinter& fingerprinter, StalenessCache& cache);

    Result<Staleness> check(const std::string& entry_id);

    Result<FileChangeStatus> inspect(const std::string& entry_id);

private:
    Result<catalog::CatalogEntry> load_live(const std::string& entry_id);
    Result<FileChangeStatus> compare(const catalog::CatalogEntry& entry);

    catalog::CatalogStore& store_;
    const Fingerprinter& fingerprinter_;
    StalenessCache& cache_;
};

} // namespace fcat::ingest
