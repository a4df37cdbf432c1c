#pragma once

#include "fcat/catalog/store.hpp"
#include "fcat/core/result.hpp"
#include "fcat/events/event_bus.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_set>

namespace fcat::ingest {

struct CleanupSummary {
    std::size_t files_deleted = 0;
    std::size_t files_protected = 0;
};

/**
 * @brief Retires catalog entries whose files were not seen by the last walk
 *
 * An entry is protected, and never retired, when its status is not
 * unreviewed, when a note is attached to it, or when any finding of the
 * case links it. Retiring means soft-deleting: rows are never removed.
 *
 * Id lists are bound in slices of at most max_params_per_statement, and
 * all soft deletes of one call share a single transaction.
 */
class OrphanCleanup {
public:
    static constexpr std::size_t kMaxSourcePathLength = 4096;

    OrphanCleanup(catalog::CatalogStore& store, events::EventBus& bus, std::size_t max_params_per_statement = 900);

    /**
     * @brief Soft-delete unprotected live entries of a source missing from walked_paths
     *
     * VALIDATION (before any mutation):
     * - case_id is a UUID of an existing case
     * - source_path is non-empty, at most 4096 characters, registered for
     *   the case, and local
     */
    Result<CleanupSummary> cleanup(const std::string& case_id,
                                   const std::string& source_path,
                                   const std::unordered_set<std::string>& walked_paths,
                                   std::int64_t deleted_at);

private:
    Result<void> validate(const std::string& case_id, const std::string& source_path);

    catalog::CatalogStore& store_;
    events::EventBus& bus_;
    std::size_t max_params_;
};

} // namespace fcat::ingest
