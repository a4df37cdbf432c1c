#pragma once

#include "fcat/catalog/store.hpp"
#include "fcat/core/result.hpp"
#include "fcat/events/event_bus.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace fcat::ingest {

/**
 * @brief Maintains append-only duplicate groups keyed by fingerprint
 *
 * A group exists once two live entries from local sources share content.
 * The first materialised member (earliest added, then lowest path) is the
 * primary and is never re-elected; later copies join as non-primary.
 * Entries from remote sources are never grouped.
 */
class DuplicateGrouper {
public:
    /// Upper bound on existing copies pulled in when a group is materialised.
    static constexpr std::size_t kCandidateLimit = 100;

    DuplicateGrouper(catalog::CatalogStore& store, events::EventBus& bus);

    /**
     * @brief Attach freshly inserted entries to their groups
     *
     * Entries are processed in path order inside one transaction; an
     * inserted entry only counts as an existing copy for the entries
     * processed after it.
     *
     * RETURNS: number of distinct groups that gained members
     */
    Result<std::size_t> group_inserted(const std::string& case_id,
                                       const std::vector<catalog::CatalogEntry>& inserted);

    /// Other live entries of the case with the same content as entry_id.
    Result<std::vector<catalog::CatalogEntry>> find_duplicates(const std::string& case_id,
                                                               const std::string& entry_id);

    Result<std::vector<catalog::DuplicateMember>> members(const std::string& case_id,
                                                          const std::string& group_id);

private:
    Result<bool> is_local_source(const std::string& case_id, const std::string& source_path);

    catalog::CatalogStore& store_;
    events::EventBus& bus_;
};

} // namespace fcat::ingest
