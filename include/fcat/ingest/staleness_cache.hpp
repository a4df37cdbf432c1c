#pragma once

#include "fcat/core/clock.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace fcat::ingest {

/// Verdict of comparing a catalog entry with the file backing it.
enum class Staleness {
    Fresh,
    Modified,
    Deleted
};

const char* to_string(Staleness staleness);

/**
 * @brief Short-lived memo of staleness verdicts keyed by entry id
 *
 * Advisory only: a hit younger than the TTL is returned as is, anything
 * older is treated as a miss. Expired entries are swept whenever the map
 * grows past max_entries. Catalog mutations invalidate affected ids (see
 * CacheInvalidationComponent).
 */
class StalenessCache {
public:
    StalenessCache(const core::Clock& clock,
                   std::chrono::milliseconds ttl = std::chrono::milliseconds(5000),
                   std::size_t max_entries = 1000);

    std::optional<Staleness> get(const std::string& entry_id) const;
    void put(const std::string& entry_id, Staleness verdict);
    void invalidate(const std::string& entry_id);
    void clear();
    std::size_t size() const;

private:
    struct Slot {
        Staleness verdict;
        core::Clock::time_point computed_at;
    };

    void prune_expired_locked(core::Clock::time_point now);

    const core::Clock& clock_;
    std::chrono::milliseconds ttl_;
    std::size_t max_entries_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Slot> slots_;
};

} // namespace fcat::ingest
