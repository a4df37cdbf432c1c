#include "fcat/ingest/staleness_cache.hpp"

#include <mutex>

namespace fcat::ingest {

const char* to_string(Staleness staleness) {
    switch (staleness) {
        case Staleness::Fresh: return "fresh";
        case Staleness::Modified: return "modified";
        case Staleness::Deleted: return "deleted";
    }
    return "unknown";
}

StalenessCache::StalenessCache(const core::Clock& clock,
                               std::chrono::milliseconds ttl,
                               std::size_t max_entries)
    : clock_(clock), ttl_(ttl), max_entries_(max_entries) {}

std::optional<Staleness> StalenessCache::get(const std::string& entry_id) const {
    std::shared_lock lock(mutex_);
    auto it = slots_.find(entry_id);
    if (it == slots_.end()) {
        return std::nullopt;
    }
    if (clock_.now() - it->second.computed_at >= ttl_) {
        return std::nullopt;
    }
    return it->second.verdict;
}

void StalenessCache::put(const std::string& entry_id, Staleness verdict) {
    std::unique_lock lock(mutex_);
    const auto now = clock_.now();
    slots_[entry_id] = Slot{verdict, now};

    if (slots_.size() > max_entries_) {
        prune_expired_locked(now);
    }
}

void StalenessCache::invalidate(const std::string& entry_id) {
    std::unique_lock lock(mutex_);
    slots_.erase(entry_id);
}

void StalenessCache::clear() {
    std::unique_lock lock(mutex_);
    slots_.clear();
}

std::size_t StalenessCache::size() const {
    std::shared_lock lock(mutex_);
    return slots_.size();
}

void StalenessCache::prune_expired_locked(core::Clock::time_point now) {
    for (auto it = slots_.begin(); it != slots_.end();) {
        if (now - it->second.computed_at >= ttl_) {
            it = slots_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace fcat::ingest
