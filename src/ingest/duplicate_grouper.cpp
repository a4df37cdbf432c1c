#include "fcat/ingest/duplicate_grouper.hpp"

#include "fcat/core/clock.hpp"
#include "fcat/events/events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace fcat::ingest {

DuplicateGrouper::DuplicateGrouper(catalog::CatalogStore& store, events::EventBus& bus)
    : store_(store), bus_(bus) {}

Result<bool> DuplicateGrouper::is_local_source(const std::string& case_id, const std::string& source_path) {
    auto source = store_.find_source(case_id, source_path);
    if (source.is_error()) {
        return Err<bool>(source.error());
    }
    return Ok(source.value().has_value() && source.value()->location == catalog::SourceLocation::Local);
}

Result<std::size_t> DuplicateGrouper::group_inserted(const std::string& case_id,
                                                     const std::vector<catalog::CatalogEntry>& inserted) {
    std::unordered_map<std::string, bool> local_sources;
    std::vector<const catalog::CatalogEntry*> eligible;

    for (const auto& entry : inserted) {
        if (!entry.file_hash) {
            continue;
        }
        auto known = local_sources.find(entry.source_directory);
        if (known == local_sources.end()) {
            auto local = is_local_source(case_id, entry.source_directory);
            if (local.is_error()) {
                return Err<std::size_t>(local.error());
            }
            known = local_sources.emplace(entry.source_directory, local.value()).first;
        }
        if (known->second) {
            eligible.push_back(&entry);
        }
    }
    if (eligible.empty()) {
        return Ok(std::size_t{0});
    }

    std::sort(eligible.begin(), eligible.end(),
              [](const auto* lhs, const auto* rhs) { return lhs->absolute_path < rhs->absolute_path; });

    std::unordered_set<std::string> pending;
    for (const auto* entry : eligible) {
        pending.insert(entry->id);
    }

    auto tx = store_.begin();
    if (tx.is_error()) {
        return Err<std::size_t>(tx.error());
    }

    const auto now = core::unix_now();
    std::unordered_set<std::string> touched;
    std::vector<events::DuplicateMemberAddedEvent> added;

    for (const auto* entry : eligible) {
        pending.erase(entry->id);
        const auto& group_id = *entry->file_hash;

        auto candidates = store_.duplicate_candidates(case_id, group_id, entry->id, kCandidateLimit);
        if (candidates.is_error()) {
            return Err<std::size_t>(candidates.error());
        }

        std::vector<catalog::CatalogEntry> existing;
        for (auto& candidate : candidates.value()) {
            if (pending.count(candidate.id) == 0) {
                existing.push_back(std::move(candidate));
            }
        }
        if (existing.empty()) {
            continue;
        }

        auto exists = store_.group_exists(case_id, group_id);
        if (exists.is_error()) {
            return Err<std::size_t>(exists.error());
        }

        if (!exists.value()) {
            for (std::size_t i = 0; i < existing.size(); ++i) {
                auto seeded = store_.add_group_member(case_id, group_id, existing[i].id, i == 0, now);
                if (seeded.is_error()) {
                    return Err<std::size_t>(seeded.error());
                }
            }
        }

        auto appended = store_.add_group_member(case_id, group_id, entry->id, false, now);
        if (appended.is_error()) {
            return Err<std::size_t>(appended.error());
        }

        touched.insert(group_id);
        added.push_back(events::DuplicateMemberAddedEvent{case_id, group_id, entry->id, !exists.value()});
    }

    auto committed = tx.value().commit();
    if (committed.is_error()) {
        return Err<std::size_t>(committed.error());
    }

    for (const auto& event : added) {
        bus_.emit(event);
    }
    if (!touched.empty()) {
        spdlog::info("[DuplicateGrouper] case {}: {} groups gained {} members",
                     case_id, touched.size(), added.size());
    }
    return Ok(touched.size());
}

Result<std::vector<catalog::CatalogEntry>> DuplicateGrouper::find_duplicates(const std::string& case_id,
                                                                             const std::string& entry_id) {
    auto entry = store_.find_by_id(entry_id);
    if (entry.is_error()) {
        return Err<std::vector<catalog::CatalogEntry>>(entry.error());
    }
    if (!entry.value() || entry.value()->case_id != case_id || entry.value()->is_deleted()) {
        return Err<std::vector<catalog::CatalogEntry>>(
            Error::not_found("No live entry " + entry_id + " in case " + case_id));
    }
    if (!entry.value()->file_hash) {
        return Ok(std::vector<catalog::CatalogEntry>{});
    }

    auto same = store_.live_entries_by_hash(case_id, *entry.value()->file_hash);
    if (same.is_error()) {
        return same;
    }

    auto& copies = same.value();
    copies.erase(std::remove_if(copies.begin(), copies.end(),
                                [&entry_id](const auto& copy) { return copy.id == entry_id; }),
                 copies.end());
    return same;
}

Result<std::vector<catalog::DuplicateMember>> DuplicateGrouper::members(const std::string& case_id,
                                                                        const std::string& group_id) {
    return store_.group_members(case_id, group_id);
}

} // namespace fcat::ingest
