#include "fcat/ingest/orphan_cleanup.hpp"

#include "fcat/core/chunked_batch.hpp"
#include "fcat/core/ids.hpp"
#include "fcat/events/events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <vector>

namespace fcat::ingest {

OrphanCleanup::OrphanCleanup(catalog::CatalogStore& store, events::EventBus& bus, std::size_t max_params_per_statement)
    : store_(store), bus_(bus), max_params_(std::max<std::size_t>(max_params_per_statement, 1)) {}

Result<void> OrphanCleanup::validate(const std::string& case_id, const std::string& source_path) {
    if (!core::is_valid_id(case_id)) {
        return Err<void>(Error::validation("Invalid case id: " + case_id));
    }
    if (source_path.empty()) {
        return Err<void>(Error::validation("Source path must not be empty"));
    }
    if (source_path.size() > kMaxSourcePathLength) {
        return Err<void>(Error::validation("Source path exceeds 4096 characters"));
    }

    auto known_case = store_.find_case(case_id);
    if (known_case.is_error()) {
        return Err<void>(known_case.error());
    }
    if (!known_case.value()) {
        return Err<void>(Error::not_found("No case " + case_id));
    }

    auto source = store_.find_source(case_id, source_path);
    if (source.is_error()) {
        return Err<void>(source.error());
    }
    if (!source.value()) {
        return Err<void>(Error::validation("Source " + source_path + " is not registered for case " + case_id));
    }
    if (source.value()->location != catalog::SourceLocation::Local) {
        return Err<void>(Error::validation("Remote source " + source_path + " cannot be cleaned"));
    }
    return Ok();
}

Result<CleanupSummary> OrphanCleanup::cleanup(const std::string& case_id,
                                              const std::string& source_path,
                                              const std::unordered_set<std::string>& walked_paths,
                                              std::int64_t deleted_at) {
    auto valid = validate(case_id, source_path);
    if (valid.is_error()) {
        return Err<CleanupSummary>(valid.error());
    }

    auto live = store_.live_entries(case_id, source_path);
    if (live.is_error()) {
        return Err<CleanupSummary>(live.error());
    }

    std::vector<std::string> missing;
    for (const auto& entry : live.value()) {
        if (walked_paths.count(entry.absolute_path) == 0) {
            missing.push_back(entry.id);
        }
    }

    CleanupSummary summary;
    if (missing.empty()) {
        return Ok(summary);
    }

    // Protection: reviewed status, notes, finding links
    auto protected_ids = store_.finding_linked_ids(case_id);
    if (protected_ids.is_error()) {
        return Err<CleanupSummary>(protected_ids.error());
    }
    auto& guarded = protected_ids.value();

    core::ChunkedBatch<std::string> batches(missing, max_params_);
    auto scanned = batches.for_each([&](const std::vector<std::string>& chunk) -> Result<void> {
        auto reviewed = store_.ids_with_review_status(chunk);
        if (reviewed.is_error()) {
            return Err<void>(reviewed.error());
        }
        guarded.insert(reviewed.value().begin(), reviewed.value().end());

        auto noted = store_.ids_with_notes(chunk);
        if (noted.is_error()) {
            return Err<void>(noted.error());
        }
        guarded.insert(noted.value().begin(), noted.value().end());
        return Ok();
    });
    if (scanned.is_error()) {
        return Err<CleanupSummary>(scanned.error());
    }

    std::vector<std::string> deletable;
    deletable.reserve(missing.size());
    for (const auto& id : missing) {
        if (guarded.count(id) > 0) {
            ++summary.files_protected;
        } else {
            deletable.push_back(id);
        }
    }

    if (!deletable.empty()) {
        auto tx = store_.begin();
        if (tx.is_error()) {
            return Err<CleanupSummary>(tx.error());
        }

        std::int64_t affected = 0;
        core::ChunkedBatch<std::string> deletes(deletable, max_params_);
        auto deleted = deletes.for_each([&](const std::vector<std::string>& chunk) -> Result<void> {
            auto rows = store_.soft_delete(chunk, deleted_at);
            if (rows.is_error()) {
                return Err<void>(rows.error());
            }
            affected += rows.value();
            return Ok();
        });
        if (deleted.is_error()) {
            return Err<CleanupSummary>(deleted.error());
        }

        auto committed = tx.value().commit();
        if (committed.is_error()) {
            return Err<CleanupSummary>(committed.error());
        }
        summary.files_deleted = static_cast<std::size_t>(affected);
    }

    spdlog::info("[OrphanCleanup] case {} source {}: {} missing, {} soft-deleted, {} protected",
                 case_id, source_path, missing.size(), summary.files_deleted, summary.files_protected);

    bus_.emit(events::EntriesSoftDeletedEvent{case_id, source_path, std::move(deletable),
                                              summary.files_protected, deleted_at});
    return Ok(summary);
}

} // namespace fcat::ingest
