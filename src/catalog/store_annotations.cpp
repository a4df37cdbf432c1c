#include "fcat/catalog/store.hpp"

#include "fcat/core/clock.hpp"
#include "fcat/core/ids.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace fcat::catalog {
namespace {

using json = nlohmann::json;

Result<std::unordered_set<std::string>> collect_ids(Statement& stmt) {
    std::unordered_set<std::string> ids;
    while (true) {
        auto row = stmt.step();
        if (row.is_error()) {
            return Err<std::unordered_set<std::string>>(row.error());
        }
        if (!row.value()) {
            break;
        }
        ids.insert(stmt.column_text(0));
    }
    return Ok(std::move(ids));
}

} // namespace

Result<void> CatalogStore::set_status(const std::string& entry_id, LifecycleStatus status) {
    auto stmt = db_->prepare("UPDATE files SET status = ?, updated_at = ? WHERE id = ?");
    if (stmt.is_error()) {
        return Err<void>(stmt.error());
    }
    stmt.value().bind(1, to_string(status)).bind(2, core::unix_now()).bind(3, entry_id);

    auto done = stmt.value().run();
    if (done.is_error()) {
        return done;
    }
    if (db_->changes() == 0) {
        return Err<void>(Error::not_found("No entry " + entry_id));
    }
    return Ok();
}

Result<void> CatalogStore::set_tags(const std::string& entry_id, std::vector<std::string> tags) {
    std::sort(tags.begin(), tags.end());
    tags.erase(std::unique(tags.begin(), tags.end()), tags.end());

    auto stmt = db_->prepare("UPDATE files SET tags = ?, updated_at = ? WHERE id = ?");
    if (stmt.is_error()) {
        return Err<void>(stmt.error());
    }
    stmt.value().bind(1, json(tags).dump()).bind(2, core::unix_now()).bind(3, entry_id);

    auto done = stmt.value().run();
    if (done.is_error()) {
        return done;
    }
    if (db_->changes() == 0) {
        return Err<void>(Error::not_found("No entry " + entry_id));
    }
    return Ok();
}

Result<std::string> CatalogStore::add_note(const std::string& case_id,
                                           const std::string& entry_id,
                                           const std::string& content) {
    auto stmt = db_->prepare("INSERT INTO notes (id, case_id, file_id, content, created_at) VALUES (?, ?, ?, ?, ?)");
    if (stmt.is_error()) {
        return Err<std::string>(stmt.error());
    }

    const auto note_id = core::generate_id();
    stmt.value()
        .bind(1, note_id)
        .bind(2, case_id)
        .bind(3, entry_id)
        .bind(4, content)
        .bind(5, core::unix_now());

    auto done = stmt.value().run();
    if (done.is_error()) {
        return Err<std::string>(done.error());
    }
    return Ok(note_id);
}

Result<std::string> CatalogStore::add_finding(const std::string& case_id,
                                              const std::string& title,
                                              const std::vector<std::string>& linked_entry_ids) {
    auto stmt = db_->prepare("INSERT INTO findings (id, case_id, title, linked_files, created_at) VALUES (?, ?, ?, ?, ?)");
    if (stmt.is_error()) {
        return Err<std::string>(stmt.error());
    }

    const auto finding_id = core::generate_id();
    stmt.value()
        .bind(1, finding_id)
        .bind(2, case_id)
        .bind(3, title)
        .bind(4, json(linked_entry_ids).dump())
        .bind(5, core::unix_now());

    auto done = stmt.value().run();
    if (done.is_error()) {
        return Err<std::string>(done.error());
    }
    return Ok(finding_id);
}

Result<std::unordered_set<std::string>> CatalogStore::ids_with_review_status(const std::vector<std::string>& entry_ids) {
    if (entry_ids.empty()) {
        return Ok(std::unordered_set<std::string>{});
    }

    auto stmt = db_->prepare("SELECT id FROM files WHERE status <> 'unreviewed' AND id IN (" +
                             placeholders(entry_ids.size()) + ")");
    if (stmt.is_error()) {
        return Err<std::unordered_set<std::string>>(stmt.error());
    }
    int index = 1;
    for (const auto& id : entry_ids) {
        stmt.value().bind(index++, id);
    }
    return collect_ids(stmt.value());
}

Result<std::unordered_set<std::string>> CatalogStore::ids_with_notes(const std::vector<std::string>& entry_ids) {
    if (entry_ids.empty()) {
        return Ok(std::unordered_set<std::string>{});
    }

    auto stmt = db_->prepare("SELECT DISTINCT file_id FROM notes WHERE file_id IN (" +
                             placeholders(entry_ids.size()) + ")");
    if (stmt.is_error()) {
        return Err<std::unordered_set<std::string>>(stmt.error());
    }
    int index = 1;
    for (const auto& id : entry_ids) {
        stmt.value().bind(index++, id);
    }
    return collect_ids(stmt.value());
}

Result<std::unordered_set<std::string>> CatalogStore::finding_linked_ids(const std::string& case_id) {
    auto stmt = db_->prepare("SELECT id, linked_files FROM findings WHERE case_id = ?");
    if (stmt.is_error()) {
        return Err<std::unordered_set<std::string>>(stmt.error());
    }
    auto& query = stmt.value();
    query.bind(1, case_id);

    std::unordered_set<std::string> linked;
    while (true) {
        auto row = query.step();
        if (row.is_error()) {
            return Err<std::unordered_set<std::string>>(row.error());
        }
        if (!row.value()) {
            break;
        }

        auto document = json::parse(query.column_text(1), nullptr, false);
        if (document.is_discarded() || !document.is_array()) {
            spdlog::warn("[Catalog] finding {} has malformed linked_files", query.column_text(0));
            continue;
        }
        for (const auto& item : document) {
            if (item.is_string()) {
                linked.insert(item.get<std::string>());
            }
        }
    }
    return Ok(std::move(linked));
}

} // namespace fcat::catalog
