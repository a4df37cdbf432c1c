#include "fcat/ingest/staleness.hpp"

#include "fcat/core/ids.hpp"

#include <spdlog/spdlog.h>

#include <sys/stat.h>

#include <cerrno>
#include <cstring>

namespace fcat::ingest {

StalenessVerifier::StalenessVerifier(catalog::CatalogStore& store,
                                     const Fingerprinter& fingerprinter,
                                     StalenessCache& cache)
    : store_(store), fingerprinter_(fingerprinter), cache_(cache) {}

Result<Staleness> StalenessVerifier::check(const std::string& entry_id) {
    if (auto cached = cache_.get(entry_id)) {
        return Ok(*cached);
    }

    auto entry = load_live(entry_id);
    if (entry.is_error()) {
        return Err<Staleness>(entry.error());
    }

    auto status = compare(entry.value());
    if (status.is_error()) {
        return Err<Staleness>(status.error());
    }

    Staleness verdict = Staleness::Fresh;
    if (!status.value().file_exists) {
        verdict = Staleness::Deleted;
    } else if (status.value().changed) {
        verdict = Staleness::Modified;
    }

    cache_.put(entry_id, verdict);
    spdlog::debug("[Staleness] {} -> {}", entry_id, to_string(verdict));
    return Ok(verdict);
}

Result<FileChangeStatus> StalenessVerifier::inspect(const std::string& entry_id) {
    auto entry = load_live(entry_id);
    if (entry.is_error()) {
        return Err<FileChangeStatus>(entry.error());
    }
    return compare(entry.value());
}

Result<catalog::CatalogEntry> StalenessVerifier::load_live(const std::string& entry_id) {
    if (!core::is_valid_id(entry_id)) {
        return Err<catalog::CatalogEntry>(Error::validation("Invalid entry id: " + entry_id));
    }
    auto entry = store_.find_by_id(entry_id);
    if (entry.is_error()) {
        return Err<catalog::CatalogEntry>(entry.error());
    }
    if (!entry.value() || entry.value()->is_deleted()) {
        return Err<catalog::CatalogEntry>(Error::not_found("File not found or has been deleted: " + entry_id));
    }
    return Ok(std::move(*entry.value()));
}

Result<FileChangeStatus> StalenessVerifier::compare(const catalog::CatalogEntry& entry) {
    FileChangeStatus status;
    status.stored_size = entry.file_size;
    status.stored_modified = entry.modified_at;

    struct stat info {};
    if (::stat(entry.absolute_path.c_str(), &info) != 0) {
        if (errno == ENOENT || errno == ENOTDIR) {
            status.changed = true;
            return Ok(status);
        }
        return Err<FileChangeStatus>(Error::filesystem(entry.absolute_path + ": " + std::strerror(errno)));
    }

    status.file_exists = true;
    status.current_size = static_cast<std::int64_t>(info.st_size);
    status.current_modified = static_cast<std::int64_t>(info.st_mtime);

    const bool metadata_changed = *status.current_size != entry.file_size ||
                                  *status.current_modified != entry.modified_at;

    if (entry.file_hash && (metadata_changed || catalog::is_critical(entry.status))) {
        auto hash = fingerprinter_.fingerprint(entry.absolute_path);
        if (hash.is_error()) {
            return Err<FileChangeStatus>(hash.error());
        }
        status.hash_changed = hash.value() != *entry.file_hash;
    }

    status.changed = metadata_changed || status.hash_changed;
    return Ok(status);
}

} // namespace fcat::ingest
