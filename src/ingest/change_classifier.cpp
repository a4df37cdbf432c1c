#include "fcat/ingest/change_classifier.hpp"

#include <spdlog/spdlog.h>

namespace fcat::ingest {
namespace {

bool metadata_equal(const catalog::CatalogEntry& entry, const WalkedFile& file) {
    return entry.file_size == file.size && entry.modified_at == file.modified_at;
}

} // namespace

const char* to_string(ChangeKind kind) {
    switch (kind) {
        case ChangeKind::Insert: return "insert";
        case ChangeKind::Update: return "update";
        case ChangeKind::Skip: return "skip";
    }
    return "unknown";
}

ChangeClassifier::ChangeClassifier(catalog::CatalogStore& store, const Fingerprinter& fingerprinter)
    : store_(store), fingerprinter_(fingerprinter), renames_(store) {}

Result<Classification> ChangeClassifier::classify(const std::string& case_id,
                                                  const std::string& source_directory,
                                                  const WalkedFile& file) const {
    Classification result;
    result.file = file;

    const std::string path = file.absolute_path.string();
    auto matched = store_.find_by_path(case_id, path);
    if (matched.is_error()) {
        return Err<Classification>(matched.error());
    }

    if (matched.value()) {
        auto& entry = *matched.value();
        if (entry.is_deleted()) {
            spdlog::debug("[ChangeClassifier] {} was removed by the user, skipping", path);
            result.kind = ChangeKind::Skip;
            result.existing = std::move(entry);
            return Ok(std::move(result));
        }

        if (metadata_equal(entry, file) && !catalog::is_critical(entry.status)) {
            result.kind = ChangeKind::Skip;
            result.existing = std::move(entry);
            return Ok(std::move(result));
        }

        auto hash = fingerprinter_.fingerprint(file.absolute_path);
        if (hash.is_error()) {
            return Err<Classification>(hash.error());
        }

        const bool same_content = entry.file_hash && *entry.file_hash == hash.value();
        result.kind = same_content ? ChangeKind::Skip : ChangeKind::Update;
        result.fingerprint = std::move(hash.value());
        result.existing = std::move(entry);
        return Ok(std::move(result));
    }

    auto hash = fingerprinter_.fingerprint(file.absolute_path);
    if (hash.is_error()) {
        return Err<Classification>(hash.error());
    }
    result.fingerprint = hash.value();

    auto reclaimed = renames_.resolve(case_id, source_directory, hash.value(), path);
    if (reclaimed.is_error()) {
        return Err<Classification>(reclaimed.error());
    }

    if (reclaimed.value()) {
        result.kind = ChangeKind::Update;
        result.renamed = true;
        result.existing = std::move(reclaimed.value());
    } else {
        result.kind = ChangeKind::Insert;
    }
    return Ok(std::move(result));
}

} // namespace fcat::ingest
