#include "fcat/ingest/rename_resolver.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace fcat::ingest {
namespace {

// An unreadable path may still exist; only a definite "absent" frees it.
bool definitely_absent(const std::string& path) {
    std::error_code ec;
    const auto status = fs::symlink_status(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return false;
    }
    return !fs::exists(status);
}

} // namespace

RenameResolver::RenameResolver(catalog::CatalogStore& store) : store_(store) {}

Result<std::optional<catalog::CatalogEntry>> RenameResolver::resolve(const std::string& case_id,
                                                                     const std::string& source_directory,
                                                                     const std::string& file_hash,
                                                                     const std::string& absolute_path) const {
    auto candidates = store_.rename_candidates(case_id, source_directory, file_hash, absolute_path);
    if (candidates.is_error()) {
        return Err<std::optional<catalog::CatalogEntry>>(candidates.error());
    }

    for (auto& candidate : candidates.value()) {
        if (definitely_absent(candidate.absolute_path)) {
            spdlog::debug("[RenameResolver] {} reclaims entry {} from {}",
                          absolute_path, candidate.id, candidate.absolute_path);
            return Ok(std::optional<catalog::CatalogEntry>(std::move(candidate)));
        }
    }
    return Ok(std::optional<catalog::CatalogEntry>{});
}

} // namespace fcat::ingest
