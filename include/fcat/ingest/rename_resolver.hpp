#pragma once

#include "fcat/catalog/store.hpp"
#include "fcat/core/result.hpp"

#include <optional>
#include <string>

namespace fcat::ingest {

/**
 * @brief Re-identifies a file with no catalog entry at its path as a move
 *
 * A live entry of the same case and source with the same fingerprint,
 * recorded at a path that no longer exists on disk, is taken to be the
 * same file. Among several such entries the earliest added one wins
 * (ties broken by path).
 */
class RenameResolver {
public:
    explicit RenameResolver(catalog::CatalogStore& store);

    Result<std::optional<catalog::CatalogEntry>> resolve(const std::string& case_id,
                                                         const std::string& source_directory,
                                                         const std::string& file_hash,
                                                         const std::string& absolute_path) const;

private:
    catalog::CatalogStore& store_;
};

} // namespace fcat::ingest
