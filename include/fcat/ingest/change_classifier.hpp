#pragma once

#include "fcat/catalog/store.hpp"
#include "fcat/core/result.hpp"
#include "fcat/ingest/fingerprint.hpp"
#include "fcat/ingest/rename_resolver.hpp"
#include "fcat/ingest/tree_walker.hpp"

#include <optional>
#include <string>

namespace fcat::ingest {

enum class ChangeKind {
    Insert,
    Update,
    Skip
};

const char* to_string(ChangeKind kind);

/**
 * @brief Decision for one walked file
 */
struct Classification {
    ChangeKind kind = ChangeKind::Skip;
    WalkedFile file;
    std::optional<catalog::CatalogEntry> existing;   ///< Entry matched by path, or reclaimed by a rename
    std::optional<std::string> fingerprint;          ///< Present whenever the file was hashed
    bool renamed = false;
};

/**
 * @brief Decides Insert / Update / Skip for a walked file
 *
 * DECISION ORDER:
 * 1. Entry at the same path is soft-deleted        -> Skip (never resurrect)
 * 2. Size and mtime match, status not critical     -> Skip, no hashing
 * 3. Hash matches the stored one                   -> Skip
 * 4. Otherwise                                     -> Update
 * 5. No entry at the path: RenameResolver decides  -> Update (rename) or Insert
 *
 * Safe to call concurrently for different files.
 */
class ChangeClassifier {
public:
    ChangeClassifier(catalog::CatalogStore& store, const Fingerprinter& fingerprinter);

    Result<Classification> classify(const std::string& case_id,
                                    const std::string& source_directory,
                                    const WalkedFile& file) const;

private:
    catalog::CatalogStore& store_;
    const Fingerprinter& fingerprinter_;
    RenameResolver renames_;
};

} // namespace fcat::ingest
