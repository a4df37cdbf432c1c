#pragma once

#include "fcat/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace fcat::ingest {

/**
 * @brief One regular file found under a source root
 */
struct WalkedFile {
    std::filesystem::path absolute_path;
    std::string file_name;
    std::string folder_path;         ///< Parent relative to the root, '/'-separated, empty at root
    std::string file_type;           ///< Upper-case extension without the dot, empty if none
    std::int64_t size = 0;
    std::int64_t created_at = 0;     ///< Unix seconds; birth time, or inode change time where none is reported
    std::int64_t modified_at = 0;    ///< Unix seconds
};

struct WalkError {
    std::string path;
    std::string message;
};

struct WalkResult {
    std::vector<WalkedFile> files;
    std::vector<WalkError> errors;
};

/**
 * @brief Stat a single file as the walker would report it
 *
 * root anchors folder_path; file must live under it.
 */
Result<WalkedFile> describe_file(const std::filesystem::path& file, const std::filesystem::path& root);

/// Absolute, lexically normalised form without a trailing separator.
std::filesystem::path normalize_root(const std::filesystem::path& root);

/**
 * @brief Breadth-first, bounded-concurrency enumeration of a directory tree
 *
 * Directories are queued level by level and drained by worker_count
 * threads. Symbolic links are never followed. A directory or entry that
 * cannot be read is logged and recorded as a WalkError; the walk goes on.
 * The order in which files are reported is unspecified.
 */
class TreeWalker {
public:
    using Sink = std::function<void(WalkedFile)>;

    explicit TreeWalker(std::size_t worker_count = 4);

    /**
     * @brief Stream every regular file under root to sink
     *
     * Calls to sink are serialized.
     *
     * RETURNS: the non-fatal errors met on the way, or a Validation error
     * when root is not an existing directory
     */
    Result<std::vector<WalkError>> walk(const std::filesystem::path& root, const Sink& sink) const;

    Result<WalkResult> collect(const std::filesystem::path& root) const;

private:
    std::size_t worker_count_;
};

} // namespace fcat::ingest
