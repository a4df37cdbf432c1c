#include "fcat/ingest/tree_walker.hpp"

#include "fcat/catalog/types.hpp"
#include "fcat/ingest/work_queue.hpp"

#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <sys/stat.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <system_error>
#include <thread>

namespace fs = std::filesystem;

namespace fcat::ingest {
namespace {

std::string upper_extension(const fs::path& path) {
    std::string ext = path.extension().string();
    if (!ext.empty() && ext.front() == '.') {
        ext.erase(0, 1);
    }
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return ext;
}

// Birth time where the kernel and filesystem report one, otherwise the inode change time.
std::int64_t creation_time(const fs::path& file, const struct stat& info) {
#ifdef STATX_BTIME
    struct statx extended {};
    if (::statx(AT_FDCWD, file.c_str(), 0, STATX_BTIME, &extended) == 0 &&
        (extended.stx_mask & STATX_BTIME) != 0) {
        return static_cast<std::int64_t>(extended.stx_btime.tv_sec);
    }
#endif
    return static_cast<std::int64_t>(info.st_ctime);
}

class WalkState {
public:
    WalkState(const fs::path& root, const TreeWalker::Sink& sink) : root_(root), sink_(sink) {}

    void run_worker() {
        while (auto dir = queue_.pop()) {
            try {
                visit(*dir);
            } catch (const std::exception& e) {
                record_error(dir->string(), e.what());
            }
            queue_.task_done();
        }
    }

    WorkQueue<fs::path>& queue() { return queue_; }

    std::vector<WalkError> take_errors() {
        std::lock_guard lock(errors_mutex_);
        return std::move(errors_);
    }

private:
    void visit(const fs::path& dir) {
        std::error_code ec;
        fs::directory_iterator it(dir, ec);
        if (ec) {
            record_error(dir.string(), ec.message());
            return;
        }

        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec) {
                record_error(dir.string(), ec.message());
                return;
            }

            const auto& entry = *it;
            std::error_code status_ec;
            const auto status = entry.symlink_status(status_ec);
            if (status_ec) {
                record_error(entry.path().string(), status_ec.message());
                continue;
            }

            if (fs::is_directory(status)) {
                queue_.push(entry.path());
            } else if (fs::is_regular_file(status)) {
                auto described = describe_file(entry.path(), root_);
                if (described.is_error()) {
                    record_error(entry.path().string(), described.error().message);
                    continue;
                }
                std::lock_guard lock(sink_mutex_);
                sink_(std::move(described.value()));
            }
            // symlinks, sockets, fifos and devices are not catalogued
        }
        if (ec) {
            record_error(dir.string(), ec.message());
        }
    }

    void record_error(const std::string& path, const std::string& message) {
        spdlog::warn("[TreeWalker] skipping {}: {}", path, message);
        std::lock_guard lock(errors_mutex_);
        errors_.push_back(WalkError{path, message});
    }

    const fs::path& root_;
    const TreeWalker::Sink& sink_;
    WorkQueue<fs::path> queue_;

    std::mutex sink_mutex_;
    std::mutex errors_mutex_;
    std::vector<WalkError> errors_;
};

} // namespace

fs::path normalize_root(const fs::path& root) {
    return fs::path(catalog::normalize_local_path(root.string()));
}

Result<WalkedFile> describe_file(const fs::path& file, const fs::path& root) {
    struct stat info {};
    if (::stat(file.c_str(), &info) != 0) {
        return Err<WalkedFile>(Error::filesystem(file.string() + ": " + std::strerror(errno)));
    }
    if (!S_ISREG(info.st_mode)) {
        return Err<WalkedFile>(Error::filesystem(file.string() + ": not a regular file"));
    }

    const fs::path relative = file.lexically_relative(root);
    if (relative.empty() || *relative.begin() == "..") {
        return Err<WalkedFile>(Error::validation(file.string() + " is outside " + root.string()));
    }

    WalkedFile walked;
    walked.absolute_path = file;
    walked.file_name = file.filename().string();
    walked.folder_path = relative.parent_path().generic_string();
    walked.file_type = upper_extension(file);
    walked.size = static_cast<std::int64_t>(info.st_size);
    walked.created_at = creation_time(file, info);
    walked.modified_at = static_cast<std::int64_t>(info.st_mtime);
    return Ok(std::move(walked));
}

TreeWalker::TreeWalker(std::size_t worker_count)
    : worker_count_(std::max<std::size_t>(worker_count, 1)) {}

Result<std::vector<WalkError>> TreeWalker::walk(const fs::path& root, const Sink& sink) const {
    const fs::path start = normalize_root(root);

    std::error_code ec;
    if (!fs::is_directory(start, ec)) {
        return Err<std::vector<WalkError>>(
            Error::validation("Source is not an existing directory: " + start.string()));
    }

    WalkState state(start, sink);
    state.queue().push(start);

    std::vector<std::thread> workers;
    workers.reserve(worker_count_);
    for (std::size_t i = 0; i < worker_count_; ++i) {
        workers.emplace_back([&state]() { state.run_worker(); });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    auto errors = state.take_errors();
    spdlog::debug("[TreeWalker] finished {} with {} errors", start.string(), errors.size());
    return Ok(std::move(errors));
}

Result<WalkResult> TreeWalker::collect(const fs::path& root) const {
    WalkResult result;
    auto walked = walk(root, [&result](WalkedFile file) {
        result.files.push_back(std::move(file));
    });
    if (walked.is_error()) {
        return Err<WalkResult>(walked.error());
    }
    result.errors = std::move(walked.value());
    return Ok(std::move(result));
}

} // namespace fcat::ingest
