#include "fcat/catalog/types.hpp"

#include <filesystem>

namespace fcat::catalog {

const char* to_string(LifecycleStatus status) {
    switch (status) {
        case LifecycleStatus::Unreviewed: return "unreviewed";
        case LifecycleStatus::InProgress: return "in_progress";
        case LifecycleStatus::Reviewed: return "reviewed";
        case LifecycleStatus::Flagged: return "flagged";
        case LifecycleStatus::Finalized: return "finalized";
    }
    return "unreviewed";
}

std::optional<LifecycleStatus> parse_status(std::string_view text) {
    if (text == "unreviewed") return LifecycleStatus::Unreviewed;
    if (text == "in_progress") return LifecycleStatus::InProgress;
    if (text == "reviewed") return LifecycleStatus::Reviewed;
    if (text == "flagged") return LifecycleStatus::Flagged;
    if (text == "finalized") return LifecycleStatus::Finalized;
    return std::nullopt;
}

bool is_critical(LifecycleStatus status) {
    return status == LifecycleStatus::Reviewed ||
           status == LifecycleStatus::Flagged ||
           status == LifecycleStatus::Finalized;
}

LifecycleStatus demote_on_change(LifecycleStatus status) {
    if (status == LifecycleStatus::Reviewed || status == LifecycleStatus::Flagged) {
        return LifecycleStatus::InProgress;
    }
    return status;
}

const char* to_string(SourceLocation location) {
    return location == SourceLocation::Remote ? "remote" : "local";
}

std::optional<SourceLocation> parse_location(std::string_view text) {
    if (text == "local") return SourceLocation::Local;
    if (text == "remote") return SourceLocation::Remote;
    return std::nullopt;
}

std::string normalize_local_path(const std::string& path) {
    namespace fs = std::filesystem;
    std::error_code ec;
    fs::path absolute = fs::absolute(path, ec);
    if (ec) {
        absolute = path;
    }
    absolute = absolute.lexically_normal();
    if (!absolute.has_filename() && absolute != absolute.root_path()) {
        absolute = absolute.parent_path();
    }
    return absolute.string();
}

} // namespace fcat::catalog
