#include "fcat/ingest/enrichment.hpp"

#include <algorithm>

namespace fs = std::filesystem;

namespace fcat::ingest {

nlohmann::json build_inventory(const WalkedFile& file, const fs::path& source_root) {
    nlohmann::json segments = nlohmann::json::array();
    for (const auto& part : file.absolute_path.lexically_relative(source_root)) {
        segments.push_back(part.string());
    }

    std::size_t depth = 0;
    if (!file.folder_path.empty()) {
        depth = static_cast<std::size_t>(
            std::count(file.folder_path.begin(), file.folder_path.end(), '/')) + 1;
    }

    std::string extension = file.absolute_path.extension().string();
    if (!extension.empty()) {
        extension.erase(0, 1);
    }

    return nlohmann::json{
        {"file_size", file.size},
        {"file_extension", extension},
        {"created_at", file.created_at},
        {"modified_at", file.modified_at},
        {"parent_folder", file.absolute_path.parent_path().string()},
        {"folder_depth", depth},
        {"file_path_segments", segments},
    };
}

} // namespace fcat::ingest
