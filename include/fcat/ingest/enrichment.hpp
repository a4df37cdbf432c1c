#pragma once

#include "fcat/ingest/tree_walker.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>

namespace fcat::ingest {

/**
 * @brief Inventory record stored beside each catalog entry
 *
 * Keys: file_size, file_extension, created_at, modified_at,
 * parent_folder, folder_depth, file_path_segments.
 */
nlohmann::json build_inventory(const WalkedFile& file, const std::filesystem::path& source_root);

} // namespace fcat::ingest
