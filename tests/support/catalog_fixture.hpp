#pragma once

#include "fcat/catalog/store.hpp"
#include "fcat/core/ids.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <cstdint>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

namespace fcat::test_support {

namespace fs = std::filesystem;

inline fs::path create_temp_dir(const std::string& prefix = "fcat_test_") {
    static std::atomic<uint64_t> counter{0};
    const auto base = fs::temp_directory_path();
    const auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    const auto id = timestamp ^ (counter.fetch_add(1) << 8);
    auto unique = base / fs::path(prefix + std::to_string(id));
    fs::create_directories(unique);
    return unique;
}

inline void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    output << content;
}

/// Move a file's mtime by whole seconds; catalog timestamps have one-second resolution.
inline void shift_mtime(const fs::path& path, int seconds) {
    fs::last_write_time(path, fs::last_write_time(path) + std::chrono::seconds(seconds));
}

/// A live entry ready for insert_batch; timestamps fixed so ordering is explicit.
inline catalog::EntryWrite make_write(const std::string& case_id,
                                      const std::string& source_directory,
                                      const std::string& absolute_path,
                                      const std::string& hash,
                                      std::int64_t added_at = 1000) {
    catalog::EntryWrite write;
    auto& entry = write.entry;
    entry.id = core::generate_id();
    entry.case_id = case_id;
    entry.absolute_path = absolute_path;
    entry.file_name = fs::path(absolute_path).filename().string();
    entry.folder_path = "";
    entry.file_hash = hash;
    entry.file_type = "TXT";
    entry.file_size = 10;
    entry.created_at = 900;
    entry.modified_at = 900;
    entry.added_at = added_at;
    entry.updated_at = added_at;
    entry.source_directory = source_directory;
    write.inventory_json = R"({"file_size":10})";
    write.scanned_at = added_at;
    return write;
}

/**
 * @brief Temp directory plus an in-memory catalog holding one case
 */
class CatalogTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = create_temp_dir();

        auto opened = catalog::CatalogStore::open(":memory:");
        ASSERT_TRUE(opened.is_ok()) << opened.error().message;
        store_ = std::move(opened.value());

        auto created = store_->create_case("test case");
        ASSERT_TRUE(created.is_ok()) << created.error().message;
        case_id_ = created.value().id;
    }

    void TearDown() override {
        store_.reset();
        if (!root_.empty()) {
            std::error_code ec;
            fs::remove_all(root_, ec);
        }
    }

    std::string path_of(const std::string& relative) const {
        return (root_ / relative).string();
    }

    fs::path root_;
    std::unique_ptr<catalog::CatalogStore> store_;
    std::string case_id_;
};

} // namespace fcat::test_support
