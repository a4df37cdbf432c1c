#include "fcat/ingest/rename_resolver.hpp"
#include "fcat/core/clock.hpp"
#include "support/ingest_fixture.hpp"

#include <gtest/gtest.h>

#include <filesystem>

namespace fs = std::filesystem;
using namespace fcat;
using fcat::ingest::RenameResolver;
using fcat::test_support::write_file;

namespace {

class RenameResolverTest : public test_support::IngestTest {};

} // namespace

TEST_F(RenameResolverTest, ReclaimsEntryWhoseFileIsGone) {
    write_file(root_ / "a.txt", "payload");
    auto original = catalog_file("a.txt");
    fs::rename(root_ / "a.txt", root_ / "b.txt");

    RenameResolver resolver(*store_);
    auto resolved = resolver.resolve(case_id_, source_, *original.file_hash, path_of("b.txt"));
    ASSERT_TRUE(resolved.is_ok());
    ASSERT_TRUE(resolved.value().has_value());
    EXPECT_EQ(resolved.value()->id, original.id);
}

TEST_F(RenameResolverTest, CopyDoesNotStealFromAPresentFile) {
    write_file(root_ / "a.txt", "payload");
    auto original = catalog_file("a.txt");
    write_file(root_ / "copy.txt", "payload");

    RenameResolver resolver(*store_);
    auto resolved = resolver.resolve(case_id_, source_, *original.file_hash, path_of("copy.txt"));
    ASSERT_TRUE(resolved.is_ok());
    EXPECT_FALSE(resolved.value().has_value());
}

TEST_F(RenameResolverTest, EarliestAddedCandidateWins) {
    write_file(root_ / "x.txt", "payload");
    write_file(root_ / "y.txt", "payload");
    auto later = catalog_file("x.txt", catalog::LifecycleStatus::Unreviewed, 2000);
    auto earlier = catalog_file("y.txt", catalog::LifecycleStatus::Unreviewed, 1000);
    fs::remove(root_ / "x.txt");
    fs::remove(root_ / "y.txt");
    write_file(root_ / "z.txt", "payload");

    RenameResolver resolver(*store_);
    auto resolved = resolver.resolve(case_id_, source_, *earlier.file_hash, path_of("z.txt"));
    ASSERT_TRUE(resolved.is_ok());
    ASSERT_TRUE(resolved.value().has_value());
    EXPECT_EQ(resolved.value()->id, earlier.id);
    EXPECT_NE(resolved.value()->id, later.id);
}

TEST_F(RenameResolverTest, OtherSourcesAndDeletedEntriesAreIgnored) {
    write_file(root_ / "a.txt", "payload");
    auto original = catalog_file("a.txt");
    ASSERT_TRUE(store_->soft_delete({original.id}, core::unix_now()).is_ok());
    fs::rename(root_ / "a.txt", root_ / "b.txt");

    RenameResolver resolver(*store_);
    auto deleted = resolver.resolve(case_id_, source_, *original.file_hash, path_of("b.txt"));
    ASSERT_TRUE(deleted.is_ok());
    EXPECT_FALSE(deleted.value().has_value());

    auto elsewhere = resolver.resolve(case_id_, "/some/other/source", *original.file_hash, path_of("b.txt"));
    ASSERT_TRUE(elsewhere.is_ok());
    EXPECT_FALSE(elsewhere.value().has_value());
}
