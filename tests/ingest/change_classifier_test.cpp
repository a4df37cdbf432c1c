#include "fcat/ingest/change_classifier.hpp"
#include "fcat/core/clock.hpp"
#include "support/fingerprinters.hpp"
#include "support/ingest_fixture.hpp"

#include <gtest/gtest.h>

using namespace fcat;
using namespace fcat::ingest;
using catalog::LifecycleStatus;
using test_support::CountingFingerprinter;
using test_support::shift_mtime;
using test_support::write_file;

namespace {

class ChangeClassifierTest : public test_support::IngestTest {
protected:
    Classification classify(const std::string& relative) {
        ChangeClassifier classifier(*store_, counting_);
        auto result = classifier.classify(case_id_, source_, walked(relative));
        EXPECT_TRUE(result.is_ok());
        return result.is_ok() ? result.value() : Classification{};
    }

    CountingFingerprinter counting_;
};

} // namespace

TEST_F(ChangeClassifierTest, NewFileIsInsertedWithFingerprint) {
    write_file(root_ / "new.txt", "fresh content");

    auto decision = classify("new.txt");
    EXPECT_EQ(decision.kind, ChangeKind::Insert);
    ASSERT_TRUE(decision.fingerprint.has_value());
    EXPECT_EQ(decision.fingerprint->size(), 64u);
    EXPECT_FALSE(decision.existing.has_value());
    EXPECT_EQ(counting_.calls(), 1u);
}

TEST_F(ChangeClassifierTest, UnchangedMetadataSkipsWithoutHashing) {
    write_file(root_ / "a.txt", "same");
    catalog_file("a.txt");

    auto decision = classify("a.txt");
    EXPECT_EQ(decision.kind, ChangeKind::Skip);
    EXPECT_EQ(counting_.calls(), 0u);
}

TEST_F(ChangeClassifierTest, CriticalStatusAlwaysVerifiesContent) {
    write_file(root_ / "reviewed.txt", "evidence");
    catalog_file("reviewed.txt", LifecycleStatus::Reviewed);

    auto decision = classify("reviewed.txt");
    EXPECT_EQ(decision.kind, ChangeKind::Skip);
    EXPECT_EQ(counting_.calls(), 1u);
}

TEST_F(ChangeClassifierTest, TouchWithoutContentChangeIsSkipped) {
    write_file(root_ / "a.txt", "same");
    catalog_file("a.txt");
    shift_mtime(root_ / "a.txt", 60);

    auto decision = classify("a.txt");
    EXPECT_EQ(decision.kind, ChangeKind::Skip);
    EXPECT_EQ(counting_.calls(), 1u);
}

TEST_F(ChangeClassifierTest, ContentChangeIsAnUpdateOfTheSameEntry) {
    write_file(root_ / "a.txt", "before");
    auto original = catalog_file("a.txt");
    write_file(root_ / "a.txt", "after, and longer");

    auto decision = classify("a.txt");
    EXPECT_EQ(decision.kind, ChangeKind::Update);
    EXPECT_FALSE(decision.renamed);
    ASSERT_TRUE(decision.existing.has_value());
    EXPECT_EQ(decision.existing->id, original.id);
    ASSERT_TRUE(decision.fingerprint.has_value());
    EXPECT_NE(*decision.fingerprint, original.file_hash.value_or(""));
}

TEST_F(ChangeClassifierTest, UserDeletedEntryIsNeverResurrected) {
    write_file(root_ / "a.txt", "content");
    auto original = catalog_file("a.txt");
    ASSERT_TRUE(store_->soft_delete({original.id}, core::unix_now()).is_ok());

    write_file(root_ / "a.txt", "content that changed too");
    auto decision = classify("a.txt");
    EXPECT_EQ(decision.kind, ChangeKind::Skip);
    ASSERT_TRUE(decision.existing.has_value());
    EXPECT_TRUE(decision.existing->is_deleted());
    EXPECT_EQ(counting_.calls(), 0u);
}

TEST_F(ChangeClassifierTest, MovedFileReclaimsItsEntry) {
    write_file(root_ / "old" / "a.txt", "moved content");
    auto original = catalog_file("old/a.txt");
    std::filesystem::create_directories(root_ / "new");
    std::filesystem::rename(root_ / "old" / "a.txt", root_ / "new" / "a.txt");

    auto decision = classify("new/a.txt");
    EXPECT_EQ(decision.kind, ChangeKind::Update);
    EXPECT_TRUE(decision.renamed);
    ASSERT_TRUE(decision.existing.has_value());
    EXPECT_EQ(decision.existing->id, original.id);
}

TEST_F(ChangeClassifierTest, FingerprintFailureIsReported) {
    test_support::FailingFingerprinter failing({"bad.txt"});
    write_file(root_ / "bad.txt", "unreadable");

    ChangeClassifier classifier(*store_, failing);
    auto result = classifier.classify(case_id_, source_, walked("bad.txt"));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Fingerprint);
}
