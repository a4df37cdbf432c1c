#include "fcat/core/config.hpp"
#include "fcat/events/components.hpp"
#include "fcat/events/event_bus.hpp"
#include "fcat/ingest/sync_orchestrator.hpp"
#include "support/catalog_fixture.hpp"
#include "support/fingerprinters.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <filesystem>

namespace fs = std::filesystem;
using namespace fcat;
using namespace fcat::ingest;
using catalog::LifecycleStatus;
using test_support::write_file;

namespace {

class SyncOrchestratorTest : public test_support::CatalogTest {
protected:
    void SetUp() override {
        test_support::CatalogTest::SetUp();
        config_.walker_threads = 2;
        config_.worker_threads = 4;
        metrics_ = std::make_unique<events::MetricsComponent>(bus_);
    }

    SyncSummary sync(const Fingerprinter& fingerprinter) {
        SyncOrchestrator orchestrator(*store_, bus_, fingerprinter, config_);
        auto result = orchestrator.sync_source(case_id_, root_.string());
        EXPECT_TRUE(result.is_ok()) << (result.is_ok() ? "" : result.error().describe());
        return result.is_ok() ? result.value() : SyncSummary{};
    }

    SyncSummary sync() { return sync(sha256_); }

    catalog::CatalogEntry live_at(const std::string& relative) {
        auto found = store_->find_by_path(case_id_, path_of(relative));
        EXPECT_TRUE(found.is_ok());
        if (!found.is_ok() || !found.value()) {
            ADD_FAILURE() << "no entry at " << relative;
            return catalog::CatalogEntry{};
        }
        EXPECT_FALSE(found.value()->is_deleted());
        return *found.value();
    }

    core::Config config_;
    events::EventBus bus_;
    std::unique_ptr<events::MetricsComponent> metrics_;
    Sha256Fingerprinter sha256_;
};

} // namespace

TEST_F(SyncOrchestratorTest, FirstPassInsertsAndGroupsDuplicates) {
    write_file(root_ / "a.txt", "hello");
    write_file(root_ / "b.txt", "hello");
    write_file(root_ / "docs" / "c.pdf", "%PDF-1.4 report");

    auto summary = sync();
    EXPECT_EQ(summary.total_files, 3u);
    EXPECT_EQ(summary.files_inserted, 3u);
    EXPECT_EQ(summary.files_updated, 0u);
    EXPECT_EQ(summary.files_failed, 0u);
    EXPECT_EQ(summary.duplicate_groups_touched, 1u);
    ASSERT_TRUE(summary.cleanup.has_value());
    EXPECT_EQ(summary.cleanup->files_deleted, 0u);

    const auto a = live_at("a.txt");
    const auto c = live_at("docs/c.pdf");
    EXPECT_EQ(a.status, LifecycleStatus::Unreviewed);
    EXPECT_EQ(a.file_type, "TXT");
    EXPECT_EQ(c.folder_path, "docs");
    EXPECT_EQ(c.file_type, "PDF");
    EXPECT_EQ(c.source_directory, root_.string());

    SyncOrchestrator orchestrator(*store_, bus_, sha256_, config_);
    auto members = orchestrator.grouper().members(case_id_, *a.file_hash);
    ASSERT_TRUE(members.is_ok());
    ASSERT_EQ(members.value().size(), 2u);
    EXPECT_EQ(members.value()[0].file_id, a.id);
    EXPECT_TRUE(members.value()[0].is_primary);

    auto inventory = store_->inventory(c.id);
    ASSERT_TRUE(inventory.is_ok());
    ASSERT_TRUE(inventory.value().has_value());
    auto document = nlohmann::json::parse(*inventory.value());
    EXPECT_EQ(document["file_extension"], "pdf");
    EXPECT_EQ(document["parent_folder"], (root_ / "docs").string());
    EXPECT_EQ(document["folder_depth"], 1);

    EXPECT_EQ(metrics_->get_stats().entries_inserted.load(), 3u);
    EXPECT_EQ(metrics_->get_stats().duplicate_groups_created.load(), 1u);
}

TEST_F(SyncOrchestratorTest, SecondPassIsIdempotentAndCheap) {
    write_file(root_ / "a.txt", "hello");
    write_file(root_ / "b.txt", "hello");
    write_file(root_ / "docs" / "c.pdf", "%PDF-1.4 report");
    sync();

    test_support::CountingFingerprinter counting;
    auto summary = sync(counting);
    EXPECT_EQ(summary.files_inserted, 0u);
    EXPECT_EQ(summary.files_updated, 0u);
    EXPECT_EQ(summary.files_skipped, 3u);
    EXPECT_EQ(counting.calls(), 0u);

    auto live = store_->count_live(case_id_);
    ASSERT_TRUE(live.is_ok());
    EXPECT_EQ(live.value(), 3);
    auto groups = store_->count_groups(case_id_);
    ASSERT_TRUE(groups.is_ok());
    EXPECT_EQ(groups.value(), 1);
}

TEST_F(SyncOrchestratorTest, RemovedFileIsSoftDeletedAndNotResurrected) {
    write_file(root_ / "a.txt", "hello");
    write_file(root_ / "b.txt", "hello");
    write_file(root_ / "docs" / "c.pdf", "%PDF-1.4 report");
    sync();
    const auto b = live_at("b.txt");

    fs::remove(root_ / "b.txt");
    auto summary = sync();
    ASSERT_TRUE(summary.cleanup.has_value());
    EXPECT_EQ(summary.cleanup->files_deleted, 1u);
    EXPECT_EQ(summary.files_skipped, 2u);

    auto gone = store_->find_by_id(b.id);
    ASSERT_TRUE(gone.is_ok());
    ASSERT_TRUE(gone.value().has_value());
    EXPECT_TRUE(gone.value()->is_deleted());

    // The user removed it from the catalog; putting the file back does not undo that
    write_file(root_ / "b.txt", "hello");
    auto again = sync();
    EXPECT_EQ(again.files_inserted, 0u);
    EXPECT_EQ(again.files_skipped, 3u);
}

TEST_F(SyncOrchestratorTest, RenameKeepsIdentityStatusAndNotes) {
    write_file(root_ / "a.txt", "evidence photo bytes");
    sync();
    const auto original = live_at("a.txt");
    ASSERT_TRUE(store_->set_status(original.id, LifecycleStatus::Flagged).is_ok());
    ASSERT_TRUE(store_->add_note(case_id_, original.id, "suspicious").is_ok());

    fs::create_directories(root_ / "sub");
    fs::rename(root_ / "a.txt", root_ / "sub" / "a.txt");

    auto summary = sync();
    EXPECT_EQ(summary.files_updated, 1u);
    EXPECT_EQ(summary.files_renamed, 1u);
    EXPECT_EQ(summary.files_inserted, 0u);
    ASSERT_TRUE(summary.cleanup.has_value());
    EXPECT_EQ(summary.cleanup->files_deleted, 0u);

    const auto moved = live_at("sub/a.txt");
    EXPECT_EQ(moved.id, original.id);
    EXPECT_EQ(moved.status, LifecycleStatus::Flagged);
    EXPECT_EQ(moved.folder_path, "sub");

    auto noted = store_->ids_with_notes({moved.id});
    ASSERT_TRUE(noted.is_ok());
    EXPECT_EQ(noted.value().count(moved.id), 1u);
    EXPECT_EQ(metrics_->get_stats().entries_renamed.load(), 1u);
}

TEST_F(SyncOrchestratorTest, CopyOfPresentFileIsANewEntry) {
    write_file(root_ / "a.txt", "shared bytes");
    sync();
    const auto original = live_at("a.txt");

    write_file(root_ / "copy.txt", "shared bytes");
    auto summary = sync();
    EXPECT_EQ(summary.files_inserted, 1u);
    EXPECT_EQ(summary.files_renamed, 0u);
    EXPECT_EQ(summary.duplicate_groups_touched, 1u);
    EXPECT_EQ(live_at("a.txt").id, original.id);
}

TEST_F(SyncOrchestratorTest, FirstPathWinsWhenTwoCopiesReclaimOneEntry) {
    write_file(root_ / "a.txt", "moved and copied");
    sync();
    const auto original = live_at("a.txt");

    fs::remove(root_ / "a.txt");
    write_file(root_ / "b.txt", "moved and copied");
    write_file(root_ / "c.txt", "moved and copied");

    auto summary = sync();
    EXPECT_EQ(summary.files_renamed, 1u);
    EXPECT_EQ(summary.files_updated, 1u);
    EXPECT_EQ(summary.files_inserted, 1u);
    EXPECT_EQ(summary.files_failed, 0u);
    ASSERT_TRUE(summary.cleanup.has_value());
    EXPECT_EQ(summary.cleanup->files_deleted, 0u);

    EXPECT_EQ(live_at("b.txt").id, original.id);
    const auto copy = live_at("c.txt");
    EXPECT_NE(copy.id, original.id);
    EXPECT_EQ(copy.file_hash, original.file_hash);

    auto live = store_->count_live(case_id_);
    ASSERT_TRUE(live.is_ok());
    EXPECT_EQ(live.value(), 2);
}

TEST_F(SyncOrchestratorTest, FailedUpdatePhaseSkipsCleanupAndRetryKeepsIdentity) {
    write_file(root_ / "a.txt", "tagged evidence");
    sync();
    const auto original = live_at("a.txt");
    ASSERT_TRUE(store_->set_tags(original.id, {"keep"}).is_ok());

    fs::rename(root_ / "a.txt", root_ / "b.txt");
    ASSERT_TRUE(store_->database()
                    .execute("CREATE TRIGGER block_moves BEFORE UPDATE OF absolute_path ON files "
                             "BEGIN SELECT RAISE(ABORT, 'catalog is read-only'); END")
                    .is_ok());

    auto failed = sync();
    EXPECT_EQ(failed.files_updated, 0u);
    EXPECT_EQ(failed.files_renamed, 0u);
    EXPECT_EQ(failed.files_failed, 1u);
    ASSERT_EQ(failed.phase_errors.size(), 1u);
    EXPECT_EQ(failed.phase_errors[0].rfind("update", 0), 0u);
    EXPECT_FALSE(failed.cleanup.has_value());

    auto kept = store_->find_by_id(original.id);
    ASSERT_TRUE(kept.is_ok());
    ASSERT_TRUE(kept.value().has_value());
    EXPECT_FALSE(kept.value()->is_deleted());
    EXPECT_EQ(kept.value()->absolute_path, path_of("a.txt"));

    ASSERT_TRUE(store_->database().execute("DROP TRIGGER block_moves").is_ok());

    auto retried = sync();
    EXPECT_EQ(retried.files_renamed, 1u);
    EXPECT_EQ(retried.files_inserted, 0u);
    EXPECT_TRUE(retried.phase_errors.empty());

    const auto moved = live_at("b.txt");
    EXPECT_EQ(moved.id, original.id);
    EXPECT_EQ(moved.tags, std::vector<std::string>{"keep"});
}

TEST_F(SyncOrchestratorTest, FailedInsertPhaseRollsBackAndLaterPhasesRun) {
    write_file(root_ / "a.txt", "v1");
    sync();
    const auto original = live_at("a.txt");

    write_file(root_ / "a.txt", "v2 is longer");
    write_file(root_ / "new1.txt", "first newcomer");
    write_file(root_ / "new2.txt", "second newcomer");
    ASSERT_TRUE(store_->database()
                    .execute("CREATE TRIGGER block_inserts BEFORE INSERT ON files "
                             "BEGIN SELECT RAISE(ABORT, 'disk full'); END")
                    .is_ok());

    auto failed = sync();
    EXPECT_EQ(failed.total_files, 3u);
    EXPECT_EQ(failed.files_inserted, 0u);
    EXPECT_EQ(failed.files_failed, 2u);
    EXPECT_EQ(failed.files_updated, 1u);
    ASSERT_EQ(failed.phase_errors.size(), 1u);
    EXPECT_EQ(failed.phase_errors[0].rfind("insert", 0), 0u);
    EXPECT_FALSE(failed.cleanup.has_value());

    auto live = store_->count_live(case_id_);
    ASSERT_TRUE(live.is_ok());
    EXPECT_EQ(live.value(), 1);
    EXPECT_EQ(live_at("a.txt").id, original.id);
    EXPECT_EQ(live_at("a.txt").file_size, 12);

    ASSERT_TRUE(store_->database().execute("DROP TRIGGER block_inserts").is_ok());

    auto retried = sync();
    EXPECT_EQ(retried.files_inserted, 2u);
    EXPECT_EQ(retried.files_skipped, 1u);
    EXPECT_TRUE(retried.phase_errors.empty());
    EXPECT_TRUE(retried.cleanup.has_value());
}

TEST_F(SyncOrchestratorTest, ContentChangeDemotesReviewedEntry) {
    write_file(root_ / "report.txt", "draft");
    sync();
    const auto original = live_at("report.txt");
    ASSERT_TRUE(store_->set_status(original.id, LifecycleStatus::Reviewed).is_ok());

    write_file(root_ / "report.txt", "final version with more text");
    auto summary = sync();
    EXPECT_EQ(summary.files_updated, 1u);
    EXPECT_EQ(summary.files_renamed, 0u);

    const auto updated = live_at("report.txt");
    EXPECT_EQ(updated.id, original.id);
    EXPECT_EQ(updated.status, LifecycleStatus::InProgress);
    EXPECT_NE(updated.file_hash, original.file_hash);
    EXPECT_EQ(updated.added_at, original.added_at);
}

TEST_F(SyncOrchestratorTest, FinalizedEntryKeepsStatusOnContentChange) {
    write_file(root_ / "sealed.txt", "v1");
    sync();
    const auto original = live_at("sealed.txt");
    ASSERT_TRUE(store_->set_status(original.id, LifecycleStatus::Finalized).is_ok());

    write_file(root_ / "sealed.txt", "v2 is longer");
    sync();
    EXPECT_EQ(live_at("sealed.txt").status, LifecycleStatus::Finalized);
}

TEST_F(SyncOrchestratorTest, UnreadableFileFailsAloneAndIsNotCleaned) {
    write_file(root_ / "good.txt", "fine");
    write_file(root_ / "bad.txt", "cannot hash");

    test_support::FailingFingerprinter failing({"bad.txt"});
    auto summary = sync(failing);
    EXPECT_EQ(summary.files_inserted, 1u);
    EXPECT_EQ(summary.files_failed, 1u);
    ASSERT_EQ(summary.errors.size(), 1u);
    EXPECT_EQ(summary.errors[0].path, path_of("bad.txt"));
    EXPECT_TRUE(summary.phase_errors.empty());

    auto later = sync();
    EXPECT_EQ(later.files_inserted, 1u);
    EXPECT_EQ(later.files_skipped, 1u);
}

TEST_F(SyncOrchestratorTest, CleanupCanBeDisabled) {
    write_file(root_ / "a.txt", "one");
    sync();
    fs::remove(root_ / "a.txt");

    config_.cleanup_orphans = false;
    auto summary = sync();
    EXPECT_FALSE(summary.cleanup.has_value());

    auto live = store_->count_live(case_id_);
    ASSERT_TRUE(live.is_ok());
    EXPECT_EQ(live.value(), 1);
}

TEST_F(SyncOrchestratorTest, RejectsRemoteUnknownCaseAndMissingDirectory) {
    SyncOrchestrator orchestrator(*store_, bus_, sha256_, config_);

    ASSERT_TRUE(store_->add_source(case_id_, root_.string(), catalog::SourceLocation::Remote).is_ok());
    auto remote = orchestrator.sync_source(case_id_, root_.string());
    ASSERT_TRUE(remote.is_error());
    EXPECT_EQ(remote.error().kind, ErrorKind::Validation);

    auto unknown = orchestrator.sync_source(core::generate_id(), root_.string());
    ASSERT_TRUE(unknown.is_error());
    EXPECT_EQ(unknown.error().kind, ErrorKind::NotFound);

    auto missing = orchestrator.sync_source(case_id_, (root_ / "nope").string());
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().kind, ErrorKind::Validation);

    auto live = store_->count_live(case_id_);
    ASSERT_TRUE(live.is_ok());
    EXPECT_EQ(live.value(), 0);
}

TEST_F(SyncOrchestratorTest, SyncCaseWalksEveryLocalSource) {
    write_file(root_ / "one" / "a.txt", "first source");
    write_file(root_ / "two" / "b.txt", "second source");
    write_file(root_ / "two" / "c.txt", "second source, other file");

    ASSERT_TRUE(store_->add_source(case_id_, (root_ / "one").string(), catalog::SourceLocation::Local).is_ok());
    ASSERT_TRUE(store_->add_source(case_id_, (root_ / "two").string(), catalog::SourceLocation::Local).is_ok());
    ASSERT_TRUE(store_->add_source(case_id_, "s3://bucket/evidence", catalog::SourceLocation::Remote).is_ok());
    ASSERT_TRUE(store_->add_source(case_id_, (root_ / "vanished").string(), catalog::SourceLocation::Local).is_ok());

    SyncOrchestrator orchestrator(*store_, bus_, sha256_, config_);
    auto summary = orchestrator.sync_case(case_id_);
    ASSERT_TRUE(summary.is_ok()) << summary.error().message;
    EXPECT_EQ(summary.value().files_inserted, 3u);
    EXPECT_EQ(summary.value().total_files, 3u);
    ASSERT_EQ(summary.value().errors.size(), 1u);
    EXPECT_EQ(summary.value().errors[0].path, (root_ / "vanished").string());
    EXPECT_EQ(metrics_->get_stats().sync_passes.load(), 2u);
}

TEST_F(SyncOrchestratorTest, TrailingSlashSourceIsWalkedOnce) {
    write_file(root_ / "a.txt", "only file");
    ASSERT_TRUE(store_->add_source(case_id_, root_.string() + "/", catalog::SourceLocation::Local).is_ok());

    SyncOrchestrator orchestrator(*store_, bus_, sha256_, config_);
    auto first = orchestrator.sync_case(case_id_);
    ASSERT_TRUE(first.is_ok()) << first.error().message;
    EXPECT_EQ(first.value().files_inserted, 1u);

    auto second = orchestrator.sync_case(case_id_);
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(second.value().total_files, 1u);
    EXPECT_EQ(second.value().files_skipped, 1u);

    auto direct = orchestrator.sync_source(case_id_, root_.string() + "/.");
    ASSERT_TRUE(direct.is_ok());

    auto sources = store_->list_sources(case_id_);
    ASSERT_TRUE(sources.is_ok());
    ASSERT_EQ(sources.value().size(), 1u);
    EXPECT_EQ(sources.value()[0].source_path, root_.string());
}

TEST_F(SyncOrchestratorTest, RefreshRereadsSelectedEntries) {
    write_file(root_ / "a.txt", "original");
    write_file(root_ / "b.txt", "untouched");
    sync();
    const auto a = live_at("a.txt");
    const auto b = live_at("b.txt");
    ASSERT_TRUE(store_->set_status(a.id, LifecycleStatus::Flagged).is_ok());

    write_file(root_ / "a.txt", "rewritten content");

    SyncOrchestrator orchestrator(*store_, bus_, sha256_, config_);
    auto refreshed = orchestrator.refresh_entries(case_id_, {a.id}, true);
    ASSERT_TRUE(refreshed.is_ok()) << refreshed.error().message;
    EXPECT_EQ(refreshed.value().files_refreshed, 1u);
    EXPECT_EQ(refreshed.value().files_failed, 0u);

    const auto after = live_at("a.txt");
    EXPECT_EQ(after.status, LifecycleStatus::InProgress);
    EXPECT_EQ(after.file_size, 17);
    EXPECT_NE(after.file_hash, a.file_hash);
    EXPECT_EQ(live_at("b.txt").updated_at, b.updated_at);
}

TEST_F(SyncOrchestratorTest, RefreshValidatesEveryIdFirst) {
    write_file(root_ / "a.txt", "original");
    sync();
    const auto a = live_at("a.txt");
    write_file(root_ / "a.txt", "changed before refresh");

    SyncOrchestrator orchestrator(*store_, bus_, sha256_, config_);

    auto bad_id = orchestrator.refresh_entries(case_id_, {a.id, "not-a-uuid"}, false);
    ASSERT_TRUE(bad_id.is_error());
    EXPECT_EQ(bad_id.error().kind, ErrorKind::Validation);

    auto unknown = orchestrator.refresh_entries(case_id_, {a.id, core::generate_id()}, false);
    ASSERT_TRUE(unknown.is_error());
    EXPECT_EQ(unknown.error().kind, ErrorKind::Validation);

    EXPECT_EQ(live_at("a.txt").file_hash, a.file_hash);
}

TEST_F(SyncOrchestratorTest, RefreshReportsMissingFilesPerEntry) {
    write_file(root_ / "a.txt", "one");
    write_file(root_ / "b.txt", "two");
    sync();
    const auto a = live_at("a.txt");
    const auto b = live_at("b.txt");
    fs::remove(root_ / "a.txt");

    SyncOrchestrator orchestrator(*store_, bus_, sha256_, config_);
    auto refreshed = orchestrator.refresh_entries(case_id_, {a.id, b.id}, false);
    ASSERT_TRUE(refreshed.is_ok());
    EXPECT_EQ(refreshed.value().files_refreshed, 1u);
    EXPECT_EQ(refreshed.value().files_failed, 1u);
    ASSERT_EQ(refreshed.value().errors.size(), 1u);
    EXPECT_EQ(refreshed.value().errors[0].path, path_of("a.txt"));
}
