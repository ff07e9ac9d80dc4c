/**
 * @file OrchestratorTest.cpp
 * @brief Unit tests for Orchestrator
 */

#include "services/Orchestrator.hpp"

#include "fixtures/TestFixtures.hpp"
#include "mocks/MockAuditLogger.hpp"
#include "mocks/MockMetadataScrubber.hpp"
#include "mocks/MockStorageClassifier.hpp"
#include "services/AuditLogger.hpp"
#include "util/Logger.hpp"

#include <gtest/gtest.h>

#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using ::testing::_;
using ::testing::Return;

class OrchestratorTest : public SanitizerTestFixture {
protected:
    void SetUp() override {
        classifier = MockStorageClassifier::CreateNiceMock(StorageKind::Rotational);
        audit = MockAuditLogger::CreateRecordingMock();
        orchestrator = std::make_unique<Orchestrator>(classifier, audit);
    }

    auto ConfirmedOptions() -> WipeOptions {
        WipeOptions options;
        options.pre_confirmed = true;
        options.on_progress = CreateCapturingCallback();
        return options;
    }

    std::shared_ptr<MockStorageClassifier> classifier;
    std::shared_ptr<MockAuditLogger> audit;
    std::unique_ptr<Orchestrator> orchestrator;
};

// Test: single file, full pipeline
TEST_F(OrchestratorTest, Wipe_PurgeOnRotationalRunsThreePassesAndVerifies) {
    const auto path = temp_dir / "secrets.bin";
    TestFiles::write_random(path, 10 * 1'024 * 1'024);

    auto options = ConfirmedOptions();
    options.standard = SanitizationStandard::NIST_PURGE;
    options.verify = true;

    const auto summary = orchestrator->wipe(path, options);

    EXPECT_EQ(summary.outcome, WipeOutcome::Success) << summary.message;
    ASSERT_EQ(summary.results.size(), 1U);
    const auto& result = summary.results[0];
    EXPECT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(result.passes_executed, 3);
    EXPECT_EQ(result.verified, true);
    EXPECT_EQ(result.size_bytes, 10U * 1'024 * 1'024);
    EXPECT_EQ(result.sha256_before.size(), 64U);
    EXPECT_EQ(result.strategy_label, "HDD (purge)");
    EXPECT_EQ(summary.total_bytes_overwritten, 3U * 10 * 1'024 * 1'024);
    EXPECT_FALSE(fs::exists(path));
    EXPECT_FALSE(fs::exists(result.final_path));

    const auto records = audit->records();
    ASSERT_EQ(records.size(), 1U);
    EXPECT_EQ(records[0].result.passes_executed, 3);
    EXPECT_EQ(records[0].user, "tester");
    EXPECT_EQ(records[0].hostname, "testhost");
    EXPECT_FALSE(records[0].timestamp_utc.empty());

    std::lock_guard lock(progress_mutex);
    ASSERT_FALSE(captured_progress.empty());
    EXPECT_EQ(captured_progress.back().pass_index, 3);
    EXPECT_EQ(captured_progress.back().bytes_written, 10U * 1'024 * 1'024);
}

TEST_F(OrchestratorTest, Wipe_ClearOnSolidStateRunsOnePass) {
    classifier = MockStorageClassifier::CreateNiceMock(StorageKind::SolidState);
    orchestrator = std::make_unique<Orchestrator>(classifier, audit);

    const auto path = temp_dir / "notes.txt";
    TestFiles::write_text(path, "meeting notes");

    const auto summary = orchestrator->wipe(path, ConfirmedOptions());

    EXPECT_EQ(summary.outcome, WipeOutcome::Success);
    ASSERT_EQ(summary.results.size(), 1U);
    EXPECT_EQ(summary.results[0].passes_executed, 1);
    EXPECT_FALSE(summary.results[0].verified.has_value());
    EXPECT_EQ(summary.results[0].strategy_label, "SSD/NVMe (clear)");
    EXPECT_FALSE(fs::exists(path));
}

TEST_F(OrchestratorTest, Wipe_EmptyFileIsSanitized) {
    const auto path = temp_dir / "empty.bin";
    TestFiles::write(path, {});

    auto options = ConfirmedOptions();
    options.verify = true;
    const auto summary = orchestrator->wipe(path, options);

    EXPECT_EQ(summary.outcome, WipeOutcome::Success) << summary.message;
    ASSERT_EQ(summary.results.size(), 1U);
    EXPECT_EQ(summary.results[0].verified, true);
    EXPECT_EQ(summary.total_bytes_overwritten, 0U);
    EXPECT_FALSE(fs::exists(path));
}

// Test: verification and scrub failures
TEST_F(OrchestratorTest, Wipe_LowEntropyResultFailsVerificationButFileIsRemoved) {
    classifier = MockStorageClassifier::CreateNiceMock(StorageKind::SolidState);
    orchestrator = std::make_unique<Orchestrator>(classifier, audit);

    // Thirteen bytes cannot reach 7 bits/byte whatever was written
    const auto path = temp_dir / "notes.txt";
    TestFiles::write_text(path, "meeting notes");

    auto options = ConfirmedOptions();
    options.verify = true;
    const auto summary = orchestrator->wipe(path, options);

    EXPECT_EQ(summary.outcome, WipeOutcome::TotalFailure);
    EXPECT_EQ(summary.files_failed, 1U);
    ASSERT_EQ(summary.results.size(), 1U);
    const auto& result = summary.results[0];
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.verified, false);
    EXPECT_EQ(result.error_kind, ErrorKind::VerificationFailed);
    EXPECT_EQ(result.error_stage, WipeStage::Verify);
    EXPECT_NE(result.error_message.find("7.000"), std::string::npos) << result.error_message;
    ASSERT_TRUE(result.mean_entropy.has_value());
    EXPECT_LE(*result.mean_entropy, 7.0);
    EXPECT_EQ(result.passes_executed, 1);

    EXPECT_FALSE(fs::exists(path));
    EXPECT_FALSE(result.final_path.empty());
    EXPECT_FALSE(fs::exists(result.final_path));
    EXPECT_TRUE(fs::is_empty(temp_dir.path()));

    const auto records = audit->records();
    ASSERT_EQ(records.size(), 1U);
    EXPECT_FALSE(records[0].result.success);
    EXPECT_EQ(records[0].result.verified, false);
    EXPECT_EQ(records[0].result.error_kind, ErrorKind::VerificationFailed);
}

TEST_F(OrchestratorTest, Wipe_DegradedScrubIsScrubFailedWithFileGone) {
    auto scrubber = MockMetadataScrubber::CreateDegradingMock();
    EXPECT_CALL(*scrubber, scrub(_)).Times(1);
    Orchestrator with_degraded_scrub(classifier, audit, scrubber);

    const auto path = temp_dir / "report.pdf";
    TestFiles::write_random(path, 32 * 1'024);

    const auto summary = with_degraded_scrub.wipe(path, ConfirmedOptions());

    EXPECT_EQ(summary.outcome, WipeOutcome::TotalFailure);
    ASSERT_EQ(summary.results.size(), 1U);
    const auto& result = summary.results[0];
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::ScrubFailed);
    EXPECT_EQ(result.error_stage, WipeStage::Scrub);
    EXPECT_GE(result.passes_executed, 1);
    EXPECT_FALSE(result.final_path.empty());
    EXPECT_FALSE(fs::exists(path));
    EXPECT_FALSE(fs::exists(result.final_path));

    const auto records = audit->records();
    ASSERT_EQ(records.size(), 1U);
    EXPECT_EQ(records[0].result.error_kind, ErrorKind::ScrubFailed);
}

TEST_F(OrchestratorTest, Wipe_UnlinkFailureIsReportedFromScrub) {
    auto scrubber = std::make_shared<testing::NiceMock<MockMetadataScrubber>>();
    EXPECT_CALL(*scrubber, scrub(_))
        .WillOnce(Return(std::unexpected(WipeError{ErrorKind::PermissionDenied,
                                                   WipeStage::Scrub, "unlink refused", EACCES})));
    Orchestrator with_failing_scrub(classifier, audit, scrubber);

    const auto path = temp_dir / "data.bin";
    TestFiles::write_random(path, 4'096);

    const auto summary = with_failing_scrub.wipe(path, ConfirmedOptions());

    ASSERT_EQ(summary.results.size(), 1U);
    EXPECT_EQ(summary.results[0].error_kind, ErrorKind::PermissionDenied);
    EXPECT_EQ(summary.results[0].error_stage, WipeStage::Scrub);
    EXPECT_EQ(audit->records().size(), 1U);
}

// Test: directories
TEST_F(OrchestratorTest, Wipe_LockedFileInDirectoryIsPartialFailure) {
    const auto dir = temp_dir / "project";
    TestFiles::write_text(dir / "a.txt", "alpha");
    TestFiles::write_text(dir / "b.txt", "bravo");
    TestFiles::write_text(dir / "c.txt", "charlie");
    HeldLock lock(dir / "b.txt");

    const auto summary = orchestrator->wipe(dir, ConfirmedOptions());

    EXPECT_EQ(summary.outcome, WipeOutcome::PartialFailure);
    EXPECT_EQ(summary.total_files, 3U);
    EXPECT_EQ(summary.files_wiped, 2U);
    EXPECT_EQ(summary.files_failed, 1U);
    EXPECT_EQ(summary.message, "2 files sanitized, 1 failed");
    ASSERT_EQ(summary.results.size(), 3U);

    const auto& locked = summary.results[1];
    EXPECT_EQ(locked.path.filename().string(), "b.txt");
    EXPECT_FALSE(locked.success);
    EXPECT_EQ(locked.error_kind, ErrorKind::PermissionDenied);
    EXPECT_EQ(locked.error_stage, WipeStage::Overwrite);

    EXPECT_FALSE(fs::exists(dir / "a.txt"));
    EXPECT_FALSE(fs::exists(dir / "c.txt"));
    EXPECT_EQ(TestFiles::read(dir / "b.txt").size(), 5U);

    const auto records = audit->records();
    ASSERT_EQ(records.size(), 3U);
    EXPECT_EQ(std::count_if(records.begin(), records.end(),
                            [](const AuditRecord& r) { return !r.result.success; }),
              1);
}

TEST_F(OrchestratorTest, Wipe_ResultsFollowEnumerationOrder) {
    const auto dir = temp_dir / "many";
    for (const auto* name : {"e.bin", "a.bin", "sub/c.bin", "d.bin", "b.bin"}) {
        TestFiles::write_random(dir / name, 2'048);
    }

    auto options = ConfirmedOptions();
    options.max_concurrency = 3;
    const auto summary = orchestrator->wipe(dir, options);

    EXPECT_EQ(summary.outcome, WipeOutcome::Success);
    ASSERT_EQ(summary.results.size(), 5U);
    ASSERT_EQ(summary.previews.size(), 5U);
    for (size_t i = 0; i < summary.results.size(); ++i) {
        EXPECT_EQ(summary.results[i].path.string(), summary.previews[i].path.string());
    }
    EXPECT_EQ(summary.results[0].path.filename().string(), "a.bin");
}

TEST_F(OrchestratorTest, Wipe_RemovesEmptiedDirectories) {
    const auto dir = temp_dir / "tree";
    TestFiles::write_text(dir / "one" / "two" / "deep.txt", "deep");
    TestFiles::write_text(dir / "top.txt", "top");
    fs::create_directories(dir / "already-empty");

    const auto summary = orchestrator->wipe(dir, ConfirmedOptions());

    EXPECT_EQ(summary.outcome, WipeOutcome::Success);
    EXPECT_FALSE(fs::exists(dir));
}

TEST_F(OrchestratorTest, Wipe_KeepDirectoriesWhenAsked) {
    const auto dir = temp_dir / "tree";
    TestFiles::write_text(dir / "one" / "deep.txt", "deep");

    auto options = ConfirmedOptions();
    options.remove_empty_directories = false;
    const auto summary = orchestrator->wipe(dir, options);

    EXPECT_EQ(summary.outcome, WipeOutcome::Success);
    EXPECT_TRUE(fs::is_directory(dir / "one"));
    EXPECT_TRUE(fs::is_empty(dir / "one"));
}

TEST_F(OrchestratorTest, Wipe_NonRecursiveLeavesSubdirectories) {
    const auto dir = temp_dir / "flat";
    TestFiles::write_text(dir / "top.txt", "top");
    TestFiles::write_text(dir / "nested" / "inner.txt", "inner");

    auto options = ConfirmedOptions();
    options.recursive = false;
    const auto summary = orchestrator->wipe(dir, options);

    EXPECT_EQ(summary.total_files, 1U);
    EXPECT_FALSE(fs::exists(dir / "top.txt"));
    EXPECT_TRUE(fs::exists(dir / "nested" / "inner.txt"));
}

TEST_F(OrchestratorTest, Wipe_SkipsSymlinks) {
    const auto outside = temp_dir / "outside.txt";
    const auto dir = temp_dir / "links";
    TestFiles::write_text(outside, "must survive");
    TestFiles::write_text(dir / "real.txt", "real");
    fs::create_symlink(outside, dir / "link.txt");

    const auto summary = orchestrator->wipe(dir, ConfirmedOptions());

    EXPECT_EQ(summary.outcome, WipeOutcome::Success);
    EXPECT_EQ(summary.total_files, 1U);
    EXPECT_TRUE(fs::is_symlink(dir / "link.txt"));
    EXPECT_EQ(TestFiles::read(outside).size(), 12U);
}

TEST_F(OrchestratorTest, Wipe_EmptyDirectorySucceedsWithNothingToDo) {
    const auto dir = temp_dir / "nothing";
    fs::create_directories(dir);

    const auto summary = orchestrator->wipe(dir, ConfirmedOptions());

    EXPECT_EQ(summary.outcome, WipeOutcome::Success);
    EXPECT_EQ(summary.total_files, 0U);
    EXPECT_TRUE(audit->records().empty());
}

// Test: gates
TEST_F(OrchestratorTest, Wipe_DryRunTouchesNothing) {
    const auto path = temp_dir / "keep.bin";
    TestFiles::write_pattern(path, 4'096, 0x33);

    auto options = ConfirmedOptions();
    options.dry_run = true;
    options.standard = SanitizationStandard::DOD_LEGACY;
    const auto summary = orchestrator->wipe(path, options);

    EXPECT_EQ(summary.outcome, WipeOutcome::DryRun);
    EXPECT_TRUE(summary.results.empty());
    ASSERT_EQ(summary.previews.size(), 1U);
    EXPECT_EQ(summary.previews[0].size_bytes, 4'096U);
    EXPECT_EQ(summary.previews[0].plan.pass_count(), 3);
    EXPECT_TRUE(TestFiles::all_equal(TestFiles::read(path), 0x33));
    EXPECT_TRUE(audit->records().empty());
}

TEST_F(OrchestratorTest, Wipe_DirectoryDryRunLeavesContentAndTimesAlone) {
    const auto dir = temp_dir / "project";
    TestFiles::write_text(dir / "a.txt", "alpha");
    TestFiles::write_pattern(dir / "nested" / "b.bin", 8'192, 0x44);
    TestFiles::write_text(dir / "nested" / "deeper" / "c.txt", "charlie");

    const std::vector<fs::path> files = {dir / "a.txt", dir / "nested" / "b.bin",
                                         dir / "nested" / "deeper" / "c.txt"};
    const auto stamp = fs::file_time_type::clock::now() - std::chrono::hours(24 * 30);
    std::vector<std::vector<uint8_t>> contents;
    for (const auto& file : files) {
        fs::last_write_time(file, stamp);
        contents.push_back(TestFiles::read(file));
    }

    auto options = ConfirmedOptions();
    options.dry_run = true;
    options.verify = true;
    const auto summary = orchestrator->wipe(dir, options);

    EXPECT_EQ(summary.outcome, WipeOutcome::DryRun);
    EXPECT_TRUE(summary.results.empty());
    ASSERT_EQ(summary.previews.size(), 3U);
    EXPECT_EQ(summary.total_bytes_overwritten, 0U);
    for (size_t i = 0; i < files.size(); ++i) {
        EXPECT_EQ(summary.previews[i].path.string(), files[i].string());
        EXPECT_EQ(TestFiles::read(files[i]), contents[i]) << files[i].string();
        EXPECT_TRUE(fs::last_write_time(files[i]) == stamp) << files[i].string();
    }
    EXPECT_TRUE(fs::exists(dir / "nested" / "deeper"));
    EXPECT_TRUE(audit->records().empty());
    std::lock_guard lock(progress_mutex);
    EXPECT_TRUE(captured_progress.empty());
}

TEST_F(OrchestratorTest, Wipe_RefusedConfirmationTouchesNothing) {
    const auto path = temp_dir / "keep.bin";
    TestFiles::write_pattern(path, 4'096, 0x33);

    WipeOptions options;
    size_t shown = 0;
    options.confirm = [&shown](const std::vector<FilePreview>& previews) {
        shown = previews.size();
        return false;
    };
    const auto summary = orchestrator->wipe(path, options);

    EXPECT_EQ(summary.outcome, WipeOutcome::TotalFailure);
    EXPECT_EQ(shown, 1U);
    EXPECT_TRUE(summary.results.empty());
    EXPECT_TRUE(TestFiles::all_equal(TestFiles::read(path), 0x33));
    EXPECT_TRUE(audit->records().empty());
}

TEST_F(OrchestratorTest, Wipe_NoConfirmationCallbackTouchesNothing) {
    const auto path = temp_dir / "keep.bin";
    TestFiles::write_text(path, "data");

    const auto summary = orchestrator->wipe(path, WipeOptions{});

    EXPECT_EQ(summary.outcome, WipeOutcome::TotalFailure);
    EXPECT_TRUE(fs::exists(path));
}

TEST_F(OrchestratorTest, Wipe_MissingTargetIsTotalFailure) {
    const auto summary = orchestrator->wipe(temp_dir / "absent", ConfirmedOptions());

    EXPECT_EQ(summary.outcome, WipeOutcome::TotalFailure);
    EXPECT_NE(summary.message.find("not found"), std::string::npos);
    EXPECT_TRUE(audit->records().empty());
}

// Test: audit trail failures
TEST_F(OrchestratorTest, Wipe_AuditFailureDowngradesOutcome) {
    auto failing = std::make_shared<testing::NiceMock<MockAuditLogger>>();
    ON_CALL(*failing, identity()).WillByDefault(Return(AuditIdentity{"tester", "testhost"}));
    EXPECT_CALL(*failing, append(_))
        .WillOnce(Return(std::unexpected(
            WipeError{ErrorKind::AuditWriteFailed, WipeStage::Audit, "disk full", ENOSPC})));
    Orchestrator with_failing_audit(classifier, failing);

    const auto path = temp_dir / "data.txt";
    TestFiles::write_text(path, "data");
    const auto summary = with_failing_audit.wipe(path, ConfirmedOptions());

    EXPECT_EQ(summary.outcome, WipeOutcome::PartialFailure);
    EXPECT_EQ(summary.audit_failures, 1U);
    EXPECT_EQ(summary.files_wiped, 1U);
    EXPECT_TRUE(summary.results[0].success);
    EXPECT_FALSE(fs::exists(path));
}

TEST_F(OrchestratorTest, Wipe_WritesJsonlTrail) {
    const auto trail = temp_dir / "audit.jsonl";
    auto logger = std::make_shared<JsonlAuditLogger>(trail, AuditIdentity{"alice", "box"});
    Orchestrator real_audit(classifier, logger);

    const auto dir = temp_dir / "work";
    TestFiles::write_text(dir / "a.txt", "a");
    TestFiles::write_text(dir / "b.txt", "b");

    auto options = ConfirmedOptions();
    options.standard = SanitizationStandard::NIST_PURGE;
    const auto summary = real_audit.wipe(dir, options);
    ASSERT_EQ(summary.outcome, WipeOutcome::Success);

    auto records = logger->read_records();
    ASSERT_TRUE(records);
    ASSERT_EQ(records->size(), 2U);
    for (const auto& record : *records) {
        EXPECT_EQ(record.result.passes_executed, 3);
        EXPECT_EQ(record.result.standard_used, SanitizationStandard::NIST_PURGE);
        EXPECT_EQ(record.user, "alice");
        EXPECT_TRUE(record.result.success);
    }
}

// Test: helpers
TEST_F(OrchestratorTest, CollectFiles_SortedAndRecursive) {
    TestFiles::write_text(temp_dir / "z.txt", "z");
    TestFiles::write_text(temp_dir / "a" / "m.txt", "m");
    TestFiles::write_text(temp_dir / "b.txt", "b");

    auto files = Orchestrator::collect_files(temp_dir.path(), true);
    ASSERT_TRUE(files);
    ASSERT_EQ(files->size(), 3U);
    EXPECT_EQ((*files)[0].string(), (temp_dir / "a" / "m.txt").string());
    EXPECT_EQ((*files)[1].string(), (temp_dir / "b.txt").string());
    EXPECT_EQ((*files)[2].string(), (temp_dir / "z.txt").string());
}

TEST_F(OrchestratorTest, CollectFiles_WarnsAboutUnreadableDirectory) {
    if (::geteuid() == 0) {
        GTEST_SKIP() << "root can read any directory";
    }

    const auto root = temp_dir / "tree";
    TestFiles::write_text(root / "visible.txt", "v");
    TestFiles::write_text(root / "locked" / "hidden.txt", "h");
    TestFiles::write_text(root / "open" / "inner.txt", "i");
    ASSERT_EQ(::chmod((root / "locked").c_str(), 0), 0);

    auto& logger = util::Logger::instance();
    ASSERT_TRUE(logger.initialize(temp_dir / "logs", "collect-test", util::LogLevel::INFO));
    const auto log_path = logger.get_log_file_path();

    std::vector<fs::path> skipped;
    auto files = Orchestrator::collect_files(root, true, &skipped);

    logger.shutdown();
    ::chmod((root / "locked").c_str(), 0700);

    ASSERT_TRUE(files) << files.error().message;
    ASSERT_EQ(files->size(), 2U);
    EXPECT_EQ((*files)[0].string(), (root / "open" / "inner.txt").string());
    EXPECT_EQ((*files)[1].string(), (root / "visible.txt").string());
    ASSERT_EQ(skipped.size(), 1U);
    EXPECT_EQ(skipped[0].string(), (root / "locked").string());

    std::ifstream log(log_path);
    std::stringstream text;
    text << log.rdbuf();
    EXPECT_NE(text.str().find("skipping unreadable directory " + (root / "locked").string()),
              std::string::npos)
        << text.str();
}

TEST_F(OrchestratorTest, CollectFiles_MissingDirectoryFails) {
    auto files = Orchestrator::collect_files(temp_dir / "absent", true);

    ASSERT_FALSE(files);
    EXPECT_EQ(files.error().code, ENOENT);
}

TEST_F(OrchestratorTest, RemoveEmptyDirectories_KeepsNonEmpty) {
    const auto root = temp_dir / "root";
    fs::create_directories(root / "empty" / "nested");
    TestFiles::write_text(root / "full" / "keep.txt", "keep");

    const auto removed = Orchestrator::remove_empty_directories(root);

    EXPECT_EQ(removed, 2U);
    EXPECT_FALSE(fs::exists(root / "empty"));
    EXPECT_TRUE(fs::exists(root / "full" / "keep.txt"));
    EXPECT_TRUE(fs::exists(root));
}
