/**
 * @file WipeTypesTest.cpp
 * @brief Unit tests for model helpers
 */

#include "models/WipeOptions.hpp"
#include "models/WipeTypes.hpp"

#include <gtest/gtest.h>

#include <cerrno>

TEST(WipeTypesTest, ParseStandard_AcceptsShortAndFullNames) {
    EXPECT_EQ(parse_standard("clear"), SanitizationStandard::NIST_CLEAR);
    EXPECT_EQ(parse_standard("Purge"), SanitizationStandard::NIST_PURGE);
    EXPECT_EQ(parse_standard("dod"), SanitizationStandard::DOD_LEGACY);
    EXPECT_EQ(parse_standard("NIST_PURGE"), SanitizationStandard::NIST_PURGE);
    EXPECT_EQ(parse_standard("gutmann"), std::nullopt);
}

TEST(WipeTypesTest, EnumNames_ParseBack) {
    for (auto kind : {ErrorKind::PermissionDenied, ErrorKind::TargetVanished,
                      ErrorKind::SyncFailed, ErrorKind::AuditWriteFailed, ErrorKind::IoError}) {
        EXPECT_EQ(parse_error_kind(to_string(kind)), kind);
    }
    for (auto stage : {WipeStage::Classify, WipeStage::Overwrite, WipeStage::Audit}) {
        EXPECT_EQ(parse_wipe_stage(to_string(stage)), stage);
    }
    EXPECT_EQ(parse_storage_kind("SolidState"), StorageKind::SolidState);
}

TEST(WipeTypesTest, ErrorKindFromErrno_ClassifiesCommonCodes) {
    EXPECT_EQ(error_kind_from_errno(EACCES), ErrorKind::PermissionDenied);
    EXPECT_EQ(error_kind_from_errno(EWOULDBLOCK), ErrorKind::PermissionDenied);
    EXPECT_EQ(error_kind_from_errno(ENOENT), ErrorKind::TargetVanished);
    EXPECT_EQ(error_kind_from_errno(ENOSPC), ErrorKind::IoError);
    EXPECT_EQ(error_kind_from_errno(EIO, ErrorKind::SyncFailed), ErrorKind::SyncFailed);
}

TEST(WipeTypesTest, PatternByte_ZeroAndOne) {
    EXPECT_EQ(pattern_byte(Pattern::Zero), 0x00);
    EXPECT_EQ(pattern_byte(Pattern::One), 0xFF);
}

TEST(WipeTypesTest, WipeResultFail_RecordsError) {
    WipeResult result;
    result.success = true;
    result.fail(WipeError{ErrorKind::ScrubFailed, WipeStage::Scrub, "rename failed", EXDEV});

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::ScrubFailed);
    EXPECT_EQ(result.error_stage, WipeStage::Scrub);
    EXPECT_EQ(result.error_message, "rename failed");
}

TEST(WipeTypesTest, ExitCode_MatchesOutcome) {
    EXPECT_EQ(exit_code(WipeOutcome::Success), 0);
    EXPECT_EQ(exit_code(WipeOutcome::TotalFailure), 1);
    EXPECT_EQ(exit_code(WipeOutcome::PartialFailure), 2);
    EXPECT_EQ(exit_code(WipeOutcome::DryRun), 3);
}
