// =============================================================================
// swiss-uid - Error Handling Tests
// =============================================================================
// Unit tests for error codes, the exception hierarchy and Result helpers.
// =============================================================================

#include "suid/common/error.h"

#include <gtest/gtest.h>

#include <string>

namespace suid {
namespace {

// =============================================================================
// ErrorCode Tests
// =============================================================================

TEST(ErrorCodeTest, ExitCodesAreStable) {
    EXPECT_EQ(toExitCode(ErrorCode::kSuccess), 0);
    EXPECT_EQ(toExitCode(ErrorCode::kUsageError), 1);
    EXPECT_EQ(toExitCode(ErrorCode::kIOError), 2);
    EXPECT_EQ(toExitCode(ErrorCode::kInvalidPrefix), 3);
    EXPECT_EQ(toExitCode(ErrorCode::kCheckDigitMismatch), 7);
    EXPECT_EQ(toExitCode(ErrorCode::kInvalidSuffix), 8);
}

TEST(ErrorCodeTest, Names) {
    EXPECT_EQ(errorCodeToString(ErrorCode::kLeadingZero), "leading zero");
    EXPECT_EQ(errorCodeToString(ErrorCode::kNoValidCheckDigit), "no valid check digit");
    EXPECT_EQ(errorCodeToString(ErrorCode::kInvalidSuffix), "invalid suffix");
}

TEST(ErrorCodeTest, ChecksumCategory) {
    EXPECT_TRUE(isChecksumError(ErrorCode::kNoValidCheckDigit));
    EXPECT_TRUE(isChecksumError(ErrorCode::kCheckDigitMismatch));
    EXPECT_FALSE(isChecksumError(ErrorCode::kLeadingZero));
    EXPECT_FALSE(isChecksumError(ErrorCode::kInvalidSuffix));
}

// =============================================================================
// Exception Tests
// =============================================================================

TEST(SuidExceptionTest, WhatIncludesCategoryAndContext) {
    FormatError ex(ErrorCode::kInvalidPrefix, "prefix must be 'CHE' or 'ADM'",
                   ErrorContext{"XYZ-109.322.551"}.withLine(4));

    const std::string what = ex.what();
    EXPECT_NE(what.find("[invalid prefix]"), std::string::npos);
    EXPECT_NE(what.find("input: 'XYZ-109.322.551'"), std::string::npos);
    EXPECT_NE(what.find("line: 4"), std::string::npos);
    EXPECT_EQ(ex.exitCode(), 3);
    EXPECT_TRUE(ex.hasContext());
}

TEST(SuidExceptionTest, EmptyContextFormatsToNothing) {
    ErrorContext context;
    EXPECT_TRUE(context.format().empty());

    ChecksumError ex(ErrorCode::kCheckDigitMismatch, "bad check digit", context);
    EXPECT_EQ(std::string(ex.what()), "[check digit mismatch] bad check digit");
}

TEST(SuidExceptionTest, IOErrorAppendsSystemError) {
    const auto ec = std::make_error_code(std::errc::no_such_file_or_directory);
    IOError ex("cannot open 'uids.txt'", ec);

    EXPECT_NE(ex.message().find("cannot open 'uids.txt'"), std::string::npos);
    EXPECT_NE(ex.message().find(ec.message()), std::string::npos);
    EXPECT_EQ(ex.code(), ErrorCode::kIOError);
    EXPECT_EQ(ex.exitCode(), 2);
}

// =============================================================================
// Result Tests
// =============================================================================

TEST(ResultTest, ThrowExceptionMapsCodesToTypes) {
    EXPECT_THROW(Error(ErrorCode::kUsageError, "x").throwException(), UsageError);
    EXPECT_THROW(Error(ErrorCode::kIOError, "x").throwException(), IOError);
    EXPECT_THROW(Error(ErrorCode::kInvalidPrefix, "x").throwException(), FormatError);
    EXPECT_THROW(Error(ErrorCode::kInvalidSuffix, "x").throwException(), FormatError);
    EXPECT_THROW(Error(ErrorCode::kNoValidCheckDigit, "x").throwException(), ChecksumError);
    EXPECT_THROW(Error(ErrorCode::kCheckDigitMismatch, "x").throwException(), ChecksumError);
}

TEST(ResultTest, UnwrapOrThrow) {
    EXPECT_EQ(unwrapOrThrow(Result<int>{42}), 42);

    try {
        [[maybe_unused]] int value =
            unwrapOrThrow(makeError<int>(ErrorCode::kCheckDigitMismatch, "mismatch"));
        FAIL() << "expected ChecksumError";
    } catch (const ChecksumError& ex) {
        EXPECT_EQ(ex.code(), ErrorCode::kCheckDigitMismatch);
        EXPECT_EQ(ex.message(), "mismatch");
    }
}

}  // namespace
}  // namespace suid
