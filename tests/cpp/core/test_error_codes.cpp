/**
 * @file test_error_codes.cpp
 * @brief Unit tests for error codes and OpResult.
 */

#include "core/error_codes.h"

#include <gtest/gtest.h>

using namespace playdeck;

// ============================================================
// ErrorCode to String Tests
// ============================================================

TEST(ErrorCodes, ErrorCodeToString) {
    EXPECT_STREQ(errorCodeToString(ErrorCode::OK), "OK");
    EXPECT_STREQ(errorCodeToString(ErrorCode::PLAYBACK_INVALID_STATE), "PLAYBACK_INVALID_STATE");
    EXPECT_STREQ(errorCodeToString(ErrorCode::CATALOG_NOT_FOUND), "CATALOG_NOT_FOUND");
    EXPECT_STREQ(errorCodeToString(ErrorCode::CATALOG_UNSUPPORTED_EXPORT_FORMAT),
                 "CATALOG_UNSUPPORTED_EXPORT_FORMAT");
    EXPECT_STREQ(errorCodeToString(ErrorCode::VALIDATION_INVALID_ARGUMENT),
                 "VALIDATION_INVALID_ARGUMENT");
}

TEST(ErrorCodes, UnknownErrorCodeReturnsUnknown) {
    auto unknownCode = static_cast<ErrorCode>(0xFFFF);
    EXPECT_STREQ(errorCodeToString(unknownCode), "UNKNOWN_ERROR");
}

// ============================================================
// Error Category Tests
// ============================================================

TEST(ErrorCodes, GetErrorCategory) {
    EXPECT_STREQ(getErrorCategory(ErrorCode::OK), "ok");
    EXPECT_STREQ(getErrorCategory(ErrorCode::PLAYBACK_BACKEND_ERROR), "playback");
    EXPECT_STREQ(getErrorCategory(ErrorCode::CATALOG_PERSISTENCE_ERROR), "catalog");
    EXPECT_STREQ(getErrorCategory(ErrorCode::VALIDATION_INVALID_CONFIG), "validation");
    EXPECT_STREQ(getErrorCategory(ErrorCode::INTERNAL_UNKNOWN), "internal");
}

TEST(ErrorCodes, CategoryPredicates) {
    static_assert(isPlaybackError(ErrorCode::PLAYBACK_UNSUPPORTED_FORMAT));
    static_assert(isCatalogError(ErrorCode::CATALOG_ALREADY_EXISTS));
    static_assert(!isCatalogError(ErrorCode::PLAYBACK_NOT_FOUND));

    EXPECT_TRUE(isValidationError(ErrorCode::VALIDATION_INVALID_ARGUMENT));
    EXPECT_TRUE(isInternalError(ErrorCode::INTERNAL_UNKNOWN));
    EXPECT_FALSE(isPlaybackError(ErrorCode::OK));
}

TEST(ErrorCodes, HexFormatting) {
    EXPECT_EQ(errorCodeToHex(ErrorCode::PLAYBACK_INVALID_STATE), "0x1004");
    EXPECT_EQ(errorCodeToHex(ErrorCode::CATALOG_NOT_FOUND), "0x2001");
    EXPECT_EQ(errorCodeToHex(ErrorCode::OK), "0x0000");
}

// ============================================================
// OpResult Tests
// ============================================================

TEST(OpResult, DefaultIsSuccess) {
    OpResult result;
    EXPECT_TRUE(result.ok());
    EXPECT_TRUE(OpResult::success().ok());
    EXPECT_TRUE(OpResult::success().message.empty());
}

TEST(OpResult, FailureCarriesCodeAndMessage) {
    OpResult result = OpResult::failure(ErrorCode::CATALOG_NOT_FOUND, "Collection not found: x");
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.code, ErrorCode::CATALOG_NOT_FOUND);
    EXPECT_EQ(result.message, "Collection not found: x");
}
