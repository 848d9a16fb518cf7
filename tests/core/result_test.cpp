#include "bulkup/core/result.hpp"

#include <gtest/gtest.h>

#include <string>

using bulkup::Error;
using bulkup::ErrorCode;
using bulkup::Result;

namespace {

Result<int> parse_positive(int value) {
    if (value <= 0) {
        return bulkup::Fail<int>(ErrorCode::Validation, "must be positive");
    }
    return bulkup::Ok(value);
}

} // namespace

TEST(ResultTest, CarriesValueOrError) {
    auto ok = parse_positive(3);
    ASSERT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value(), 3);

    auto bad = parse_positive(-1);
    ASSERT_TRUE(bad.is_error());
    EXPECT_EQ(bad.error().code, ErrorCode::Validation);
    EXPECT_EQ(bad.error().message, "must be positive");
    EXPECT_EQ(bad.value_or(7), 7);
}

TEST(ResultTest, VoidResult) {
    Result<void> ok = bulkup::Ok();
    EXPECT_TRUE(ok.is_ok());

    Result<void> cancelled = bulkup::Fail(ErrorCode::Cancelled, "stop");
    ASSERT_TRUE(cancelled.is_error());
    EXPECT_TRUE(cancelled.error().is_cancelled());
}

TEST(ResultTest, SameValueAndErrorType) {
    auto ok = Result<std::string, std::string>(bulkup::OkValue<std::string>("fine"));
    auto err = bulkup::Err<std::string>(std::string("broken"));

    EXPECT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value(), "fine");
    ASSERT_TRUE(err.is_error());
    EXPECT_EQ(err.error(), "broken");
}

TEST(ErrorCodeTest, NamesEveryCode) {
    EXPECT_STREQ(bulkup::to_string(ErrorCode::Validation), "validation");
    EXPECT_STREQ(bulkup::to_string(ErrorCode::Cancelled), "cancelled");
    EXPECT_STREQ(bulkup::to_string(ErrorCode::ChunkTransfer), "chunk-transfer");
    EXPECT_STREQ(bulkup::to_string(ErrorCode::ArchiveEncoding), "archive-encoding");
    EXPECT_STREQ(bulkup::to_string(ErrorCode::Io), "io");
    EXPECT_STREQ(bulkup::to_string(ErrorCode::Config), "config");
    EXPECT_FALSE(Error{}.is_cancelled());
}
