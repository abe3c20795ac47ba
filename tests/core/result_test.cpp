#include "runsync/core/cancellation.hpp"
#include "runsync/core/result.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>

using runsync::CancellationSource;
using runsync::CancellationToken;
using runsync::Error;
using runsync::ErrorCode;

TEST(ResultTest, OkCarriesValue) {
    auto result = runsync::Ok(std::string("bag"));
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), "bag");
    EXPECT_EQ(result.value_or("other"), "bag");
}

TEST(ResultTest, ErrCarriesCodeAndContext) {
    auto result = runsync::Err<int>(ErrorCode::NotFound, "Object not found", "bucket/key");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::NotFound);
    EXPECT_EQ(result.value_or(7), 7);
    EXPECT_EQ(result.error().describe(), "NotFound: Object not found [bucket/key]");
}

TEST(ResultTest, VoidResult) {
    auto ok = runsync::Ok();
    EXPECT_TRUE(ok.is_ok());

    auto failed = runsync::Err<void>(ErrorCode::FilesystemError, "disk full");
    ASSERT_TRUE(failed.is_error());
    EXPECT_EQ(failed.error().message, "disk full");
}

TEST(ErrorTest, WrapKeepsOriginalAsCause) {
    Error inner(ErrorCode::FilesystemError, "Permission denied", "/data/raw");
    auto outer = inner.wrap(ErrorCode::DiscoveryFailed, "(c,r,f,tw,lb,ts) during discover-target");

    EXPECT_EQ(outer.code, ErrorCode::DiscoveryFailed);
    EXPECT_EQ(outer.message, "Permission denied");
    EXPECT_EQ(outer.cause, "FilesystemError");
    EXPECT_NE(outer.describe().find("cause: FilesystemError"), std::string::npos);
}

TEST(CancellationTest, DefaultTokenNeverCancels) {
    CancellationToken token;
    EXPECT_FALSE(token.is_cancelled());
    EXPECT_FALSE(token.deadline().has_value());
}

TEST(CancellationTest, SourceCancelsAllTokens) {
    CancellationSource source;
    auto first = source.token();
    auto second = source.token();
    EXPECT_FALSE(first.is_cancelled());

    source.cancel();
    EXPECT_TRUE(first.is_cancelled());
    EXPECT_TRUE(second.is_cancelled());
    EXPECT_TRUE(source.is_cancelled());
}

TEST(CancellationTest, DeadlineExpires) {
    CancellationToken token;
    auto bounded = token.with_timeout(std::chrono::milliseconds(10));
    EXPECT_TRUE(bounded.deadline().has_value());

    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    EXPECT_TRUE(bounded.is_cancelled());
    EXPECT_TRUE(bounded.deadline_expired());
    EXPECT_FALSE(token.is_cancelled());
}

TEST(CancellationTest, WithTimeoutKeepsEarlierDeadline) {
    auto short_lived = CancellationToken().with_timeout(std::chrono::milliseconds(5));
    auto widened = short_lived.with_timeout(std::chrono::hours(1));
    EXPECT_EQ(widened.deadline(), short_lived.deadline());
}
