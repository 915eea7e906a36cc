/**
 * @file test_result.cpp
 * @brief Unit tests for Result<T, E> and the error taxonomy.
 */

#include "core/result.hpp"

#include <gtest/gtest.h>

using namespace vm_sandbox;

TEST(ResultTest, SuccessValue) {
    Result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, 42);
}

TEST(ResultTest, ErrorValue) {
    Result<int> r = Error{ErrorCode::ImageError, "base image missing"};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::ImageError);
    EXPECT_EQ(r.error().message, "base image missing");
}

TEST(ResultTest, PlainErrorIsInternal) {
    Error e{"something went wrong"};
    EXPECT_EQ(e.code, ErrorCode::Internal);
    EXPECT_EQ(e.what(), "something went wrong");
}

TEST(ResultTest, ValueOr) {
    Result<int> success = 42;
    Result<int> failure = Error{"fail"};
    EXPECT_EQ(success.value_or(0), 42);
    EXPECT_EQ(failure.value_or(0), 0);
}

TEST(ResultTest, MapPropagatesError) {
    Result<int> r = Error{ErrorCode::SSHAuthError, "denied"};
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_FALSE(doubled.has_value());
    EXPECT_EQ(doubled.error().code, ErrorCode::SSHAuthError);
}

TEST(ResultTest, AndThenChains) {
    Result<int> r = 21;
    auto chained = r.and_then([](int v) -> Result<std::string> { return std::to_string(v * 2); });
    ASSERT_TRUE(chained.has_value());
    EXPECT_EQ(*chained, "42");
}

TEST(ResultTest, VoidResult) {
    Result<void> ok;
    Result<void> bad = Error{ErrorCode::SecurityError, "escape"};
    EXPECT_TRUE(ok.has_value());
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code, ErrorCode::SecurityError);
}

TEST(ResultTest, CustomErrorType) {
    struct Reason { int code; };
    Result<void, Reason> r = Reason{7};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, 7);
}

TEST(ResultTest, MakeError) {
    auto r = make_error<int>(ErrorCode::QueueRejected, "full");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::QueueRejected);
}

TEST(ErrorTest, VmCategory) {
    for (auto code : {ErrorCode::ImageError, ErrorCode::SecurityError, ErrorCode::VMDefineError,
                      ErrorCode::VMStartError, ErrorCode::VMUndefineError, ErrorCode::HypervisorError}) {
        Error e{code, "x"};
        EXPECT_TRUE(e.is_vm_error()) << to_string(code);
        EXPECT_FALSE(e.is_ssh_error()) << to_string(code);
    }
}

TEST(ErrorTest, SshCategory) {
    for (auto code : {ErrorCode::SSHConnectError, ErrorCode::SSHAuthError,
                      ErrorCode::SSHTransferError, ErrorCode::SSHChannelError}) {
        Error e{code, "x"};
        EXPECT_TRUE(e.is_ssh_error()) << to_string(code);
        EXPECT_FALSE(e.is_vm_error()) << to_string(code);
    }
}

TEST(ErrorTest, OtherCodesAreUncategorized) {
    Error e{ErrorCode::InvalidArgument, "x"};
    EXPECT_FALSE(e.is_vm_error());
    EXPECT_FALSE(e.is_ssh_error());
}
