/**
 * @file test_result.cpp
 * @brief Unit tests for Result<T, E> monadic error type.
 */

#include "core/result.hpp"

#include <gtest/gtest.h>

#include <cerrno>

using namespace jobguard;

TEST(ResultTest, SuccessValue) {
    Result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, 42);
}

TEST(ResultTest, ErrorValue) {
    Result<int> r = Error{"something went wrong", ErrorCode::Parse};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().message, "something went wrong");
    EXPECT_EQ(r.error().code, ErrorCode::Parse);
}

TEST(ResultTest, ValueOnErrorThrowsWithMessage) {
    Result<int> r = Error{"bad input"};
    try {
        static_cast<void>(r.value());
        FAIL() << "expected throw";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string{e.what()}.find("bad input"), std::string::npos);
    }
}

TEST(ResultTest, ValueOr) {
    Result<int> success = 42;
    Result<int> failure = Error{"fail"};
    EXPECT_EQ(success.value_or(0), 42);
    EXPECT_EQ(failure.value_or(0), 0);
}

TEST(ResultTest, MapAndThen) {
    Result<int> r = 21;
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_TRUE(doubled.has_value());
    EXPECT_EQ(*doubled, 42);

    auto checked = doubled.and_then([](int v) -> Result<int> {
        if (v > 40) return Error{"too large"};
        return v;
    });
    ASSERT_FALSE(checked.has_value());
    EXPECT_EQ(checked.error().message, "too large");
}

TEST(ResultTest, VoidResult) {
    Result<void> ok;
    Result<void> failed = Error{"nope", ErrorCode::State};
    EXPECT_TRUE(ok.has_value());
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code, ErrorCode::State);
}

TEST(ResultTest, SystemErrorCarriesStrerror) {
    auto err = system_error("open /missing", ENOENT);
    EXPECT_EQ(err.code, ErrorCode::System);
    EXPECT_NE(err.message.find("open /missing"), std::string::npos);
    EXPECT_NE(err.message.find("No such file"), std::string::npos);
}
