#include <gtest/gtest.h>
#include "weft/core/types.hpp"
#include "weft/core/string.hpp"

using namespace weft;

// ============================================================================
// Result Tests
// ============================================================================

TEST(ResultTest, OkResult) {
    Result<int, String> result = 42;

    EXPECT_TRUE(result.is_ok());
    EXPECT_FALSE(result.is_err());
    EXPECT_TRUE(static_cast<bool>(result));
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, ErrorResult) {
    Result<int, String> result = make_error(String("error message"));

    EXPECT_FALSE(result.is_ok());
    EXPECT_TRUE(result.is_err());
    EXPECT_FALSE(static_cast<bool>(result));
    EXPECT_EQ(result.error(), "error message");
}

TEST(ResultTest, SameValueAndErrorType) {
    Result<String, String> ok = String("value");
    Result<String, String> err = make_error(String("error"));

    ASSERT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value(), "value");
    ASSERT_TRUE(err.is_err());
    EXPECT_EQ(err.error(), "error");
}

TEST(ResultTest, ValueOr) {
    Result<int, String> ok_result = 42;
    Result<int, String> err_result = make_error(String("error"));

    EXPECT_EQ(ok_result.value_or(0), 42);
    EXPECT_EQ(err_result.value_or(0), 0);
}

TEST(ResultTest, Map) {
    Result<int, String> result = 21;
    auto mapped = result.map([](int x) { return x * 2; });

    EXPECT_TRUE(mapped.is_ok());
    EXPECT_EQ(mapped.value(), 42);
}

TEST(ResultTest, MapKeepsError) {
    Result<int, String> result = make_error(String("bad"));
    auto mapped = result.map([](int x) { return x * 2; });

    ASSERT_TRUE(mapped.is_err());
    EXPECT_EQ(mapped.error(), "bad");
}

TEST(ResultTest, MapErr) {
    Result<int, String> result = make_error(String("bad"));
    auto mapped = result.map_err([](const String& e) { return e.size(); });

    ASSERT_TRUE(mapped.is_err());
    EXPECT_EQ(mapped.error(), 3u);
}

TEST(ResultTest, MoveOutValue) {
    Result<std::vector<int>, String> result = std::vector<int>{1, 2, 3};
    std::vector<int> values = std::move(result).value();

    EXPECT_EQ(values.size(), 3u);
}

TEST(ResultTest, VoidResult) {
    Result<void, String> ok_result;
    Result<void, String> err_result = make_error(String("error"));

    EXPECT_TRUE(ok_result.is_ok());
    EXPECT_TRUE(err_result.is_err());
    EXPECT_EQ(err_result.error(), "error");
}
