#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>

#include "stash/type/expected.hpp"

namespace {

using namespace stash::type;

enum class TestError { Broken, Missing };

class ExpectedTest : public ::testing::Test {};

TEST_F(ExpectedTest, UnexpectedClass) {
    unexpected<int> unex1(42);
    EXPECT_EQ(unex1.error(), 42);
    EXPECT_TRUE(unex1 == unexpected<int>(42));
    EXPECT_FALSE(unex1 == unexpected<int>(43));

    auto unex2 = make_unexpected(std::string("error message"));
    EXPECT_EQ(unex2.error(), "error message");
}

TEST_F(ExpectedTest, HoldsValue) {
    expected<int, TestError> exp(7);
    ASSERT_TRUE(exp.has_value());
    EXPECT_TRUE(static_cast<bool>(exp));
    EXPECT_EQ(exp.value(), 7);
    EXPECT_EQ(*exp, 7);
    EXPECT_THROW((void)exp.error(), std::logic_error);
}

TEST_F(ExpectedTest, HoldsError) {
    expected<int, TestError> exp = make_unexpected(TestError::Missing);
    ASSERT_FALSE(exp.has_value());
    EXPECT_EQ(exp.error(), TestError::Missing);
    EXPECT_EQ(exp.value_or(3), 3);
    EXPECT_THROW((void)exp.value(), std::logic_error);
}

TEST_F(ExpectedTest, MoveOnlyValue) {
    expected<std::unique_ptr<int>, TestError> exp(std::make_unique<int>(5));
    ASSERT_TRUE(exp.has_value());
    auto owned = std::move(exp).value();
    ASSERT_NE(owned, nullptr);
    EXPECT_EQ(*owned, 5);
}

TEST_F(ExpectedTest, MapTransformsValue) {
    auto doubled = expected<int, TestError>(21).map(
        [](int value) { return value * 2; });
    ASSERT_TRUE(doubled.has_value());
    EXPECT_EQ(doubled.value(), 42);

    auto failed = expected<int, TestError>(make_unexpected(TestError::Broken))
                      .map([](int value) { return std::to_string(value); });
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error(), TestError::Broken);
}

TEST_F(ExpectedTest, AndThenChains) {
    auto half = [](int value) -> expected<int, TestError> {
        if (value % 2 != 0) {
            return make_unexpected(TestError::Broken);
        }
        return value / 2;
    };
    auto ok = expected<int, TestError>(8).and_then(half);
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ(ok.value(), 4);

    auto odd = expected<int, TestError>(3).and_then(half);
    ASSERT_FALSE(odd.has_value());
    EXPECT_EQ(odd.error(), TestError::Broken);
}

TEST_F(ExpectedTest, VoidSpecialization) {
    expected<void, TestError> ok;
    EXPECT_TRUE(ok.has_value());

    expected<void, TestError> failed = make_unexpected(TestError::Missing);
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error(), TestError::Missing);

    auto next = ok.and_then([]() -> expected<int, TestError> { return 1; });
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next.value(), 1);
}

}  // namespace
