#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <vector>

#include "recipsum/errors.hpp"
#include "recipsum/sequential.hpp"

using namespace recipsum;

TEST(SequentialTest, Example) {
    std::vector<double> a{1, 2, 4, 5};
    EXPECT_DOUBLE_EQ(sequential_sum(a), 1.95);
}

TEST(SequentialTest, EmptyIsZero) {
    std::vector<double> a;
    EXPECT_EQ(sequential_sum(a), 0.0);
    EXPECT_EQ(sequential_sum(nullptr, 0), 0.0);
}

TEST(SequentialTest, SingleElement) {
    std::vector<double> a{8.0};
    EXPECT_EQ(sequential_sum(a), 0.125);
    EXPECT_EQ(reciprocal_sum(a.data(), a.size(), {0, 1}), 0.125);
}

TEST(SequentialTest, SubRange) {
    std::vector<double> a{1, 2, 4, 5, 10};
    EXPECT_DOUBLE_EQ(reciprocal_sum(a.data(), a.size(), {1, 3}), 0.75);
    EXPECT_EQ(reciprocal_sum(a.data(), a.size(), {2, 2}), 0.0);
    EXPECT_EQ(reciprocal_sum(a.data(), a.size(), {5, 5}), 0.0);
}

TEST(SequentialTest, AscendingIndexOrder) {
    // Large term first: the result depends on rounding order.
    std::vector<double> a{1e-16, 1.0, 1.0};
    double expected = 0.0;
    expected += 1.0 / 1e-16;
    expected += 1.0;
    expected += 1.0;
    EXPECT_EQ(sequential_sum(a), expected);
}

TEST(SequentialTest, NegativeValues) {
    std::vector<double> a{-2.0, 4.0};
    EXPECT_EQ(sequential_sum(a), -0.25);
}

TEST(SequentialTest, ZeroPropagatesInfinity) {
    std::vector<double> a{1.0, 0.0};
    EXPECT_TRUE(std::isinf(sequential_sum(a)));
}

TEST(SequentialTest, NaNPropagates) {
    std::vector<double> a{1.0, std::numeric_limits<double>::quiet_NaN(), 2.0};
    EXPECT_TRUE(std::isnan(sequential_sum(a)));
}

TEST(SequentialTest, InvalidRange) {
    std::vector<double> a{1, 2, 3};
    EXPECT_THROW(reciprocal_sum(a.data(), a.size(), {2, 1}), InvalidRange);
    EXPECT_THROW(reciprocal_sum(a.data(), a.size(), {0, 4}), InvalidRange);
    EXPECT_THROW(reciprocal_sum(a.data(), a.size(), {4, 4}), InvalidRange);

    try {
        reciprocal_sum(a.data(), a.size(), {2, 7});
        FAIL() << "expected InvalidRange";
    } catch (const InvalidRange& e) {
        EXPECT_EQ(e.begin(), 2u);
        EXPECT_EQ(e.end(), 7u);
        EXPECT_EQ(e.size(), 3u);
    }
}

TEST(SequentialTest, NullInput) {
    EXPECT_THROW(sequential_sum(nullptr, 3), InvalidArgument);
}
