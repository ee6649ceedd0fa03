#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include "RankingUtils.hpp"
#include "TestDatasets.hpp"

TEST(RankingUtilsTest, ArgsortIsAscending)
{
    VectorXi order = RankingUtils::argsort(vec({0.1, 0.4, 0.35, 0.8}));

    ASSERT_EQ(order.size(), 4);
    EXPECT_EQ(order(0), 0);
    EXPECT_EQ(order(1), 2);
    EXPECT_EQ(order(2), 1);
    EXPECT_EQ(order(3), 3);
}

TEST(RankingUtilsTest, ArgsortKeepsTiesInInputOrder)
{
    VectorXi order = RankingUtils::argsort(vec({0.5, 0.2, 0.5, 0.2, 0.5}));

    ASSERT_EQ(order.size(), 5);
    EXPECT_EQ(order(0), 1);
    EXPECT_EQ(order(1), 3);
    EXPECT_EQ(order(2), 0);
    EXPECT_EQ(order(3), 2);
    EXPECT_EQ(order(4), 4);
}

TEST(RankingUtilsTest, DescendingOrderReversesTies)
{
    VectorXi order = RankingUtils::descendingOrder(vec({0.5, 0.2, 0.5, 0.2, 0.5}));

    ASSERT_EQ(order.size(), 5);
    EXPECT_EQ(order(0), 4);
    EXPECT_EQ(order(1), 2);
    EXPECT_EQ(order(2), 0);
    EXPECT_EQ(order(3), 3);
    EXPECT_EQ(order(4), 1);
}

TEST(RankingUtilsTest, NaNSortsFirst)
{
    const double nan = std::numeric_limits<double>::quiet_NaN();
    VectorXi order = RankingUtils::argsort(vec({0.3, nan, 0.1}));

    EXPECT_EQ(order(0), 1);
    EXPECT_EQ(order(1), 2);
    EXPECT_EQ(order(2), 0);
}

TEST(RankingUtilsTest, PermuteGathersValues)
{
    VectorXd values = vec({0.1, 0.4, 0.35, 0.8});
    VectorXd sorted = RankingUtils::permute(values, RankingUtils::argsort(values));

    EXPECT_DOUBLE_EQ(sorted(0), 0.1);
    EXPECT_DOUBLE_EQ(sorted(1), 0.35);
    EXPECT_DOUBLE_EQ(sorted(2), 0.4);
    EXPECT_DOUBLE_EQ(sorted(3), 0.8);
}

TEST(RankingUtilsTest, EmptyInput)
{
    EXPECT_EQ(RankingUtils::argsort(VectorXd(0)).size(), 0);
    EXPECT_EQ(RankingUtils::descendingOrder(VectorXd(0)).size(), 0);
}
