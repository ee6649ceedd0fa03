#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>
#include "HeatmapGrid.hpp"

class HeatmapGridTest : public ::testing::Test
{
protected:
    MatrixXd values;
    std::vector<std::string> xlabels;
    std::vector<std::string> ylabels;

    void SetUp() override
    {
        // 2 rows, 3 columns
        values.resize(2, 3);
        values << 0.5, -1.0, 2.0,
            std::numeric_limits<double>::quiet_NaN(), 3.0, 0.0;
        xlabels = {"a", "b", "c"};
        ylabels = {"row0", "row1"};
    }
};

TEST_F(HeatmapGridTest, DimsAreColumnsThenRows)
{
    HeatmapGrid grid(values, xlabels, ylabels);

    EXPECT_EQ(grid.dims().first, 3);
    EXPECT_EQ(grid.dims().second, 2);
}

TEST_F(HeatmapGridTest, CellsAreTransposed)
{
    HeatmapGrid grid(values, xlabels, ylabels);

    EXPECT_DOUBLE_EQ(grid.z(0, 0), 0.5);
    EXPECT_DOUBLE_EQ(grid.z(1, 0), -1.0);
    EXPECT_DOUBLE_EQ(grid.z(2, 1), 0.0);
    EXPECT_TRUE(std::isnan(grid.z(0, 1)));
    EXPECT_DOUBLE_EQ(grid.x(2), 2.0);
    EXPECT_DOUBLE_EQ(grid.y(1), 1.0);
}

TEST_F(HeatmapGridTest, RangeSkipsNaN)
{
    HeatmapGrid grid(values, xlabels, ylabels);

    EXPECT_DOUBLE_EQ(grid.min(), -1.0);
    EXPECT_DOUBLE_EQ(grid.max(), 3.0);

    MatrixXd blank = MatrixXd::Constant(1, 1, std::numeric_limits<double>::quiet_NaN());
    HeatmapGrid empty(blank, std::vector<std::string>{"x"}, std::vector<std::string>{"y"});
    EXPECT_TRUE(std::isnan(empty.min()));
    EXPECT_TRUE(std::isnan(empty.max()));
}

TEST_F(HeatmapGridTest, Ticks)
{
    HeatmapGrid grid(values, xlabels, ylabels);

    std::vector<Tick> xticks = grid.xTicks(-0.5, 2.5);
    ASSERT_EQ(xticks.size(), 3u);
    EXPECT_DOUBLE_EQ(xticks[0].value, 0.0);
    EXPECT_EQ(xticks[0].label, "a");
    EXPECT_EQ(xticks[2].label, "c");

    std::vector<Tick> yticks = grid.yTicks(1.0, 1.0);
    ASSERT_EQ(yticks.size(), 1u);
    EXPECT_DOUBLE_EQ(yticks[0].value, 1.0);
    EXPECT_EQ(yticks[0].label, "row1");

    EXPECT_THROW(grid.xTicks(0.0, 3.0), std::out_of_range);
}

TEST_F(HeatmapGridTest, UnboundedTickRangeThrows)
{
    HeatmapGrid grid(values, xlabels, ylabels);
    const double inf = std::numeric_limits<double>::infinity();

    EXPECT_THROW(grid.xTicks(-inf, 2.0), std::out_of_range);
    EXPECT_THROW(grid.xTicks(0.0, inf), std::out_of_range);
    EXPECT_THROW(grid.yTicks(-1e300, 1.0), std::out_of_range);
    EXPECT_THROW(grid.yTicks(1e300, inf), std::out_of_range);
}

TEST_F(HeatmapGridTest, LabelsMustMatchGrid)
{
    EXPECT_THROW(HeatmapGrid(values, std::vector<std::string>{"a", "b"}, ylabels), std::invalid_argument);
    EXPECT_THROW(HeatmapGrid(values, xlabels, std::vector<std::string>{"row0"}), std::invalid_argument);
}
