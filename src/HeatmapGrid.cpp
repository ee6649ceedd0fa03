#include <cmath>
#include <limits>
#include <stdexcept>
#include "HeatmapGrid.hpp"

using namespace std;

// Constructor
HeatmapGrid::HeatmapGrid(const MatrixXd &values, const std::vector<std::string> &xlabels,
                         const std::vector<std::string> &ylabels)
    : grid(values), x_labels(xlabels), y_labels(ylabels)
{
    if ((int)x_labels.size() != grid.cols())
    {
        throw std::invalid_argument("Number of x labels must match the number of columns");
    }
    if ((int)y_labels.size() != grid.rows())
    {
        throw std::invalid_argument("Number of y labels must match the number of rows");
    }
}

std::pair<int, int> HeatmapGrid::dims() const
{
    return std::make_pair((int)grid.cols(), (int)grid.rows());
}

double HeatmapGrid::z(int c, int r) const
{
    return grid(r, c);
}

double HeatmapGrid::x(int c) const
{
    return (double)c;
}

double HeatmapGrid::y(int r) const
{
    return (double)r;
}

double HeatmapGrid::min() const
{
    double result = numeric_limits<double>::quiet_NaN();
    for (int i = 0; i < grid.size(); ++i)
    {
        double v = grid.data()[i];
        if (!std::isnan(v) && (std::isnan(result) || v < result))
            result = v;
    }
    return result;
}

double HeatmapGrid::max() const
{
    double result = numeric_limits<double>::quiet_NaN();
    for (int i = 0; i < grid.size(); ++i)
    {
        double v = grid.data()[i];
        if (!std::isnan(v) && (std::isnan(result) || v > result))
            result = v;
    }
    return result;
}

std::vector<Tick> HeatmapGrid::ticks(const std::vector<std::string> &labels, double min, double max)
{
    std::vector<Tick> result;
    for (double i = std::trunc(min); i <= max; ++i)
    {
        // Checked as a double so unbounded ranges never reach the int cast
        if (!(i >= 0.0 && i < (double)labels.size()))
        {
            throw std::out_of_range("No axis label at position " + to_string(i));
        }
        Tick tick;
        tick.value = i;
        tick.label = labels[(int)i];
        result.push_back(tick);
    }
    return result;
}

std::vector<Tick> HeatmapGrid::xTicks(double min, double max) const
{
    return ticks(x_labels, min, max);
}

std::vector<Tick> HeatmapGrid::yTicks(double min, double max) const
{
    return ticks(y_labels, min, max);
}
