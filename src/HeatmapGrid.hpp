#ifndef HEATMAP_GRID_HPP
#define HEATMAP_GRID_HPP

#include <Eigen/Dense>
#include <string>
#include <utility>
#include <vector>

using namespace Eigen;

// Axis tick for a heat map renderer
struct Tick
{
    double value;
    std::string label;
};

// Presents a matrix as the column-major grid a heat map renderer reads:
// cell (c, r) is grid(r, c), and column/row positions are their indices.
// Axis labels name the columns (x) and rows (y).
class HeatmapGrid
{
private:
    MatrixXd grid;
    std::vector<std::string> x_labels;
    std::vector<std::string> y_labels;

    static std::vector<Tick> ticks(const std::vector<std::string> &labels, double min, double max);

public:
    HeatmapGrid(const MatrixXd &values, const std::vector<std::string> &xlabels,
                const std::vector<std::string> &ylabels);

    // (columns, rows)
    std::pair<int, int> dims() const;

    double z(int c, int r) const;
    double x(int c) const;
    double y(int r) const;

    // Range of the non-NaN cells, NaN if there are none
    double min() const;
    double max() const;

    // Labelled ticks at each integer position from trunc(min) to max
    std::vector<Tick> xTicks(double min, double max) const;
    std::vector<Tick> yTicks(double min, double max) const;
};

#endif // HEATMAP_GRID_HPP
