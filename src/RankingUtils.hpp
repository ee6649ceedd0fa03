#ifndef RANKING_UTILS_HPP
#define RANKING_UTILS_HPP

#include <Eigen/Dense>

using namespace Eigen;

class RankingUtils
{
public:
    // Indices of values in stable ascending order (equal values keep their
    // original relative order, NaN values sort first)
    static VectorXi argsort(const VectorXd &values);

    // Ascending argsort reversed. With ties this is not the same as a stable
    // descending sort: tied items come out in reverse input order.
    static VectorXi descendingOrder(const VectorXd &values);

    // values(order(0)), values(order(1)), ...
    static VectorXd permute(const VectorXd &values, const VectorXi &order);
};

#endif // RANKING_UTILS_HPP
