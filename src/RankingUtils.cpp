#include <vector>
#include <algorithm>
#include <numeric>
#include <cmath>
#include "RankingUtils.hpp"

using namespace std;

VectorXi RankingUtils::argsort(const VectorXd &values)
{
    vector<int> indices(values.size());
    iota(indices.begin(), indices.end(), 0);

    // Sort the index array by key, never the values themselves
    stable_sort(indices.begin(), indices.end(),
                [&values](int a, int b)
                {
                    return values(a) < values(b) ||
                           (std::isnan(values(a)) && !std::isnan(values(b)));
                });

    VectorXi order(indices.size());
    for (size_t i = 0; i < indices.size(); ++i)
    {
        order(i) = indices[i];
    }

    return order;
}

VectorXi RankingUtils::descendingOrder(const VectorXd &values)
{
    VectorXi order = argsort(values);
    order.reverseInPlace();
    return order;
}

VectorXd RankingUtils::permute(const VectorXd &values, const VectorXi &order)
{
    VectorXd permuted(order.size());
    for (int i = 0; i < order.size(); ++i)
    {
        permuted(i) = values(order(i));
    }
    return permuted;
}
