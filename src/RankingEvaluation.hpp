#ifndef RANKING_EVALUATION_HPP
#define RANKING_EVALUATION_HPP

#include <Eigen/Dense>
#include <functional>

using namespace Eigen;

// Maps a raw relevance grade to the gain it contributes at a rank
typedef std::function<double(double)> RelevancyFunction;

// Evaluates a ranking produced by model scores against ground truth
// relevance grades: cumulative gain, discounted cumulative gain and
// normalised discounted cumulative gain at a cut-off k.
class RankingEvaluation
{
private:
    VectorXd relevancies;    // ground truth, original order
    VectorXi predicted_rank; // indices ranked by descending score
    VectorXi perfect_rank;   // indices ranked by descending relevance

    void checkCutoff(int k) const;
    double discountedGain(int k, const RelevancyFunction &rel, const VectorXi &ranking) const;

public:
    // scores(i) is the model output for the item whose relevance is labels(i)
    RankingEvaluation(const VectorXd &scores, const VectorXd &labels);

    // Cut-off -1 means all items; any other value is returned unchanged
    int resolveCutoff(int k) const;

    // Gain functions
    static double traditionalRelevancy(double r); // r
    static double emphasisedRelevancy(double r);  // 2^r - 1

    // Sum of relevancies of the top k predicted items, 1 <= k <= size()
    double cumulativeGain() const;
    double cumulativeGain(int k) const;

    double discountedCumulativeGain(int k) const;
    double discountedCumulativeGain(int k, const RelevancyFunction &rel) const;

    // DCG of the predicted ranking over DCG of the perfect ranking.
    // 1.0 when no item has a relevance above zero.
    double normalisedDiscountedCumulativeGain(int k) const;
    double normalisedDiscountedCumulativeGain(int k, const RelevancyFunction &rel) const;

    // Getters
    VectorXd getRelevancies() const;
    VectorXi getPredictedRank() const;
    VectorXi getPerfectRank() const;
    int size() const;
};

#endif // RANKING_EVALUATION_HPP
