#include <stdexcept>
#include <string>
#include <cmath>
#include <limits>
#include "RankingEvaluation.hpp"
#include "RankingUtils.hpp"

using namespace std;

// Constructor
RankingEvaluation::RankingEvaluation(const VectorXd &scores, const VectorXd &labels)
    : relevancies(labels)
{
    if (scores.size() != labels.size())
    {
        throw std::invalid_argument("Scores and labels must have the same size");
    }

    // Highest score / highest relevance ranked first
    predicted_rank = RankingUtils::descendingOrder(scores);
    perfect_rank = RankingUtils::descendingOrder(labels);
}

double RankingEvaluation::traditionalRelevancy(double r)
{
    return r;
}

double RankingEvaluation::emphasisedRelevancy(double r)
{
    return std::pow(2.0, r) - 1.0;
}

int RankingEvaluation::resolveCutoff(int k) const
{
    return (k == -1) ? size() : k;
}

void RankingEvaluation::checkCutoff(int k) const
{
    if (k < 1 || k > relevancies.size())
    {
        throw std::out_of_range("Cut-off k = " + to_string(k) + " is out of bounds [1, " +
                                to_string(relevancies.size()) + "]");
    }
}

// Rank i (0-based) is discounted by log2(i + 2), so the top item is not discounted
double RankingEvaluation::discountedGain(int k, const RelevancyFunction &rel,
                                         const VectorXi &ranking) const
{
    double sum = 0.0;
    for (int i = 0; i < k; ++i)
    {
        sum += rel(relevancies(ranking(i))) / std::log2(i + 2.0);
    }
    return sum;
}

double RankingEvaluation::cumulativeGain() const
{
    return cumulativeGain(size());
}

double RankingEvaluation::cumulativeGain(int k) const
{
    checkCutoff(k);

    double sum = 0.0;
    for (int i = 0; i < k; ++i)
    {
        sum += relevancies(predicted_rank(i));
    }
    return sum;
}

double RankingEvaluation::discountedCumulativeGain(int k) const
{
    return discountedCumulativeGain(k, traditionalRelevancy);
}

double RankingEvaluation::discountedCumulativeGain(int k, const RelevancyFunction &rel) const
{
    checkCutoff(k);
    return discountedGain(k, rel, predicted_rank);
}

double RankingEvaluation::normalisedDiscountedCumulativeGain(int k) const
{
    return normalisedDiscountedCumulativeGain(k, traditionalRelevancy);
}

double RankingEvaluation::normalisedDiscountedCumulativeGain(int k, const RelevancyFunction &rel) const
{
    checkCutoff(k);

    // Largest non-NaN relevance
    double max_relevance = -numeric_limits<double>::infinity();
    for (int i = 0; i < relevancies.size(); ++i)
    {
        if (!std::isnan(relevancies(i)) && relevancies(i) > max_relevance)
            max_relevance = relevancies(i);
    }

    // No relevant items, so any ordering is perfect
    if (max_relevance == 0.0)
    {
        return 1.0;
    }

    return discountedGain(k, rel, predicted_rank) / discountedGain(k, rel, perfect_rank);
}

// Getters
VectorXd RankingEvaluation::getRelevancies() const
{
    return relevancies;
}

VectorXi RankingEvaluation::getPredictedRank() const
{
    return predicted_rank;
}

VectorXi RankingEvaluation::getPerfectRank() const
{
    return perfect_rank;
}

int RankingEvaluation::size() const
{
    return relevancies.size();
}
