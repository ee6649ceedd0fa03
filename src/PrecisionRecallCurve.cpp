#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <string>
#include "PrecisionRecallCurve.hpp"
#include "RankingUtils.hpp"

using namespace std;

// Constructor
PrecisionRecallCurve::PrecisionRecallCurve(const VectorXd &scores, const VectorXd &labels)
{
    if (scores.size() != labels.size())
    {
        throw std::invalid_argument("Scores and labels must have the same size");
    }

    int n = scores.size();
    positives = (labels.array() > 0.0).count();

    // No positives: nothing to trace, only the anchor point
    if (positives == 0)
    {
        precision = VectorXd::Ones(1);
        recall = VectorXd::Zero(1);
        thresholds = VectorXd(0);
        return;
    }

    VectorXi order = RankingUtils::argsort(scores);

    VectorXd ranked_precision(n);
    VectorXd ranked_recall(n);
    int hits = 0;
    int k = 0;

    // Walk from the highest score down until all positives are found
    for (int i = n - 1; i >= 0; --i)
    {
        if (labels(order(i)) > 0.0)
        {
            hits++;
        }
        ranked_recall(k) = (double)hits / positives;
        ranked_precision(k) = (double)hits / (k + 1);
        if (ranked_recall(k) == 1.0)
        {
            break;
        }
        k++;
    }
    int m = k + 1;

    // Truncate to the rank where recall reached 1
    VectorXd truncated_precision = ranked_precision.head(m);
    VectorXd truncated_recall = ranked_recall.head(m);

    // Reverse so the highest score comes last
    truncated_precision.reverseInPlace();
    truncated_recall.reverseInPlace();

    // Append the anchor point
    precision.resize(m + 1);
    precision << truncated_precision, 1.0;
    recall.resize(m + 1);
    recall << truncated_recall, 0.0;

    // The m highest scores, ascending
    thresholds = RankingUtils::permute(scores, order).tail(m);
}

// Getters
VectorXd PrecisionRecallCurve::getPrecision() const
{
    return precision;
}

VectorXd PrecisionRecallCurve::getRecall() const
{
    return recall;
}

VectorXd PrecisionRecallCurve::getThresholds() const
{
    return thresholds;
}

int PrecisionRecallCurve::getPositives() const
{
    return positives;
}

int PrecisionRecallCurve::size() const
{
    return precision.size();
}

MatrixXd PrecisionRecallCurve::getPoints() const
{
    MatrixXd points(precision.size(), 2);
    points.col(0) = recall;
    points.col(1) = precision;
    return points;
}

std::string PrecisionRecallCurve::summary() const
{
    ostringstream os;
    os << "Precision-recall Curve, AP=" << fixed << setprecision(6) << averagePrecision();
    return os.str();
}

// Recall decreases along the stored curve, so the sum is negated
double PrecisionRecallCurve::averagePrecision() const
{
    double sum = 0.0;
    for (int i = 0; i < precision.size() - 1; ++i)
    {
        sum += (recall(i + 1) - recall(i)) * precision(i);
    }
    return -sum;
}

double PrecisionRecallCurve::averageInterpolatedPrecision() const
{
    double sum = 0.0;
    for (int i = 0; i <= 10; ++i)
    {
        sum += interpolatedPrecisionAt(i / 10.0);
    }
    return sum / 11.0;
}

double PrecisionRecallCurve::rPrecision() const
{
    return precision(precision.size() - 1 - positives);
}

// Indexed from the anchor end of the curve
double PrecisionRecallCurve::precisionAt(int k) const
{
    if (k < 0 || k >= precision.size())
    {
        throw std::out_of_range("Cut-off k = " + to_string(k) + " is out of bounds [0, " +
                                to_string(precision.size() - 1) + "]");
    }
    return precision(precision.size() - 1 - k);
}

double PrecisionRecallCurve::interpolatedPrecisionAt(double r) const
{
    double max = 0.0;
    for (int i = 0; i < recall.size(); ++i)
    {
        if (recall(i) >= r && precision(i) > max)
        {
            max = precision(i);
        }
    }
    return max;
}
