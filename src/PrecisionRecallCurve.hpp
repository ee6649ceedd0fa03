#ifndef PRECISION_RECALL_CURVE_HPP
#define PRECISION_RECALL_CURVE_HPP

#include <Eigen/Dense>
#include <string>

using namespace Eigen;

// Precision recall curve of a ranking, traced from the highest score down to
// the score at which every positive item has been recovered (recall == 1).
//
// The curve is stored from that lowest score up towards the highest score, so
// recall is non-increasing with the index. The last point is always the
// anchor (precision = 1, recall = 0) and has no threshold, so
// thresholds.size() == precision.size() - 1.
//
// A label greater than 0 marks a positive/relevant item, which allows graded
// relevance labels as well as 0/1 labels.
class PrecisionRecallCurve
{
private:
    VectorXd precision;
    VectorXd recall;
    VectorXd thresholds;
    int positives;

public:
    PrecisionRecallCurve(const VectorXd &scores, const VectorXd &labels);

    // Getters
    VectorXd getPrecision() const;
    VectorXd getRecall() const;
    VectorXd getThresholds() const;
    int getPositives() const;
    int size() const;

    // (recall, precision) pairs in curve order, one row per point
    MatrixXd getPoints() const;

    // Chart title, e.g. "Precision-recall Curve, AP=0.833333"
    std::string summary() const;

    // Area under the curve
    double averagePrecision() const;

    // Mean interpolated precision at recall 0.0, 0.1, ..., 1.0
    double averageInterpolatedPrecision() const;

    // Precision at a cut-off equal to the number of positives
    double rPrecision() const;

    // Precision of the top k items; k = 0 gives the anchor value 1.0
    double precisionAt(int k) const;

    // Maximum precision over all points with recall >= r, 0 if there are none
    double interpolatedPrecisionAt(double r) const;
};

#endif // PRECISION_RECALL_CURVE_HPP
