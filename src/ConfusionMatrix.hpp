#ifndef CONFUSION_MATRIX_HPP
#define CONFUSION_MATRIX_HPP

#include <Eigen/Dense>
#include <ostream>
#include <string>

using namespace Eigen;

// Binary confusion matrix. An item is predicted positive when its score is
// at least the threshold and is actually positive when its label equals 1.
//
// Ratios are computed from the counts on demand. A ratio whose denominator
// is zero is NaN (e.g. precision() with no predicted positives); test with
// std::isnan.
class ConfusionMatrix
{
private:
    int observations;
    int pos;
    int neg;
    int true_pos;
    int true_neg;
    int false_pos;
    int false_neg;

public:
    ConfusionMatrix(const VectorXd &scores, const VectorXd &labels, double threshold);

    // Counts
    int getObservations() const;
    int getPos() const;
    int getNeg() const;
    int getTruePos() const;
    int getTrueNeg() const;
    int getFalsePos() const;
    int getFalseNeg() const;

    // Derived ratios
    double precision() const;
    double recall() const;
    double accuracy() const;
    double f1() const;

    // Text table of counts and ratios
    std::string toString() const;
};

std::ostream &operator<<(std::ostream &os, const ConfusionMatrix &matrix);

#endif // CONFUSION_MATRIX_HPP
