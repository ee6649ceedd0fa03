#include <sstream>
#include <iomanip>
#include <stdexcept>
#include "ConfusionMatrix.hpp"

using namespace std;

// Constructor
ConfusionMatrix::ConfusionMatrix(const VectorXd &scores, const VectorXd &labels, double threshold)
    : observations(0), pos(0), neg(0), true_pos(0), true_neg(0), false_pos(0), false_neg(0)
{
    if (scores.size() != labels.size())
    {
        throw std::invalid_argument("Scores and labels must have the same size");
    }

    for (int i = 0; i < labels.size(); ++i)
    {
        observations++;

        bool predicted_positive = scores(i) >= threshold;

        if (labels(i) == 1.0)
        {
            pos++;
            if (predicted_positive)
                true_pos++;
            else
                false_neg++;
        }
        else
        {
            neg++;
            if (predicted_positive)
                false_pos++;
            else
                true_neg++;
        }
    }
}

// Getters
int ConfusionMatrix::getObservations() const
{
    return observations;
}

int ConfusionMatrix::getPos() const
{
    return pos;
}

int ConfusionMatrix::getNeg() const
{
    return neg;
}

int ConfusionMatrix::getTruePos() const
{
    return true_pos;
}

int ConfusionMatrix::getTrueNeg() const
{
    return true_neg;
}

int ConfusionMatrix::getFalsePos() const
{
    return false_pos;
}

int ConfusionMatrix::getFalseNeg() const
{
    return false_neg;
}

// Zero denominators are not guarded: 0.0 / 0.0 yields NaN
double ConfusionMatrix::precision() const
{
    return (double)true_pos / (double)(true_pos + false_pos);
}

double ConfusionMatrix::recall() const
{
    return (double)true_pos / (double)(true_pos + false_neg);
}

double ConfusionMatrix::accuracy() const
{
    return (double)(true_neg + true_pos) / (double)observations;
}

double ConfusionMatrix::f1() const
{
    double p = precision();
    double r = recall();
    return 2.0 * ((p * r) / (p + r));
}

std::string ConfusionMatrix::toString() const
{
    const string horiz(102, '-');

    ostringstream os;
    os << fixed << setprecision(6) << left;

    os << "Observations = " << setw(10) << observations
       << " |       Predicted No       |       Predicted Yes      |\n";
    os << horiz << "\n";
    os << "Actual No                 |       TN = " << setw(10) << true_neg
       << "    |       FP = " << setw(10) << false_pos << "    |\n";
    os << "Actual Yes                |       FN = " << setw(10) << false_neg
       << "    |       TP = " << setw(10) << true_pos << "    |  Recall = " << recall() << "\n";
    os << horiz << "\n";
    os << string(53, ' ') << "|   Precision = " << setw(10) << precision()
       << " |  Accuracy = " << accuracy() << "\n";
    os << "F1 Score = " << f1() << "\n";

    return os.str();
}

std::ostream &operator<<(std::ostream &os, const ConfusionMatrix &matrix)
{
    return os << matrix.toString();
}
