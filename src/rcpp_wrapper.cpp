#include <Rcpp.h>
#include <RcppEigen.h>
#include "RankingEvaluation.hpp"
#include "PrecisionRecallCurve.hpp"
#include "ConfusionMatrix.hpp"

// [[Rcpp::depends(RcppEigen)]]
// [[Rcpp::plugins(cpp11)]]

using namespace Rcpp;
using namespace Eigen;

// Resolve a relevancy function by name
static RelevancyFunction relevancyByName(const std::string &relevancy)
{
    if (relevancy == "traditional")
    {
        return RankingEvaluation::traditionalRelevancy;
    }
    if (relevancy == "emphasised" || relevancy == "emphasized")
    {
        return RankingEvaluation::emphasisedRelevancy;
    }
    throw std::invalid_argument("Unsupported relevancy: " + relevancy +
                                ". Supported: 'traditional', 'emphasised'");
}

static NumericVector toNumeric(const VectorXd &v)
{
    return NumericVector(v.data(), v.data() + v.size());
}

// C++ function for gain based ranking metrics
// [[Rcpp::export]]
List ranking_evaluation(
    NumericVector scores_r,
    NumericVector labels_r,
    int k = -1,
    std::string relevancy = "traditional")
{
    try
    {
        Map<VectorXd> scores(as<Map<VectorXd>>(scores_r));
        Map<VectorXd> labels(as<Map<VectorXd>>(labels_r));

        RankingEvaluation evaluation(scores, labels);
        RelevancyFunction rel = relevancyByName(relevancy);

        // k = -1 means no cut-off, other out of range values throw below
        k = evaluation.resolveCutoff(k);

        VectorXi predicted = evaluation.getPredictedRank();
        VectorXi perfect = evaluation.getPerfectRank();
        IntegerVector predicted_rank(predicted.size());
        IntegerVector perfect_rank(perfect.size());
        for (int i = 0; i < predicted.size(); ++i)
        {
            predicted_rank[i] = predicted(i) + 1; // 1-based indexing for R
            perfect_rank[i] = perfect(i) + 1;
        }

        return List::create(
            Named("k") = k,
            Named("relevancy") = relevancy,
            Named("cg") = evaluation.cumulativeGain(k),
            Named("dcg") = evaluation.discountedCumulativeGain(k, rel),
            Named("ndcg") = evaluation.normalisedDiscountedCumulativeGain(k, rel),
            Named("predicted_rank") = predicted_rank,
            Named("perfect_rank") = perfect_rank);
    }
    catch (const std::exception &e)
    {
        stop("C++ error: " + std::string(e.what()));
    }
}

// C++ function for the precision recall curve and its summaries
// [[Rcpp::export]]
List precision_recall_curve(
    NumericVector scores_r,
    NumericVector labels_r,
    bool verbose = false)
{
    try
    {
        Map<VectorXd> scores(as<Map<VectorXd>>(scores_r));
        Map<VectorXd> labels(as<Map<VectorXd>>(labels_r));

        PrecisionRecallCurve curve(scores, labels);

        if (verbose)
        {
            Rcpp::Rcout << curve.summary() << " (" << curve.size() << " points, "
                        << curve.getPositives() << " positives)" << std::endl;
        }

        DataFrame points = DataFrame::create(
            Named("recall") = toNumeric(curve.getRecall()),
            Named("precision") = toNumeric(curve.getPrecision()));

        return List::create(
            Named("curve") = points,
            Named("thresholds") = toNumeric(curve.getThresholds()),
            Named("positives") = curve.getPositives(),
            Named("average_precision") = curve.averagePrecision(),
            Named("average_interpolated_precision") = curve.averageInterpolatedPrecision(),
            Named("r_precision") = curve.rPrecision());
    }
    catch (const std::exception &e)
    {
        stop("C++ error: " + std::string(e.what()));
    }
}

// C++ function for precision at a cut-off
// [[Rcpp::export]]
double precision_at_k(
    NumericVector scores_r,
    NumericVector labels_r,
    int k)
{
    try
    {
        Map<VectorXd> scores(as<Map<VectorXd>>(scores_r));
        Map<VectorXd> labels(as<Map<VectorXd>>(labels_r));

        PrecisionRecallCurve curve(scores, labels);
        return curve.precisionAt(k);
    }
    catch (const std::exception &e)
    {
        stop("C++ error: " + std::string(e.what()));
    }
}

// C++ function for the thresholded confusion matrix
// [[Rcpp::export]]
List confusion_matrix(
    NumericVector scores_r,
    NumericVector labels_r,
    double threshold = 0.5,
    bool verbose = false)
{
    try
    {
        Map<VectorXd> scores(as<Map<VectorXd>>(scores_r));
        Map<VectorXd> labels(as<Map<VectorXd>>(labels_r));

        ConfusionMatrix matrix(scores, labels, threshold);

        if (verbose)
        {
            Rcpp::Rcout << matrix;
        }

        // Undefined ratios come back to R as NaN
        return List::create(
            Named("threshold") = threshold,
            Named("observations") = matrix.getObservations(),
            Named("pos") = matrix.getPos(),
            Named("neg") = matrix.getNeg(),
            Named("true_pos") = matrix.getTruePos(),
            Named("true_neg") = matrix.getTrueNeg(),
            Named("false_pos") = matrix.getFalsePos(),
            Named("false_neg") = matrix.getFalseNeg(),
            Named("precision") = matrix.precision(),
            Named("recall") = matrix.recall(),
            Named("accuracy") = matrix.accuracy(),
            Named("f1") = matrix.f1());
    }
    catch (const std::exception &e)
    {
        stop("C++ error: " + std::string(e.what()));
    }
}
