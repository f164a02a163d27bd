#include "NetworkEstimation.hpp"
#include "CovarianceBuilder.hpp"
#include "Exceptions.hpp"
#include "Simulation.hpp"
#include <gtest/gtest.h>
#include <limits>

using namespace netgsa;
using namespace netgsa::network;

namespace {

EstimationParameters tightParameters(double lambda) {
    EstimationParameters params;
    params.lambda = lambda;
    params.tolerance = 1e-10;
    params.maxIterations = 5000;
    return params;
}

}

TEST(UndirectedEstimatorTest, RecoversChainFromExactSecondMoments) {
    std::mt19937 gen(11);
    Eigen::MatrixXd omega = sim::chainPrecision(4, 3, 0.45);
    Eigen::MatrixXd data = sim::sampleExactCovariance(omega.inverse(), 200, gen);

    UndirectedNetworkEstimator estimator;
    EstimatedNetwork network = estimator.estimate(data, ConstraintMasks(), tightParameters(0.1));

    EXPECT_TRUE(network.adjacency.isApprox(sim::adjacencyOf(omega)));
    EXPECT_EQ(network.numEdges, 2);
    EXPECT_TRUE(network.warnings.empty());
}

TEST(UndirectedEstimatorTest, RecoversChainFromSimulatedSamples) {
    std::mt19937 gen(2024);
    Eigen::MatrixXd omega = sim::chainPrecision(4, 3, 0.45);
    Eigen::MatrixXd data = sim::sampleGaussian(omega.inverse(), 200, gen);

    UndirectedNetworkEstimator estimator;
    EstimatedNetwork network = estimator.estimate(data, ConstraintMasks(), tightParameters(0.3));

    EXPECT_EQ(network.adjacency(0, 1), 1.0);
    EXPECT_EQ(network.adjacency(1, 2), 1.0);
    EXPECT_EQ(network.adjacency.row(3).sum(), 0.0);
}

TEST(UndirectedEstimatorTest, OutputIsSymmetricAndRespectsZeroMask) {
    std::mt19937 gen(3);
    Eigen::MatrixXd data = sim::standardNormal(6, 25, gen);
    data.row(1) += 0.8 * data.row(0);
    data.row(2) += 0.6 * data.row(1);

    ConstraintMasks masks;
    masks.zero = Eigen::MatrixXd::Zero(6, 6);
    masks.zero(0, 1) = masks.zero(1, 0) = 1.0;
    masks.zero(4, 5) = masks.zero(5, 4) = 1.0;

    UndirectedNetworkEstimator estimator;
    EstimatedNetwork network = estimator.estimate(data, masks, tightParameters(0.02));

    EXPECT_TRUE(network.precision.isApprox(network.precision.transpose(), 1e-12));
    EXPECT_TRUE(network.adjacency.isApprox(network.adjacency.transpose()));
    EXPECT_TRUE(network.weights.isApprox(network.weights.transpose(), 1e-12));
    EXPECT_EQ(network.precision(0, 1), 0.0);
    EXPECT_EQ(network.precision(1, 0), 0.0);
    EXPECT_EQ(network.precision(4, 5), 0.0);
    EXPECT_EQ(network.adjacency(0, 1), 0.0);
}

TEST(UndirectedEstimatorTest, UnpenalizedKnownEdgeIsAlwaysEstimated) {
    std::mt19937 gen(5);
    Eigen::MatrixXd data = sim::standardNormal(5, 40, gen);

    ConstraintMasks masks;
    masks.one = Eigen::MatrixXd::Zero(5, 5);
    masks.one(0, 3) = masks.one(3, 0) = 1.0;
    masks.one(2, 4) = masks.one(4, 2) = 1.0;

    // Large enough that every penalized entry is zero
    EstimationParameters params = tightParameters(5.0);
    params.knownEdgeWeight = 0.0;

    UndirectedNetworkEstimator estimator;
    EstimatedNetwork network = estimator.estimate(data, masks, params);

    EXPECT_NE(network.precision(0, 3), 0.0);
    EXPECT_NE(network.precision(2, 4), 0.0);
    EXPECT_EQ(network.numEdges, 2);
}

TEST(UndirectedEstimatorTest, FullKnownMaskWithZeroWeightGivesInverseCovariance) {
    std::mt19937 gen(8);
    Eigen::MatrixXd data = sim::standardNormal(5, 50, gen);

    ConstraintMasks masks;
    masks.one = Eigen::MatrixXd::Ones(5, 5) - Eigen::MatrixXd::Identity(5, 5);

    EstimationParameters params = tightParameters(0.3);
    params.knownEdgeWeight = 0.0;

    UndirectedNetworkEstimator estimator;
    EstimatedNetwork network = estimator.estimate(data, masks, params);

    Eigen::MatrixXd expected = buildCovariance(data).inverse();
    EXPECT_TRUE(network.precision.isApprox(expected, 1e-6));
    EXPECT_EQ(network.numEdges, 10);
}

TEST(UndirectedEstimatorTest, EmptyMasksMatchAllZeroMasks) {
    std::mt19937 gen(13);
    Eigen::MatrixXd data = sim::standardNormal(5, 30, gen);
    data.row(3) += data.row(4);

    ConstraintMasks emptyMasks;
    ConstraintMasks zeroMasks;
    zeroMasks.zero = Eigen::MatrixXd::Zero(5, 5);
    zeroMasks.one = Eigen::MatrixXd::Zero(5, 5);

    UndirectedNetworkEstimator estimator;
    EstimatedNetwork unconstrained = estimator.estimate(data, emptyMasks, tightParameters(0.1));
    EstimatedNetwork constrained = estimator.estimate(data, zeroMasks, tightParameters(0.1));

    EXPECT_TRUE(unconstrained.precision.isApprox(constrained.precision, 1e-12));
}

TEST(UndirectedEstimatorTest, EdgeCountDoesNotIncreaseWithLambda) {
    std::mt19937 gen(17);
    Eigen::MatrixXd omega = sim::chainPrecision(6, 6, 0.4);
    Eigen::MatrixXd data = sim::sampleGaussian(omega.inverse(), 100, gen);

    UndirectedNetworkEstimator estimator;
    int previous = std::numeric_limits<int>::max();
    for (double lambda : {0.01, 0.05, 0.1, 0.2, 0.4, 0.8, 1.6}) {
        EstimatedNetwork network = estimator.estimate(data, ConstraintMasks(), tightParameters(lambda));
        EXPECT_LE(network.numEdges, previous) << "lambda = " << lambda;
        previous = network.numEdges;
    }
    EXPECT_EQ(previous, 0);
}

TEST(UndirectedEstimatorTest, LargeLambdaGivesDegenerateFitWarning) {
    std::mt19937 gen(19);
    Eigen::MatrixXd data = sim::standardNormal(4, 20, gen);

    UndirectedNetworkEstimator estimator;
    EstimatedNetwork network = estimator.estimate(data, ConstraintMasks(), tightParameters(100.0));

    EXPECT_TRUE(network.isEdgeless());
    ASSERT_EQ(network.warnings.size(), 1u);
    EXPECT_EQ(network.warnings[0].type, WarningType::DEGENERATE_FIT);
    Eigen::MatrixXd covariance = buildCovariance(data);
    for (int i = 0; i < 4; ++i) {
        EXPECT_NEAR(network.precision(i, i), 1.0 / covariance(i, i), 1e-10);
    }
}

TEST(UndirectedEstimatorTest, PermutingGenesPermutesTheEstimate) {
    std::mt19937 gen(23);
    Eigen::MatrixXd omega = sim::chainPrecision(5, 5, 0.35);
    Eigen::MatrixXd data = sim::sampleGaussian(omega.inverse(), 60, gen);

    ConstraintMasks masks;
    masks.zero = Eigen::MatrixXd::Zero(5, 5);
    masks.zero(0, 4) = masks.zero(4, 0) = 1.0;
    masks.one = Eigen::MatrixXd::Zero(5, 5);
    masks.one(1, 2) = masks.one(2, 1) = 1.0;

    Eigen::MatrixXd P = sim::permutationMatrix({3, 0, 4, 1, 2});
    ConstraintMasks permutedMasks;
    permutedMasks.zero = P * masks.zero * P.transpose();
    permutedMasks.one = P * masks.one * P.transpose();

    EstimationParameters params = tightParameters(0.08);
    params.knownEdgeWeight = 0.5;

    UndirectedNetworkEstimator estimator;
    EstimatedNetwork original = estimator.estimate(data, masks, params);
    EstimatedNetwork permuted = estimator.estimate(P * data, permutedMasks, params);

    EXPECT_TRUE((P * original.precision * P.transpose()).isApprox(permuted.precision, 1e-6));
    EXPECT_TRUE((P * original.adjacency * P.transpose()).isApprox(permuted.adjacency));
}

TEST(UndirectedEstimatorTest, PartialCorrelationsHaveZeroDiagonal) {
    Eigen::MatrixXd precision(2, 2);
    precision << 2.0, -1.0,
                 -1.0, 2.0;

    Eigen::MatrixXd pcor = partialCorrelations(precision);

    EXPECT_EQ(pcor(0, 0), 0.0);
    EXPECT_NEAR(pcor(0, 1), 0.5, 1e-12);
}

TEST(UndirectedEstimatorTest, OverlappingMasksThrow) {
    ConstraintMasks masks;
    masks.zero = Eigen::MatrixXd::Zero(3, 3);
    masks.one = Eigen::MatrixXd::Zero(3, 3);
    masks.zero(0, 2) = masks.zero(2, 0) = 1.0;
    masks.one(0, 2) = masks.one(2, 0) = 1.0;

    UndirectedNetworkEstimator estimator;
    EXPECT_THROW(estimator.validateMasks(masks, 3), ConstraintConflictError);
}

TEST(UndirectedEstimatorTest, AsymmetricMaskThrows) {
    std::mt19937 gen(29);
    Eigen::MatrixXd data = sim::standardNormal(3, 10, gen);

    ConstraintMasks masks;
    masks.one = Eigen::MatrixXd::Zero(3, 3);
    masks.one(0, 1) = 1.0;

    UndirectedNetworkEstimator estimator;
    EXPECT_THROW(estimator.estimate(data, masks, tightParameters(0.1)), ConstraintConflictError);
}

TEST(UndirectedEstimatorTest, WrongMaskShapeThrows) {
    ConstraintMasks masks;
    masks.zero = Eigen::MatrixXd::Zero(2, 2);

    UndirectedNetworkEstimator estimator;
    EXPECT_THROW(estimator.validateMasks(masks, 3), DimensionError);
}

TEST(UndirectedEstimatorTest, IterationBudgetExhaustionThrows) {
    std::mt19937 gen(31);
    Eigen::MatrixXd data = sim::standardNormal(6, 30, gen);
    data.row(1) += data.row(0);
    data.row(2) += data.row(1);

    EstimationParameters params;
    params.lambda = 0.001;
    params.tolerance = 1e-14;
    params.maxIterations = 1;

    UndirectedNetworkEstimator estimator;
    EXPECT_THROW(estimator.estimate(data, ConstraintMasks(), params), ConvergenceError);
}

TEST(UndirectedEstimatorTest, FactoryCreatesByTypeAndName) {
    EXPECT_EQ(NetworkEstimatorFactory::createEstimator(NetworkType::UNDIRECTED)->getType(), NetworkType::UNDIRECTED);
    EXPECT_EQ(NetworkEstimatorFactory::createEstimator("directed")->getType(), NetworkType::DIRECTED);
    EXPECT_THROW(NetworkEstimatorFactory::createEstimator("bayesian"), std::runtime_error);
}
