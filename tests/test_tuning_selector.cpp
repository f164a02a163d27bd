#include "TuningSelector.hpp"
#include "CovarianceBuilder.hpp"
#include "Exceptions.hpp"
#include "Simulation.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>

using namespace netgsa;
using namespace netgsa::network;

namespace {

Eigen::MatrixXd chainData(int n, unsigned seed) {
    std::mt19937 gen(seed);
    Eigen::MatrixXd omega = sim::chainPrecision(5, 4, 0.4);
    return sim::sampleGaussian(omega.inverse(), n, gen);
}

EstimationParameters gridParameters(const std::vector<double>& lambdas) {
    EstimationParameters params;
    params.lambdaGrid = lambdas;
    params.tolerance = 1e-10;
    params.maxIterations = 5000;
    return params;
}

}

TEST(TuningSelectorTest, SelectsMinimumRecordedBIC) {
    Eigen::MatrixXd data = chainData(120, 41);
    EstimationParameters params = gridParameters({0.01, 0.03, 0.06, 0.1, 0.2, 0.4, 0.8});

    TuningSelector selector;
    SelectionResult result = selector.select(data, ConstraintMasks(), params);

    ASSERT_EQ(result.bicTable.size(), 7u);
    EXPECT_FALSE(result.hasWeightGrid);
    for (const auto& record : result.bicTable) {
        ASSERT_TRUE(record.valid);
        EXPECT_TRUE(std::isnan(record.weight));
        EXPECT_GE(record.bic, result.selected().bic);
    }
    EXPECT_EQ(result.network.lambda, result.selected().lambda);
    EXPECT_EQ(result.network.numEdges, result.selected().df);
}

TEST(TuningSelectorTest, RecomputedBICMatchesRecord) {
    Eigen::MatrixXd data = chainData(80, 43);
    EstimationParameters params = gridParameters({0.05, 0.15, 0.3});

    TuningSelector selector;
    SelectionResult result = selector.select(data, ConstraintMasks(), params);

    const EstimatedNetwork& network = result.network;
    double bic = TuningSelector::computeBIC(network.covariance, network.precision,
                                            network.numEdges, network.numSamples);
    EXPECT_NEAR(bic, result.selected().bic, 1e-10);

    // Explicit formula
    double expected = (buildCovariance(data) * network.precision).trace()
                      - std::log(network.precision.determinant())
                      + std::log(80.0) / 80.0 * network.numEdges;
    EXPECT_NEAR(bic, expected, 1e-8);
}

TEST(TuningSelectorTest, SingleLambdaGridHasOneRecord) {
    Eigen::MatrixXd data = chainData(50, 47);
    EstimationParameters params = gridParameters({0.12});

    TuningSelector selector;
    SelectionResult result = selector.select(data, ConstraintMasks(), params);

    ASSERT_EQ(result.bicTable.size(), 1u);
    EXPECT_EQ(result.selectedIndex, 0);
    EXPECT_DOUBLE_EQ(result.selected().lambda, 0.12);
}

TEST(TuningSelectorTest, EmptyGridFitsConfiguredLambda) {
    Eigen::MatrixXd data = chainData(50, 53);
    EstimationParameters params = gridParameters({});
    params.lambda = 0.2;

    TuningSelector selector;
    SelectionResult result = selector.select(data, ConstraintMasks(), params);

    ASSERT_EQ(result.bicTable.size(), 1u);
    EXPECT_DOUBLE_EQ(result.selected().lambda, 0.2);
}

TEST(TuningSelectorTest, WeightGridIsCrossedWithLambdas) {
    Eigen::MatrixXd data = chainData(60, 59);
    EstimationParameters params = gridParameters({0.05, 0.2});
    params.weightGrid = {0.0, 0.5, 1.0};

    ConstraintMasks masks;
    masks.one = Eigen::MatrixXd::Zero(5, 5);
    masks.one(0, 1) = masks.one(1, 0) = 1.0;

    TuningSelector selector;
    SelectionResult result = selector.select(data, masks, params);

    ASSERT_EQ(result.bicTable.size(), 6u);
    EXPECT_TRUE(result.hasWeightGrid);
    // Lambda-major order
    EXPECT_DOUBLE_EQ(result.bicTable[0].lambda, 0.05);
    EXPECT_DOUBLE_EQ(result.bicTable[2].weight, 1.0);
    EXPECT_DOUBLE_EQ(result.bicTable[3].lambda, 0.2);
    EXPECT_DOUBLE_EQ(result.bicTable[3].weight, 0.0);
    EXPECT_EQ(result.network.weight, result.selected().weight);
}

TEST(TuningSelectorTest, TiesGoToTheLargerLambda) {
    std::mt19937 gen(61);
    Eigen::MatrixXd data = sim::standardNormal(4, 30, gen);
    // Every lambda is beyond all sample covariances, so every fit is the same diagonal model
    EstimationParameters params = gridParameters({50.0, 200.0, 100.0});

    TuningSelector selector;
    SelectionResult result = selector.select(data, ConstraintMasks(), params);

    EXPECT_DOUBLE_EQ(result.selected().lambda, 200.0);
    EXPECT_NEAR(result.bicTable[0].bic, result.bicTable[1].bic, 1e-12);
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_EQ(result.warnings[0].type, WarningType::DEGENERATE_FIT);
}

TEST(TuningSelectorTest, ParallelAndSerialGridsAgree) {
    Eigen::MatrixXd data = chainData(90, 67);
    EstimationParameters serial = gridParameters({0.02, 0.05, 0.1, 0.2, 0.4});
    EstimationParameters parallel = serial;
    parallel.numThreads = 4;

    TuningSelector selector;
    SelectionResult a = selector.select(data, ConstraintMasks(), serial);
    SelectionResult b = selector.select(data, ConstraintMasks(), parallel);

    ASSERT_EQ(a.bicTable.size(), b.bicTable.size());
    for (size_t i = 0; i < a.bicTable.size(); ++i) {
        EXPECT_DOUBLE_EQ(a.bicTable[i].bic, b.bicTable[i].bic);
        EXPECT_EQ(a.bicTable[i].df, b.bicTable[i].df);
    }
    EXPECT_EQ(a.selectedIndex, b.selectedIndex);
}

TEST(TuningSelectorTest, FailedGridPointsAreMarkedAndSkipped) {
    std::mt19937 gen(71);
    Eigen::MatrixXd data = sim::standardNormal(5, 30, gen);
    data.row(1) += data.row(0);
    data.row(2) += data.row(1);

    EstimationParameters params = gridParameters({0.0005, 50.0});
    params.tolerance = 1e-14;
    params.maxIterations = 3;

    TuningSelector selector;
    SelectionResult result = selector.select(data, ConstraintMasks(), params);

    EXPECT_FALSE(result.bicTable[0].valid);
    EXPECT_FALSE(result.bicTable[0].failure.empty());
    EXPECT_TRUE(result.bicTable[1].valid);
    EXPECT_EQ(result.selectedIndex, 1);
}

TEST(TuningSelectorTest, AllGridPointsFailingThrows) {
    std::mt19937 gen(73);
    Eigen::MatrixXd data = sim::standardNormal(5, 30, gen);
    data.row(1) += data.row(0);

    EstimationParameters params = gridParameters({0.0005, 0.001});
    params.tolerance = 1e-14;
    params.maxIterations = 1;

    TuningSelector selector;
    EXPECT_THROW(selector.select(data, ConstraintMasks(), params), ConvergenceError);
}

TEST(TuningSelectorTest, InvalidInputsFailBeforeFitting) {
    Eigen::MatrixXd data = chainData(30, 79);
    TuningSelector selector;

    EXPECT_THROW(selector.select(data, ConstraintMasks(), gridParameters({0.1, -0.2})), std::invalid_argument);

    EstimationParameters negativeWeight = gridParameters({0.1});
    negativeWeight.weightGrid = {-1.0};
    EXPECT_THROW(selector.select(data, ConstraintMasks(), negativeWeight), std::invalid_argument);

    ConstraintMasks conflicting;
    conflicting.zero = Eigen::MatrixXd::Zero(5, 5);
    conflicting.one = Eigen::MatrixXd::Zero(5, 5);
    conflicting.zero(1, 3) = conflicting.zero(3, 1) = 1.0;
    conflicting.one(1, 3) = conflicting.one(3, 1) = 1.0;
    EXPECT_THROW(selector.select(data, conflicting, gridParameters({0.1})), ConstraintConflictError);

    EXPECT_THROW(selector.select(data.leftCols(1), ConstraintMasks(), gridParameters({0.1})), DimensionError);
}

TEST(TuningSelectorTest, DirectedMasksUseTheDirectedEstimator) {
    Eigen::MatrixXd data = chainData(80, 83);

    ConstraintMasks masks;
    masks.type = NetworkType::DIRECTED;
    masks.one = Eigen::MatrixXd::Zero(5, 5);
    masks.one(0, 1) = masks.one(1, 2) = masks.one(2, 3) = 1.0;

    TuningSelector selector;
    SelectionResult result = selector.select(data, masks, gridParameters({0.01, 0.1, 1.0}));

    EXPECT_EQ(result.network.type, NetworkType::DIRECTED);
    for (const auto& record : result.bicTable) {
        EXPECT_TRUE(record.valid);
        EXPECT_LE(record.df, 3);
    }
}

TEST(TuningSelectorTest, DirectedMasksRejectWeightGrid) {
    Eigen::MatrixXd data = chainData(40, 89);

    ConstraintMasks masks;
    masks.type = NetworkType::DIRECTED;
    masks.one = Eigen::MatrixXd::Zero(5, 5);
    masks.one(0, 1) = 1.0;

    EstimationParameters params = gridParameters({0.1, 0.2});
    params.weightGrid = {0.0, 1.0};

    TuningSelector selector;
    EXPECT_THROW(selector.select(data, masks, params), std::invalid_argument);
}

TEST(TuningSelectorTest, NaNGridValuesAreRejected) {
    Eigen::MatrixXd data = chainData(40, 97);
    TuningSelector selector;

    EXPECT_THROW(selector.select(data, ConstraintMasks(),
                                 gridParameters({std::numeric_limits<double>::quiet_NaN()})),
                 std::invalid_argument);
}
