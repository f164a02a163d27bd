#include "TuningSelector.hpp"
#include "CovarianceBuilder.hpp"
#include "Exceptions.hpp"
#include "NetworkEstimation.hpp"
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

namespace netgsa {
namespace network {

namespace {

const double kTieTolerance = 1e-10;

}

double TuningSelector::computeBIC(
    const Eigen::MatrixXd& covariance,
    const Eigen::MatrixXd& precision,
    int df,
    int numSamples) {

    Eigen::LLT<Eigen::MatrixXd> llt(precision);
    if (llt.info() != Eigen::Success) {
        throw ProcessingError("Precision matrix is not positive definite; BIC undefined");
    }
    double logDet = 2.0 * llt.matrixLLT().diagonal().array().log().sum();
    double fit = (covariance * precision).trace() - logDet;

    return fit + std::log(static_cast<double>(numSamples)) / numSamples * df;
}

void TuningSelector::validateGrid(const EstimationParameters& params) const {
    for (double lambda : params.lambdaGrid) {
        if (lambda < 0 || std::isnan(lambda)) {
            throw std::invalid_argument("Lambda grid values must be non-negative, got " + std::to_string(lambda));
        }
    }
    for (double weight : params.weightGrid) {
        if (weight < 0 || std::isnan(weight)) {
            throw std::invalid_argument("Weight grid values must be non-negative, got " + std::to_string(weight));
        }
    }
    if (params.lambdaGrid.empty() && !(params.lambda >= 0)) {
        throw std::invalid_argument("lambda must be non-negative, got " + std::to_string(params.lambda));
    }
    if (params.weightGrid.empty() && !(params.knownEdgeWeight >= 0)) {
        throw std::invalid_argument("Known edge weight must be non-negative, got "
                                    + std::to_string(params.knownEdgeWeight));
    }
    if (params.maxIterations < 1 || !(params.tolerance > 0)) {
        throw std::invalid_argument("Solver needs maxIterations >= 1 and tolerance > 0");
    }
    if (params.numThreads < 1) {
        throw std::invalid_argument("numThreads must be at least 1, got " + std::to_string(params.numThreads));
    }
}

bool TuningSelector::isBetter(const BICRecord& candidate, const BICRecord& incumbent) const {
    if (candidate.bic < incumbent.bic - kTieTolerance) {
        return true;
    }
    if (candidate.bic > incumbent.bic + kTieTolerance) {
        return false;
    }
    // Tie: prefer the sparser model
    if (candidate.lambda != incumbent.lambda) {
        return candidate.lambda > incumbent.lambda;
    }
    return candidate.weight > incumbent.weight;
}

SelectionResult TuningSelector::select(
    const Eigen::MatrixXd& data,
    const ConstraintMasks& masks,
    const EstimationParameters& params) const {

    validateGrid(params);
    if (masks.type == NetworkType::DIRECTED && !params.weightGrid.empty()) {
        throw std::invalid_argument("Known-edge weights do not apply to directed networks; leave the weight grid empty");
    }

    auto estimator = NetworkEstimatorFactory::createEstimator(masks.type);
    int p = data.rows();

    // Fail on shape and constraint problems before any fitting
    estimator->validateMasks(masks, p);
    Eigen::MatrixXd covariance = buildCovariance(data, params.eta);
    for (int i = 0; i < p; ++i) {
        if (!(covariance(i, i) > 0.0)) {
            throw ProcessingError("Gene " + std::to_string(i) + " has variance "
                                  + std::to_string(covariance(i, i)) + "; set eta > 0");
        }
    }

    std::vector<double> lambdas = params.lambdaGrid;
    if (lambdas.empty()) {
        lambdas.push_back(params.lambda);
    }

    SelectionResult result;
    result.hasWeightGrid = !params.weightGrid.empty();
    std::vector<double> weights = params.weightGrid;
    if (weights.empty()) {
        weights.push_back(params.knownEdgeWeight);
    }

    const int numPoints = static_cast<int>(lambdas.size() * weights.size());
    std::vector<BICRecord> records(numPoints);
    std::vector<EstimatedNetwork> networks(numPoints);

    // Each grid point writes only its own slot
#pragma omp parallel for schedule(dynamic) num_threads(params.numThreads)
    for (int idx = 0; idx < numPoints; ++idx) {
        EstimationParameters pointParams = params;
        pointParams.lambda = lambdas[idx / weights.size()];
        pointParams.knownEdgeWeight = weights[idx % weights.size()];
        pointParams.verbose = false;

        BICRecord& record = records[idx];
        record.lambda = pointParams.lambda;
        if (result.hasWeightGrid) {
            record.weight = pointParams.knownEdgeWeight;
        }

        try {
            EstimatedNetwork network = estimator->estimate(data, masks, pointParams);
            record.df = network.numEdges;
            record.bic = computeBIC(network.covariance, network.precision, network.numEdges, network.numSamples);
            record.valid = true;
            networks[idx] = std::move(network);
        }
        catch (const ConvergenceError& e) {
            record.failure = e.what();
        }
        catch (const ProcessingError& e) {
            record.failure = e.what();
        }

        if (params.verbose) {
#pragma omp critical
            {
                std::cout << "lambda = " << record.lambda;
                if (result.hasWeightGrid) {
                    std::cout << ", weight = " << record.weight;
                }
                if (record.valid) {
                    std::cout << ": BIC = " << record.bic << ", edges = " << record.df << std::endl;
                } else {
                    std::cout << ": failed (" << record.failure << ")" << std::endl;
                }
            }
        }
    }

    // Selection runs only after every grid point has finished
    int best = -1;
    bool allEdgeless = true;
    for (int idx = 0; idx < numPoints; ++idx) {
        if (!records[idx].valid) continue;
        if (records[idx].df > 0) {
            allEdgeless = false;
        }
        if (best < 0 || isBetter(records[idx], records[best])) {
            best = idx;
        }
    }

    if (best < 0) {
        throw ConvergenceError("No grid point could be fitted out of " + std::to_string(numPoints)
                               + "; first failure: " + records.front().failure);
    }

    result.bicTable = std::move(records);
    result.selectedIndex = best;
    result.network = std::move(networks[best]);

    if (allEdgeless) {
        result.warnings.push_back({
            WarningType::DEGENERATE_FIT,
            "Every fitted grid point produced a network without edges"
        });
    }

    return result;
}

}
}
