#include "NetworkEstimation.hpp"
#include "CovarianceBuilder.hpp"
#include "Exceptions.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>

namespace netgsa {
namespace network {

namespace {

double softThreshold(double z, double gamma) {
    return std::max(0.0, z - gamma) - std::max(0.0, -z - gamma);
}

bool isSet(const Eigen::MatrixXd& mask, int i, int j) {
    return mask.size() > 0 && mask(i, j) != 0.0;
}

std::string entryString(int i, int j) {
    return "(" + std::to_string(i) + ", " + std::to_string(j) + ")";
}

void checkMaskShape(const Eigen::MatrixXd& mask, const std::string& name, int numGenes) {
    if (mask.size() > 0 && (mask.rows() != numGenes || mask.cols() != numGenes)) {
        throw DimensionError("Mask '" + name + "' has shape " + shapeString(mask.rows(), mask.cols())
                             + ", expected " + shapeString(numGenes, numGenes));
    }
}

void checkPositiveDiagonal(const Eigen::MatrixXd& covariance) {
    for (int i = 0; i < covariance.rows(); ++i) {
        if (!(covariance(i, i) > 0.0)) {
            throw ProcessingError("Gene " + std::to_string(i) + " has variance "
                                  + std::to_string(covariance(i, i)) + "; set eta > 0");
        }
    }
}

void thresholdSmallEntries(Eigen::MatrixXd& matrix, double eps) {
    for (int j = 0; j < matrix.cols(); ++j) {
        for (int i = 0; i < matrix.rows(); ++i) {
            if (i != j && std::abs(matrix(i, j)) < eps) {
                matrix(i, j) = 0.0;
            }
        }
    }
}

}

int lassoCoordinateDescent(
    const Eigen::MatrixXd& gram,
    const Eigen::VectorXd& target,
    const Eigen::VectorXd& penalties,
    const std::vector<int>& active,
    Eigen::VectorXd& beta,
    double tolerance,
    int maxIterations) {

    // Gradient components G * beta, updated incrementally
    Eigen::VectorXd gc = gram * beta;

    for (int iter = 1; iter <= maxIterations; ++iter) {
        double maxDiff = 0.0;
        for (int k : active) {
            double z = target(k) - gc(k) + gram(k, k) * beta(k);
            double updated = softThreshold(z, penalties(k)) / gram(k, k);
            double diff = updated - beta(k);
            if (diff != 0.0) {
                beta(k) = updated;
                gc += gram.col(k) * diff;
                maxDiff = std::max(maxDiff, std::abs(diff));
            }
        }
        if (maxDiff < tolerance) {
            return iter;
        }
    }
    return -1;
}

Eigen::MatrixXd partialCorrelations(const Eigen::MatrixXd& precision) {
    int p = precision.rows();
    Eigen::VectorXd invSqrt = precision.diagonal().array().sqrt().inverse();
    Eigen::MatrixXd pcor = -(invSqrt.asDiagonal() * precision * invSqrt.asDiagonal());
    for (int i = 0; i < p; ++i) {
        pcor(i, i) = 0.0;
    }
    return pcor;
}

int countEdges(const Eigen::MatrixXd& adjacency, NetworkType type) {
    int count = 0;
    for (int j = 0; j < adjacency.cols(); ++j) {
        for (int i = 0; i < adjacency.rows(); ++i) {
            if (i != j && adjacency(i, j) != 0.0) {
                count++;
            }
        }
    }
    // Each undirected edge appears twice
    return type == NetworkType::UNDIRECTED ? count / 2 : count;
}

// Undirected estimator

void UndirectedNetworkEstimator::validateMasks(const ConstraintMasks& masks, int numGenes) const {
    if (masks.type != NetworkType::UNDIRECTED) {
        throw std::invalid_argument("Undirected estimator given masks declared as directed");
    }
    checkMaskShape(masks.zero, "zero", numGenes);
    checkMaskShape(masks.one, "one", numGenes);

    for (int i = 0; i < numGenes; ++i) {
        for (int j = i + 1; j < numGenes; ++j) {
            if (isSet(masks.zero, i, j) != isSet(masks.zero, j, i)) {
                throw ConstraintConflictError("Mask 'zero' is not symmetric at entry " + entryString(i, j));
            }
            if (isSet(masks.one, i, j) != isSet(masks.one, j, i)) {
                throw ConstraintConflictError("Mask 'one' is not symmetric at entry " + entryString(i, j));
            }
            if (isSet(masks.zero, i, j) && isSet(masks.one, i, j)) {
                throw ConstraintConflictError("Entry " + entryString(i, j)
                                              + " is both a forbidden and a known edge");
            }
        }
    }
}

Eigen::MatrixXd UndirectedNetworkEstimator::buildPenaltyMatrix(
    const ConstraintMasks& masks,
    int numGenes,
    double lambda,
    double weight) const {

    Eigen::MatrixXd penalties = Eigen::MatrixXd::Constant(numGenes, numGenes, lambda);
    for (int j = 0; j < numGenes; ++j) {
        for (int i = 0; i < numGenes; ++i) {
            if (i == j || isSet(masks.zero, i, j)) {
                penalties(i, j) = 0.0;
            } else if (isSet(masks.one, i, j)) {
                penalties(i, j) = lambda * weight;
            }
        }
    }
    return penalties;
}

Eigen::MatrixXd UndirectedNetworkEstimator::graphicalLasso(
    const Eigen::MatrixXd& covariance,
    const Eigen::MatrixXd& penalties,
    const Eigen::MatrixXd& fixedZero,
    const EstimationParameters& params,
    int& iterations) const {

    int p = covariance.rows();
    Eigen::MatrixXd W = covariance;
    Eigen::MatrixXd coefficients = Eigen::MatrixXd::Zero(p, p);

    // Convergence threshold scales with the mean absolute off-diagonal covariance
    double offDiagonalMass = covariance.cwiseAbs().sum() - covariance.diagonal().cwiseAbs().sum();
    double scale = p > 1 ? offDiagonalMass / (p * (p - 1.0)) : 0.0;
    if (scale <= 0.0) {
        scale = 1.0;
    }
    double threshold = params.tolerance * scale;
    double innerTolerance = 0.1 * threshold;

    std::vector<std::vector<int>> activeSets(p);
    for (int j = 0; j < p; ++j) {
        for (int k = 0; k < p; ++k) {
            if (k != j && !isSet(fixedZero, k, j)) {
                activeSets[j].push_back(k);
            }
        }
    }

    iterations = 0;
    bool converged = p < 2;
    for (int iter = 1; iter <= params.maxIterations && !converged; ++iter) {
        double change = 0.0;

        for (int j = 0; j < p; ++j) {
            Eigen::VectorXd beta = coefficients.col(j);
            beta(j) = 0.0;

            int sweeps = lassoCoordinateDescent(W, covariance.col(j), penalties.col(j),
                                                activeSets[j], beta, innerTolerance,
                                                params.maxIterations);
            if (sweeps < 0) {
                throw ConvergenceError("Lasso for gene " + std::to_string(j)
                                       + " did not converge in " + std::to_string(params.maxIterations)
                                       + " sweeps (lambda = " + std::to_string(params.lambda) + ")");
            }

            Eigen::VectorXd w12 = W * beta;
            for (int k = 0; k < p; ++k) {
                if (k == j) continue;
                change += std::abs(w12(k) - W(k, j));
                W(k, j) = w12(k);
                W(j, k) = w12(k);
            }
            coefficients.col(j) = beta;
        }

        iterations = iter;
        converged = change / (p * (p - 1.0)) < threshold;
    }

    if (!converged) {
        throw ConvergenceError("Graphical lasso did not converge in " + std::to_string(params.maxIterations)
                               + " iterations (lambda = " + std::to_string(params.lambda)
                               + ", tolerance = " + std::to_string(params.tolerance) + ")");
    }

    // Recover the precision matrix column by column
    Eigen::MatrixXd precision = Eigen::MatrixXd::Zero(p, p);
    for (int j = 0; j < p; ++j) {
        Eigen::VectorXd beta = coefficients.col(j);
        beta(j) = 0.0;
        double schur = W(j, j) - W.col(j).dot(beta);
        double omega = 1.0 / schur;
        precision.col(j) = -beta * omega;
        precision(j, j) = omega;
    }

    return precision;
}

EstimatedNetwork UndirectedNetworkEstimator::estimate(
    const Eigen::MatrixXd& data,
    const ConstraintMasks& masks,
    const EstimationParameters& params) const {

    Eigen::MatrixXd covariance = buildCovariance(data, params.eta);
    return estimateFromCovariance(covariance, data.cols(), masks, params);
}

EstimatedNetwork UndirectedNetworkEstimator::estimateFromCovariance(
    const Eigen::MatrixXd& covariance,
    int numSamples,
    const ConstraintMasks& masks,
    const EstimationParameters& params) const {

    int p = covariance.rows();
    if (covariance.cols() != p) {
        throw DimensionError("Covariance must be square, got " + shapeString(covariance.rows(), covariance.cols()));
    }
    if (params.lambda < 0 || params.knownEdgeWeight < 0) {
        throw std::invalid_argument("lambda and weight must be non-negative, got lambda = "
                                    + std::to_string(params.lambda) + ", weight = "
                                    + std::to_string(params.knownEdgeWeight));
    }
    validateMasks(masks, p);
    checkPositiveDiagonal(covariance);

    if (params.verbose) {
        std::cout << "Fitting undirected network, lambda = " << params.lambda
                  << ", weight = " << params.knownEdgeWeight << std::endl;
    }

    Eigen::MatrixXd penalties = buildPenaltyMatrix(masks, p, params.lambda, params.knownEdgeWeight);

    EstimatedNetwork network;
    network.type = NetworkType::UNDIRECTED;
    network.covariance = covariance;
    network.numSamples = numSamples;
    network.lambda = params.lambda;
    network.weight = params.knownEdgeWeight;

    Eigen::MatrixXd precision = graphicalLasso(covariance, penalties, masks.zero, params, network.iterations);

    // Sparsify, then average with the transpose to remove numerical asymmetry
    thresholdSmallEntries(precision, params.eps);
    precision = 0.5 * (precision + precision.transpose());
    for (int j = 0; j < p; ++j) {
        for (int i = 0; i < p; ++i) {
            if (isSet(masks.zero, i, j)) {
                precision(i, j) = 0.0;
            }
        }
    }
    network.precision = precision;

    network.adjacency = Eigen::MatrixXd::Zero(p, p);
    for (int j = 0; j < p; ++j) {
        for (int i = 0; i < p; ++i) {
            if (i != j && precision(i, j) != 0.0) {
                network.adjacency(i, j) = 1.0;
            }
        }
    }
    network.weights = partialCorrelations(precision);
    network.numEdges = countEdges(network.adjacency, NetworkType::UNDIRECTED);

    if (network.isEdgeless()) {
        network.warnings.push_back({
            WarningType::DEGENERATE_FIT,
            "Estimated network has no edges at lambda = " + std::to_string(params.lambda)
        });
    }

    return network;
}

std::string UndirectedNetworkEstimator::getDescription() const {
    return "Graphical lasso with forbidden-edge and known-edge constraints";
}

// Directed estimator

std::vector<int> DirectedNetworkEstimator::resolveOrder(const ConstraintMasks& masks, int numGenes) const {
    std::vector<int> order = masks.topologicalOrder;
    if (order.empty()) {
        for (int i = 0; i < numGenes; ++i) {
            order.push_back(i);
        }
        return order;
    }

    if (static_cast<int>(order.size()) != numGenes) {
        throw OrderingError("Topological order has " + std::to_string(order.size())
                            + " entries for " + std::to_string(numGenes) + " genes");
    }
    std::vector<bool> seen(numGenes, false);
    for (int gene : order) {
        if (gene < 0 || gene >= numGenes || seen[gene]) {
            throw OrderingError("Topological order is not a permutation of 0.."
                                + std::to_string(numGenes - 1) + " (entry " + std::to_string(gene) + ")");
        }
        seen[gene] = true;
    }
    return order;
}

void DirectedNetworkEstimator::validateMasks(const ConstraintMasks& masks, int numGenes) const {
    if (masks.type != NetworkType::DIRECTED) {
        throw std::invalid_argument("Directed estimator given masks declared as undirected");
    }
    checkMaskShape(masks.zero, "zero", numGenes);
    checkMaskShape(masks.one, "one", numGenes);

    std::vector<int> order = resolveOrder(masks, numGenes);
    std::vector<int> position(numGenes);
    for (int k = 0; k < numGenes; ++k) {
        position[order[k]] = k;
    }

    for (int i = 0; i < numGenes; ++i) {
        for (int j = 0; j < numGenes; ++j) {
            if (!isSet(masks.one, i, j)) continue;
            if (position[i] >= position[j]) {
                throw OrderingError("Edge " + std::to_string(i) + " -> " + std::to_string(j)
                                    + " goes from order position " + std::to_string(position[i])
                                    + " to " + std::to_string(position[j]));
            }
            if (isSet(masks.zero, i, j)) {
                throw ConstraintConflictError("Entry " + entryString(i, j)
                                              + " is both a forbidden and a known edge");
            }
        }
    }
}

EstimatedNetwork DirectedNetworkEstimator::estimate(
    const Eigen::MatrixXd& data,
    const ConstraintMasks& masks,
    const EstimationParameters& params) const {

    int p = data.rows();
    if (params.lambda < 0) {
        throw std::invalid_argument("lambda must be non-negative, got " + std::to_string(params.lambda));
    }
    validateMasks(masks, p);

    Eigen::MatrixXd covariance = buildCovariance(data, params.eta);
    checkPositiveDiagonal(covariance);

    if (params.verbose) {
        std::cout << "Fitting directed network, lambda = " << params.lambda << std::endl;
    }

    EstimatedNetwork network;
    network.type = NetworkType::DIRECTED;
    network.covariance = covariance;
    network.numSamples = data.cols();
    network.lambda = params.lambda;
    network.weight = params.knownEdgeWeight;

    Eigen::MatrixXd coefficients = Eigen::MatrixXd::Zero(p, p);
    Eigen::VectorXd residualVariances(p);
    Eigen::VectorXd penalties = Eigen::VectorXd::Constant(p, params.lambda);

    for (int gene : resolveOrder(masks, p)) {
        std::vector<int> parents;
        for (int i = 0; i < p; ++i) {
            if (isSet(masks.one, i, gene)) {
                parents.push_back(i);
            }
        }

        Eigen::VectorXd beta = Eigen::VectorXd::Zero(p);
        if (!parents.empty()) {
            int sweeps = lassoCoordinateDescent(covariance, covariance.col(gene), penalties, parents,
                                                beta, 0.1 * params.tolerance, params.maxIterations);
            if (sweeps < 0) {
                throw ConvergenceError("Regression for gene " + std::to_string(gene) + " on "
                                       + std::to_string(parents.size()) + " parents did not converge in "
                                       + std::to_string(params.maxIterations) + " sweeps (lambda = "
                                       + std::to_string(params.lambda) + ")");
            }
            network.iterations = std::max(network.iterations, sweeps);
        }

        for (int parent : parents) {
            if (std::abs(beta(parent)) >= params.eps) {
                coefficients(parent, gene) = beta(parent);
            }
        }

        Eigen::VectorXd b = coefficients.col(gene);
        double residual = covariance(gene, gene) - 2.0 * b.dot(covariance.col(gene)) + b.dot(covariance * b);
        if (!(residual > 0.0)) {
            throw ConvergenceError("Residual variance for gene " + std::to_string(gene) + " is "
                                   + std::to_string(residual) + "; increase eta or lambda");
        }
        residualVariances(gene) = residual;
    }

    Eigen::MatrixXd identityMinusA = Eigen::MatrixXd::Identity(p, p) - coefficients;
    network.precision = identityMinusA * residualVariances.cwiseInverse().asDiagonal() * identityMinusA.transpose();
    network.weights = coefficients;
    network.adjacency = (coefficients.array() != 0.0).cast<double>().matrix();
    network.numEdges = countEdges(network.adjacency, NetworkType::DIRECTED);

    if (network.isEdgeless()) {
        network.warnings.push_back({
            WarningType::DEGENERATE_FIT,
            "Estimated directed network has no edges at lambda = " + std::to_string(params.lambda)
        });
    }

    return network;
}

std::string DirectedNetworkEstimator::getDescription() const {
    return "Lasso regression of each gene on its parents in topological order";
}

// Factory Implementation
std::unique_ptr<NetworkEstimator> NetworkEstimatorFactory::createEstimator(NetworkType type) {
    switch (type) {
        case NetworkType::UNDIRECTED:
            return std::make_unique<UndirectedNetworkEstimator>();
        case NetworkType::DIRECTED:
            return std::make_unique<DirectedNetworkEstimator>();
        default:
            throw std::runtime_error("Unknown network type");
    }
}

std::unique_ptr<NetworkEstimator> NetworkEstimatorFactory::createEstimator(const std::string& name) {
    if (name == "undirected") {
        return std::make_unique<UndirectedNetworkEstimator>();
    } else if (name == "directed") {
        return std::make_unique<DirectedNetworkEstimator>();
    } else {
        throw std::runtime_error("Unknown network estimator: " + name);
    }
}

std::vector<std::string> NetworkEstimatorFactory::availableEstimators() {
    return {"undirected", "directed"};
}

} // namespace network
} // namespace netgsa
