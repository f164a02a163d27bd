#pragma once

#include "DataStructures.hpp"
#include <Eigen/Dense>
#include <memory>
#include <string>
#include <vector>

namespace netgsa {
namespace network {

// Abstract base class for network estimators
class NetworkEstimator {
public:
    virtual ~NetworkEstimator() = default;

    // Fit one network to a genes x samples matrix
    virtual EstimatedNetwork estimate(
        const Eigen::MatrixXd& data,
        const ConstraintMasks& masks,
        const EstimationParameters& params
    ) const = 0;

    // Checks masks for a problem with `numGenes` genes, throws on conflicts
    virtual void validateMasks(const ConstraintMasks& masks, int numGenes) const = 0;

    virtual NetworkType getType() const = 0;
    virtual std::string getName() const = 0;
    virtual std::string getDescription() const = 0;
};

// Graphical lasso with zero / known-edge constraints
class UndirectedNetworkEstimator : public NetworkEstimator {
public:
    UndirectedNetworkEstimator() = default;

    EstimatedNetwork estimate(
        const Eigen::MatrixXd& data,
        const ConstraintMasks& masks,
        const EstimationParameters& params
    ) const override;

    // Same fit from a precomputed covariance
    EstimatedNetwork estimateFromCovariance(
        const Eigen::MatrixXd& covariance,
        int numSamples,
        const ConstraintMasks& masks,
        const EstimationParameters& params
    ) const;

    void validateMasks(const ConstraintMasks& masks, int numGenes) const override;

    NetworkType getType() const override { return NetworkType::UNDIRECTED; }
    std::string getName() const override { return "Undirected Network"; }
    std::string getDescription() const override;

private:
    // lambda for free entries, lambda * weight for known edges, zero for fixed entries
    Eigen::MatrixXd buildPenaltyMatrix(
        const ConstraintMasks& masks,
        int numGenes,
        double lambda,
        double weight
    ) const;

    Eigen::MatrixXd graphicalLasso(
        const Eigen::MatrixXd& covariance,
        const Eigen::MatrixXd& penalties,
        const Eigen::MatrixXd& fixedZero,
        const EstimationParameters& params,
        int& iterations
    ) const;
};

// Regression of every gene on its parents under a topological order
class DirectedNetworkEstimator : public NetworkEstimator {
public:
    DirectedNetworkEstimator() = default;

    EstimatedNetwork estimate(
        const Eigen::MatrixXd& data,
        const ConstraintMasks& masks,
        const EstimationParameters& params
    ) const override;

    void validateMasks(const ConstraintMasks& masks, int numGenes) const override;

    NetworkType getType() const override { return NetworkType::DIRECTED; }
    std::string getName() const override { return "Directed Network"; }
    std::string getDescription() const override;

private:
    std::vector<int> resolveOrder(const ConstraintMasks& masks, int numGenes) const;
};

class NetworkEstimatorFactory {
public:
    static std::unique_ptr<NetworkEstimator> createEstimator(NetworkType type);

    static std::unique_ptr<NetworkEstimator> createEstimator(const std::string& name);

    static std::vector<std::string> availableEstimators();
};

// Coordinate descent for min 0.5 b'Gb - b'c + sum_k penalties(k) |b_k| over the
// `active` coordinates; all other entries of `beta` stay at zero.
// Returns the number of sweeps used, or -1 if `maxIterations` was exhausted.
int lassoCoordinateDescent(
    const Eigen::MatrixXd& gram,
    const Eigen::VectorXd& target,
    const Eigen::VectorXd& penalties,
    const std::vector<int>& active,
    Eigen::VectorXd& beta,
    double tolerance,
    int maxIterations
);

// -Omega_ij / sqrt(Omega_ii * Omega_jj) with a zero diagonal
Eigen::MatrixXd partialCorrelations(const Eigen::MatrixXd& precision);

int countEdges(const Eigen::MatrixXd& adjacency, NetworkType type);

}
}
