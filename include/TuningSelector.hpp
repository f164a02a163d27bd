#pragma once

#include "DataStructures.hpp"
#include <Eigen/Dense>

namespace netgsa {
namespace network {

// Grid search over lambda (and optionally the known-edge weight) scored by BIC
class TuningSelector {
public:
    TuningSelector() = default;

    // Fits every grid point of `params` and keeps the one with the smallest BIC.
    // Ties go to the larger lambda, then the larger weight.
    SelectionResult select(
        const Eigen::MatrixXd& data,
        const ConstraintMasks& masks,
        const EstimationParameters& params
    ) const;

    // tr(S * Omega) - log det(Omega) + (log n / n) * df
    static double computeBIC(
        const Eigen::MatrixXd& covariance,
        const Eigen::MatrixXd& precision,
        int df,
        int numSamples
    );

private:
    void validateGrid(const EstimationParameters& params) const;

    bool isBetter(const BICRecord& candidate, const BICRecord& incumbent) const;
};

}
}
