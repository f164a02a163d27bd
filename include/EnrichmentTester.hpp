#pragma once

#include "DataStructures.hpp"
#include <Eigen/Dense>
#include <string>
#include <vector>

namespace netgsa {
namespace enrichment {

// Variance of the network-propagated random effect and of the independent noise
struct VarianceComponents {
    double gene = 0.0;
    double noise = 0.0;
    bool clamped = false;
};

// Pathway test on per-condition networks.
//
// Expression of condition k is modelled as x = D_k (mu_k + gamma) + eps with
// gamma ~ N(0, s2_gene I) and eps ~ N(0, s2_noise I), where D_k is the influence
// matrix of the condition's network. A pathway b is summarised per condition by
// theta_k = l_k' mu_k with l_k = b .* (D_k' 1), and the thetas are compared
// across conditions with a Wald statistic.
class EnrichmentTester {
public:
    explicit EnrichmentTester(const TestParameters& params = TestParameters());

    // `networks` holds one network per condition in increasing label order.
    // `geneNames` is only needed when the pathway set names its genes.
    EnrichmentTable test(
        const std::vector<EstimatedNetwork>& networks,
        const Eigen::MatrixXd& expression,
        const std::vector<int>& conditionLabels,
        const PathwaySet& pathways,
        const std::vector<std::string>& geneNames = std::vector<std::string>()
    ) const;

    // D = (I - A')^-1 for directed networks, the symmetric square root of (I - A)^-1 otherwise
    static Eigen::MatrixXd influenceMatrix(const EstimatedNetwork& network);

    // Variance components from the within-condition covariance of one condition
    VarianceComponents estimateVarianceComponents(
        const Eigen::MatrixXd& withinCovariance,
        const Eigen::MatrixXd& influence,
        int numSamples
    ) const;

    // Benjamini-Hochberg adjusted p-values, same order as the input
    static std::vector<double> adjustPValues(const std::vector<double>& pValues);

    const TestParameters& getParameters() const { return params; }

private:
    TestParameters params;

    VarianceComponents estimateReHE(
        const Eigen::MatrixXd& withinCovariance,
        const Eigen::MatrixXd& geneCovariance
    ) const;

    VarianceComponents estimateREML(
        const Eigen::MatrixXd& withinCovariance,
        const Eigen::MatrixXd& geneCovariance
    ) const;

    // Pathway indicators with columns in network gene order
    Eigen::MatrixXd alignPathways(
        const PathwaySet& pathways,
        int numGenes,
        const std::vector<std::string>& geneNames
    ) const;

    void validateParameters() const;
};

std::string varianceMethodName(VarianceMethod method);

VarianceMethod parseVarianceMethod(const std::string& name);

}
}
