#include "EnrichmentTester.hpp"
#include "CovarianceBuilder.hpp"
#include "Exceptions.hpp"
#include <boost/math/distributions/chi_squared.hpp>
#include <boost/math/distributions/normal.hpp>
#include <boost/math/tools/minima.hpp>
#include <boost/cstdint.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <numeric>

namespace netgsa {
namespace enrichment {

namespace {

// Search range for the REML variance ratio, on the log scale
const double kMinLogRatio = -18.0;
const double kMaxLogRatio = 14.0;

// Per-condition quantities shared by every pathway
struct ConditionModel {
    int numSamples = 0;
    Eigen::MatrixXd influence;
    Eigen::MatrixXd inverseInfluence;
    Eigen::VectorXd influenceTotals; // Column sums of D
    Eigen::VectorXd effects;         // D^-1 * sample mean
    VarianceComponents variance;
};

// -2 * profiled restricted log-likelihood (up to constants) for ratio h = s2_gene / s2_noise
class ProfileLikelihood {
public:
    ProfileLikelihood(const Eigen::VectorXd& eigenvalues, const Eigen::VectorXd& rotatedVariances)
        : eigenvalues(eigenvalues), rotatedVariances(rotatedVariances) {}

    double noiseVariance(double ratio) const {
        Eigen::ArrayXd scale = ratio * eigenvalues.array() + 1.0;
        return (rotatedVariances.array() / scale).mean();
    }

    double operator()(double logRatio) const {
        return deviance(std::exp(logRatio));
    }

    double deviance(double ratio) const {
        Eigen::ArrayXd scale = ratio * eigenvalues.array() + 1.0;
        double noise = noiseVariance(ratio);
        return eigenvalues.size() * std::log(noise) + scale.log().sum();
    }

private:
    Eigen::VectorXd eigenvalues;
    Eigen::VectorXd rotatedVariances;
};

}

std::string varianceMethodName(VarianceMethod method) {
    switch (method) {
        case VarianceMethod::REHE:
            return "ReHE";
        case VarianceMethod::REML:
            return "REML";
        default:
            throw std::invalid_argument("Unknown variance method");
    }
}

VarianceMethod parseVarianceMethod(const std::string& name) {
    if (name == "rehe" || name == "ReHE") {
        return VarianceMethod::REHE;
    } else if (name == "reml" || name == "REML") {
        return VarianceMethod::REML;
    }
    throw std::invalid_argument("Unknown variance method: " + name + " (use 'rehe' or 'reml')");
}

EnrichmentTester::EnrichmentTester(const TestParameters& params)
    : params(params) {
    validateParameters();
}

void EnrichmentTester::validateParameters() const {
    if (params.minPathwaySize < 1) {
        throw std::invalid_argument("Minimum pathway size must be positive, got "
                                    + std::to_string(params.minPathwaySize));
    }
    if (params.varianceTolerance < 0) {
        throw std::invalid_argument("Variance tolerance must be non-negative, got "
                                    + std::to_string(params.varianceTolerance));
    }
}

Eigen::MatrixXd EnrichmentTester::influenceMatrix(const EstimatedNetwork& network) {
    const Eigen::MatrixXd& A = network.weights;
    int p = A.rows();
    if (A.cols() != p) {
        throw DimensionError("Network weights must be square, got " + shapeString(A.rows(), A.cols()));
    }
    Eigen::MatrixXd identity = Eigen::MatrixXd::Identity(p, p);

    if (network.type == NetworkType::DIRECTED) {
        Eigen::FullPivLU<Eigen::MatrixXd> lu(identity - A.transpose());
        if (!lu.isInvertible()) {
            throw ProcessingError("Directed network gives a singular influence matrix (I - A')");
        }
        return lu.inverse();
    }

    Eigen::LLT<Eigen::MatrixXd> llt(identity - A);
    if (llt.info() != Eigen::Success) {
        throw ProcessingError("Undirected network weights do not give a positive definite (I - A)");
    }
    Eigen::MatrixXd inverse = llt.solve(identity);
    inverse = 0.5 * (inverse + inverse.transpose());

    // Symmetric square root, so relabelling genes relabels D the same way
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> eigen(inverse);
    if (eigen.info() != Eigen::Success) {
        throw ProcessingError("Eigen-decomposition of (I - A)^-1 failed");
    }
    return eigen.operatorSqrt();
}

VarianceComponents EnrichmentTester::estimateVarianceComponents(
    const Eigen::MatrixXd& withinCovariance,
    const Eigen::MatrixXd& influence,
    int numSamples) const {

    if (numSamples < 2) {
        throw DimensionError("Variance components need at least 2 samples, got " + std::to_string(numSamples));
    }
    Eigen::MatrixXd geneCovariance = influence * influence.transpose();

    switch (params.varianceMethod) {
        case VarianceMethod::REHE:
            return estimateReHE(withinCovariance, geneCovariance);
        case VarianceMethod::REML:
            return estimateREML(withinCovariance, geneCovariance);
        default:
            throw std::invalid_argument("Unknown variance method");
    }
}

VarianceComponents EnrichmentTester::estimateReHE(
    const Eigen::MatrixXd& withinCovariance,
    const Eigen::MatrixXd& geneCovariance) const {

    const int p = withinCovariance.rows();
    double meanVariance = withinCovariance.trace() / p;
    if (!(meanVariance > 0.0)) {
        throw DegenerateVarianceError("Within-condition variance is " + std::to_string(meanVariance));
    }

    // Least squares of vec(S) on vec(G) and vec(I)
    double gg = geneCovariance.squaredNorm();
    double gi = geneCovariance.trace();
    double ii = p;
    double gs = geneCovariance.cwiseProduct(withinCovariance).sum();
    double is = withinCovariance.trace();
    double det = gg * ii - gi * gi;

    VarianceComponents components;
    if (det <= 1e-10 * gg * ii) {
        // G proportional to I: only the total is identifiable
        components.gene = 0.0;
        components.noise = is / ii;
        return components;
    }

    components.gene = (ii * gs - gi * is) / det;
    components.noise = (gg * is - gi * gs) / det;

    double tolerance = params.varianceTolerance * meanVariance;
    if (components.gene < -tolerance || components.noise < -tolerance) {
        throw DegenerateVarianceError("ReHE variance components are negative (gene = "
                                      + std::to_string(components.gene) + ", noise = "
                                      + std::to_string(components.noise)
                                      + "); use REML or increase eta");
    }

    // Refit the remaining component on the boundary
    if (components.gene < 0.0) {
        components.gene = 0.0;
        components.noise = is / ii;
        components.clamped = true;
    } else if (components.noise < 0.0) {
        components.noise = 0.0;
        components.gene = gs / gg;
        components.clamped = true;
    }
    return components;
}

VarianceComponents EnrichmentTester::estimateREML(
    const Eigen::MatrixXd& withinCovariance,
    const Eigen::MatrixXd& geneCovariance) const {

    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> eigen(geneCovariance);
    if (eigen.info() != Eigen::Success) {
        throw DegenerateVarianceError("Eigen-decomposition of the network covariance failed");
    }
    Eigen::VectorXd eigenvalues = eigen.eigenvalues().cwiseMax(0.0);
    Eigen::MatrixXd rotated = eigen.eigenvectors().transpose() * withinCovariance * eigen.eigenvectors();
    Eigen::VectorXd rotatedVariances = rotated.diagonal().cwiseMax(0.0);

    ProfileLikelihood likelihood(eigenvalues, rotatedVariances);
    if (!(likelihood.noiseVariance(0.0) > 0.0)) {
        throw DegenerateVarianceError("Within-condition variance is zero; REML undefined");
    }

    const int bits = std::numeric_limits<double>::digits / 2;
    boost::uintmax_t maxIterations = 200;
    std::pair<double, double> best = boost::math::tools::brent_find_minima(
        likelihood, kMinLogRatio, kMaxLogRatio, bits, maxIterations);

    double ratio = std::exp(best.first);
    if (likelihood.deviance(0.0) <= best.second) {
        ratio = 0.0;
    }

    VarianceComponents components;
    components.noise = likelihood.noiseVariance(ratio);
    components.gene = ratio * components.noise;
    if (!(components.noise > 0.0) || !std::isfinite(components.gene)) {
        throw DegenerateVarianceError("REML variance components are invalid (gene = "
                                      + std::to_string(components.gene) + ", noise = "
                                      + std::to_string(components.noise) + ")");
    }
    return components;
}

Eigen::MatrixXd EnrichmentTester::alignPathways(
    const PathwaySet& pathways,
    int numGenes,
    const std::vector<std::string>& geneNames) const {

    const Eigen::MatrixXd& B = pathways.indicators;
    if (!pathways.pathwayNames.empty() && static_cast<int>(pathways.pathwayNames.size()) != B.rows()) {
        throw DimensionError("Pathway matrix has " + std::to_string(B.rows()) + " rows but "
                             + std::to_string(pathways.pathwayNames.size()) + " pathway names");
    }

    if (pathways.geneNames.empty()) {
        if (B.cols() != numGenes) {
            throw DimensionError("Pathway matrix has " + std::to_string(B.cols())
                                 + " gene columns, networks have " + std::to_string(numGenes) + " genes");
        }
        return (B.array() != 0.0).cast<double>().matrix();
    }

    if (static_cast<int>(pathways.geneNames.size()) != B.cols()) {
        throw DimensionError("Pathway matrix has " + std::to_string(B.cols()) + " columns but "
                             + std::to_string(pathways.geneNames.size()) + " gene names");
    }
    if (static_cast<int>(geneNames.size()) != numGenes) {
        throw DimensionError("Pathway genes are named but " + std::to_string(geneNames.size())
                             + " network gene names were given for " + std::to_string(numGenes) + " genes");
    }

    std::map<std::string, int> geneIndex;
    for (int i = 0; i < numGenes; ++i) {
        geneIndex[geneNames[i]] = i;
    }

    Eigen::MatrixXd aligned = Eigen::MatrixXd::Zero(B.rows(), numGenes);
    for (int c = 0; c < B.cols(); ++c) {
        auto it = geneIndex.find(pathways.geneNames[c]);
        if (it == geneIndex.end()) {
            throw DimensionError("Pathway gene '" + pathways.geneNames[c] + "' is not in the network");
        }
        for (int r = 0; r < B.rows(); ++r) {
            if (B(r, c) != 0.0) {
                aligned(r, it->second) = 1.0;
            }
        }
    }
    return aligned;
}

std::vector<double> EnrichmentTester::adjustPValues(const std::vector<double>& pValues) {
    const int m = pValues.size();
    std::vector<int> order(m);
    std::iota(order.begin(), order.end(), 0);
    std::sort(order.begin(), order.end(), [&pValues](int a, int b) {
        return pValues[a] < pValues[b];
    });

    std::vector<double> adjusted(m);
    double running = 1.0;
    for (int rank = m; rank >= 1; --rank) {
        int idx = order[rank - 1];
        running = std::min(running, pValues[idx] * m / rank);
        adjusted[idx] = std::min(1.0, running);
    }
    return adjusted;
}

EnrichmentTable EnrichmentTester::test(
    const std::vector<EstimatedNetwork>& networks,
    const Eigen::MatrixXd& expression,
    const std::vector<int>& conditionLabels,
    const PathwaySet& pathways,
    const std::vector<std::string>& geneNames) const {

    const int p = expression.rows();
    if (static_cast<int>(conditionLabels.size()) != expression.cols()) {
        throw DimensionError("Expression has " + std::to_string(expression.cols()) + " samples but "
                             + std::to_string(conditionLabels.size()) + " condition labels were given");
    }

    std::map<int, std::vector<int>> samplesByCondition;
    for (int s = 0; s < static_cast<int>(conditionLabels.size()); ++s) {
        samplesByCondition[conditionLabels[s]].push_back(s);
    }
    const int K = samplesByCondition.size();
    if (K < 2) {
        throw DimensionError("Pathway test needs at least 2 conditions, got " + std::to_string(K));
    }
    if (static_cast<int>(networks.size()) != K) {
        throw DimensionError("Got " + std::to_string(networks.size()) + " networks for "
                             + std::to_string(K) + " conditions");
    }
    for (int k = 0; k < K; ++k) {
        const Eigen::MatrixXd& A = networks[k].weights;
        if (A.rows() != p || A.cols() != p) {
            throw DimensionError("Network " + std::to_string(k) + " has shape " + shapeString(A.rows(), A.cols())
                                 + ", expression has " + std::to_string(p) + " genes");
        }
    }
    for (const auto& entry : samplesByCondition) {
        if (entry.second.size() < 2) {
            throw DimensionError("Condition " + std::to_string(entry.first) + " has "
                                 + std::to_string(entry.second.size()) + " samples, at least 2 are needed");
        }
    }

    Eigen::MatrixXd aligned = alignPathways(pathways, p, geneNames);

    EnrichmentTable table;
    table.varianceMethod = params.varianceMethod;

    // Fit the per-condition model
    std::vector<ConditionModel> models(K);
    int k = 0;
    for (const auto& entry : samplesByCondition) {
        const std::vector<int>& samples = entry.second;
        Eigen::MatrixXd slice(p, samples.size());
        for (size_t j = 0; j < samples.size(); ++j) {
            slice.col(j) = expression.col(samples[j]);
        }

        ConditionModel& model = models[k];
        model.numSamples = samples.size();
        model.influence = influenceMatrix(networks[k]);
        model.inverseInfluence = model.influence.fullPivLu().inverse();
        model.influenceTotals = model.influence.colwise().sum().transpose();
        model.effects = model.inverseInfluence * slice.rowwise().mean();

        try {
            model.variance = estimateVarianceComponents(buildCovariance(slice), model.influence, model.numSamples);
        }
        catch (const DegenerateVarianceError& e) {
            throw DegenerateVarianceError("Condition " + std::to_string(entry.first) + ": " + e.what());
        }
        if (model.variance.clamped) {
            table.warnings.push_back({
                WarningType::VARIANCE_CLAMPED,
                "Condition " + std::to_string(entry.first) + ": a negative variance component was set to zero"
            });
        }

        table.geneVariances.push_back(model.variance.gene);
        table.noiseVariances.push_back(model.variance.noise);
        ++k;
    }

    boost::math::normal standardNormal;
    boost::math::chi_squared chiSquared(K - 1);

    std::vector<double> testedPValues;
    std::vector<int> testedRows;

    // A pathway the network gives no signal to is reported untested
    auto skipDegenerate = [&table](const EnrichmentResult& result, const std::string& reason) {
        table.warnings.push_back({
            WarningType::PATHWAY_SKIPPED,
            "Pathway '" + result.pathway + "' has " + reason + " and was not tested"
        });
        table.results.push_back(result);
    };

    for (int r = 0; r < aligned.rows(); ++r) {
        EnrichmentResult result;
        result.pathway = pathways.pathwayNames.empty() ? "pathway_" + std::to_string(r + 1)
                                                      : pathways.pathwayNames[r];
        Eigen::VectorXd membership = aligned.row(r).transpose();
        result.pathwaySize = static_cast<int>(membership.sum());

        if (result.pathwaySize < params.minPathwaySize) {
            table.warnings.push_back({
                WarningType::PATHWAY_SKIPPED,
                "Pathway '" + result.pathway + "' has " + std::to_string(result.pathwaySize)
                    + " genes, fewer than " + std::to_string(params.minPathwaySize)
            });
            table.results.push_back(result);
            continue;
        }

        Eigen::VectorXd theta(K);
        Eigen::VectorXd variances(K);
        for (int c = 0; c < K; ++c) {
            const ConditionModel& model = models[c];
            Eigen::VectorXd contrast = membership.cwiseProduct(model.influenceTotals);
            Eigen::VectorXd noiseContrast = model.inverseInfluence.transpose() * contrast;

            theta(c) = contrast.dot(model.effects);
            variances(c) = (model.variance.gene * contrast.squaredNorm()
                            + model.variance.noise * noiseContrast.squaredNorm()) / model.numSamples;
        }

        if (K == 2) {
            double sd = std::sqrt(variances.sum());
            if (!(sd > 0.0)) {
                skipDegenerate(result, "zero contrast variance");
                continue;
            }
            result.statistic = (theta(1) - theta(0)) / sd;
            result.pValue = 2.0 * boost::math::cdf(boost::math::complement(standardNormal, std::abs(result.statistic)));
            result.df = 1;
        } else {
            // Each condition against the first
            Eigen::MatrixXd C = Eigen::MatrixXd::Zero(K - 1, K);
            for (int c = 1; c < K; ++c) {
                C(c - 1, 0) = -1.0;
                C(c - 1, c) = 1.0;
            }
            Eigen::VectorXd differences = C * theta;
            Eigen::MatrixXd V = C * variances.asDiagonal() * C.transpose();
            Eigen::LLT<Eigen::MatrixXd> llt(V);
            if (llt.info() != Eigen::Success) {
                skipDegenerate(result, "a singular contrast covariance");
                continue;
            }
            result.statistic = differences.dot(llt.solve(differences));
            result.pValue = boost::math::cdf(boost::math::complement(chiSquared, std::max(0.0, result.statistic)));
            result.df = K - 1;
        }

        double shift = theta(K - 1) - theta(0);
        result.direction = (shift > 0.0) - (shift < 0.0);
        result.pValue = std::min(1.0, std::max(0.0, result.pValue));
        result.tested = true;

        testedPValues.push_back(result.pValue);
        testedRows.push_back(r);
        table.results.push_back(result);
    }

    std::vector<double> adjusted = adjustPValues(testedPValues);
    for (size_t i = 0; i < testedRows.size(); ++i) {
        table.results[testedRows[i]].qValue = adjusted[i];
    }

    return table;
}

}
}
