#pragma once

#include <Eigen/Dense>
#include <limits>
#include <string>
#include <vector>
#include <map>

namespace netgsa {

// Structure to hold raw expression data with condition labels
struct ExpressionData {
    Eigen::MatrixXd expressionMatrix; // Rows are genes, columns are samples
    std::vector<std::string> geneNames;
    std::vector<std::string> sampleNames;
    std::vector<int> conditionLabels;   // One label per sample
    std::map<int, std::vector<int>> labelIndices;   // Maps condition labels to sample indices

    // Metadata
    std::string datasetName;
    int numGenes = 0;
    int numSamples = 0;
};

// Binary pathway membership, pathways x genes
struct PathwaySet {
    Eigen::MatrixXd indicators;
    std::vector<std::string> pathwayNames;
    std::vector<std::string> geneNames; // Empty means columns follow the network gene order
};

enum class NetworkType {
    UNDIRECTED,
    DIRECTED
};

// Prior knowledge about edges. An empty matrix means no constraint of that kind.
// For directed networks `one` is the allowed parent mask (row = parent, column = child).
struct ConstraintMasks {
    NetworkType type = NetworkType::UNDIRECTED;
    Eigen::MatrixXd zero;
    Eigen::MatrixXd one;
    std::vector<int> topologicalOrder; // Directed only; empty means identity
};

// Parameters for network estimation and tuning
struct EstimationParameters {
    double lambda = 0.1;
    double knownEdgeWeight = 0.0; // Penalty multiplier for entries in `one`
    double eta = 0.0;             // Added to the covariance diagonal
    double eps = 1e-8;            // Sparsification threshold

    // Solver control
    double tolerance = 1e-4;
    int maxIterations = 1000;

    // Grid search; an empty grid means fit `lambda` / `knownEdgeWeight` only
    std::vector<double> lambdaGrid;
    std::vector<double> weightGrid;

    int numThreads = 1;
    bool verbose = false;
};

enum class VarianceMethod {
    REHE,  // Restricted moment estimator
    REML   // Restricted maximum likelihood
};

// Parameters for the pathway test
struct TestParameters {
    VarianceMethod varianceMethod = VarianceMethod::REHE;
    int minPathwaySize = 1;
    double varianceTolerance = 1e-8; // Relative to the mean within-condition variance
};

enum class WarningType {
    DEGENERATE_FIT,
    PATHWAY_SKIPPED,
    VARIANCE_CLAMPED,
    CONDITION_FAILED
};

struct AnalysisWarning {
    WarningType type;
    std::string message;
};

// Estimated network for one condition
struct EstimatedNetwork {
    NetworkType type = NetworkType::UNDIRECTED;
    Eigen::MatrixXd precision;
    Eigen::MatrixXd adjacency;  // Binary edge indicator
    Eigen::MatrixXd weights;    // Partial correlations, or regression coefficients (parent x child)
    Eigen::MatrixXd covariance; // Empirical covariance the fit used

    int numSamples = 0;
    double lambda = 0.0;
    double weight = 0.0;
    int numEdges = 0;
    int iterations = 0;

    std::vector<AnalysisWarning> warnings;

    bool isEdgeless() const { return numEdges == 0; }
};

struct BICRecord {
    double lambda = 0.0;
    double weight = std::numeric_limits<double>::quiet_NaN(); // NaN without a weight grid
    double bic = std::numeric_limits<double>::quiet_NaN();
    int df = 0;

    bool valid = false;
    std::string failure;
};

// Structure for grid search results
struct SelectionResult {
    std::vector<BICRecord> bicTable; // Lambda-major order
    bool hasWeightGrid = false;
    int selectedIndex = -1;
    EstimatedNetwork network;

    std::vector<AnalysisWarning> warnings;

    const BICRecord& selected() const { return bicTable.at(selectedIndex); }
};

struct EnrichmentResult {
    std::string pathway;
    int pathwaySize = 0;
    double statistic = 0.0;
    double pValue = 1.0;
    double qValue = 1.0;
    int direction = 0;
    int df = 0;
    bool tested = false;
};

struct EnrichmentTable {
    std::vector<EnrichmentResult> results;
    VarianceMethod varianceMethod = VarianceMethod::REHE;

    // Variance components per condition
    std::vector<double> geneVariances;  // sigma^2_gamma
    std::vector<double> noiseVariances; // sigma^2_epsilon

    std::vector<AnalysisWarning> warnings;
};

}
