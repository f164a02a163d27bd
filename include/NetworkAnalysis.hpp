#pragma once

#include "DataStructures.hpp"
#include "Exceptions.hpp"
#include <exception>
#include <string>
#include <vector>

namespace netgsa {

enum class MaskKind {
    ZERO,
    ONE
};

class NetworkAnalysis {
public:
    NetworkAnalysis();
    ~NetworkAnalysis();

    // Data loading and validation
    bool loadData(const std::string& expressionFile, const std::string& labelsFile);
    bool loadPathways(const std::string& pathwayFile);
    bool loadConstraintMask(const std::string& maskFile, MaskKind kind);
    bool loadTopologicalOrder(const std::string& orderFile);
    bool validateData() const;

    // In-memory inputs
    void setData(const ExpressionData& expressionData);
    void setPathways(const PathwaySet& pathwaySet);
    void setConstraintMasks(const ConstraintMasks& constraintMasks);
    void setNetworkType(NetworkType type) { masks.type = type; }

    // Conditions are indexed 0..K-1 in increasing label order
    int numConditions() const { return static_cast<int>(data.labelIndices.size()); }
    std::vector<int> conditionLabelValues() const;
    Eigen::MatrixXd conditionData(int conditionIndex) const;

    // Network estimation, one slot per condition
    void estimateNetworks(const EstimationParameters& params);
    void setNetworks(const std::vector<EstimatedNetwork>& networks);
    bool hasNetwork(int conditionIndex) const;
    const SelectionResult& getSelection(int conditionIndex) const;
    const EstimatedNetwork& getNetwork(int conditionIndex) const;

    // Pathway test on the current networks
    EnrichmentTable testPathways(const TestParameters& params);

    // Export methods
    void exportResults(const EnrichmentTable& table, const std::string& outputFile) const;
    void exportBICTable(int conditionIndex, const std::string& outputFile) const;
    void exportNetwork(int conditionIndex, const std::string& outputFile) const;

    // Getters
    const ExpressionData& getData() const { return data; }
    const PathwaySet& getPathways() const { return pathways; }
    const ConstraintMasks& getConstraintMasks() const { return masks; }
    const std::vector<AnalysisWarning>& getWarnings() const { return warnings; }
    const std::vector<std::string>& getErrors() const { return errors; }

private:
    struct ConditionSlot {
        bool estimated = false;
        std::string failure;
        std::exception_ptr error;
        SelectionResult selection;
    };

    ExpressionData data;
    PathwaySet pathways;
    ConstraintMasks masks;
    std::vector<ConditionSlot> slots;
    std::vector<AnalysisWarning> warnings;
    std::vector<std::string> errors;
    bool isDataLoaded;
    bool hasPathways;

    // Helper methods
    void rebuildLabelIndices();
    Eigen::MatrixXd readGeneMatrix(const std::string& file, std::vector<std::string>& rowNames,
                                   std::vector<std::string>& columnNames) const;
    Eigen::MatrixXd alignSquareMask(const Eigen::MatrixXd& mask, const std::vector<std::string>& rowNames,
                                    const std::vector<std::string>& columnNames) const;
    int geneIndex(const std::string& gene) const;
    void checkCondition(int conditionIndex) const;
    void validateParameters(const EstimationParameters& params) const;
    void addWarning(WarningType type, const std::string& warning) { warnings.push_back({type, warning}); }
    void addError(const std::string& error) { errors.push_back(error); }
};

}
