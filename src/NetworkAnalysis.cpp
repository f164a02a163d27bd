#include "NetworkAnalysis.hpp"
#include "EnrichmentTester.hpp"
#include "NetworkEstimation.hpp"
#include "TuningSelector.hpp"
#include <fstream>
#include <sstream>
#include <iostream>
#include <cmath>
#include <exception>
#include <algorithm>
#include <iomanip>
#include <limits>
#include <set>

namespace netgsa {

namespace {

std::vector<std::string> splitLine(const std::string& line) {
    std::vector<std::string> tokens;
    std::istringstream iss(line);
    std::string token;
    while (std::getline(iss, token, ',')) {
        if (!token.empty() && token.back() == '\r') {
            token.pop_back();
        }
        tokens.push_back(token);
    }
    return tokens;
}

double parseValue(const std::string& token, const std::string& file, int line) {
    try {
        size_t used = 0;
        double value = std::stod(token, &used);
        if (used != token.size()) {
            throw std::invalid_argument(token);
        }
        return value;
    }
    catch (const std::exception& e) {
        throw DataLoadingError("Invalid value '" + token + "' on line " + std::to_string(line) + " of " + file);
    }
}

}

NetworkAnalysis::NetworkAnalysis()
    : isDataLoaded(false), hasPathways(false) {
}

NetworkAnalysis::~NetworkAnalysis() = default;

Eigen::MatrixXd NetworkAnalysis::readGeneMatrix(const std::string& file,
                                                std::vector<std::string>& rowNames,
                                                std::vector<std::string>& columnNames) const {
    std::ifstream in(file);
    if (!in.is_open()) {
        throw DataLoadingError("Cannot open file: " + file);
    }

    // Header: first cell labels the row names, the rest are column names
    std::string line;
    if (!std::getline(in, line)) {
        throw DataLoadingError("Empty file: " + file);
    }
    std::vector<std::string> header = splitLine(line);
    if (header.size() < 2) {
        throw DataLoadingError("Header of " + file + " has no data columns");
    }
    columnNames.assign(header.begin() + 1, header.end());

    std::vector<std::vector<double>> rows;
    int lineNumber = 1;
    while (std::getline(in, line)) {
        ++lineNumber;
        if (line.empty() || line == "\r") continue;

        std::vector<std::string> tokens = splitLine(line);
        if (tokens.size() != header.size()) {
            throw DataLoadingError("Line " + std::to_string(lineNumber) + " of " + file + " has "
                                   + std::to_string(tokens.size()) + " fields, expected "
                                   + std::to_string(header.size()));
        }
        rowNames.push_back(tokens[0]);

        std::vector<double> row;
        for (size_t j = 1; j < tokens.size(); ++j) {
            row.push_back(parseValue(tokens[j], file, lineNumber));
        }
        rows.push_back(row);
    }

    // Convert to Eigen matrix
    Eigen::MatrixXd matrix(rows.size(), columnNames.size());
    for (size_t i = 0; i < rows.size(); ++i) {
        for (size_t j = 0; j < rows[i].size(); ++j) {
            matrix(i, j) = rows[i][j];
        }
    }
    return matrix;
}

bool NetworkAnalysis::loadData(const std::string& expressionFile,
                               const std::string& labelsFile) {
    try {
        ExpressionData loaded;
        loaded.expressionMatrix = readGeneMatrix(expressionFile, loaded.geneNames, loaded.sampleNames);
        loaded.datasetName = expressionFile;

        // Load labels
        std::ifstream labFile(labelsFile);
        if (!labFile.is_open()) {
            throw DataLoadingError("Cannot open labels file: " + labelsFile);
        }

        std::map<std::string, int> labelBySample;
        std::string line;
        std::getline(labFile, line); // Skip header
        int lineNumber = 1;
        while (std::getline(labFile, line)) {
            ++lineNumber;
            if (line.empty() || line == "\r") continue;
            std::vector<std::string> tokens = splitLine(line);
            if (tokens.size() != 2) {
                throw DataLoadingError("Line " + std::to_string(lineNumber) + " of " + labelsFile
                                       + " must be 'sample,label'");
            }
            double label = parseValue(tokens[1], labelsFile, lineNumber);
            if (label != std::floor(label) || label < 1) {
                throw DataLoadingError("Condition label '" + tokens[1] + "' must be a positive integer");
            }
            labelBySample[tokens[0]] = static_cast<int>(label);
        }

        for (const auto& sample : loaded.sampleNames) {
            auto it = labelBySample.find(sample);
            if (it == labelBySample.end()) {
                throw DataLoadingError("Sample '" + sample + "' has no condition label in " + labelsFile);
            }
            loaded.conditionLabels.push_back(it->second);
        }

        setData(loaded);
        return true;
    }
    catch (const std::exception& e) {
        addError("Error loading data: " + std::string(e.what()));
        return false;
    }
}

void NetworkAnalysis::setData(const ExpressionData& expressionData) {
    const Eigen::MatrixXd& X = expressionData.expressionMatrix;
    if (static_cast<int>(expressionData.geneNames.size()) != X.rows()
        || static_cast<int>(expressionData.sampleNames.size()) != X.cols()
        || static_cast<int>(expressionData.conditionLabels.size()) != X.cols()) {
        throw DimensionError("Expression matrix " + shapeString(X.rows(), X.cols()) + " with "
                             + std::to_string(expressionData.geneNames.size()) + " gene names, "
                             + std::to_string(expressionData.sampleNames.size()) + " sample names and "
                             + std::to_string(expressionData.conditionLabels.size()) + " labels");
    }

    data = expressionData;
    data.numGenes = X.rows();
    data.numSamples = X.cols();
    rebuildLabelIndices();

    slots.clear();
    isDataLoaded = true;
}

void NetworkAnalysis::rebuildLabelIndices() {
    data.labelIndices.clear();
    for (int s = 0; s < static_cast<int>(data.conditionLabels.size()); ++s) {
        data.labelIndices[data.conditionLabels[s]].push_back(s);
    }
}

bool NetworkAnalysis::validateData() const {
    if (!isDataLoaded) {
        return false;
    }
    std::set<std::string> genes(data.geneNames.begin(), data.geneNames.end());
    std::set<std::string> samples(data.sampleNames.begin(), data.sampleNames.end());
    if (genes.size() != data.geneNames.size() || samples.size() != data.sampleNames.size()) {
        return false;
    }
    if (data.labelIndices.size() < 2) {
        return false;
    }
    for (const auto& entry : data.labelIndices) {
        if (entry.second.size() < 2) {
            return false;
        }
    }
    return data.expressionMatrix.allFinite();
}

int NetworkAnalysis::geneIndex(const std::string& gene) const {
    auto it = std::find(data.geneNames.begin(), data.geneNames.end(), gene);
    if (it == data.geneNames.end()) {
        return -1;
    }
    return static_cast<int>(it - data.geneNames.begin());
}

bool NetworkAnalysis::loadPathways(const std::string& pathwayFile) {
    try {
        if (!isDataLoaded) {
            throw ProcessingError("Load expression data before pathways");
        }
        PathwaySet loaded;
        loaded.indicators = readGeneMatrix(pathwayFile, loaded.pathwayNames, loaded.geneNames);
        setPathways(loaded);
        return true;
    }
    catch (const std::exception& e) {
        addError("Error loading pathways: " + std::string(e.what()));
        return false;
    }
}

void NetworkAnalysis::setPathways(const PathwaySet& pathwaySet) {
    for (const auto& gene : pathwaySet.geneNames) {
        if (geneIndex(gene) < 0) {
            throw DimensionError("Pathway gene '" + gene + "' is not in the expression data");
        }
    }
    pathways = pathwaySet;
    hasPathways = true;
}

Eigen::MatrixXd NetworkAnalysis::alignSquareMask(const Eigen::MatrixXd& mask,
                                                 const std::vector<std::string>& rowNames,
                                                 const std::vector<std::string>& columnNames) const {
    const int p = data.numGenes;
    if (static_cast<int>(rowNames.size()) != p || static_cast<int>(columnNames.size()) != p) {
        throw DimensionError("Mask is " + shapeString(rowNames.size(), columnNames.size())
                             + ", expected " + shapeString(p, p));
    }

    std::vector<int> rowIndex(p), columnIndex(p);
    for (int i = 0; i < p; ++i) {
        rowIndex[i] = geneIndex(rowNames[i]);
        columnIndex[i] = geneIndex(columnNames[i]);
        if (rowIndex[i] < 0 || columnIndex[i] < 0) {
            throw DimensionError("Mask gene '" + (rowIndex[i] < 0 ? rowNames[i] : columnNames[i])
                                 + "' is not in the expression data");
        }
    }

    Eigen::MatrixXd aligned = Eigen::MatrixXd::Zero(p, p);
    for (int i = 0; i < p; ++i) {
        for (int j = 0; j < p; ++j) {
            aligned(rowIndex[i], columnIndex[j]) = mask(i, j) != 0.0 ? 1.0 : 0.0;
        }
    }
    return aligned;
}

bool NetworkAnalysis::loadConstraintMask(const std::string& maskFile, MaskKind kind) {
    try {
        if (!isDataLoaded) {
            throw ProcessingError("Load expression data before constraint masks");
        }
        std::vector<std::string> rowNames, columnNames;
        Eigen::MatrixXd mask = readGeneMatrix(maskFile, rowNames, columnNames);
        Eigen::MatrixXd aligned = alignSquareMask(mask, rowNames, columnNames);

        if (kind == MaskKind::ZERO) {
            masks.zero = aligned;
        } else {
            masks.one = aligned;
        }
        return true;
    }
    catch (const std::exception& e) {
        addError("Error loading mask: " + std::string(e.what()));
        return false;
    }
}

bool NetworkAnalysis::loadTopologicalOrder(const std::string& orderFile) {
    try {
        std::ifstream in(orderFile);
        if (!in.is_open()) {
            throw DataLoadingError("Cannot open order file: " + orderFile);
        }

        std::vector<int> order;
        std::string line;
        std::getline(in, line); // Skip header
        while (std::getline(in, line)) {
            std::vector<std::string> tokens = splitLine(line);
            if (tokens.empty() || tokens[0].empty()) continue;
            int index = geneIndex(tokens[0]);
            if (index < 0) {
                throw DataLoadingError("Ordered gene '" + tokens[0] + "' is not in the expression data");
            }
            order.push_back(index);
        }

        masks.topologicalOrder = order;
        return true;
    }
    catch (const std::exception& e) {
        addError("Error loading topological order: " + std::string(e.what()));
        return false;
    }
}

void NetworkAnalysis::setConstraintMasks(const ConstraintMasks& constraintMasks) {
    masks = constraintMasks;
}

std::vector<int> NetworkAnalysis::conditionLabelValues() const {
    std::vector<int> labels;
    for (const auto& entry : data.labelIndices) {
        labels.push_back(entry.first);
    }
    return labels;
}

void NetworkAnalysis::checkCondition(int conditionIndex) const {
    if (conditionIndex < 0 || conditionIndex >= numConditions()) {
        throw std::out_of_range("Condition index " + std::to_string(conditionIndex) + " outside 0.."
                                + std::to_string(numConditions() - 1));
    }
}

Eigen::MatrixXd NetworkAnalysis::conditionData(int conditionIndex) const {
    checkCondition(conditionIndex);
    auto it = data.labelIndices.begin();
    std::advance(it, conditionIndex);

    const std::vector<int>& samples = it->second;
    Eigen::MatrixXd slice(data.numGenes, samples.size());
    for (size_t j = 0; j < samples.size(); ++j) {
        slice.col(j) = data.expressionMatrix.col(samples[j]);
    }
    return slice;
}

void NetworkAnalysis::validateParameters(const EstimationParameters& params) const {
    // Negated comparisons so NaN is rejected too
    if (!(params.lambda >= 0)) {
        throw std::invalid_argument("lambda must be non-negative, got " + std::to_string(params.lambda));
    }
    if (!(params.knownEdgeWeight >= 0)) {
        throw std::invalid_argument("Known edge weight must be non-negative, got "
                                    + std::to_string(params.knownEdgeWeight));
    }
    for (double lambda : params.lambdaGrid) {
        if (!(lambda >= 0)) {
            throw std::invalid_argument("Lambda grid values must be non-negative, got " + std::to_string(lambda));
        }
    }
    for (double weight : params.weightGrid) {
        if (!(weight >= 0)) {
            throw std::invalid_argument("Weight grid values must be non-negative, got " + std::to_string(weight));
        }
    }
    if (masks.type == NetworkType::DIRECTED && !params.weightGrid.empty()) {
        throw std::invalid_argument("Known-edge weights do not apply to directed networks; leave the weight grid empty");
    }
    if (!(params.eta >= 0)) {
        throw std::invalid_argument("eta must be non-negative, got " + std::to_string(params.eta));
    }
    if (!(params.eps >= 0)) {
        throw std::invalid_argument("eps must be non-negative, got " + std::to_string(params.eps));
    }
    if (!(params.tolerance > 0) || params.maxIterations < 1) {
        throw std::invalid_argument("Solver tolerance must be positive and maxIterations at least 1");
    }
    if (params.numThreads < 1) {
        throw std::invalid_argument("numThreads must be at least 1");
    }
}

void NetworkAnalysis::estimateNetworks(const EstimationParameters& params) {
    if (!isDataLoaded) {
        throw ProcessingError("Data not loaded");
    }
    validateParameters(params);

    const int K = numConditions();
    for (const auto& entry : data.labelIndices) {
        if (entry.second.size() < 2) {
            throw DimensionError("Condition " + std::to_string(entry.first) + " has "
                                 + std::to_string(entry.second.size()) + " samples, at least 2 are needed");
        }
    }

    // Shared masks are checked once before any condition is fitted
    auto estimator = network::NetworkEstimatorFactory::createEstimator(masks.type);
    estimator->validateMasks(masks, data.numGenes);

    std::vector<int> labels = conditionLabelValues();
    std::vector<Eigen::MatrixXd> slices;
    for (int k = 0; k < K; ++k) {
        slices.push_back(conditionData(k));
    }

    slots.assign(K, ConditionSlot());
    EstimationParameters conditionParams = params;
    conditionParams.numThreads = 1;

    network::TuningSelector selector;

#pragma omp parallel for schedule(dynamic) num_threads(params.numThreads)
    for (int k = 0; k < K; ++k) {
        ConditionSlot& slot = slots[k];
        try {
            slot.selection = selector.select(slices[k], masks, conditionParams);
            slot.estimated = true;
        }
        catch (const ConvergenceError& e) {
            slot.failure = e.what();
        }
        catch (const ProcessingError& e) {
            slot.failure = e.what();
        }
        catch (const std::exception& e) {
            // Not a per-condition failure; raised once the team has joined
            slot.failure = e.what();
            slot.error = std::current_exception();
        }
    }

    for (const auto& slot : slots) {
        if (slot.error) {
            std::rethrow_exception(slot.error);
        }
    }

    for (int k = 0; k < K; ++k) {
        std::string prefix = "Condition " + std::to_string(labels[k]) + ": ";
        if (!slots[k].estimated) {
            addWarning(WarningType::CONDITION_FAILED, prefix + slots[k].failure);
            addError(prefix + slots[k].failure);
            continue;
        }

        const SelectionResult& selection = slots[k].selection;
        for (const auto& warning : selection.warnings) {
            addWarning(warning.type, prefix + warning.message);
        }
        for (const auto& warning : selection.network.warnings) {
            addWarning(warning.type, prefix + warning.message);
        }

        if (params.verbose) {
            std::cout << prefix << "selected lambda = " << selection.selected().lambda
                      << " (" << selection.network.numEdges << " edges, BIC = "
                      << std::setprecision(6) << selection.selected().bic << ")" << std::endl;
        }
    }
}

void NetworkAnalysis::setNetworks(const std::vector<EstimatedNetwork>& networks) {
    if (!isDataLoaded) {
        throw ProcessingError("Data not loaded");
    }
    if (static_cast<int>(networks.size()) != numConditions()) {
        throw DimensionError("Got " + std::to_string(networks.size()) + " networks for "
                             + std::to_string(numConditions()) + " conditions");
    }

    slots.assign(networks.size(), ConditionSlot());
    for (size_t k = 0; k < networks.size(); ++k) {
        const Eigen::MatrixXd& A = networks[k].weights;
        if (A.rows() != data.numGenes || A.cols() != data.numGenes) {
            throw DimensionError("Network " + std::to_string(k) + " has shape " + shapeString(A.rows(), A.cols())
                                 + ", expected " + shapeString(data.numGenes, data.numGenes));
        }
        slots[k].selection.network = networks[k];
        slots[k].estimated = true;
    }
}

bool NetworkAnalysis::hasNetwork(int conditionIndex) const {
    return conditionIndex >= 0 && conditionIndex < static_cast<int>(slots.size())
           && slots[conditionIndex].estimated;
}

const SelectionResult& NetworkAnalysis::getSelection(int conditionIndex) const {
    checkCondition(conditionIndex);
    if (!hasNetwork(conditionIndex)) {
        throw ProcessingError("No network for condition index " + std::to_string(conditionIndex));
    }
    return slots[conditionIndex].selection;
}

const EstimatedNetwork& NetworkAnalysis::getNetwork(int conditionIndex) const {
    return getSelection(conditionIndex).network;
}

EnrichmentTable NetworkAnalysis::testPathways(const TestParameters& params) {
    if (!isDataLoaded) {
        throw ProcessingError("Data not loaded");
    }
    if (!hasPathways) {
        throw ProcessingError("Pathways not loaded");
    }

    std::vector<EstimatedNetwork> networks;
    std::string missing;
    std::vector<int> labels = conditionLabelValues();
    for (int k = 0; k < numConditions(); ++k) {
        if (!hasNetwork(k)) {
            missing += (missing.empty() ? "" : ", ") + std::to_string(labels[k]);
            continue;
        }
        networks.push_back(slots[k].selection.network);
    }
    if (!missing.empty()) {
        throw ProcessingError("No network for condition(s) " + missing);
    }

    enrichment::EnrichmentTester tester(params);
    EnrichmentTable table = tester.test(networks, data.expressionMatrix, data.conditionLabels,
                                        pathways, data.geneNames);
    for (const auto& warning : table.warnings) {
        addWarning(warning.type, warning.message);
    }
    return table;
}

void NetworkAnalysis::exportResults(const EnrichmentTable& table,
                                    const std::string& outputFile) const {
    std::ofstream out(outputFile);
    if (!out.is_open()) {
        throw ProcessingError("Cannot open output file: " + outputFile);
    }

    out << "pathway,size,statistic,pvalue,qvalue,direction,df,tested\n";
    out << std::setprecision(10);
    for (const auto& result : table.results) {
        out << result.pathway << ","
            << result.pathwaySize << ","
            << result.statistic << ","
            << result.pValue << ","
            << result.qValue << ","
            << result.direction << ","
            << result.df << ","
            << (result.tested ? "true" : "false") << "\n";
    }
}

void NetworkAnalysis::exportBICTable(int conditionIndex, const std::string& outputFile) const {
    const SelectionResult& selection = getSelection(conditionIndex);

    std::ofstream out(outputFile);
    if (!out.is_open()) {
        throw ProcessingError("Cannot open output file: " + outputFile);
    }

    out << "lambda," << (selection.hasWeightGrid ? "weight," : "") << "bic,df,selected\n";
    out << std::setprecision(10);
    for (size_t i = 0; i < selection.bicTable.size(); ++i) {
        const BICRecord& record = selection.bicTable[i];
        out << record.lambda << ",";
        if (selection.hasWeightGrid) {
            out << record.weight << ",";
        }
        if (record.valid) {
            out << record.bic << "," << record.df << ",";
        } else {
            out << "NA,NA,";
        }
        out << (static_cast<int>(i) == selection.selectedIndex ? "true" : "false") << "\n";
    }
}

void NetworkAnalysis::exportNetwork(int conditionIndex, const std::string& outputFile) const {
    const EstimatedNetwork& network = getNetwork(conditionIndex);

    std::ofstream out(outputFile);
    if (!out.is_open()) {
        throw ProcessingError("Cannot open output file: " + outputFile);
    }

    // Write header
    out << "Gene";
    for (const auto& gene : data.geneNames) {
        out << "," << gene;
    }
    out << "\n";

    // Write edge weights
    out << std::setprecision(10);
    for (int i = 0; i < network.weights.rows(); ++i) {
        out << data.geneNames[i];
        for (int j = 0; j < network.weights.cols(); ++j) {
            out << "," << network.weights(i, j);
        }
        out << "\n";
    }
}

}
