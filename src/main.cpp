#include "NetworkAnalysis.hpp"
#include "EnrichmentTester.hpp"
#include <iostream>
#include <iomanip>
#include <filesystem>
#include <sstream>

using namespace netgsa;

namespace {

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " <expression_file> <labels_file> <pathway_file> [options]\n"
              << "  --zero <file>        forbidden-edge mask\n"
              << "  --one <file>         known-edge mask (parent x child when --directed)\n"
              << "  --directed           estimate directed networks\n"
              << "  --order <file>       topological order, one gene per line\n"
              << "  --lambda a,b,...     regularization grid\n"
              << "  --weight a,b,...     known-edge penalty weight grid\n"
              << "  --eta <x>            covariance diagonal perturbation\n"
              << "  --method rehe|reml   variance estimation\n"
              << "  --min-size <n>       smallest pathway tested\n"
              << "  --threads <n>        worker threads\n"
              << "  --output <dir>       output directory (default 'output')\n";
}

std::vector<double> parseGrid(const std::string& text) {
    std::vector<double> values;
    std::istringstream iss(text);
    std::string token;
    while (std::getline(iss, token, ',')) {
        values.push_back(std::stod(token));
    }
    return values;
}

}

int main(int argc, char* argv[]) {
    try {
        if (argc < 4) {
            printUsage(argv[0]);
            return 1;
        }

        std::string expressionFile = argv[1];
        std::string labelsFile = argv[2];
        std::string pathwayFile = argv[3];

        std::string zeroFile, oneFile, orderFile;
        std::string outputDir = "output";
        bool directed = false;

        // Set analysis parameters
        EstimationParameters params;
        params.lambdaGrid = {0.01, 0.02, 0.05, 0.1, 0.2, 0.5};
        params.verbose = true;
        TestParameters testParams;

        for (int i = 4; i < argc; ++i) {
            std::string option = argv[i];
            if (option == "--directed") {
                directed = true;
                continue;
            }
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << option << "\n";
                printUsage(argv[0]);
                return 1;
            }
            std::string value = argv[++i];
            if (option == "--zero") zeroFile = value;
            else if (option == "--one") oneFile = value;
            else if (option == "--order") orderFile = value;
            else if (option == "--lambda") params.lambdaGrid = parseGrid(value);
            else if (option == "--weight") params.weightGrid = parseGrid(value);
            else if (option == "--eta") params.eta = std::stod(value);
            else if (option == "--method") testParams.varianceMethod = enrichment::parseVarianceMethod(value);
            else if (option == "--min-size") testParams.minPathwaySize = std::stoi(value);
            else if (option == "--threads") params.numThreads = std::stoi(value);
            else if (option == "--output") outputDir = value;
            else {
                std::cerr << "Unknown option " << option << "\n";
                printUsage(argv[0]);
                return 1;
            }
        }

        // Create output directory if it doesn't exist
        std::filesystem::create_directories(outputDir);

        std::cout << "Initializing network analysis...\n";
        NetworkAnalysis analyzer;
        analyzer.setNetworkType(directed ? NetworkType::DIRECTED : NetworkType::UNDIRECTED);

        // Load data
        std::cout << "Loading data...\n";
        bool loaded = analyzer.loadData(expressionFile, labelsFile)
                      && analyzer.loadPathways(pathwayFile)
                      && (zeroFile.empty() || analyzer.loadConstraintMask(zeroFile, MaskKind::ZERO))
                      && (oneFile.empty() || analyzer.loadConstraintMask(oneFile, MaskKind::ONE))
                      && (orderFile.empty() || analyzer.loadTopologicalOrder(orderFile));
        if (!loaded) {
            for (const auto& error : analyzer.getErrors()) {
                std::cerr << error << "\n";
            }
            std::cerr << "Failed to load data\n";
            return 1;
        }
        if (!analyzer.validateData()) {
            std::cerr << "Invalid data: need unique names, 2+ conditions and 2+ samples per condition\n";
            return 1;
        }

        std::cout << "Estimating " << (directed ? "directed" : "undirected") << " networks for "
                  << analyzer.numConditions() << " conditions...\n";
        analyzer.estimateNetworks(params);

        std::cout << "Testing pathways (" << enrichment::varianceMethodName(testParams.varianceMethod) << ")...\n";
        EnrichmentTable table = analyzer.testPathways(testParams);

        // Export results
        std::cout << "Exporting results...\n";
        analyzer.exportResults(table, outputDir + "/pathway_results.csv");
        std::vector<int> labels = analyzer.conditionLabelValues();
        for (int k = 0; k < analyzer.numConditions(); ++k) {
            std::string suffix = std::to_string(labels[k]) + ".csv";
            analyzer.exportNetwork(k, outputDir + "/network_condition_" + suffix);
            analyzer.exportBICTable(k, outputDir + "/bic_condition_" + suffix);
        }

        for (const auto& warning : analyzer.getWarnings()) {
            std::cout << "Warning: " << warning.message << "\n";
        }

        // Print summary
        int significant = 0;
        for (const auto& result : table.results) {
            if (result.tested && result.qValue < 0.05) {
                significant++;
            }
        }
        std::cout << "\nAnalysis complete!\n";
        std::cout << "Pathways tested: " << table.results.size() << ", FDR < 0.05: " << significant << "\n";
        std::cout << "Results saved in the '" << outputDir << "' directory\n";

        return 0;
    }
    catch (const DegenerateVarianceError& e) {
        std::cerr << "Error: " << e.what() << "\n"
                  << "Try --method reml or a larger --eta\n";
        return 1;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
