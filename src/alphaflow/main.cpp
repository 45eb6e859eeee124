#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <boost/program_options.hpp>
#include <boost/filesystem.hpp>
#include "BackTester.h"
#include "BacktestRequestReader.h"
#include "BacktestResultWriter.h"
#include "PriceSeriesCsvReader.h"
#include "TradeLogObserver.h"

namespace po = boost::program_options;
namespace fs = boost::filesystem;

using namespace alphaflow;

void printUsage(const po::options_description& desc) {
    std::cout << "AlphaFlow - rule based strategy backtester\n\n";
    std::cout << "Usage: alphaflow --data <prices.csv> --request <request.json> [options]\n\n";
    std::cout << desc << std::endl;

    std::cout << "\nExamples:\n";
    std::cout << "  # Backtest and print the JSON result\n";
    std::cout << "  alphaflow --data SPY.csv --request ema_cross.json\n\n";
    std::cout << "  # Compute beta against a benchmark and save the result\n";
    std::cout << "  alphaflow --data SPY.csv --request ema_cross.json --benchmark bench.txt --output result.json\n";
}

bool checkInputFile(const std::string& option, const std::string& fileName) {
    if (!fs::exists(fileName) || !fs::is_regular_file(fileName)) {
        std::cerr << "Error: --" << option << " file '" << fileName << "' does not exist" << std::endl;
        return false;
    }
    return true;
}

int main(int argc, char* argv[]) {
    try {
        po::options_description desc("Options");
        desc.add_options()
            ("help,h", "Show this help message")
            ("data,d", po::value<std::string>(), "OHLCV CSV file (timestamp,open,high,low,close,volume)")
            ("request,r", po::value<std::string>(), "Backtest request JSON file")
            ("benchmark,b", po::value<std::string>(), "Benchmark returns file, one value per line")
            ("output,o", po::value<std::string>(), "Write the JSON result to this file instead of stdout")
            ("verbose,v", "Print every trade and a summary table to stderr");

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);

        if (vm.count("help")) {
            printUsage(desc);
            return 0;
        }

        if (!vm.count("data") || !vm.count("request")) {
            std::cerr << "Error: both --data and --request are required" << std::endl;
            printUsage(desc);
            return 1;
        }

        const std::string dataFile = vm["data"].as<std::string>();
        const std::string requestFile = vm["request"].as<std::string>();
        const bool verbose = vm.count("verbose") > 0;

        // Report every missing input before doing any work
        bool inputsOk = checkInputFile("data", dataFile);
        inputsOk = checkInputFile("request", requestFile) && inputsOk;
        if (vm.count("benchmark"))
            inputsOk = checkInputFile("benchmark", vm["benchmark"].as<std::string>()) && inputsOk;
        if (!inputsOk)
            return 1;

        BacktestRequest request = BacktestRequestReader::readFile(requestFile);

        PriceSeriesCsvReader reader(dataFile);
        reader.readFile();
        if (verbose)
            std::cerr << "Loaded " << reader.getPriceSeries().getNumBars() << " bars from " << dataFile
                      << " (" << reader.getNumWarnings() << " warnings)" << std::endl;

        BackTester backTester(reader.getPriceSeries(), request);

        if (vm.count("benchmark")) {
            std::vector<double> benchmark = readReturnsFile(vm["benchmark"].as<std::string>());
            if (verbose)
                std::cerr << "Loaded " << benchmark.size() << " benchmark returns" << std::endl;
            backTester.setBenchmarkReturns(benchmark);
        }

        if (verbose)
            backTester.addObserver(std::make_shared<TradeLogObserver>(std::cerr));

        BacktestResult result = backTester.backtest();

        if (verbose)
            writePerformanceTable(std::cerr, result.getPerformanceSummary());

        if (vm.count("output")) {
            const std::string outputFile = vm["output"].as<std::string>();
            BacktestResultWriter::writeFile(result, request.getExecutionParameters(), outputFile);
            if (verbose)
                std::cerr << "Result written to " << outputFile << std::endl;
        } else {
            std::cout << BacktestResultWriter::toJson(result, request.getExecutionParameters()) << std::endl;
        }

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
