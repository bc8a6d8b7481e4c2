#include "meritsim/ingest.hpp"
#include "meritsim/io_csv.hpp"
#include "meritsim/simulation.hpp"
#include "meritsim/types.hpp"

#include <cstddef>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

namespace {

constexpr const char* kDefaultReportPath = "hourly_prices_and_mix_report.csv";

void printUsage() {
    std::cout << "Usage: merit_sim --scenario PATH [--report PATH] [--no-report]"
                 " [--parallel-hours] [--threads N] [--verbose] [--quiet]"
                 " [--print-table] [--help]\n";
}

void ensureParentDirectory(const std::filesystem::path& path) {
    const std::filesystem::path parent = path.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }
}

void printResultTable(const meritsim::SimulationResult& result) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    for (const char* column : meritsim::kResultColumns) {
        oss << std::setw(20) << column;
    }
    oss << '\n';
    for (const auto& row : result.rows) {
        oss << std::setw(20) << row.hour << std::setw(20) << row.marginalPrice << std::setw(20)
            << row.windGenerated << std::setw(20) << row.solarGenerated << std::setw(20) << row.gasGenerated
            << std::setw(20) << row.demand << std::setw(20) << row.shortage << '\n';
    }
    std::cout << oss.str();
}

}  // namespace

int main(int argc, char** argv) {
    using namespace meritsim;

    std::optional<std::string> scenarioPath;
    std::optional<std::string> reportOverride;
    bool writeReport = true;
    bool printTable = false;
    std::optional<bool> parallelOverride;
    std::optional<std::size_t> threadsOverride;
    std::optional<bool> verboseOverride;
    bool quiet = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--scenario") {
            if (i + 1 >= argc) {
                std::cerr << "--scenario requires a path argument\n";
                printUsage();
                return 1;
            }
            scenarioPath = std::string(argv[++i]);
        } else if (arg == "--report") {
            if (i + 1 >= argc) {
                std::cerr << "--report requires a path argument\n";
                printUsage();
                return 1;
            }
            const std::string pathArg = std::string(argv[++i]);
            if (pathArg.empty()) {
                std::cerr << "--report requires a non-empty path\n";
                return 1;
            }
            reportOverride = pathArg;
        } else if (arg == "--no-report") {
            writeReport = false;
        } else if (arg == "--parallel-hours") {
            parallelOverride = true;
        } else if (arg == "--threads") {
            if (i + 1 >= argc) {
                std::cerr << "--threads requires an integer argument\n";
                return 1;
            }
            long value = 0;
            try {
                value = std::stol(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "--threads requires a valid integer argument\n";
                return 1;
            }
            if (value < 0) {
                std::cerr << "--threads must be non-negative\n";
                return 1;
            }
            threadsOverride = static_cast<std::size_t>(value);
        } else if (arg == "--verbose") {
            verboseOverride = true;
        } else if (arg == "--quiet") {
            quiet = true;
        } else if (arg == "--print-table") {
            printTable = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else {
            std::cerr << "Unrecognised argument: " << arg << "\n";
            printUsage();
            return 1;
        }
    }

    if (!scenarioPath) {
        printUsage();
        return 0;
    }

    MarketScenario scenario;
    try {
        scenario = loadMarketScenarioFromJson(*scenarioPath);
    } catch (const std::exception& ex) {
        std::cerr << "Failed to load scenario: " << ex.what() << "\n";
        return 1;
    }

    SimulationOptions options = scenario.simulation_options();
    if (parallelOverride) {
        options.parallelHours = *parallelOverride;
    }
    if (threadsOverride) {
        options.threadCount = *threadsOverride;
        if (*threadsOverride > 1) {
            options.parallelHours = true;
        }
    }
    bool verbose = verboseOverride.value_or(scenario.simulation.verbose);
    if (quiet) {
        verbose = false;
    }

    SimulationResult result;
    try {
        result = run_simulation(scenario.inputs, options);
    } catch (const AlignmentError& ex) {
        std::cerr << ex.what() << "\n";
        return 1;
    } catch (const LookupError& ex) {
        std::cerr << "Load factor lookup failed: " << ex.what() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Simulation failed: " << ex.what() << "\n";
        return 1;
    }

    if (!quiet) {
        for (const auto& warning : result.warnings) {
            std::cerr << "WARNING: " << warning << "\n";
        }
    }

    if (verbose) {
        std::cout << "Data alignment checked.\n";
        std::cout << "Max Net Demand: " << result.peakNetDemand << "\n";
        std::cout << "Min Net Demand: " << result.minNetDemand << "\n";
        if (result.threadsUsed > 1) {
            std::cout << "Dispatched " << result.rows.size() << " hours with " << result.threadsUsed
                      << " worker threads\n";
        }
        for (const auto& row : result.rows) {
            if (row.shortage > 0.0) {
                std::ostringstream oss;
                oss << "WARNING: Hour " << row.hour << " has supply shortage of " << std::fixed
                    << std::setprecision(2) << row.shortage << " MWh.\n";
                std::cout << oss.str();
            }
        }
    }

    if (verbose || printTable) {
        printResultTable(result);
    }

    if (!quiet) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2) << "Average Price: \xC2\xA3" << result.meanMarginalPrice
            << "/MWh\n";
        if (result.shortageHours > 0) {
            oss << "WARNING: System Shortage detected in " << result.shortageHours << " hours.\n";
        }
        if (verbose && result.curtailedHours > 0) {
            oss << "Renewables covered demand in " << result.curtailedHours << " hours.\n";
        }
        std::cout << oss.str();
    }

    if (writeReport) {
        std::string reportPath = kDefaultReportPath;
        if (reportOverride) {
            reportPath = *reportOverride;
        } else if (scenario.outputs.reportPath) {
            std::filesystem::path configured(*scenario.outputs.reportPath);
            if (configured.is_relative()) {
                configured = std::filesystem::path(*scenarioPath).parent_path() / configured;
            }
            reportPath = configured.lexically_normal().string();
        }
        try {
            ensureParentDirectory(reportPath);
            write_hourly_results_csv(reportPath, result);
        } catch (const std::exception& ex) {
            std::cerr << "Failed to write report: " << ex.what() << "\n";
            return 1;
        }
        if (!quiet) {
            std::cout << "Results saved to " << reportPath << "\n";
        }
    }

    return 0;
}
