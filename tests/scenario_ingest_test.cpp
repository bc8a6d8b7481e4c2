#include "meritsim/ingest.hpp"
#include "meritsim/market.hpp"
#include "meritsim/simulation.hpp"
#include "meritsim/types.hpp"

#include <cmath>
#include <filesystem>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace {

namespace fs = std::filesystem;

fs::path fixture(const std::string& name) {
    return (fs::path(__FILE__).parent_path() / "../inputs/tests" / name).lexically_normal();
}

bool same_inputs(const meritsim::MarketInputs& a, const meritsim::MarketInputs& b) {
    if (a.windPlants.size() != b.windPlants.size() || a.solarPlants.size() != b.solarPlants.size() ||
        a.gasPlants.size() != b.gasPlants.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.windPlants.size(); ++i) {
        if (a.windPlants[i].name != b.windPlants[i].name || a.windPlants[i].capacity != b.windPlants[i].capacity) {
            return false;
        }
    }
    for (std::size_t i = 0; i < a.solarPlants.size(); ++i) {
        if (a.solarPlants[i].name != b.solarPlants[i].name ||
            a.solarPlants[i].capacity != b.solarPlants[i].capacity) {
            return false;
        }
    }
    for (std::size_t i = 0; i < a.gasPlants.size(); ++i) {
        if (a.gasPlants[i].capacity != b.gasPlants[i].capacity ||
            a.gasPlants[i].efficiency != b.gasPlants[i].efficiency) {
            return false;
        }
    }
    for (const auto& plant : a.windPlants) {
        const auto* lhs = a.windLoadFactors.find_column(plant.name);
        const auto* rhs = b.windLoadFactors.find_column(plant.name);
        if (!lhs || !rhs || *lhs != *rhs) {
            return false;
        }
    }
    return a.demand.hours == b.demand.hours && a.demand.demand == b.demand.demand &&
           a.gasPrices.hours == b.gasPrices.hours && a.gasPrices.price == b.gasPrices.price &&
           a.windLoadFactors.hours == b.windLoadFactors.hours && a.solarLoadFactors.hours == b.solarLoadFactors.hours;
}

}  // namespace

int main() {
    using namespace meritsim;

    MarketScenario inlineScenario;
    MarketScenario csvScenario;
    try {
        inlineScenario = loadMarketScenarioFromJson(fixture("market_inline.json").string());
        csvScenario = loadMarketScenarioFromJson(fixture("market_csv.json").string());
    } catch (const std::exception& ex) {
        std::cerr << "Failed to load market scenarios: " << ex.what() << "\n";
        return 1;
    }

    if (inlineScenario.inputs.hour_count() != 4 || inlineScenario.inputs.gasPlants.size() != 2) {
        std::cerr << "Inline scenario did not load 4 hours and 2 gas plants\n";
        return 1;
    }
    if (!inlineScenario.outputs.reportPath || *inlineScenario.outputs.reportPath != "out/market_inline_report.csv") {
        std::cerr << "outputs.report was not parsed\n";
        return 1;
    }
    const SimulationOptions options = inlineScenario.simulation_options();
    if (!options.parallelHours || options.threadCount != 2 || !inlineScenario.simulation.verbose) {
        std::cerr << "simulation settings were not parsed\n";
        return 1;
    }
    if (!same_inputs(inlineScenario.inputs, csvScenario.inputs)) {
        std::cerr << "CSV sheets and inline sheets produced different inputs\n";
        return 1;
    }
    if (csvScenario.inputs.solarPlants.size() != 1 || csvScenario.inputs.solarPlants[0].name != "Cleve Hill") {
        std::cerr << "Quoted CSV plant name was not unquoted\n";
        return 1;
    }

    const SimulationResult result = run_simulation(inlineScenario.inputs, options);
    const std::vector<double> expectedPrice{17.0605 / 0.6, 20.4726 / 0.4, 0.0, 27.2968 / 0.4};
    const std::vector<double> expectedGas{60.0, 120.0, 0.0, 200.0};
    const std::vector<double> expectedShortage{0.0, 0.0, 0.0, 60.0};
    for (std::size_t h = 0; h < 4; ++h) {
        const HourlyResult& row = result.rows[h];
        if (std::abs(row.marginalPrice - expectedPrice[h]) > 1e-9 ||
            std::abs(row.gasGenerated - expectedGas[h]) > 1e-9 ||
            std::abs(row.shortage - expectedShortage[h]) > 1e-9) {
            std::cerr << "Hour " << row.hour << ": price=" << row.marginalPrice << " gas=" << row.gasGenerated
                      << " shortage=" << row.shortage << "\n";
            return 1;
        }
    }
    const double expectedMean = (expectedPrice[0] + expectedPrice[1] + expectedPrice[3]) / 4.0;
    if (std::abs(result.meanMarginalPrice - expectedMean) > 1e-9 || result.shortageHours != 1 ||
        result.curtailedHours != 1) {
        std::cerr << "Summary mismatch: mean=" << result.meanMarginalPrice << " shortageHours=" << result.shortageHours
                  << " curtailedHours=" << result.curtailedHours << "\n";
        return 1;
    }

    const std::vector<std::pair<std::string, std::string>> failures{
        {"bad_version.json", "Unsupported scenario version"},
        {"missing_sheet.json", "gas_prices"},
        {"does_not_exist.json", "Failed to open scenario JSON"},
    };
    for (const auto& [name, needle] : failures) {
        try {
            (void)loadMarketScenarioFromJson(fixture(name).string());
            std::cerr << name << " loaded without error\n";
            return 1;
        } catch (const std::runtime_error& ex) {
            if (std::string(ex.what()).find(needle) == std::string::npos) {
                std::cerr << name << ": unexpected message: " << ex.what() << "\n";
                return 1;
            }
        }
    }

    try {
        const MarketScenario missingColumn = loadMarketScenarioFromJson(fixture("missing_column.json").string());
        (void)run_simulation(missingColumn.inputs);
        std::cerr << "Plant without a load-factor column was accepted\n";
        return 1;
    } catch (const LookupError& ex) {
        if (ex.plant() != "Beta") {
            std::cerr << "LookupError named '" << ex.plant() << "'\n";
            return 1;
        }
    }

    std::cout << "Scenario ingest verified successfully\n";
    return 0;
}
