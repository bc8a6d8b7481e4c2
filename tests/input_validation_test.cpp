#include "meritsim/market.hpp"
#include "meritsim/validation.hpp"

#include <functional>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

meritsim::MarketInputs make_inputs() {
    using namespace meritsim;
    MarketInputs inputs;
    inputs.demand.hours = {1, 2};
    inputs.demand.demand = {10.0, 20.0};
    inputs.gasPrices.hours = {1, 2};
    inputs.gasPrices.price = {40.0, 45.0};
    inputs.windPlants = {{"W", 10.0}};
    inputs.windLoadFactors.hours = {1, 2};
    inputs.windLoadFactors.set_column("W", {0.2, 0.4});
    inputs.solarLoadFactors.hours = {1, 2};
    inputs.gasPlants = {{"G", 50.0, 0.5}};
    return inputs;
}

bool expect_invalid(const std::string& label, const std::function<void(meritsim::MarketInputs&)>& mutate) {
    meritsim::MarketInputs inputs = make_inputs();
    mutate(inputs);
    try {
        (void)meritsim::validate_market_inputs(inputs);
    } catch (const std::invalid_argument&) {
        return true;
    } catch (const std::exception& ex) {
        std::cerr << label << ": wrong exception type: " << ex.what() << "\n";
        return false;
    }
    std::cerr << label << ": invalid inputs were accepted\n";
    return false;
}

}  // namespace

int main() {
    using namespace meritsim;

    try {
        const ValidationReport report = validate_market_inputs(make_inputs());
        if (!report.warnings.empty()) {
            std::cerr << "Clean inputs produced warning: " << report.warnings.front() << "\n";
            return 1;
        }
    } catch (const std::exception& ex) {
        std::cerr << "Clean inputs rejected: " << ex.what() << "\n";
        return 1;
    }

    const double nan = std::numeric_limits<double>::quiet_NaN();
    const bool ok =
        expect_invalid("negative wind capacity", [](MarketInputs& in) { in.windPlants[0].capacity = -1.0; }) &&
        expect_invalid("duplicate wind name", [](MarketInputs& in) { in.windPlants.push_back({"W", 5.0}); }) &&
        expect_invalid("zero efficiency", [](MarketInputs& in) { in.gasPlants[0].efficiency = 0.0; }) &&
        expect_invalid("negative gas capacity", [](MarketInputs& in) { in.gasPlants[0].capacity = -5.0; }) &&
        expect_invalid("negative demand", [](MarketInputs& in) { in.demand.demand[1] = -3.0; }) &&
        expect_invalid("nan price", [nan](MarketInputs& in) { in.gasPrices.price[0] = nan; }) &&
        expect_invalid("short demand values", [](MarketInputs& in) { in.demand.demand.pop_back(); }) &&
        expect_invalid("short load-factor column",
                       [](MarketInputs& in) { in.windLoadFactors.set_column("W", {0.5}); }) &&
        expect_invalid("empty horizon", [](MarketInputs& in) {
            in.demand = {};
            in.gasPrices = {};
            in.windLoadFactors = {};
            in.solarLoadFactors = {};
            in.windPlants.clear();
        });
    if (!ok) {
        return 1;
    }

    MarketInputs warned = make_inputs();
    warned.windLoadFactors.set_column("W", {1.2, -0.1});
    warned.gasPrices.price[0] = -2.0;
    const ValidationReport report = validate_market_inputs(warned);
    if (report.warnings.size() != 2) {
        std::cerr << "Expected 2 warnings for out-of-range load factors and negative price, got "
                  << report.warnings.size() << "\n";
        return 1;
    }

    std::cout << "Input validation verified successfully\n";
    return 0;
}
