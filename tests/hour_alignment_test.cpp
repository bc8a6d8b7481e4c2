#include "meritsim/dispatch.hpp"
#include "meritsim/market.hpp"
#include "meritsim/simulation.hpp"
#include "meritsim/types.hpp"
#include "meritsim/validation.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace {

meritsim::MarketInputs make_aligned_inputs() {
    using namespace meritsim;
    MarketInputs inputs;
    const std::vector<HourLabel> hours{1, 2, 3};

    inputs.windPlants.push_back({"W1", 100.0});
    inputs.windLoadFactors.hours = hours;
    inputs.windLoadFactors.set_column("W1", {0.1, 0.2, 0.3});

    inputs.solarPlants.push_back({"S1", 50.0});
    inputs.solarLoadFactors.hours = hours;
    inputs.solarLoadFactors.set_column("S1", {0.0, 0.5, 1.0});

    inputs.gasPlants.push_back({"G1", 200.0, 0.5});

    inputs.demand.hours = hours;
    inputs.demand.demand = {100.0, 120.0, 140.0};
    inputs.gasPrices.hours = hours;
    inputs.gasPrices.price = {50.0, 60.0, 70.0};
    return inputs;
}

// Returns true when the expected series was reported, printing the failure otherwise.
bool expect_alignment_error(const meritsim::MarketInputs& inputs, const std::string& expectedSeries,
                            const std::string& label) {
    try {
        (void)meritsim::run_simulation(inputs);
    } catch (const meritsim::AlignmentError& ex) {
        if (ex.series() != expectedSeries) {
            std::cerr << label << ": expected series '" << expectedSeries << "' but got '" << ex.series()
                      << "'\n";
            return false;
        }
        const std::string message = ex.what();
        if (message.find(expectedSeries) == std::string::npos) {
            std::cerr << label << ": message does not name the series: " << message << "\n";
            return false;
        }
        return true;
    } catch (const std::exception& ex) {
        std::cerr << label << ": unexpected exception type: " << ex.what() << "\n";
        return false;
    }
    std::cerr << label << ": misaligned hours were accepted\n";
    return false;
}

}  // namespace

int main() {
    using namespace meritsim;

    try {
        validate_hour_alignment(make_aligned_inputs());
    } catch (const std::exception& ex) {
        std::cerr << "Aligned inputs rejected: " << ex.what() << "\n";
        return 1;
    }

    {
        MarketInputs inputs = make_aligned_inputs();
        inputs.gasPrices.hours = {1, 3, 2};
        if (!expect_alignment_error(inputs, "Gas Prices", "swapped gas price hours")) {
            return 1;
        }
    }
    {
        MarketInputs inputs = make_aligned_inputs();
        inputs.windLoadFactors.hours = {1, 2};
        inputs.windLoadFactors.set_column("W1", {0.1, 0.2});
        if (!expect_alignment_error(inputs, "Wind LoadFactors", "short wind table")) {
            return 1;
        }
    }
    {
        MarketInputs inputs = make_aligned_inputs();
        inputs.solarLoadFactors.hours = {2, 3, 4};
        if (!expect_alignment_error(inputs, "Solar LoadFactors", "shifted solar hours")) {
            return 1;
        }
    }
    {
        // Gas prices are checked first when several series disagree.
        MarketInputs inputs = make_aligned_inputs();
        inputs.gasPrices.hours = {0, 2, 3};
        inputs.solarLoadFactors.hours = {0, 2, 3};
        if (!expect_alignment_error(inputs, "Gas Prices", "multiple misalignments")) {
            return 1;
        }
    }
    {
        // Misalignment must stop the run before a context is produced.
        MarketInputs inputs = make_aligned_inputs();
        inputs.windLoadFactors.hours = {1, 2, 5};
        bool threw = false;
        try {
            (void)build_run_context(inputs);
        } catch (const AlignmentError&) {
            threw = true;
        }
        if (!threw) {
            std::cerr << "build_run_context accepted misaligned wind hours\n";
            return 1;
        }
    }

    std::cout << "Hour alignment checks verified successfully\n";
    return 0;
}
