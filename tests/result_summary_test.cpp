#include "meritsim/market.hpp"
#include "meritsim/simulation.hpp"

#include <cmath>
#include <iostream>
#include <vector>

int main() {
    using namespace meritsim;

    std::vector<HourlyResult> rows(4);
    rows[0] = {1, 10.0, 5.0, 0.0, 20.0, 25.0, 0.0};
    rows[1] = {2, 0.0, 40.0, 10.0, 0.0, 30.0, 0.0};
    rows[2] = {3, 50.0, 0.0, 0.0, 100.0, 130.0, 30.0};
    rows[3] = {4, 40.0, 0.0, 0.0, 100.0, 101.5, 1.5};

    const SimulationResult result = assemble_results(rows);
    if (result.rows.size() != 4 || result.rows[2].hour != 3) {
        std::cerr << "Rows were not preserved in order\n";
        return 1;
    }
    if (std::abs(result.meanMarginalPrice - 25.0) > 1e-12) {
        std::cerr << "Mean marginal price " << result.meanMarginalPrice << " != 25\n";
        return 1;
    }
    if (result.shortageHours != 2 || std::abs(result.totalShortage - 31.5) > 1e-12) {
        std::cerr << "Shortage summary: hours=" << result.shortageHours << " total=" << result.totalShortage << "\n";
        return 1;
    }

    const SimulationResult empty = assemble_results({});
    if (empty.meanMarginalPrice != 0.0 || empty.shortageHours != 0 || !empty.rows.empty()) {
        std::cerr << "Empty table should summarise to zeros\n";
        return 1;
    }

    std::cout << "Result assembly verified successfully\n";
    return 0;
}
