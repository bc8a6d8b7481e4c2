#include "meritsim/validation.hpp"

#include "meritsim/types.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <sstream>
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace meritsim {
namespace {

bool sameHours(const std::vector<HourLabel>& reference, const std::vector<HourLabel>& hours) {
    return reference.size() == hours.size() && std::equal(reference.begin(), reference.end(), hours.begin());
}

void requireNonNegative(const std::string& field, double value) {
    if (!std::isfinite(value) || value < 0.0) {
        std::ostringstream oss;
        oss << field << " must be a finite non-negative number (got " << value << ")";
        throw std::invalid_argument(oss.str());
    }
}

void checkRenewableClass(const std::string& label,
                         const std::vector<RenewablePlant>& plants,
                         const LoadFactorTable& table,
                         ValidationReport& report) {
    std::unordered_set<std::string> seen;
    for (const auto& plant : plants) {
        if (plant.name.empty()) {
            throw std::invalid_argument(label + " plant with empty name");
        }
        if (!seen.insert(plant.name).second) {
            throw std::invalid_argument("Duplicate " + label + " plant name: " + plant.name);
        }
        requireNonNegative(label + " plant '" + plant.name + "' capacity", plant.capacity);
    }

    for (const auto& name : table.columnOrder) {
        const std::vector<double>* column = table.find_column(name);
        if (column == nullptr) {
            continue;
        }
        if (column->size() != table.hours.size()) {
            throw std::invalid_argument(label + " load-factor column '" + name + "' has " +
                                        std::to_string(column->size()) + " values for " +
                                        std::to_string(table.hours.size()) + " hours");
        }
        std::size_t outOfRange = 0;
        for (double lf : *column) {
            if (!std::isfinite(lf)) {
                throw std::invalid_argument(label + " load-factor column '" + name +
                                            "' contains a non-finite value");
            }
            if (lf < 0.0 || lf > 1.0) {
                ++outOfRange;
            }
        }
        if (outOfRange > 0) {
            report.warnings.push_back(label + " load-factor column '" + name + "' has " +
                                      std::to_string(outOfRange) + " value(s) outside [0, 1]");
        }
    }
}

}  // namespace

void validate_hour_alignment(const MarketInputs& inputs) {
    const std::vector<HourLabel>& standard = inputs.demand.hours;

    const std::pair<const char*, const std::vector<HourLabel>*> checking[] = {
        {"Gas Prices", &inputs.gasPrices.hours},
        {"Wind LoadFactors", &inputs.windLoadFactors.hours},
        {"Solar LoadFactors", &inputs.solarLoadFactors.hours},
    };
    for (const auto& [name, hours] : checking) {
        if (!sameHours(standard, *hours)) {
            throw AlignmentError(name);
        }
    }
}

ValidationReport validate_market_inputs(const MarketInputs& inputs) {
    validate_hour_alignment(inputs);

    if (inputs.demand.hours.empty()) {
        throw std::invalid_argument("Demand series is empty");
    }
    if (inputs.demand.demand.size() != inputs.demand.hours.size()) {
        throw std::invalid_argument("Demand series has mismatched hour and value counts");
    }
    if (inputs.gasPrices.price.size() != inputs.gasPrices.hours.size()) {
        throw std::invalid_argument("Gas price series has mismatched hour and value counts");
    }

    ValidationReport report;
    checkRenewableClass("wind", inputs.windPlants, inputs.windLoadFactors, report);
    checkRenewableClass("solar", inputs.solarPlants, inputs.solarLoadFactors, report);

    for (std::size_t i = 0; i < inputs.gasPlants.size(); ++i) {
        const ThermalPlant& plant = inputs.gasPlants[i];
        const std::string label =
            "gas plant " + (plant.name.empty() ? "#" + std::to_string(i) : "'" + plant.name + "'");
        requireNonNegative(label + " capacity", plant.capacity);
        if (!std::isfinite(plant.efficiency) || !(plant.efficiency > 0.0)) {
            throw std::invalid_argument(label + " efficiency must be positive");
        }
    }

    for (std::size_t i = 0; i < inputs.demand.demand.size(); ++i) {
        requireNonNegative("demand at hour " + std::to_string(inputs.demand.hours[i]), inputs.demand.demand[i]);
    }

    std::size_t negativePrices = 0;
    for (std::size_t i = 0; i < inputs.gasPrices.price.size(); ++i) {
        const double price = inputs.gasPrices.price[i];
        if (!std::isfinite(price)) {
            throw std::invalid_argument("gas price at hour " + std::to_string(inputs.gasPrices.hours[i]) +
                                        " is not finite");
        }
        if (price < 0.0) {
            ++negativePrices;
        }
    }
    if (negativePrices > 0) {
        report.warnings.push_back("gas price series has " + std::to_string(negativePrices) +
                                  " negative value(s)");
    }

    return report;
}

}  // namespace meritsim
