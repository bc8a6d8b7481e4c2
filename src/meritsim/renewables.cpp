#include "meritsim/renewables.hpp"

#include "meritsim/types.hpp"

#include <cstddef>
#include <stdexcept>

namespace meritsim {

std::vector<double> aggregate_renewable_generation(const std::vector<RenewablePlant>& plants,
                                                   const LoadFactorTable& loadFactors,
                                                   const std::string& label) {
    const std::size_t hours = loadFactors.hours.size();

    // Resolve every column before summing so a missing plant fails without partial output.
    std::vector<const std::vector<double>*> columns;
    columns.reserve(plants.size());
    for (const auto& plant : plants) {
        const std::vector<double>* column = loadFactors.find_column(plant.name);
        if (column == nullptr) {
            throw LookupError(plant.name, label + " load factors");
        }
        if (column->size() != hours) {
            throw std::invalid_argument("aggregate_renewable_generation: column size mismatch for '" +
                                        plant.name + "'");
        }
        columns.push_back(column);
    }

    std::vector<double> total(hours, 0.0);
    for (std::size_t h = 0; h < hours; ++h) {
        double sum = 0.0;
        for (std::size_t p = 0; p < plants.size(); ++p) {
            sum += (*columns[p])[h] * plants[p].capacity;
        }
        total[h] = sum;
    }
    return total;
}

}  // namespace meritsim
