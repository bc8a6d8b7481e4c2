#pragma once

#include <string>
#include <vector>

#include "meritsim/market.hpp"

namespace meritsim {

/**
 * @brief Hourly generation of one renewable class: load factors (hours x plants)
 *        times capacities, summed across plants.
 * @param label Name of the class used in error messages, e.g. "wind".
 * @throws LookupError if a plant has no column in @p loadFactors.
 */
std::vector<double> aggregate_renewable_generation(const std::vector<RenewablePlant>& plants,
                                                   const LoadFactorTable& loadFactors,
                                                   const std::string& label);

}  // namespace meritsim
