#pragma once

#include <string>
#include <vector>

#include "meritsim/market.hpp"

namespace meritsim {

struct ValidationReport {
    std::vector<std::string> warnings;
};

/**
 * @brief Check that the gas price, wind load-factor and solar load-factor hour
 *        sequences match the demand hours element for element.
 * @throws AlignmentError naming the first series that disagrees.
 */
void validate_hour_alignment(const MarketInputs& inputs);

/**
 * @brief Alignment check followed by domain checks on capacities, efficiencies,
 *        demand and price values.
 * @throws AlignmentError, std::invalid_argument
 * @return Non-fatal findings such as load factors outside [0, 1].
 */
ValidationReport validate_market_inputs(const MarketInputs& inputs);

}  // namespace meritsim
