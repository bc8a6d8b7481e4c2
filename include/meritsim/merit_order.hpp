#pragma once

#include <cstddef>
#include <vector>

#include "meritsim/market.hpp"

namespace meritsim {

// Thermal units in dispatch priority. The three vectors are aligned; plantIndices
// maps each stack position back to the caller's gas plant list.
struct MeritOrderStack {
    std::vector<double> capacities;
    std::vector<double> efficiencies;
    std::vector<std::size_t> plantIndices;

    [[nodiscard]] std::size_t size() const { return capacities.size(); }
    [[nodiscard]] bool empty() const { return capacities.empty(); }
    [[nodiscard]] double total_capacity() const;
};

/**
 * @brief Order gas units by descending efficiency.
 *
 * Units with equal efficiency keep their relative input order (stable sort);
 * the input vector is not modified.
 */
MeritOrderStack build_merit_order(const std::vector<ThermalPlant>& plants);

}  // namespace meritsim
