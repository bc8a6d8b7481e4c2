#include "meritsim/merit_order.hpp"

#include <algorithm>
#include <numeric>
#include <utility>

namespace meritsim {

double MeritOrderStack::total_capacity() const {
    return std::accumulate(capacities.begin(), capacities.end(), 0.0);
}

MeritOrderStack build_merit_order(const std::vector<ThermalPlant>& plants) {
    std::vector<std::size_t> order(plants.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::stable_sort(order.begin(), order.end(), [&plants](std::size_t a, std::size_t b) {
        return plants[a].efficiency > plants[b].efficiency;
    });

    MeritOrderStack stack;
    stack.capacities.reserve(order.size());
    stack.efficiencies.reserve(order.size());
    for (std::size_t idx : order) {
        stack.capacities.push_back(plants[idx].capacity);
        stack.efficiencies.push_back(plants[idx].efficiency);
    }
    stack.plantIndices = std::move(order);
    return stack;
}

}  // namespace meritsim
