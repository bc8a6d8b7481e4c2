// filename: simulation.hpp
// part of Hourly Merit-Order Dispatch Simulator
// MIT License

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "meritsim/dispatch.hpp"
#include "meritsim/market.hpp"

namespace meritsim {

struct SimulationOptions {
    bool parallelHours{false};
    std::size_t threadCount{0};  // 0 selects hardware_concurrency() - 1
};

struct SimulationResult {
    std::vector<HourlyResult> rows;
    double meanMarginalPrice{0.0};
    std::size_t shortageHours{0};
    double totalShortage{0.0};
    std::size_t curtailedHours{0};
    double peakNetDemand{0.0};
    double minNetDemand{0.0};
    std::size_t threadsUsed{1};
    std::vector<std::string> warnings;
};

/**
 * @brief Collect hourly rows (already in hour order) and compute the mean
 *        marginal price and shortage statistics.
 */
SimulationResult assemble_results(std::vector<HourlyResult> rows);

std::size_t resolve_thread_count(const SimulationOptions& options, std::size_t hourCount);

/**
 * @brief Dispatch every hour of the context. Rows come back in hour order
 *        whether or not the loop ran on worker threads.
 */
std::vector<HourDispatch> dispatch_all_hours(const RunContext& context,
                                             const SimulationOptions& options,
                                             std::size_t* threadsUsed = nullptr);

/**
 * @brief Validate, build the run context, dispatch all hours and assemble.
 * @throws AlignmentError, LookupError, std::invalid_argument
 */
SimulationResult run_simulation(const MarketInputs& inputs, const SimulationOptions& options = {});

}  // namespace meritsim
