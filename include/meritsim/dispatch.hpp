// filename: dispatch.hpp
// part of Hourly Merit-Order Dispatch Simulator
// MIT License

#pragma once

#include <cstddef>
#include <vector>

#include "meritsim/market.hpp"
#include "meritsim/merit_order.hpp"
#include "meritsim/validation.hpp"

namespace meritsim {

/**
 * @brief Run-level series shared by every hour's dispatch.
 *
 * Built once from validated inputs; read-only afterwards, so it can be shared
 * across worker threads without locking.
 */
struct RunContext {
    std::vector<HourLabel> hours;
    std::vector<double> demand;
    std::vector<double> gasPrice;  // pence per therm
    std::vector<double> windGenerated;
    std::vector<double> solarGenerated;
    std::vector<double> netDemand;
    MeritOrderStack meritOrder;

    [[nodiscard]] std::size_t hour_count() const { return hours.size(); }
};

enum class DispatchBranch { Curtailment, Normal, Shortage };

const char* to_string(DispatchBranch branch);

struct HourDispatch {
    HourlyResult result;
    DispatchBranch branch{DispatchBranch::Curtailment};
    double netDemand{0.0};
    double fuelPrice{0.0};         // GBP/MWh before efficiency
    double dispatchShortage{0.0};  // demand left after walking the whole stack
    double curtailedEnergy{0.0};   // renewable output in excess of demand
    // Output per merit-order position; empty in the curtailment branch.
    std::vector<double> unitDispatch;
};

double convert_gas_price(double pencePerTherm);

inline double unit_bid(double fuelPrice, double efficiency) { return fuelPrice / efficiency; }

/**
 * @brief Validate inputs, aggregate renewables and build the merit order.
 * @param report Receives non-fatal validation findings when non-null.
 * @throws AlignmentError, LookupError, std::invalid_argument
 */
RunContext build_run_context(const MarketInputs& inputs, ValidationReport* report = nullptr);

/**
 * @brief Clear one hour against the merit-order stack.
 *
 * Net demand <= 0 is curtailment (price and gas output zero). Otherwise units
 * are dispatched in stack order, each up to its capacity, and the clearing price
 * is the bid of the last unit that produced. Demand left after the stack is a
 * shortage; it is reported, not thrown.
 */
HourDispatch dispatch_hour(const RunContext& context, std::size_t hourPos);

}  // namespace meritsim
