#include "meritsim/dispatch.hpp"

#include "meritsim/renewables.hpp"
#include "meritsim/types.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>
#include <stdexcept>

namespace meritsim {
namespace {
constexpr double kShortageTolerance = 1e-9;
}

const char* to_string(DispatchBranch branch) {
    switch (branch) {
        case DispatchBranch::Curtailment:
            return "curtailment";
        case DispatchBranch::Normal:
            return "normal";
        case DispatchBranch::Shortage:
            return "shortage";
    }
    return "unknown";
}

double convert_gas_price(double pencePerTherm) {
    return pencePerTherm / 100.0 * kPencePerThermToGbpPerMwh;
}

RunContext build_run_context(const MarketInputs& inputs, ValidationReport* report) {
    ValidationReport findings = validate_market_inputs(inputs);
    if (report) {
        *report = std::move(findings);
    }

    RunContext context;
    context.hours = inputs.demand.hours;
    context.demand = inputs.demand.demand;
    context.gasPrice = inputs.gasPrices.price;

    context.windGenerated = aggregate_renewable_generation(inputs.windPlants, inputs.windLoadFactors, "wind");
    context.solarGenerated =
        aggregate_renewable_generation(inputs.solarPlants, inputs.solarLoadFactors, "solar");

    const std::size_t hours = context.hours.size();
    context.netDemand.resize(hours);
    for (std::size_t h = 0; h < hours; ++h) {
        context.netDemand[h] = context.demand[h] - context.windGenerated[h] - context.solarGenerated[h];
    }

    context.meritOrder = build_merit_order(inputs.gasPlants);
    return context;
}

HourDispatch dispatch_hour(const RunContext& context, std::size_t hourPos) {
    if (hourPos >= context.hour_count()) {
        throw std::out_of_range("dispatch_hour: hour position " + std::to_string(hourPos) + " out of range");
    }

    HourDispatch out;
    out.netDemand = context.netDemand[hourPos];

    HourlyResult& row = out.result;
    row.hour = context.hours[hourPos];
    row.windGenerated = context.windGenerated[hourPos];
    row.solarGenerated = context.solarGenerated[hourPos];
    row.demand = context.demand[hourPos];

    if (out.netDemand <= 0.0) {
        out.branch = DispatchBranch::Curtailment;
        out.curtailedEnergy = -out.netDemand;
        row.marginalPrice = 0.0;
        row.gasGenerated = 0.0;
    } else {
        const MeritOrderStack& stack = context.meritOrder;
        out.fuelPrice = convert_gas_price(context.gasPrice[hourPos]);
        out.unitDispatch.assign(stack.size(), 0.0);

        double remaining = out.netDemand;
        double gasTotal = 0.0;
        double price = 0.0;
        for (std::size_t k = 0; k < stack.size(); ++k) {
            if (remaining <= 0.0) {
                break;
            }
            const double amount = std::min(stack.capacities[k], remaining);
            if (!(amount > 0.0)) {
                continue;
            }
            remaining -= amount;
            gasTotal += amount;
            out.unitDispatch[k] = amount;
            price = unit_bid(out.fuelPrice, stack.efficiencies[k]);
        }

        row.gasGenerated = gasTotal;
        row.marginalPrice = price;
        if (remaining > 0.0) {
            out.branch = DispatchBranch::Shortage;
            out.dispatchShortage = remaining;
        } else {
            out.branch = DispatchBranch::Normal;
        }
    }

    // Reconcile against totals. Both figures describe the same shortfall, so they may
    // only differ by rounding in the order of subtraction.
    const double totalSupply = row.windGenerated + row.solarGenerated + row.gasGenerated;
    const double reconciled = std::max(0.0, row.demand - totalSupply);
    const double tolerance = kShortageTolerance * std::max(1.0, std::abs(row.demand));
    if (std::abs(reconciled - out.dispatchShortage) > tolerance) {
        throw std::logic_error("dispatch_hour: shortage mismatch at hour " + std::to_string(row.hour));
    }
    row.shortage = out.dispatchShortage;
    return out;
}

}  // namespace meritsim
