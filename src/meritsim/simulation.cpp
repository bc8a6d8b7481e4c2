#include "meritsim/simulation.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>
#include <utility>

namespace meritsim {

SimulationResult assemble_results(std::vector<HourlyResult> rows) {
    SimulationResult result;
    result.rows = std::move(rows);

    double priceSum = 0.0;
    for (const auto& row : result.rows) {
        priceSum += row.marginalPrice;
        if (row.shortage > 0.0) {
            ++result.shortageHours;
            result.totalShortage += row.shortage;
        }
    }
    if (!result.rows.empty()) {
        result.meanMarginalPrice = priceSum / static_cast<double>(result.rows.size());
    }
    return result;
}

std::size_t resolve_thread_count(const SimulationOptions& options, std::size_t hourCount) {
    if (!options.parallelHours || hourCount < 2) {
        return 1;
    }
    std::size_t threads = options.threadCount;
    if (threads == 0) {
        const unsigned int hw = std::thread::hardware_concurrency();
        threads = hw > 1 ? static_cast<std::size_t>(hw - 1) : 1;
    }
    return std::max<std::size_t>(1, std::min(threads, hourCount));
}

std::vector<HourDispatch> dispatch_all_hours(const RunContext& context,
                                             const SimulationOptions& options,
                                             std::size_t* threadsUsed) {
    const std::size_t hours = context.hour_count();
    const std::size_t threadCount = resolve_thread_count(options, hours);
    if (threadsUsed) {
        *threadsUsed = threadCount;
    }

    std::vector<HourDispatch> dispatches(hours);
    if (threadCount <= 1) {
        for (std::size_t idx = 0; idx < hours; ++idx) {
            dispatches[idx] = dispatch_hour(context, idx);
        }
        return dispatches;
    }

    std::atomic<std::size_t> nextIndex{0};
    std::atomic<bool> failed{false};
    std::exception_ptr firstError;
    std::mutex errorMutex;

    std::vector<std::thread> workers;
    workers.reserve(threadCount);
    for (std::size_t t = 0; t < threadCount; ++t) {
        workers.emplace_back([&]() {
            while (!failed.load()) {
                const std::size_t idx = nextIndex.fetch_add(1);
                if (idx >= hours) {
                    break;
                }
                try {
                    dispatches[idx] = dispatch_hour(context, idx);
                } catch (...) {
                    std::lock_guard<std::mutex> lock(errorMutex);
                    if (!firstError) {
                        firstError = std::current_exception();
                    }
                    failed.store(true);
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    if (firstError) {
        std::rethrow_exception(firstError);
    }
    return dispatches;
}

SimulationResult run_simulation(const MarketInputs& inputs, const SimulationOptions& options) {
    ValidationReport report;
    const RunContext context = build_run_context(inputs, &report);

    std::size_t threadsUsed = 1;
    std::vector<HourDispatch> dispatches = dispatch_all_hours(context, options, &threadsUsed);

    std::vector<HourlyResult> rows;
    rows.reserve(dispatches.size());
    std::size_t curtailed = 0;
    for (const auto& dispatch : dispatches) {
        rows.push_back(dispatch.result);
        if (dispatch.branch == DispatchBranch::Curtailment) {
            ++curtailed;
        }
    }

    SimulationResult result = assemble_results(std::move(rows));
    result.curtailedHours = curtailed;
    result.threadsUsed = threadsUsed;
    result.warnings = std::move(report.warnings);
    if (!context.netDemand.empty()) {
        const auto [minIt, maxIt] = std::minmax_element(context.netDemand.begin(), context.netDemand.end());
        result.minNetDemand = *minIt;
        result.peakNetDemand = *maxIt;
    }
    return result;
}

}  // namespace meritsim
