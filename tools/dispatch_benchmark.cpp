// filename: dispatch_benchmark.cpp
// part of Hourly Merit-Order Dispatch Simulator
// MIT License

#include "meritsim/dispatch.hpp"
#include "meritsim/market.hpp"
#include "meritsim/simulation.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

struct BenchmarkConfig {
    std::size_t hours{8760};
    std::size_t windPlants{40};
    std::size_t solarPlants{40};
    std::size_t gasPlants{60};
    std::size_t repeats{3};
    std::size_t threads{0};
    std::uint32_t seed{12345};
    bool writeCsv{false};
    std::string csvPath{};
};

void printUsage() {
    std::cout << "dispatch_benchmark options:\n"
              << "  --hours <int>          Length of the synthetic horizon (default 8760)\n"
              << "  --wind <int>           Number of wind plants (default 40)\n"
              << "  --solar <int>          Number of solar plants (default 40)\n"
              << "  --gas <int>            Number of gas units (default 60)\n"
              << "  --repeats <int>        Number of benchmark repeats (default 3)\n"
              << "  --threads <int>        Worker threads for the parallel run (0 = auto)\n"
              << "  --seed <int>           Random seed for the synthetic inputs (default 12345)\n"
              << "  --csv <path>           Append benchmark results to CSV file\n"
              << "  --help                 Show this message\n";
}

bool parseArgs(int argc, char** argv, BenchmarkConfig& cfg) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        try {
            if (arg == "--help") {
                printUsage();
                return false;
            } else if (arg == "--hours" && i + 1 < argc) {
                cfg.hours = static_cast<std::size_t>(std::stoul(argv[++i]));
            } else if (arg == "--wind" && i + 1 < argc) {
                cfg.windPlants = static_cast<std::size_t>(std::stoul(argv[++i]));
            } else if (arg == "--solar" && i + 1 < argc) {
                cfg.solarPlants = static_cast<std::size_t>(std::stoul(argv[++i]));
            } else if (arg == "--gas" && i + 1 < argc) {
                cfg.gasPlants = static_cast<std::size_t>(std::stoul(argv[++i]));
            } else if (arg == "--repeats" && i + 1 < argc) {
                cfg.repeats = static_cast<std::size_t>(std::stoul(argv[++i]));
            } else if (arg == "--threads" && i + 1 < argc) {
                cfg.threads = static_cast<std::size_t>(std::stoul(argv[++i]));
            } else if (arg == "--seed" && i + 1 < argc) {
                cfg.seed = static_cast<std::uint32_t>(std::stoul(argv[++i]));
            } else if (arg == "--csv" && i + 1 < argc) {
                cfg.writeCsv = true;
                cfg.csvPath = argv[++i];
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                return false;
            }
        } catch (const std::exception& ex) {
            std::cerr << "Failed to parse argument " << arg << ": " << ex.what() << "\n";
            return false;
        }
    }
    return true;
}

void fillLoadFactors(const std::vector<meritsim::RenewablePlant>& plants,
                     const std::vector<meritsim::HourLabel>& hours,
                     bool diurnal,
                     std::mt19937& rng,
                     meritsim::LoadFactorTable& table) {
    std::uniform_real_distribution<double> noise(0.0, 1.0);
    table.hours = hours;
    for (const auto& plant : plants) {
        std::vector<double> values(hours.size(), 0.0);
        for (std::size_t h = 0; h < hours.size(); ++h) {
            if (diurnal) {
                const double phase = std::sin(M_PI * static_cast<double>(h % 24) / 24.0);
                values[h] = std::clamp(phase * (0.6 + 0.4 * noise(rng)), 0.0, 1.0);
            } else {
                values[h] = noise(rng);
            }
        }
        table.set_column(plant.name, std::move(values));
    }
}

meritsim::MarketInputs makeSyntheticMarket(const BenchmarkConfig& cfg) {
    std::mt19937 rng(cfg.seed);
    std::uniform_real_distribution<double> capacity(20.0, 400.0);
    std::uniform_real_distribution<double> efficiency(0.30, 0.60);
    std::uniform_real_distribution<double> price(30.0, 120.0);

    meritsim::MarketInputs inputs;
    std::vector<meritsim::HourLabel> hours(cfg.hours);
    std::iota(hours.begin(), hours.end(), meritsim::HourLabel{1});

    for (std::size_t i = 0; i < cfg.windPlants; ++i) {
        inputs.windPlants.push_back({"wind_" + std::to_string(i), capacity(rng)});
    }
    for (std::size_t i = 0; i < cfg.solarPlants; ++i) {
        inputs.solarPlants.push_back({"solar_" + std::to_string(i), capacity(rng)});
    }
    double gasCapacity = 0.0;
    for (std::size_t i = 0; i < cfg.gasPlants; ++i) {
        meritsim::ThermalPlant plant{};
        plant.name = "gas_" + std::to_string(i);
        plant.capacity = capacity(rng);
        plant.efficiency = efficiency(rng);
        gasCapacity += plant.capacity;
        inputs.gasPlants.push_back(plant);
    }
    fillLoadFactors(inputs.windPlants, hours, false, rng, inputs.windLoadFactors);
    fillLoadFactors(inputs.solarPlants, hours, true, rng, inputs.solarLoadFactors);

    // Peak demand slightly above thermal capacity so a few hours run short.
    std::uniform_real_distribution<double> demandShare(0.3, 1.05);
    inputs.demand.hours = hours;
    inputs.gasPrices.hours = hours;
    for (std::size_t h = 0; h < hours.size(); ++h) {
        inputs.demand.demand.push_back(demandShare(rng) * gasCapacity);
        inputs.gasPrices.price.push_back(price(rng));
    }
    return inputs;
}

struct Timing {
    double avgMs{0.0};
    double minMs{0.0};
    double maxMs{0.0};
};

Timing timeDispatch(const meritsim::RunContext& context,
                    const meritsim::SimulationOptions& options,
                    std::size_t repeats,
                    std::vector<meritsim::HourDispatch>& lastRun,
                    std::size_t& threadsUsed) {
    std::vector<double> durationsMs;
    durationsMs.reserve(repeats);
    for (std::size_t repeat = 0; repeat < repeats; ++repeat) {
        const auto start = std::chrono::steady_clock::now();
        lastRun = meritsim::dispatch_all_hours(context, options, &threadsUsed);
        const auto end = std::chrono::steady_clock::now();
        durationsMs.push_back(std::chrono::duration<double, std::milli>(end - start).count());
    }

    Timing timing{};
    timing.avgMs = std::accumulate(durationsMs.begin(), durationsMs.end(), 0.0) /
                   static_cast<double>(durationsMs.size());
    const auto [minIt, maxIt] = std::minmax_element(durationsMs.begin(), durationsMs.end());
    timing.minMs = *minIt;
    timing.maxMs = *maxIt;
    return timing;
}

void writeCsvResult(const BenchmarkConfig& cfg,
                    std::size_t threadsUsed,
                    const Timing& sequential,
                    const Timing& parallel) {
    namespace fs = std::filesystem;
    const fs::path csvPath{cfg.csvPath};
    const bool newFile = !fs::exists(csvPath);
    std::ofstream csv(csvPath, std::ios::app);
    if (!csv) {
        throw std::runtime_error("Failed to open CSV file: " + cfg.csvPath);
    }
    if (newFile) {
        csv << "hours,wind,solar,gas,threads,seq_avg_ms,seq_min_ms,seq_max_ms,par_avg_ms,par_min_ms,par_max_ms\n";
    }
    csv << cfg.hours << ',' << cfg.windPlants << ',' << cfg.solarPlants << ',' << cfg.gasPlants << ','
        << threadsUsed << ',' << sequential.avgMs << ',' << sequential.minMs << ',' << sequential.maxMs << ','
        << parallel.avgMs << ',' << parallel.minMs << ',' << parallel.maxMs << '\n';
}

}  // namespace

int main(int argc, char** argv) {
    BenchmarkConfig cfg{};
    if (!parseArgs(argc, argv, cfg)) {
        return 1;
    }
    if (cfg.hours == 0 || cfg.repeats == 0) {
        std::cerr << "--hours and --repeats must be positive.\n";
        return 1;
    }

    const meritsim::MarketInputs inputs = makeSyntheticMarket(cfg);
    meritsim::RunContext context;
    try {
        context = meritsim::build_run_context(inputs);
    } catch (const std::exception& ex) {
        std::cerr << "Failed to build run context: " << ex.what() << "\n";
        return 1;
    }

    meritsim::SimulationOptions sequentialOptions{};
    meritsim::SimulationOptions parallelOptions{};
    parallelOptions.parallelHours = true;
    parallelOptions.threadCount = cfg.threads;

    std::vector<meritsim::HourDispatch> sequentialRun;
    std::vector<meritsim::HourDispatch> parallelRun;
    std::size_t sequentialThreads = 1;
    std::size_t parallelThreads = 1;
    const Timing sequential = timeDispatch(context, sequentialOptions, cfg.repeats, sequentialRun, sequentialThreads);
    const Timing parallel = timeDispatch(context, parallelOptions, cfg.repeats, parallelRun, parallelThreads);

    std::size_t mismatches = 0;
    for (std::size_t h = 0; h < sequentialRun.size(); ++h) {
        const auto& a = sequentialRun[h].result;
        const auto& b = parallelRun[h].result;
        if (a.hour != b.hour || a.marginalPrice != b.marginalPrice || a.gasGenerated != b.gasGenerated ||
            a.shortage != b.shortage) {
            ++mismatches;
        }
    }

    std::vector<meritsim::HourlyResult> rows;
    rows.reserve(sequentialRun.size());
    for (const auto& dispatch : sequentialRun) {
        rows.push_back(dispatch.result);
    }
    const meritsim::SimulationResult summary = meritsim::assemble_results(std::move(rows));

    std::cout << std::fixed << std::setprecision(3);
    std::cout << "Horizon: " << cfg.hours << " hours, " << cfg.windPlants << " wind, " << cfg.solarPlants
              << " solar, " << cfg.gasPlants << " gas units\n";
    std::cout << "Sequential: " << sequential.avgMs << " ms (min=" << sequential.minMs
              << " ms, max=" << sequential.maxMs << " ms)\n";
    std::cout << "Parallel (" << parallelThreads << " threads): " << parallel.avgMs << " ms (min="
              << parallel.minMs << " ms, max=" << parallel.maxMs << " ms)\n";
    std::cout << "Mean price: " << summary.meanMarginalPrice << " GBP/MWh, shortage hours: "
              << summary.shortageHours << "\n";

    if (cfg.writeCsv) {
        try {
            writeCsvResult(cfg, parallelThreads, sequential, parallel);
        } catch (const std::exception& ex) {
            std::cerr << "Warning: " << ex.what() << "\n";
        }
    }

    if (mismatches > 0) {
        std::cerr << mismatches << " hours differ between sequential and parallel dispatch\n";
        return 2;
    }
    return 0;
}
