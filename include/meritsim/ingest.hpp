#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "meritsim/market.hpp"
#include "meritsim/simulation.hpp"

namespace meritsim {

struct MarketScenario {
    std::string version;
    std::string path;
    MarketInputs inputs;

    struct Outputs {
        std::optional<std::string> reportPath;
    } outputs;

    struct SimulationSettings {
        bool parallelHoursSpecified{false};
        bool parallelHours{false};
        bool threadsSpecified{false};
        std::size_t threads{0};
        bool verboseSpecified{false};
        bool verbose{false};
    } simulation;

    [[nodiscard]] SimulationOptions simulation_options() const;
};

/**
 * @brief Load a market scenario. Each of the seven sheets (windplants,
 *        wind_loadfactors, solarplants, solar_loadfactors, gasplants, demand,
 *        gas_prices) is either an inline array of row objects or the path of a
 *        CSV file, resolved relative to the scenario file.
 * @throws std::runtime_error on I/O, schema or value errors.
 */
MarketScenario loadMarketScenarioFromJson(const std::string& path);

}  // namespace meritsim
