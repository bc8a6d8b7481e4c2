// filename: io_csv.hpp
// part of Hourly Merit-Order Dispatch Simulator
// MIT License

#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <vector>

#include "meritsim/simulation.hpp"

namespace meritsim {

inline constexpr std::array<const char*, 7> kResultColumns{
    "Hour",
    "Marginal_Price_GBP",
    "Wind_Generated_MWh",
    "Solar_Generated_MWh",
    "Gas_Generated_MWh",
    "Demand_MWh",
    "Supply_Shortage_MWh",
};

void write_hourly_results_csv(const std::string& path, const std::vector<HourlyResult>& rows);

inline void write_hourly_results_csv(const std::string& path, const SimulationResult& result) {
    write_hourly_results_csv(path, result.rows);
}

struct CsvTable {
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;

    // Index of a header cell, or header.size() when absent.
    [[nodiscard]] std::size_t column_index(const std::string& name) const;
};

CsvTable read_csv_table(const std::string& path);

}  // namespace meritsim
