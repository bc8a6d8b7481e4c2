// filename: market.hpp
// part of Hourly Merit-Order Dispatch Simulator
// MIT License

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace meritsim {

using HourLabel = std::int64_t;

struct RenewablePlant {
    std::string name;
    double capacity{0.0};  // MW
};

// One row per hour, one column per plant. Columns are looked up by plant name.
struct LoadFactorTable {
    std::vector<HourLabel> hours;
    std::vector<std::string> columnOrder;
    std::unordered_map<std::string, std::vector<double>> columns;

    void set_column(const std::string& name, std::vector<double> values);
    [[nodiscard]] const std::vector<double>* find_column(const std::string& name) const;
};

struct ThermalPlant {
    std::string name;
    double capacity{0.0};    // MW
    double efficiency{0.0};  // higher burns less fuel per MWh
};

struct DemandSeries {
    std::vector<HourLabel> hours;
    std::vector<double> demand;  // MWh
};

struct GasPriceSeries {
    std::vector<HourLabel> hours;
    std::vector<double> price;  // pence per therm
};

struct MarketInputs {
    std::vector<RenewablePlant> windPlants;
    LoadFactorTable windLoadFactors;
    std::vector<RenewablePlant> solarPlants;
    LoadFactorTable solarLoadFactors;
    std::vector<ThermalPlant> gasPlants;
    DemandSeries demand;
    GasPriceSeries gasPrices;

    [[nodiscard]] std::size_t hour_count() const { return demand.hours.size(); }
};

struct HourlyResult {
    HourLabel hour{0};
    double marginalPrice{0.0};  // GBP/MWh
    double windGenerated{0.0};
    double solarGenerated{0.0};
    double gasGenerated{0.0};
    double demand{0.0};
    double shortage{0.0};
};

}  // namespace meritsim
