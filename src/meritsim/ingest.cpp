#include "meritsim/ingest.hpp"

#include "meritsim/io_csv.hpp"

#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace meritsim {
namespace {

namespace fs = std::filesystem;

constexpr const char* kSheetWindPlants = "windplants";
constexpr const char* kSheetWindLoadFactors = "wind_loadfactors";
constexpr const char* kSheetSolarPlants = "solarplants";
constexpr const char* kSheetSolarLoadFactors = "solar_loadfactors";
constexpr const char* kSheetGasPlants = "gasplants";
constexpr const char* kSheetDemand = "demand";
constexpr const char* kSheetGasPrices = "gas_prices";

// CSV cells become integers, doubles or strings so both sheet sources share one reader.
nlohmann::json parseCell(const std::string& cell) {
    if (cell.empty()) {
        return nullptr;
    }
    try {
        std::size_t consumed = 0;
        const long long asInt = std::stoll(cell, &consumed);
        if (consumed == cell.size()) {
            return static_cast<std::int64_t>(asInt);
        }
    } catch (const std::exception&) {
        // not an integer; fall through to floating-point
    }
    try {
        std::size_t consumed = 0;
        const double asDouble = std::stod(cell, &consumed);
        if (consumed == cell.size()) {
            return asDouble;
        }
    } catch (const std::exception&) {
        // not numeric; keep as text
    }
    return cell;
}

nlohmann::json csvTableToRows(const CsvTable& table) {
    nlohmann::json rows = nlohmann::json::array();
    for (const auto& cells : table.rows) {
        nlohmann::json row = nlohmann::json::object();
        for (std::size_t c = 0; c < table.header.size(); ++c) {
            row[table.header[c]] = parseCell(cells[c]);
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

nlohmann::json loadSheet(const nlohmann::json& sheets, const std::string& name, const fs::path& baseDir) {
    if (!sheets.contains(name)) {
        throw std::runtime_error("Scenario missing required sheet: " + name);
    }
    const auto& sheet = sheets.at(name);
    if (sheet.is_array()) {
        for (const auto& row : sheet) {
            if (!row.is_object()) {
                throw std::runtime_error("Sheet '" + name + "' rows must be objects");
            }
        }
        return sheet;
    }
    if (sheet.is_string()) {
        fs::path csvPath(sheet.get<std::string>());
        if (csvPath.is_relative()) {
            csvPath = baseDir / csvPath;
        }
        return csvTableToRows(read_csv_table(csvPath.lexically_normal().string()));
    }
    throw std::runtime_error("Sheet '" + name + "' must be an array of rows or a CSV path");
}

double requireNumber(const nlohmann::json& row, const std::string& sheet, const std::string& field,
                     std::size_t rowIndex) {
    if (!row.contains(field)) {
        throw std::runtime_error("Sheet '" + sheet + "' row " + std::to_string(rowIndex) +
                                 " missing field: " + field);
    }
    const auto& value = row.at(field);
    if (!value.is_number()) {
        throw std::runtime_error("Sheet '" + sheet + "' row " + std::to_string(rowIndex) + " field '" +
                                 field + "' must be numeric");
    }
    return value.get<double>();
}

HourLabel requireHour(const nlohmann::json& row, const std::string& sheet, std::size_t rowIndex) {
    if (!row.contains("hour")) {
        throw std::runtime_error("Sheet '" + sheet + "' row " + std::to_string(rowIndex) +
                                 " missing field: hour");
    }
    const auto& value = row.at("hour");
    if (value.is_number_integer()) {
        return value.get<HourLabel>();
    }
    if (value.is_number_float()) {
        const double raw = value.get<double>();
        if (std::isfinite(raw) && std::floor(raw) == raw &&
            std::abs(raw) < static_cast<double>(std::numeric_limits<HourLabel>::max())) {
            return static_cast<HourLabel>(raw);
        }
    }
    throw std::runtime_error("Sheet '" + sheet + "' row " + std::to_string(rowIndex) +
                             " hour must be an integer");
}

std::string requireName(const nlohmann::json& row, const std::string& sheet, std::size_t rowIndex) {
    if (!row.contains("name")) {
        throw std::runtime_error("Sheet '" + sheet + "' row " + std::to_string(rowIndex) +
                                 " missing field: name");
    }
    const auto& value = row.at("name");
    std::string name;
    if (value.is_string()) {
        name = value.get<std::string>();
    } else if (value.is_number()) {
        name = value.dump();
    }
    if (name.empty()) {
        throw std::runtime_error("Sheet '" + sheet + "' row " + std::to_string(rowIndex) +
                                 " name must be a non-empty string");
    }
    return name;
}

std::vector<RenewablePlant> parseRenewablePlants(const nlohmann::json& rows, const std::string& sheet) {
    std::vector<RenewablePlant> plants;
    plants.reserve(rows.size());
    for (std::size_t i = 0; i < rows.size(); ++i) {
        RenewablePlant plant{};
        plant.name = requireName(rows[i], sheet, i);
        plant.capacity = requireNumber(rows[i], sheet, "capacity", i);
        plants.push_back(std::move(plant));
    }
    return plants;
}

LoadFactorTable parseLoadFactors(const nlohmann::json& rows, const std::string& sheet) {
    LoadFactorTable table;
    if (rows.empty()) {
        return table;
    }

    std::vector<std::string> names;
    for (const auto& item : rows.front().items()) {
        if (item.key() != "hour") {
            names.push_back(item.key());
        }
    }

    std::vector<std::vector<double>> values(names.size());
    table.hours.reserve(rows.size());
    for (std::size_t i = 0; i < rows.size(); ++i) {
        table.hours.push_back(requireHour(rows[i], sheet, i));
        for (std::size_t c = 0; c < names.size(); ++c) {
            values[c].push_back(requireNumber(rows[i], sheet, names[c], i));
        }
    }
    for (std::size_t c = 0; c < names.size(); ++c) {
        table.set_column(names[c], std::move(values[c]));
    }
    return table;
}

std::vector<ThermalPlant> parseGasPlants(const nlohmann::json& rows, const std::string& sheet) {
    std::vector<ThermalPlant> plants;
    plants.reserve(rows.size());
    for (std::size_t i = 0; i < rows.size(); ++i) {
        ThermalPlant plant{};
        if (rows[i].contains("name")) {
            plant.name = requireName(rows[i], sheet, i);
        }
        plant.capacity = requireNumber(rows[i], sheet, "capacity", i);
        plant.efficiency = requireNumber(rows[i], sheet, "efficiency", i);
        plants.push_back(std::move(plant));
    }
    return plants;
}

void parseHourlySeries(const nlohmann::json& rows, const std::string& sheet, const std::string& field,
                       std::vector<HourLabel>& hours, std::vector<double>& values) {
    hours.clear();
    values.clear();
    hours.reserve(rows.size());
    values.reserve(rows.size());
    for (std::size_t i = 0; i < rows.size(); ++i) {
        hours.push_back(requireHour(rows[i], sheet, i));
        values.push_back(requireNumber(rows[i], sheet, field, i));
    }
}

void parseUnits(const nlohmann::json& json) {
    if (!json.contains("units")) {
        return;
    }
    const auto& units = json.at("units");
    const std::string price = units.value("price", std::string{"pence_per_therm"});
    if (price != "pence_per_therm") {
        throw std::runtime_error("Unsupported gas price units: " + price + ". Only pence_per_therm is supported.");
    }
    const std::string energy = units.value("energy", std::string{"MWh"});
    if (energy != "MWh") {
        throw std::runtime_error("Unsupported energy units: " + energy + ". Only MWh is supported.");
    }
}

void parseSimulationSettings(const nlohmann::json& json, MarketScenario& scenario) {
    if (json.contains("outputs")) {
        const auto& outputs = json.at("outputs");
        if (outputs.contains("report")) {
            const std::string report = outputs.at("report").get<std::string>();
            if (report.empty()) {
                throw std::runtime_error("outputs.report must be a non-empty string");
            }
            scenario.outputs.reportPath = report;
        }
    }

    if (!json.contains("simulation")) {
        return;
    }
    const auto& simulation = json.at("simulation");
    auto& settings = scenario.simulation;
    if (simulation.contains("parallel_hours")) {
        settings.parallelHoursSpecified = true;
        settings.parallelHours = simulation.at("parallel_hours").get<bool>();
    }
    if (simulation.contains("threads")) {
        const auto& threads = simulation.at("threads");
        if (!threads.is_number_integer() || threads.get<long long>() < 0) {
            throw std::runtime_error("simulation.threads must be a non-negative integer");
        }
        settings.threadsSpecified = true;
        settings.threads = threads.get<std::size_t>();
    }
    if (simulation.contains("verbose")) {
        settings.verboseSpecified = true;
        settings.verbose = simulation.at("verbose").get<bool>();
    }
}

}  // namespace

SimulationOptions MarketScenario::simulation_options() const {
    SimulationOptions options{};
    if (simulation.parallelHoursSpecified) {
        options.parallelHours = simulation.parallelHours;
    }
    if (simulation.threadsSpecified) {
        options.threadCount = simulation.threads;
    }
    return options;
}

MarketScenario loadMarketScenarioFromJson(const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        throw std::runtime_error("Failed to open scenario JSON: " + path);
    }

    MarketScenario scenario{};
    scenario.path = path;
    const fs::path baseDir = fs::path(path).parent_path();

    try {
        nlohmann::json json;
        input >> json;

        scenario.version = json.value("version", std::string{});
        if (scenario.version.empty()) {
            throw std::runtime_error("Scenario JSON missing required field: version");
        }
        if (scenario.version != "0.1") {
            throw std::runtime_error("Unsupported scenario version: " + scenario.version);
        }
        parseUnits(json);

        if (!json.contains("sheets") || !json.at("sheets").is_object()) {
            throw std::runtime_error("Scenario JSON missing required object: sheets");
        }
        const auto& sheets = json.at("sheets");

        MarketInputs& inputs = scenario.inputs;
        inputs.windPlants = parseRenewablePlants(loadSheet(sheets, kSheetWindPlants, baseDir), kSheetWindPlants);
        inputs.windLoadFactors =
            parseLoadFactors(loadSheet(sheets, kSheetWindLoadFactors, baseDir), kSheetWindLoadFactors);
        inputs.solarPlants =
            parseRenewablePlants(loadSheet(sheets, kSheetSolarPlants, baseDir), kSheetSolarPlants);
        inputs.solarLoadFactors =
            parseLoadFactors(loadSheet(sheets, kSheetSolarLoadFactors, baseDir), kSheetSolarLoadFactors);
        inputs.gasPlants = parseGasPlants(loadSheet(sheets, kSheetGasPlants, baseDir), kSheetGasPlants);
        parseHourlySeries(loadSheet(sheets, kSheetDemand, baseDir), kSheetDemand, "demand", inputs.demand.hours,
                          inputs.demand.demand);
        parseHourlySeries(loadSheet(sheets, kSheetGasPrices, baseDir), kSheetGasPrices, "price",
                          inputs.gasPrices.hours, inputs.gasPrices.price);

        parseSimulationSettings(json, scenario);
    } catch (const nlohmann::json::exception& ex) {
        throw std::runtime_error("Invalid scenario JSON '" + path + "': " + ex.what());
    }

    return scenario;
}

}  // namespace meritsim
