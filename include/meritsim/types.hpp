// filename: types.hpp
// part of Hourly Merit-Order Dispatch Simulator
// MIT License

#pragma once

#include <stdexcept>
#include <string>

namespace meritsim {

// 1 therm = 29.3071 kWh, so p/therm -> GBP/MWh is price / 100 * 34.121.
constexpr double kPencePerThermToGbpPerMwh = 34.121;

class AlignmentError : public std::runtime_error {
public:
    explicit AlignmentError(const std::string& series)
        : std::runtime_error("Data Error: '" + series + "' hours do not align with Demand hours."),
          series_(series) {}

    const std::string& series() const { return series_; }

private:
    std::string series_;
};

class LookupError : public std::out_of_range {
public:
    LookupError(const std::string& plant, const std::string& table)
        : std::out_of_range("Plant '" + plant + "' has no load-factor column in " + table),
          plant_(plant) {}

    const std::string& plant() const { return plant_; }

private:
    std::string plant_;
};

}  // namespace meritsim
