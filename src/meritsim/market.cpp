#include "meritsim/market.hpp"

#include <utility>

namespace meritsim {

void LoadFactorTable::set_column(const std::string& name, std::vector<double> values) {
    auto it = columns.find(name);
    if (it == columns.end()) {
        columnOrder.push_back(name);
        columns.emplace(name, std::move(values));
    } else {
        it->second = std::move(values);
    }
}

const std::vector<double>* LoadFactorTable::find_column(const std::string& name) const {
    const auto it = columns.find(name);
    if (it == columns.end()) {
        return nullptr;
    }
    return &it->second;
}

}  // namespace meritsim
