// filename: io_csv.cpp
// part of Hourly Merit-Order Dispatch Simulator
// MIT License

#include "meritsim/io_csv.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace meritsim {
namespace {

std::string trim(const std::string& text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(begin, end - begin);
}

std::vector<std::string> splitRow(const std::string& line) {
    std::vector<std::string> cells;
    std::string cell;
    bool quoted = false;
    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (c == '"') {
            if (quoted && i + 1 < line.size() && line[i + 1] == '"') {
                cell.push_back('"');
                ++i;
            } else {
                quoted = !quoted;
            }
        } else if (c == ',' && !quoted) {
            cells.push_back(trim(cell));
            cell.clear();
        } else {
            cell.push_back(c);
        }
    }
    cells.push_back(trim(cell));
    return cells;
}

}  // namespace

void write_hourly_results_csv(const std::string& path, const std::vector<HourlyResult>& rows) {
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open CSV output: " + path);
    }

    for (std::size_t i = 0; i < kResultColumns.size(); ++i) {
        if (i > 0) {
            ofs << ',';
        }
        ofs << kResultColumns[i];
    }
    ofs << '\n';

    ofs << std::setprecision(12);
    for (const auto& row : rows) {
        ofs << row.hour << ',' << row.marginalPrice << ',' << row.windGenerated << ','
            << row.solarGenerated << ',' << row.gasGenerated << ',' << row.demand << ','
            << row.shortage << '\n';
    }
    if (!ofs) {
        throw std::runtime_error("Failed while writing CSV output: " + path);
    }
}

std::size_t CsvTable::column_index(const std::string& name) const {
    const auto it = std::find(header.begin(), header.end(), name);
    return static_cast<std::size_t>(it - header.begin());
}

CsvTable read_csv_table(const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        throw std::runtime_error("Failed to open CSV input: " + path);
    }

    CsvTable table;
    std::string line;
    std::size_t lineNumber = 0;
    bool haveHeader = false;
    while (std::getline(input, line)) {
        ++lineNumber;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (trim(line).empty()) {
            continue;
        }
        std::vector<std::string> cells = splitRow(line);
        if (!haveHeader) {
            if (!cells.empty() && cells.front().rfind("\xEF\xBB\xBF", 0) == 0) {
                cells.front().erase(0, 3);
            }
            table.header = std::move(cells);
            haveHeader = true;
            continue;
        }
        if (cells.size() != table.header.size()) {
            std::ostringstream oss;
            oss << path << ":" << lineNumber << ": expected " << table.header.size() << " cells, found "
                << cells.size();
            throw std::runtime_error(oss.str());
        }
        table.rows.push_back(std::move(cells));
    }

    if (!haveHeader) {
        throw std::runtime_error("CSV input has no header row: " + path);
    }
    return table;
}

}  // namespace meritsim
