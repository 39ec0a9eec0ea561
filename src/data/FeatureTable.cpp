#include "data/FeatureTable.h"

#include <stdexcept>

namespace stratlab {
namespace data {

FeatureTable::FeatureTable(std::vector<Date> dates, std::vector<double> closes, std::vector<double> returns)
    : dates_(std::move(dates)), closes_(std::move(closes)), returns_(std::move(returns)) {
    if (closes_.size() != dates_.size() || returns_.size() != dates_.size()) {
        throw std::invalid_argument("FeatureTable: date/close/return lengths differ");
    }
}

void FeatureTable::setColumn(const std::string& name, std::vector<double> values) {
    if (values.size() != dates_.size()) {
        throw std::invalid_argument("FeatureTable: column '" + name + "' has " +
                                    std::to_string(values.size()) + " rows, expected " +
                                    std::to_string(dates_.size()));
    }
    columns_[name] = std::move(values);
}

bool FeatureTable::hasColumn(const std::string& name) const {
    return columns_.count(name) > 0;
}

const std::vector<double>* FeatureTable::column(const std::string& name) const {
    auto it = columns_.find(name);
    return (it == columns_.end()) ? nullptr : &it->second;
}

std::vector<std::string> FeatureTable::columnNames() const {
    std::vector<std::string> out;
    out.reserve(columns_.size());
    for (const auto& kv : columns_) {
        out.push_back(kv.first);
    }
    return out;
}

std::string FeatureTable::maColumn(int window) {
    return "ma_" + std::to_string(window);
}

std::string FeatureTable::rvColumn(int window) {
    return "rv_" + std::to_string(window);
}

std::string FeatureTable::rvMedianColumn(int window) {
    return "rv_" + std::to_string(window) + "_med_" + std::to_string(kVolMedianWindow);
}

} // namespace data
} // namespace stratlab
