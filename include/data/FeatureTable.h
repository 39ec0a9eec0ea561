#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "common/Types.h"

namespace stratlab {
namespace data {

// Date-indexed daily rows with raw close/return plus named indicator columns.
// Read-only to the simulation core; NaN marks a missing value on a given day.
class FeatureTable {
public:
    FeatureTable() = default;
    FeatureTable(std::vector<Date> dates, std::vector<double> closes, std::vector<double> returns);

    size_t size() const { return dates_.size(); }
    bool empty() const { return dates_.empty(); }

    const Date& date(size_t i) const { return dates_[i]; }
    double close(size_t i) const { return closes_[i]; }
    double dailyReturn(size_t i) const { return returns_[i]; }

    const std::vector<Date>& dates() const { return dates_; }
    const std::vector<double>& closes() const { return closes_; }
    const std::vector<double>& returns() const { return returns_; }

    // Throws std::invalid_argument when the length does not match the row count
    void setColumn(const std::string& name, std::vector<double> values);
    bool hasColumn(const std::string& name) const;
    // nullptr when the column is absent
    const std::vector<double>* column(const std::string& name) const;
    std::vector<std::string> columnNames() const;

    // Trailing window of the realized-vol median ("1Y median")
    static constexpr int kVolMedianWindow = 252;

    static std::string maColumn(int window);
    static std::string rvColumn(int window);
    static std::string rvMedianColumn(int window);

private:
    std::vector<Date> dates_;
    std::vector<double> closes_;
    std::vector<double> returns_;
    std::map<std::string, std::vector<double>> columns_;
};

} // namespace data
} // namespace stratlab
