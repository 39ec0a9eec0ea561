#pragma once

#include <string>
#include <vector>
#include "common/Types.h"

namespace stratlab {
namespace data {

class DataHistory {
public:
    // Load daily bars from a CSV file.
    // Header row is required and located by name: date,close are mandatory,
    // open,high,low,volume optional (default to close / 0).
    // Returns an empty vector when the file cannot be read.
    static std::vector<DailyBar> loadDailyCSV(const std::string& file_path);

    // Load daily bars from a JSON array: [{"date": "YYYY-MM-DD", "close": ..., ...}]
    static std::vector<DailyBar> loadJSON(const std::string& file_path);

    // Keep bars with start_date <= date < end_date
    static std::vector<DailyBar> filterByDate(const std::vector<DailyBar>& bars,
                                              const Date& start_date,
                                              const Date& end_date);
};

} // namespace data
} // namespace stratlab
