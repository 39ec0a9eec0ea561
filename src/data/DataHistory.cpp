#include "data/DataHistory.h"
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <map>
#include "common/Logger.h"

namespace stratlab {
namespace data {

namespace {
std::string trim(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.erase(s.begin());
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }
    return s;
}

std::string normalizeCell(std::string s) {
    s = trim(std::move(s));

    // Strip UTF-8 BOM if present at first cell.
    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        s = s.substr(3);
    }

    // Accept quoted CSV cells.
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return trim(std::move(s));
}

std::string toLowerCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Accepts "YYYY-MM-DD" and "YYYY-MM-DD HH:MM:SS"-style timestamps
std::optional<Date> parseDateCell(const std::string& cell) {
    if (cell.size() < 10) {
        return std::nullopt;
    }
    return Date::parseIso(cell.substr(0, 10));
}

void sortAndDedupe(std::vector<DailyBar>& bars) {
    std::stable_sort(bars.begin(), bars.end(), [](const DailyBar& a, const DailyBar& b) {
        return a.date < b.date;
    });
    // Keep the last row for a repeated date
    std::vector<DailyBar> unique;
    unique.reserve(bars.size());
    for (const auto& bar : bars) {
        if (!unique.empty() && unique.back().date == bar.date) {
            unique.back() = bar;
        } else {
            unique.push_back(bar);
        }
    }
    bars.swap(unique);
}
}

std::vector<DailyBar> DataHistory::loadDailyCSV(const std::string& file_path) {
    std::vector<DailyBar> bars;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open CSV file: {}", file_path);
        return bars;
    }

    std::map<std::string, size_t> header;
    std::string line;

    while (std::getline(file, line)) {
        std::stringstream ss(line);
        std::string cell;
        std::vector<std::string> row;

        while (std::getline(ss, cell, ',')) {
            row.push_back(normalizeCell(cell));
        }
        if (row.empty() || row[0].empty()) continue;

        if (header.empty()) {
            for (size_t i = 0; i < row.size(); ++i) {
                header[toLowerCopy(row[i])] = i;
            }
            if (!header.count("date") || !header.count("close")) {
                LOG_ERROR("CSV header must contain 'date' and 'close' columns: {}", file_path);
                return {};
            }
            continue;
        }

        auto cellAt = [&](const char* name) -> const std::string* {
            auto it = header.find(name);
            if (it == header.end() || it->second >= row.size() || row[it->second].empty()) {
                return nullptr;
            }
            return &row[it->second];
        };

        try {
            std::optional<Date> date;
            if (const std::string* date_cell = cellAt("date")) {
                date = parseDateCell(*date_cell);
            }
            const std::string* close_cell = cellAt("close");
            if (!date || close_cell == nullptr) {
                LOG_WARN("Skipping malformed row: {}", line);
                continue;
            }

            DailyBar bar;
            bar.date = *date;
            bar.close = std::stod(*close_cell);
            bar.open = cellAt("open") ? std::stod(*cellAt("open")) : bar.close;
            bar.high = cellAt("high") ? std::stod(*cellAt("high")) : bar.close;
            bar.low = cellAt("low") ? std::stod(*cellAt("low")) : bar.close;
            bar.volume = cellAt("volume") ? std::stod(*cellAt("volume")) : 0.0;
            bars.push_back(bar);
        } catch (const std::exception& e) {
            LOG_WARN("Error parsing row: {} - {}", line, e.what());
        }
    }

    sortAndDedupe(bars);
    LOG_INFO("Loaded {} daily bars from {}", bars.size(), file_path);
    return bars;
}

std::vector<DailyBar> DataHistory::loadJSON(const std::string& file_path) {
    std::vector<DailyBar> bars;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open JSON file: {}", file_path);
        return bars;
    }

    try {
        nlohmann::json j;
        file >> j;
        for (const auto& item : j) {
            try {
                const auto date = parseDateCell(item.value("date", std::string()));
                if (!date || !item.contains("close")) {
                    LOG_WARN("Skipping malformed JSON bar: {}", item.dump());
                    continue;
                }
                DailyBar bar;
                bar.date = *date;
                bar.close = item["close"].get<double>();
                bar.open = item.value("open", bar.close);
                bar.high = item.value("high", bar.close);
                bar.low = item.value("low", bar.close);
                bar.volume = item.value("volume", 0.0);
                bars.push_back(bar);
            } catch (const nlohmann::json::type_error& e) {
                LOG_WARN("Error parsing JSON bar: {} - {}", item.dump(), e.what());
            }
        }
        sortAndDedupe(bars);
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Error parsing JSON file: {} - {}", file_path, e.what());
        bars.clear();
    }

    LOG_INFO("Loaded {} daily bars from {}", bars.size(), file_path);
    return bars;
}

std::vector<DailyBar> DataHistory::filterByDate(const std::vector<DailyBar>& bars,
                                                const Date& start_date,
                                                const Date& end_date) {
    std::vector<DailyBar> out;
    for (const auto& bar : bars) {
        if (bar.date >= start_date && bar.date < end_date) {
            out.push_back(bar);
        }
    }
    return out;
}

} // namespace data
} // namespace stratlab
