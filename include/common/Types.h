#pragma once

#include <optional>
#include <string>

namespace stratlab {

// Calendar date without time zone (trading day granularity)
struct Date {
    int year = 1970;
    int month = 1;
    int day = 1;

    Date() = default;
    Date(int y, int m, int d) : year(y), month(m), day(d) {}

    // Strict YYYY-MM-DD, rejects impossible calendar days (e.g. 2023-02-29)
    static std::optional<Date> parseIso(const std::string& text);
    static bool isValid(int y, int m, int d);

    std::string toIsoString() const;

    bool operator==(const Date& other) const {
        return year == other.year && month == other.month && day == other.day;
    }
    bool operator!=(const Date& other) const { return !(*this == other); }
    bool operator<(const Date& other) const {
        if (year != other.year) return year < other.year;
        if (month != other.month) return month < other.month;
        return day < other.day;
    }
    bool operator<=(const Date& other) const { return !(other < *this); }
    bool operator>(const Date& other) const { return other < *this; }
    bool operator>=(const Date& other) const { return !(*this < other); }
};

struct DailyBar {
    Date date;
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;

    DailyBar() = default;
    DailyBar(const Date& d, double o, double h, double l, double c, double v)
        : date(d), open(o), high(h), low(l), close(c), volume(v) {}
};

} // namespace stratlab
