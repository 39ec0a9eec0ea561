#include "common/Types.h"

#include <cctype>
#include <cstdio>

namespace stratlab {

namespace {
bool isLeapYear(int y) {
    return (y % 4 == 0 && y % 100 != 0) || (y % 400 == 0);
}

int daysInMonth(int y, int m) {
    static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && isLeapYear(y)) {
        return 29;
    }
    return kDays[m - 1];
}

bool parseDigits(const std::string& text, size_t pos, size_t count, int& out) {
    int value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
        value = value * 10 + (text[i] - '0');
    }
    out = value;
    return true;
}
}

bool Date::isValid(int y, int m, int d) {
    if (y < 1 || y > 9999) return false;
    if (m < 1 || m > 12) return false;
    return d >= 1 && d <= daysInMonth(y, m);
}

std::optional<Date> Date::parseIso(const std::string& text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }

    int y = 0;
    int m = 0;
    int d = 0;
    if (!parseDigits(text, 0, 4, y) || !parseDigits(text, 5, 2, m) || !parseDigits(text, 8, 2, d)) {
        return std::nullopt;
    }
    if (!isValid(y, m, d)) {
        return std::nullopt;
    }
    return Date(y, m, d);
}

std::string Date::toIsoString() const {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", year, month, day);
    return buffer;
}

} // namespace stratlab
