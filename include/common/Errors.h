#pragma once

#include <stdexcept>
#include <string>

namespace stratlab {

// Malformed strategy specification (bad dates, unknown rule type, empty rule list).
// Raised at parse time and blocks the whole run.
class SpecificationError : public std::runtime_error {
public:
    explicit SpecificationError(const std::string& message)
        : std::runtime_error(message) {}
};

// Price history is empty or missing for the requested period.
class DataUnavailableError : public std::runtime_error {
public:
    explicit DataUnavailableError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace stratlab
