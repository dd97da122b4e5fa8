#pragma once

#include <stdexcept>
#include <string>

namespace pgtemp {

/**
 * @brief The one exception type a failed TempDb setup reports
 *
 * Causes are distinguished by message only.
 */
class SetupError : public std::runtime_error {
public:
    explicit SetupError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace pgtemp
