#ifndef PLANCALC_ERRORS_HPP
#define PLANCALC_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace plancalc {

/**
 * @brief Thrown at a construction or generation boundary when an input value
 * is outside its valid domain (negative premium, fee rate >= 1, ...)
 */
class InvalidInput : public std::invalid_argument {
public:
    explicit InvalidInput(const std::string& message)
        : std::invalid_argument(message) {}
};

/**
 * @brief Thrown when a configuration file cannot be read or parsed
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace plancalc

#endif // PLANCALC_ERRORS_HPP
