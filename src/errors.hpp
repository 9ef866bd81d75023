#ifndef RISKCALC_ERRORS_HPP
#define RISKCALC_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace riskcalc {

// Invalid parameters detected while constructing a value object
// (distribution parameters, correlation coefficients, mitigation strategies).
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& message)
        : std::invalid_argument(message) {}
};

// Caller error detected before a simulation consumes any randomness:
// empty risk list, sub-floor iteration count, unknown correlation ids.
class PreconditionError : public std::invalid_argument {
public:
    explicit PreconditionError(const std::string& message)
        : std::invalid_argument(message) {}
};

// Numerical failure that the documented fallbacks could not absorb.
class NumericalError : public std::runtime_error {
public:
    explicit NumericalError(const std::string& message)
        : std::runtime_error(message) {}
};

// Requested project does not exist in the repository
class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(const std::string& message)
        : std::runtime_error(message) {}
};

// Configuration file could not be read or is not valid JSON
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace riskcalc

#endif // RISKCALC_ERRORS_HPP
