#ifndef CONFIGURATION_ERROR_HPP
#define CONFIGURATION_ERROR_HPP

#include <stdexcept>
#include <string>

/**
 * @brief Fatal error in the run configuration (unknown objective, malformed combination id, bad bounds, ...)
 *
 * Raised before any computation starts and never retried. Numerical problems during the
 * search are not configuration errors and are absorbed as penalty scores instead.
 */
class ConfigurationError : public std::runtime_error {
   public:
    explicit ConfigurationError(const std::string& message) : std::runtime_error(message) {}
};

#endif  // CONFIGURATION_ERROR_HPP
