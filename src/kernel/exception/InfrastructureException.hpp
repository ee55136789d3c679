/**
 * @file InfrastructureException.hpp
 * @brief Infrastructure layer exception class
 */

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace kernel::exception {

/**
 * @brief Exception for infrastructure layer errors
 *
 * Used for configuration and environment errors.
 */
class InfrastructureException : public std::runtime_error {
private:
    std::string code_;
    std::string message_;

public:
    /**
     * @brief Construct a new Infrastructure Exception
     * @param code Error code (e.g., "CONFIG_MISSING")
     * @param message Human-readable error message
     */
    InfrastructureException(std::string code, std::string message)
        : std::runtime_error(message),
          code_(std::move(code)),
          message_(std::move(message)) {}

    [[nodiscard]] const std::string& getCode() const noexcept {
        return code_;
    }

    [[nodiscard]] const std::string& getMessage() const noexcept {
        return message_;
    }
};

} // namespace kernel::exception
