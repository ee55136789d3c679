/**
 * @file InvalidOperationException.hpp
 * @brief Exception for operations invalid in the object's current state
 */

#pragma once

#include "kernel/exception/DomainException.hpp"

namespace kernel::exception {

/**
 * @brief Raised when an operation is not allowed in the current state
 *
 * Typical case: establishing an entity identity a second time.
 */
class InvalidOperationException : public DomainException {
public:
    static constexpr const char* CODE = "INVALID_OPERATION";

    explicit InvalidOperationException(std::string message)
        : DomainException(CODE, std::move(message)) {}
};

} // namespace kernel::exception
