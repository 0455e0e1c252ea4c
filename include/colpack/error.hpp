/**
 * @file error.hpp
 * @brief colpack error handling.
 *
 * Provides both error-code-based and exception-based error handling.
 * Every fallible operation returns an Error; the exceptions are only
 * thrown where no code can be returned (constructors) and disappear
 * entirely with COLPACK_NO_EXCEPTIONS=1.
 *
 * @authors colpack contributors
 */

#ifndef COLPACK_ERROR_HPP
#define COLPACK_ERROR_HPP

#include "config.hpp"

#if !COLPACK_NO_EXCEPTIONS
#include <stdexcept>
#include <string>
#endif

namespace colpack {

/**
 * @brief Error codes returned by fallible operations.
 */
enum class Error {
    Ok = 0,           ///< Success
    InvalidArg = -1,  ///< Invalid argument
    Overflow = -2,    ///< Destination too small
    Underflow = -3,   ///< Not enough data (short read, section exhausted)
    Unsupported = -4, ///< Operation not supported by this source
    Io = -5           ///< Underlying sink or stream failed
};

/**
 * @brief Get error message for error code.
 * @param error Error code
 * @return Human-readable error message
 */
inline const char* error_string(Error error) noexcept {
    switch (error) {
    case Error::Ok:
        return "Success";
    case Error::InvalidArg:
        return "Invalid argument";
    case Error::Overflow:
        return "Buffer overflow";
    case Error::Underflow:
        return "Buffer underflow";
    case Error::Unsupported:
        return "Unsupported operation";
    case Error::Io:
        return "I/O error";
    default:
        return "Unknown error";
    }
}

#if !COLPACK_NO_EXCEPTIONS

/**
 * @brief Base exception for colpack errors.
 */
class ColpackException : public std::runtime_error {
public:
    explicit ColpackException(const std::string& message, Error code = Error::InvalidArg)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

/**
 * @brief Exception for invalid arguments.
 */
class InvalidArgumentException : public ColpackException {
public:
    explicit InvalidArgumentException(const std::string& message)
        : ColpackException(message, Error::InvalidArg) {}
};

/**
 * @brief Exception for short reads.
 */
class UnderflowException : public ColpackException {
public:
    explicit UnderflowException(const std::string& message)
        : ColpackException(message, Error::Underflow) {}
};

/**
 * @brief Exception for operations a source cannot perform.
 */
class UnsupportedOperationException : public ColpackException {
public:
    explicit UnsupportedOperationException(const std::string& message)
        : ColpackException(message, Error::Unsupported) {}
};

/**
 * @brief Convert an error code into the matching exception.
 *
 * @param error Result of a fallible operation
 * @param context Prefix for the exception message
 */
inline void throw_if_error(Error error, const char* context) {
    if (error == Error::Ok) {
        return;
    }

    std::string message = std::string(context) + ": " + error_string(error);
    switch (error) {
    case Error::InvalidArg:
        throw InvalidArgumentException(message);
    case Error::Underflow:
        throw UnderflowException(message);
    case Error::Unsupported:
        throw UnsupportedOperationException(message);
    default:
        throw ColpackException(message, error);
    }
}

#endif // !COLPACK_NO_EXCEPTIONS

} // namespace colpack

#endif // COLPACK_ERROR_HPP
