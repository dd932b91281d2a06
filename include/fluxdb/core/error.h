#ifndef FLUXDB_CORE_ERROR_H_
#define FLUXDB_CORE_ERROR_H_

#include <stdexcept>
#include <string>

namespace fluxdb {
namespace core {

/**
 * @brief Base class for all fluxdb errors
 */
class Error : public std::runtime_error {
public:
    enum class Code {
        UNKNOWN = 0,
        INVALID_ARGUMENT = 1,
        NOT_FOUND = 2,
        ALREADY_EXISTS = 3,
        TIMEOUT = 4,
        RESOURCE_EXHAUSTED = 5,
        INTERNAL = 6,
        IO_FAILURE = 7,
        AUTHORIZATION_DENIED = 8,
        INVALID_STATEMENT = 9,
        CLOSED = 10
    };

    explicit Error(const std::string& message, Code code = Code::UNKNOWN) 
        : std::runtime_error(message), code_(code) {}
    explicit Error(const char* message, Code code = Code::UNKNOWN) 
        : std::runtime_error(message), code_(code) {}

    Code code() const { return code_; }
    const char* what() const noexcept override { return std::runtime_error::what(); }

private:
    Code code_;
};

/**
 * @brief Returns a stable name for an error code, e.g. "NOT_FOUND"
 */
const char* CodeName(Error::Code code);

/**
 * @brief Error indicating invalid arguments or parameters
 */
class InvalidArgumentError : public Error {
public:
    explicit InvalidArgumentError(const std::string& message) 
        : Error(message, Code::INVALID_ARGUMENT) {}
    explicit InvalidArgumentError(const char* message) 
        : Error(message, Code::INVALID_ARGUMENT) {}
};

/**
 * @brief Error indicating resource not found
 */
class NotFoundError : public Error {
public:
    explicit NotFoundError(const std::string& message) 
        : Error(message, Code::NOT_FOUND) {}
    explicit NotFoundError(const char* message) 
        : Error(message, Code::NOT_FOUND) {}
};

} // namespace core
} // namespace fluxdb

#endif // FLUXDB_CORE_ERROR_H_
