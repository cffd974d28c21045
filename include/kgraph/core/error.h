#ifndef KGRAPH_CORE_ERROR_H_
#define KGRAPH_CORE_ERROR_H_

#include <stdexcept>
#include <string>

namespace kgraph {
namespace core {

/**
 * @brief Base class for all kgraph errors
 */
class Error : public std::runtime_error {
public:
    enum class Code {
        UNKNOWN = 0,
        INVALID_ARGUMENT = 1,
        NOT_FOUND = 2,
        INTERNAL = 3,
        NOT_INITIALIZED = 4,
        STORAGE_UNAVAILABLE = 5,
        ENCODING_ERROR = 6,
        DIMENSION_MISMATCH = 7,
        ORACLE_FAILURE = 8,
        ABORTED = 9
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

const char* ToString(Error::Code code);

/**
 * @brief Error indicating invalid arguments or parameters
 */
class InvalidArgumentError : public Error {
public:
    explicit InvalidArgumentError(const std::string& message)
        : Error(message, Code::INVALID_ARGUMENT) {}
};

/**
 * @brief Operation attempted before the component was initialized
 */
class NotInitializedError : public Error {
public:
    explicit NotInitializedError(const std::string& message)
        : Error(message, Code::NOT_INITIALIZED) {}
};

/**
 * @brief Durable backend missing, unreadable or denied
 */
class StorageUnavailableError : public Error {
public:
    explicit StorageUnavailableError(const std::string& message)
        : Error(message, Code::STORAGE_UNAVAILABLE) {}
};

/**
 * @brief Malformed or truncated persisted record
 */
class EncodingError : public Error {
public:
    explicit EncodingError(const std::string& message)
        : Error(message, Code::ENCODING_ERROR) {}
};

class DimensionMismatchError : public Error {
public:
    explicit DimensionMismatchError(const std::string& message)
        : Error(message, Code::DIMENSION_MISMATCH) {}
};

class OracleFailureError : public Error {
public:
    explicit OracleFailureError(const std::string& message)
        : Error(message, Code::ORACLE_FAILURE) {}
};

/**
 * @brief Error indicating internal error
 */
class InternalError : public Error {
public:
    explicit InternalError(const std::string& message)
        : Error(message, Code::INTERNAL) {}
};

} // namespace core
} // namespace kgraph

#endif // KGRAPH_CORE_ERROR_H_
