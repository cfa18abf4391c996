#ifndef VANITYSSH_ERRORS_HPP
#define VANITYSSH_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace VanitySsh {

/**
 * @brief Base class for all VanitySsh exceptions.
 */
class Exception : public std::exception {
public:
    explicit Exception(const std::string& message) : msg_(message) {}
    explicit Exception(const char* message) : msg_(message) {}
    virtual ~Exception() noexcept override = default;

    virtual const char* what() const noexcept override {
        return msg_.c_str();
    }

protected:
    std::string msg_;
};

/**
 * @brief Exception for errors that occur at runtime.
 */
class RuntimeError : public Exception {
public:
    explicit RuntimeError(const std::string& message) : Exception(message) {}
    explicit RuntimeError(const char* message) : Exception(message) {}
};

/**
 * @brief The underlying key generation primitive failed.
 */
class KeyGenerationError : public RuntimeError {
public:
    explicit KeyGenerationError(const std::string& message) : RuntimeError(message) {}
    explicit KeyGenerationError(const char* message) : RuntimeError(message) {}
};

/**
 * @brief Malformed key text or binary container.
 */
class FormatError : public RuntimeError {
public:
    explicit FormatError(const std::string& message) : RuntimeError(message) {}
    explicit FormatError(const char* message) : RuntimeError(message) {}
};

/**
 * @brief Exception for logic errors in the library's usage.
 */
class LogicError : public Exception {
public:
    explicit LogicError(const std::string& message) : Exception(message) {}
    explicit LogicError(const char* message) : Exception(message) {}
};

/**
 * @brief Exception for invalid arguments.
 */
class InvalidArgument : public LogicError {
public:
    explicit InvalidArgument(const std::string& message) : LogicError(message) {}
    explicit InvalidArgument(const char* message) : LogicError(message) {}
};

/**
 * @brief The user-supplied pattern is not a valid regular expression.
 */
class InvalidPattern : public InvalidArgument {
public:
    explicit InvalidPattern(const std::string& message) : InvalidArgument(message) {}
    explicit InvalidPattern(const char* message) : InvalidArgument(message) {}
};

/**
 * @brief Zero or unsupported number of worker threads.
 */
class InvalidThreadCount : public InvalidArgument {
public:
    explicit InvalidThreadCount(const std::string& message) : InvalidArgument(message) {}
    explicit InvalidThreadCount(const char* message) : InvalidArgument(message) {}
};

/**
 * @brief A fixed-size buffer coming from the key generator has the wrong size.
 * Never recoverable: it means the crypto backend is broken.
 */
class InternalInvariantViolation : public LogicError {
public:
    explicit InternalInvariantViolation(const std::string& message) : LogicError(message) {}
    explicit InternalInvariantViolation(const char* message) : LogicError(message) {}
};

} // namespace VanitySsh

#endif // VANITYSSH_ERRORS_HPP
