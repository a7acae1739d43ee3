#ifndef HGREASON_ERRORS_HPP
#define HGREASON_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace hgreason {

// Exception types for structured error handling.
// Validation outcomes (DENY / UNKNOWN) are results, never exceptions.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * Malformed hyperedge text. position() is the character offset
 * at which the parser gave up.
 */
class ParseError : public Error {
public:
    ParseError(const std::string& message, std::size_t position = 0)
        : Error("Parse error: " + message), position_(position) {}

    std::size_t position() const noexcept { return position_; }

private:
    std::size_t position_;
};

// Syntactically valid pattern rejected by sanitization (e.g. too deep)
class PatternError : public ParseError {
public:
    PatternError(const std::string& message, std::size_t position = 0)
        : ParseError(message, position) {}
};

class InvalidArgument : public Error {
public:
    explicit InvalidArgument(const std::string& message)
        : Error("Invalid argument: " + message) {}
};

/**
 * Failure raised by a store implementation. Never retried;
 * propagates out of the validation or reasoning call unchanged.
 */
class StoreError : public Error {
public:
    explicit StoreError(const std::string& message)
        : Error("Store error: " + message) {}
};

// Reserved attribute holding a value of the wrong type or range
class AttributeError : public StoreError {
public:
    AttributeError(const std::string& key, const std::string& message)
        : StoreError("attribute '" + key + "': " + message), key_(key) {}

    const std::string& key() const noexcept { return key_; }

private:
    std::string key_;
};

} // namespace hgreason

#endif // HGREASON_ERRORS_HPP
