#ifndef ARGTREE_ERROR_HPP
#define ARGTREE_ERROR_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace argtree {

enum class ErrorCode {
    UnknownOption,
    InsufficientValues,
    TooManyValues,
    UnexpectedPositional,
    RequiredArgumentMissing,
    InvalidFlagValue,
    NoValueSet,
    RequiredMissing,
    OptionNotFound,
    ArgumentNotFound,
    InvalidFormat,
    Overflow,
    InvalidEnumValue,
    InvalidJsonFormat,
    MissingField,
    NoActionDefined,
};

const char* toString(ErrorCode code);

// Malformed declarations. Raised while the command tree is being built.
class ConfigError : public std::logic_error {
public:
    explicit ConfigError(const std::string& message) : std::logic_error(message) {}
};

// Errors raised after parsing: value access, decoding and dispatch.
class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& message, std::string name = {})
        : std::runtime_error(message), code_(code), name_(std::move(name)) {}

    [[nodiscard]] ErrorCode code() const { return code_; }
    // Parameter the error refers to, empty when not tied to one.
    [[nodiscard]] const std::string& name() const { return name_; }

private:
    ErrorCode code_;
    std::string name_;
};

// One user input error found while scanning the token stream.
struct Diagnostic {
    ErrorCode code{ErrorCode::UnknownOption};
    std::string name;  // option, flag or argument name
    std::string value; // offending raw token, if any
    std::size_t expected{0};
    std::size_t actual{0};
    std::string message;
};

} // namespace argtree

#endif // ARGTREE_ERROR_HPP
