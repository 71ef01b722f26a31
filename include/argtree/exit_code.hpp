#ifndef ARGTREE_EXIT_CODE_HPP
#define ARGTREE_EXIT_CODE_HPP

#include <cstdint>

#include "error.hpp"

namespace argtree {

// Process exit statuses returned by Command::run.
enum class ExitCode : std::uint8_t {
    Success = 0,
    GeneralError = 1,
    InvalidCharacter = 2,
    Overflow = 3,
    SyntaxError = 4,
    UnexpectedToken = 5,
    ArgumentNotFound = 6,
    ArgumentMissing = 7,
    NoValueSet = 8,
    NoActionDefined = 9,
    InvalidEnumValue = 10,
    InvalidJsonFormat = 11,
    MissingRequiredField = 12,
};

ExitCode exitCodeFor(ErrorCode code);

inline int toInt(ExitCode code) { return static_cast<int>(code); }

} // namespace argtree

#endif // ARGTREE_EXIT_CODE_HPP
