#include "argtree/error.hpp"
#include "argtree/exit_code.hpp"

namespace argtree {

const char* toString(ErrorCode code) {
    switch (code) {
    case ErrorCode::UnknownOption: return "unknown option";
    case ErrorCode::InsufficientValues: return "insufficient values";
    case ErrorCode::TooManyValues: return "too many values";
    case ErrorCode::UnexpectedPositional: return "unexpected positional";
    case ErrorCode::RequiredArgumentMissing: return "required argument missing";
    case ErrorCode::InvalidFlagValue: return "invalid flag value";
    case ErrorCode::NoValueSet: return "no value set";
    case ErrorCode::RequiredMissing: return "required value missing";
    case ErrorCode::OptionNotFound: return "option not found";
    case ErrorCode::ArgumentNotFound: return "argument not found";
    case ErrorCode::InvalidFormat: return "invalid format";
    case ErrorCode::Overflow: return "overflow";
    case ErrorCode::InvalidEnumValue: return "invalid enum value";
    case ErrorCode::InvalidJsonFormat: return "invalid json format";
    case ErrorCode::MissingField: return "missing field";
    case ErrorCode::NoActionDefined: return "no action defined";
    }
    return "unknown error";
}

ExitCode exitCodeFor(ErrorCode code) {
    switch (code) {
    case ErrorCode::InvalidFormat:
    case ErrorCode::InvalidFlagValue: return ExitCode::InvalidCharacter;
    case ErrorCode::Overflow: return ExitCode::Overflow;
    case ErrorCode::UnknownOption: return ExitCode::SyntaxError;
    case ErrorCode::UnexpectedPositional:
    case ErrorCode::TooManyValues: return ExitCode::UnexpectedToken;
    case ErrorCode::OptionNotFound:
    case ErrorCode::ArgumentNotFound: return ExitCode::ArgumentNotFound;
    case ErrorCode::InsufficientValues:
    case ErrorCode::RequiredArgumentMissing:
    case ErrorCode::RequiredMissing: return ExitCode::ArgumentMissing;
    case ErrorCode::NoValueSet: return ExitCode::NoValueSet;
    case ErrorCode::NoActionDefined: return ExitCode::NoActionDefined;
    case ErrorCode::InvalidEnumValue: return ExitCode::InvalidEnumValue;
    case ErrorCode::InvalidJsonFormat: return ExitCode::InvalidJsonFormat;
    case ErrorCode::MissingField: return ExitCode::MissingRequiredField;
    }
    return ExitCode::GeneralError;
}

} // namespace argtree
