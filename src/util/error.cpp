#include <pformat/error.hpp>

namespace pformat {

const char* PformatError::code_name(Code c) {
    switch (c) {
        case UnbalancedBrace:     return "UnbalancedBrace";
        case EmptyKeyPath:        return "EmptyKeyPath";
        case MalformedKeyPath:    return "MalformedKeyPath";
        case MalformedEncoding:   return "MalformedEncoding";
        case BadConversion:       return "BadConversion";
        case BadFormatSpec:       return "BadFormatSpec";
        case BadPattern:          return "BadPattern";
        case PatternMismatch:     return "PatternMismatch";
        case ConstraintViolation: return "ConstraintViolation";
        case Config:              return "Config";
        case IO:                  return "IO";
        case InvalidArg:          return "InvalidArg";
    }
    return "Unknown";
}

bool PformatError::is_parse_error() const {
    switch (code) {
        case UnbalancedBrace:
        case EmptyKeyPath:
        case MalformedKeyPath:
        case MalformedEncoding:
        case BadConversion:
        case BadFormatSpec:
        case BadPattern:
            return true;
        default:
            return false;
    }
}

std::string PformatError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!expected.empty()) {
        result += "\n  expected: ";
        result += expected;
    }

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!source.empty()) {
        result += "\n  --> ";
        result += source;
        if (position >= 0) {
            result += ":";
            result += std::to_string(position);
            // Caret under the offending byte; single-line sources only
            if (source.find('\n') == std::string::npos &&
                static_cast<size_t>(position) <= source.size()) {
                result += "\n      ";
                result += std::string(static_cast<size_t>(position), ' ');
                result += "^";
            }
        }
    }

    return result;
}

} // namespace pformat
