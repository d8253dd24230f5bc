#pragma once

#include <string>

namespace pformat {

struct PformatError {
    enum Code {
        // Template syntax errors
        UnbalancedBrace,
        EmptyKeyPath,
        MalformedKeyPath,
        MalformedEncoding,
        BadConversion,
        BadFormatSpec,
        BadPattern,
        // Reverse matching / validation
        PatternMismatch,
        ConstraintViolation,
        // Ambient
        Config,
        IO,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    std::string source;    // template text (or file) the error points into
    int position = -1;     // byte offset into source, -1 if unknown
    std::string expected;  // PatternMismatch: the segment that failed to match

    PformatError() = default;
    PformatError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    PformatError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    PformatError(Code c, std::string msg, std::string src, int pos)
        : code(c), message(std::move(msg)), source(std::move(src)), position(pos) {}

    // True for every code that reports a malformed template
    bool is_parse_error() const;

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace pformat
