#pragma once

#include <pformat/lang/template.hpp>
#include <pformat/result.hpp>
#include <pformat/value.hpp>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace re2 {
class RE2;
}

namespace pformat {

struct MatchOptions {
    // Capture class for fields without an inline constraint
    std::string default_pattern = ".+?";
    // Derive the capture class from the format spec's presentation type
    // ("{n:d}" captures digits) when there is no inline constraint
    bool typed_captures = true;
};

// Field key -> captured text
using Captures = std::map<std::string, std::string>;

// A template compiled into an anchored RE2 pattern. Literal segments match
// themselves; every field becomes a named group holding its inline
// constraint or a default capture class. Adjacent fields with no literal
// between them make the split ambiguous; avoiding that is up to the caller.
//
// Immutable after compile(); match() may be called from several threads.
class ReverseMatcher {
public:
    static Result<ReverseMatcher> compile(const Template& tmpl,
                                          const MatchOptions& opts = {});

    // Extract field values from a fully formatted string. On failure the
    // PatternMismatch error carries the offset where matching diverged and
    // the segment that was expected there.
    Result<Captures> match(const std::string& candidate) const;

    // Composite pattern source, without anchors
    const std::string& pattern() const { return pattern_; }

private:
    struct Piece {
        std::string regex;
        std::string description;   // "literal '.csv'" / "field 'id'"
        std::string literal;       // literals only: unescaped text
        std::string key;           // fields only
        std::string group;         // fields only: RE2 group name
    };

    PformatError mismatch(const std::string& candidate) const;

    std::string source_;
    std::string pattern_;
    std::vector<Piece> pieces_;
    std::shared_ptr<const re2::RE2> regex_;
};

// Check every bound field that carries an inline constraint: its formatted
// value must match the constraint in full (ConstraintViolation otherwise).
// Missing fields are skipped.
Status validate(const Template& tmpl, const Bindings& bindings);

} // namespace pformat
