#pragma once

#include <pformat/lang/field.hpp>
#include <pformat/result.hpp>
#include <string>
#include <variant>
#include <vector>

namespace pformat {

struct Literal {
    std::string text;
    size_t offset = 0;
};

using Segment = std::variant<Literal, FieldRef>;

// Parsed, immutable template: an ordered sequence of literal and field
// segments. Inline defaults and constraints are extracted here, once.
class Template {
public:
    static Result<Template> parse(const std::string& source,
                                  const SyntaxOptions& opts = {});

    const std::string& source() const { return source_; }
    const std::vector<Segment>& segments() const { return segments_; }

    // Fields in template order
    std::vector<const FieldRef*> fields() const;
    size_t field_count() const;

    // Literal text and raw field spans concatenated in order: the source
    // with escaped braces collapsed
    std::string normalized() const;

private:
    std::string source_;
    std::vector<Segment> segments_;
};

} // namespace pformat
