#pragma once

#include <pformat/result.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace pformat {

// Trailing attribute names that introduce inline encodings:
//   {loss._[--]:.2f}     inline default "--"
//   {id._re[\d+]}        inline constraint "\d+"
struct SyntaxOptions {
    std::string default_marker = "_";
    std::string constraint_marker = "_re";
};

struct KeyComponent {
    enum Kind {
        Name,       // leading lookup key
        Attribute,  // .name
        Index,      // [3]
        Item        // [key]
    };

    Kind kind;
    std::string text;   // verbatim, without '.' or brackets
    size_t index = 0;   // Index only

    bool operator==(const KeyComponent& o) const {
        return kind == o.kind && text == o.text && index == o.index;
    }
};

using KeyPath = std::vector<KeyComponent>;

struct FieldRef {
    KeyPath key_path;                           // never empty, [0] is a Name
    std::optional<char> conversion;             // 's', 'r' or 'a'
    std::string format_spec;                    // empty when absent
    std::optional<std::string> inline_default;
    std::optional<std::string> inline_constraint;
    std::string raw_span;                       // "{...}" exactly as written
    size_t offset = 0;                          // offset of '{' in the template

    const std::string& key() const { return key_path.front().text; }

    // "a.b[0]" (encodings excluded)
    std::string path_string() const;

    // Canonical "{path._[default]._re[pattern]!c:spec}"
    std::string to_string(const SyntaxOptions& opts = {}) const;
};

// Parse one raw field span (braces included) into a descriptor.
// `offset` and `source` only feed error positions.
Result<FieldRef> parse_field(const std::string& raw_span,
                             size_t offset,
                             const std::string& source,
                             const SyntaxOptions& opts = {});

} // namespace pformat
