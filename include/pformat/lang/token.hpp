#pragma once

#include <cstddef>
#include <string>

namespace pformat {

// One tokenizer output unit: a run of literal text or a raw field span
struct RawSegment {
    enum Kind { Literal, Field };

    Kind kind;
    std::string text;    // Literal: text with {{ and }} collapsed. Field: "{...}" verbatim
    size_t offset = 0;   // byte offset of the segment's first source char
};

} // namespace pformat
