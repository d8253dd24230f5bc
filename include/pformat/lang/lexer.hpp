#pragma once

#include <pformat/lang/token.hpp>
#include <pformat/result.hpp>
#include <string>
#include <vector>

namespace pformat {

// Split a template into literal runs and field spans.
//
// "{{" and "}}" collapse to literal braces. A single '{' opens a field that
// runs to the next '}' outside of square brackets; inside brackets of the
// key path a backslash escapes the next character and braces are ordinary
// text. Field spans never nest.
//
// Fails with UnbalancedBrace on an unclosed '{', a nested '{' or a bare '}'.
Result<std::vector<RawSegment>> tokenize(const std::string& source);

} // namespace pformat
