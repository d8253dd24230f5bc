#pragma once

#include <pformat/lang/field.hpp>
#include <pformat/result.hpp>
#include <pformat/value.hpp>
#include <string>

namespace pformat {

// What to emit for a field whose binding is missing and that carries no
// inline default:
//   Partial  the field's original text, so a later call can fill it in
//   Glob     the glob marker ("*")
//   Default  same as Partial; fields with an inline default use it
enum class Mode { Partial, Glob, Default };

const char* mode_name(Mode mode);

// "partial", "glob" or "default"
Result<Mode> parse_mode(const std::string& name);

// Forward resolution of one field. A bound value gets the conversion and
// format spec applied; a missing one falls back to the inline default, then
// to the mode. Only a format spec that cannot apply to a bound value fails
// (BadFormatSpec).
Result<std::string> resolve_field(const FieldRef& field,
                                  Mode mode,
                                  const Bindings& bindings,
                                  const std::string& glob_marker = "*");

} // namespace pformat
