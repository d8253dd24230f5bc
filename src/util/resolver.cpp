#include <pformat/resolver.hpp>
#include <pformat/format_spec.hpp>
#include <pformat/log.hpp>

namespace pformat {

const char* mode_name(Mode mode) {
    switch (mode) {
        case Mode::Partial: return "partial";
        case Mode::Glob:    return "glob";
        case Mode::Default: return "default";
    }
    return "unknown";
}

Result<Mode> parse_mode(const std::string& name) {
    for (Mode m : {Mode::Partial, Mode::Glob, Mode::Default}) {
        if (name == mode_name(m)) return Result<Mode>::ok(m);
    }
    return PformatError{PformatError::InvalidArg,
        "unknown mode '" + name + "'",
        "expected one of: partial, glob, default"};
}

Result<std::string> resolve_field(const FieldRef& field,
                                  Mode mode,
                                  const Bindings& bindings,
                                  const std::string& glob_marker) {
    auto value = lookup(bindings, field.key_path);
    if (value) {
        if (field.conversion) {
            return apply_format_spec(apply_conversion(*value, *field.conversion),
                                     field.format_spec);
        }
        return apply_format_spec(*value, field.format_spec);
    }

    if (field.inline_default) {
        return Result<std::string>::ok(
            format_default_literal(*field.inline_default, field.format_spec));
    }

    log::trace("field '%s' is missing (%s mode)", field.path_string().c_str(),
               mode_name(mode));
    switch (mode) {
    case Mode::Glob:
        return Result<std::string>::ok(glob_marker);
    case Mode::Partial:
    case Mode::Default:
        break;
    }
    return Result<std::string>::ok(field.raw_span);
}

} // namespace pformat
